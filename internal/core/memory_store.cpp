#include "internal/core/memory_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recall::core {

using db::model::MemoryRecord;
using namespace recall::memory::v1;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.Describe(context);
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::SlotConflict(message);
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::AlreadyExists:
      throw util::InvariantViolation(message);
    default:
      throw std::runtime_error(message);
  }
}

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

bool OccupiesSlot(const MemoryRecord& r) {
  return r.status == RECORD_STATUS_ACTIVE && !r.predicate.empty();
}

void RequireRevision(const MemoryRecord& r, std::optional<uint64_t> expected_revision) {
  if (expected_revision && *expected_revision != r.revision) {
    throw util::SlotConflict("record " + r.id + " changed (revision " + std::to_string(r.revision) + ", expected " +
                                 std::to_string(*expected_revision) + ")",
                             r.id);
  }
}

void RequireActive(const MemoryRecord& r) {
  if (r.status != RECORD_STATUS_ACTIVE) {
    throw util::SlotConflict("record " + r.id + " is no longer active",
                             r.superseded_by_id.empty() ? r.id : r.superseded_by_id);
  }
}

void AddAlias(MemoryRecord& r, const std::string& name) {
  const auto key = util::NormalizeKey(name);
  if (key.empty() || key == util::NormalizeKey(r.subject_name)) return;
  for (const auto& alias : r.aliases) {
    if (util::NormalizeKey(alias) == key) return;
  }
  r.aliases.push_back(util::Trim(name));
}

} // namespace

// Holds one or two subject mutexes, deadlock-free, and hands them back to the
// lock table on scope exit.
class MemoryStore::SubjectGuard {
 public:
  SubjectGuard(MemoryStore& store, const std::string& owner_id, const std::string& subject,
               const std::string& other_subject = {})
      : store_(store), key_a_(SubjectKey(owner_id, subject)) {
    mutex_a_ = store_.AcquireSubjectMutex(key_a_);
    if (!other_subject.empty()) {
      auto key_b = SubjectKey(owner_id, other_subject);
      if (key_b != key_a_) {
        key_b_   = std::move(key_b);
        mutex_b_ = store_.AcquireSubjectMutex(key_b_);
      }
    }
    if (mutex_b_) {
      std::lock(*mutex_a_, *mutex_b_);
    } else {
      mutex_a_->lock();
    }
  }

  ~SubjectGuard() {
    const bool two = static_cast<bool>(mutex_b_);
    mutex_a_->unlock();
    if (two) mutex_b_->unlock();
    store_.ReleaseSubjectMutex(key_a_, mutex_a_);
    if (two) store_.ReleaseSubjectMutex(key_b_, mutex_b_);
  }

  SubjectGuard(const SubjectGuard&)            = delete;
  SubjectGuard& operator=(const SubjectGuard&) = delete;

 private:
  MemoryStore&                store_;
  std::string                 key_a_;
  std::string                 key_b_;
  std::shared_ptr<std::mutex> mutex_a_;
  std::shared_ptr<std::mutex> mutex_b_;
};

MemoryStore::MemoryStore(std::shared_ptr<db::Repository> repository, uint32_t max_commit_attempts)
    : repository_(std::move(repository)), max_commit_attempts_(max_commit_attempts == 0 ? 1 : max_commit_attempts) {
  if (!repository_) {
    throw std::invalid_argument("MemoryStore: repository is required");
  }
}

void MemoryStore::AddListener(std::shared_ptr<StoreListener> listener) {
  std::lock_guard<std::mutex> lock(listeners_guard_);
  listeners_.push_back(std::move(listener));
}

std::string MemoryStore::SubjectKey(const std::string& owner_id, const std::string& subject) {
  return owner_id + '\x1f' + util::NormalizeKey(subject);
}

std::shared_ptr<std::mutex> MemoryStore::AcquireSubjectMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(subject_mutexes_guard_);
  auto&                       subject_mutex = subject_mutexes_[key];
  if (!subject_mutex) {
    subject_mutex = std::make_shared<std::mutex>();
  }
  return subject_mutex;
}

void MemoryStore::ReleaseSubjectMutex(const std::string& key, std::shared_ptr<std::mutex>& mutex) {
  std::lock_guard<std::mutex> lock(subject_mutexes_guard_);
  mutex.reset();
  // Copies are only handed out under the guard, so a count of one means the
  // table holds the last reference.
  auto it = subject_mutexes_.find(key);
  if (it != subject_mutexes_.end() && it->second.use_count() == 1) {
    subject_mutexes_.erase(it);
  }
}

std::size_t MemoryStore::TrackedSubjects() const {
  std::lock_guard<std::mutex> lock(subject_mutexes_guard_);
  return subject_mutexes_.size();
}

void MemoryStore::InvalidateSummariesListing(db::Transaction& tx, const std::string& owner_id,
                                             const std::vector<std::string>& ids, std::vector<std::string>& categories) {
  for (const auto& summary : repository_->ListCategorySummaries(tx, owner_id)) {
    const auto& members = summary.member_record_ids;
    const bool  listed  = std::any_of(ids.begin(), ids.end(), [&](const std::string& id) {
      return std::find(members.begin(), members.end(), id) != members.end();
    });
    if (!listed) continue;

    auto stale = summary;
    stale.summary_text.clear();
    stale.member_record_ids.clear();
    stale.member_fingerprint.clear();
    ThrowIfDbError(repository_->UpsertCategorySummary(tx, stale), "invalidate category summary");
    if (std::find(categories.begin(), categories.end(), summary.category) == categories.end()) {
      categories.push_back(summary.category);
    }
  }
}

void MemoryStore::RunInTransaction(const std::string& what, const Mutation& fn) {
  try {
    db::RunWithCommitRetry(*repository_, max_commit_attempts_, fn);
  } catch (const db::CommitConflict&) {
    RECALL_LOG_DEBUG("commit retries exhausted", {observability::StringField("op", what),
                                                  observability::IntField("attempts", max_commit_attempts_)});
    throw util::SlotConflict(what + ": commit conflict after " + std::to_string(max_commit_attempts_) + " attempts");
  }
}

MemoryRecord MemoryStore::Load(const std::string& id) {
  auto record = GetById(id);
  if (!record) {
    throw util::NotFound("memory record not found: " + id);
  }
  return *record;
}

void MemoryStore::NotifyChanged(const MemoryRecord& record) {
  std::vector<std::shared_ptr<StoreListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_guard_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) listener->OnRecordChanged(record);
}

void MemoryStore::NotifyRemoved(const std::string& owner_id, const std::string& id) {
  std::vector<std::shared_ptr<StoreListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_guard_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) listener->OnRecordRemoved(owner_id, id);
}

void MemoryStore::NotifySummariesInvalidated(const std::string& owner_id, const std::vector<std::string>& categories) {
  if (categories.empty()) {
    return;
  }
  RECALL_LOG_DEBUG("category summaries invalidated", {observability::StringField("owner_id", owner_id),
                                                      observability::IntField("categories", static_cast<std::int64_t>(categories.size()))});
  std::vector<std::shared_ptr<StoreListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_guard_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) listener->OnSummariesInvalidated(owner_id, categories);
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

MemoryRecord MemoryStore::Insert(MemoryRecord record) {
  record.subject_name = util::Trim(record.subject_name);
  record.predicate    = util::Trim(record.predicate);
  if (record.owner_id.empty() || record.subject_name.empty()) {
    throw util::InvariantViolation("memory record requires owner and subject");
  }

  const auto now = NowMs();
  if (record.id.empty()) record.id = util::NewId();
  if (record.status == RECORD_STATUS_UNSPECIFIED) record.status = RECORD_STATUS_ACTIVE;
  if (record.sensitivity == SENSITIVITY_UNSPECIFIED) record.sensitivity = SENSITIVITY_NORMAL;
  if (record.version == 0) record.version = 1;
  if (record.created_at_ms == 0) record.created_at_ms = now;
  record.revision      = 1;
  record.updated_at_ms = now;

  SubjectGuard guard(*this, record.owner_id, record.subject_name);
  RunInTransaction("insert memory", [&](db::Transaction& tx) {
    if (OccupiesSlot(record)) {
      if (auto holder = repository_->GetActiveBySlot(tx, record.owner_id, record.subject_name, record.predicate)) {
        throw util::SlotConflict("slot (" + record.subject_name + ", " + record.predicate + ") is held by " + holder->id,
                                 holder->id);
      }
    }
    ThrowIfDbError(repository_->InsertMemory(tx, record), "insert memory");
  });

  NotifyChanged(record);
  return record;
}

MemoryRecord MemoryStore::Update(const std::string& id, const RecordPatch& patch, std::optional<uint64_t> expected_revision) {
  const auto current = Load(id);

  MemoryRecord             updated;
  std::vector<std::string> invalidated;
  SubjectGuard             guard(*this, current.owner_id, current.subject_name);
  RunInTransaction("update memory", [&](db::Transaction& tx) {
    invalidated.clear();
    auto row = repository_->GetMemory(tx, id);
    if (!row) throw util::NotFound("memory record not found: " + id);
    RequireRevision(*row, expected_revision);
    if (!patch.status) RequireActive(*row);

    updated = *row;
    if (patch.content) updated.content = *patch.content;
    if (patch.object) updated.object = *patch.object;
    if (patch.aliases) updated.aliases = *patch.aliases;
    if (patch.embedding) updated.embedding = *patch.embedding;
    if (patch.embedding_model) updated.embedding_model = *patch.embedding_model;
    if (patch.importance) updated.importance = *patch.importance;
    if (patch.sentiment) updated.sentiment = *patch.sentiment;
    if (patch.is_historical) updated.is_historical = *patch.is_historical;
    if (patch.user_pinned) updated.user_pinned = *patch.user_pinned;
    if (patch.effective_from_ms) updated.effective_from_ms = *patch.effective_from_ms;
    if (patch.expires_at_ms) updated.expires_at_ms = *patch.expires_at_ms;
    if (patch.decayed_at_ms) updated.decayed_at_ms = *patch.decayed_at_ms;
    if (patch.category) updated.category = *patch.category;
    if (patch.sensitivity) updated.sensitivity = *patch.sensitivity;
    if (patch.status) updated.status = *patch.status;

    if (OccupiesSlot(updated) && !OccupiesSlot(*row)) {
      auto holder = repository_->GetActiveBySlot(tx, updated.owner_id, updated.subject_name, updated.predicate);
      if (holder && holder->id != updated.id) {
        throw util::InvariantViolation("reactivating " + updated.id + " would duplicate active slot held by " + holder->id);
      }
    }

    const bool leaves_active = row->status == RECORD_STATUS_ACTIVE && updated.status != RECORD_STATUS_ACTIVE;
    const bool turns_private = updated.sensitivity == SENSITIVITY_PRIVATE && row->sensitivity != SENSITIVITY_PRIVATE;
    if (leaves_active || turns_private || updated.content != row->content || updated.category != row->category) {
      InvalidateSummariesListing(tx, updated.owner_id, {updated.id}, invalidated);
    }

    updated.revision      = row->revision + 1;
    updated.updated_at_ms = NowMs();
    ThrowIfDbError(repository_->UpdateMemory(tx, updated), "update memory");
  });

  NotifyChanged(updated);
  NotifySummariesInvalidated(updated.owner_id, invalidated);
  return updated;
}

SupersedeResult MemoryStore::Supersede(const std::string& old_id, MemoryRecord replacement,
                                       std::optional<uint64_t> expected_revision) {
  const auto current = Load(old_id);
  replacement.subject_name = util::Trim(replacement.subject_name.empty() ? current.subject_name : replacement.subject_name);
  replacement.predicate    = util::Trim(replacement.predicate.empty() ? current.predicate : replacement.predicate);

  SupersedeResult          result;
  std::vector<std::string> invalidated;
  SubjectGuard             guard(*this, current.owner_id, current.subject_name, replacement.subject_name);
  RunInTransaction("supersede memory", [&](db::Transaction& tx) {
    invalidated.clear();
    auto old_row = repository_->GetMemory(tx, old_id);
    if (!old_row) throw util::NotFound("memory record not found: " + old_id);
    RequireActive(*old_row);
    RequireRevision(*old_row, expected_revision);

    const auto now = NowMs();

    auto next = replacement;
    if (next.id.empty()) next.id = util::NewId();
    next.owner_id         = old_row->owner_id;
    next.status           = RECORD_STATUS_ACTIVE;
    next.supersedes_id    = old_row->id;
    next.superseded_by_id = "";
    next.version          = old_row->version + 1;
    next.revision         = 1;
    next.created_at_ms    = now;
    next.updated_at_ms    = now;
    if (next.sensitivity == SENSITIVITY_UNSPECIFIED) next.sensitivity = old_row->sensitivity;
    if (next.kind == MEMORY_KIND_UNSPECIFIED) next.kind = old_row->kind;
    if (next.id == old_row->id) throw util::InvariantViolation("supersede would link record " + next.id + " to itself");

    if (OccupiesSlot(next)) {
      auto holder = repository_->GetActiveBySlot(tx, next.owner_id, next.subject_name, next.predicate);
      if (holder && holder->id != old_row->id) {
        throw util::SlotConflict("slot (" + next.subject_name + ", " + next.predicate + ") is held by " + holder->id,
                                 holder->id);
      }
    }

    auto old_updated             = *old_row;
    old_updated.status           = RECORD_STATUS_SUPERSEDED;
    old_updated.superseded_by_id = next.id;
    old_updated.is_historical    = true;
    old_updated.revision         = old_row->revision + 1;
    old_updated.updated_at_ms    = now;

    // Old row first so the slot is free when the replacement lands.
    ThrowIfDbError(repository_->UpdateMemory(tx, old_updated), "supersede: retire old version");
    ThrowIfDbError(repository_->InsertMemory(tx, next), "supersede: insert new version");
    InvalidateSummariesListing(tx, old_row->owner_id, {old_row->id}, invalidated);

    result.old_record = std::move(old_updated);
    result.new_record = std::move(next);
  });

  NotifyChanged(result.old_record);
  NotifyChanged(result.new_record);
  NotifySummariesInvalidated(result.old_record.owner_id, invalidated);
  return result;
}

MemoryRecord MemoryStore::SoftDelete(const std::string& id, std::optional<uint64_t> expected_revision) {
  const auto current = Load(id);

  MemoryRecord             archived;
  bool                     changed = false;
  std::vector<std::string> invalidated;
  SubjectGuard             guard(*this, current.owner_id, current.subject_name);
  RunInTransaction("soft delete memory", [&](db::Transaction& tx) {
    auto row = repository_->GetMemory(tx, id);
    if (!row) throw util::NotFound("memory record not found: " + id);
    archived = *row;
    changed  = false;
    invalidated.clear();
    if (row->status == RECORD_STATUS_ARCHIVED) return;
    RequireActive(*row);
    RequireRevision(*row, expected_revision);

    archived.status        = RECORD_STATUS_ARCHIVED;
    archived.revision      = row->revision + 1;
    archived.updated_at_ms = NowMs();
    ThrowIfDbError(repository_->UpdateMemory(tx, archived), "soft delete memory");
    InvalidateSummariesListing(tx, archived.owner_id, {archived.id}, invalidated);
    changed = true;
  });

  if (changed) {
    NotifyChanged(archived);
    NotifySummariesInvalidated(archived.owner_id, invalidated);
  }
  return archived;
}

MemoryRecord MemoryStore::HardDelete(const std::string& id) {
  const auto current = Load(id);

  MemoryRecord             removed;
  std::vector<std::string> invalidated;
  SubjectGuard             guard(*this, current.owner_id, current.subject_name);
  RunInTransaction("hard delete memory", [&](db::Transaction& tx) {
    invalidated.clear();
    auto row = repository_->GetMemory(tx, id);
    if (!row) throw util::NotFound("memory record not found: " + id);
    removed = *row;
    ThrowIfDbError(repository_->DeleteMemory(tx, id), "hard delete memory");
    InvalidateSummariesListing(tx, removed.owner_id, {removed.id}, invalidated);
  });

  NotifyRemoved(removed.owner_id, removed.id);
  NotifySummariesInvalidated(removed.owner_id, invalidated);
  return removed;
}

MemoryRecord MemoryStore::Consolidate(const std::string& keeper_id, uint64_t keeper_revision, const std::string& merged_id,
                                      uint64_t merged_revision, const std::string& merged_content,
                                      std::optional<std::vector<float>> merged_embedding) {
  if (keeper_id == merged_id) {
    throw util::InvariantViolation("cannot consolidate record " + keeper_id + " into itself");
  }
  const auto keeper_now = Load(keeper_id);
  const auto merged_now = Load(merged_id);
  if (keeper_now.owner_id != merged_now.owner_id) {
    throw util::InvariantViolation("cannot consolidate records of different owners");
  }

  MemoryRecord             keeper;
  MemoryRecord             merged;
  std::vector<std::string> invalidated;
  SubjectGuard             guard(*this, keeper_now.owner_id, keeper_now.subject_name, merged_now.subject_name);
  RunInTransaction("consolidate memory", [&](db::Transaction& tx) {
    invalidated.clear();
    auto keeper_row = repository_->GetMemory(tx, keeper_id);
    auto merged_row = repository_->GetMemory(tx, merged_id);
    if (!keeper_row) throw util::NotFound("memory record not found: " + keeper_id);
    if (!merged_row) throw util::NotFound("memory record not found: " + merged_id);
    RequireActive(*keeper_row);
    RequireActive(*merged_row);
    RequireRevision(*keeper_row, keeper_revision);
    RequireRevision(*merged_row, merged_revision);

    const auto now = NowMs();

    keeper         = *keeper_row;
    keeper.content = merged_content;
    if (merged_embedding) keeper.embedding = *merged_embedding;
    AddAlias(keeper, merged_row->subject_name);
    for (const auto& alias : merged_row->aliases) AddAlias(keeper, alias);
    keeper.importance   = std::max(keeper.importance, merged_row->importance);
    keeper.user_pinned  = keeper.user_pinned || merged_row->user_pinned;
    keeper.access_count = keeper.access_count + merged_row->access_count;
    keeper.revision     = keeper_row->revision + 1;
    keeper.updated_at_ms = now;

    merged                  = *merged_row;
    merged.status           = RECORD_STATUS_ARCHIVED;
    merged.superseded_by_id = keeper.id;
    merged.revision         = merged_row->revision + 1;
    merged.updated_at_ms    = now;

    ThrowIfDbError(repository_->UpdateMemory(tx, merged), "consolidate: archive merged record");
    ThrowIfDbError(repository_->UpdateMemory(tx, keeper), "consolidate: update keeper");
    InvalidateSummariesListing(tx, keeper.owner_id, {merged.id, keeper.id}, invalidated);
  });

  NotifyChanged(merged);
  NotifyChanged(keeper);
  NotifySummariesInvalidated(keeper.owner_id, invalidated);
  return keeper;
}

void MemoryStore::RecordAccess(const std::string& owner_id, const std::vector<std::string>& ids, const std::string& batch_id,
                               uint64_t now_ms) {
  if (ids.empty()) {
    return;
  }

  RunInTransaction("record access", [&](db::Transaction& tx) {
    for (const auto& id : ids) {
      auto row = repository_->GetMemory(tx, id);
      if (!row || row->owner_id != owner_id) continue;

      row->access_count += 1;
      row->last_accessed_at_ms = std::max(row->last_accessed_at_ms, now_ms);
      ThrowIfDbError(repository_->UpdateMemory(tx, *row), "record access");

      db::model::AccessRecord access;
      access.owner_id       = owner_id;
      access.record_id      = id;
      access.batch_id       = batch_id;
      access.accessed_at_ms = now_ms;
      ThrowIfDbError(repository_->InsertAccess(tx, access), "record access log");
    }
  });
}

double MemoryStore::RecordSentiment(const std::string& id, double sentiment, const std::string& source_id, uint64_t now_ms,
                                    uint32_t window) {
  const auto current = Load(id);

  double       average = sentiment;
  SubjectGuard guard(*this, current.owner_id, current.subject_name);
  RunInTransaction("record sentiment", [&](db::Transaction& tx) {
    auto row = repository_->GetMemory(tx, id);
    if (!row) throw util::NotFound("memory record not found: " + id);

    db::model::SentimentSampleRecord sample;
    sample.owner_id       = row->owner_id;
    sample.subject_key    = util::NormalizeKey(row->subject_name);
    sample.record_id      = row->id;
    sample.sentiment      = sentiment;
    sample.source_id      = source_id;
    sample.recorded_at_ms = now_ms;
    ThrowIfDbError(repository_->AppendSentimentSample(tx, sample), "append sentiment sample");

    const auto recent = repository_->ListSentimentSamples(tx, sample.owner_id, sample.subject_key, window == 0 ? 1 : window);
    double     sum    = 0.0;
    for (const auto& s : recent) sum += s.sentiment;
    average = recent.empty() ? sentiment : sum / static_cast<double>(recent.size());

    row->sentiment_average = average;
    ThrowIfDbError(repository_->UpdateMemory(tx, *row), "update sentiment average");
  });
  return average;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<MemoryRecord> MemoryStore::GetById(const std::string& id) {
  auto tx = repository_->Begin();
  return repository_->GetMemory(*tx, id);
}

std::optional<MemoryRecord> MemoryStore::GetActiveBySlot(const std::string& owner_id, const std::string& subject,
                                                         const std::string& predicate) {
  auto tx = repository_->Begin();
  return repository_->GetActiveBySlot(*tx, owner_id, subject, predicate);
}

std::vector<MemoryRecord> MemoryStore::ListActive(const std::string& owner_id) {
  db::model::MemoryFilter filter;
  filter.owner_id = owner_id;
  filter.status   = RECORD_STATUS_ACTIVE;
  return List(filter);
}

std::vector<MemoryRecord> MemoryStore::List(const db::model::MemoryFilter& filter) {
  auto tx = repository_->Begin();
  return repository_->ListMemories(*tx, filter);
}

std::vector<std::string> MemoryStore::Owners() {
  auto tx = repository_->Begin();
  return repository_->ListOwners(*tx);
}

std::vector<MemoryRecord> MemoryStore::VersionChain(const std::string& id) {
  auto tx    = repository_->Begin();
  auto start = repository_->GetMemory(*tx, id);
  if (!start) throw util::NotFound("memory record not found: " + id);

  std::unordered_set<std::string> visited{start->id};

  std::vector<MemoryRecord> older;
  for (auto cursor = start->supersedes_id; !cursor.empty();) {
    if (!visited.insert(cursor).second) {
      throw util::InvariantViolation("version chain of " + id + " revisits " + cursor);
    }
    auto row = repository_->GetMemory(*tx, cursor);
    if (!row) break;
    cursor = row->supersedes_id;
    older.push_back(std::move(*row));
  }

  std::vector<MemoryRecord> chain(older.rbegin(), older.rend());
  chain.push_back(*start);

  for (auto cursor = start->superseded_by_id; !cursor.empty();) {
    if (!visited.insert(cursor).second) {
      throw util::InvariantViolation("version chain of " + id + " revisits " + cursor);
    }
    auto row = repository_->GetMemory(*tx, cursor);
    if (!row) break;
    cursor = row->superseded_by_id;
    // Consolidation also sets superseded_by; only follow true successors.
    if (row->supersedes_id != chain.back().id) break;
    chain.push_back(std::move(*row));
  }
  return chain;
}

MemoryRecord MemoryStore::ChainHead(const std::string& id) {
  auto tx     = repository_->Begin();
  auto cursor = repository_->GetMemory(*tx, id);
  if (!cursor) throw util::NotFound("memory record not found: " + id);

  std::unordered_set<std::string> visited{cursor->id};
  while (!cursor->superseded_by_id.empty()) {
    if (!visited.insert(cursor->superseded_by_id).second) {
      throw util::InvariantViolation("version chain of " + id + " revisits " + cursor->superseded_by_id);
    }
    auto next = repository_->GetMemory(*tx, cursor->superseded_by_id);
    if (!next) break;
    cursor = std::move(next);
  }
  return *cursor;
}

} // namespace recall::core
