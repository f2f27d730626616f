#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "internal/util/text.hpp"
#include "memory_tx.hpp"

namespace recall::db::memory {

using recall::memory::v1::JobStatus;
using recall::memory::v1::RECORD_STATUS_ACTIVE;

namespace {

std::string SummaryKey(const std::string& owner_id, const std::string& category) {
  return owner_id + "#" + category;
}

std::string RelationshipKey(const model::RelationshipRecord& r) {
  return r.owner_id + "#" + r.record_a + "#" + r.record_b;
}

bool OccupiesSlot(const model::MemoryRecord& r) {
  return r.status == RECORD_STATUS_ACTIVE && !r.predicate.empty();
}

bool SameSlot(const model::MemoryRecord& a, const model::MemoryRecord& b) {
  return a.owner_id == b.owner_id && util::NormalizeKey(a.subject_name) == util::NormalizeKey(b.subject_name) &&
         util::NormalizeKey(a.predicate) == util::NormalizeKey(b.predicate);
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// Mirrors the partial unique index of the SQL backends.
static bool SlotTakenBy(const std::unordered_map<std::string, model::MemoryRecord>& memories, const model::MemoryRecord& r) {
  if (!OccupiesSlot(r)) return false;
  for (const auto& [id, other] : memories) {
    if (id != r.id && OccupiesSlot(other) && SameSlot(other, r)) return true;
  }
  return false;
}

// ------------------------------------------------------------------
// Memory records
// ------------------------------------------------------------------

Result MemoryRepository::InsertMemory(Transaction& t, const model::MemoryRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.memories.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "memory id already exists");
  if (SlotTakenBy(s.memories, r)) return Result::Err(ErrorCode::ConstraintViolation, "active slot already occupied");
  s.memories[r.id] = r;
  return Result::Ok();
}

std::optional<model::MemoryRecord> MemoryRepository::GetMemory(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.memories.find(id);
  if (it == s.memories.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateMemory(Transaction& t, const model::MemoryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.memories.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  if (SlotTakenBy(s.memories, r)) return Result::Err(ErrorCode::ConstraintViolation, "active slot already occupied");
  s.memories[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteMemory(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.memories.erase(id);
  return Result::Ok();
}

std::optional<model::MemoryRecord> MemoryRepository::GetActiveBySlot(Transaction& t, const std::string& owner_id,
                                                                    const std::string& subject, const std::string& predicate) {
  const auto predicate_key = util::NormalizeKey(predicate);
  if (predicate_key.empty()) return std::nullopt;

  const auto  subject_key = util::NormalizeKey(subject);
  const auto& s             = TX(t).View();
  for (const auto& [_, r] : s.memories) {
    if (r.owner_id == owner_id && OccupiesSlot(r) && util::NormalizeKey(r.subject_name) == subject_key &&
        util::NormalizeKey(r.predicate) == predicate_key) {
      return r;
    }
  }
  return std::nullopt;
}

std::vector<model::MemoryRecord> MemoryRepository::ListMemories(Transaction& t, const model::MemoryFilter& filter) {
  std::vector<model::MemoryRecord> out;
  for (const auto& [_, r] : TX(t).View().memories) {
    if (!filter.owner_id.empty() && r.owner_id != filter.owner_id) continue;
    if (filter.status && r.status != *filter.status) continue;
    if (filter.subject_key && util::NormalizeKey(r.subject_name) != *filter.subject_key) continue;
    if (filter.category && r.category != *filter.category) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

std::vector<std::string> MemoryRepository::ListOwners(Transaction& t) {
  std::set<std::string> owners;
  for (const auto& [_, r] : TX(t).View().memories) owners.insert(r.owner_id);
  return {owners.begin(), owners.end()};
}

// ------------------------------------------------------------------
// Category summaries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCategorySummary(Transaction& t, const model::CategorySummaryRecord& r) {
  TX(t).Mutable().summaries[SummaryKey(r.owner_id, r.category)] = r;
  return Result::Ok();
}

std::optional<model::CategorySummaryRecord> MemoryRepository::GetCategorySummary(Transaction& t, const std::string& owner_id,
                                                                                  const std::string& category) {
  const auto& s  = TX(t).View();
  auto        it = s.summaries.find(SummaryKey(owner_id, category));
  if (it == s.summaries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CategorySummaryRecord> MemoryRepository::ListCategorySummaries(Transaction& t, const std::string& owner_id) {
  std::vector<model::CategorySummaryRecord> out;
  for (const auto& [_, r] : TX(t).View().summaries) {
    if (r.owner_id == owner_id) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.category < b.category; });
  return out;
}

Result MemoryRepository::DeleteCategorySummary(Transaction& t, const std::string& owner_id, const std::string& category) {
  TX(t).Mutable().summaries.erase(SummaryKey(owner_id, category));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit log
// ------------------------------------------------------------------

Result MemoryRepository::AppendOperation(Transaction& t, const model::MemoryOperationRecord& r) {
  TX(t).Mutable().operations.push_back(r);
  return Result::Ok();
}

std::vector<model::MemoryOperationRecord> MemoryRepository::ListOperations(Transaction& t, const std::string& owner_id, uint64_t limit) {
  std::vector<model::MemoryOperationRecord> out;
  const auto&                               ops = TX(t).View().operations;
  for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
    if (it->owner_id != owner_id) continue;
    out.push_back(*it);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::MaintenanceJobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::MaintenanceJobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::MaintenanceJobRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.jobs.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::vector<model::MaintenanceJobRecord> MemoryRepository::ListJobs(Transaction& t, std::optional<JobStatus> status) {
  std::vector<model::MaintenanceJobRecord> out;
  for (const auto& [_, r] : TX(t).View().jobs) {
    if (status && r.status != *status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.scheduled_for_ms != b.scheduled_for_ms) return a.scheduled_for_ms < b.scheduled_for_ms;
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Access log / relationships
// ------------------------------------------------------------------

Result MemoryRepository::InsertAccess(Transaction& t, const model::AccessRecord& r) {
  TX(t).Mutable().accesses.push_back(r);
  return Result::Ok();
}

std::vector<model::AccessRecord> MemoryRepository::ListAccesses(Transaction& t, const std::string& owner_id) {
  std::vector<model::AccessRecord> out;
  for (const auto& r : TX(t).View().accesses) {
    if (r.owner_id == owner_id) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.accessed_at_ms != b.accessed_at_ms) return a.accessed_at_ms < b.accessed_at_ms;
    if (a.batch_id != b.batch_id) return a.batch_id < b.batch_id;
    return a.record_id < b.record_id;
  });
  return out;
}

Result MemoryRepository::UpsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  TX(t).Mutable().relationships[RelationshipKey(r)] = r;
  return Result::Ok();
}

std::vector<model::RelationshipRecord> MemoryRepository::ListRelationships(Transaction& t, const std::string& owner_id) {
  std::vector<model::RelationshipRecord> out;
  for (const auto& [_, r] : TX(t).View().relationships) {
    if (r.owner_id == owner_id) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.record_a != b.record_a) return a.record_a < b.record_a;
    return a.record_b < b.record_b;
  });
  return out;
}

// ------------------------------------------------------------------
// Sentiment samples
// ------------------------------------------------------------------

Result MemoryRepository::AppendSentimentSample(Transaction& t, const model::SentimentSampleRecord& r) {
  TX(t).Mutable().sentiment_samples.push_back(r);
  return Result::Ok();
}

std::vector<model::SentimentSampleRecord> MemoryRepository::ListSentimentSamples(Transaction& t, const std::string& owner_id,
                                                                                 const std::string& subject_key,
                                                                                 uint64_t limit) {
  std::vector<model::SentimentSampleRecord> out;
  const auto&                               samples = TX(t).View().sentiment_samples;
  for (auto it = samples.rbegin(); it != samples.rend(); ++it) {
    if (limit > 0 && out.size() >= limit) break;
    if (it->owner_id == owner_id && it->subject_key == subject_key) out.push_back(*it);
  }
  return out;
}

} // namespace recall::db::memory
