#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace recall::core {

/*
  Partial update applied by MemoryStore::Update. Unset fields are left alone.
  A record's owner and subject are fixed at insert time; alias linkage goes
  through `aliases`.
*/
struct RecordPatch {
  std::optional<std::string>              content;
  std::optional<std::string>              object;
  std::optional<std::vector<std::string>> aliases;
  std::optional<std::vector<float>>       embedding;
  std::optional<std::string>              embedding_model;
  std::optional<double>                   importance;
  std::optional<double>                   sentiment;
  std::optional<bool>                     is_historical;
  std::optional<bool>                     user_pinned;
  std::optional<uint64_t>                 effective_from_ms;
  std::optional<uint64_t>                 expires_at_ms;
  std::optional<uint64_t>                 decayed_at_ms;
  std::optional<std::string>              category;

  std::optional<recall::memory::v1::Sensitivity>  sensitivity;
  std::optional<recall::memory::v1::RecordStatus> status;
};

// Notified after a mutation committed.
class StoreListener {
 public:
  virtual ~StoreListener() = default;

  virtual void OnRecordChanged(const db::model::MemoryRecord& record) = 0;

  virtual void OnRecordRemoved(const std::string& owner_id, const std::string& id) = 0;

  // Category summaries of `owner_id` were blanked because a member left the
  // active set or changed content.
  virtual void OnSummariesInvalidated(const std::string& /*owner_id*/, const std::vector<std::string>& /*categories*/) {}
};

struct SupersedeResult {
  db::model::MemoryRecord old_record;
  db::model::MemoryRecord new_record;
};

/*
  MemoryStore

  Transactional record store over db::Repository.

  Concurrency:
    - writes to one (owner, subject) run under a process-local mutex
    - a supersede or consolidate spanning two subjects holds both
    - optimistic backends that lose a commit race are retried with a fresh read
    - `expected_revision` rejects writes based on a stale read (SlotConflict)
    - a subject's mutex is dropped from the lock table once no writer holds it

  A write that removes a record from the active set, or rewrites its content,
  blanks every category summary listing it in the same transaction.
*/
class MemoryStore {
 public:
  explicit MemoryStore(std::shared_ptr<db::Repository> repository, uint32_t max_commit_attempts = 5);

  void AddListener(std::shared_ptr<StoreListener> listener);

  db::model::MemoryRecord Insert(db::model::MemoryRecord record);

  db::model::MemoryRecord Update(const std::string& id, const RecordPatch& patch,
                                 std::optional<uint64_t> expected_revision = std::nullopt);

  SupersedeResult Supersede(const std::string& old_id, db::model::MemoryRecord replacement,
                            std::optional<uint64_t> expected_revision = std::nullopt);

  db::model::MemoryRecord SoftDelete(const std::string& id, std::optional<uint64_t> expected_revision = std::nullopt);

  // Physical removal. Returns the row as it was.
  db::model::MemoryRecord HardDelete(const std::string& id);

  // Folds `merged_id` into `keeper_id`: the keeper takes merged_content (and
  // merged_embedding when given) plus the other's subject as an alias; the
  // other is archived pointing at the keeper.
  db::model::MemoryRecord Consolidate(const std::string& keeper_id, uint64_t keeper_revision, const std::string& merged_id,
                                      uint64_t merged_revision, const std::string& merged_content,
                                      std::optional<std::vector<float>> merged_embedding = std::nullopt);

  // Access bookkeeping; does not bump revisions.
  void RecordAccess(const std::string& owner_id, const std::vector<std::string>& ids, const std::string& batch_id,
                    uint64_t now_ms);

  static constexpr uint32_t kSentimentWindow = 20;

  // Appends a sentiment sample for the record's subject and stores the mean of
  // the subject's last `window` samples as the record's sentiment_average.
  // Bookkeeping; does not bump the revision. Returns the new average.
  double RecordSentiment(const std::string& id, double sentiment, const std::string& source_id, uint64_t now_ms,
                         uint32_t window = kSentimentWindow);

  std::optional<db::model::MemoryRecord> GetById(const std::string& id);
  std::optional<db::model::MemoryRecord> GetActiveBySlot(const std::string& owner_id, const std::string& subject,
                                                         const std::string& predicate);
  std::vector<db::model::MemoryRecord>   ListActive(const std::string& owner_id);
  std::vector<db::model::MemoryRecord>   List(const db::model::MemoryFilter& filter);
  std::vector<std::string>               Owners();

  // Oldest first. Throws InvariantViolation if the chain revisits a record.
  std::vector<db::model::MemoryRecord> VersionChain(const std::string& id);

  // Follows superseded_by links to the newest version.
  db::model::MemoryRecord ChainHead(const std::string& id);

  std::shared_ptr<db::Repository> Repository() const {
    return repository_;
  }

  // Number of subject mutexes currently in the lock table.
  std::size_t TrackedSubjects() const;

 private:
  using Mutation = std::function<void(db::Transaction&)>;

  class SubjectGuard;

  static std::string SubjectKey(const std::string& owner_id, const std::string& subject);

  std::shared_ptr<std::mutex> AcquireSubjectMutex(const std::string& key);

  // Drops `mutex` and evicts the table entry when nobody else holds it.
  void ReleaseSubjectMutex(const std::string& key, std::shared_ptr<std::mutex>& mutex);

  // Blanks the owner's summaries listing any of `ids` and appends their
  // categories. A blank summary keeps its version and is never served.
  void InvalidateSummariesListing(db::Transaction& tx, const std::string& owner_id, const std::vector<std::string>& ids,
                                  std::vector<std::string>& categories);

  // Runs fn in a transaction and commits, retrying lost optimistic commits.
  void RunInTransaction(const std::string& what, const Mutation& fn);

  db::model::MemoryRecord Load(const std::string& id);

  void NotifyChanged(const db::model::MemoryRecord& record);
  void NotifyRemoved(const std::string& owner_id, const std::string& id);
  void NotifySummariesInvalidated(const std::string& owner_id, const std::vector<std::string>& categories);

  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_commit_attempts_;

  mutable std::mutex                                           subject_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> subject_mutexes_;

  mutable std::mutex                          listeners_guard_;
  std::vector<std::shared_ptr<StoreListener>> listeners_;
};

} // namespace recall::core
