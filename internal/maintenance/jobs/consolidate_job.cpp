#include "internal/maintenance/jobs/consolidate_job.hpp"

#include <algorithm>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace recall::maintenance {

using db::model::MemoryRecord;
using namespace recall::memory::v1;

namespace {

bool NamesSubject(const MemoryRecord& r, const std::string& key) {
  if (util::NormalizeKey(r.subject_name) == key) return true;
  for (const auto& alias : r.aliases) {
    if (util::NormalizeKey(alias) == key) return true;
  }
  return false;
}

bool SameEntity(const MemoryRecord& a, const MemoryRecord& b) {
  return NamesSubject(a, util::NormalizeKey(b.subject_name)) || NamesSubject(b, util::NormalizeKey(a.subject_name));
}

bool CompatiblePredicates(const MemoryRecord& a, const MemoryRecord& b) {
  const auto pa = util::NormalizeKey(a.predicate);
  const auto pb = util::NormalizeKey(b.predicate);
  return pa.empty() || pb.empty() || pa == pb;
}

struct Pair {
  std::string a;
  std::string b;
  double      similarity = 0.0;
};

} // namespace

const MemoryRecord& PickKeeper(const MemoryRecord& a, const MemoryRecord& b) {
  if (a.importance != b.importance) return a.importance > b.importance ? a : b;
  if (a.access_count != b.access_count) return a.access_count > b.access_count ? a : b;
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms ? a : b;
  return a.id < b.id ? a : b;
}

std::string MergeContent(const std::string& keeper_content, const std::string& other_content) {
  const auto keeper = util::NormalizeText(keeper_content);
  const auto other  = util::NormalizeText(other_content);
  if (other.empty() || (" " + keeper + " ").find(" " + other + " ") != std::string::npos) {
    return keeper_content;
  }
  return util::JoinSentences(keeper_content, other_content);
}

ConsolidateJob::ConsolidateJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
                               std::shared_ptr<audit::AuditLog> audit, double similarity_threshold)
    : store_(std::move(store)), embedder_(std::move(embedder)), audit_(std::move(audit)), threshold_(similarity_threshold) {
}

std::string ConsolidateJob::Run(const JobContext& context) {
  const auto& owner = context.job.owner_id;

  std::unordered_map<std::string, MemoryRecord> records;
  std::vector<std::string>                      ids;
  for (auto& r : store_->ListActive(owner)) {
    if (r.embedding.empty()) continue;
    ids.push_back(r.id);
    records.emplace(r.id, std::move(r));
  }

  std::vector<Pair> pairs;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    for (std::size_t j = i + 1; j < ids.size(); ++j) {
      const auto& a = records.at(ids[i]);
      const auto& b = records.at(ids[j]);
      if (a.sensitivity != b.sensitivity || !SameEntity(a, b) || !CompatiblePredicates(a, b)) continue;
      const auto similarity = util::CosineSimilarity(a.embedding, b.embedding);
      if (similarity >= threshold_) pairs.push_back({a.id, b.id, similarity});
    }
  }
  std::sort(pairs.begin(), pairs.end(), [](const Pair& x, const Pair& y) {
    if (x.similarity != y.similarity) return x.similarity > y.similarity;
    return std::tie(x.a, x.b) < std::tie(y.a, y.b);
  });

  std::unordered_set<std::string> merged_away;
  std::size_t                     merged  = 0;
  std::size_t                     skipped = 0;

  for (const auto& pair : pairs) {
    if (merged_away.count(pair.a) || merged_away.count(pair.b)) continue;

    const auto& a      = records.at(pair.a);
    const auto& b      = records.at(pair.b);
    // Predicate slots stay intact: a predicate-less record folds into the slot holder.
    const bool  one_slot = a.predicate.empty() != b.predicate.empty();
    const auto  keeper   = one_slot ? (a.predicate.empty() ? b : a) : PickKeeper(a, b);
    const auto  other    = keeper.id == a.id ? b : a;
    const auto  content  = MergeContent(keeper.content, other.content);

    std::optional<std::vector<float>> embedding;
    if (content != keeper.content) embedding = embedder_->EmbedRecord(keeper.subject_name, content);

    try {
      auto updated = store_->Consolidate(keeper.id, keeper.revision, other.id, other.revision, content, std::move(embedding));

      db::model::MemoryOperationRecord entry;
      entry.owner_id    = owner;
      entry.operation   = OPERATION_CONSOLIDATE;
      entry.outcome     = OPERATION_OUTCOME_APPLIED;
      entry.target_id   = keeper.id;
      entry.similar_ids = {other.id};
      entry.result_ids  = {keeper.id, other.id};
      entry.reasoning   = "near-duplicate (cosine " + std::to_string(pair.similarity) + ")";
      entry.old_content = keeper.content;
      entry.new_content = updated.content;
      entry.job_id      = context.job.id;
      audit_->Record(std::move(entry));

      records[keeper.id] = std::move(updated);
      merged_away.insert(other.id);
      ++merged;
    } catch (const util::SlotConflict&) {
      ++skipped;
    } catch (const util::NotFound&) {
      ++skipped;
    }
  }

  RECALL_LOG_DEBUG("consolidate pass", {observability::StringField("owner_id", owner),
                                        observability::IntField("pairs", static_cast<std::int64_t>(pairs.size())),
                                        observability::IntField("merged", static_cast<std::int64_t>(merged))});
  return "merged=" + std::to_string(merged) + " skipped=" + std::to_string(skipped);
}

} // namespace recall::maintenance
