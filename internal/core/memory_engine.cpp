#include "internal/core/memory_engine.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace recall::core {

using namespace recall::memory::v1;

MemoryEngine::MemoryEngine(std::shared_ptr<MemoryStore> store, std::shared_ptr<extraction::FactExtractor> extractor,
                           std::shared_ptr<UpdateEngine> updater, std::shared_ptr<retrieval::RetrievalComposer> composer,
                           std::shared_ptr<maintenance::JobQueue> queue, std::shared_ptr<audit::AuditLog> audit,
                           std::size_t known_entities_limit, std::size_t max_content_chars)
    : store_(std::move(store)),
      extractor_(std::move(extractor)),
      updater_(std::move(updater)),
      composer_(std::move(composer)),
      queue_(std::move(queue)),
      audit_(std::move(audit)),
      known_entities_limit_(known_entities_limit),
      max_content_chars_(max_content_chars) {
  if (!store_ || !extractor_ || !updater_ || !composer_ || !queue_ || !audit_) {
    throw std::invalid_argument("MemoryEngine: all components are required");
  }
}

ObservationReport MemoryEngine::Observe(const std::string& owner_id, const std::string& text, const ApplyOptions& options) {
  observability::SpanScope span("recall.observe", owner_id);

  ObservationReport report;
  if (util::Trim(text).empty()) return report;

  auto candidates             = extractor_->Extract(text, KnownEntities(owner_id));
  report.candidates_extracted = candidates.size();
  span.SetAttribute("candidates", static_cast<std::int64_t>(candidates.size()));
  if (candidates.empty()) return report;

  report.outcomes = updater_->Apply(owner_id, candidates, options);
  return report;
}

ObservationReport MemoryEngine::ObserveCandidates(const std::string& owner_id, const std::vector<CandidateFact>& facts,
                                                  const ApplyOptions& options) {
  observability::SpanScope span("recall.observe", owner_id);

  ObservationReport                  report;
  std::vector<extraction::Candidate> candidates;
  for (const auto& fact : facts) {
    std::string reason;
    auto        candidate = extraction::FactExtractor::Validate(fact, max_content_chars_, &reason);
    if (!candidate) {
      RECALL_LOG_WARN("candidate dropped", {observability::StringField("owner_id", owner_id), observability::StringField("reason", reason),
                                            observability::ContentField("content", fact.content())});
      ++report.candidates_dropped;
      continue;
    }
    candidates.push_back(std::move(*candidate));
  }
  report.candidates_extracted = candidates.size();
  if (!candidates.empty()) report.outcomes = updater_->Apply(owner_id, candidates, options);
  return report;
}

retrieval::RetrievalResult MemoryEngine::Retrieve(const std::string& owner_id, const std::string& query, uint32_t token_budget,
                                                  bool include_private) {
  return composer_->Retrieve(owner_id, query, token_budget, include_private);
}

std::string MemoryEngine::EnqueueJob(JobType type, const std::string& owner_id, const std::string& payload_json,
                                     uint64_t scheduled_for_ms, const std::string& depends_on) {
  return queue_->Enqueue(type, owner_id, payload_json, scheduled_for_ms, depends_on);
}

std::vector<db::model::MemoryOperationRecord> MemoryEngine::History(const std::string& owner_id, uint64_t limit) {
  return audit_->ForOwner(owner_id, limit);
}

db::model::MemoryRecord MemoryEngine::Delete(const std::string& owner_id, const std::string& id, bool hard) {
  auto existing = store_->GetById(id);
  if (!existing || existing->owner_id != owner_id) {
    throw util::NotFound("memory not found: " + id);
  }

  db::model::MemoryOperationRecord entry;
  entry.owner_id    = owner_id;
  entry.operation   = OPERATION_DELETE;
  entry.outcome     = OPERATION_OUTCOME_APPLIED;
  entry.target_id   = id;
  entry.result_ids  = {id};
  entry.reasoning   = hard ? "operator hard delete" : "operator delete";
  entry.old_content = existing->content;

  db::model::MemoryRecord removed;
  if (hard) {
    removed             = store_->HardDelete(id);
    entry.snapshot_json = SnapshotJson(removed);
  } else {
    removed = store_->SoftDelete(id);
  }
  audit_->Record(std::move(entry));

  RECALL_LOG_INFO("memory deleted", {observability::StringField("owner_id", owner_id), observability::StringField("id", id),
                                     observability::BoolField("hard", hard)});
  return removed;
}

std::vector<std::string> MemoryEngine::KnownEntities(const std::string& owner_id) {
  // Most important subjects first; one spelling per normalized key.
  std::map<std::string, std::pair<double, std::string>> best;
  for (const auto& r : store_->ListActive(owner_id)) {
    auto key = util::NormalizeKey(r.subject_name);
    if (key.empty()) continue;
    auto it = best.find(key);
    if (it == best.end() || r.importance > it->second.first) best[key] = {r.importance, r.subject_name};
  }

  std::vector<std::pair<double, std::string>> ranked;
  ranked.reserve(best.size());
  for (auto& [_, v] : best) ranked.push_back(std::move(v));
  std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

  std::vector<std::string> out;
  for (auto& [_, name] : ranked) {
    if (known_entities_limit_ > 0 && out.size() >= known_entities_limit_) break;
    out.push_back(std::move(name));
  }
  return out;
}

} // namespace recall::core
