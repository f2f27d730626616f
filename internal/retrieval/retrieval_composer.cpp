#include "internal/retrieval/retrieval_composer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "internal/core/category_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recall::retrieval {

using namespace recall::memory::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

// A summary is served only while every record it lists is active and shareable.
bool MembersServable(db::Repository& repository, db::Transaction& tx, const db::model::CategorySummaryRecord& summary) {
  for (const auto& id : summary.member_record_ids) {
    const auto member = repository.GetMemory(tx, id);
    if (!member || member->owner_id != summary.owner_id) return false;
    if (member->status != RECORD_STATUS_ACTIVE || member->sensitivity == SENSITIVITY_PRIVATE) return false;
  }
  return true;
}

} // namespace

RetrievalComposer::RetrievalComposer(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
                                     std::shared_ptr<SimilarityRetriever> retriever, std::shared_ptr<SufficiencyJudge> judge,
                                     RetrievalPolicy policy)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      retriever_(std::move(retriever)),
      judge_(std::move(judge)),
      policy_(policy) {
  if (!store_ || !embedder_ || !retriever_ || !judge_) {
    throw std::invalid_argument("RetrievalComposer: all collaborators are required");
  }
}

double RetrievalComposer::Score(double similarity, const db::model::MemoryRecord& record, uint64_t now_ms,
                                double half_life_days) {
  const auto anchor    = record.updated_at_ms != 0 ? record.updated_at_ms : record.created_at_ms;
  const auto age_days  = anchor != 0 ? util::DaysBetween(anchor, now_ms) : 0.0;
  const auto recency   = half_life_days > 0 ? std::pow(0.5, age_days / half_life_days) : 1.0;
  const auto frequency = std::min(static_cast<double>(record.access_count) / 10.0, 1.0);
  return 0.5 * similarity + 0.2 * record.importance + 0.15 * recency + 0.15 * frequency;
}

std::vector<std::string> RetrievalComposer::KnownEntities(const std::string& owner_id) {
  std::vector<std::string> names;
  for (const auto& record : store_->ListActive(owner_id)) {
    names.push_back(record.subject_name);
    names.insert(names.end(), record.aliases.begin(), record.aliases.end());
  }
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

RetrievalResult RetrievalComposer::Retrieve(const std::string& owner_id, const std::string& query, uint32_t token_budget,
                                            bool include_private) {
  observability::SpanScope span("recall.retrieve", owner_id);
  const auto               started = std::chrono::steady_clock::now();
  const auto               budget  = static_cast<std::size_t>(token_budget != 0 ? token_budget : policy_.default_token_budget);
  const auto               now_ms  = util::ToUnixMillis(util::Now());

  RetrievalResult result;

  // Tier 1: category summaries.
  const auto categories = core::RankCategories(query, policy_.max_summary_categories);
  if (!categories.empty()) {
    auto repository = store_->Repository();
    auto tx         = repository->Begin();

    std::size_t used = 0;
    for (const auto& category : categories) {
      auto summary = repository->GetCategorySummary(*tx, owner_id, category);
      if (!summary || summary->summary_text.empty()) continue;
      if (!MembersServable(*repository, *tx, *summary)) {
        RECALL_LOG_DEBUG("skipping stale category summary",
                         {observability::StringField("owner_id", owner_id), observability::StringField("category", category)});
        continue;
      }
      const auto tokens = util::EstimateTokens(summary->summary_text);
      if (used + tokens > budget) continue;
      used += tokens;
      result.summaries.push_back(std::move(*summary));
    }

    if (!result.summaries.empty() && judge_->Sufficient(query, result.summaries, KnownEntities(owner_id))) {
      result.from_summaries = true;
      result.tokens_used    = used;
      observability::Metrics::Instance().ObserveRetrievalLatencyMs("summaries", ElapsedMs(started));
      span.SetAttribute("tier", std::string_view("summaries"));
      return result;
    }
    result.summaries.clear();
  }

  // Tier 2: records.
  std::vector<float> embedding;
  try {
    embedding = embedder_->Embed(query);
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("retrieval embedding unavailable; returning nothing",
                    {observability::StringField("owner_id", owner_id), observability::StringField("error", e.what())});
    return result;
  }

  std::vector<ScoredRecord> scored;
  for (auto& hit : retriever_->FindSimilar(owner_id, embedding, policy_.candidate_pool, policy_.min_similarity)) {
    const auto& r = hit.record;
    if (r.effective_from_ms > now_ms) continue;
    if (r.sensitivity == SENSITIVITY_PRIVATE && !include_private) continue;

    ScoredRecord s;
    s.similarity = hit.similarity;
    s.score      = Score(hit.similarity, r, now_ms, policy_.recency_half_life_days);
    s.tokens     = std::max<std::size_t>(1, util::EstimateTokens(embedding::EmbeddingAdapter::RecordText(r.subject_name, r.content)));
    s.record     = std::move(hit.record);
    scored.push_back(std::move(s));
  }
  std::stable_sort(scored.begin(), scored.end(), [](const ScoredRecord& a, const ScoredRecord& b) { return a.score > b.score; });

  std::size_t remaining = budget;
  for (auto& s : scored) {
    if (remaining == 0) break;
    if (s.score / static_cast<double>(s.tokens) < policy_.min_value_per_token) break;
    if (s.tokens > remaining) continue;
    remaining -= s.tokens;
    result.records.push_back(std::move(s));
  }
  result.tokens_used = budget - remaining;

  if (!result.records.empty()) {
    result.batch_id = util::NewId();
    std::vector<std::string> ids;
    for (const auto& s : result.records) ids.push_back(s.record.id);
    try {
      store_->RecordAccess(owner_id, ids, result.batch_id, now_ms);
    } catch (const std::exception& e) {
      RECALL_LOG_WARN("access bookkeeping failed", {observability::StringField("owner_id", owner_id),
                                                    observability::StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().ObserveRetrievalLatencyMs("records", ElapsedMs(started));
  span.SetAttribute("tier", std::string_view("records"));
  span.SetAttribute("records", static_cast<std::int64_t>(result.records.size()));
  return result;
}

} // namespace recall::retrieval
