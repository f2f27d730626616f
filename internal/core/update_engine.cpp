#include "internal/core/update_engine.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "internal/core/category_classifier.hpp"
#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace recall::core {

using namespace recall::memory::v1;
using db::model::MemoryRecord;
using extraction::Candidate;
using retrieval::SimilarRecord;

struct UpdateEngine::Plan {
  Operation                   operation = OPERATION_NOOP;
  MergeStrategy               strategy  = MERGE_STRATEGY_UNSPECIFIED;
  std::optional<MemoryRecord> target;
  bool                        hard_delete = false;
  bool                        link_alias  = false;
  std::string                 reasoning;
};

struct UpdateEngine::Applied {
  std::vector<std::string> result_ids;
  std::string              old_content;
  std::string              new_content;
  std::string              snapshot_json;
};

namespace {

// Similarities this close are treated as a tie.
constexpr double kTieBand = 0.01;

bool NamesSubject(const MemoryRecord& r, const std::string& subject) {
  const auto key = util::NormalizeKey(subject);
  if (util::NormalizeKey(r.subject_name) == key) return true;
  for (const auto& alias : r.aliases) {
    if (util::NormalizeKey(alias) == key) return true;
  }
  return false;
}

// True when `incoming` adds nothing to `existing`.
bool Covers(const std::string& existing, const std::string& incoming) {
  const auto in = util::NormalizeText(incoming);
  if (in.empty()) return true;
  const auto ex = util::NormalizeText(existing);
  return (" " + ex + " ").find(" " + in + " ") != std::string::npos;
}

std::vector<std::string> WithAlias(std::vector<std::string> aliases, const MemoryRecord& target, const std::string& name) {
  if (NamesSubject(target, name)) return aliases;
  aliases.push_back(util::Trim(name));
  return aliases;
}

Sensitivity Strictest(Sensitivity a, Sensitivity b) {
  return static_cast<Sensitivity>(std::max(static_cast<int>(a), static_cast<int>(b)));
}

// Similarity descending; inside a tie band, most recently accessed then most important first.
void Rank(std::vector<SimilarRecord>& similar) {
  std::stable_sort(similar.begin(), similar.end(),
                   [](const SimilarRecord& a, const SimilarRecord& b) { return a.similarity > b.similarity; });

  for (std::size_t start = 0; start < similar.size();) {
    std::size_t end = start + 1;
    while (end < similar.size() && similar[start].similarity - similar[end].similarity <= kTieBand) ++end;
    std::stable_sort(similar.begin() + start, similar.begin() + end, [](const SimilarRecord& a, const SimilarRecord& b) {
      if (a.record.last_accessed_at_ms != b.record.last_accessed_at_ms) {
        return a.record.last_accessed_at_ms > b.record.last_accessed_at_ms;
      }
      return a.record.importance > b.record.importance;
    });
    start = end;
  }
}

const SimilarRecord* FindById(const std::vector<SimilarRecord>& similar, const std::string& id) {
  for (const auto& s : similar) {
    if (s.record.id == id) return &s;
  }
  return nullptr;
}

const SimilarRecord* BestForSubject(const std::vector<SimilarRecord>& similar, const std::string& subject) {
  for (const auto& s : similar) {
    if (NamesSubject(s.record, subject)) return &s;
  }
  return nullptr;
}

uint64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count());
}

} // namespace

UpdateEngine::UpdateEngine(std::shared_ptr<MemoryStore> store, std::shared_ptr<embedding::EmbeddingAdapter> embedder,
                           std::shared_ptr<retrieval::SimilarityRetriever> retriever,
                           std::shared_ptr<decision::DecisionAdapter> decider, std::shared_ptr<audit::AuditLog> audit,
                           UpdatePolicy policy)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      retriever_(std::move(retriever)),
      decider_(std::move(decider)),
      audit_(std::move(audit)),
      policy_(policy) {
  if (!store_ || !embedder_ || !retriever_ || !decider_ || !audit_) {
    throw std::invalid_argument("UpdateEngine: all collaborators are required");
  }
  if (policy_.max_conflict_retries == 0) policy_.max_conflict_retries = 1;
}

std::vector<CandidateOutcome> UpdateEngine::Apply(const std::string& owner_id, const std::vector<Candidate>& candidates,
                                                  const ApplyOptions& options) {
  std::vector<CandidateOutcome> outcomes(candidates.size());
  std::vector<std::size_t>      requeued;

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    try {
      outcomes[i] = Process(owner_id, candidates[i], options, /*allow_requeue=*/true);
    } catch (const util::DecisionUnavailable& e) {
      RECALL_LOG_WARN("decision unavailable; candidate requeued",
                      {observability::StringField("owner_id", owner_id), observability::IntField("index", static_cast<std::int64_t>(i)),
                       observability::StringField("error", e.what())});
      requeued.push_back(i);
    }
  }

  // One more pass for candidates whose decision call failed.
  for (auto i : requeued) {
    outcomes[i] = Process(owner_id, candidates[i], options, /*allow_requeue=*/false);
  }
  return outcomes;
}

CandidateOutcome UpdateEngine::Process(const std::string& owner_id, const Candidate& candidate, const ApplyOptions& options,
                                       bool allow_requeue) {
  const auto               started = std::chrono::steady_clock::now();
  observability::SpanScope span("recall.update.candidate", owner_id);

  db::model::MemoryOperationRecord entry;
  entry.owner_id       = owner_id;
  entry.candidate_text = embedding::EmbeddingAdapter::RecordText(candidate.subject_name, candidate.content);
  entry.candidate_json = util::ToJson(candidate.wire);
  entry.job_id         = options.job_id;
  entry.source_id      = options.source_id;

  CandidateOutcome result;
  Plan             plan;
  Applied          applied;

  auto finish = [&](OperationOutcome outcome, const std::string& error) {
    result.operation = plan.operation;
    result.strategy  = plan.strategy;
    result.outcome   = outcome;
    result.target_id = plan.target ? plan.target->id : std::string{};
    result.reasoning = plan.reasoning;
    result.error     = error;
    if (outcome == OPERATION_OUTCOME_APPLIED) {
      result.result_ids = applied.result_ids;
    }

    entry.operation      = result.operation;
    entry.merge_strategy = result.strategy;
    entry.outcome        = outcome;
    entry.target_id      = result.target_id;
    entry.result_ids     = result.result_ids;
    entry.reasoning      = result.reasoning;
    entry.old_content    = applied.old_content;
    entry.new_content    = applied.new_content;
    entry.snapshot_json  = applied.snapshot_json;
    entry.error          = error;
    entry.duration_ms    = ElapsedMs(started);

    entry.id = util::NewId();
    if (audit_->Record(entry)) result.audit_id = entry.id;

    const auto op_name = OperationName(result.operation);
    observability::Metrics::Instance().RecordDecision(op_name, OutcomeName(outcome));
    observability::Metrics::Instance().ObserveDecisionLatencyMs(op_name, static_cast<double>(entry.duration_ms));
    span.SetAttribute("operation", op_name);
    span.SetOutcome(OutcomeName(outcome));

    RECALL_LOG_INFO("candidate applied", {observability::StringField("owner_id", owner_id),
                                          observability::StringField("operation", op_name),
                                          observability::StringField("strategy", StrategyName(result.strategy)),
                                          observability::StringField("outcome", OutcomeName(outcome)),
                                          observability::StringField("target_id", result.target_id),
                                          observability::ContentField("candidate", entry.candidate_text),
                                          observability::IntField("duration_ms", static_cast<std::int64_t>(entry.duration_ms))});
    return result;
  };

  try {
    const auto embedding = embedder_->EmbedRecord(candidate.subject_name, candidate.content);

    auto similar = retriever_->FindSimilar(owner_id, embedding, policy_.similar_k, policy_.similarity_threshold);
    if (!candidate.predicate.empty()) {
      auto holder = store_->GetActiveBySlot(owner_id, candidate.subject_name, candidate.predicate);
      if (holder && !FindById(similar, holder->id)) {
        const auto similarity = util::CosineSimilarity(embedding, holder->embedding);
        similar.push_back({std::move(*holder), similarity});
      }
    }
    Rank(similar);
    for (const auto& s : similar) entry.similar_ids.push_back(s.record.id);

    if (candidate.forget_requested) {
      // The user asked to forget: never consult the collaborator. A slot is
      // forgotten only through its holder; otherwise the record must be
      // similar to the request and name its subject.
      std::optional<MemoryRecord> match;
      if (!candidate.predicate.empty()) {
        match = store_->GetActiveBySlot(owner_id, candidate.subject_name, candidate.predicate);
      } else if (const auto* hit = BestForSubject(similar, candidate.subject_name)) {
        match = hit->record;
      }

      if (match) {
        plan.operation   = OPERATION_DELETE;
        plan.target      = std::move(match);
        plan.hard_delete = true;
        plan.reasoning   = "forget requested";
      } else {
        plan.reasoning = "forget requested; nothing stored to forget";
      }
    } else {
      const SimilarRecord* duplicate = nullptr;
      for (const auto& s : similar) {
        if (NamesSubject(s.record, candidate.subject_name) &&
            util::NormalizeText(s.record.content) == util::NormalizeText(candidate.content)) {
          duplicate = &s;
          break;
        }
      }

      if (duplicate) {
        plan.target    = duplicate->record;
        plan.reasoning = "verbatim duplicate of an active record";
      } else {
        std::vector<MemoryRecordView> views;
        views.reserve(similar.size());
        for (const auto& s : similar) views.push_back(ToView(s.record, s.similarity));

        decision::Decision decision;
        try {
          decision = decider_->Decide(candidate.wire, views);
        } catch (const util::DecisionUnavailable& e) {
          if (allow_requeue) throw;
          return finish(OPERATION_OUTCOME_FAILED, std::string("decision unavailable: ") + e.what());
        }
        plan = Resolve(owner_id, candidate, similar, decision);
      }
    }

    for (uint32_t attempt = 1;; ++attempt) {
      try {
        options.cancel.ThrowIfCancelled("apply candidate");
        applied = Applied{};
        Execute(owner_id, candidate, embedding, plan, applied);
        break;
      } catch (const util::SlotConflict& e) {
        if (attempt >= policy_.max_conflict_retries) throw;
        RECALL_LOG_DEBUG("write conflict; reconciling", {observability::StringField("owner_id", owner_id),
                                                         observability::StringField("occupant_id", e.OccupantId()),
                                                         observability::IntField("attempt", attempt)});
        Reconcile(owner_id, candidate, e.OccupantId(), plan);
      } catch (const util::NotFound&) {
        if (attempt >= policy_.max_conflict_retries) throw;
        Reconcile(owner_id, candidate, {}, plan);
      }
    }

    if (candidate.sentiment && !applied.result_ids.empty() &&
        (plan.operation == OPERATION_ADD || plan.operation == OPERATION_UPDATE)) {
      // Sentiment history is bookkeeping; the write above stands either way.
      const auto& record_id = applied.result_ids.back();
      try {
        store_->RecordSentiment(record_id, *candidate.sentiment, options.source_id, util::ToUnixMillis(util::Now()),
                                policy_.sentiment_window);
      } catch (const std::exception& e) {
        RECALL_LOG_WARN("sentiment history not updated", {observability::StringField("owner_id", owner_id),
                                                          observability::StringField("record_id", record_id),
                                                          observability::StringField("error", e.what())});
      }
    }
    return finish(OPERATION_OUTCOME_APPLIED, {});
  } catch (const util::DecisionUnavailable&) {
    throw;
  } catch (const util::OperationCancelled& e) {
    return finish(OPERATION_OUTCOME_CANCELLED, e.what());
  } catch (const util::InvariantViolation& e) {
    RECALL_LOG_ERROR("invariant violation; candidate rejected",
                     {observability::StringField("owner_id", owner_id),
                      observability::StringField("operation", OperationName(plan.operation)),
                      observability::StringField("strategy", StrategyName(plan.strategy)),
                      observability::StringField("target_id", plan.target ? plan.target->id : std::string{}),
                      observability::StringField("source_id", options.source_id),
                      observability::StringField("error", e.what())});
    span.RecordException(e.what());
    return finish(OPERATION_OUTCOME_REJECTED, e.what());
  } catch (const util::EmbeddingUnavailable& e) {
    span.RecordException(e.what());
    return finish(OPERATION_OUTCOME_FAILED, e.what());
  } catch (const std::exception& e) {
    RECALL_LOG_ERROR("candidate failed", {observability::StringField("owner_id", owner_id),
                                          observability::StringField("operation", OperationName(plan.operation)),
                                          observability::StringField("error", e.what())});
    span.RecordException(e.what());
    return finish(OPERATION_OUTCOME_FAILED, e.what());
  }
}

UpdateEngine::Plan UpdateEngine::Resolve(const std::string& owner_id, const Candidate& candidate,
                                         const std::vector<SimilarRecord>& similar, const decision::Decision& decision) {
  Plan plan;
  plan.operation = decision.operation;
  plan.strategy  = decision.strategy;
  plan.reasoning = decision.reasoning;

  if (plan.operation == OPERATION_NOOP) {
    plan.strategy = MERGE_STRATEGY_UNSPECIFIED;
    if (const auto* hit = FindById(similar, decision.target_id)) plan.target = hit->record;
    return plan;
  }

  if (plan.operation == OPERATION_UPDATE || plan.operation == OPERATION_DELETE) {
    const auto* hit = FindById(similar, decision.target_id);
    if (!hit && !similar.empty()) hit = &similar.front();

    if (!hit) {
      if (plan.operation == OPERATION_UPDATE) {
        plan.operation = OPERATION_ADD;
        plan.reasoning += " [no update target; added]";
      } else {
        plan.operation = OPERATION_NOOP;
        plan.reasoning += " [no delete target]";
      }
    } else {
      plan.target = hit->record;
    }
  }

  if (plan.operation == OPERATION_ADD) {
    plan.strategy = MERGE_STRATEGY_UNSPECIFIED;
    plan.target.reset();
    if (!candidate.predicate.empty()) {
      for (const auto& s : similar) {
        if (s.record.status == RECORD_STATUS_ACTIVE && NamesSubject(s.record, candidate.subject_name) &&
            util::NormalizeKey(s.record.predicate) == util::NormalizeKey(candidate.predicate) &&
            util::NormalizeKey(s.record.subject_name) == util::NormalizeKey(candidate.subject_name)) {
          plan.operation = OPERATION_UPDATE;
          plan.strategy  = MERGE_STRATEGY_SUPERSEDE;
          plan.target    = s.record;
          plan.reasoning += " [slot occupied; superseding holder]";
          break;
        }
      }
    }
    return plan;
  }

  if (plan.operation == OPERATION_NOOP) {
    plan.strategy = MERGE_STRATEGY_UNSPECIFIED;
    return plan;
  }

  auto& target = *plan.target;

  // Subject guard.
  if (!NamesSubject(target, candidate.subject_name)) {
    if (decision.same_entity) {
      plan.link_alias = true;
    } else if (plan.operation == OPERATION_UPDATE) {
      RECALL_LOG_INFO("subject guard: update across subjects became add",
                      {observability::StringField("owner_id", owner_id), observability::StringField("target_id", target.id)});
      plan.operation = OPERATION_ADD;
      plan.strategy  = MERGE_STRATEGY_UNSPECIFIED;
      plan.target.reset();
      plan.reasoning += " [different subject; added]";
      return plan;
    } else {
      plan.operation = OPERATION_NOOP;
      plan.strategy  = MERGE_STRATEGY_UNSPECIFIED;
      plan.reasoning += " [different subject; not deleted]";
      return plan;
    }
  }

  if (plan.operation == OPERATION_DELETE) {
    plan.strategy = MERGE_STRATEGY_UNSPECIFIED;
    return plan;
  }

  if (plan.strategy == MERGE_STRATEGY_UNSPECIFIED || plan.strategy == MERGE_STRATEGY_ALIAS) {
    plan.strategy = MERGE_STRATEGY_APPEND;
  }
  if (candidate.is_historical && plan.strategy == MERGE_STRATEGY_REPLACE && target.status == RECORD_STATUS_ACTIVE &&
      !target.is_historical) {
    plan.strategy = MERGE_STRATEGY_SUPERSEDE;
    plan.reasoning += " [historical fact; superseding instead of replacing]";
  }
  return plan;
}

MemoryRecord UpdateEngine::NewRecord(const std::string& owner_id, const Candidate& candidate,
                                     const std::vector<float>& embedding) const {
  MemoryRecord r;
  r.owner_id          = owner_id;
  r.kind              = candidate.kind;
  r.subject_name      = candidate.subject_name;
  r.content           = candidate.content;
  r.predicate         = candidate.predicate;
  r.object            = candidate.object;
  r.embedding         = embedding;
  r.embedding_model   = embedder_->ModelName();
  r.importance        = candidate.importance;
  r.sentiment         = candidate.sentiment;
  r.is_historical     = candidate.is_historical;
  r.user_pinned       = candidate.importance >= 1.0;
  r.effective_from_ms = candidate.effective_from_ms;
  r.expires_at_ms     = candidate.expires_at_ms;
  r.recurrence_json   = candidate.recurrence_json;
  r.sensitivity       = candidate.sensitivity;
  r.status            = RECORD_STATUS_ACTIVE;
  r.category          = ClassifyCategory(candidate.kind, candidate.subject_name + " " + candidate.content);
  return r;
}

void UpdateEngine::Execute(const std::string& owner_id, const Candidate& candidate, const std::vector<float>& embedding,
                           Plan& plan, Applied& applied) {
  switch (plan.operation) {
    case OPERATION_ADD: {
      auto inserted       = store_->Insert(NewRecord(owner_id, candidate, embedding));
      applied.result_ids  = {inserted.id};
      applied.new_content = inserted.content;
      return;
    }

    case OPERATION_DELETE: {
      const auto& target  = *plan.target;
      applied.old_content = target.content;
      if (plan.hard_delete) {
        auto removed          = store_->HardDelete(target.id);
        applied.snapshot_json = SnapshotJson(removed);
      } else {
        store_->SoftDelete(target.id, target.revision);
      }
      applied.result_ids = {target.id};
      return;
    }

    case OPERATION_UPDATE:
      break;

    default:
      if (plan.target) applied.result_ids = {plan.target->id};
      return;
  }

  const auto& target  = *plan.target;
  applied.old_content = target.content;

  if (plan.strategy == MERGE_STRATEGY_SUPERSEDE) {
    auto replacement         = NewRecord(owner_id, candidate, embedding);
    replacement.subject_name = target.subject_name;
    replacement.aliases      = target.aliases;
    if (plan.link_alias) replacement.aliases = WithAlias(replacement.aliases, target, candidate.subject_name);
    replacement.user_pinned = replacement.user_pinned || target.user_pinned;
    replacement.sensitivity = Strictest(replacement.sensitivity, target.sensitivity);
    if (util::NormalizeKey(candidate.subject_name) != util::NormalizeKey(target.subject_name)) {
      replacement.embedding = embedder_->EmbedRecord(target.subject_name, candidate.content);
    }

    auto superseded     = store_->Supersede(target.id, std::move(replacement), target.revision);
    applied.result_ids  = {superseded.old_record.id, superseded.new_record.id};
    applied.new_content = superseded.new_record.content;
    return;
  }

  RecordPatch patch;
  if (plan.link_alias && !NamesSubject(target, candidate.subject_name)) {
    patch.aliases = WithAlias(target.aliases, target, candidate.subject_name);
  }

  if (plan.strategy == MERGE_STRATEGY_APPEND && Covers(target.content, candidate.content)) {
    if (!patch.aliases) {
      plan.operation = OPERATION_NOOP;
      plan.strategy  = MERGE_STRATEGY_UNSPECIFIED;
      plan.reasoning += " [content already present]";
      applied.result_ids = {target.id};
      return;
    }
    plan.strategy = MERGE_STRATEGY_ALIAS;
  }

  if (plan.strategy == MERGE_STRATEGY_REPLACE || plan.strategy == MERGE_STRATEGY_APPEND) {
    const auto content = plan.strategy == MERGE_STRATEGY_REPLACE ? candidate.content
                                                                  : util::JoinSentences(target.content, candidate.content);
    patch.content         = content;
    patch.embedding       = embedder_->EmbedRecord(target.subject_name, content);
    patch.embedding_model = embedder_->ModelName();
    patch.importance      = std::max(target.importance, candidate.importance);
    patch.sensitivity     = Strictest(target.sensitivity, candidate.sensitivity);
    patch.category        = ClassifyCategory(target.kind, target.subject_name + " " + content);
    if (plan.strategy == MERGE_STRATEGY_REPLACE) {
      patch.object        = candidate.object;
      patch.is_historical = candidate.is_historical;
    }
    if (candidate.sentiment) patch.sentiment = candidate.sentiment;
    if (candidate.effective_from_ms != 0) patch.effective_from_ms = candidate.effective_from_ms;
    if (candidate.expires_at_ms != 0) patch.expires_at_ms = candidate.expires_at_ms;
    if (candidate.importance >= 1.0) patch.user_pinned = true;
  }

  auto updated        = store_->Update(target.id, patch, target.revision);
  applied.result_ids  = {updated.id};
  applied.new_content = updated.content;
}

void UpdateEngine::Reconcile(const std::string& owner_id, const Candidate& candidate, const std::string& occupant_id,
                             Plan& plan) {
  auto to_noop = [&plan](const std::string& why) {
    plan.operation = OPERATION_NOOP;
    plan.strategy  = MERGE_STRATEGY_UNSPECIFIED;
    plan.reasoning += " [" + why + "]";
  };

  if (plan.operation == OPERATION_ADD) {
    std::optional<MemoryRecord> holder;
    if (!occupant_id.empty()) holder = store_->GetById(occupant_id);
    if (!holder || holder->status != RECORD_STATUS_ACTIVE) {
      holder = store_->GetActiveBySlot(owner_id, candidate.subject_name, candidate.predicate);
    }
    if (!holder) return; // slot freed meanwhile; retry the insert

    plan.target = holder;
    if (Covers(holder->content, candidate.content)) {
      to_noop("concurrent writer stored the same content");
    } else {
      plan.operation = OPERATION_UPDATE;
      plan.strategy  = MERGE_STRATEGY_SUPERSEDE;
      plan.reasoning += " [slot taken concurrently; superseding holder]";
    }
    return;
  }

  if (!plan.target) return;

  std::optional<MemoryRecord> head;
  try {
    head = store_->ChainHead(plan.target->id);
  } catch (const util::NotFound&) {
    head.reset();
  }

  if (!head || head->status != RECORD_STATUS_ACTIVE) {
    if (plan.operation == OPERATION_UPDATE && plan.strategy != MERGE_STRATEGY_ALIAS) {
      plan.operation = OPERATION_ADD;
      plan.strategy  = MERGE_STRATEGY_UNSPECIFIED;
      plan.target.reset();
      plan.link_alias = false;
      plan.reasoning += " [target removed concurrently; added]";
    } else {
      to_noop("target removed concurrently");
    }
    return;
  }

  plan.target = head;
  if (plan.operation == OPERATION_UPDATE && plan.strategy != MERGE_STRATEGY_ALIAS && Covers(head->content, candidate.content)) {
    to_noop("head already holds this content");
  }
}

} // namespace recall::core
