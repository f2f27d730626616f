#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/decision/decision_adapter.hpp"
#include "internal/embedding/hashing_embedding_provider.hpp"
#include "internal/extraction/fact_extractor.hpp"
#include "internal/maintenance/jobs/cleanup_job.hpp"
#include "internal/maintenance/jobs/consolidate_job.hpp"
#include "internal/maintenance/jobs/decay_job.hpp"
#include "internal/maintenance/jobs/reindex_job.hpp"
#include "internal/maintenance/jobs/resummarize_job.hpp"
#include "internal/maintenance/jobs/summary_writer.hpp"
#include "internal/maintenance/summary_refresh.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retrieval/retrieval_composer.hpp"
#include "internal/retrieval/similarity_retriever.hpp"
#include "internal/retrieval/sufficiency_judge.hpp"
#if RECALL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RECALL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace recall::factory {

using recall::runtime::config::RuntimeConfig;

namespace {

collaborator::CallPolicy ToCallPolicy(const recall::runtime::config::CollaboratorConfig& config) {
  collaborator::CallPolicy policy;
  policy.timeout     = std::chrono::milliseconds(config.timeout_ms());
  policy.max_retries = config.max_retries();
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RECALL_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    const auto applied = sqlite_db->Migrate();
    RECALL_LOG_INFO("sqlite schema ready", {observability::StringField("path", database.sqlite().path()),
                                            observability::IntField("migrations_applied", static_cast<std::int64_t>(applied))});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RECALL_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    const auto applied = pool->Migrate();
    RECALL_LOG_INFO("postgres schema ready", {observability::IntField("migrations_applied", static_cast<std::int64_t>(applied))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const RuntimeConfig& config, std::shared_ptr<collaborator::CollaboratorClient> collaborator) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.store      = std::make_shared<core::MemoryStore>(rt.repository);
  rt.audit      = std::make_shared<audit::AuditLog>(rt.repository);

  rt.index = std::make_shared<retrieval::VectorIndex>();
  const auto indexed = rt.index->Hydrate(*rt.store);
  rt.store->AddListener(rt.index);

  // ------------------------------------------------------------------
  // Collaborator adapters
  // ------------------------------------------------------------------
  const auto& emb = config.embedding();
  embedding::EmbeddingPolicy embedding_policy;
  embedding_policy.timeout     = std::chrono::milliseconds(emb.timeout_ms());
  embedding_policy.max_retries = emb.max_retries();
  rt.embedder = std::make_shared<embedding::EmbeddingAdapter>(std::make_shared<embedding::HashingEmbeddingProvider>(emb.dimensions()),
                                                              embedding_policy);

  if (!collaborator) {
    RECALL_LOG_WARN("no language-model collaborator configured; extraction and update decisions are unavailable");
  }

  const auto& update = config.update_engine();
  auto extractor = std::make_shared<extraction::FactExtractor>(collaborator, ToCallPolicy(config.extraction()), update.max_content_chars());
  auto decider   = std::make_shared<decision::DecisionAdapter>(collaborator, ToCallPolicy(config.decision()));
  auto retriever = std::make_shared<retrieval::SimilarityRetriever>(rt.store, rt.index);

  std::shared_ptr<retrieval::SufficiencyJudge> judge;
  if (collaborator) {
    judge = std::make_shared<retrieval::CollaboratorSufficiencyJudge>(collaborator, ToCallPolicy(config.decision()));
  } else {
    judge = std::make_shared<retrieval::HeuristicSufficiencyJudge>();
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  core::UpdatePolicy update_policy;
  update_policy.similar_k            = update.similar_k();
  update_policy.similarity_threshold = update.similarity_threshold();
  update_policy.max_conflict_retries = update.max_conflict_retries();
  auto updater = std::make_shared<core::UpdateEngine>(rt.store, rt.embedder, retriever, decider, rt.audit, update_policy);

  const auto&                retrieval = config.retrieval();
  retrieval::RetrievalPolicy retrieval_policy;
  retrieval_policy.default_token_budget   = retrieval.default_token_budget();
  retrieval_policy.candidate_pool         = retrieval.candidate_pool();
  retrieval_policy.min_similarity         = retrieval.min_similarity();
  retrieval_policy.min_value_per_token    = retrieval.min_value_per_token();
  retrieval_policy.recency_half_life_days = retrieval.recency_half_life_days();
  retrieval_policy.max_summary_categories = retrieval.max_summary_categories();
  auto composer = std::make_shared<retrieval::RetrievalComposer>(rt.store, rt.embedder, retriever, judge, retrieval_policy);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  const auto&                 m = config.maintenance();
  maintenance::JobQueuePolicy queue_policy;
  queue_policy.max_attempts = m.max_attempts();
  queue_policy.backoff_base = std::chrono::milliseconds(m.backoff_base_ms());
  rt.queue                  = std::make_shared<maintenance::JobQueue>(rt.repository, queue_policy);
  const auto recovered      = rt.queue->RecoverStale();
  rt.store->AddListener(std::make_shared<maintenance::SummaryRefresh>(rt.queue));

  rt.engine = std::make_shared<core::MemoryEngine>(rt.store, extractor, updater, composer, rt.queue, rt.audit,
                                                   update.known_entities_limit(), update.max_content_chars());

  maintenance::DecayPolicy decay_policy;
  decay_policy.floor        = m.decay().floor();
  decay_policy.pinned_floor = m.decay().pinned_floor();
  decay_policy.grace_days   = m.decay().grace_days();

  maintenance::ResummarizePolicy resummarize_policy;
  resummarize_policy.max_members = m.resummarize().max_members();
  resummarize_policy.max_chars   = m.resummarize().max_chars();

  maintenance::CleanupPolicy cleanup_policy;
  cleanup_policy.unused_days          = m.cleanup().unused_days();
  cleanup_policy.low_importance_below = m.cleanup().low_importance_below();

  std::vector<std::shared_ptr<maintenance::JobHandler>> handlers = {
      std::make_shared<maintenance::DecayJob>(rt.store, decay_policy),
      std::make_shared<maintenance::ConsolidateJob>(rt.store, rt.embedder, rt.audit, m.consolidate().similarity_threshold()),
      std::make_shared<maintenance::ResummarizeJob>(rt.store, std::make_shared<maintenance::ExtractiveSummaryWriter>(),
                                                    resummarize_policy),
      std::make_shared<maintenance::ReindexJob>(rt.store, rt.embedder),
      std::make_shared<maintenance::CleanupJob>(rt.store, rt.audit, cleanup_policy),
  };
  rt.worker = std::make_shared<maintenance::MaintenanceWorker>(rt.queue, std::move(handlers), m.workers(),
                                                               std::chrono::milliseconds(m.poll_interval_ms()));

  if (!m.disable_scheduler()) {
    maintenance::SchedulePolicy schedule;
    schedule.tick                        = std::chrono::milliseconds(m.scheduler_tick_ms());
    schedule.resummarize_min_new_records = m.resummarize().min_new_records();
    rt.scheduler = std::make_shared<maintenance::MaintenanceScheduler>(rt.store, rt.queue, rt.embedder->ModelName(), schedule);
  }

  RECALL_LOG_INFO("runtime built", {observability::IntField("indexed_records", static_cast<std::int64_t>(indexed)),
                                    observability::IntField("recovered_jobs", static_cast<std::int64_t>(recovered)),
                                    observability::IntField("workers", m.workers()),
                                    observability::BoolField("scheduler", rt.scheduler != nullptr)});
  return rt;
}

void Runtime::Start() {
  if (worker) worker->Start();
  if (scheduler) scheduler->Start();
}

void Runtime::Stop() {
  if (scheduler) scheduler->Stop();
  if (worker) worker->Stop();
}

} // namespace recall::factory
