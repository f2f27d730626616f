#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/audit/audit_log.hpp"
#include "internal/collaborator/collaborator_client.hpp"
#include "internal/core/memory_engine.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedding_adapter.hpp"
#include "internal/maintenance/job_queue.hpp"
#include "internal/maintenance/maintenance_scheduler.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/retrieval/vector_index.hpp"

namespace recall::factory {

/*
  Runtime

  Owns all long-lived components. Everything here lives for the lifetime of
  the process; Start/Stop only concern the background threads.
*/
struct Runtime {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<core::MemoryStore>           store;
  std::shared_ptr<retrieval::VectorIndex>      index;
  std::shared_ptr<embedding::EmbeddingAdapter> embedder;
  std::shared_ptr<audit::AuditLog>             audit;
  std::shared_ptr<maintenance::JobQueue>       queue;

  std::shared_ptr<core::MemoryEngine> engine;

  std::shared_ptr<maintenance::MaintenanceWorker>    worker;
  std::shared_ptr<maintenance::MaintenanceScheduler> scheduler;

  void Start();
  void Stop();
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete backends.
  `collaborator` serves extraction, decisions and sufficiency checks; when
  null those calls fail fast and the engine degrades (no candidates, failed
  decisions, heuristic sufficiency). Maintenance never needs it.
*/
Runtime BuildRuntime(const recall::runtime::config::RuntimeConfig& config,
                     std::shared_ptr<collaborator::CollaboratorClient> collaborator = nullptr);

// Repository for the configured backend with its schema migrated.
std::shared_ptr<db::Repository> BuildRepository(const recall::runtime::config::RuntimeConfig& config);

} // namespace recall::factory
