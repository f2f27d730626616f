#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/audit/audit_log.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/core/update_engine.hpp"
#include "internal/extraction/fact_extractor.hpp"
#include "internal/maintenance/job_queue.hpp"
#include "internal/retrieval/retrieval_composer.hpp"

namespace recall::core {

struct ObservationReport {
  std::size_t                   candidates_extracted = 0;
  std::size_t                   candidates_dropped   = 0;
  std::vector<CandidateOutcome> outcomes;
};

/*
  MemoryEngine

  Entry point for callers embedding the library:

    Observe   text -> extraction -> per-candidate update decisions
    Retrieve  token-bounded context for a query
    EnqueueJob / History / Delete for operators

  Every method is safe to call from several threads at once.
*/
class MemoryEngine {
 public:
  MemoryEngine(std::shared_ptr<MemoryStore> store, std::shared_ptr<extraction::FactExtractor> extractor,
               std::shared_ptr<UpdateEngine> updater, std::shared_ptr<retrieval::RetrievalComposer> composer,
               std::shared_ptr<maintenance::JobQueue> queue, std::shared_ptr<audit::AuditLog> audit,
               std::size_t known_entities_limit = 200, std::size_t max_content_chars = 2000);

  ObservationReport Observe(const std::string& owner_id, const std::string& text, const ApplyOptions& options = {});

  // Skips extraction; facts are validated exactly like extracted ones.
  ObservationReport ObserveCandidates(const std::string& owner_id,
                                      const std::vector<recall::memory::v1::CandidateFact>& facts,
                                      const ApplyOptions& options = {});

  retrieval::RetrievalResult Retrieve(const std::string& owner_id, const std::string& query, uint32_t token_budget = 0,
                                      bool include_private = false);

  std::string EnqueueJob(recall::memory::v1::JobType type, const std::string& owner_id, const std::string& payload_json = "{}",
                         uint64_t scheduled_for_ms = 0, const std::string& depends_on = {});

  // Audit entries, newest first.
  std::vector<db::model::MemoryOperationRecord> History(const std::string& owner_id, uint64_t limit = 0);

  // Operator delete. Soft archives; hard removes the row and keeps a snapshot in the audit log.
  db::model::MemoryRecord Delete(const std::string& owner_id, const std::string& id, bool hard);

  std::vector<std::string> KnownEntities(const std::string& owner_id);

 private:
  std::shared_ptr<MemoryStore>                   store_;
  std::shared_ptr<extraction::FactExtractor>     extractor_;
  std::shared_ptr<UpdateEngine>                  updater_;
  std::shared_ptr<retrieval::RetrievalComposer>  composer_;
  std::shared_ptr<maintenance::JobQueue>         queue_;
  std::shared_ptr<audit::AuditLog>               audit_;
  std::size_t                                    known_entities_limit_;
  std::size_t                                    max_content_chars_;
};

} // namespace recall::core
