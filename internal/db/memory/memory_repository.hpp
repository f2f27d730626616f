#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace recall::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMemory(Transaction&, const model::MemoryRecord&) override;
  std::optional<model::MemoryRecord> GetMemory(Transaction&, const std::string&) override;
  Result UpdateMemory(Transaction&, const model::MemoryRecord&) override;
  Result DeleteMemory(Transaction&, const std::string&) override;
  std::optional<model::MemoryRecord> GetActiveBySlot(Transaction&, const std::string& owner_id,
                                                     const std::string& subject,
                                                     const std::string& predicate) override;
  std::vector<model::MemoryRecord> ListMemories(Transaction&, const model::MemoryFilter&) override;
  std::vector<std::string> ListOwners(Transaction&) override;

  Result UpsertCategorySummary(Transaction&, const model::CategorySummaryRecord&) override;
  std::optional<model::CategorySummaryRecord> GetCategorySummary(Transaction&, const std::string& owner_id,
                                                                 const std::string& category) override;
  std::vector<model::CategorySummaryRecord> ListCategorySummaries(Transaction&, const std::string& owner_id) override;
  Result DeleteCategorySummary(Transaction&, const std::string& owner_id, const std::string& category) override;

  Result AppendOperation(Transaction&, const model::MemoryOperationRecord&) override;
  std::vector<model::MemoryOperationRecord> ListOperations(Transaction&, const std::string& owner_id,
                                                           uint64_t limit) override;

  Result InsertJob(Transaction&, const model::MaintenanceJobRecord&) override;
  std::optional<model::MaintenanceJobRecord> GetJob(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::MaintenanceJobRecord&) override;
  std::vector<model::MaintenanceJobRecord> ListJobs(Transaction&,
                                                    std::optional<recall::memory::v1::JobStatus>) override;

  Result InsertAccess(Transaction&, const model::AccessRecord&) override;
  std::vector<model::AccessRecord> ListAccesses(Transaction&, const std::string& owner_id) override;
  Result UpsertRelationship(Transaction&, const model::RelationshipRecord&) override;
  std::vector<model::RelationshipRecord> ListRelationships(Transaction&, const std::string& owner_id) override;

  Result AppendSentimentSample(Transaction&, const model::SentimentSampleRecord&) override;
  std::vector<model::SentimentSampleRecord> ListSentimentSamples(Transaction&, const std::string& owner_id,
                                                                   const std::string& subject_key, uint64_t limit) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::MemoryRecord>          memories;
    std::unordered_map<std::string, model::CategorySummaryRecord> summaries;
    std::vector<model::MemoryOperationRecord>                     operations;
    std::unordered_map<std::string, model::MaintenanceJobRecord>  jobs;
    std::vector<model::AccessRecord>                              accesses;
    std::unordered_map<std::string, model::RelationshipRecord>    relationships;
    std::vector<model::SentimentSampleRecord>                     sentiment_samples;
  };

  // Committed state is immutable once published; a writing transaction
  // copies it on first write and publishes a new one on commit.
  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

}
