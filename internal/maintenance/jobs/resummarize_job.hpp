#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_store.hpp"
#include "internal/maintenance/job_handler.hpp"
#include "internal/maintenance/jobs/summary_writer.hpp"

namespace recall::maintenance {

struct ResummarizePolicy {
  uint32_t max_members = 20;
  uint32_t max_chars   = 1200;
};

// FNV-1a over sorted "id:revision" pairs.
std::string MemberFingerprint(const std::vector<db::model::MemoryRecord>& members);

/*
  Rebuilds category summaries for one owner.

  Payload {"categories": [...]} restricts the pass; otherwise every category
  is visited. A summary is rewritten only when its member fingerprint changed,
  and dropped when its category no longer has eligible members.
*/
class ResummarizeJob final : public JobHandler {
 public:
  ResummarizeJob(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<SummaryWriter> writer, ResummarizePolicy policy);

  recall::memory::v1::JobType Type() const override {
    return recall::memory::v1::JOB_TYPE_RESUMMARIZE;
  }

  std::string Run(const JobContext& context) override;

 private:
  std::shared_ptr<core::MemoryStore> store_;
  std::shared_ptr<SummaryWriter>     writer_;
  ResummarizePolicy                  policy_;
};

} // namespace recall::maintenance
