#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/core/memory_store.hpp"
#include "internal/maintenance/job_handler.hpp"

namespace recall::maintenance {

struct DecayPolicy {
  double   floor        = 0.05;
  double   pinned_floor = 0.7;
  uint32_t grace_days   = 7;
};

// Importance half-life per kind, in days.
double HalfLifeDays(recall::memory::v1::MemoryKind kind);

struct DecayStep {
  double   importance    = 0.0;
  uint64_t decayed_at_ms = 0;
};

/*
  Whole-day exponential decay of one record at now_ms.

  The anchor is decayed_at (else created_at; for events, not before the
  event date). Only complete days since the anchor are applied and the
  anchor advances by exactly those days, so a second run on the same day is
  a no-op. Records used within the grace window keep their importance while
  the anchor still advances. Importance never drops below the floor and is
  never raised. nullopt when nothing is due.
*/
std::optional<DecayStep> ComputeDecay(const db::model::MemoryRecord& record, uint64_t now_ms, const DecayPolicy& policy);

class DecayJob final : public JobHandler {
 public:
  DecayJob(std::shared_ptr<core::MemoryStore> store, DecayPolicy policy);

  recall::memory::v1::JobType Type() const override {
    return recall::memory::v1::JOB_TYPE_DECAY;
  }

  std::string Run(const JobContext& context) override;

 private:
  std::shared_ptr<core::MemoryStore> store_;
  DecayPolicy                        policy_;
};

} // namespace recall::maintenance
