#include "internal/maintenance/jobs/decay_job.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace recall::maintenance {

using namespace recall::memory::v1;

double HalfLifeDays(MemoryKind kind) {
  switch (kind) {
    case MEMORY_KIND_PREFERENCE:
      return 180;
    case MEMORY_KIND_ENTITY:
      return 365;
    case MEMORY_KIND_PROCEDURE:
      return 120;
    case MEMORY_KIND_GOAL:
      return 60;
    case MEMORY_KIND_ACTION:
      return 30;
    case MEMORY_KIND_EVENT:
      return 14;
    case MEMORY_KIND_FACT:
    case MEMORY_KIND_DECISION:
    default:
      return 90;
  }
}

std::optional<DecayStep> ComputeDecay(const db::model::MemoryRecord& record, uint64_t now_ms, const DecayPolicy& policy) {
  if (record.status != RECORD_STATUS_ACTIVE) return std::nullopt;

  uint64_t anchor = record.decayed_at_ms != 0 ? record.decayed_at_ms : record.created_at_ms;
  if (record.kind == MEMORY_KIND_EVENT && record.effective_from_ms != 0) {
    if (record.effective_from_ms > now_ms) return std::nullopt;
    anchor = std::max(anchor, record.effective_from_ms);
  }
  if (anchor == 0 || anchor >= now_ms) return std::nullopt;

  const uint64_t days = (now_ms - anchor) / util::kMillisPerDay;
  if (days == 0) return std::nullopt;

  DecayStep step;
  step.importance    = record.importance;
  step.decayed_at_ms = anchor + days * util::kMillisPerDay;

  const bool recently_used = record.last_accessed_at_ms != 0 &&
                             now_ms - std::min(now_ms, record.last_accessed_at_ms) < policy.grace_days * util::kMillisPerDay;
  if (recently_used) return step;

  const double floor = record.user_pinned ? policy.pinned_floor : policy.floor;
  if (record.importance <= floor) return step;

  const double decayed = record.importance * std::pow(0.5, static_cast<double>(days) / HalfLifeDays(record.kind));
  step.importance      = std::max(floor, decayed);
  return step;
}

DecayJob::DecayJob(std::shared_ptr<core::MemoryStore> store, DecayPolicy policy) : store_(std::move(store)), policy_(policy) {
}

std::string DecayJob::Run(const JobContext& context) {
  std::size_t decayed = 0;
  std::size_t skipped = 0;

  for (const auto& record : store_->ListActive(context.job.owner_id)) {
    auto step = ComputeDecay(record, context.now_ms, policy_);
    if (!step) continue;

    core::RecordPatch patch;
    patch.importance    = step->importance;
    patch.decayed_at_ms = step->decayed_at_ms;
    try {
      store_->Update(record.id, patch, record.revision);
      if (step->importance < record.importance) ++decayed;
    } catch (const util::SlotConflict&) {
      // Changed under us; the next run picks it up.
      ++skipped;
    }
  }

  RECALL_LOG_DEBUG("decay pass", {observability::StringField("owner_id", context.job.owner_id),
                                  observability::IntField("decayed", static_cast<std::int64_t>(decayed)),
                                  observability::IntField("skipped", static_cast<std::int64_t>(skipped))});
  return "decayed=" + std::to_string(decayed) + " skipped=" + std::to_string(skipped);
}

} // namespace recall::maintenance
