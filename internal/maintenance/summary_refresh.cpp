#include "internal/maintenance/summary_refresh.hpp"

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/proto_json.hpp"

namespace recall::maintenance {

using namespace recall::memory::v1;

SummaryRefresh::SummaryRefresh(std::shared_ptr<JobQueue> queue) : queue_(std::move(queue)) {
  if (!queue_) {
    throw std::invalid_argument("SummaryRefresh: queue is required");
  }
}

void SummaryRefresh::OnSummariesInvalidated(const std::string& owner_id, const std::vector<std::string>& categories) {
  if (categories.empty()) {
    return;
  }

  google::protobuf::Struct payload;
  auto*                    list = (*payload.mutable_fields())["categories"].mutable_list_value();
  for (const auto& category : categories) list->add_values()->set_string_value(category);

  try {
    const auto id = queue_->Enqueue(JOB_TYPE_RESUMMARIZE, owner_id, util::ToJson(payload));
    RECALL_LOG_DEBUG("resummarize queued for invalidated summaries",
                     {observability::StringField("owner_id", owner_id), observability::StringField("job_id", id),
                      observability::IntField("categories", static_cast<std::int64_t>(categories.size()))});
  } catch (const std::exception& e) {
    RECALL_LOG_WARN("could not queue resummarize for invalidated summaries",
                    {observability::StringField("owner_id", owner_id), observability::StringField("error", e.what())});
  }
}

} // namespace recall::maintenance
