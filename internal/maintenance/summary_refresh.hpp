#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/memory_store.hpp"
#include "internal/maintenance/job_queue.hpp"

namespace recall::maintenance {

/*
  Store listener that queues a resummarize for categories whose summary the
  store dropped. Enqueue failures are logged; the weekly pass picks the
  category up again.
*/
class SummaryRefresh final : public core::StoreListener {
 public:
  explicit SummaryRefresh(std::shared_ptr<JobQueue> queue);

  void OnRecordChanged(const db::model::MemoryRecord&) override {}
  void OnRecordRemoved(const std::string&, const std::string&) override {}
  void OnSummariesInvalidated(const std::string& owner_id, const std::vector<std::string>& categories) override;

 private:
  std::shared_ptr<JobQueue> queue_;
};

} // namespace recall::maintenance
