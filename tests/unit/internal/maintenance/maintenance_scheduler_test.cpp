#include "internal/maintenance/maintenance_scheduler.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <thread>

#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::maintenance::MaintenanceScheduler;
using recall::maintenance::SchedulePolicy;
using recall::testing::NowMs;
using recall::testing::TestStack;

namespace {

const std::string kOwner = "user-1";

std::map<JobType, int> OpenJobs(TestStack& stack) {
  std::map<JobType, int> out;
  for (auto status : {JOB_STATUS_PENDING, JOB_STATUS_RUNNING}) {
    for (const auto& job : stack.queue->List(status)) ++out[job.job_type];
  }
  return out;
}

void DrainAll(TestStack& stack, uint64_t now_ms) {
  while (auto job = stack.queue->ClaimNext(now_ms)) stack.queue->Complete(job->id, now_ms);
}

void TestFirstTickSchedulesEverything() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  MaintenanceScheduler scheduler(stack.store, stack.queue, stack.embedder->ModelName(), SchedulePolicy{});

  const auto now = NowMs();
  assert(scheduler.Tick(now) == 5);

  auto open = OpenJobs(stack);
  assert(open[JOB_TYPE_DECAY] == 1);
  assert(open[JOB_TYPE_CLEANUP] == 1);
  assert(open[JOB_TYPE_REINDEX] == 1);
  assert(open[JOB_TYPE_CONSOLIDATE] == 1);
  assert(open[JOB_TYPE_RESUMMARIZE] == 1);

  // Resummarize waits for consolidate.
  for (const auto& job : stack.queue->List(JOB_STATUS_PENDING)) {
    if (job.job_type != JOB_TYPE_RESUMMARIZE) continue;
    auto dependency = stack.queue->Get(job.depends_on);
    assert(dependency && dependency->job_type == JOB_TYPE_CONSOLIDATE);
  }

  // Open jobs are never enqueued twice.
  assert(scheduler.Tick(now) == 0);
}

void TestPeriodsComeFromJobHistory() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  const auto now = NowMs();

  {
    MaintenanceScheduler scheduler(stack.store, stack.queue, stack.embedder->ModelName(), SchedulePolicy{});
    scheduler.Tick(now);
  }
  DrainAll(stack, now);

  // A fresh scheduler (as after a restart) sees the finished jobs.
  MaintenanceScheduler restarted(stack.store, stack.queue, stack.embedder->ModelName(), SchedulePolicy{});
  assert(restarted.Tick(now + 1000) == 0);

  const SchedulePolicy policy;
  assert(restarted.Tick(now + policy.daily_ms + 1000) == 2);
  auto open = OpenJobs(stack);
  assert(open[JOB_TYPE_DECAY] == 1 && open[JOB_TYPE_CLEANUP] == 1);
  assert(open[JOB_TYPE_REINDEX] == 0 && open[JOB_TYPE_CONSOLIDATE] == 0);
  DrainAll(stack, now + policy.daily_ms + 1000);

  assert(restarted.Tick(now + policy.weekly_ms + 1000) == 4);
  open = OpenJobs(stack);
  assert(open[JOB_TYPE_CONSOLIDATE] == 1 && open[JOB_TYPE_RESUMMARIZE] == 1);
  assert(open[JOB_TYPE_REINDEX] == 0);
}

void TestModelChangeTriggersReindex() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  const auto now = NowMs();

  MaintenanceScheduler scheduler(stack.store, stack.queue, stack.embedder->ModelName(), SchedulePolicy{});
  scheduler.Tick(now);
  DrainAll(stack, now);

  MaintenanceScheduler upgraded(stack.store, stack.queue, "scripted-v2", SchedulePolicy{});
  assert(upgraded.Tick(now + 1000) == 1);
  assert(OpenJobs(stack)[JOB_TYPE_REINDEX] == 1);
}

void TestBusyCategoryTriggersEarlyResummarize() {
  TestStack stack;
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  const auto now = NowMs();

  SchedulePolicy policy;
  policy.resummarize_min_new_records = 3;
  MaintenanceScheduler scheduler(stack.store, stack.queue, stack.embedder->ModelName(), policy);
  scheduler.Tick(now);
  DrainAll(stack, now);
  // New records must be strictly younger than the resummarize job.
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "plays chess");
  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "paints watercolors");
  assert(scheduler.Tick(now + 1000) == 0);

  stack.Seed(kOwner, MEMORY_KIND_FACT, "Anna", "grows tomatoes");
  assert(scheduler.Tick(now + 1000) == 2);
  auto open = OpenJobs(stack);
  assert(open[JOB_TYPE_CONSOLIDATE] == 1 && open[JOB_TYPE_RESUMMARIZE] == 1);
}

void TestOwnersAreIndependent() {
  TestStack stack;
  stack.Seed("user-1", MEMORY_KIND_FACT, "Anna", "lives in Oslo");
  stack.Seed("user-2", MEMORY_KIND_FACT, "Zoe", "plays drums");
  MaintenanceScheduler scheduler(stack.store, stack.queue, stack.embedder->ModelName(), SchedulePolicy{});
  assert(scheduler.Tick(NowMs()) == 10);
}

} // namespace

int main() {
  TestFirstTickSchedulesEverything();
  TestPeriodsComeFromJobHistory();
  TestModelChangeTriggersReindex();
  TestBusyCategoryTriggersEarlyResummarize();
  TestOwnersAreIndependent();
  std::cout << "maintenance_scheduler_test: pass" << std::endl;
  return 0;
}
