#include "internal/maintenance/job_queue.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::maintenance::JobQueue;
using recall::maintenance::JobQueuePolicy;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

std::shared_ptr<JobQueue> MakeQueue(uint32_t max_attempts = 3) {
  JobQueuePolicy policy;
  policy.max_attempts = max_attempts;
  policy.backoff_base = std::chrono::milliseconds(10);
  return std::make_shared<JobQueue>(std::make_shared<db::memory::MemoryRepository>(), policy);
}

void TestOneRunningJobPerOwner() {
  auto queue = MakeQueue();
  const auto now = NowMs();
  auto a1 = queue->Enqueue(JOB_TYPE_DECAY, "anna", "{}", now - 30);
  auto a2 = queue->Enqueue(JOB_TYPE_CLEANUP, "anna", "{}", now - 20);
  auto b1 = queue->Enqueue(JOB_TYPE_DECAY, "marcus", "{}", now - 10);

  auto first = queue->ClaimNext(now);
  assert(first && first->id == a1);
  assert(first->status == JOB_STATUS_RUNNING);
  assert(first->attempts == 1);

  // anna is busy, so marcus goes next.
  auto second = queue->ClaimNext(now);
  assert(second && second->id == b1);
  assert(!queue->ClaimNext(now));

  queue->Complete(a1, now);
  assert(queue->Get(a1)->status == JOB_STATUS_DONE);
  auto third = queue->ClaimNext(now);
  assert(third && third->id == a2);
}

void TestScheduledJobsWait() {
  auto queue = MakeQueue();
  const auto now = NowMs();
  auto later = queue->Enqueue(JOB_TYPE_REINDEX, "anna", "{}", now + 60000);
  assert(!queue->ClaimNext(now));
  auto claimed = queue->ClaimNext(now + 60000);
  assert(claimed && claimed->id == later);
}

void TestDependencies() {
  auto queue = MakeQueue(1);
  const auto now = NowMs();

  auto consolidate = queue->Enqueue(JOB_TYPE_CONSOLIDATE, "anna", "{}", now - 10);
  auto resummarize = queue->Enqueue(JOB_TYPE_RESUMMARIZE, "marcus", "{}", now - 5, consolidate);

  auto claimed = queue->ClaimNext(now);
  assert(claimed && claimed->id == consolidate);
  // Different owner, but its dependency is still running.
  assert(!queue->ClaimNext(now));

  queue->Complete(consolidate, now);
  claimed = queue->ClaimNext(now);
  assert(claimed && claimed->id == resummarize);
  queue->Complete(resummarize, now);

  // A failed dependency fails its dependents instead of running them.
  auto broken    = queue->Enqueue(JOB_TYPE_CONSOLIDATE, "zoe", "{}", now - 10);
  auto dependent = queue->Enqueue(JOB_TYPE_RESUMMARIZE, "zoe", "{}", now - 5, broken);
  claimed        = queue->ClaimNext(now);
  assert(claimed && claimed->id == broken);
  assert(queue->Fail(broken, "boom", now).status == JOB_STATUS_FAILED);
  assert(!queue->ClaimNext(now));
  auto failed = queue->Get(dependent);
  assert(failed->status == JOB_STATUS_FAILED);
  assert(failed->last_error.find(broken) != std::string::npos);

  bool rejected = false;
  try {
    queue->Enqueue(JOB_TYPE_RESUMMARIZE, "zoe", "{}", 0, "no-such-job");
  } catch (const util::NotFound&) {
    rejected = true;
  }
  assert(rejected);
}

void TestFailureBackoffThenGiveUp() {
  auto queue = MakeQueue(2);
  const auto now = NowMs();
  auto id = queue->Enqueue(JOB_TYPE_DECAY, "anna", "{}", now);

  assert(queue->ClaimNext(now));
  auto retried = queue->Fail(id, "database busy", now);
  assert(retried.status == JOB_STATUS_PENDING);
  assert(retried.scheduled_for_ms == now + 20);
  assert(retried.last_error == "database busy");

  assert(!queue->ClaimNext(now + 19));
  auto again = queue->ClaimNext(now + 20);
  assert(again && again->attempts == 2);

  auto given_up = queue->Fail(id, "database busy", now + 20);
  assert(given_up.status == JOB_STATUS_FAILED);
  assert(queue->List(JOB_STATUS_FAILED).size() == 1);
  assert(!queue->ClaimNext(now + 100000));
}

void TestRecoverStaleAndOpenJobs() {
  auto queue = MakeQueue();
  const auto now = NowMs();
  auto id = queue->Enqueue(JOB_TYPE_CLEANUP, "anna", "{}", now);
  assert(queue->HasOpenJob("anna", JOB_TYPE_CLEANUP));
  assert(!queue->HasOpenJob("anna", JOB_TYPE_DECAY));

  assert(queue->ClaimNext(now));
  assert(queue->RecoverStale() == 1);
  assert(queue->Get(id)->status == JOB_STATUS_PENDING);
  assert(queue->HasOpenJob("anna", JOB_TYPE_CLEANUP));

  assert(queue->ClaimNext(now));
  queue->Complete(id, now);
  assert(!queue->HasOpenJob("anna", JOB_TYPE_CLEANUP));
}

void TestConcurrentClaimsAreExclusive() {
  auto queue = MakeQueue();
  const auto now = NowMs();
  for (int i = 0; i < 16; ++i) queue->Enqueue(JOB_TYPE_DECAY, "owner-" + std::to_string(i), "{}", now);

  std::mutex                 mutex;
  std::multiset<std::string> claimed;
  std::vector<std::thread>   workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      while (auto job = queue->ClaimNext(now)) {
        std::lock_guard<std::mutex> lock(mutex);
        claimed.insert(job->id);
      }
    });
  }
  for (auto& w : workers) w.join();

  assert(claimed.size() == 16);
  for (const auto& id : claimed) assert(claimed.count(id) == 1);
}

void TestWaitForWork() {
  auto queue = MakeQueue();
  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue->Enqueue(JOB_TYPE_DECAY, "anna");
  });
  assert(queue->WaitForWork(std::chrono::milliseconds(2000)));
  producer.join();

  queue->Shutdown();
  assert(queue->IsShutdown());
  assert(!queue->WaitForWork(std::chrono::milliseconds(10)));
}

class CountingHandler final : public maintenance::JobHandler {
 public:
  CountingHandler(JobType type, bool fail) : type_(type), fail_(fail) {
  }

  JobType Type() const override {
    return type_;
  }

  std::string Run(const maintenance::JobContext& context) override {
    ++runs;
    last_owner = context.job.owner_id;
    if (fail_) throw util::JobFailed("handler refused");
    return "ok";
  }

  std::atomic<int> runs{0};
  std::string      last_owner;

 private:
  JobType type_;
  bool    fail_;
};

void TestWorkerDispatch() {
  auto queue   = MakeQueue(1);
  auto decay   = std::make_shared<CountingHandler>(JOB_TYPE_DECAY, false);
  auto cleanup = std::make_shared<CountingHandler>(JOB_TYPE_CLEANUP, true);
  maintenance::MaintenanceWorker worker(queue, {decay, cleanup}, 1, std::chrono::milliseconds(10));

  const auto now     = NowMs();
  auto       done    = queue->Enqueue(JOB_TYPE_DECAY, "anna", "{}", now - 3);
  auto       refused = queue->Enqueue(JOB_TYPE_CLEANUP, "marcus", "{}", now - 2);
  auto       orphan  = queue->Enqueue(JOB_TYPE_REINDEX, "zoe", "{}", now - 1);

  while (worker.RunOnce(now)) {
  }

  assert(decay->runs == 1 && decay->last_owner == "anna");
  assert(queue->Get(done)->status == JOB_STATUS_DONE);
  assert(cleanup->runs == 1);
  assert(queue->Get(refused)->status == JOB_STATUS_FAILED);
  assert(queue->Get(refused)->last_error.find("handler refused") != std::string::npos);
  assert(queue->Get(orphan)->status == JOB_STATUS_FAILED);
}

void TestWorkerThreadsDrainQueue() {
  auto queue = MakeQueue();
  auto decay = std::make_shared<CountingHandler>(JOB_TYPE_DECAY, false);
  maintenance::MaintenanceWorker worker(queue, {decay}, 2, std::chrono::milliseconds(5));
  worker.Start();
  for (int i = 0; i < 6; ++i) queue->Enqueue(JOB_TYPE_DECAY, "owner-" + std::to_string(i));

  for (int i = 0; i < 400 && queue->List(JOB_STATUS_DONE).size() < 6; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  worker.Stop();
  assert(decay->runs == 6);
}

} // namespace

int main() {
  TestOneRunningJobPerOwner();
  TestScheduledJobsWait();
  TestDependencies();
  TestFailureBackoffThenGiveUp();
  TestRecoverStaleAndOpenJobs();
  TestConcurrentClaimsAreExclusive();
  TestWaitForWork();
  TestWorkerDispatch();
  TestWorkerThreadsDrainQueue();
  std::cout << "job_queue_test: pass" << std::endl;
  return 0;
}
