#include "internal/maintenance/jobs/decay_job.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/util/time.hpp"
#include "support/test_stack.hpp"

using namespace recall;
using namespace recall::memory::v1;
using recall::maintenance::ComputeDecay;
using recall::maintenance::DecayPolicy;
using recall::testing::NowMs;
using recall::testing::TestStack;
using recall::util::kMillisPerDay;

namespace {

constexpr uint64_t kT0 = 1700000000000ull;

db::model::MemoryRecord Record(MemoryKind kind, double importance) {
  db::model::MemoryRecord r;
  r.id            = "r1";
  r.kind          = kind;
  r.importance    = importance;
  r.status        = RECORD_STATUS_ACTIVE;
  r.created_at_ms = kT0;
  return r;
}

void TestHalfLife() {
  auto r    = Record(MEMORY_KIND_FACT, 0.8);
  auto step = ComputeDecay(r, kT0 + 90 * kMillisPerDay, DecayPolicy{});
  assert(step);
  assert(std::fabs(step->importance - 0.4) < 1e-9);
  assert(step->decayed_at_ms == kT0 + 90 * kMillisPerDay);

  // Events fade faster than preferences.
  auto event      = ComputeDecay(Record(MEMORY_KIND_EVENT, 0.8), kT0 + 30 * kMillisPerDay, DecayPolicy{});
  auto preference = ComputeDecay(Record(MEMORY_KIND_PREFERENCE, 0.8), kT0 + 30 * kMillisPerDay, DecayPolicy{});
  assert(event->importance < preference->importance);
}

void TestOnlyWholeDaysAndNoDoubleDecay() {
  auto r = Record(MEMORY_KIND_FACT, 0.8);
  assert(!ComputeDecay(r, kT0 + kMillisPerDay - 1, DecayPolicy{}));

  const auto now  = kT0 + 3 * kMillisPerDay + 5000;
  auto       step = ComputeDecay(r, now, DecayPolicy{});
  assert(step->decayed_at_ms == kT0 + 3 * kMillisPerDay);

  // Applying the step then running again the same day changes nothing.
  r.importance    = step->importance;
  r.decayed_at_ms = step->decayed_at_ms;
  assert(!ComputeDecay(r, now + 1000, DecayPolicy{}));

  // Two one-day steps equal one two-day step.
  auto split  = Record(MEMORY_KIND_FACT, 0.8);
  auto first          = ComputeDecay(split, kT0 + kMillisPerDay, DecayPolicy{});
  split.importance    = first->importance;
  split.decayed_at_ms = first->decayed_at_ms;
  auto second = ComputeDecay(split, kT0 + 2 * kMillisPerDay, DecayPolicy{});
  auto whole  = ComputeDecay(Record(MEMORY_KIND_FACT, 0.8), kT0 + 2 * kMillisPerDay, DecayPolicy{});
  assert(std::fabs(second->importance - whole->importance) < 1e-12);
}

void TestFloors() {
  auto low  = Record(MEMORY_KIND_EVENT, 0.5);
  auto step = ComputeDecay(low, kT0 + 3650 * kMillisPerDay, DecayPolicy{});
  assert(step->importance == DecayPolicy{}.floor);

  auto pinned        = Record(MEMORY_KIND_EVENT, 1.0);
  pinned.user_pinned = true;
  step               = ComputeDecay(pinned, kT0 + 3650 * kMillisPerDay, DecayPolicy{});
  assert(step->importance == DecayPolicy{}.pinned_floor);

  // Already below the floor: never raised.
  auto tiny = Record(MEMORY_KIND_FACT, 0.01);
  step      = ComputeDecay(tiny, kT0 + 10 * kMillisPerDay, DecayPolicy{});
  assert(step->importance == 0.01);
}

void TestGraceWindow() {
  auto r                = Record(MEMORY_KIND_FACT, 0.8);
  const auto now        = kT0 + 30 * kMillisPerDay;
  r.last_accessed_at_ms = now - 2 * kMillisPerDay;

  auto step = ComputeDecay(r, now, DecayPolicy{});
  assert(step->importance == 0.8);
  // The anchor still moves, so the skipped days are not charged later.
  assert(step->decayed_at_ms == now);

  r.last_accessed_at_ms = now - 10 * kMillisPerDay;
  assert(ComputeDecay(r, now, DecayPolicy{})->importance < 0.8);
}

void TestEventsDecayFromTheirDate() {
  auto trip              = Record(MEMORY_KIND_EVENT, 0.8);
  trip.effective_from_ms = kT0 + 20 * kMillisPerDay;

  assert(!ComputeDecay(trip, kT0 + 10 * kMillisPerDay, DecayPolicy{}));

  auto step = ComputeDecay(trip, kT0 + 34 * kMillisPerDay, DecayPolicy{});
  assert(std::fabs(step->importance - 0.4) < 1e-9);
}

void TestInactiveRecordsAreLeftAlone() {
  auto r   = Record(MEMORY_KIND_FACT, 0.8);
  r.status = RECORD_STATUS_ARCHIVED;
  assert(!ComputeDecay(r, kT0 + 100 * kMillisPerDay, DecayPolicy{}));
}

void TestRunUpdatesStore() {
  TestStack stack;
  auto fact  = stack.Seed("user-1", MEMORY_KIND_FACT, "Anna", "lives in Oslo", "", 0.8);
  auto other = stack.Seed("user-2", MEMORY_KIND_FACT, "Zoe", "plays drums", "", 0.8);

  maintenance::DecayJob           job(stack.store, DecayPolicy{});
  db::model::MaintenanceJobRecord record;
  record.owner_id = "user-1";

  const auto later = NowMs() + 45 * kMillisPerDay;
  assert(job.Run({record, later}) == "decayed=1 skipped=0");

  auto decayed = stack.store->GetById(fact.id);
  assert(decayed->importance < 0.8);
  assert(decayed->importance > 0.5);
  assert(decayed->decayed_at_ms != 0);
  assert(stack.store->GetById(other.id)->importance == 0.8);

  // Same day again: nothing left to do.
  assert(job.Run({record, later + 1000}) == "decayed=0 skipped=0");
  assert(stack.store->GetById(fact.id)->importance == decayed->importance);
}

} // namespace

int main() {
  TestHalfLife();
  TestOnlyWholeDaysAndNoDoubleDecay();
  TestFloors();
  TestGraceWindow();
  TestEventsDecayFromTheirDate();
  TestInactiveRecordsAreLeftAlone();
  TestRunUpdatesStore();
  std::cout << "decay_job_test: pass" << std::endl;
  return 0;
}
