#include "internal/lease/run_lease_table.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using plancast::lease::RunLease;
using plancast::lease::RunLeaseTable;

void TestSecondAcquireIsRejectedUntilRelease() {
  auto table = RunLeaseTable::Create();

  {
    RunLease lease = table->Acquire(7);
    assert(lease.valid());
    assert(lease.project_id() == 7);
    assert(table->IsHeld(7));

    bool threw = false;
    try {
      (void)table->Acquire(7);
    } catch (const plancast::util::AlreadyRunning&) {
      threw = true;
    }
    assert(threw);

    RunLease other = table->Acquire(8);
    assert(table->ActiveCount() == 2);
  }

  assert(!table->IsHeld(7));
  assert(table->ActiveCount() == 0);
  RunLease again = table->Acquire(7);
  assert(again.valid());
}

void TestMovedLeaseReleasesOnce() {
  auto table = RunLeaseTable::Create();

  RunLease first = table->Acquire(1);
  RunLease moved = std::move(first);
  assert(!first.valid());
  assert(moved.valid());
  assert(table->IsHeld(1));

  first.Release();
  assert(table->IsHeld(1));

  moved.Release();
  assert(!table->IsHeld(1));
}

void TestLeaseOutlivesTable() {
  RunLease lease;
  {
    auto table = RunLeaseTable::Create();
    lease      = table->Acquire(3);
  }
  assert(lease.valid());
  lease.Release();
  assert(!lease.valid());
}

void TestConcurrentAcquireHasSingleWinner() {
  auto             table = RunLeaseTable::Create();
  std::atomic<int> winners{0};
  std::atomic<int> rejected{0};
  std::atomic<bool> go{false};

  std::vector<RunLease>    held(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
      }
      try {
        held[i] = table->Acquire(42);
        winners.fetch_add(1);
      } catch (const plancast::util::AlreadyRunning&) {
        rejected.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
  assert(rejected.load() == 7);
  assert(table->ActiveCount() == 1);
}

} // namespace

int main() {
  TestSecondAcquireIsRejectedUntilRelease();
  TestMovedLeaseReleasesOnce();
  TestLeaseOutlivesTable();
  TestConcurrentAcquireHasSingleWinner();

  std::cout << "plancast_unit_run_lease_table: pass\n";
  return 0;
}
