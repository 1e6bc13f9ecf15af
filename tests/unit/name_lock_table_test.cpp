#include "internal/store/name_lock_table.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using refstore::store::NameLockTable;
using Mode = NameLockTable::Mode;

void TestEntriesLiveOnlyWhileHeld() {
  NameLockTable table;
  assert(table.Size() == 0);
  {
    auto a1 = table.Lock("a", Mode::kShared);
    auto a2 = table.Lock("a", Mode::kShared);
    auto b  = table.Lock("b", Mode::kExclusive);
    assert(table.Size() == 2);
  }
  assert(table.Size() == 0);
}

void TestExclusiveExcludesOtherHolders() {
  NameLockTable    table;
  std::atomic<int> inside{0};
  std::atomic<int> overlap{0};

  auto worker = [&](Mode mode) {
    for (int i = 0; i < 200; ++i) {
      auto guard = table.Lock("name", mode);
      if (mode == Mode::kExclusive) {
        if (inside.fetch_add(100) != 0) ++overlap;
        std::this_thread::yield();
        inside.fetch_sub(100);
      } else {
        if (inside.fetch_add(1) >= 100) ++overlap;
        std::this_thread::yield();
        inside.fetch_sub(1);
      }
    }
  };

  std::thread w1(worker, Mode::kExclusive);
  std::thread w2(worker, Mode::kExclusive);
  std::thread r1(worker, Mode::kShared);
  std::thread r2(worker, Mode::kShared);
  w1.join();
  w2.join();
  r1.join();
  r2.join();

  assert(overlap.load() == 0);
  assert(table.Size() == 0);
}

void TestSharedHoldersRunTogether() {
  NameLockTable     table;
  auto              first = table.Lock("shared", Mode::kShared);
  std::atomic<bool> acquired{false};

  std::thread other([&] {
    auto second = table.Lock("shared", Mode::kShared);
    acquired    = true;
  });
  other.join();

  assert(acquired.load());
}

void TestDifferentNamesDoNotBlock() {
  NameLockTable     table;
  auto              held = table.Lock("one", Mode::kExclusive);
  std::atomic<bool> acquired{false};

  std::thread other([&] {
    auto guard = table.Lock("two", Mode::kExclusive);
    acquired   = true;
  });
  other.join();

  assert(acquired.load());
}

void TestExclusiveWaitsForRelease() {
  NameLockTable     table;
  std::atomic<bool> acquired{false};

  std::thread other;
  {
    auto held = table.Lock("busy", Mode::kExclusive);
    other     = std::thread([&] {
      auto guard = table.Lock("busy", Mode::kExclusive);
      acquired   = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!acquired.load());
  }
  other.join();

  assert(acquired.load());
  assert(table.Size() == 0);
}

} // namespace

int main() {
  TestEntriesLiveOnlyWhileHeld();
  TestExclusiveExcludesOtherHolders();
  TestSharedHoldersRunTogether();
  TestDifferentNamesDoNotBlock();
  TestExclusiveWaitsForRelease();

  std::cout << "refstore_unit_name_lock_table: pass\n";
  return 0;
}
