#include <assert.h>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/store/reference_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using refstore::store::ReferenceStore;

std::filesystem::path TempRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "refstore_concurrency_tests" / test_name;
  std::filesystem::remove_all(root);
  return root;
}

ReferenceStore::Options FastOptions(bool cache) {
  ReferenceStore::Options options;
  options.fsync         = false;
  options.cache_enabled = cache;
  return options;
}

void RunConcurrentWritersOnOneName(bool cache) {
  ReferenceStore store(TempRoot(cache ? "one_name_cached" : "one_name"), FastOptions(cache));

  constexpr int kThreads         = 8;
  constexpr int kWritesPerThread = 25;

  std::mutex            versions_mutex;
  std::vector<uint64_t> versions;
  std::atomic<int>      failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kWritesPerThread; ++i) {
        try {
          const auto result = store.CreateOrUpdate("shared/counter", "writer " + std::to_string(t) + " write " + std::to_string(i));
          std::lock_guard lock(versions_mutex);
          versions.push_back(result.version);
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(failures.load() == 0);
  assert(versions.size() == static_cast<std::size_t>(kThreads * kWritesPerThread));

  const std::set<uint64_t> unique(versions.begin(), versions.end());
  assert(unique.size() == versions.size());
  assert(*unique.begin() == 1);
  assert(*unique.rbegin() == static_cast<uint64_t>(kThreads * kWritesPerThread));
  assert(store.Read("shared/counter").record.version == static_cast<uint64_t>(kThreads * kWritesPerThread));
}

void TestConcurrentWritersNeverLoseUpdates() {
  RunConcurrentWritersOnOneName(false);
  RunConcurrentWritersOnOneName(true);
}

void TestReadersNeverSeePartialRecords() {
  ReferenceStore store(TempRoot("readers"), FastOptions(false));
  store.CreateOrUpdate("doc", std::string(4096, 'a'));

  std::atomic<bool> done{false};
  std::atomic<int>  bad_reads{0};

  std::thread writer([&] {
    for (int i = 0; i < 100; ++i) {
      store.CreateOrUpdate("doc", std::string(4096, static_cast<char>('a' + (i % 26))));
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!done) {
        try {
          const auto reference = store.Read("doc");
          const auto& content  = reference.record.content;
          if (content.size() != 4096 || content.find_first_not_of(content.front()) != std::string::npos) {
            ++bad_reads;
          }
        } catch (const std::exception&) {
          ++bad_reads;
        }
      }
    });
  }

  writer.join();
  for (auto& reader : readers) reader.join();
  assert(bad_reads.load() == 0);
  assert(store.Read("doc").record.version == 101);
}

void TestDistinctNamesProceedIndependently() {
  ReferenceStore store(TempRoot("distinct"), FastOptions(false));

  constexpr int            kThreads = 6;
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const auto name = "group/item" + std::to_string(t);
      for (int i = 1; i <= 20; ++i) {
        try {
          if (store.CreateOrUpdate(name, std::to_string(i)).version != static_cast<uint64_t>(i)) {
            ++failures;
          }
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(failures.load() == 0);
  assert(store.List("group/").size() == static_cast<std::size_t>(kThreads));
}

void TestPruningNeverBreaksSiblingWrites() {
  ReferenceStore store(TempRoot("prune_race"), FastOptions(false));

  std::atomic<int> failures{0};

  std::thread churn([&] {
    for (int i = 0; i < 200; ++i) {
      try {
        store.CreateOrUpdate("tree/branch/leaf", "x");
        store.Delete("tree/branch/leaf");
      } catch (const std::exception&) {
        ++failures;
      }
    }
  });

  std::thread sibling([&] {
    for (int i = 0; i < 200; ++i) {
      const auto name = "tree/branch/sibling" + std::to_string(i);
      try {
        store.CreateOrUpdate(name, "y");
        store.Delete(name);
      } catch (const std::exception&) {
        ++failures;
      }
    }
  });

  churn.join();
  sibling.join();

  assert(failures.load() == 0);
  assert(store.List().empty());
  assert(!std::filesystem::exists(store.root() / "tree"));
}

void TestListDuringChurnOnlyReturnsValidNames() {
  ReferenceStore store(TempRoot("list_churn"), FastOptions(false));
  store.CreateOrUpdate("stable/a", "1");

  std::atomic<bool> done{false};
  std::atomic<int>  failures{0};

  std::thread writer([&] {
    for (int i = 0; i < 100; ++i) {
      const auto name = "churn/n" + std::to_string(i % 5) + "/leaf";
      try {
        store.CreateOrUpdate(name, "v");
        store.Delete(name);
      } catch (const std::exception&) {
        ++failures;
      }
    }
    done = true;
  });

  while (!done) {
    try {
      const auto names = store.List();
      bool       found = false;
      for (const auto& name : names) {
        found = found || name == "stable/a";
      }
      if (!found) {
        ++failures;
      }
    } catch (const std::exception&) {
      ++failures;
    }
  }
  writer.join();

  assert(failures.load() == 0);
}

} // namespace

int main() {
  TestConcurrentWritersNeverLoseUpdates();
  TestReadersNeverSeePartialRecords();
  TestDistinctNamesProceedIndependently();
  TestPruningNeverBreaksSiblingWrites();
  TestListDuringChurnOnlyReturnsValidNames();

  std::cout << "refstore_unit_reference_store_concurrency: pass\n";
  return 0;
}
