#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace refstore::store {
class ReferenceStore;
}

namespace refstore::maintenance {

struct CleanupRule {
  std::string          prefix;
  std::chrono::seconds max_age{0};
};

/*
  Periodically applies age-based cleanup rules to the store.

  The first sweep runs as soon as the thread starts; Stop() wakes the
  thread and joins it without waiting out the interval. Intervals longer
  than kMaxInterval are clamped to it.
*/
class CleanupSweeper {
 public:
  static constexpr std::chrono::hours kMaxInterval{24 * 30};

  CleanupSweeper(std::shared_ptr<store::ReferenceStore> store, std::vector<CleanupRule> rules, std::chrono::milliseconds interval);
  ~CleanupSweeper();

  CleanupSweeper(const CleanupSweeper&)            = delete;
  CleanupSweeper& operator=(const CleanupSweeper&) = delete;

  void Start();
  void Stop();

  // One pass over every rule. A failing rule is logged and does not stop the
  // others. Returns the number of references removed.
  std::size_t RunOnce();

  bool running() const {
    return running_;
  }

  const std::vector<CleanupRule>& rules() const {
    return rules_;
  }

  std::chrono::milliseconds interval() const {
    return interval_;
  }

 private:
  void Loop();

  std::shared_ptr<store::ReferenceStore> store_;
  std::vector<CleanupRule>               rules_;
  std::chrono::milliseconds              interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace refstore::maintenance
