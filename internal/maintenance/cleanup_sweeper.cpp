#include "cleanup_sweeper.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/store/reference_store.hpp"

namespace refstore::maintenance {

using refstore::observability::IntField;
using refstore::observability::StringField;

CleanupSweeper::CleanupSweeper(std::shared_ptr<store::ReferenceStore> store, std::vector<CleanupRule> rules, std::chrono::milliseconds interval)
    : store_(std::move(store)), rules_(std::move(rules)), interval_(std::min<std::chrono::milliseconds>(interval, kMaxInterval)) {
}

CleanupSweeper::~CleanupSweeper() {
  Stop();
}

void CleanupSweeper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  REFSTORE_LOG_INFO("cleanup sweeper started", {IntField("rules", static_cast<std::int64_t>(rules_.size())), IntField("interval_ms", interval_.count())});
  thread_ = std::thread(&CleanupSweeper::Loop, this);
}

void CleanupSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    REFSTORE_LOG_INFO("cleanup sweeper stopped");
  }
}

std::size_t CleanupSweeper::RunOnce() {
  std::size_t removed = 0;
  for (const auto& rule : rules_) {
    try {
      removed += store_->Cleanup(rule.prefix, rule.max_age);
    } catch (const std::exception& e) {
      REFSTORE_LOG_ERROR("cleanup rule failed", {StringField("prefix", rule.prefix), StringField("error", e.what())});
    }
  }
  return removed;
}

void CleanupSweeper::Loop() {
  while (running_) {
    RunOnce();

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, interval_, [&] { return !running_; })) {
      return;
    }
  }
}

} // namespace refstore::maintenance
