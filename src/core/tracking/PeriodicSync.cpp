#include "PeriodicSync.hpp"
#include "TrackingStore.hpp"
#include "core/errors/Errors.hpp"

#include <spdlog/spdlog.h>

PeriodicSync::PeriodicSync(TrackingStore& store, std::chrono::milliseconds interval)
  : store_(store), interval_(interval) {}

PeriodicSync::~PeriodicSync() {
  stop();
}

void PeriodicSync::start() {
  if (running_) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopRequested_ = false;
  }
  running_ = true;
  thread_ = std::thread(&PeriodicSync::run, this);
  spdlog::debug("Periodic sync started ({} s interval)",
                std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
}

void PeriodicSync::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopRequested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  if (running_.exchange(false)) spdlog::debug("Periodic sync stopped");
}

void PeriodicSync::run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stopRequested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stopRequested_; })) break;

    lock.unlock();
    try {
      store_.sync();
      ++syncCount_;
    } catch (const SyncFailed& e) {
      spdlog::warn("Periodic sync failed, will retry next interval: {}", e.what());
    }
    lock.lock();
  }
}
