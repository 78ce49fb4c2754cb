#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

class TrackingStore;

// Publishes the tracking store on a fixed interval from a background thread,
// independent of how long the operator takes over a decision.
class PeriodicSync {
public:
  static constexpr std::chrono::seconds kDefaultInterval{600};

  explicit PeriodicSync(TrackingStore& store,
                        std::chrono::milliseconds interval = kDefaultInterval);
  ~PeriodicSync();

  PeriodicSync(const PeriodicSync&) = delete;
  PeriodicSync& operator=(const PeriodicSync&) = delete;

  void start();

  // Returns after any sync already in progress has finished.
  void stop();

  int syncCount() const { return syncCount_; }

private:
  void run();

  TrackingStore& store_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopRequested_ = false;
  std::atomic<bool> running_{false};
  std::atomic<int> syncCount_{0};
};
