#ifndef RETRAIN_MONITOR_HPP
#define RETRAIN_MONITOR_HPP

#include "retrain/retrain_coordinator.hpp"
#include "retrain/signal_file.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

// Polls the signal file and turns each claimed signal into one retrain run
// followed by a reload. Errors never end the loop.
class RetrainMonitor {
public:
  RetrainMonitor(std::string signal_file_path,
                 std::shared_ptr<RetrainCoordinator> coordinator,
                 std::chrono::seconds poll_interval);
  ~RetrainMonitor();

  RetrainMonitor(const RetrainMonitor &) = delete;
  RetrainMonitor &operator=(const RetrainMonitor &) = delete;

  void start();
  void stop();

  // Blocks the calling thread until stop() is called from elsewhere
  void run();

  // One iteration; true when a signal was claimed and processed
  bool poll_once();

  uint64_t processed_signals() const { return processed_signals_.load(); }

private:
  SignalFile signal_;
  std::shared_ptr<RetrainCoordinator> coordinator_;
  std::chrono::seconds poll_interval_;

  std::thread thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<uint64_t> processed_signals_{0};
  std::condition_variable cv_;
  std::mutex cv_mutex_;
};

#endif // RETRAIN_MONITOR_HPP
