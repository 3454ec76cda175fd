#include "retrain/retrain_monitor.hpp"
#include "retrain/signal_file.hpp"
#include "test_retrain_fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class RetrainMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("retrain_monitor_" + std::to_string(::getpid()) + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    path = (dir / "retrain_requested").string();

    runner = std::make_shared<FakeJobRunner>();
    target = std::make_shared<FakeReloadTarget>();
    coordinator = std::make_shared<RetrainCoordinator>(
        runner, target, RetrainCoordinatorConfig{});
  }

  void TearDown() override {
    coordinator->shutdown();
    fs::remove_all(dir);
  }

  fs::path dir;
  std::string path;
  std::shared_ptr<FakeJobRunner> runner;
  std::shared_ptr<FakeReloadTarget> target;
  std::shared_ptr<RetrainCoordinator> coordinator;
};

TEST_F(RetrainMonitorTest, IdleWithoutSignal) {
  RetrainMonitor monitor(path, coordinator, std::chrono::seconds(1));
  EXPECT_FALSE(monitor.poll_once());
  EXPECT_EQ(runner->calls.load(), 0);
  EXPECT_EQ(target->reloads.load(), 0);
}

TEST_F(RetrainMonitorTest, SignalIsDeletedBeforeJobRunsThenReloads) {
  ASSERT_TRUE(SignalFile::request(path, "Data drift detected"));

  bool signal_present_during_job = true;
  runner->on_trigger = [&] { signal_present_during_job = fs::exists(path); };

  RetrainMonitor monitor(path, coordinator, std::chrono::seconds(1));
  EXPECT_TRUE(monitor.poll_once());

  EXPECT_FALSE(signal_present_during_job);
  EXPECT_EQ(runner->calls.load(), 1);
  EXPECT_EQ(target->reloads.load(), 1);
  EXPECT_EQ(monitor.processed_signals(), 1u);

  // Nothing left to process
  EXPECT_FALSE(monitor.poll_once());
  EXPECT_EQ(runner->calls.load(), 1);
}

TEST_F(RetrainMonitorTest, FailedJobStillReloads) {
  runner->status = JobStatus::FAILED;
  ASSERT_TRUE(SignalFile::request(path, "manual"));

  RetrainMonitor monitor(path, coordinator, std::chrono::seconds(1));
  EXPECT_TRUE(monitor.poll_once());
  EXPECT_EQ(target->reloads.load(), 1);
}

TEST_F(RetrainMonitorTest, BackgroundLoopProcessesEachSignalOnce) {
  RetrainMonitor monitor(path, coordinator, std::chrono::seconds(1));
  monitor.start();

  ASSERT_TRUE(SignalFile::request(path, "first"));
  ASSERT_TRUE(wait_until([&] { return target->reloads.load() == 1; }));

  ASSERT_TRUE(SignalFile::request(path, "second"));
  ASSERT_TRUE(wait_until([&] { return target->reloads.load() == 2; }));

  monitor.stop();
  EXPECT_EQ(runner->calls.load(), 2);
  EXPECT_EQ(monitor.processed_signals(), 2u);
}

TEST_F(RetrainMonitorTest, StopInterruptsTheWait) {
  RetrainMonitor monitor(path, coordinator, std::chrono::seconds(60));
  monitor.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto start = std::chrono::steady_clock::now();
  monitor.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}
