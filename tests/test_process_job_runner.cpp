#include "retrain/process_job_runner.hpp"

#include <gtest/gtest.h>

namespace {

ProcessJobRunner shell_runner(const std::string &script, size_t tail = 500) {
  ProcessJobConfig config;
  // split_whitespace keeps the script as one argument only without spaces
  config.command_template = "/bin/sh -c " + script;
  config.output_tail_bytes = tail;
  return ProcessJobRunner(config);
}

} // namespace

TEST(ProcessJobRunnerTest, BuildArgvSubstitutesService) {
  ProcessJobConfig config;
  config.command_template =
      "docker compose --profile pipeline run --rm --no-deps {service}";
  ProcessJobRunner runner(config);

  auto argv = runner.build_argv("train-model");
  ASSERT_EQ(argv.size(), 8u);
  EXPECT_EQ(argv[0], "docker");
  EXPECT_EQ(argv[7], "train-model");
}

TEST(ProcessJobRunnerTest, SuccessfulJobCapturesOutput) {
  auto runner = shell_runner("echo${IFS}trained;echo${IFS}warn>&2");
  JobOutcome outcome = runner.trigger("train-model", std::chrono::seconds(10));

  EXPECT_EQ(outcome.status, JobStatus::SUCCEEDED);
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_NE(outcome.output_tail.find("trained"), std::string::npos);
  EXPECT_NE(outcome.output_tail.find("warn"), std::string::npos);
}

TEST(ProcessJobRunnerTest, NonZeroExitIsFailure) {
  auto runner = shell_runner("exit${IFS}3");
  JobOutcome outcome = runner.trigger("train-model", std::chrono::seconds(10));
  EXPECT_EQ(outcome.status, JobStatus::FAILED);
  EXPECT_EQ(outcome.exit_code, 3);
}

TEST(ProcessJobRunnerTest, OutputTailIsBounded) {
  auto runner = shell_runner("printf${IFS}'%0600d'${IFS}0;printf${IFS}END", 16);
  JobOutcome outcome = runner.trigger("train-model", std::chrono::seconds(10));
  EXPECT_EQ(outcome.status, JobStatus::SUCCEEDED);
  EXPECT_EQ(outcome.output_tail.size(), 16u);
  EXPECT_EQ(outcome.output_tail.substr(13), "END");
}

TEST(ProcessJobRunnerTest, SlowJobTimesOutWithoutBlocking) {
  auto runner = shell_runner("sleep${IFS}5");
  auto start = std::chrono::steady_clock::now();
  JobOutcome outcome = runner.trigger("train-model", std::chrono::seconds(1));
  auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(outcome.status, JobStatus::TIMED_OUT);
  EXPECT_EQ(outcome.exit_code, -1);
  EXPECT_LT(waited, std::chrono::seconds(3));
}

TEST(ProcessJobRunnerTest, MissingExecutableIsLaunchFailure) {
  ProcessJobConfig config;
  config.command_template = "/nonexistent/trainer {service}";
  ProcessJobRunner runner(config);

  JobOutcome outcome = runner.trigger("train-model", std::chrono::seconds(5));
  EXPECT_EQ(outcome.status, JobStatus::LAUNCH_FAILED);
  EXPECT_FALSE(outcome.error.empty());
}

TEST(ProcessJobRunnerTest, EmptyCommandIsLaunchFailure) {
  ProcessJobConfig config;
  config.command_template = "   ";
  ProcessJobRunner runner(config);
  EXPECT_EQ(runner.trigger("x", std::chrono::seconds(1)).status,
            JobStatus::LAUNCH_FAILED);
}
