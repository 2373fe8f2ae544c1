#include <gtest/gtest.h>

#include "core/run.h"

using namespace runq::core;

namespace {

RunRecord make_run(const std::string &id) {
  RunRecord run;
  run.run_id = id;
  run.session_name = "s-" + id;
  run.payload = "do things";
  return run;
}

RunRecord claimed_run(const std::string &id) {
  RunRecord run = make_run(id);
  auto claimed = run.claim_for("rnr_a");
  EXPECT_TRUE(claimed.is_ok());
  return run;
}

} // namespace

// ============================================================
// Legal transitions
// ============================================================

TEST(RunStateMachine, NewRunIsPending) {
  RunRecord run = make_run("r-000");
  EXPECT_EQ(run.status, RunStatus::Pending);
  EXPECT_FALSE(run.runner_id.has_value());
  EXPECT_FALSE(run.completed_at.has_value());
}

TEST(RunStateMachine, ClaimStampsRunnerAndTime) {
  RunRecord run = make_run("r-001");

  auto result = run.claim_for("rnr_a");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(run.status, RunStatus::Claimed);
  ASSERT_TRUE(run.runner_id.has_value());
  EXPECT_EQ(*run.runner_id, "rnr_a");
  EXPECT_TRUE(run.claimed_at.has_value());
}

TEST(RunStateMachine, ClaimedToRunningToCompleted) {
  RunRecord run = claimed_run("r-002");

  ASSERT_TRUE(run.transition_to(RunStatus::Running).is_ok());
  EXPECT_TRUE(run.started_at.has_value());

  ASSERT_TRUE(run.transition_to(RunStatus::Completed).is_ok());
  EXPECT_EQ(run.status, RunStatus::Completed);
  EXPECT_TRUE(run.completed_at.has_value());
  EXPECT_FALSE(run.runner_id.has_value());
  ASSERT_TRUE(run.last_runner_id.has_value());
  EXPECT_EQ(*run.last_runner_id, "rnr_a");
}

TEST(RunStateMachine, ClaimedCanFailOrStop) {
  RunRecord failing = claimed_run("r-003");
  EXPECT_TRUE(failing.transition_to(RunStatus::Failed).is_ok());

  RunRecord stopping = claimed_run("r-004");
  ASSERT_TRUE(stopping.transition_to(RunStatus::Stopping).is_ok());
  EXPECT_TRUE(stopping.runner_id.has_value());
  ASSERT_TRUE(stopping.transition_to(RunStatus::Stopped).is_ok());
  EXPECT_FALSE(stopping.runner_id.has_value());
}

TEST(RunStateMachine, RunningToStoppingToStopped) {
  RunRecord run = claimed_run("r-005");
  ASSERT_TRUE(run.transition_to(RunStatus::Running).is_ok());
  ASSERT_TRUE(run.transition_to(RunStatus::Stopping).is_ok());
  ASSERT_TRUE(run.transition_to(RunStatus::Stopped).is_ok());
  EXPECT_TRUE(is_terminal(run.status));
}

TEST(RunStateMachine, PendingCanFailOnTimeout) {
  RunRecord run = make_run("r-006");
  ASSERT_TRUE(run.transition_to(RunStatus::Failed).is_ok());
  EXPECT_TRUE(run.completed_at.has_value());
  EXPECT_FALSE(run.last_runner_id.has_value());
}

// ============================================================
// Illegal transitions
// ============================================================

TEST(RunStateMachine, PendingCannotSkipToRunning) {
  RunRecord run = make_run("r-010");
  auto result = run.transition_to(RunStatus::Running);
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Conflict);
  EXPECT_EQ(run.status, RunStatus::Pending);
}

TEST(RunStateMachine, ClaimWithoutRunnerIsRejected) {
  RunRecord run = make_run("r-011");
  auto result = run.transition_to(RunStatus::Claimed);
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Internal);
  EXPECT_EQ(run.status, RunStatus::Pending);
}

TEST(RunStateMachine, ClaimedCannotComplete) {
  RunRecord run = claimed_run("r-012");
  EXPECT_TRUE(run.transition_to(RunStatus::Completed).is_err());
  EXPECT_EQ(run.status, RunStatus::Claimed);
}

TEST(RunStateMachine, StoppingOnlyAcceptsStopped) {
  RunRecord run = claimed_run("r-013");
  ASSERT_TRUE(run.transition_to(RunStatus::Stopping).is_ok());
  EXPECT_TRUE(run.transition_to(RunStatus::Completed).is_err());
  EXPECT_TRUE(run.transition_to(RunStatus::Failed).is_err());
  EXPECT_TRUE(run.transition_to(RunStatus::Running).is_err());
  EXPECT_EQ(run.status, RunStatus::Stopping);
}

TEST(RunStateMachine, TerminalStatesAreFinal) {
  for (auto terminal : {RunStatus::Completed, RunStatus::Failed}) {
    RunRecord run = claimed_run("r-014");
    ASSERT_TRUE(run.transition_to(RunStatus::Running).is_ok());
    ASSERT_TRUE(run.transition_to(terminal).is_ok());
    const auto completed_at = run.completed_at;

    for (auto next : {RunStatus::Pending, RunStatus::Claimed, RunStatus::Running,
                      RunStatus::Stopping, RunStatus::Completed,
                      RunStatus::Failed, RunStatus::Stopped}) {
      EXPECT_TRUE(run.transition_to(next).is_err())
          << to_string(terminal) << " -> " << to_string(next);
    }
    EXPECT_EQ(run.status, terminal);
    EXPECT_TRUE(run.completed_at == completed_at);
  }
}

TEST(RunStateMachine, ClaimOnlyFromPending) {
  RunRecord run = claimed_run("r-015");
  auto again = run.claim_for("rnr_b");
  ASSERT_TRUE(again.is_err());
  EXPECT_EQ(*run.runner_id, "rnr_a");
}

// ============================================================
// Names and timestamps
// ============================================================

TEST(RunStateMachine, StatusNamesRoundTrip) {
  for (auto status : {RunStatus::Pending, RunStatus::Claimed, RunStatus::Running,
                      RunStatus::Stopping, RunStatus::Completed,
                      RunStatus::Failed, RunStatus::Stopped}) {
    auto parsed = parse_run_status(to_string(status));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, status);
  }
  EXPECT_FALSE(parse_run_status("finished").has_value());
}

TEST(RunStateMachine, KindAcceptsLegacyNames) {
  EXPECT_EQ(parse_run_kind("START"), RunKind::Start);
  EXPECT_EQ(parse_run_kind("start_session"), RunKind::Start);
  EXPECT_EQ(parse_run_kind("resume_session"), RunKind::Resume);
  EXPECT_FALSE(parse_run_kind("restart").has_value());
  EXPECT_STREQ(to_string(RunKind::Resume), "RESUME");
}

TEST(RunStateMachine, TimestampFormat) {
  const auto tp = RunRecord::Clock::from_time_t(0) + std::chrono::milliseconds(42);
  EXPECT_EQ(format_timestamp(tp), "1970-01-01T00:00:00.042Z");
}
