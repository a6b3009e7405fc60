#include <gtest/gtest.h>
#include <proofline/testing/fake_remote_client.hpp>
#include <proofline/workflow/coordinator.hpp>

#include <algorithm>
#include <chrono>
#include <vector>

namespace {

using namespace std::chrono_literals;
using proofline::client::client_error_kind;
using proofline::schema::job_status_t;
using proofline::schema::workflow_error_code;
using proofline::schema::workflow_state_t;
using proofline::testing::fake_remote_client;
using proofline::testing::make_client_error;
using proofline::testing::make_identifier;
using proofline::testing::make_padded_identifier;
using proofline::testing::recording_sleeper;
using proofline::workflow::coordinator;
using proofline::workflow::coordinator_options;

bool contains(const std::vector<workflow_state_t>& states,
              const workflow_state_t state) {
  return std::ranges::find(states, state) != states.end();
}

class coordinator_test : public ::testing::Test {
 protected:
  coordinator make_coordinator(coordinator_options options = {}) {
    return coordinator{client, std::move(options), sleeper.as_sleeper()};
  }

  fake_remote_client client;
  recording_sleeper sleeper;
};

}  // namespace

TEST_F(coordinator_test, submit_creates_identifier_and_tops_up_when_empty) {
  client.balances = {0.0, 0.004};
  client.job_id = "job-123";
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({.proof = "0xdead"});
  ASSERT_TRUE(report.success) << report.text;
  EXPECT_EQ(client.list_calls, 1);
  EXPECT_EQ(client.create_calls, 1);
  ASSERT_EQ(client.top_ups.size(), 1u);
  EXPECT_EQ(client.top_ups[0].first, client.created_identifier);
  EXPECT_DOUBLE_EQ(client.top_ups[0].second, 0.004);
  ASSERT_EQ(client.submissions.size(), 1u);
  EXPECT_EQ(client.submissions[0].first, "0xdead");
  EXPECT_EQ(client.submissions[0].second, client.created_identifier);
  ASSERT_EQ(sleeper.waits.size(), 1u);
  EXPECT_EQ(sleeper.waits[0], 5s);

  ASSERT_TRUE(report.result.has_value());
  EXPECT_EQ(report.result->job_id, "job-123");
  ASSERT_TRUE(report.top_up.has_value());
  EXPECT_EQ(report.top_up->transaction_hash, "0xfeed");
  EXPECT_EQ(report.identifier, client.created_identifier);
  EXPECT_TRUE(report.warnings.empty());
  EXPECT_EQ(report.text,
            "Proof submitted successfully! Job ID: job-123. You can check the "
            "status of your submission using this job ID.");
  EXPECT_EQ(report.transitions,
            (std::vector<workflow_state_t>{
                workflow_state_t::idle, workflow_state_t::resolving_identifier,
                workflow_state_t::checking_balance,
                workflow_state_t::topping_up, workflow_state_t::submitting,
                workflow_state_t::succeeded}));
  EXPECT_EQ(report.state, workflow_state_t::succeeded);
}

TEST_F(coordinator_test, submit_uses_padded_explicit_identifier_without_top_up) {
  client.balances = {0.01};
  client.identifiers = {make_identifier(0x40)};
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({.proof = "0xbeef", .identifier = "0x12"});
  ASSERT_TRUE(report.success) << report.text;
  EXPECT_EQ(client.list_calls, 0);
  EXPECT_TRUE(client.top_ups.empty());
  ASSERT_EQ(client.submissions.size(), 1u);
  EXPECT_EQ(client.submissions[0].second, make_padded_identifier({0x12}));
  EXPECT_FALSE(contains(report.transitions, workflow_state_t::topping_up));
  EXPECT_FALSE(report.top_up.has_value());
  EXPECT_TRUE(sleeper.waits.empty());
}

TEST_F(coordinator_test, submit_prefers_configured_identifier_over_discovery) {
  client.identifiers = {make_identifier(0x40)};
  auto workflow = make_coordinator({.identifier = "0x0a"});

  auto report = workflow.submit_proof({.proof = "proof"});
  ASSERT_TRUE(report.success) << report.text;
  EXPECT_EQ(client.list_calls, 0);
  ASSERT_EQ(client.submissions.size(), 1u);
  EXPECT_EQ(client.submissions[0].second, make_padded_identifier({0x0A}));
}

TEST_F(coordinator_test, submit_without_proof_makes_no_client_calls) {
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({});
  EXPECT_FALSE(report.success);
  EXPECT_EQ(client.total_calls(), 0);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::missing_proof);
  EXPECT_EQ(report.text, "No proof provided for submission");
  EXPECT_EQ(report.transitions,
            (std::vector<workflow_state_t>{workflow_state_t::idle,
                                           workflow_state_t::failed}));
}

TEST_F(coordinator_test, malformed_identifier_fails_before_any_client_call) {
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof(
      {.proof = "proof", .identifier = std::string(65, 'f')});
  EXPECT_FALSE(report.success);
  EXPECT_EQ(client.total_calls(), 0);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::malformed_identifier);
  EXPECT_TRUE(report.text.starts_with("Error submitting proof: "));
  EXPECT_EQ(report.state, workflow_state_t::failed);
}

TEST_F(coordinator_test, short_balance_after_top_up_still_submits_with_warning) {
  client.balances = {0.0, 0.001};
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({.proof = "proof"});
  ASSERT_TRUE(report.success) << report.text;
  EXPECT_EQ(client.top_ups.size(), 1u);
  EXPECT_EQ(client.submissions.size(), 1u);
  ASSERT_EQ(report.warnings.size(), 1u);
  EXPECT_EQ(report.warnings[0].code,
            workflow_error_code::insufficient_balance_after_top_up);
  EXPECT_EQ(report.warnings[0].message,
            "balance below 0.004 after top-up settlement wait");
}

TEST_F(coordinator_test, settlement_options_reach_the_balance_guard) {
  client.balances = {0.0, 0.0, 0.0, 0.5};
  auto workflow = make_coordinator({.top_up_threshold = 0.25,
                                    .settlement_delay = 100ms,
                                    .settlement_checks = 4});

  auto report = workflow.submit_proof({.proof = "proof"});
  ASSERT_TRUE(report.success) << report.text;
  ASSERT_EQ(client.top_ups.size(), 1u);
  EXPECT_DOUBLE_EQ(client.top_ups[0].second, 0.25);
  EXPECT_EQ(sleeper.waits,
            (std::vector<std::chrono::milliseconds>{100ms, 100ms, 100ms}));
  EXPECT_TRUE(report.warnings.empty());
}

TEST_F(coordinator_test, submission_timeout_is_reported) {
  client.submit_failure =
      make_client_error(client_error_kind::timeout, "deadline exceeded");
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({.proof = "proof"});
  EXPECT_FALSE(report.success);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::submission_timeout);
  EXPECT_EQ(client.submissions.size(), 1u);
  EXPECT_NE(report.text.find("deadline exceeded"), std::string::npos);
  EXPECT_EQ(report.transitions.back(), workflow_state_t::failed);
  EXPECT_TRUE(contains(report.transitions, workflow_state_t::submitting));
}

TEST_F(coordinator_test, top_up_failure_stops_before_submission) {
  client.balances = {0.0};
  client.top_up_failure = make_client_error(client_error_kind::rejected);
  auto workflow = make_coordinator();

  auto report = workflow.submit_proof({.proof = "proof"});
  EXPECT_FALSE(report.success);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::top_up_failed);
  EXPECT_TRUE(client.submissions.empty());
  EXPECT_FALSE(contains(report.transitions, workflow_state_t::submitting));
}

TEST_F(coordinator_test, status_reports_remote_state) {
  client.status = proofline::schema::proof_status_t{
      .status = job_status_t::completed, .request_id = "req1"};
  auto workflow = make_coordinator();

  auto report = workflow.get_proof_status("abc123");
  ASSERT_TRUE(report.success) << report.text;
  ASSERT_EQ(client.status_queries.size(), 1u);
  EXPECT_EQ(client.status_queries[0], "abc123");
  ASSERT_TRUE(report.status.has_value());
  EXPECT_EQ(report.status->status, job_status_t::completed);
  EXPECT_NE(report.text.find("COMPLETED"), std::string::npos);
  EXPECT_NE(report.text.find("req1"), std::string::npos);
  EXPECT_EQ(report.text,
            "Current status for proof submission job abc123: COMPLETED\n"
            "You can also track it with Request ID: req1");
}

TEST_F(coordinator_test, status_includes_remote_error) {
  client.status = proofline::schema::proof_status_t{
      .status = job_status_t::failed,
      .request_id = "req2",
      .error = "verification failed"};
  auto workflow = make_coordinator();

  auto report = workflow.get_proof_status("job-2");
  ASSERT_TRUE(report.success);
  EXPECT_EQ(report.text,
            "Current status for proof submission job job-2: FAILED. Error: "
            "verification failed\nYou can also track it with Request ID: req2");
}

TEST_F(coordinator_test, status_without_job_id_makes_no_client_calls) {
  auto workflow = make_coordinator();

  auto report = workflow.get_proof_status("");
  EXPECT_FALSE(report.success);
  EXPECT_EQ(client.total_calls(), 0);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::missing_job_id);
  EXPECT_EQ(report.text, "No job ID provided to check proof submission status");
}

TEST_F(coordinator_test, status_lookup_failure_is_reported) {
  client.status_failure =
      make_client_error(client_error_kind::not_found, "unknown job");
  auto workflow = make_coordinator();

  auto report = workflow.get_proof_status("job-404");
  EXPECT_FALSE(report.success);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_EQ(report.error->code, workflow_error_code::status_lookup_failed);
  EXPECT_EQ(report.text,
            "Error checking proof submission status: unknown job");
}
