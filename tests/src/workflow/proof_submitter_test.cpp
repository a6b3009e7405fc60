#include <gtest/gtest.h>
#include <proofline/testing/fake_remote_client.hpp>
#include <proofline/workflow/proof_submitter.hpp>

namespace {

using proofline::client::client_error_kind;
using proofline::schema::workflow_error_code;
using proofline::schema::workflow_failure_t;
using proofline::testing::fake_remote_client;
using proofline::testing::make_client_error;
using proofline::testing::make_identifier;

workflow_failure_t submit_failure(fake_remote_client& client) {
  auto failure = workflow_failure_t{};
  auto result = proofline::workflow::submit_proof("proof", make_identifier(1),
                                                  client, failure);
  EXPECT_FALSE(result.has_value());
  return failure;
}

}  // namespace

TEST(proof_submitter, returns_job_id_and_sends_payload_once) {
  auto client = fake_remote_client{};
  client.job_id = "job-42";
  auto identifier = make_identifier(3);

  auto failure = workflow_failure_t{};
  auto result =
      proofline::workflow::submit_proof("0xdead", identifier, client, failure);
  ASSERT_TRUE(result.has_value()) << failure.message;
  EXPECT_EQ(result->job_id, "job-42");
  ASSERT_EQ(client.submissions.size(), 1u);
  EXPECT_EQ(client.submissions[0].first, "0xdead");
  EXPECT_EQ(client.submissions[0].second, identifier);
}

TEST(proof_submitter, deadline_maps_to_submission_timeout) {
  auto client = fake_remote_client{};
  client.submit_failure =
      make_client_error(client_error_kind::timeout, "deadline exceeded");

  auto failure = submit_failure(client);
  EXPECT_EQ(failure.code, workflow_error_code::submission_timeout);
  EXPECT_EQ(failure.message, "submission timed out: deadline exceeded");
  EXPECT_EQ(client.submissions.size(), 1u);
}

TEST(proof_submitter, other_failures_map_to_submission_rejected) {
  for (auto kind : {client_error_kind::rejected, client_error_kind::unavailable,
                    client_error_kind::transport}) {
    auto client = fake_remote_client{};
    client.submit_failure = make_client_error(kind);
    EXPECT_EQ(submit_failure(client).code,
              workflow_error_code::submission_rejected);
    EXPECT_EQ(client.submissions.size(), 1u);
  }
}

TEST(proof_submitter, empty_job_id_is_rejected) {
  auto client = fake_remote_client{};
  client.job_id.clear();
  EXPECT_EQ(submit_failure(client).code,
            workflow_error_code::submission_rejected);
}
