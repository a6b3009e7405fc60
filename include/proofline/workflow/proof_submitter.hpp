#pragma once

#include <proofline/client/remote_client.hpp>
#include <proofline/schema/primitives.hpp>
#include <proofline/schema/submission_result.hpp>
#include <proofline/schema/workflow_failure.hpp>
#include <optional>

namespace proofline::workflow {

/// Send one proof for `identifier`; a single round trip with no retry.
///
/// A client deadline fails with submission_timeout. Every other client
/// failure, or an empty job id, fails with submission_rejected.
std::optional<schema::submission_result_t> submit_proof(
    const schema::proof_payload_t& proof,
    const schema::identifier_t& identifier,
    client::remote_client& client,
    schema::workflow_failure_t& failure);

}  // namespace proofline::workflow
