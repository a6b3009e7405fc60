#pragma once

#include <proofline/client/remote_client.hpp>
#include <proofline/schema/proof_status.hpp>
#include <proofline/schema/workflow_failure.hpp>
#include <optional>
#include <string_view>

namespace proofline::workflow {

/// Fetch the current state of a submitted job. Nothing is cached; every
/// client failure is reported as status_lookup_failed.
std::optional<schema::proof_status_t> get_status(
    std::string_view job_id,
    client::remote_client& client,
    schema::workflow_failure_t& failure);

}  // namespace proofline::workflow
