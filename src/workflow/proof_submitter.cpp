#include <spdlog/spdlog.h>
#include <proofline/workflow/proof_submitter.hpp>
#include <string>

namespace proofline::workflow {

std::optional<schema::submission_result_t> submit_proof(
    const schema::proof_payload_t& proof,
    const schema::identifier_t& identifier,
    client::remote_client& client,
    schema::workflow_failure_t& failure) {
  spdlog::info("Submitting {}-byte proof for identifier 0x{}", proof.size(),
               schema::to_hex(identifier));

  auto error = client::client_error{};
  auto result = client.submit_proof(proof, identifier, error);
  if (!result) {
    if (error.kind == client::client_error_kind::timeout) {
      failure.code = schema::workflow_error_code::submission_timeout;
      failure.message = "submission timed out: " + error.message;
    } else {
      failure.code = schema::workflow_error_code::submission_rejected;
      failure.message = error.message;
    }
    return std::nullopt;
  }

  if (result->job_id.empty()) {
    failure.code = schema::workflow_error_code::submission_rejected;
    failure.message = "network accepted the proof without a job id";
    return std::nullopt;
  }
  spdlog::info("Proof submitted successfully. Job ID: {}", result->job_id);
  return result;
}

}  // namespace proofline::workflow
