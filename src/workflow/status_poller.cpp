#include <spdlog/spdlog.h>
#include <proofline/workflow/status_poller.hpp>

namespace proofline::workflow {

std::optional<schema::proof_status_t> get_status(
    const std::string_view job_id,
    client::remote_client& client,
    schema::workflow_failure_t& failure) {
  auto error = client::client_error{};
  auto status = client.get_proof_status(job_id, error);
  if (!status) {
    failure.code = schema::workflow_error_code::status_lookup_failed;
    failure.message = error.message;
    return std::nullopt;
  }
  spdlog::info("Request ID: {}, Additional Info: {}", status->request_id,
               status->additional_info.value_or(""));
  return status;
}

}  // namespace proofline::workflow
