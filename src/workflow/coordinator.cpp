#include <spdlog/spdlog.h>
#include <proofline/workflow/coordinator.hpp>
#include <proofline/workflow/identifier_resolver.hpp>
#include <proofline/workflow/proof_submitter.hpp>
#include <proofline/workflow/status_poller.hpp>
#include <string>
#include <utility>

using namespace proofline::schema;

namespace {

void enter(submit_proof_report_t& report, const workflow_state_t state) {
  spdlog::debug("submit_proof: {} -> {}", to_string(report.state),
                to_string(state));
  report.state = state;
  report.transitions.push_back(state);
}

submit_proof_report_t fail(submit_proof_report_t report,
                           workflow_failure_t failure) {
  enter(report, workflow_state_t::failed);
  report.success = false;
  if (failure.code == workflow_error_code::missing_proof) {
    report.text = "No proof provided for submission";
  } else {
    report.text = "Error submitting proof: " + failure.message;
  }
  spdlog::error("Error submitting proof ({}): {}", to_string(failure.code),
                failure.message);
  report.error = std::move(failure);
  return report;
}

proof_status_report_t fail(proof_status_report_t report,
                           workflow_failure_t failure) {
  report.success = false;
  if (failure.code == workflow_error_code::missing_job_id) {
    report.text = "No job ID provided to check proof submission status";
  } else {
    report.text = "Error checking proof submission status: " + failure.message;
  }
  spdlog::error("Error checking proof submission status ({}): {}",
                to_string(failure.code), failure.message);
  report.error = std::move(failure);
  return report;
}

std::string describe(const job_id_t& job_id, const proof_status_t& status) {
  auto text = "Current status for proof submission job " + job_id + ": " +
              std::string{to_string(status.status)};
  if (status.error) {
    text += ". Error: " + *status.error;
  }
  text += "\nYou can also track it with Request ID: " + status.request_id;
  return text;
}

}  // namespace

namespace proofline::workflow {

coordinator::coordinator(client::remote_client& client,
                         coordinator_options options,
                         sleeper_t sleeper)
    : client_{client},
      options_{std::move(options)},
      balance_guard_{options_.top_up_threshold, options_.settlement_delay,
                     options_.settlement_checks, std::move(sleeper)} {}

submit_proof_report_t coordinator::submit_proof(
    const submission_request_t& request) const {
  auto report = submit_proof_report_t{};
  report.transitions.push_back(workflow_state_t::idle);
  spdlog::info("Starting proof submission");

  if (request.proof.empty()) {
    return fail(std::move(report),
                {.code = workflow_error_code::missing_proof,
                 .message = "no proof provided"});
  }

  auto failure = workflow_failure_t{};
  enter(report, workflow_state_t::resolving_identifier);
  auto resolved = resolve_identifier(request.identifier, options_.identifier,
                                     client_, failure);
  if (!resolved) {
    return fail(std::move(report), std::move(failure));
  }
  report.identifier = resolved->identifier;

  enter(report, workflow_state_t::checking_balance);
  auto balance = balance_guard_.ensure(
      resolved->identifier, client_, failure, [&report](const balance_t) {
        enter(report, workflow_state_t::topping_up);
      });
  if (!balance) {
    return fail(std::move(report), std::move(failure));
  }
  report.top_up = balance->top_up;
  if (balance->topped_up && !balance->threshold_met) {
    report.warnings.push_back(workflow_failure_t{
        .code = workflow_error_code::insufficient_balance_after_top_up,
        .message = fmt::format("balance below {} after top-up settlement wait",
                               balance_guard_.threshold())});
  }

  enter(report, workflow_state_t::submitting);
  report.result = workflow::submit_proof(request.proof, resolved->identifier,
                                         client_, failure);
  if (!report.result) {
    return fail(std::move(report), std::move(failure));
  }

  enter(report, workflow_state_t::succeeded);
  report.success = true;
  report.text = "Proof submitted successfully! Job ID: " +
                report.result->job_id +
                ". You can check the status of your submission using this "
                "job ID.";
  return report;
}

proof_status_report_t coordinator::get_proof_status(
    const std::string_view job_id) const {
  auto report = proof_status_report_t{};
  report.job_id = std::string{job_id};
  spdlog::info("Checking status of proof submission job '{}'", job_id);

  if (job_id.empty()) {
    return fail(std::move(report),
                {.code = workflow_error_code::missing_job_id,
                 .message = "no job id provided"});
  }

  auto failure = workflow_failure_t{};
  report.status = get_status(job_id, client_, failure);
  if (!report.status) {
    return fail(std::move(report), std::move(failure));
  }

  report.success = true;
  report.text = describe(report.job_id, *report.status);
  spdlog::info("Retrieved status for proof submission job {}: {}",
               report.job_id, to_string(report.status->status));
  return report;
}

}  // namespace proofline::workflow
