#pragma once

#include <proofline/client/remote_client.hpp>
#include <proofline/schema/submission_request.hpp>
#include <proofline/schema/workflow_report.hpp>
#include <proofline/workflow/balance_guard.hpp>
#include <proofline/workflow/sleeper.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proofline::workflow {

struct coordinator_options final {
  /// Deployment-wide identifier hex, used when the caller supplies none.
  std::optional<std::string> identifier;
  schema::balance_t top_up_threshold{0.004};
  std::chrono::milliseconds settlement_delay{std::chrono::seconds{5}};
  uint32_t settlement_checks{1};
};

/// Entry point for the two public operations.
///
/// submit_proof walks idle -> resolving_identifier -> checking_balance ->
/// (topping_up) -> submitting -> succeeded|failed; every failure is folded
/// into the returned report. get_proof_status is a single lookup.
///
/// The coordinator holds no per-call state, so one instance may serve
/// concurrent callers as far as the client allows; nothing serializes
/// top-ups for a shared identifier.
class coordinator final {
 public:
  coordinator(client::remote_client& client,
              coordinator_options options,
              sleeper_t sleeper = make_thread_sleeper());

  schema::submit_proof_report_t submit_proof(
      const schema::submission_request_t& request) const;

  schema::proof_status_report_t get_proof_status(
      std::string_view job_id) const;

 private:
  client::remote_client& client_;
  coordinator_options options_;
  balance_guard balance_guard_;
};

}  // namespace proofline::workflow
