#pragma once

#include <proofline/schema/primitives.hpp>
#include <proofline/schema/proof_status.hpp>
#include <proofline/schema/submission_result.hpp>
#include <proofline/schema/top_up_result.hpp>
#include <proofline/schema/workflow_error_code.hpp>
#include <proofline/schema/workflow_failure.hpp>
#include <proofline/schema/workflow_state.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Outbound reporting envelopes: a human-readable `text` plus the structured
// result or failure. Only the structured fields are load-bearing.
namespace proofline::schema {

template <uint16_t Version>
struct submit_proof_report;

template <>
struct submit_proof_report<1> final {
  uint16_t version{1};
  bool success{};
  workflow_state_t state{workflow_state_t::idle};
  /// Every state entered, in order, starting with idle.
  std::vector<workflow_state_t> transitions;
  std::string text;
  std::optional<identifier_t> identifier;
  std::optional<top_up_result_t> top_up;
  std::optional<submission_result_t> result;
  std::optional<workflow_failure_t> error;
  /// Non-fatal conditions, e.g. a balance still short after top-up.
  std::vector<workflow_failure_t> warnings;
};

using submit_proof_report_t = submit_proof_report<1>;

template <uint16_t Version>
struct proof_status_report;

template <>
struct proof_status_report<1> final {
  uint16_t version{1};
  bool success{};
  job_id_t job_id;
  std::string text;
  std::optional<proof_status_t> status;
  std::optional<workflow_failure_t> error;
};

using proof_status_report_t = proof_status_report<1>;

}  // namespace proofline::schema
