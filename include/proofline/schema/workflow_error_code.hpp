#pragma once

#include <proofline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace proofline::schema {

enum class workflow_error_code : uint32_t {
  malformed_identifier = 1,
  missing_proof = 2,
  missing_job_id = 3,
  submission_rejected = 4,
  submission_timeout = 5,
  insufficient_balance_after_top_up = 6,
  status_lookup_failed = 7,
  identifier_unavailable = 8,
  balance_unavailable = 9,
  top_up_failed = 10,
};

inline constexpr auto kWorkflowErrorCodeMappings = std::array{
    std::pair<std::string_view, workflow_error_code>{
        "malformed_identifier", workflow_error_code::malformed_identifier},
    std::pair<std::string_view, workflow_error_code>{
        "missing_proof", workflow_error_code::missing_proof},
    std::pair<std::string_view, workflow_error_code>{
        "missing_job_id", workflow_error_code::missing_job_id},
    std::pair<std::string_view, workflow_error_code>{
        "submission_rejected", workflow_error_code::submission_rejected},
    std::pair<std::string_view, workflow_error_code>{
        "submission_timeout", workflow_error_code::submission_timeout},
    std::pair<std::string_view, workflow_error_code>{
        "insufficient_balance_after_top_up",
        workflow_error_code::insufficient_balance_after_top_up},
    std::pair<std::string_view, workflow_error_code>{
        "status_lookup_failed", workflow_error_code::status_lookup_failed},
    std::pair<std::string_view, workflow_error_code>{
        "identifier_unavailable", workflow_error_code::identifier_unavailable},
    std::pair<std::string_view, workflow_error_code>{
        "balance_unavailable", workflow_error_code::balance_unavailable},
    std::pair<std::string_view, workflow_error_code>{
        "top_up_failed", workflow_error_code::top_up_failed}};

template <>
inline std::optional<workflow_error_code> try_from_string<workflow_error_code>(
    const std::string_view value) {
  return from_string(value, kWorkflowErrorCodeMappings);
}

inline constexpr std::string_view to_string(const workflow_error_code value) {
  return to_string(value, kWorkflowErrorCodeMappings).value_or("unknown");
}

}  // namespace proofline::schema
