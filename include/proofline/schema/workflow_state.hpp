#pragma once

#include <proofline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Submission workflow: idle, resolving_identifier, checking_balance,
// optional topping_up, submitting, then succeeded or failed.
namespace proofline::schema {

enum class workflow_state_t : uint8_t {
  idle = 0,
  resolving_identifier = 1,
  checking_balance = 2,
  topping_up = 3,
  submitting = 4,
  succeeded = 5,
  failed = 6
};

inline constexpr auto kWorkflowStateMappings =
    std::array{std::pair<std::string_view, workflow_state_t>{
                   "idle", workflow_state_t::idle},
               std::pair<std::string_view, workflow_state_t>{
                   "resolving_identifier",
                   workflow_state_t::resolving_identifier},
               std::pair<std::string_view, workflow_state_t>{
                   "checking_balance", workflow_state_t::checking_balance},
               std::pair<std::string_view, workflow_state_t>{
                   "topping_up", workflow_state_t::topping_up},
               std::pair<std::string_view, workflow_state_t>{
                   "submitting", workflow_state_t::submitting},
               std::pair<std::string_view, workflow_state_t>{
                   "succeeded", workflow_state_t::succeeded},
               std::pair<std::string_view, workflow_state_t>{
                   "failed", workflow_state_t::failed}};

template <>
inline std::optional<workflow_state_t> try_from_string<workflow_state_t>(
    const std::string_view value) {
  return from_string(value, kWorkflowStateMappings);
}

inline constexpr std::string_view to_string(const workflow_state_t value) {
  return to_string(value, kWorkflowStateMappings).value_or("unknown");
}

}  // namespace proofline::schema
