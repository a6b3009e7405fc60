#pragma once

#include <proofline/client/remote_client.hpp>
#include <proofline/schema/enum_string.hpp>
#include <proofline/schema/primitives.hpp>
#include <proofline/schema/workflow_failure.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proofline::workflow {

enum class identifier_source_t : uint8_t {
  explicit_value = 0,
  configured = 1,
  discovered = 2,
  created = 3
};

inline constexpr auto kIdentifierSourceMappings =
    std::array{std::pair<std::string_view, identifier_source_t>{
                   "explicit", identifier_source_t::explicit_value},
               std::pair<std::string_view, identifier_source_t>{
                   "configured", identifier_source_t::configured},
               std::pair<std::string_view, identifier_source_t>{
                   "discovered", identifier_source_t::discovered},
               std::pair<std::string_view, identifier_source_t>{
                   "created", identifier_source_t::created}};

inline constexpr std::string_view to_string(const identifier_source_t value) {
  return schema::to_string(value, kIdentifierSourceMappings)
      .value_or("unknown");
}

struct resolved_identifier final {
  schema::identifier_t identifier{};
  identifier_source_t source{identifier_source_t::explicit_value};
};

/// Decode a caller- or configuration-supplied hex identifier.
///
/// Empty, overlong (more than 64 hex digits after the marker) or non-hex
/// input fails with malformed_identifier.
std::optional<schema::identifier_t> parse_identifier(
    std::string_view hex,
    schema::workflow_failure_t& failure);

/// Pick the identifier for one submission.
///
/// Precedence: explicit, then configured, then the first identifier the
/// client already knows, then a newly created one. Empty strings count as
/// absent. Client failures are reported as identifier_unavailable.
std::optional<resolved_identifier> resolve_identifier(
    const std::optional<std::string>& explicit_hex,
    const std::optional<std::string>& configured_hex,
    client::remote_client& client,
    schema::workflow_failure_t& failure);

}  // namespace proofline::workflow
