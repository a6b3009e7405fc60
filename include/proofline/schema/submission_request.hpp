#pragma once

#include <proofline/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace proofline::schema {

template <uint16_t Version>
struct submission_request;

template <>
struct submission_request<1> final {
  uint16_t version{1};
  proof_payload_t proof;
  /// Hex identifier requested by the caller; overrides configuration.
  std::optional<std::string> identifier;
};

using submission_request_t = submission_request<1>;

}  // namespace proofline::schema
