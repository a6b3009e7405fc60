#pragma once

#include <proofline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Lifecycle of a submitted proof as reported by the remote network. The
// state machine lives remotely; this is only the vocabulary.
namespace proofline::schema {

enum class job_status_t : uint8_t {
  pending = 0,
  processing = 1,
  completed = 2,
  failed = 3,
  unknown = 4
};

inline constexpr auto kJobStatusMappings =
    std::array{std::pair<std::string_view, job_status_t>{
                   "PENDING", job_status_t::pending},
               std::pair<std::string_view, job_status_t>{
                   "PROCESSING", job_status_t::processing},
               std::pair<std::string_view, job_status_t>{
                   "COMPLETED", job_status_t::completed},
               std::pair<std::string_view, job_status_t>{
                   "FAILED", job_status_t::failed},
               std::pair<std::string_view, job_status_t>{
                   "UNKNOWN", job_status_t::unknown}};

template <>
inline std::optional<job_status_t> try_from_string<job_status_t>(
    const std::string_view value) {
  return from_string(value, kJobStatusMappings);
}

inline constexpr std::string_view to_string(const job_status_t value) {
  return to_string(value, kJobStatusMappings).value_or("UNKNOWN");
}

/// Unrecognised wire values collapse to job_status_t::unknown.
inline job_status_t parse_job_status(const std::string_view value) {
  return try_from_string<job_status_t>(value).value_or(job_status_t::unknown);
}

}  // namespace proofline::schema
