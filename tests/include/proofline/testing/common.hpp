#pragma once

#include <proofline/schema/primitives.hpp>
#include <proofline/workflow/sleeper.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace proofline::testing {

inline proofline::schema::identifier_t make_identifier(const uint8_t seed) {
  auto out = proofline::schema::identifier_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Identifier whose trailing bytes hold `tail`, everything else zero.
inline proofline::schema::identifier_t make_padded_identifier(
    const std::vector<uint8_t>& tail) {
  auto out = proofline::schema::identifier_t{};
  std::copy(tail.begin(), tail.end(), out.end() - tail.size());
  return out;
}

/// Records requested waits instead of blocking.
struct recording_sleeper final {
  std::vector<std::chrono::milliseconds> waits;

  proofline::workflow::sleeper_t as_sleeper() {
    return [this](const std::chrono::milliseconds duration) {
      waits.push_back(duration);
    };
  }
};

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace proofline::testing
