#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace proofline::client {

enum class client_error_kind : uint8_t {
  rejected = 0,
  timeout = 1,
  not_found = 2,
  unavailable = 3,
  transport = 4
};

std::string_view to_string(client_error_kind kind);

/// Filled by a remote_client operation that returned std::nullopt.
struct client_error final {
  client_error_kind kind{client_error_kind::transport};
  std::string message;
};

}  // namespace proofline::client
