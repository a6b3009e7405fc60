#pragma once

#include <chrono>
#include <string>

namespace proofline::client {

struct client_options final {
  std::string endpoint{"localhost:50051"};
  /// Sent as `authorization: Bearer <api_key>` when non-empty.
  std::string api_key;
  bool use_tls{false};
  /// Per-call deadline; zero leaves calls unbounded.
  std::chrono::milliseconds call_timeout{0};
};

}  // namespace proofline::client
