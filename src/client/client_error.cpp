#include <proofline/client/client_error.hpp>

namespace proofline::client {

std::string_view to_string(const client_error_kind kind) {
  using enum client_error_kind;
  switch (kind) {
    case rejected:
      return "rejected";
    case timeout:
      return "timeout";
    case not_found:
      return "not_found";
    case unavailable:
      return "unavailable";
    case transport:
    default:
      return "transport";
  }
}

}  // namespace proofline::client
