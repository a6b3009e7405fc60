#pragma once

#include <proofline/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Receipt for a credit top-up issued against one identifier.
namespace proofline::schema {

template <uint16_t Version>
struct top_up_result;

template <>
struct top_up_result<1> final {
  uint16_t version{1};
  std::string transaction_hash;
  balance_t amount{};
};

using top_up_result_t = top_up_result<1>;

}  // namespace proofline::schema
