#pragma once

#include <proofline/schema/job_status.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace proofline::schema {

template <uint16_t Version>
struct proof_status;

template <>
struct proof_status<1> final {
  uint16_t version{1};
  job_status_t status{job_status_t::unknown};
  std::string request_id;
  std::optional<std::string> additional_info;
  std::optional<std::string> error;
};

using proof_status_t = proof_status<1>;

}  // namespace proofline::schema
