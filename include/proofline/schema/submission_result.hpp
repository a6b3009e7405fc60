#pragma once

#include <proofline/schema/primitives.hpp>
#include <cstdint>

namespace proofline::schema {

template <uint16_t Version>
struct submission_result;

template <>
struct submission_result<1> final {
  uint16_t version{1};
  job_id_t job_id;
};

using submission_result_t = submission_result<1>;

}  // namespace proofline::schema
