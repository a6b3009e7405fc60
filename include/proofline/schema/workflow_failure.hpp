#pragma once

#include <proofline/schema/workflow_error_code.hpp>
#include <string>

namespace proofline::schema {

struct workflow_failure_t final {
  workflow_error_code code{};
  std::string message;
};

}  // namespace proofline::schema
