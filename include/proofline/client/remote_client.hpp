#pragma once

#include <proofline/client/client_error.hpp>
#include <proofline/schema/primitives.hpp>
#include <proofline/schema/proof_status.hpp>
#include <proofline/schema/submission_result.hpp>
#include <proofline/schema/top_up_result.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace proofline::client {

/// Capability set of the remote proof network consumed by the workflow.
///
/// Every operation returns std::nullopt on failure and describes it in
/// `error`. The workflow treats an instance as stateless; connection reuse
/// and call deadlines are the implementation's concern.
class remote_client {
 public:
  virtual ~remote_client() = default;

  /// Identifiers already registered for the configured credentials.
  virtual std::optional<std::vector<schema::identifier_t>> list_identifiers(
      client_error& error) = 0;

  /// Register and return a fresh identifier.
  virtual std::optional<schema::identifier_t> create_identifier(
      client_error& error) = 0;

  /// Prepaid balance in native settlement units.
  virtual std::optional<schema::balance_t> get_balance(
      const schema::identifier_t& identifier,
      client_error& error) = 0;

  /// Issue a credit top-up transaction of `amount` for `identifier`.
  virtual std::optional<schema::top_up_result_t> top_up_credits(
      const schema::identifier_t& identifier,
      schema::balance_t amount,
      client_error& error) = 0;

  virtual std::optional<schema::submission_result_t> submit_proof(
      const schema::proof_payload_t& proof,
      const schema::identifier_t& identifier,
      client_error& error) = 0;

  virtual std::optional<schema::proof_status_t> get_proof_status(
      std::string_view job_id,
      client_error& error) = 0;
};

}  // namespace proofline::client
