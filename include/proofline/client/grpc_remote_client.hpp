#pragma once

#include <proofline/network/v1/proof_network.grpc.pb.h>
#include <grpcpp/grpcpp.h>
#include <proofline/client/client_options.hpp>
#include <proofline/client/remote_client.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace proofline::client {

/// Build an insecure or TLS channel to `options.endpoint`.
std::shared_ptr<grpc::Channel> make_channel(const client_options& options);

/// Map a failed gRPC status onto the client error taxonomy.
client_error_kind map_status_code(grpc::StatusCode code);

/// remote_client backed by the ProofNetwork gRPC service.
class grpc_remote_client final : public remote_client {
 public:
  grpc_remote_client(std::shared_ptr<grpc::Channel> channel,
                     client_options options);

  std::optional<std::vector<schema::identifier_t>> list_identifiers(
      client_error& error) override;

  std::optional<schema::identifier_t> create_identifier(
      client_error& error) override;

  std::optional<schema::balance_t> get_balance(
      const schema::identifier_t& identifier,
      client_error& error) override;

  std::optional<schema::top_up_result_t> top_up_credits(
      const schema::identifier_t& identifier,
      schema::balance_t amount,
      client_error& error) override;

  std::optional<schema::submission_result_t> submit_proof(
      const schema::proof_payload_t& proof,
      const schema::identifier_t& identifier,
      client_error& error) override;

  std::optional<schema::proof_status_t> get_proof_status(
      std::string_view job_id,
      client_error& error) override;

 private:
  /// Attach credentials and deadline to a fresh call context.
  void prepare(grpc::ClientContext& context) const;

  std::unique_ptr<proofline::network::v1::ProofNetwork::Stub> stub_;
  client_options options_;
};

}  // namespace proofline::client
