#include <spdlog/spdlog.h>
#include <proofline/client/grpc_remote_client.hpp>
#include <proofline/schema/job_status.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace network = proofline::network::v1;

namespace {

bool succeeded(const grpc::Status& status,
               const std::string_view rpc,
               proofline::client::client_error& error) {
  if (status.ok()) {
    return true;
  }
  error.kind = proofline::client::map_status_code(status.error_code());
  error.message = std::string{rpc} + ": " + status.error_message();
  spdlog::debug("{} failed with gRPC status {} ({}): {}", rpc,
                static_cast<int>(status.error_code()),
                proofline::client::to_string(error.kind),
                status.error_message());
  return false;
}

std::optional<proofline::schema::identifier_t> identifier_from_wire(
    const std::string& value,
    const std::string_view rpc,
    proofline::client::client_error& error) {
  auto identifier = proofline::schema::try_make_identifier(value);
  if (!identifier) {
    error.kind = proofline::client::client_error_kind::transport;
    error.message = std::string{rpc} +
                    ": expected a 32-byte identifier, got " +
                    std::to_string(value.size()) + " bytes";
  }
  return identifier;
}

}  // namespace

namespace proofline::client {

std::shared_ptr<grpc::Channel> make_channel(const client_options& options) {
  if (options.use_tls) {
    spdlog::debug("Opening TLS channel to {}", options.endpoint);
    return grpc::CreateChannel(
        options.endpoint, grpc::SslCredentials(grpc::SslCredentialsOptions{}));
  }
  spdlog::debug("Opening insecure channel to {}", options.endpoint);
  return grpc::CreateChannel(options.endpoint,
                             grpc::InsecureChannelCredentials());
}

client_error_kind map_status_code(const grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return client_error_kind::timeout;
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::FAILED_PRECONDITION:
    case grpc::StatusCode::PERMISSION_DENIED:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return client_error_kind::rejected;
    case grpc::StatusCode::NOT_FOUND:
      return client_error_kind::not_found;
    case grpc::StatusCode::UNAVAILABLE:
      return client_error_kind::unavailable;
    default:
      return client_error_kind::transport;
  }
}

grpc_remote_client::grpc_remote_client(std::shared_ptr<grpc::Channel> channel,
                                       client_options options)
    : stub_{network::ProofNetwork::NewStub(std::move(channel))},
      options_{std::move(options)} {}

void grpc_remote_client::prepare(grpc::ClientContext& context) const {
  if (!options_.api_key.empty()) {
    context.AddMetadata("authorization", "Bearer " + options_.api_key);
  }
  if (options_.call_timeout.count() > 0) {
    context.set_deadline(std::chrono::system_clock::now() +
                         options_.call_timeout);
  }
}

std::optional<std::vector<schema::identifier_t>>
grpc_remote_client::list_identifiers(client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::ListIdentifiersRequest{};
  auto response = network::ListIdentifiersResponse{};
  if (!succeeded(stub_->ListIdentifiers(&context, request, &response),
                 "ListIdentifiers", error)) {
    return std::nullopt;
  }

  auto identifiers = std::vector<schema::identifier_t>{};
  identifiers.reserve(static_cast<size_t>(response.identifiers_size()));
  for (const auto& value : response.identifiers()) {
    auto identifier = identifier_from_wire(value, "ListIdentifiers", error);
    if (!identifier) {
      return std::nullopt;
    }
    identifiers.push_back(*identifier);
  }
  return identifiers;
}

std::optional<schema::identifier_t> grpc_remote_client::create_identifier(
    client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::CreateIdentifierRequest{};
  auto response = network::CreateIdentifierResponse{};
  if (!succeeded(stub_->CreateIdentifier(&context, request, &response),
                 "CreateIdentifier", error)) {
    return std::nullopt;
  }
  return identifier_from_wire(response.identifier(), "CreateIdentifier",
                              error);
}

std::optional<schema::balance_t> grpc_remote_client::get_balance(
    const schema::identifier_t& identifier,
    client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::GetBalanceRequest{};
  request.set_identifier(schema::make_string(identifier));
  auto response = network::GetBalanceResponse{};
  if (!succeeded(stub_->GetBalance(&context, request, &response), "GetBalance",
                 error)) {
    return std::nullopt;
  }
  return response.balance();
}

std::optional<schema::top_up_result_t> grpc_remote_client::top_up_credits(
    const schema::identifier_t& identifier,
    const schema::balance_t amount,
    client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::TopUpCreditsRequest{};
  request.set_identifier(schema::make_string(identifier));
  request.set_amount(amount);
  auto response = network::TopUpCreditsResponse{};
  if (!succeeded(stub_->TopUpCredits(&context, request, &response),
                 "TopUpCredits", error)) {
    return std::nullopt;
  }
  return schema::top_up_result_t{.transaction_hash = response.transaction_hash(),
                                 .amount = response.amount()};
}

std::optional<schema::submission_result_t> grpc_remote_client::submit_proof(
    const schema::proof_payload_t& proof,
    const schema::identifier_t& identifier,
    client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::SubmitProofRequest{};
  request.set_proof(proof);
  request.set_identifier(schema::make_string(identifier));
  auto response = network::SubmitProofResponse{};
  if (!succeeded(stub_->SubmitProof(&context, request, &response),
                 "SubmitProof", error)) {
    return std::nullopt;
  }
  return schema::submission_result_t{.job_id = response.job_id()};
}

std::optional<schema::proof_status_t> grpc_remote_client::get_proof_status(
    const std::string_view job_id,
    client_error& error) {
  auto context = grpc::ClientContext{};
  prepare(context);
  auto request = network::GetProofStatusRequest{};
  request.set_job_id(std::string{job_id});
  auto response = network::GetProofStatusResponse{};
  if (!succeeded(stub_->GetProofStatus(&context, request, &response),
                 "GetProofStatus", error)) {
    return std::nullopt;
  }

  auto status = schema::proof_status_t{};
  status.status = schema::parse_job_status(response.status());
  status.request_id = response.request_id();
  if (response.has_additional_info()) {
    status.additional_info = response.additional_info();
  }
  if (response.has_error()) {
    status.error = response.error();
  }
  return status;
}

}  // namespace proofline::client
