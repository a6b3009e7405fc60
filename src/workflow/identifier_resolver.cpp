#include <spdlog/spdlog.h>
#include <proofline/workflow/identifier_resolver.hpp>

namespace proofline::workflow {

namespace {

bool present(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

std::optional<resolved_identifier> announce(
    const std::optional<schema::identifier_t>& identifier,
    const identifier_source_t source) {
  if (!identifier) {
    return std::nullopt;
  }
  spdlog::info("Using {} identifier 0x{}", to_string(source),
               schema::to_hex(*identifier));
  return resolved_identifier{.identifier = *identifier, .source = source};
}

void unavailable(const client::client_error& error,
                 schema::workflow_failure_t& failure) {
  failure.code = schema::workflow_error_code::identifier_unavailable;
  failure.message = "unable to obtain an identifier: " + error.message;
}

}  // namespace

std::optional<schema::identifier_t> parse_identifier(
    const std::string_view hex,
    schema::workflow_failure_t& failure) {
  auto identifier = schema::try_parse_identifier(hex);
  if (!identifier) {
    failure.code = schema::workflow_error_code::malformed_identifier;
    failure.message = "identifier '" + std::string{hex} +
                      "' is not a hex value of at most 32 bytes";
  }
  return identifier;
}

std::optional<resolved_identifier> resolve_identifier(
    const std::optional<std::string>& explicit_hex,
    const std::optional<std::string>& configured_hex,
    client::remote_client& client,
    schema::workflow_failure_t& failure) {
  if (present(explicit_hex)) {
    return announce(parse_identifier(*explicit_hex, failure),
                    identifier_source_t::explicit_value);
  }
  if (present(configured_hex)) {
    return announce(parse_identifier(*configured_hex, failure),
                    identifier_source_t::configured);
  }

  auto error = client::client_error{};
  auto known = client.list_identifiers(error);
  if (!known) {
    unavailable(error, failure);
    return std::nullopt;
  }
  if (!known->empty()) {
    spdlog::debug("Client reported {} existing identifier(s)", known->size());
    return announce(known->front(), identifier_source_t::discovered);
  }

  spdlog::info("No existing identifiers; creating one");
  auto created = client.create_identifier(error);
  if (!created) {
    unavailable(error, failure);
    return std::nullopt;
  }
  return announce(created, identifier_source_t::created);
}

}  // namespace proofline::workflow
