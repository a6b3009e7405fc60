#include <spdlog/spdlog.h>
#include <proofline/config/settings.hpp>
#include <proofline/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Durations above a day are rejected so deadlines stay representable.
constexpr auto kMaxDurationMs = int64_t{24 * 60 * 60 * 1000};

std::optional<std::chrono::milliseconds> read_duration(
    const po::variables_map& vm,
    const std::string& name,
    std::string& error) {
  auto count = vm[name].as<int64_t>();
  if (count < 0 || count > kMaxDurationMs) {
    error = name + " must be between 0 and " + std::to_string(kMaxDurationMs);
    return std::nullopt;
  }
  return std::chrono::milliseconds{count};
}

}  // namespace

namespace proofline::config {

po::options_description settings_description() {
  auto description = po::options_description{"proofline settings"};
  description.add_options()(
      "endpoint", po::value<std::string>()->default_value("localhost:50051"),
      "proof network gRPC endpoint (host:port)")(
      "api-key", po::value<std::string>()->default_value(""),
      "bearer token sent with every call")(
      "tls", po::value<bool>()->default_value(false)->implicit_value(true),
      "use a TLS channel")(
      "call-timeout-ms", po::value<int64_t>()->default_value(0),
      "per-call deadline in milliseconds, 0 for none")(
      "identifier", po::value<std::string>(),
      "fixed 32-byte identifier hex used when a request names none")(
      "top-up-threshold", po::value<double>()->default_value(0.004),
      "minimum balance required before submitting")(
      "settlement-delay-ms", po::value<int64_t>()->default_value(5000),
      "wait after a top-up before re-reading the balance")(
      "settlement-checks", po::value<uint32_t>()->default_value(1),
      "balance re-reads after a top-up")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("proofline.log"),
      "log file path");
  return description;
}

std::string environment_name_to_option(
    const po::options_description& description,
    const std::string& variable) {
  if (!variable.starts_with(kEnvironmentPrefix)) {
    return {};
  }
  auto name = variable.substr(kEnvironmentPrefix.size());
  std::ranges::transform(name, name.begin(), [](const char c) {
    return c == '_' ? '-'
                    : static_cast<char>(
                          std::tolower(static_cast<unsigned char>(c)));
  });
  if (description.find_nothrow(name, false) == nullptr) {
    return {};
  }
  return name;
}

void store_environment(const po::options_description& description,
                       po::variables_map& vm) {
  po::store(po::parse_environment(description,
                                  [&description](const std::string& variable) {
                                    return environment_name_to_option(
                                        description, variable);
                                  }),
            vm);
}

bool store_config_file(const std::string& path,
                       const po::options_description& description,
                       po::variables_map& vm,
                       std::string& error) {
  auto stream = std::ifstream{path};
  if (!stream) {
    error = "unable to read config file '" + path + "'";
    return false;
  }
  try {
    po::store(po::parse_config_file(stream, description, false), vm);
  } catch (const po::error& ex) {
    error = "config file '" + path + "': " + ex.what();
    return false;
  }
  spdlog::debug("Loaded config file '{}'", path);
  return true;
}

std::optional<settings> make_settings(const po::variables_map& vm,
                                      std::string& error) {
  auto value = settings{};

  value.client.endpoint = vm["endpoint"].as<std::string>();
  if (value.client.endpoint.empty()) {
    error = "endpoint must not be empty";
    return std::nullopt;
  }
  value.client.api_key = vm["api-key"].as<std::string>();
  value.client.use_tls = vm["tls"].as<bool>();
  auto call_timeout = read_duration(vm, "call-timeout-ms", error);
  if (!call_timeout) {
    return std::nullopt;
  }
  value.client.call_timeout = *call_timeout;

  if (vm.contains("identifier") &&
      !vm["identifier"].as<std::string>().empty()) {
    auto hex = vm["identifier"].as<std::string>();
    if (!schema::try_parse_identifier(hex)) {
      error = "identifier '" + hex + "' is not a hex value of at most 32 bytes";
      return std::nullopt;
    }
    value.workflow.identifier = hex;
  }

  value.workflow.top_up_threshold = vm["top-up-threshold"].as<double>();
  if (!std::isfinite(value.workflow.top_up_threshold) ||
      value.workflow.top_up_threshold < 0.0) {
    error = "top-up-threshold must be a finite value >= 0";
    return std::nullopt;
  }
  auto settlement_delay = read_duration(vm, "settlement-delay-ms", error);
  if (!settlement_delay) {
    return std::nullopt;
  }
  value.workflow.settlement_delay = *settlement_delay;
  value.workflow.settlement_checks = vm["settlement-checks"].as<uint32_t>();
  if (value.workflow.settlement_checks == 0) {
    error = "settlement-checks must be at least 1";
    return std::nullopt;
  }

  value.logging.level = vm["log-level"].as<std::string>();
  if (std::ranges::find(kLogLevels, value.logging.level) ==
      std::end(kLogLevels)) {
    error = "unknown log-level '" + value.logging.level + "'";
    return std::nullopt;
  }
  value.logging.file = vm["log-file"].as<std::string>();
  return value;
}

std::string describe(const settings& value) {
  auto out = std::ostringstream{};
  out << "endpoint = " << value.client.endpoint << '\n'
      << "api-key = " << (value.client.api_key.empty() ? "" : "<redacted>")
      << '\n'
      << "tls = " << (value.client.use_tls ? "true" : "false") << '\n'
      << "call-timeout-ms = " << value.client.call_timeout.count() << '\n'
      << "identifier = " << value.workflow.identifier.value_or("") << '\n'
      << "top-up-threshold = " << value.workflow.top_up_threshold << '\n'
      << "settlement-delay-ms = " << value.workflow.settlement_delay.count()
      << '\n'
      << "settlement-checks = " << value.workflow.settlement_checks << '\n'
      << "log-level = " << value.logging.level << '\n'
      << "log-file = " << value.logging.file << '\n';
  return out.str();
}

}  // namespace proofline::config
