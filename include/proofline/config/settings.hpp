#pragma once

#include <boost/program_options.hpp>
#include <proofline/client/client_options.hpp>
#include <proofline/workflow/coordinator.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proofline::config {

inline constexpr auto kEnvironmentPrefix = std::string_view{"PROOFLINE_"};

struct logging_options final {
  std::string level{"info"};
  std::string file{"proofline.log"};
};

struct settings final {
  client::client_options client;
  workflow::coordinator_options workflow;
  logging_options logging;
};

/// Options shared by the command line, the environment and config files.
boost::program_options::options_description settings_description();

/// Map `PROOFLINE_TOP_UP_THRESHOLD` to `top-up-threshold`; names that are
/// not settings map to an empty string and are ignored.
std::string environment_name_to_option(
    const boost::program_options::options_description& description,
    const std::string& variable);

/// Store PROOFLINE_* environment variables. Values already stored from the
/// command line are kept.
void store_environment(
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm);

/// Store an INI-style config file. Returns false and fills `error` when the
/// file is unreadable or holds an unknown or invalid entry.
bool store_config_file(
    const std::string& path,
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& vm,
    std::string& error);

/// Validate and convert parsed values.
std::optional<settings> make_settings(
    const boost::program_options::variables_map& vm,
    std::string& error);

/// Human-readable dump with the API key redacted.
std::string describe(const settings& value);

}  // namespace proofline::config
