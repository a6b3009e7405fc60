#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <proofline/client/grpc_remote_client.hpp>
#include <proofline/common/critical.hpp>
#include <proofline/config/settings.hpp>
#include <proofline/workflow/coordinator.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace {

namespace po = boost::program_options;

constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;

void setup_logging(const proofline::config::logging_options& options) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries the report text only.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "proofline", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.level));
}

/// `@path` reads the proof from a file; anything else is the proof itself.
std::optional<std::string> load_proof(const std::string& argument) {
  if (!argument.starts_with('@')) {
    return argument;
  }
  auto stream = std::ifstream{argument.substr(1), std::ios::binary};
  if (!stream) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  proofline submit --proof <data|@file> [--request-identifier <hex>]\n"
            << "  proofline status --job-id <id>\n"
            << "  proofline show-config\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};

  auto commands = po::options_description{"proofline commands"};
  commands.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "submit|status|show-config")(
      "config,c", po::value<std::string>(), "INI-style settings file")(
      "proof", po::value<std::string>(), "proof payload or @file")(
      "request-identifier", po::value<std::string>(),
      "identifier hex for this submission only")(
      "job-id", po::value<std::string>(), "job id returned by submit");

  auto settings_options = proofline::config::settings_description();
  auto options = po::options_description{};
  options.add(commands).add(settings_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    proofline::config::store_environment(settings_options, vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "proofline: " << ex.what() << '\n';
    return kExitUsage;
  }

  auto error = std::string{};
  if (vm.contains("config") &&
      !proofline::config::store_config_file(vm["config"].as<std::string>(),
                                            settings_options, vm, error)) {
    std::cerr << "proofline: " << error << '\n';
    return kExitUsage;
  }
  auto settings = proofline::config::make_settings(vm, error);
  if (!settings) {
    std::cerr << "proofline: " << error << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "show-config") {
    std::cout << proofline::config::describe(*settings);
    return 0;
  }

  try {
    setup_logging(settings->logging);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "proofline: " << ex.what() << '\n';
    return kExitUsage;
  }
  spdlog::debug("Connecting to proof network at {}", settings->client.endpoint);

  auto client = proofline::client::grpc_remote_client{
      proofline::client::make_channel(settings->client), settings->client};
  auto coordinator =
      proofline::workflow::coordinator{client, settings->workflow};

  if (command == "submit") {
    auto request = proofline::schema::submission_request_t{};
    if (vm.contains("proof")) {
      auto proof = load_proof(vm["proof"].as<std::string>());
      if (!proof) {
        spdlog::error("Unable to read proof file '{}'",
                      vm["proof"].as<std::string>().substr(1));
        spdlog::shutdown();
        return kExitUsage;
      }
      request.proof = std::move(*proof);
    }
    if (vm.contains("request-identifier")) {
      request.identifier = vm["request-identifier"].as<std::string>();
    }

    auto report = coordinator.submit_proof(request);
    std::cout << report.text << '\n';
    spdlog::shutdown();
    return report.success ? 0 : kExitFailure;
  }

  if (command == "status") {
    auto job_id = vm.contains("job-id") ? vm["job-id"].as<std::string>()
                                        : std::string{};
    auto report = coordinator.get_proof_status(job_id);
    std::cout << report.text << '\n';
    spdlog::shutdown();
    return report.success ? 0 : kExitFailure;
  }

  proofline::common::critical(
      "unknown command '{}': expected submit|status|show-config", command);
}
