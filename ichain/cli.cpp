#include "cli.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include "core.hpp"

namespace ichain {

namespace {

const std::string kEnvPrefix = "ICHAIN_";

[[noreturn]] void print_help(po::options_description const& description,
                             std::string const& message = "") {
  std::cout << message << '\n' << description << std::endl;
  std::exit(0);
}

// ICHAIN_DRAIN_TIMEOUT_MS -> drain-timeout-ms, anything without the prefix is ignored
std::string environment_map(std::string env) {
  if (env.compare(0, kEnvPrefix.size(), kEnvPrefix) != 0) return "";
  env.erase(0, kEnvPrefix.size());
  std::transform(env.begin(), env.end(), env.begin(), [](unsigned char c) {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });
  return env;
}

}  // namespace

po::variables_map parse_program_options(int argc, char** argv,
                                        po::options_description const& user_options) {
  po::options_description description("Common");
  auto&& options = description.add_options();
  options("help", "show available options");
  options("loglevel", po::value<char>()->default_value('i'),
          "char indicating the desired log level: d[ebug], i[nfo], w[warn], e[error]");
  options("config", po::value<std::string>(), "JSON file with the engine options");
  options("worker-threads", po::value<unsigned>(), "validation/observability worker threads");
  options("drain-timeout-ms", po::value<unsigned>(),
          "grace period to wait for detached tasks on shutdown");
  description.add(user_options);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description, environment_map), vm);
    po::notify(vm);
  } catch (std::exception const& e) {
    print_help(description, fmt::format("Error parsing program options: {}", e.what()));
  }

  if (vm.count("help")) print_help(description);

  if (set_loglevel(vm["loglevel"].as<char>()))
    print_help(description, fmt::format("Invalid log level '{}'", vm["loglevel"].as<char>()));

  return vm;
}

msgs::EngineOptions engine_options(po::variables_map const& vm) {
  msgs::EngineOptions options;
  if (vm.count("config")) {
    auto filename = vm["config"].as<std::string>();
    auto loaded = load_from_json<msgs::EngineOptions>(filename);
    if (!loaded) critical("Failed to load engine options from '{}'", filename);
    options = *loaded;
  }
  if (vm.count("worker-threads")) options.set_worker_threads(vm["worker-threads"].as<unsigned>());
  if (vm.count("drain-timeout-ms"))
    options.set_drain_timeout_ms(vm["drain-timeout-ms"].as<unsigned>());
  return options;
}

}  // namespace ichain
