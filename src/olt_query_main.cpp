#include "olt-client/Logger.hpp"
#include "olt-client/config/ConfigLoader.hpp"
#include "olt-client/errors.hpp"
#include "olt-client/parser/OutputParsers.hpp"
#include "olt-client/query/QueryOrchestrator.hpp"
#include "olt-client/query/Report.hpp"
#include "olt-client/query/ResultJson.hpp"
#include "olt-client/session/SessionPool.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace oltclient;

namespace {

constexpr int EXIT_FOUND = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_NOT_FOUND = 2;
constexpr int EXIT_UNREACHABLE = 3;

struct QueryOptions {
  std::vector<std::string> positional;
  std::string device;
  std::string log_level;
  bool json{false};
  bool no_details{false};
};

} // namespace

int cmd_query(int argc, char **argv);
int cmd_route(int argc, char **argv);
int cmd_validate(int argc, char **argv);

void print_usage() {
  std::cout << "Usage: olt-query <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  query <config> <description>   Find a unit by description\n";
  std::cout << "  route <config> <interface>     Find the unit behind a "
               "Mikrotik interface\n";
  std::cout << "  validate <config>              Check a devices file\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --device <name>      Only query this device\n";
  std::cout << "  --json               Print the result as JSON\n";
  std::cout << "  --no-details         Skip optical / link / capability "
               "queries\n";
  std::cout << "  --log-level <level>  Log level (default: from config)\n";
  std::cout << "\nExit codes:\n";
  std::cout << "  0 found, 1 usage or configuration error, 2 not found,\n";
  std::cout << "  3 every queried device unreachable\n";
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

static QueryOptions parse_options(int argc, char **argv) {
  QueryOptions opts;
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--device" && i + 1 < argc) {
      opts.device = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      opts.log_level = argv[++i];
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--no-details") {
      opts.no_details = true;
    } else {
      opts.positional.push_back(arg);
    }
  }
  return opts;
}

static bool load_config(const std::string &path, const QueryOptions &opts,
                        config::ClientConfig &cfg) {
  try {
    cfg = config::ConfigLoader::load_file(path);
  } catch (const ConfigError &ex) {
    std::cerr << "Invalid configuration " << path << ":\n" << ex.what() << "\n";
    return false;
  }

  std::string level = opts.log_level.empty() ? cfg.log_level : opts.log_level;
  OltLogger::instance().init(cfg.log_file, parse_log_level(level));
  return true;
}

/// Ask each target in turn until one knows the unit
static int run_query(const config::ClientConfig &cfg,
                     const std::vector<const DeviceConfig *> &targets,
                     const std::string &description,
                     const QueryOptions &opts) {
  session::SessionPool pool(session::tcp_transport_factory(),
                            cfg.session_idle_ttl);
  query::ResultCache cache(cfg.cache_ttl);

  nlohmann::json attempts = nlohmann::json::object();
  size_t queried = 0;
  size_t unreachable = 0;

  for (const auto *target : targets) {
    DeviceConfig device = *target;
    if (opts.no_details)
      device.fetch_details = false;

    query::QueryOrchestrator orchestrator(device, pool, cache);
    QueryResult result = orchestrator.get_unit_info(description);

    if (result.outcome == QueryOutcome::Disabled)
      continue;
    queried++;

    if (result.found()) {
      if (opts.json) {
        std::cout << nlohmann::json(result).dump(2) << "\n";
      } else {
        std::cout << query::format_unit_report(*result.unit) << "\n";
      }
      return EXIT_FOUND;
    }

    if (result.outcome == QueryOutcome::DeviceUnreachable) {
      unreachable++;
      if (!opts.json) {
        std::cerr << device.name << ": " << result.error_message << "\n";
      }
    }
    attempts[device.name] = result;
  }

  if (queried == 0) {
    std::cerr << "No enabled device to query\n";
    return EXIT_USAGE;
  }

  bool all_unreachable = unreachable == queried;
  if (opts.json) {
    nlohmann::json out{{"description", description},
                       {"outcome", all_unreachable ? "device_unreachable"
                                                   : "not_found"},
                       {"devices", attempts}};
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << "'" << description << "' not found\n";
  }
  return all_unreachable ? EXIT_UNREACHABLE : EXIT_NOT_FOUND;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return EXIT_USAGE;
  }

  std::string command = argv[1];

  if (command == "query") {
    return cmd_query(argc - 2, argv + 2);
  } else if (command == "route") {
    return cmd_route(argc - 2, argv + 2);
  } else if (command == "validate") {
    return cmd_validate(argc - 2, argv + 2);
  } else if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return EXIT_USAGE;
  }
}

int cmd_query(int argc, char **argv) {
  QueryOptions opts = parse_options(argc, argv);
  if (opts.positional.size() != 2) {
    std::cerr << "Usage: olt-query query <config> <description> "
                 "[--device NAME] [--json] [--no-details]\n";
    return EXIT_USAGE;
  }

  config::ClientConfig cfg;
  if (!load_config(opts.positional[0], opts, cfg))
    return EXIT_USAGE;

  std::vector<const DeviceConfig *> targets;
  if (!opts.device.empty()) {
    const DeviceConfig *device = cfg.find_device(opts.device);
    if (!device) {
      std::cerr << "Unknown device: " << opts.device << "\n";
      return EXIT_USAGE;
    }
    targets.push_back(device);
  } else {
    for (const auto &device : cfg.devices) {
      targets.push_back(&device);
    }
  }

  return run_query(cfg, targets, opts.positional[1], opts);
}

int cmd_route(int argc, char **argv) {
  QueryOptions opts = parse_options(argc, argv);
  if (opts.positional.size() != 2) {
    std::cerr << "Usage: olt-query route <config> <interface> [--json] "
                 "[--no-details]\n";
    return EXIT_USAGE;
  }

  config::ClientConfig cfg;
  if (!load_config(opts.positional[0], opts, cfg))
    return EXIT_USAGE;

  const std::string &interface_name = opts.positional[1];
  const DeviceConfig *device = cfg.route_interface(interface_name);
  if (!device) {
    std::cerr << "No enabled device matches interface " << interface_name
              << "\n";
    return EXIT_NOT_FOUND;
  }

  auto username =
      parser::extract_unit_username(interface_name, device->interface_pattern);
  if (!username) {
    std::cerr << "Cannot extract a username from " << interface_name << "\n";
    return EXIT_NOT_FOUND;
  }

  LOG_INFO(device->name, "ROUTE", "{} -> '{}'", interface_name, *username);
  return run_query(cfg, {device}, *username, opts);
}

int cmd_validate(int argc, char **argv) {
  if (argc != 1) {
    std::cerr << "Usage: olt-query validate <config>\n";
    return EXIT_USAGE;
  }

  auto result = config::ConfigLoader::validate_file(argv[0]);
  for (const auto &warning : result.warnings) {
    std::cout << "  warning: " << warning << "\n";
  }
  if (result.valid) {
    std::cout << "Validation succeeded.\n";
    return 0;
  } else {
    std::cout << "Validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path << ": " << err.message;
      if (err.line > 0)
        std::cout << " (line " << err.line << ", column " << err.column << ")";
      std::cout << "\n";
    }
    return 2;
  }
}
