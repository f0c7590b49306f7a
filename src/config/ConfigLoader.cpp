#include "olt-client/config/ConfigLoader.hpp"
#include "olt-client/errors.hpp"
#include "olt-client/parser/OutputParsers.hpp"

#include <regex>
#include <set>
#include <yaml-cpp/yaml.h>

namespace oltclient {
namespace config {

namespace {

const std::regex EPON_PORT_TOKEN(R"(^\d+/\d+$)");

const std::set<std::string> DEVICE_KEYS{
    "name",     "host",    "port",
    "username", "password", "enable_password",
    "enabled",  "connect_timeout_ms", "command_timeout_ms",
    "interface_pattern", "ports", "fetch_details"};

const std::set<std::string> LOG_LEVELS{"trace", "debug", "info", "warn",
                                       "error", "critical", "off"};

std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out;
}

void add_error(ValidationResult &result, const std::vector<std::string> &path,
               const std::string &msg, const YAML::Node &node = YAML::Node()) {
  result.valid = false;
  int line = 0;
  int column = 0;
  if (node.IsDefined()) {
    line = node.Mark().line + 1;
    column = node.Mark().column + 1;
  }
  result.errors.push_back({node_path(path), msg, line, column});
}

bool is_integer(const YAML::Node &node) {
  if (!node.IsScalar())
    return false;
  try {
    node.as<long long>();
    return true;
  } catch (const YAML::BadConversion &) {
    return false;
  }
}

bool is_bool(const YAML::Node &node) {
  if (!node.IsScalar())
    return false;
  try {
    node.as<bool>();
    return true;
  } catch (const YAML::BadConversion &) {
    return false;
  }
}

bool is_nonempty_string(const YAML::Node &node) {
  return node.IsScalar() && !node.Scalar().empty();
}

void check_int_range(ValidationResult &result, const YAML::Node &parent,
                     const std::string &key,
                     const std::vector<std::string> &path, long long min,
                     long long max) {
  const YAML::Node node = parent[key];
  if (!node)
    return;
  std::vector<std::string> p = path;
  p.push_back(key);
  if (!is_integer(node)) {
    add_error(result, p, "'" + key + "' must be an integer", node);
    return;
  }
  long long value = node.as<long long>();
  if (value < min || value > max) {
    add_error(result, p,
              "'" + key + "' must be between " + std::to_string(min) +
                  " and " + std::to_string(max),
              node);
  }
}

void check_bool(ValidationResult &result, const YAML::Node &parent,
                const std::string &key, const std::vector<std::string> &path) {
  const YAML::Node node = parent[key];
  if (node && !is_bool(node)) {
    std::vector<std::string> p = path;
    p.push_back(key);
    add_error(result, p, "'" + key + "' must be true or false", node);
  }
}

void validate_device(const YAML::Node &dev, size_t index,
                     std::set<std::string> &names, ValidationResult &result) {
  std::vector<std::string> path{"devices", std::to_string(index)};

  if (!dev.IsMap()) {
    add_error(result, path, "Device entry must be a map", dev);
    return;
  }

  for (const auto &req : {"name", "host", "password", "enable_password"}) {
    if (!dev[req]) {
      add_error(result, path,
                std::string("Missing required field '") + req + "'", dev);
    } else if (!dev[req].IsScalar()) {
      std::vector<std::string> p = path;
      p.push_back(req);
      add_error(result, p, std::string("'") + req + "' must be a string",
                dev[req]);
    }
  }

  if (dev["name"] && dev["name"].IsScalar()) {
    if (!is_nonempty_string(dev["name"])) {
      add_error(result, {"devices", std::to_string(index), "name"},
                "Device name must not be empty", dev["name"]);
    } else {
      std::string lowered = parser::to_lower(dev["name"].Scalar());
      if (!names.insert(lowered).second) {
        add_error(result, {"devices", std::to_string(index), "name"},
                  "Duplicate device name '" + dev["name"].Scalar() + "'",
                  dev["name"]);
      }
    }
  }

  if (dev["host"] && dev["host"].IsScalar() && !is_nonempty_string(dev["host"])) {
    add_error(result, {"devices", std::to_string(index), "host"},
              "Host must not be empty", dev["host"]);
  }

  check_int_range(result, dev, "port", path, 1, 65535);
  check_int_range(result, dev, "connect_timeout_ms", path, 1, 600000);
  check_int_range(result, dev, "command_timeout_ms", path, 1, 600000);
  check_bool(result, dev, "enabled", path);
  check_bool(result, dev, "fetch_details", path);

  if (dev["username"] && !is_nonempty_string(dev["username"])) {
    add_error(result, {"devices", std::to_string(index), "username"},
              "'username' must be a non-empty string", dev["username"]);
  }
  if (dev["interface_pattern"] && !dev["interface_pattern"].IsScalar()) {
    add_error(result, {"devices", std::to_string(index), "interface_pattern"},
              "'interface_pattern' must be a string", dev["interface_pattern"]);
  }

  if (const YAML::Node ports = dev["ports"]) {
    std::vector<std::string> p = path;
    p.push_back("ports");
    if (!ports.IsSequence() || ports.size() == 0) {
      add_error(result, p, "'ports' must be a non-empty list", ports);
    } else {
      for (size_t i = 0; i < ports.size(); ++i) {
        const YAML::Node port = ports[i];
        if (!port.IsScalar() ||
            !std::regex_match(port.Scalar(), EPON_PORT_TOKEN)) {
          std::vector<std::string> pp = p;
          pp.push_back(std::to_string(i));
          add_error(result, pp,
                    "EPON port must look like '<slot>/<port>', e.g. '0/1'",
                    port);
        }
      }
    }
  }

  for (const auto &kv : dev) {
    std::string key = kv.first.as<std::string>();
    if (DEVICE_KEYS.count(key) == 0) {
      result.warnings.push_back(node_path(path) + ": unknown key '" + key +
                                "' ignored");
    }
  }
}

ValidationResult validate_document(const YAML::Node &doc) {
  ValidationResult result;

  if (!doc.IsMap()) {
    add_error(result, {}, "Top level must be a map", doc);
    return result;
  }

  if (const YAML::Node logging = doc["logging"]) {
    if (!logging.IsMap()) {
      add_error(result, {"logging"}, "'logging' must be a map", logging);
    } else {
      if (logging["file"] && !is_nonempty_string(logging["file"])) {
        add_error(result, {"logging", "file"},
                  "'file' must be a non-empty string", logging["file"]);
      }
      if (const YAML::Node level = logging["level"]) {
        if (!level.IsScalar() ||
            LOG_LEVELS.count(parser::to_lower(level.Scalar())) == 0) {
          add_error(result, {"logging", "level"},
                    "Unknown log level (trace, debug, info, warn, error, "
                    "critical, off)",
                    level);
        }
      }
    }
  }

  if (const YAML::Node session = doc["session"]) {
    if (!session.IsMap()) {
      add_error(result, {"session"}, "'session' must be a map", session);
    } else {
      check_int_range(result, session, "idle_ttl_s", {"session"}, 1, 86400);
      check_int_range(result, session, "poll_interval_ms", {"session"}, 1,
                      10000);
    }
  }

  if (const YAML::Node cache = doc["cache"]) {
    if (!cache.IsMap()) {
      add_error(result, {"cache"}, "'cache' must be a map", cache);
    } else {
      check_int_range(result, cache, "ttl_s", {"cache"}, 0, 86400);
    }
  }

  const YAML::Node devices = doc["devices"];
  if (!devices) {
    add_error(result, {}, "Missing required field 'devices'", doc);
    return result;
  }
  if (!devices.IsSequence() || devices.size() == 0) {
    add_error(result, {"devices"}, "'devices' must be a non-empty list",
              devices);
    return result;
  }

  std::set<std::string> names;
  bool any_enabled = false;
  for (size_t i = 0; i < devices.size(); ++i) {
    const YAML::Node dev = devices[i];
    validate_device(dev, i, names, result);
    if (dev.IsMap() && (!dev["enabled"] ||
                        (is_bool(dev["enabled"]) && dev["enabled"].as<bool>()))) {
      any_enabled = true;
    }
  }
  if (!any_enabled) {
    result.warnings.push_back("/devices: every device is disabled");
  }

  return result;
}

std::chrono::milliseconds ms(const YAML::Node &node, long long fallback,
                             long long scale = 1) {
  return std::chrono::milliseconds(
      (node ? node.as<long long>() : fallback) * scale);
}

ClientConfig parse_document(const YAML::Node &doc) {
  ClientConfig cfg;

  if (const YAML::Node logging = doc["logging"]) {
    cfg.log_file = logging["file"].as<std::string>(cfg.log_file);
    cfg.log_level = parser::to_lower(logging["level"].as<std::string>(cfg.log_level));
  }
  if (const YAML::Node session = doc["session"]) {
    cfg.session_idle_ttl = ms(session["idle_ttl_s"], 300, 1000);
    cfg.poll_interval = ms(session["poll_interval_ms"], 100);
  }
  if (const YAML::Node cache = doc["cache"]) {
    cfg.cache_ttl = ms(cache["ttl_s"], 300, 1000);
  }

  for (const auto &dev : doc["devices"]) {
    DeviceConfig d;
    d.name = dev["name"].as<std::string>();
    d.host = dev["host"].as<std::string>();
    d.port = static_cast<uint16_t>(dev["port"].as<int>(d.port));
    d.username = dev["username"].as<std::string>(d.username);
    d.password = dev["password"].as<std::string>();
    d.enable_password = dev["enable_password"].as<std::string>();
    d.enabled = dev["enabled"].as<bool>(d.enabled);
    d.connect_timeout = ms(dev["connect_timeout_ms"], d.connect_timeout.count());
    d.command_timeout = ms(dev["command_timeout_ms"], d.command_timeout.count());
    d.interface_pattern = dev["interface_pattern"].as<std::string>(d.name);
    d.fetch_details = dev["fetch_details"].as<bool>(d.fetch_details);

    if (const YAML::Node ports = dev["ports"]) {
      d.epon_ports.clear();
      for (const auto &port : ports) {
        d.epon_ports.push_back(port.as<std::string>());
      }
    }

    d.timings.poll_interval = cfg.poll_interval;
    cfg.devices.push_back(std::move(d));
  }

  return cfg;
}

ClientConfig load_document(const YAML::Node &doc) {
  ValidationResult result = validate_document(doc);
  if (!result.valid) {
    throw ConfigError(ConfigLoader::format_errors(result));
  }
  return parse_document(doc);
}

} // namespace

const DeviceConfig *ClientConfig::find_device(const std::string &name) const {
  std::string wanted = parser::to_lower(name);
  for (const auto &device : devices) {
    if (parser::to_lower(device.name) == wanted)
      return &device;
  }
  return nullptr;
}

const DeviceConfig *
ClientConfig::route_interface(const std::string &interface_name) const {
  std::string lowered = parser::to_lower(interface_name);
  for (const auto &device : devices) {
    if (!device.enabled || device.interface_pattern.empty())
      continue;
    if (lowered.find(parser::to_lower(device.interface_pattern)) !=
        std::string::npos) {
      return &device;
    }
  }
  return nullptr;
}

ValidationResult ConfigLoader::validate_file(const std::string &path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    ValidationResult result;
    result.valid = false;
    result.errors.push_back(
        {"", std::string("YAML parse error: ") + e.what(), 0, 0});
    return result;
  }
  return validate_document(doc);
}

ValidationResult ConfigLoader::validate_string(const std::string &yaml) {
  YAML::Node doc;
  try {
    doc = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    ValidationResult result;
    result.valid = false;
    result.errors.push_back(
        {"", std::string("YAML parse error: ") + e.what(), 0, 0});
    return result;
  }
  return validate_document(doc);
}

ClientConfig ConfigLoader::load_file(const std::string &path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Cannot load " + path + ": " + e.what());
  }
  return load_document(doc);
}

ClientConfig ConfigLoader::load_string(const std::string &yaml) {
  YAML::Node doc;
  try {
    doc = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Cannot parse configuration: ") + e.what());
  }
  return load_document(doc);
}

std::string ConfigLoader::format_errors(const ValidationResult &result) {
  std::string out;
  for (const auto &err : result.errors) {
    if (!out.empty())
      out += "\n";
    out += (err.path.empty() ? std::string("/") : err.path) + ": " +
           err.message;
    if (err.line > 0) {
      out += " (line " + std::to_string(err.line) + ")";
    }
  }
  return out;
}

} // namespace config
} // namespace oltclient
