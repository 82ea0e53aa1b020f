#include "config.h"

#include <limits>
#include <string>

namespace {
int ParseInt(const std::string &value, const std::string &label, std::vector<std::string> &errors, bool &ok) {
  ok = false;
  try {
    size_t idx = 0;
    const int parsed = std::stoi(value, &idx);
    if (idx != value.size()) {
      errors.push_back("Invalid " + label + " value: " + value);
      return 0;
    }
    ok = true;
    return parsed;
  } catch (const std::exception &) {
    errors.push_back("Invalid " + label + " value: " + value);
    return 0;
  }
}

uint32_t ParseUnsigned32(const std::string &value, const std::string &label,
                         std::vector<std::string> &errors, bool &ok) {
  ok = false;
  try {
    size_t idx = 0;
    const unsigned long long parsed = std::stoull(value, &idx);
    if (idx != value.size() || value.front() == '-') {
      errors.push_back("Invalid " + label + " value: " + value);
      return 0;
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
      errors.push_back(label + " out of range: " + value);
      return 0;
    }
    ok = true;
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception &) {
    errors.push_back("Invalid " + label + " value: " + value);
    return 0;
  }
}
}

ParseResult ParseArgs(int argc, const char *const *argv) {
  ParseResult result;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      result.config.show_help = true;
      continue;
    }

    auto require_value = [&](const char *flag) -> std::string {
      if (i + 1 >= argc) {
        result.errors.push_back(std::string("Missing value for ") + flag);
        return {};
      }
      return std::string(argv[++i]);
    };

    auto read_int = [&](const char *flag, const char *label, int &target) {
      auto value = require_value(flag);
      if (value.empty()) {
        return;
      }
      bool ok = false;
      const int parsed = ParseInt(value, label, result.errors, ok);
      if (ok) {
        target = parsed;
      }
    };

    if (arg == "--seed") {
      auto value = require_value("--seed");
      if (!value.empty()) {
        bool ok = false;
        const uint32_t parsed = ParseUnsigned32(value, "seed", result.errors, ok);
        if (ok) {
          result.config.seed = parsed;
        }
      }
    } else if (arg == "--ticks") {
      read_int("--ticks", "ticks", result.config.ticks);
    } else if (arg == "--world") {
      read_int("--world", "world", result.config.world);
    } else if (arg == "--level") {
      read_int("--level", "level", result.config.level);
    } else if (arg == "--log-every") {
      read_int("--log-every", "log interval", result.config.log_every);
    } else if (arg == "--sim-config") {
      auto value = require_value("--sim-config");
      if (!value.empty()) {
        result.config.sim_config_path = value;
      }
    } else if (arg == "--realtime") {
      result.config.realtime = true;
    } else if (arg == "--no-autoplay") {
      result.config.autoplay = false;
    } else if (arg == "--dump-level") {
      result.config.dump_level = true;
    } else {
      result.errors.push_back("Unknown argument: " + arg);
    }
  }

  return result;
}

std::vector<std::string> ValidateConfig(const RuntimeConfig &config) {
  std::vector<std::string> errors;
  if (config.ticks < 0) {
    errors.push_back("Ticks must be >= 0");
  }
  if (config.world < 1 || config.world > 8) {
    errors.push_back("World must be in 1-8");
  }
  if (config.level < 1 || config.level > 4) {
    errors.push_back("Level must be in 1-4");
  }
  if (config.log_every < 0) {
    errors.push_back("Log interval must be >= 0");
  }
  return errors;
}
