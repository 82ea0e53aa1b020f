#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct RuntimeConfig {
  uint32_t seed = 0;
  int ticks = 3600;
  int world = 1;
  int level = 1;
  int log_every = 60;
  std::string sim_config_path;
  bool realtime = false;
  bool autoplay = true;
  bool dump_level = false;
  bool show_help = false;
};

struct ParseResult {
  RuntimeConfig config;
  std::vector<std::string> errors;
};

ParseResult ParseArgs(int argc, const char *const *argv);
std::vector<std::string> ValidateConfig(const RuntimeConfig &config);
