#pragma once

#include <filesystem>
#include <string>

#include "sim/sim.h"

namespace tilerun::sim {

std::filesystem::path ResolveSimConfigPath();
// Returns the defaults overridden by whatever keys the file sets. On any
// failure the defaults come back unchanged and `error` says why.
SimConfig LoadSimConfig(const std::filesystem::path &path, std::string &error);
bool ValidateSimConfig(const SimConfig &config, std::string &error);

}  // namespace tilerun::sim
