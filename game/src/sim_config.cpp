#include "sim_config.h"

#include <cmath>
#include <fstream>

#include <nlohmann/json.hpp>

namespace {
std::string ToError(const std::string &message) {
  return "sim_config: " + message;
}

// Missing keys keep the current value; present keys must be finite numbers.
bool ReadNumber(const nlohmann::json &obj, const char *key, double &out, std::string &error) {
  auto iter = obj.find(key);
  if (iter == obj.end()) {
    return true;
  }
  if (!iter->is_number()) {
    error = ToError(std::string("invalid_field: ") + key);
    return false;
  }
  const double value = iter->get<double>();
  if (!std::isfinite(value)) {
    error = ToError(std::string("invalid_field: ") + key);
    return false;
  }
  out = value;
  return true;
}
}  // namespace

namespace tilerun::sim {

std::filesystem::path ResolveSimConfigPath() {
  auto path = std::filesystem::current_path();
  for (int i = 0; i < 5; ++i) {
    auto candidate = path / "shared/sim/config.json";
    if (std::filesystem::exists(candidate)) {
      return candidate;
    }
    if (!path.has_parent_path()) {
      break;
    }
    path = path.parent_path();
  }
  return {};
}

SimConfig LoadSimConfig(const std::filesystem::path &path, std::string &error) {
  error.clear();
  if (path.empty()) {
    error = ToError("path_not_found");
    return kDefaultSimConfig;
  }
  std::ifstream stream(path);
  if (!stream.is_open()) {
    error = ToError("file_not_found");
    return kDefaultSimConfig;
  }

  nlohmann::json data;
  try {
    stream >> data;
  } catch (const std::exception &exc) {
    error = ToError(std::string("parse_failed: ") + exc.what());
    return kDefaultSimConfig;
  }

  if (!data.is_object()) {
    error = ToError("invalid_root");
    return kDefaultSimConfig;
  }

  SimConfig config = kDefaultSimConfig;
  const bool ok = ReadNumber(data, "gravity", config.gravity, error) &&
                  ReadNumber(data, "maxFallSpeed", config.max_fall_speed, error) &&
                  ReadNumber(data, "walkSpeed", config.walk_speed, error) &&
                  ReadNumber(data, "runSpeed", config.run_speed, error) &&
                  ReadNumber(data, "walkAccel", config.walk_accel, error) &&
                  ReadNumber(data, "runAccel", config.run_accel, error) &&
                  ReadNumber(data, "friction", config.friction, error) &&
                  ReadNumber(data, "jumpVelocity", config.jump_velocity, error) &&
                  ReadNumber(data, "jumpCutVelocity", config.jump_cut_velocity, error) &&
                  ReadNumber(data, "stompBounce", config.stomp_bounce, error) &&
                  ReadNumber(data, "deathHop", config.death_hop, error) &&
                  ReadNumber(data, "deathGravityScale", config.death_gravity_scale, error) &&
                  ReadNumber(data, "underwaterGravityScale", config.underwater_gravity_scale, error) &&
                  ReadNumber(data, "underwaterMaxFall", config.underwater_max_fall, error) &&
                  ReadNumber(data, "entityGravity", config.entity_gravity, error) &&
                  ReadNumber(data, "entityMaxFall", config.entity_max_fall, error) &&
                  ReadNumber(data, "shellKickSpeed", config.shell_kick_speed, error) &&
                  ReadNumber(data, "fireballSpeed", config.fireball_speed, error);
  if (!ok) {
    return kDefaultSimConfig;
  }
  if (!ValidateSimConfig(config, error)) {
    return kDefaultSimConfig;
  }
  return config;
}

bool ValidateSimConfig(const SimConfig &config, std::string &error) {
  if (!IsFiniteConfig(config)) {
    error = ToError("values must be finite and positive");
    return false;
  }
  if (config.walk_speed > config.run_speed) {
    error = ToError("walkSpeed must not exceed runSpeed");
    return false;
  }
  if (config.jump_cut_velocity > config.jump_velocity) {
    error = ToError("jumpCutVelocity must not exceed jumpVelocity");
    return false;
  }
  return true;
}

}  // namespace tilerun::sim
