#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "game_events.h"

std::string NowUtcTimestamp();

// One stdout log line: a JSON object holding "ts", "event" and the members of
// `fields`, which cannot override the first two. Non-object `fields` are stored
// under "value".
std::string BuildEventLine(const std::string &timestamp, const std::string &event,
                           const nlohmann::json &fields);
std::string BuildEventLine(const std::string &timestamp, const tilerun::game::GameEvent &event);
