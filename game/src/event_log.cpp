#include "event_log.h"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string NowUtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm utc_tm{};
#if defined(_WIN32)
  gmtime_s(&utc_tm, &time);
#else
  gmtime_r(&time, &utc_tm);
#endif
  std::ostringstream out;
  out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string BuildEventLine(const std::string &timestamp, const std::string &event,
                           const nlohmann::json &fields) {
  nlohmann::json line = nlohmann::json::object();
  line["ts"] = timestamp;
  line["event"] = event;
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      if (it.key() == "ts" || it.key() == "event") {
        continue;
      }
      line[it.key()] = it.value();
    }
  } else if (!fields.is_null()) {
    line["value"] = fields;
  }
  return line.dump();
}

std::string BuildEventLine(const std::string &timestamp, const tilerun::game::GameEvent &event) {
  nlohmann::json fields = {
      {"tick", event.tick},
      {"x", std::round(event.x)},
      {"y", std::round(event.y)},
  };
  if (event.value != 0) {
    fields["value"] = event.value;
  }
  if (!event.detail.empty()) {
    fields["detail"] = event.detail;
  }
  return BuildEventLine(timestamp, tilerun::game::GameEventName(event.kind), fields);
}
