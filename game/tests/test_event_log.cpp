#include <doctest/doctest.h>

#include <regex>
#include <string>

#include <nlohmann/json.hpp>

#include "event_log.h"

TEST_CASE("BuildEventLine carries timestamp, event and fields") {
  const auto line = BuildEventLine("2026-01-02T03:04:05Z", "hud", {{"score", 100}, {"state", "playing"}});
  const auto json = nlohmann::json::parse(line);

  CHECK(json.at("ts") == "2026-01-02T03:04:05Z");
  CHECK(json.at("event") == "hud");
  CHECK(json.at("score") == 100);
  CHECK(json.at("state") == "playing");
  CHECK(line.find('\n') == std::string::npos);
}

TEST_CASE("BuildEventLine fields cannot override ts or event") {
  const auto line = BuildEventLine("t0", "summary", {{"ts", "forged"}, {"event", "other"}, {"ticks", 5}});
  const auto json = nlohmann::json::parse(line);

  CHECK(json.at("ts") == "t0");
  CHECK(json.at("event") == "summary");
  CHECK(json.at("ticks") == 5);
}

TEST_CASE("BuildEventLine wraps non-object fields") {
  const auto scalar = nlohmann::json::parse(BuildEventLine("t0", "note", 42));
  CHECK(scalar.at("value") == 42);

  const auto array = nlohmann::json::parse(BuildEventLine("t0", "note", nlohmann::json::array({1, 2})));
  CHECK(array.at("value").size() == 2);

  const auto empty = nlohmann::json::parse(BuildEventLine("t0", "note", nullptr));
  CHECK(empty.size() == 2);
}

TEST_CASE("BuildEventLine formats game events") {
  tilerun::game::GameEvent event;
  event.kind = tilerun::game::GameEventKind::Stomp;
  event.tick = 12;
  event.x = 100.4;
  event.y = 287.6;
  event.value = 100;

  auto json = nlohmann::json::parse(BuildEventLine("t0", event));
  CHECK(json.at("event") == "stomp");
  CHECK(json.at("tick") == 12);
  CHECK(json.at("x").get<double>() == doctest::Approx(100.0));
  CHECK(json.at("y").get<double>() == doctest::Approx(288.0));
  CHECK(json.at("value") == 100);
  CHECK_FALSE(json.contains("detail"));

  event.kind = tilerun::game::GameEventKind::StateChanged;
  event.value = 0;
  event.detail = "playing";
  json = nlohmann::json::parse(BuildEventLine("t0", event));
  CHECK(json.at("event") == "state_changed");
  CHECK(json.at("detail") == "playing");
  CHECK_FALSE(json.contains("value"));
}

TEST_CASE("GameEventName is distinct per kind") {
  CHECK(std::string(tilerun::game::GameEventName(tilerun::game::GameEventKind::LevelLoaded)) == "level_loaded");
  CHECK(std::string(tilerun::game::GameEventName(tilerun::game::GameEventKind::OneUp)) == "one_up");
  CHECK(std::string(tilerun::game::GameEventName(tilerun::game::GameEventKind::Victory)) == "victory");
}

TEST_CASE("NowUtcTimestamp uses ISO 8601 UTC") {
  const auto ts = NowUtcTimestamp();
  CHECK(std::regex_match(ts, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}
