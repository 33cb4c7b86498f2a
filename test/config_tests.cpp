// SPDX-License-Identifier: UNLICENSED
#include "fakes.hpp"

#include <Dictum/core/config.hpp>
#include <Dictum/core/dirs.hpp>
#include <Dictum/core/error.hpp>
#include <Dictum/core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using dictum::config;

TEST_CASE("empty config yields defaults", "[config]") {
  config cfg;
  cfg.model.language = "xx";
  REQUIRE_FALSE(config::parse("{}", cfg));
  REQUIRE(cfg == config{});
  REQUIRE(cfg.model.model == dictum::speech_model::whisper_base);
  REQUIRE(cfg.model.language == "auto");
  REQUIRE(cfg.latency.mode == dictum::latency_mode::balanced);
  REQUIRE(cfg.latency.min_chunk_seconds == 1.0F);
  REQUIRE(cfg.injection.allowlist.empty());
  REQUIRE(cfg.logging.level == dictum::log_level::info);
  REQUIRE(cfg.daemon.start_state == dictum::initial_state::paused);
}

TEST_CASE("partial config keeps defaults for missing keys", "[config]") {
  config cfg;
  REQUIRE_FALSE(config::parse(R"({"model": {"model": "whisper-large-v3-turbo"}, "gui": {"languages": ["en", "pl"]}})", cfg));
  REQUIRE(cfg.model.model == dictum::speech_model::whisper_large_v3_turbo);
  REQUIRE(cfg.model.language == "auto");
  REQUIRE(cfg.gui.languages == std::vector<std::string>{"en", "pl"});
  REQUIRE(cfg.logging.level == dictum::log_level::info);
}

TEST_CASE("unknown enum spellings and malformed json are rejected", "[config]") {
  config cfg;
  cfg.model.language = "kept";
  REQUIRE(config::parse(R"({"model": {"model": "whisper-gigantic"}})", cfg) == dictum::errc::config_parse_failed);
  REQUIRE(config::parse(R"({"latency": {"mode": "instant"}})", cfg) == dictum::errc::config_parse_failed);
  REQUIRE(config::parse(R"({"daemon": {"initial_state": "asleep"}})", cfg) == dictum::errc::config_parse_failed);
  REQUIRE(config::parse("{ not json", cfg) == dictum::errc::config_parse_failed);
  REQUIRE(config::parse("[1, 2]", cfg) == dictum::errc::config_parse_failed);
  REQUIRE(cfg.model.language == "kept");
}

TEST_CASE("config survives a save and load", "[config]") {
  dictum::test::scoped_temp_dir dir("config");
  const auto path = dir.path() / "nested" / "config.json";

  config cfg;
  cfg.model.model = dictum::speech_model::whisper_small_en;
  cfg.model.language = "en";
  cfg.latency.mode = dictum::latency_mode::accurate;
  cfg.latency.min_chunk_seconds = 2.5F;
  cfg.injection.allowlist = {"kitty", "firefox"};
  cfg.logging.level = dictum::log_level::debug;
  cfg.gui.languages = {"en", "fr"};
  cfg.daemon.start_state = dictum::initial_state::listening;
  REQUIRE_FALSE(cfg.save_to(path));

  config loaded;
  REQUIRE_FALSE(config::load_from(path, loaded));
  REQUIRE(loaded == cfg);
}

TEST_CASE("empty allowlist is omitted from the saved file", "[config]") {
  const config cfg;
  REQUIRE(cfg.dump().find("allowlist") == std::string::npos);
}

TEST_CASE("missing config file yields defaults", "[config]") {
  config cfg;
  cfg.model.language = "xx";
  REQUIRE_FALSE(config::load_from("/nonexistent/dictum/config.json", cfg));
  REQUIRE(cfg == config{});
}

TEST_CASE("enum spellings are kebab case", "[config]") {
  REQUIRE(dictum::to_string(dictum::speech_model::whisper_tiny_en) == "whisper-tiny-en");
  REQUIRE(dictum::to_string(dictum::speech_model::whisper_large_v3) == "whisper-large-v3");
  REQUIRE(dictum::parse_speech_model("whisper-medium-en") == dictum::speech_model::whisper_medium_en);
  REQUIRE_FALSE(dictum::parse_speech_model("whisper_medium_en").has_value());
  REQUIRE(dictum::parse_log_level("warn") == dictum::log_level::warn);
  REQUIRE(dictum::parse_latency_mode("fast") == dictum::latency_mode::fast);
  REQUIRE(dictum::parse_initial_state("listening") == dictum::initial_state::listening);
}

TEST_CASE("xdg directories carry the dictum prefix", "[config]") {
  const auto dir = dictum::dirs::config_dir();
  if (!dir) {
    SKIP("neither XDG_CONFIG_HOME nor HOME is set");
  }
  REQUIRE(dir->filename() == "dictum");
  REQUIRE(dictum::dirs::config_path()->filename() == "config.json");
  REQUIRE(dictum::dirs::models_dir()->filename() == "models");
  REQUIRE(dictum::dirs::pid_path()->filename() == "daemon.pid");
  REQUIRE(dictum::dirs::log_path()->filename() == "daemon.log");
}

TEST_CASE("logging initializes with and without a file", "[config]") {
  dictum::test::scoped_temp_dir dir("log");
  const dictum::logging_config cfg{dictum::log_level::warn};
  REQUIRE(dictum::log::init(cfg, dir.path() / "state" / "daemon.log"));
  REQUIRE(dictum::log::init(cfg, std::nullopt));
}

TEST_CASE("logging reports an unusable log file without throwing", "[config]") {
  dictum::test::scoped_temp_dir dir("log");
  const auto blocker = dir.path() / "not-a-dir";
  { std::ofstream out(blocker); }
  const dictum::logging_config cfg{dictum::log_level::warn};
  STATIC_REQUIRE(noexcept(dictum::log::init(cfg, std::nullopt)));
  REQUIRE_FALSE(dictum::log::init(cfg, blocker / "daemon.log"));
  REQUIRE(dictum::log::init(cfg, std::nullopt));
}
