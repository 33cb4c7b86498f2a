#include <Dictum/core/config.hpp>
#include <Dictum/core/error.hpp>

#include <array>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dictum {
namespace {

using json = nlohmann::json;

template <typename Enum, std::size_t N>
using name_table = std::array<std::pair<Enum, std::string_view>, N>;

constexpr name_table<speech_model, 10> speech_model_names{{
  {speech_model::whisper_tiny, "whisper-tiny"},
  {speech_model::whisper_tiny_en, "whisper-tiny-en"},
  {speech_model::whisper_base, "whisper-base"},
  {speech_model::whisper_base_en, "whisper-base-en"},
  {speech_model::whisper_small, "whisper-small"},
  {speech_model::whisper_small_en, "whisper-small-en"},
  {speech_model::whisper_medium, "whisper-medium"},
  {speech_model::whisper_medium_en, "whisper-medium-en"},
  {speech_model::whisper_large_v3, "whisper-large-v3"},
  {speech_model::whisper_large_v3_turbo, "whisper-large-v3-turbo"},
}};

constexpr name_table<latency_mode, 3> latency_mode_names{{
  {latency_mode::fast, "fast"},
  {latency_mode::balanced, "balanced"},
  {latency_mode::accurate, "accurate"},
}};

constexpr name_table<log_level, 5> log_level_names{{
  {log_level::trace, "trace"},
  {log_level::debug, "debug"},
  {log_level::info, "info"},
  {log_level::warn, "warn"},
  {log_level::error, "error"},
}};

constexpr name_table<initial_state, 2> initial_state_names{{
  {initial_state::paused, "paused"},
  {initial_state::listening, "listening"},
}};

template <typename Enum, std::size_t N>
std::string_view name_of(const name_table<Enum, N>& table, Enum value) noexcept {
  for (const auto& [entry, name] : table) {
    if (entry == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> value_of(const name_table<Enum, N>& table, std::string_view text) noexcept {
  for (const auto& [entry, name] : table) {
    if (name == text) {
      return entry;
    }
  }
  return std::nullopt;
}

// Reads an enum-valued key if present. Returns false on an unknown spelling.
template <typename Enum, typename Parser>
bool read_enum(const json& section, const char* key, Enum& out, Parser parse) {
  if (!section.contains(key)) {
    return true;
  }
  const auto text = section.at(key).get<std::string>();
  const auto parsed = parse(text);
  if (!parsed) {
    spdlog::error("config: unknown value '{}' for key '{}'", text, key);
    return false;
  }
  out = *parsed;
  return true;
}

template <typename T>
void read_value(const json& section, const char* key, T& out) {
  if (section.contains(key)) {
    out = section.at(key).get<T>();
  }
}

} // namespace

std::string_view to_string(speech_model model) noexcept { return name_of(speech_model_names, model); }
std::string_view to_string(latency_mode mode) noexcept { return name_of(latency_mode_names, mode); }
std::string_view to_string(log_level level) noexcept { return name_of(log_level_names, level); }
std::string_view to_string(initial_state state) noexcept { return name_of(initial_state_names, state); }

std::optional<speech_model> parse_speech_model(std::string_view text) noexcept {
  return value_of(speech_model_names, text);
}
std::optional<latency_mode> parse_latency_mode(std::string_view text) noexcept {
  return value_of(latency_mode_names, text);
}
std::optional<log_level> parse_log_level(std::string_view text) noexcept {
  return value_of(log_level_names, text);
}
std::optional<initial_state> parse_initial_state(std::string_view text) noexcept {
  return value_of(initial_state_names, text);
}

std::error_code config::parse(std::string_view text, config& out) {
  config parsed{};
  try {
    const json root = text.empty() ? json::object() : json::parse(std::string(text));
    if (!root.is_object()) {
      spdlog::error("config: top level must be an object");
      return errc::config_parse_failed;
    }

    const json empty = json::object();
    const auto section = [&](const char* name) -> const json& {
      return root.contains(name) ? root.at(name) : empty;
    };

    const json& model = section("model");
    if (!read_enum(model, "model", parsed.model.model, parse_speech_model)) {
      return errc::config_parse_failed;
    }
    read_value(model, "language", parsed.model.language);

    const json& latency = section("latency");
    if (!read_enum(latency, "mode", parsed.latency.mode, parse_latency_mode)) {
      return errc::config_parse_failed;
    }
    read_value(latency, "min_chunk_seconds", parsed.latency.min_chunk_seconds);

    read_value(section("injection"), "allowlist", parsed.injection.allowlist);

    if (!read_enum(section("logging"), "level", parsed.logging.level, parse_log_level)) {
      return errc::config_parse_failed;
    }

    read_value(section("gui"), "languages", parsed.gui.languages);

    if (!read_enum(section("daemon"), "initial_state", parsed.daemon.start_state, parse_initial_state)) {
      return errc::config_parse_failed;
    }
  } catch (const json::exception& e) {
    spdlog::error("config: invalid JSON: {}", e.what());
    return errc::config_parse_failed;
  }

  out = std::move(parsed);
  return {};
}

std::error_code config::load_from(const std::filesystem::path& path, config& out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    out = config{};
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::error("config: failed to read {}", path.string());
    return errc::io_error;
  }
  std::stringstream content;
  content << file.rdbuf();
  return parse(content.str(), out);
}

std::string config::dump() const {
  json root;
  root["model"] = {
    {"model", to_string(model.model)},
    {"language", model.language},
  };
  root["latency"] = {
    {"mode", to_string(latency.mode)},
    {"min_chunk_seconds", latency.min_chunk_seconds},
  };
  root["injection"] = json::object();
  if (!injection.allowlist.empty()) {
    root["injection"]["allowlist"] = injection.allowlist;
  }
  root["logging"] = {{"level", to_string(logging.level)}};
  root["gui"] = {{"languages", gui.languages}};
  root["daemon"] = {{"initial_state", to_string(daemon.start_state)}};
  return root.dump(2);
}

std::error_code config::save_to(const std::filesystem::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error("config: failed to create {}: {}", path.parent_path().string(), ec.message());
      return errc::io_error;
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    spdlog::error("config: failed to open {} for writing", path.string());
    return errc::io_error;
  }
  file << dump() << '\n';
  if (!file.good()) {
    return errc::io_error;
  }
  return {};
}

} // namespace dictum
