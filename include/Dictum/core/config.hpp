#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dictum {

enum class speech_model {
  whisper_tiny,
  whisper_tiny_en,
  whisper_base,
  whisper_base_en,
  whisper_small,
  whisper_small_en,
  whisper_medium,
  whisper_medium_en,
  whisper_large_v3,
  whisper_large_v3_turbo,
};

enum class latency_mode { fast, balanced, accurate };

enum class log_level { trace, debug, info, warn, error };

enum class initial_state { paused, listening };

// Kebab-case spellings used in the config file ("whisper-base-en").
std::string_view to_string(speech_model model) noexcept;
std::string_view to_string(latency_mode mode) noexcept;
std::string_view to_string(log_level level) noexcept;
std::string_view to_string(initial_state state) noexcept;

std::optional<speech_model> parse_speech_model(std::string_view text) noexcept;
std::optional<latency_mode> parse_latency_mode(std::string_view text) noexcept;
std::optional<log_level> parse_log_level(std::string_view text) noexcept;
std::optional<initial_state> parse_initial_state(std::string_view text) noexcept;

struct model_config {
  speech_model model{speech_model::whisper_base};
  std::string language{"auto"}; // "auto" selects language detection

  bool operator==(const model_config&) const = default;
};

struct latency_config {
  latency_mode mode{latency_mode::balanced};
  float min_chunk_seconds{1.0F};

  bool operator==(const latency_config&) const = default;
};

struct injection_config {
  std::vector<std::string> allowlist; // empty injects into every application

  bool operator==(const injection_config&) const = default;
};

struct logging_config {
  log_level level{log_level::info};

  bool operator==(const logging_config&) const = default;
};

struct gui_config {
  std::vector<std::string> languages;

  bool operator==(const gui_config&) const = default;
};

struct daemon_config {
  initial_state start_state{initial_state::paused};

  bool operator==(const daemon_config&) const = default;
};

struct config {
  model_config model{};
  latency_config latency{};
  injection_config injection{};
  logging_config logging{};
  gui_config gui{};
  daemon_config daemon{};

  bool operator==(const config&) const = default;

  // Missing keys keep their defaults; unknown enum spellings are errors.
  static std::error_code parse(std::string_view text, config& out);

  // A missing file yields the defaults.
  static std::error_code load_from(const std::filesystem::path& path, config& out);

  std::string dump() const;
  std::error_code save_to(const std::filesystem::path& path) const;
};

} // namespace dictum
