#include <Dictum/core/dirs.hpp>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string_view>

namespace dictum::dirs {
namespace {

constexpr std::string_view app_name{"dictum"};

std::optional<std::filesystem::path> xdg_home(const char* variable, const char* home_fallback) {
  const char* xdg = std::getenv(variable); // NOLINT(concurrency-mt-unsafe)
  if (xdg != nullptr && *xdg != '\0') {
    return std::filesystem::path(xdg) / app_name;
  }
  const char* home = std::getenv("HOME"); // NOLINT(concurrency-mt-unsafe)
  if (home == nullptr || *home == '\0') {
    return std::nullopt;
  }
  return std::filesystem::path(home) / home_fallback / app_name;
}

std::optional<std::filesystem::path> child(const std::optional<std::filesystem::path>& dir, const char* name) {
  if (!dir) {
    return std::nullopt;
  }
  return *dir / name;
}

} // namespace

std::optional<std::filesystem::path> config_dir() { return xdg_home("XDG_CONFIG_HOME", ".config"); }

std::optional<std::filesystem::path> data_dir() { return xdg_home("XDG_DATA_HOME", ".local/share"); }

std::optional<std::filesystem::path> state_dir() { return xdg_home("XDG_STATE_HOME", ".local/state"); }

std::optional<std::filesystem::path> config_path() { return child(config_dir(), "config.json"); }

std::optional<std::filesystem::path> models_dir() { return child(data_dir(), "models"); }

std::optional<std::filesystem::path> pid_path() { return child(state_dir(), "daemon.pid"); }

std::optional<std::filesystem::path> log_path() { return child(state_dir(), "daemon.log"); }

} // namespace dictum::dirs
