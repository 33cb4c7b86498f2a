#pragma once

#include <Dictum/core/config.hpp>

#include <filesystem>
#include <optional>

namespace dictum::log {

// Environment variable that overrides the configured level ("debug", ...).
inline constexpr const char* level_env_var = "DICTUM_LOG";

// Installs the default "dictum" logger: stderr plus an optional log file.
// Returns false if the file sink could not be opened; stderr logging is
// still installed in that case.
bool init(const logging_config& cfg, const std::optional<std::filesystem::path>& file) noexcept;

log_level effective_level(const logging_config& cfg) noexcept;

} // namespace dictum::log
