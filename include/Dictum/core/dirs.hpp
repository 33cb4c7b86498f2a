#pragma once

#include <filesystem>
#include <optional>

namespace dictum::dirs {

// XDG base directories with the "dictum" prefix. Empty when neither the XDG
// variable nor $HOME is set.
std::optional<std::filesystem::path> config_dir();
std::optional<std::filesystem::path> data_dir();
std::optional<std::filesystem::path> state_dir();

std::optional<std::filesystem::path> config_path(); // config_dir()/config.json
std::optional<std::filesystem::path> models_dir();  // data_dir()/models
std::optional<std::filesystem::path> pid_path();    // state_dir()/daemon.pid
std::optional<std::filesystem::path> log_path();    // state_dir()/daemon.log

} // namespace dictum::dirs
