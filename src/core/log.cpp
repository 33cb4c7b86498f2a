#include <Dictum/core/log.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dictum::log {
namespace {

spdlog::level::level_enum to_spdlog(log_level level) noexcept {
  switch (level) {
  case log_level::trace:
    return spdlog::level::trace;
  case log_level::debug:
    return spdlog::level::debug;
  case log_level::info:
    return spdlog::level::info;
  case log_level::warn:
    return spdlog::level::warn;
  case log_level::error:
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

} // namespace

log_level effective_level(const logging_config& cfg) noexcept {
  const char* env = std::getenv(level_env_var); // NOLINT(concurrency-mt-unsafe)
  if (env != nullptr) {
    if (const auto parsed = parse_log_level(env)) {
      return *parsed;
    }
  }
  return cfg.level;
}

bool init(const logging_config& cfg, const std::optional<std::filesystem::path>& file) noexcept {
  std::string file_error;
  try {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (file) {
      try {
        std::filesystem::create_directories(file->parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file->string()));
      } catch (const std::exception& e) {
        file_error = e.what();
      }
    }

    auto logger = std::make_shared<spdlog::logger>("dictum", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog(effective_level(cfg)));
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
  } catch (const std::exception&) {
    return false;
  }

  if (!file_error.empty()) {
    spdlog::warn("failed to open log file {}: {}", file->string(), file_error);
    return false;
  }
  return true;
}

} // namespace dictum::log
