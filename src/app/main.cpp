#include <Dictum/core/config.hpp>
#include <Dictum/core/dirs.hpp>
#include <Dictum/core/log.hpp>
#include <Dictum/engine/controller.hpp>
#include <Dictum/engine/engine.hpp>
#include <Dictum/engine/events.hpp>
#include <Dictum/models/model_manager.hpp>
#include <internal_use_only/config.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

using std::string;
using std::string_view;
using namespace std::chrono_literals;

static bool has_flag(std::span<char*> args, string_view flag1, string_view flag2) {
  auto first = args.begin();
  if (first != args.end()) { ++first; }
  return std::any_of(first, args.end(), [&](const char* arg_ptr) {
    const string_view arg_sv{arg_ptr != nullptr ? arg_ptr : ""};
    return (arg_sv == flag1 || arg_sv == flag2);
  });
}

static std::optional<string> option_value(std::span<char*> args, string_view name) {
  for (size_t i = 1; i + 1 < args.size(); ++i) {
    const string_view arg_sv{args[i] != nullptr ? args[i] : ""};
    if (arg_sv == name && args[i + 1] != nullptr) {
      return string(args[i + 1]);
    }
  }
  return std::nullopt;
}

static bool write_pid_file(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    spdlog::error("cannot create {}: {}", path.parent_path().string(), ec.message());
    return false;
  }
  std::ofstream out(path, std::ios::trunc);
  out << ::getpid() << '\n';
  if (!out) {
    spdlog::error("cannot write pid file {}", path.string());
    return false;
  }
  return true;
}

static int run_daemon(const std::optional<std::filesystem::path>& config_path) {
  dictum::config cfg{};
  if (config_path) {
    if (const auto ec = dictum::config::load_from(*config_path, cfg)) {
      std::cerr << "Failed to load config " << config_path->string() << ": " << ec.message() << '\n';
      return EXIT_FAILURE;
    }
  }

  if (!dictum::log::init(cfg.logging, dictum::dirs::log_path())) {
    spdlog::warn("continuing with stderr logging only");
  }
  spdlog::info("{} {} starting", dictum::cmake::project_name, dictum::cmake::project_version);

  const auto models_dir = dictum::dirs::models_dir();
  const auto pid_path = dictum::dirs::pid_path();
  if (!models_dir || !pid_path) {
    spdlog::error("cannot determine data directories (HOME not set?)");
    return EXIT_FAILURE;
  }
  if (!write_pid_file(*pid_path)) {
    return EXIT_FAILURE;
  }

  // Block before any thread starts so only the waiter sees the signals.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  auto models = std::make_shared<dictum::models::model_manager>(*models_dir);
  auto engine = std::make_unique<dictum::engine::speech_engine>(cfg, models);
  dictum::engine::controller ctl(std::move(engine), config_path);
  auto stopped = ctl.shutdown_signal();
  auto events = ctl.subscribe();

  const std::jthread event_logger([&events](const std::stop_token& stop) {
    dictum::engine::event ev;
    while (!stop.stop_requested()) {
      if (events.recv(100ms, ev)) {
        spdlog::info("event: {}", dictum::engine::describe(ev));
      }
    }
  });

  const std::jthread signal_waiter([&ctl, &signals] {
    int sig = 0;
    if (sigwait(&signals, &sig) == 0) {
      spdlog::info("received signal {}, shutting down", sig);
    }
    ctl.shutdown();
  });

  // Declared last so it is stopped and joined first; the stop request aborts
  // a model download in progress.
  const std::jthread initializer([&ctl](const std::stop_token& stop) {
    if (const auto ec = ctl.initialize_engine(stop)) {
      spdlog::error("engine initialization failed: {}", ec.message());
    }
  });

  stopped.wait();

  std::error_code ec;
  std::filesystem::remove(*pid_path, ec);
  spdlog::info("shutdown complete");
  return EXIT_SUCCESS;
}

int main(int argc, char** argv) noexcept
{
  try {
    const std::span<char*> args(argv, static_cast<size_t>(argc));
    if (has_flag(args, "--version", "-v")) {
      std::cout << dictum::cmake::project_version << '\n';
      return EXIT_SUCCESS;
    }
    if (has_flag(args, "--help", "-h")) {
      std::cout << "dictumd: offline voice dictation daemon\n";
      std::cout << "Usage: dictumd [--help] [--version] [--config <path>]\n";
      return EXIT_SUCCESS;
    }
    std::optional<std::filesystem::path> config_path = dictum::dirs::config_path();
    if (auto value = option_value(args, "--config")) {
      config_path = std::filesystem::path(*value);
    }
    return run_daemon(config_path);
  } catch (const std::exception& e) {
    std::cerr << "dictumd: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
