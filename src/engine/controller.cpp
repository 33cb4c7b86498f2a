#include <Dictum/core/error.hpp>
#include <Dictum/engine/controller.hpp>

#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace dictum::engine {
namespace {

error_kind classify(const std::error_code& ec) noexcept {
  if (ec == errc::no_input_device || ec == errc::unsupported_sample_format || ec == errc::device_start_failed) {
    return error_kind::audio_device;
  }
  return error_kind::engine;
}

} // namespace

std::jthread launch_thread(engine_task task) { return std::jthread(std::move(task)); }

controller::controller(std::unique_ptr<speech_engine> engine,
  std::optional<std::filesystem::path> config_path,
  std::size_t event_capacity,
  task_launcher launch)
  : bus_(event_capacity), engine_(std::move(engine)), launch_(std::move(launch)),
    config_path_(std::move(config_path)) {
  if (!engine_) {
    throw std::invalid_argument("controller requires an engine");
  }
  if (!launch_) {
    launch_ = &launch_thread;
  }
  language_ = engine_->language();
  config_ = engine_->cfg();
}

controller::~controller() { shutdown(); }

void controller::set_state_locked(controller_state next) {
  if (state_.load() == next) {
    return;
  }
  state_.store(next);
  spdlog::info("controller: state -> {}", to_string(next));
  bus_.publish(state_change{next});
}

std::error_code controller::mark_ready() {
  const std::lock_guard<std::mutex> lock(mutex_);
  switch (state_.load()) {
  case controller_state::initializing:
    break;
  case controller_state::stopped:
    return errc::daemon_stopped;
  case controller_state::paused:
  case controller_state::listening:
    return {};
  }

  set_state_locked(controller_state::paused);
  if (config_.daemon.start_state == initial_state::listening) {
    if (const auto ec = start_locked()) {
      spdlog::warn("controller: auto-start failed: {}", ec.message());
    }
  }
  return {};
}

std::error_code controller::start_listening() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return start_locked();
}

std::error_code controller::start_locked() {
  switch (state_.load()) {
  case controller_state::listening:
    return {};
  case controller_state::initializing:
    return errc::daemon_initializing;
  case controller_state::stopped:
    return errc::daemon_stopped;
  case controller_state::paused:
    break;
  }

  if (engine_lost_) {
    return errc::engine_lost;
  }
  if (!engine_ || !engine_->is_initialized()) {
    return errc::engine_unavailable;
  }

  // The slot keeps the engine reachable if the thread never starts.
  auto slot = std::make_shared<std::unique_ptr<speech_engine>>(std::move(engine_));
  engine_task task([this, slot](std::stop_token stop) {
    auto engine = std::move(*slot);
    const auto ec = engine->run_loop(stop, [this](const std::string& text) {
      bus_.publish(transcription{text, 0.0F, false});
    });
    if (ec) {
      spdlog::error("controller: engine loop ended: {}", ec.message());
      bus_.publish(daemon_error{classify(ec), ec.message(), {}});
    }
    return engine;
  });

  running_task running{task.get_future(), {}};
  try {
    running.thread = launch_(std::move(task));
  } catch (const std::system_error& e) {
    engine_ = std::move(*slot);
    spdlog::error("controller: cannot start engine task: {}", e.what());
    return e.code();
  }
  running_.emplace(std::move(running));

  set_state_locked(controller_state::listening);
  return {};
}

std::error_code controller::stop_listening() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return stop_locked();
}

std::error_code controller::stop_locked() {
  switch (state_.load()) {
  case controller_state::paused:
    return {};
  case controller_state::initializing:
    return errc::daemon_initializing;
  case controller_state::stopped:
    return errc::daemon_stopped;
  case controller_state::listening:
    break;
  }

  if (running_) {
    running_->thread.request_stop();
    running_->thread.join();
    try {
      engine_ = running_->result.get();
    } catch (const std::exception& e) {
      engine_lost_ = true;
      spdlog::error("controller: engine task failed, engine lost: {}", e.what());
      bus_.publish(daemon_error{error_kind::engine,
        std::string("engine lost, restart the daemon: ") + e.what(),
        {}});
    }
    running_.reset();
  }

  set_state_locked(controller_state::paused);
  return {};
}

void controller::shutdown() {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load() == controller_state::listening) {
    if (const auto ec = stop_locked()) {
      spdlog::warn("controller: stop during shutdown failed: {}", ec.message());
    }
  }
  set_state_locked(controller_state::stopped);
  if (!shutdown_fired_) {
    shutdown_fired_ = true;
    shutdown_promise_.set_value();
  }
}

std::future<void> controller::shutdown_signal() {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (shutdown_taken_) {
    return {};
  }
  shutdown_taken_ = true;
  return shutdown_promise_.get_future();
}

std::error_code controller::set_language(const std::string& language) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (language.empty()) {
    return errc::invalid_argument;
  }
  if (config_path_) {
    config updated = config_;
    updated.model.language = language;
    if (const auto ec = updated.save_to(*config_path_)) {
      spdlog::error("controller: failed to persist language: {}", ec.message());
      return ec;
    }
  }
  config_.model.language = language;
  language_->set(language);
  spdlog::info("controller: language -> {}", language);
  return {};
}

language_info controller::get_language_info() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return {language_->get(), config_.gui.languages};
}

std::unique_ptr<speech_engine> controller::take_engine() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return std::move(engine_);
}

void controller::return_engine(std::unique_ptr<speech_engine> engine) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (!engine_) {
    engine_ = std::move(engine);
  }
}

std::error_code controller::initialize_engine(std::stop_token stop) {
  auto engine = take_engine();
  if (!engine) {
    return errc::engine_unavailable;
  }

  std::string current_model;
  const auto ec = engine->initialize([&](const init_progress& progress) {
    if (!progress.model.empty()) {
      current_model = progress.model;
    }
    bus_.publish(progress);
  }, stop);
  return_engine(std::move(engine));

  if (ec == errc::cancelled) {
    spdlog::info("controller: engine initialization cancelled");
    return ec;
  }
  if (ec) {
    spdlog::error("controller: engine initialization failed ({}): {}", current_model, ec.message());
    bus_.publish(daemon_error{error_kind::model_download, ec.message(), current_model});
    return ec;
  }
  return mark_ready();
}

bool controller::engine_lost() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return engine_lost_;
}

} // namespace dictum::engine
