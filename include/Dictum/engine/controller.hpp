#pragma once

#include <Dictum/core/config.hpp>
#include <Dictum/core/language.hpp>
#include <Dictum/engine/engine.hpp>
#include <Dictum/engine/events.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace dictum::engine {

struct language_info {
  std::string active;
  std::vector<std::string> available;
};

using engine_task = std::packaged_task<std::unique_ptr<speech_engine>(std::stop_token)>;

// Runs the listening task. Throws std::system_error when no thread can be
// created.
using task_launcher = std::function<std::jthread(engine_task)>;

std::jthread launch_thread(engine_task task);

// Lifecycle state machine over one speech_engine:
// initializing -> paused <-> listening -> stopped.
//
// Transitions are serialized by a mutex held for their whole duration,
// including the join of the listening task. While listening, the engine is
// owned by that task and comes back through the task's result on stop. If
// the task ends with an exception the engine is lost: an engine error event
// is broadcast, the controller returns to paused and start_listening()
// fails with errc::engine_lost from then on.
class controller {
public:
  controller(std::unique_ptr<speech_engine> engine,
    std::optional<std::filesystem::path> config_path,
    std::size_t event_capacity = default_event_capacity,
    task_launcher launch = &launch_thread);
  ~controller();

  controller(const controller&) = delete;
  controller& operator=(const controller&) = delete;

  controller_state state() const noexcept { return state_.load(); }

  subscription subscribe() { return bus_.subscribe(); }
  event_bus& events() noexcept { return bus_; }

  // initializing -> paused, then auto-start if the config asks for it.
  std::error_code mark_ready();
  std::error_code start_listening();
  std::error_code stop_listening();

  // Stops listening, moves to stopped and fires the shutdown signal once.
  void shutdown();

  // Valid once; completes when shutdown() runs.
  std::future<void> shutdown_signal();

  // Persists the language to the config file first; nothing changes if
  // that fails.
  std::error_code set_language(const std::string& language);
  language_info get_language_info() const;

  // Ownership hand-off for initialization outside the transition lock.
  std::unique_ptr<speech_engine> take_engine();
  void return_engine(std::unique_ptr<speech_engine> engine);

  // take_engine -> initialize (progress broadcast) -> return_engine, then
  // mark_ready() on success or a model_download error event on failure.
  // A stop request cancels a pending download; the engine is returned
  // uninitialized and no error event is sent.
  std::error_code initialize_engine(std::stop_token stop = {});

  bool engine_lost() const;

private:
  struct running_task {
    std::future<std::unique_ptr<speech_engine>> result;
    std::jthread thread;
  };

  std::error_code start_locked();
  std::error_code stop_locked();
  void set_state_locked(controller_state next);

  mutable std::mutex mutex_;
  std::atomic<controller_state> state_{controller_state::initializing};
  event_bus bus_;
  std::unique_ptr<speech_engine> engine_;
  std::optional<running_task> running_;
  task_launcher launch_;
  std::shared_ptr<language_cell> language_;
  config config_;
  std::optional<std::filesystem::path> config_path_;
  std::promise<void> shutdown_promise_;
  bool shutdown_fired_{false};
  bool shutdown_taken_{false};
  bool engine_lost_{false};
};

} // namespace dictum::engine
