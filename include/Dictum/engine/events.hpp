#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace dictum::engine {

enum class controller_state { initializing, paused, listening, stopped };

std::string_view to_string(controller_state state) noexcept;

struct state_change {
  controller_state state{controller_state::initializing};
};

struct transcription {
  std::string text;
  float confidence{0.0F}; // whisper reports none
  bool is_partial{false};
};

enum class init_stage { downloading, loading, ready };

struct init_progress {
  init_stage stage{init_stage::loading};
  std::string model; // empty for ready
  uint64_t bytes{0};
  uint64_t total{0};
};

enum class error_kind { engine, model_download, audio_device, unknown };

std::string_view to_string(init_stage stage) noexcept;
std::string_view to_string(error_kind kind) noexcept;

struct daemon_error {
  error_kind kind{error_kind::unknown};
  std::string message;
  std::string model_name;
};

using event = std::variant<state_change, transcription, init_progress, daemon_error>;

// One-line rendering for logs.
std::string describe(const event& ev);

inline constexpr std::size_t default_event_capacity = 256;

class event_bus;

// Receiving end of one subscriber. Events arrive in publish order; when the
// queue is full the oldest event is dropped and counted in lagged().
class subscription {
public:
  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;
  subscription(subscription&&) noexcept = default;
  subscription& operator=(subscription&&) noexcept = default;
  ~subscription() = default;

  // Waits up to `timeout` for the next event. A moved-from subscription
  // receives nothing and reports zero lag.
  bool recv(std::chrono::milliseconds timeout, event& out);
  bool try_recv(event& out);

  uint64_t lagged() const;
  std::size_t pending() const;

private:
  friend class event_bus;
  struct channel;
  explicit subscription(std::shared_ptr<channel> ch) : channel_(std::move(ch)) {}

  std::shared_ptr<channel> channel_;
};

// Multi-producer broadcast with a bounded queue per subscriber. publish()
// never blocks on a slow consumer.
class event_bus {
public:
  explicit event_bus(std::size_t capacity = default_event_capacity);
  ~event_bus();

  event_bus(const event_bus&) = delete;
  event_bus& operator=(const event_bus&) = delete;

  subscription subscribe();
  void publish(const event& ev);

  std::size_t subscriber_count() const;
  std::size_t capacity() const noexcept { return capacity_; }

private:
  struct impl;
  std::unique_ptr<impl> pimpl_{};
  std::size_t capacity_;
};

} // namespace dictum::engine
