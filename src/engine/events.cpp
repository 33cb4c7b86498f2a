#include <Dictum/engine/events.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace dictum::engine {

std::string_view to_string(controller_state state) noexcept {
  switch (state) {
  case controller_state::initializing:
    return "initializing";
  case controller_state::paused:
    return "paused";
  case controller_state::listening:
    return "listening";
  case controller_state::stopped:
    return "stopped";
  }
  return "unknown";
}

std::string_view to_string(init_stage stage) noexcept {
  switch (stage) {
  case init_stage::downloading:
    return "downloading";
  case init_stage::loading:
    return "loading";
  case init_stage::ready:
    return "ready";
  }
  return "unknown";
}

std::string_view to_string(error_kind kind) noexcept {
  switch (kind) {
  case error_kind::engine:
    return "engine";
  case error_kind::model_download:
    return "model_download";
  case error_kind::audio_device:
    return "audio_device";
  case error_kind::unknown:
    return "unknown";
  }
  return "unknown";
}

std::string describe(const event& ev) {
  return std::visit(
    [](const auto& e) -> std::string {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, state_change>) {
        return fmt::format("state_change state={}", to_string(e.state));
      } else if constexpr (std::is_same_v<T, transcription>) {
        return fmt::format("transcription text=\"{}\" confidence={:.2f} partial={}", e.text, e.confidence, e.is_partial);
      } else if constexpr (std::is_same_v<T, init_progress>) {
        return fmt::format("init_progress stage={} model={} bytes={}/{}", to_string(e.stage), e.model, e.bytes, e.total);
      } else {
        return fmt::format("daemon_error kind={} model={} message=\"{}\"", to_string(e.kind), e.model_name, e.message);
      }
    },
    ev);
}

struct subscription::channel {
  explicit channel(std::size_t cap) : capacity(cap) {}

  void push(const event& ev) {
    {
      const std::lock_guard<std::mutex> lock(mutex);
      if (queue.size() >= capacity) {
        queue.pop_front();
        ++lagged;
      }
      queue.push_back(ev);
    }
    cv.notify_one();
  }

  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<event> queue;
  std::size_t capacity;
  uint64_t lagged{0};
};

bool subscription::recv(std::chrono::milliseconds timeout, event& out) {
  if (!channel_) {
    return false;
  }
  std::unique_lock<std::mutex> lock(channel_->mutex);
  if (!channel_->cv.wait_for(lock, timeout, [&] { return !channel_->queue.empty(); })) {
    return false;
  }
  out = std::move(channel_->queue.front());
  channel_->queue.pop_front();
  return true;
}

bool subscription::try_recv(event& out) {
  if (!channel_) {
    return false;
  }
  const std::lock_guard<std::mutex> lock(channel_->mutex);
  if (channel_->queue.empty()) {
    return false;
  }
  out = std::move(channel_->queue.front());
  channel_->queue.pop_front();
  return true;
}

uint64_t subscription::lagged() const {
  if (!channel_) {
    return 0;
  }
  const std::lock_guard<std::mutex> lock(channel_->mutex);
  return channel_->lagged;
}

std::size_t subscription::pending() const {
  if (!channel_) {
    return 0;
  }
  const std::lock_guard<std::mutex> lock(channel_->mutex);
  return channel_->queue.size();
}

struct event_bus::impl {
  mutable std::mutex mutex;
  std::vector<std::weak_ptr<subscription::channel>> channels;
};

event_bus::event_bus(std::size_t capacity)
  : pimpl_(std::make_unique<impl>()), capacity_((std::max)(capacity, std::size_t{1})) {}

event_bus::~event_bus() = default;

subscription event_bus::subscribe() {
  auto ch = std::make_shared<subscription::channel>(capacity_);
  {
    const std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->channels.push_back(ch);
  }
  return subscription(std::move(ch));
}

void event_bus::publish(const event& ev) {
  const std::lock_guard<std::mutex> lock(pimpl_->mutex);
  auto& channels = pimpl_->channels;
  channels.erase(std::remove_if(channels.begin(), channels.end(), [&](const auto& weak) {
    const auto ch = weak.lock();
    if (!ch) {
      return true;
    }
    ch->push(ev);
    return false;
  }),
    channels.end());
}

std::size_t event_bus::subscriber_count() const {
  const std::lock_guard<std::mutex> lock(pimpl_->mutex);
  return static_cast<std::size_t>(std::count_if(pimpl_->channels.begin(),
    pimpl_->channels.end(),
    [](const auto& weak) { return !weak.expired(); }));
}

} // namespace dictum::engine
