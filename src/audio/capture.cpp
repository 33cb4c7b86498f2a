#include <Dictum/audio/buffer.hpp>
#include <Dictum/audio/capture.hpp>
#include <Dictum/core/error.hpp>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <new>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <spdlog/spdlog.h>

namespace dictum::audio {

struct audio_capture::impl {
  impl() = default;
  ~impl() { release(); }

  impl(const impl&) = delete;
  impl& operator=(const impl&) = delete;
  impl(impl&&) = delete;
  impl& operator=(impl&&) = delete;

  std::error_code open() noexcept {
    release();

    if (ma_context_init(nullptr, 0, nullptr, &ctx_) != MA_SUCCESS) {
      spdlog::error("audio: failed to initialise audio context");
      return errc::no_input_device;
    }
    context_ready_ = true;

    ma_device_info* capture_infos = nullptr;
    ma_uint32 capture_count = 0;
    if (ma_context_get_devices(&ctx_, nullptr, nullptr, &capture_infos, &capture_count) != MA_SUCCESS ||
        capture_count == 0) {
      spdlog::error("audio: no input device available");
      release();
      return errc::no_input_device;
    }

    // Zero format, channels and rate select the device's native configuration.
    ma_device_config dcfg = ma_device_config_init(ma_device_type_capture);
    dcfg.capture.format = ma_format_unknown;
    dcfg.capture.channels = 0;
    dcfg.sampleRate = 0;
    dcfg.dataCallback = &impl::ma_capture_callback;
    dcfg.notificationCallback = &impl::ma_notification_callback;
    dcfg.pUserData = this;

    if (ma_device_init(&ctx_, &dcfg, &device_) != MA_SUCCESS) {
      spdlog::error("audio: failed to open default input device");
      release();
      return errc::no_input_device;
    }
    device_ready_ = true;

    format_ = device_.capture.format;
    channels_ = device_.capture.channels;
    if (format_ != ma_format_f32 && format_ != ma_format_s16) {
      spdlog::error("audio: unsupported sample format {}", ma_get_format_name(format_));
      release();
      return errc::unsupported_sample_format;
    }

    if (ma_device_start(&device_) != MA_SUCCESS) {
      spdlog::error("audio: failed to start audio stream");
      release();
      return errc::device_start_failed;
    }
    device_running_ = true;
    return {};
  }

  uint32_t sample_rate() const noexcept { return device_ready_ ? device_.sampleRate : 0; }
  uint32_t channels() const noexcept { return channels_; }

  bool drain(std::vector<float>& interleaved) {
    std::deque<std::vector<float>> pending;
    {
      const std::lock_guard<std::mutex> lock(queue_mutex_);
      pending.swap(queue_);
    }
    if (pending.empty()) {
      return false;
    }
    for (const auto& period : pending) {
      interleaved.insert(interleaved.end(), period.begin(), period.end());
    }
    return true;
  }

  void release() noexcept {
    if (device_ready_ && device_running_) {
      ma_device_stop(&device_);
      device_running_ = false;
    }
    if (device_ready_) {
      ma_device_uninit(&device_);
      device_ready_ = false;
    }
    if (context_ready_) {
      ma_context_uninit(&ctx_);
      context_ready_ = false;
    }
    const std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
    format_ = ma_format_unknown;
    channels_ = 0;
  }

private:
  static void ma_capture_callback(ma_device* device, void* output, const void* input, ma_uint32 frame_count) { // NOLINT(*-easily-swappable-parameters)
    static_cast<void>(output);
    if (device == nullptr || input == nullptr) {
      return;
    }
    auto* self = static_cast<impl*>(device->pUserData);
    if (self == nullptr) {
      return;
    }
    self->push_period(input, frame_count);
  }

  static void ma_notification_callback(const ma_device_notification* notification) {
    if (notification == nullptr) {
      return;
    }
    switch (notification->type) {
    case ma_device_notification_type_stopped:
      spdlog::warn("audio: input stream stopped by the backend");
      break;
    case ma_device_notification_type_rerouted:
      spdlog::info("audio: input stream rerouted");
      break;
    case ma_device_notification_type_interruption_began:
      spdlog::warn("audio: input stream interrupted");
      break;
    case ma_device_notification_type_interruption_ended:
      spdlog::info("audio: input stream interruption ended");
      break;
    default:
      break;
    }
  }

  void push_period(const void* input, ma_uint32 frame_count) noexcept {
    const std::size_t count = static_cast<std::size_t>(frame_count) * channels_;
    try {
      std::vector<float> period(count);
      if (format_ == ma_format_f32) {
        const std::span<const float> src(static_cast<const float*>(input), count);
        std::copy(src.begin(), src.end(), period.begin());
      } else {
        const std::span<const int16_t> src(static_cast<const int16_t*>(input), count);
        for (std::size_t i = 0; i < count; ++i) {
          period[i] = static_cast<float>(src[i]) / 32768.0F;
        }
      }
      const std::lock_guard<std::mutex> lock(queue_mutex_);
      queue_.push_back(std::move(period));
    } catch (const std::bad_alloc&) {
      spdlog::error("audio: out of memory, dropping {} frames", frame_count);
    } catch (const std::system_error& e) {
      spdlog::error("audio: dropping {} frames: {}", frame_count, e.what());
    }
  }

  ma_context ctx_{};
  ma_device device_{};
  ma_format format_{ma_format_unknown};
  ma_uint32 channels_{0};
  bool context_ready_{false};
  bool device_ready_{false};
  bool device_running_{false};

  std::mutex queue_mutex_;
  std::deque<std::vector<float>> queue_;
};

audio_capture::audio_capture() = default;
audio_capture::~audio_capture() { stop(); }

audio_capture::audio_capture(audio_capture&& other) noexcept
  : pimpl_(std::move(other.pimpl_)),
    sample_rate_(other.sample_rate_),
    channels_(other.channels_),
    started_(other.started_) {
  other.sample_rate_ = 0;
  other.channels_ = 0;
  other.started_ = false;
}

audio_capture& audio_capture::operator=(audio_capture&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  stop();

  pimpl_ = std::move(other.pimpl_);
  sample_rate_ = other.sample_rate_;
  channels_ = other.channels_;
  started_ = other.started_;

  other.sample_rate_ = 0;
  other.channels_ = 0;
  other.started_ = false;

  return *this;
}

std::error_code audio_capture::start() noexcept {
  if (started_) {
    return {};
  }

  if (!pimpl_) {
    try {
      pimpl_ = std::make_unique<impl>();
    } catch (const std::bad_alloc&) {
      return errc::device_start_failed;
    }
  }

  if (const auto ec = pimpl_->open()) {
    return ec;
  }

  sample_rate_ = pimpl_->sample_rate();
  channels_ = pimpl_->channels();
  started_ = true;
  spdlog::info("audio: capture started at {} Hz, {} channel(s)", sample_rate_, channels_);
  return {};
}

bool audio_capture::try_recv(std::vector<float>& mono) noexcept {
  if (!started_ || !pimpl_) {
    return false;
  }

  try {
    std::vector<float> interleaved;
    if (!pimpl_->drain(interleaved)) {
      return false;
    }
    mono = to_mono(interleaved, channels_);
    return !mono.empty();
  } catch (const std::bad_alloc&) {
    spdlog::error("audio: out of memory while draining capture queue");
    return false;
  }
}

void audio_capture::stop() noexcept {
  if (!started_) {
    return;
  }
  if (pimpl_) {
    pimpl_->release();
  }
  started_ = false;
  spdlog::info("audio: capture stopped");
}

} // namespace dictum::audio
