#pragma once

#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

namespace dictum::audio {

// Native-rate mono audio source drained by the engine run-loop.
class capture_source {
public:
  virtual ~capture_source() = default;

  virtual std::error_code start() noexcept = 0;

  // Moves everything buffered since the last call into `mono`, downmixed.
  // Returns false when nothing was buffered.
  virtual bool try_recv(std::vector<float>& mono) noexcept = 0;

  virtual void stop() noexcept = 0;

  virtual uint32_t sample_rate() const noexcept = 0;
};

// Default input device at its native rate and channel count. The device
// callback thread pushes every period into an unbounded queue, so audio that
// arrives while the consumer is busy is kept, not dropped.
class audio_capture final : public capture_source {
public:
  audio_capture();
  ~audio_capture() override;

  audio_capture(const audio_capture&) = delete;
  audio_capture& operator=(const audio_capture&) = delete;
  audio_capture(audio_capture&&) noexcept;
  audio_capture& operator=(audio_capture&&) noexcept;

  std::error_code start() noexcept override;
  bool try_recv(std::vector<float>& mono) noexcept override;
  void stop() noexcept override;

  uint32_t sample_rate() const noexcept override { return sample_rate_; }
  uint32_t channels() const noexcept { return channels_; }
  bool is_started() const noexcept { return started_; }

private:
  struct impl;
  std::unique_ptr<impl> pimpl_{};
  uint32_t sample_rate_{0};
  uint32_t channels_{0};
  bool started_{false};
};

} // namespace dictum::audio
