#pragma once

#include <Dictum/vad/state_machine.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace dictum::vad {

inline constexpr uint32_t vad_sample_rate = 16000;

// Samples of the previous chunk prepended to each inference input at 16 kHz.
inline constexpr std::size_t context_size = 64;

// Recurrent state shape (2, 1, 128).
inline constexpr std::size_t state_size = 2 * 1 * 128;

inline constexpr std::array<std::size_t, 3> supported_chunk_sizes{512, 1024, 1536};
inline constexpr std::size_t default_chunk_size = 512;

// One streaming inference step of a recurrent speech classifier.
class vad_model {
public:
  virtual ~vad_model() = default;

  // `input` is context_size + chunk samples, `state` is state_size floats.
  // On success writes the speech probability and the next recurrent state.
  virtual std::error_code infer(std::span<const float> input,
    std::span<const float> state,
    float& probability,
    std::vector<float>& next_state) noexcept = 0;
};

class voice_activity_detector {
public:
  voice_activity_detector() = default;

  voice_activity_detector(const voice_activity_detector&) = delete;
  voice_activity_detector& operator=(const voice_activity_detector&) = delete;
  voice_activity_detector(voice_activity_detector&&) noexcept = default;
  voice_activity_detector& operator=(voice_activity_detector&&) noexcept = default;
  ~voice_activity_detector() = default;

  std::error_code init(std::unique_ptr<vad_model> model,
    const vad_config& cfg,
    std::size_t chunk_size = default_chunk_size) noexcept;

  // Raw probability for exactly chunk_size() samples at 16 kHz. On failure the
  // recurrent state and context are left unchanged.
  std::error_code process_chunk(std::span<const float> audio, float& probability) noexcept;

  // process_chunk() followed by one state-machine step.
  std::error_code process(std::span<const float> audio, std::optional<vad_event>& event) noexcept;

  bool is_speaking() const noexcept { return machine_.is_speaking(); }
  std::size_t chunk_size() const noexcept { return chunk_size_; }
  const vad_config& config() const noexcept { return machine_.config(); }
  bool is_loaded() const noexcept { return model_ != nullptr; }

  // Zeroes the recurrent state and context and resets the state machine.
  void reset() noexcept;

private:
  std::unique_ptr<vad_model> model_{};
  vad_state_machine machine_{};
  std::vector<float> state_;
  std::vector<float> next_state_;
  std::vector<float> input_;
  std::size_t chunk_size_{0};
};

bool is_supported_chunk_size(std::size_t chunk_size) noexcept;

} // namespace dictum::vad
