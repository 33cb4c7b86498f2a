#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace dictum::audio {

// Sample rate expected by the VAD and the transcription models.
inline constexpr uint32_t target_sample_rate = 16000;

// Mono f32 samples at a known rate. Samples are nominally in [-1, 1] but are
// not clamped.
struct audio_buffer {
  std::vector<float> samples;
  uint32_t sample_rate{0};

  audio_buffer() = default;
  audio_buffer(std::vector<float> data, uint32_t rate) : samples(std::move(data)), sample_rate(rate) {}

  static audio_buffer empty(uint32_t rate) { return audio_buffer({}, rate); }

  float duration_secs() const noexcept;

  // Throws std::invalid_argument when the sample rates differ.
  void append(const audio_buffer& other);

  void clear() noexcept { samples.clear(); }
};

// Averages interleaved frames. A trailing partial frame is dropped.
std::vector<float> to_mono(std::span<const float> interleaved, uint32_t channels);

std::vector<float> stereo_to_mono(std::span<const float> interleaved);

} // namespace dictum::audio
