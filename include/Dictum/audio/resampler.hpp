#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

namespace dictum::audio {

// Fixed-ratio FFT resampler. Every input chunk of chunk_size() samples is one
// transform block and yields exactly output_chunk_size() samples; the only
// state carried between blocks is the overlap-add tail.
class audio_resampler {
public:
  audio_resampler();
  ~audio_resampler();

  audio_resampler(const audio_resampler&) = delete;
  audio_resampler& operator=(const audio_resampler&) = delete;
  audio_resampler(audio_resampler&&) noexcept;
  audio_resampler& operator=(audio_resampler&&) noexcept;

  std::error_code init(uint32_t input_rate, uint32_t output_rate, std::size_t chunk_size) noexcept;

  // Resamples every complete chunk of `input`. Samples past the last complete
  // chunk are ignored; holding them back is the caller's job.
  std::vector<float> process(std::span<const float> input);

  void reset() noexcept;

  std::size_t chunk_size() const noexcept { return chunk_size_in_; }

  // round(chunk_size * output_rate / input_rate). Read this instead of
  // computing it from the rates.
  std::size_t output_chunk_size() const noexcept { return chunk_size_out_; }

  uint32_t input_rate() const noexcept { return input_rate_; }
  uint32_t output_rate() const noexcept { return output_rate_; }

private:
  struct impl;
  std::unique_ptr<impl> pimpl_{};
  uint32_t input_rate_{0};
  uint32_t output_rate_{0};
  std::size_t chunk_size_in_{0};
  std::size_t chunk_size_out_{0};
};

} // namespace dictum::audio
