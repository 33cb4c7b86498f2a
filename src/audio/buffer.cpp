#include <Dictum/audio/buffer.hpp>

#include <span>
#include <stdexcept>
#include <vector>

namespace dictum::audio {

float audio_buffer::duration_secs() const noexcept {
  if (sample_rate == 0) {
    return 0.0F;
  }
  return static_cast<float>(samples.size()) / static_cast<float>(sample_rate);
}

void audio_buffer::append(const audio_buffer& other) {
  if (sample_rate != other.sample_rate) {
    throw std::invalid_argument("cannot append buffers with different sample rates");
  }
  samples.insert(samples.end(), other.samples.begin(), other.samples.end());
}

std::vector<float> to_mono(std::span<const float> interleaved, uint32_t channels) {
  if (channels <= 1) {
    return {interleaved.begin(), interleaved.end()};
  }

  const std::size_t frames = interleaved.size() / channels;
  std::vector<float> mono;
  mono.reserve(frames);
  for (std::size_t frame = 0; frame < frames; ++frame) {
    const auto samples = interleaved.subspan(frame * channels, channels);
    float sum = 0.0F;
    for (const float s : samples) {
      sum += s;
    }
    mono.push_back(sum / static_cast<float>(channels));
  }
  return mono;
}

std::vector<float> stereo_to_mono(std::span<const float> interleaved) { return to_mono(interleaved, 2); }

} // namespace dictum::audio
