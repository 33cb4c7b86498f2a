#pragma once

#include <Dictum/audio/buffer.hpp>
#include <Dictum/audio/resampler.hpp>
#include <Dictum/transcribe/transcriber.hpp>
#include <Dictum/vad/detector.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace dictum::engine {

inline constexpr std::size_t resampler_chunk_size = 1024;

// Turns native-rate mono audio into utterances: resample to 16 kHz, run the
// VAD on exact chunks, buffer while speaking and transcribe on speech end.
class utterance_segmenter {
public:
  using text_fn = std::function<void(const std::string&)>;

  utterance_segmenter(vad::voice_activity_detector& vad, transcribe::transcriber& transcriber);

  std::error_code init(uint32_t native_rate, std::size_t chunk_size = resampler_chunk_size) noexcept;

  // Leftovers shorter than one resampler or VAD chunk are carried over to
  // the next call.
  void feed(std::span<const float> native_mono, const text_fn& on_text);

  bool in_utterance() const noexcept { return vad_.is_speaking(); }
  std::size_t buffered_samples() const noexcept { return utterance_.samples.size(); }

  // Drops pending audio and the current utterance and resets the detector.
  void reset() noexcept;

private:
  void process_vad_chunk(std::span<const float> chunk, const text_fn& on_text);
  void finish_utterance(const text_fn& on_text);

  vad::voice_activity_detector& vad_;
  transcribe::transcriber& transcriber_;
  audio::audio_resampler resampler_;
  std::vector<float> native_pending_;
  std::vector<float> vad_pending_;
  audio::audio_buffer utterance_{audio::audio_buffer::empty(audio::target_sample_rate)};
};

} // namespace dictum::engine
