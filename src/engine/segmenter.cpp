#include <Dictum/engine/segmenter.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace dictum::engine {

utterance_segmenter::utterance_segmenter(vad::voice_activity_detector& vad, transcribe::transcriber& transcriber)
  : vad_(vad), transcriber_(transcriber) {}

std::error_code utterance_segmenter::init(uint32_t native_rate, std::size_t chunk_size) noexcept {
  if (const auto ec = resampler_.init(native_rate, audio::target_sample_rate, chunk_size)) {
    return ec;
  }
  native_pending_.clear();
  vad_pending_.clear();
  utterance_.clear();
  spdlog::debug("segmenter: {} Hz -> {} Hz, {} -> {} samples per chunk, vad chunk {}",
    native_rate,
    audio::target_sample_rate,
    resampler_.chunk_size(),
    resampler_.output_chunk_size(),
    vad_.chunk_size());
  return {};
}

void utterance_segmenter::feed(std::span<const float> native_mono, const text_fn& on_text) {
  native_pending_.insert(native_pending_.end(), native_mono.begin(), native_mono.end());

  const std::size_t in_chunk = resampler_.chunk_size();
  if (in_chunk == 0 || native_pending_.size() < in_chunk) {
    return;
  }
  const std::size_t whole = (native_pending_.size() / in_chunk) * in_chunk;
  const auto resampled = resampler_.process(std::span<const float>(native_pending_.data(), whole));
  native_pending_.erase(native_pending_.begin(), native_pending_.begin() + static_cast<std::ptrdiff_t>(whole));
  vad_pending_.insert(vad_pending_.end(), resampled.begin(), resampled.end());

  const std::size_t vad_chunk = vad_.chunk_size();
  std::size_t offset = 0;
  while (vad_pending_.size() - offset >= vad_chunk) {
    process_vad_chunk(std::span<const float>(vad_pending_.data() + offset, vad_chunk), on_text);
    offset += vad_chunk;
  }
  vad_pending_.erase(vad_pending_.begin(), vad_pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void utterance_segmenter::process_vad_chunk(std::span<const float> chunk, const text_fn& on_text) {
  const bool was_speaking = vad_.is_speaking();

  std::optional<vad::vad_event> event;
  if (const auto ec = vad_.process(chunk, event)) {
    spdlog::warn("segmenter: vad failed ({}), discarding {} buffered samples", ec.message(), utterance_.samples.size());
    utterance_.clear();
    vad_.reset();
    return;
  }

  if (event == vad::vad_event::speech_start) {
    spdlog::debug("segmenter: speech started");
    utterance_.clear();
    utterance_.samples.insert(utterance_.samples.end(), chunk.begin(), chunk.end());
    return;
  }
  if (was_speaking) {
    utterance_.samples.insert(utterance_.samples.end(), chunk.begin(), chunk.end());
  }
  if (event == vad::vad_event::speech_end) {
    finish_utterance(on_text);
  }
}

void utterance_segmenter::finish_utterance(const text_fn& on_text) {
  spdlog::debug("segmenter: speech ended, samples={} duration_secs={:.2f}",
    utterance_.samples.size(),
    utterance_.duration_secs());

  if (!utterance_.samples.empty()) {
    std::string text;
    if (const auto ec = transcriber_.transcribe(utterance_.samples, utterance_.sample_rate, text)) {
      spdlog::error("segmenter: transcription failed: {}", ec.message());
    } else if (!text.empty()) {
      spdlog::info("segmenter: transcription complete: {}", text);
      if (on_text) {
        on_text(text);
      }
    }
  }
  utterance_.clear();
}

void utterance_segmenter::reset() noexcept {
  native_pending_.clear();
  vad_pending_.clear();
  utterance_.clear();
  resampler_.reset();
  vad_.reset();
}

} // namespace dictum::engine
