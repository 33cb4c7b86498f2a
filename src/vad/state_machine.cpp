#include <Dictum/vad/state_machine.hpp>

#include <optional>

#include <spdlog/spdlog.h>

namespace dictum::vad {

const char* to_string(vad_event event) noexcept {
  switch (event) {
  case vad_event::speech_start:
    return "speech_start";
  case vad_event::speech_end:
    return "speech_end";
  }
  return "unknown";
}

std::optional<vad_event> vad_state_machine::process(float probability) noexcept {
  const bool is_speech = probability >= cfg_.threshold;

  SPDLOG_TRACE("vad: probability={:.3f} speech={} speaking={} speech_chunks={} silence_chunks={}",
    probability, is_speech, speaking_, speech_chunks_, silence_chunks_);

  if (is_speech) {
    ++speech_chunks_;
    silence_chunks_ = 0;
    if (!speaking_ && speech_chunks_ >= cfg_.min_speech_chunks) {
      speaking_ = true;
      spdlog::debug("vad: speech started");
      return vad_event::speech_start;
    }
  } else {
    ++silence_chunks_;
    speech_chunks_ = 0;
    if (speaking_ && silence_chunks_ >= cfg_.min_silence_chunks) {
      speaking_ = false;
      spdlog::debug("vad: speech ended");
      return vad_event::speech_end;
    }
  }

  return std::nullopt;
}

void vad_state_machine::reset() noexcept {
  speaking_ = false;
  speech_chunks_ = 0;
  silence_chunks_ = 0;
}

} // namespace dictum::vad
