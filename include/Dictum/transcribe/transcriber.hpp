#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace dictum::transcribe {

inline constexpr uint32_t transcriber_sample_rate = 16000;

// Speech-to-text over one complete utterance.
class transcriber {
public:
  virtual ~transcriber() = default;

  // `audio` must be mono at transcriber_sample_rate, otherwise
  // errc::sample_rate_mismatch. `text` is trimmed; an empty result is not an
  // error.
  virtual std::error_code transcribe(std::span<const float> audio,
    uint32_t sample_rate,
    std::string& text) noexcept = 0;
};

// Strips leading and trailing ASCII whitespace.
std::string trim_text(std::string_view text);

} // namespace dictum::transcribe
