#pragma once

#include <cstddef>
#include <optional>

namespace dictum::vad {

inline constexpr float default_threshold = 0.5F;

enum class vad_event { speech_start, speech_end };

const char* to_string(vad_event event) noexcept;

struct vad_config {
  float threshold{default_threshold};  // probability >= threshold counts as speech
  std::size_t min_speech_chunks{2};    // consecutive speech chunks before speech_start
  std::size_t min_silence_chunks{8};   // consecutive silence chunks before speech_end
};

// Debounces per-chunk speech probabilities into start/end events. Counts must
// be consecutive: a chunk of the opposite class resets the other counter.
class vad_state_machine {
public:
  vad_state_machine() = default;
  explicit vad_state_machine(const vad_config& cfg) noexcept : cfg_(cfg) {}

  std::optional<vad_event> process(float probability) noexcept;

  bool is_speaking() const noexcept { return speaking_; }
  std::size_t speech_chunk_count() const noexcept { return speech_chunks_; }
  std::size_t silence_chunk_count() const noexcept { return silence_chunks_; }
  const vad_config& config() const noexcept { return cfg_; }

  void reset() noexcept;

private:
  vad_config cfg_{};
  bool speaking_{false};
  std::size_t speech_chunks_{0};
  std::size_t silence_chunks_{0};
};

} // namespace dictum::vad
