#include <Dictum/core/error.hpp>
#include <Dictum/vad/detector.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace dictum::vad {

bool is_supported_chunk_size(std::size_t chunk_size) noexcept {
  return std::find(supported_chunk_sizes.begin(), supported_chunk_sizes.end(), chunk_size)
         != supported_chunk_sizes.end();
}

std::error_code voice_activity_detector::init(std::unique_ptr<vad_model> model,
  const vad_config& cfg,
  std::size_t chunk_size) noexcept {
  if (!is_supported_chunk_size(chunk_size)) {
    spdlog::error("vad: invalid chunk size {}, must be 512, 1024 or 1536", chunk_size);
    return errc::invalid_chunk_size;
  }
  if (!model) {
    return errc::model_load_failed;
  }

  try {
    state_.assign(state_size, 0.0F);
    next_state_.reserve(state_size);
    // The first context_size samples hold the previous chunk's tail.
    input_.assign(context_size + chunk_size, 0.0F);
  } catch (const std::bad_alloc&) {
    return errc::model_load_failed;
  }

  model_ = std::move(model);
  machine_ = vad_state_machine(cfg);
  chunk_size_ = chunk_size;
  return {};
}

std::error_code voice_activity_detector::process_chunk(std::span<const float> audio, float& probability) noexcept {
  if (!model_) {
    return errc::not_initialized;
  }
  if (audio.size() != chunk_size_) {
    spdlog::warn("vad: chunk of {} samples does not match expected {}", audio.size(), chunk_size_);
    return errc::invalid_chunk_size;
  }

  std::copy(audio.begin(), audio.end(), input_.begin() + static_cast<std::ptrdiff_t>(context_size));

  float result = 0.0F;
  next_state_.clear();
  if (const auto ec = model_->infer(input_, state_, result, next_state_)) {
    return ec;
  }
  if (next_state_.size() != state_size) {
    spdlog::warn("vad: model returned {} state values, expected {}", next_state_.size(), state_size);
    return errc::inference_failed;
  }

  state_.swap(next_state_);
  const auto tail = audio.subspan(audio.size() - context_size);
  std::copy(tail.begin(), tail.end(), input_.begin());

  SPDLOG_TRACE("vad: inference probability={:.3f}", result);
  probability = result;
  return {};
}

std::error_code voice_activity_detector::process(std::span<const float> audio, std::optional<vad_event>& event) noexcept {
  float probability = 0.0F;
  if (const auto ec = process_chunk(audio, probability)) {
    return ec;
  }
  event = machine_.process(probability);
  return {};
}

void voice_activity_detector::reset() noexcept {
  std::fill(state_.begin(), state_.end(), 0.0F);
  std::fill(input_.begin(), input_.end(), 0.0F);
  machine_.reset();
}

} // namespace dictum::vad
