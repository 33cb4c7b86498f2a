#pragma once

#include <Dictum/vad/detector.hpp>

#include <filesystem>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

namespace dictum::vad {

// Silero VAD ONNX model (inputs "input", "state", "sr"; outputs "output",
// "stateN") on the CPU execution provider with a single intra-op thread.
class silero_vad_model final : public vad_model {
public:
  silero_vad_model();
  ~silero_vad_model() override;

  silero_vad_model(const silero_vad_model&) = delete;
  silero_vad_model& operator=(const silero_vad_model&) = delete;
  silero_vad_model(silero_vad_model&&) noexcept;
  silero_vad_model& operator=(silero_vad_model&&) noexcept;

  std::error_code load(const std::filesystem::path& model_path) noexcept;

  std::error_code infer(std::span<const float> input,
    std::span<const float> state,
    float& probability,
    std::vector<float>& next_state) noexcept override;

private:
  struct impl;
  std::unique_ptr<impl> pimpl_{};
};

} // namespace dictum::vad
