#include <Dictum/core/error.hpp>
#include <Dictum/vad/silero_model.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <new>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>

namespace dictum::vad {
namespace {

constexpr std::array<const char*, 3> input_names{"input", "state", "sr"};
constexpr std::array<const char*, 2> output_names{"output", "stateN"};
constexpr std::array<int64_t, 3> state_shape{2, 1, 128};

} // namespace

struct silero_vad_model::impl {
  impl()
    : env(ORT_LOGGING_LEVEL_WARNING, "dictum-vad"),
      memory_info(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {}

  Ort::Env env;
  Ort::MemoryInfo memory_info;
  std::unique_ptr<Ort::Session> session{};
  int64_t sample_rate{static_cast<int64_t>(vad_sample_rate)};
};

silero_vad_model::silero_vad_model() = default;
silero_vad_model::~silero_vad_model() = default;
silero_vad_model::silero_vad_model(silero_vad_model&&) noexcept = default;
silero_vad_model& silero_vad_model::operator=(silero_vad_model&&) noexcept = default;

std::error_code silero_vad_model::load(const std::filesystem::path& model_path) noexcept {
  spdlog::debug("vad: loading model from {}", model_path.string());
  try {
    auto state = std::make_unique<impl>();

    Ort::SessionOptions options{};
    options.SetIntraOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
    state->session = std::make_unique<Ort::Session>(state->env, model_path.c_str(), options);

    pimpl_ = std::move(state);
  } catch (const Ort::Exception& e) {
    spdlog::error("vad: failed to load model from {}: {}", model_path.string(), e.what());
    pimpl_.reset();
    return errc::model_load_failed;
  } catch (const std::bad_alloc&) {
    pimpl_.reset();
    return errc::model_load_failed;
  }
  spdlog::debug("vad: model loaded");
  return {};
}

std::error_code silero_vad_model::infer(std::span<const float> input,
  std::span<const float> state,
  float& probability,
  std::vector<float>& next_state) noexcept {
  if (!pimpl_ || !pimpl_->session) {
    return errc::not_initialized;
  }
  if (state.size() != state_size) {
    return errc::invalid_argument;
  }

  try {
    const std::array<int64_t, 2> input_shape{1, static_cast<int64_t>(input.size())};

    // ORT takes non-const pointers but does not write to input tensors.
    std::array<Ort::Value, 3> inputs{
      Ort::Value::CreateTensor<float>(pimpl_->memory_info,
        const_cast<float*>(input.data()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
        input.size(),
        input_shape.data(),
        input_shape.size()),
      Ort::Value::CreateTensor<float>(pimpl_->memory_info,
        const_cast<float*>(state.data()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
        state.size(),
        state_shape.data(),
        state_shape.size()),
      Ort::Value::CreateTensor<int64_t>(pimpl_->memory_info, &pimpl_->sample_rate, 1, nullptr, 0),
    };

    auto outputs = pimpl_->session->Run(Ort::RunOptions{nullptr},
      input_names.data(),
      inputs.data(),
      inputs.size(),
      output_names.data(),
      output_names.size());

    if (outputs.size() != output_names.size()) {
      return errc::inference_failed;
    }

    const float* prob = outputs[0].GetTensorData<float>();
    const auto state_count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
    const float* new_state = outputs[1].GetTensorData<float>();

    probability = prob[0];
    next_state.assign(new_state, new_state + state_count);
  } catch (const Ort::Exception& e) {
    spdlog::warn("vad: inference failed: {}", e.what());
    return errc::inference_failed;
  } catch (const std::bad_alloc&) {
    return errc::inference_failed;
  }
  return {};
}

} // namespace dictum::vad
