#pragma once

#include <Dictum/audio/capture.hpp>
#include <Dictum/core/config.hpp>
#include <Dictum/core/language.hpp>
#include <Dictum/engine/events.hpp>
#include <Dictum/models/model_manager.hpp>
#include <Dictum/transcribe/transcriber.hpp>
#include <Dictum/vad/detector.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>

namespace dictum::engine {

inline constexpr std::chrono::milliseconds tick_interval{10};

// Builds the inference components from resolved model files.
class component_factory {
public:
  virtual ~component_factory() = default;

  virtual std::error_code make_vad_model(const std::filesystem::path& model_path,
    std::unique_ptr<vad::vad_model>& out) = 0;

  virtual std::error_code make_transcriber(speech_model model,
    const std::filesystem::path& model_path,
    std::shared_ptr<const language_cell> language,
    std::unique_ptr<transcribe::transcriber>& out) = 0;
};

// Silero VAD on ONNX Runtime and the whisper.cpp backend.
class default_component_factory final : public component_factory {
public:
  std::error_code make_vad_model(const std::filesystem::path& model_path,
    std::unique_ptr<vad::vad_model>& out) override;

  std::error_code make_transcriber(speech_model model,
    const std::filesystem::path& model_path,
    std::shared_ptr<const language_cell> language,
    std::unique_ptr<transcribe::transcriber>& out) override;
};

using capture_factory = std::function<std::unique_ptr<audio::capture_source>()>;

// Default input device through miniaudio.
std::unique_ptr<audio::capture_source> make_default_capture();

// Owns the configuration and, once initialized, the VAD and transcriber.
// Not thread-safe: one owner at a time, handed between the controller and
// the listening task.
class speech_engine {
public:
  using progress_fn = std::function<void(const init_progress&)>;
  using transcription_fn = std::function<void(const std::string&)>;

  speech_engine(config cfg,
    std::shared_ptr<models::model_provider> models,
    std::shared_ptr<component_factory> factory = std::make_shared<default_component_factory>(),
    capture_factory make_capture = &make_default_capture);
  ~speech_engine();

  speech_engine(const speech_engine&) = delete;
  speech_engine& operator=(const speech_engine&) = delete;

  // Resolves both models (downloading as needed) and builds the components.
  // On failure nothing is kept and the call may be repeated. A stop request
  // abandons a pending download with errc::cancelled.
  std::error_code initialize(const progress_fn& on_progress, std::stop_token stop = {});

  bool is_initialized() const noexcept { return components_ != nullptr; }

  // Captures and segments audio until `stop` is requested. Returns
  // errc::not_initialized without opening a device when uninitialized.
  std::error_code run_loop(std::stop_token stop, const transcription_fn& on_transcription);

  const config& cfg() const noexcept { return config_; }
  const std::shared_ptr<language_cell>& language() const noexcept { return language_; }

private:
  struct components;

  config config_;
  std::shared_ptr<models::model_provider> models_;
  std::shared_ptr<component_factory> factory_;
  capture_factory make_capture_;
  std::shared_ptr<language_cell> language_;
  std::unique_ptr<components> components_{};
};

} // namespace dictum::engine
