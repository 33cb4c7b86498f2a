#include <Dictum/core/error.hpp>
#include <Dictum/engine/engine.hpp>
#include <Dictum/engine/segmenter.hpp>
#include <Dictum/transcribe/whisper_transcriber.hpp>
#include <Dictum/vad/silero_model.hpp>

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace dictum::engine {

struct speech_engine::components {
  vad::voice_activity_detector vad;
  std::unique_ptr<transcribe::transcriber> transcriber;
};

std::error_code default_component_factory::make_vad_model(const std::filesystem::path& model_path,
  std::unique_ptr<vad::vad_model>& out) {
  auto model = std::make_unique<vad::silero_vad_model>();
  if (const auto ec = model->load(model_path)) {
    return ec;
  }
  out = std::move(model);
  return {};
}

std::error_code default_component_factory::make_transcriber(speech_model model,
  const std::filesystem::path& model_path,
  std::shared_ptr<const language_cell> language,
  std::unique_ptr<transcribe::transcriber>& out) {
  return transcribe::make_transcriber(model, model_path, std::move(language), out);
}

std::unique_ptr<audio::capture_source> make_default_capture() { return std::make_unique<audio::audio_capture>(); }

speech_engine::speech_engine(config cfg,
  std::shared_ptr<models::model_provider> models,
  std::shared_ptr<component_factory> factory,
  capture_factory make_capture)
  : config_(std::move(cfg)),
    models_(std::move(models)),
    factory_(std::move(factory)),
    make_capture_(std::move(make_capture)),
    language_(std::make_shared<language_cell>(config_.model.language)) {}

speech_engine::~speech_engine() = default;

std::error_code speech_engine::initialize(const progress_fn& on_progress, std::stop_token stop) {
  components_.reset();
  if (!models_ || !factory_) {
    return errc::not_initialized;
  }

  const auto report = [&](init_progress progress) {
    if (on_progress) {
      on_progress(progress);
    }
  };
  const auto ensure = [&](models::model_id id, std::filesystem::path& path) {
    const std::string name(models::to_string(id));
    report({init_stage::loading, name, 0, 0});
    return models_->ensure_model(
      id,
      [&](uint64_t bytes, uint64_t total) { report({init_stage::downloading, name, bytes, total}); },
      path,
      stop);
  };

  std::filesystem::path vad_path;
  if (const auto ec = ensure(models::model_id::silero_vad, vad_path)) {
    spdlog::error("engine: vad model unavailable: {}", ec.message());
    return ec;
  }
  std::unique_ptr<vad::vad_model> vad_model;
  if (const auto ec = factory_->make_vad_model(vad_path, vad_model)) {
    spdlog::error("engine: failed to load vad model: {}", ec.message());
    return ec;
  }
  auto built = std::make_unique<components>();
  if (const auto ec = built->vad.init(std::move(vad_model), vad::vad_config{}, vad::default_chunk_size)) {
    return ec;
  }

  if (stop.stop_requested()) {
    return errc::cancelled;
  }

  const models::model_id speech_id = models::to_model_id(config_.model.model);
  std::filesystem::path speech_path;
  if (const auto ec = ensure(speech_id, speech_path)) {
    spdlog::error("engine: speech model {} unavailable: {}", models::to_string(speech_id), ec.message());
    return ec;
  }
  if (const auto ec = factory_->make_transcriber(config_.model.model, speech_path, language_, built->transcriber)) {
    spdlog::error("engine: failed to load speech model: {}", ec.message());
    return ec;
  }
  if (!built->transcriber) {
    return errc::model_load_failed;
  }

  components_ = std::move(built);
  spdlog::info("engine: initialized (model={}, language={})", to_string(config_.model.model), language_->get());
  report({init_stage::ready, {}, 0, 0});
  return {};
}

std::error_code speech_engine::run_loop(std::stop_token stop, const transcription_fn& on_transcription) {
  if (!components_) {
    return errc::not_initialized;
  }

  auto capture = make_capture_ ? make_capture_() : nullptr;
  if (!capture) {
    return errc::no_input_device;
  }
  if (const auto ec = capture->start()) {
    spdlog::error("engine: audio capture failed to start: {}", ec.message());
    return ec;
  }

  components_->vad.reset();
  utterance_segmenter segmenter(components_->vad, *components_->transcriber);
  if (const auto ec = segmenter.init(capture->sample_rate())) {
    capture->stop();
    return ec;
  }
  spdlog::info("engine: listening at {} Hz", capture->sample_rate());

  std::mutex tick_mutex;
  std::condition_variable_any tick_cv;
  std::vector<float> mono;
  while (!stop.stop_requested()) {
    {
      std::unique_lock<std::mutex> lock(tick_mutex);
      static_cast<void>(tick_cv.wait_for(lock, stop, tick_interval, [] { return false; }));
    }
    if (stop.stop_requested()) {
      break;
    }
    while (capture->try_recv(mono)) {
      segmenter.feed(mono, on_transcription);
    }
  }

  capture->stop();
  spdlog::info("engine: audio capture stopped");
  return {};
}

} // namespace dictum::engine
