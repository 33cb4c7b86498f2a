#include <Dictum/core/error.hpp>
#include <Dictum/transcribe/whisper_transcriber.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>
#include <whisper.h>

namespace dictum::transcribe {
namespace {

constexpr int max_threads = 4;

int pick_thread_count() noexcept {
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  return hw > 0 ? (std::min)(hw, max_threads) : max_threads;
}

} // namespace

whisper_transcriber::whisper_transcriber(std::shared_ptr<const language_cell> language)
  : language_(std::move(language)), threads_(pick_thread_count()) {}

whisper_transcriber::~whisper_transcriber() { release(); }

whisper_transcriber::whisper_transcriber(whisper_transcriber&& other) noexcept
  : language_(std::move(other.language_)),
    ctx_(std::exchange(other.ctx_, nullptr)),
    state_(std::exchange(other.state_, nullptr)),
    threads_(other.threads_) {}

whisper_transcriber& whisper_transcriber::operator=(whisper_transcriber&& other) noexcept {
  if (this != &other) {
    release();
    language_ = std::move(other.language_);
    ctx_ = std::exchange(other.ctx_, nullptr);
    state_ = std::exchange(other.state_, nullptr);
    threads_ = other.threads_;
  }
  return *this;
}

void whisper_transcriber::release() noexcept {
  if (state_ != nullptr) {
    whisper_free_state(state_);
    state_ = nullptr;
  }
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

std::error_code whisper_transcriber::load(const std::filesystem::path& model_path) noexcept {
  release();
  spdlog::info("whisper: loading model {}", model_path.string());

  whisper_context_params cparams = whisper_context_default_params();
  cparams.use_gpu = false;

  ctx_ = whisper_init_from_file_with_params_no_state(model_path.c_str(), cparams);
  if (ctx_ == nullptr) {
    spdlog::error("whisper: failed to load model {}", model_path.string());
    return errc::model_load_failed;
  }
  state_ = whisper_init_state(ctx_);
  if (state_ == nullptr) {
    spdlog::error("whisper: failed to allocate inference state");
    release();
    return errc::model_load_failed;
  }
  spdlog::info("whisper: model loaded (multilingual={}, threads={})",
    whisper_is_multilingual(ctx_) != 0,
    threads_);
  return {};
}

std::error_code whisper_transcriber::transcribe(std::span<const float> audio,
  uint32_t sample_rate,
  std::string& text) noexcept {
  text.clear();
  if (sample_rate != transcriber_sample_rate) {
    return errc::sample_rate_mismatch;
  }
  if (!is_loaded()) {
    return errc::not_initialized;
  }
  if (audio.empty()) {
    return {};
  }

  try {
    const std::optional<std::string> forced = language_ ? language_->forced() : std::nullopt;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = threads_;
    params.language = forced ? forced->c_str() : "auto";
    params.translate = false;
    params.single_segment = true;
    params.no_context = true;
    params.print_special = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    const int rc = whisper_full_with_state(ctx_, state_, params, audio.data(), static_cast<int>(audio.size()));
    if (rc != 0) {
      spdlog::warn("whisper: whisper_full failed rc={}", rc);
      return errc::transcription_failed;
    }

    std::string joined;
    const int n_segments = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n_segments; ++i) {
      const char* segment = whisper_full_get_segment_text_from_state(state_, i);
      if (segment != nullptr) {
        joined += segment;
      }
    }
    text = trim_text(joined);
  } catch (const std::bad_alloc&) {
    return errc::transcription_failed;
  }

  spdlog::debug("whisper: {} samples -> {} chars", audio.size(), text.size());
  return {};
}

std::error_code make_transcriber(speech_model model,
  const std::filesystem::path& model_path,
  std::shared_ptr<const language_cell> language,
  std::unique_ptr<transcriber>& out) noexcept {
  out.reset();
  switch (model) {
  case speech_model::whisper_tiny:
  case speech_model::whisper_tiny_en:
  case speech_model::whisper_base:
  case speech_model::whisper_base_en:
  case speech_model::whisper_small:
  case speech_model::whisper_small_en:
  case speech_model::whisper_medium:
  case speech_model::whisper_medium_en:
  case speech_model::whisper_large_v3:
  case speech_model::whisper_large_v3_turbo: {
    try {
      auto backend = std::make_unique<whisper_transcriber>(std::move(language));
      if (const auto ec = backend->load(model_path)) {
        return ec;
      }
      out = std::move(backend);
    } catch (const std::bad_alloc&) {
      return errc::model_load_failed;
    }
    return {};
  }
  }
  return errc::invalid_argument;
}

} // namespace dictum::transcribe
