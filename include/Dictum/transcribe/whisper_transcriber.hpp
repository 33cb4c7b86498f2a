#pragma once

#include <Dictum/core/config.hpp>
#include <Dictum/core/language.hpp>
#include <Dictum/transcribe/transcriber.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <system_error>

struct whisper_context;
struct whisper_state;

namespace dictum::transcribe {

// whisper.cpp backend. The model context and one inference state are created
// by load() and released by the destructor.
class whisper_transcriber final : public transcriber {
public:
  explicit whisper_transcriber(std::shared_ptr<const language_cell> language);
  ~whisper_transcriber() override;

  whisper_transcriber(const whisper_transcriber&) = delete;
  whisper_transcriber& operator=(const whisper_transcriber&) = delete;
  whisper_transcriber(whisper_transcriber&& other) noexcept;
  whisper_transcriber& operator=(whisper_transcriber&& other) noexcept;

  std::error_code load(const std::filesystem::path& model_path) noexcept;

  std::error_code transcribe(std::span<const float> audio,
    uint32_t sample_rate,
    std::string& text) noexcept override;

  bool is_loaded() const noexcept { return ctx_ != nullptr && state_ != nullptr; }

private:
  void release() noexcept;

  std::shared_ptr<const language_cell> language_;
  whisper_context* ctx_{nullptr};
  whisper_state* state_{nullptr};
  int threads_{4};
};

// Single dispatch point from the configured model to a backend.
std::error_code make_transcriber(speech_model model,
  const std::filesystem::path& model_path,
  std::shared_ptr<const language_cell> language,
  std::unique_ptr<transcriber>& out) noexcept;

} // namespace dictum::transcribe
