#pragma once

#include <Dictum/core/config.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string_view>
#include <system_error>

namespace dictum::models {

enum class model_id {
  silero_vad,
  whisper_tiny,
  whisper_tiny_en,
  whisper_base,
  whisper_base_en,
  whisper_small,
  whisper_small_en,
  whisper_medium,
  whisper_medium_en,
  whisper_large_v3,
  whisper_large_v3_turbo,
};

struct model_info {
  std::string_view filename;
  std::string_view url;
  uint64_t size_bytes{0}; // 0 when the size is not validated
};

model_info info(model_id id) noexcept;

// Source of model_info. The returned views must outlive the call that uses
// them.
using catalogue_fn = std::function<model_info(model_id)>;

// Display name used in progress events ("silero-vad", "whisper-base-en").
std::string_view to_string(model_id id) noexcept;

model_id to_model_id(speech_model model) noexcept;

// (downloaded, total) in bytes. total is 0 when unknown.
using progress_fn = std::function<void(uint64_t, uint64_t)>;

// Resolves a model to a local file, fetching it first if needed. A stop
// request aborts a running fetch with errc::cancelled.
class model_provider {
public:
  virtual ~model_provider() = default;

  virtual std::error_code ensure_model(model_id id,
    const progress_fn& on_progress,
    std::filesystem::path& model_path,
    std::stop_token stop) = 0;
};

// Stores models under one directory and downloads them over HTTPS with
// libcurl. Partial downloads live beside the target with a ".tmp" extension
// and are resumed with a Range request; a cancelled download keeps its
// partial.
class model_manager final : public model_provider {
public:
  explicit model_manager(std::filesystem::path models_dir, catalogue_fn catalogue = &info);

  const std::filesystem::path& models_dir() const noexcept { return models_dir_; }
  std::filesystem::path model_path(model_id id) const;
  std::filesystem::path partial_path(model_id id) const;

  std::error_code ensure_model(model_id id,
    const progress_fn& on_progress,
    std::filesystem::path& model_path,
    std::stop_token stop) override;

private:
  std::error_code download(const model_info& meta,
    const std::filesystem::path& dest,
    const progress_fn& on_progress,
    const std::stop_token& stop,
    bool allow_restart);

  std::filesystem::path models_dir_;
  catalogue_fn catalogue_;
};

} // namespace dictum::models
