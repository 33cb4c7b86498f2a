#include <Dictum/core/error.hpp>
#include <Dictum/models/model_manager.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace dictum::models {
namespace {

namespace fs = std::filesystem;

constexpr long http_ok = 200;
constexpr long http_partial_content = 206;
constexpr long http_range_not_satisfiable = 416;

void ensure_curl_global_init() noexcept {
  static std::once_flag once;
  std::call_once(once, [] { static_cast<void>(curl_global_init(CURL_GLOBAL_DEFAULT)); });
}

struct transfer {
  CURL* curl{nullptr};
  fs::path temp_path;
  std::ofstream file;
  uint64_t resume_from{0};
  uint64_t downloaded{0};
  uint64_t total{0};
  bool opened{false};
  bool write_failed{false};
  const progress_fn* on_progress{nullptr};
  const std::stop_token* stop{nullptr};
};

// Opens the temp file on the first body chunk, once the response status is
// known: 206 appends to the partial, 200 starts over.
bool open_target(transfer& t) {
  long status = 0;
  curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);
  if (status != http_ok && status != http_partial_content) {
    return false;
  }
  const bool resume = status == http_partial_content && t.resume_from > 0;
  if (!resume && t.resume_from > 0) {
    spdlog::warn("models: server ignored range request, restarting download");
  }
  t.file.open(t.temp_path, std::ios::binary | (resume ? std::ios::app : std::ios::trunc));
  if (!t.file) {
    spdlog::error("models: cannot open {}", t.temp_path.string());
    t.write_failed = true;
    return false;
  }
  t.downloaded = resume ? t.resume_from : 0;
  t.opened = true;
  return true;
}

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
  auto& t = *static_cast<transfer*>(userdata);
  const std::size_t bytes = size * nmemb;
  try {
    if (!t.opened && !open_target(t)) {
      return 0;
    }
    t.file.write(data, static_cast<std::streamsize>(bytes));
    if (!t.file) {
      t.write_failed = true;
      return 0;
    }
    t.downloaded += bytes;
    if (t.on_progress != nullptr && *t.on_progress) {
      (*t.on_progress)(t.downloaded, t.total);
    }
  } catch (const std::exception& e) {
    spdlog::error("models: aborting download: {}", e.what());
    t.write_failed = true;
    return 0;
  }
  return bytes;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK. libcurl calls
// this about once a second even while the connection is idle.
int check_stop(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  const auto& t = *static_cast<const transfer*>(userdata);
  return t.stop != nullptr && t.stop->stop_requested() ? 1 : 0;
}

} // namespace

model_info info(model_id id) noexcept {
  switch (id) {
  case model_id::silero_vad:
    return {"silero_vad.onnx", "https://github.com/snakers4/silero-vad/raw/master/src/silero_vad/data/silero_vad.onnx", 2'327'524};
  case model_id::whisper_tiny:
    return {"ggml-tiny.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin", 77'691'713};
  case model_id::whisper_tiny_en:
    return {"ggml-tiny.en.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.en.bin", 77'704'715};
  case model_id::whisper_base:
    return {"ggml-base.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.bin", 147'951'465};
  case model_id::whisper_base_en:
    return {"ggml-base.en.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin", 147'964'211};
  case model_id::whisper_small:
    return {"ggml-small.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-small.bin", 487'601'967};
  case model_id::whisper_small_en:
    return {"ggml-small.en.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-small.en.bin", 487'614'201};
  case model_id::whisper_medium:
    return {"ggml-medium.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-medium.bin", 1'533'774'781};
  case model_id::whisper_medium_en:
    return {"ggml-medium.en.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-medium.en.bin", 1'533'774'781};
  case model_id::whisper_large_v3:
    return {"ggml-large-v3.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-large-v3.bin", 3'094'623'691};
  case model_id::whisper_large_v3_turbo:
    return {"ggml-large-v3-turbo.bin", "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-large-v3-turbo.bin", 1'624'555'275};
  }
  return {};
}

std::string_view to_string(model_id id) noexcept {
  switch (id) {
  case model_id::silero_vad:
    return "silero-vad";
  case model_id::whisper_tiny:
    return "whisper-tiny";
  case model_id::whisper_tiny_en:
    return "whisper-tiny-en";
  case model_id::whisper_base:
    return "whisper-base";
  case model_id::whisper_base_en:
    return "whisper-base-en";
  case model_id::whisper_small:
    return "whisper-small";
  case model_id::whisper_small_en:
    return "whisper-small-en";
  case model_id::whisper_medium:
    return "whisper-medium";
  case model_id::whisper_medium_en:
    return "whisper-medium-en";
  case model_id::whisper_large_v3:
    return "whisper-large-v3";
  case model_id::whisper_large_v3_turbo:
    return "whisper-large-v3-turbo";
  }
  return "unknown";
}

model_id to_model_id(speech_model model) noexcept {
  switch (model) {
  case speech_model::whisper_tiny:
    return model_id::whisper_tiny;
  case speech_model::whisper_tiny_en:
    return model_id::whisper_tiny_en;
  case speech_model::whisper_base:
    return model_id::whisper_base;
  case speech_model::whisper_base_en:
    return model_id::whisper_base_en;
  case speech_model::whisper_small:
    return model_id::whisper_small;
  case speech_model::whisper_small_en:
    return model_id::whisper_small_en;
  case speech_model::whisper_medium:
    return model_id::whisper_medium;
  case speech_model::whisper_medium_en:
    return model_id::whisper_medium_en;
  case speech_model::whisper_large_v3:
    return model_id::whisper_large_v3;
  case speech_model::whisper_large_v3_turbo:
    return model_id::whisper_large_v3_turbo;
  }
  return model_id::whisper_base;
}

model_manager::model_manager(std::filesystem::path models_dir, catalogue_fn catalogue)
  : models_dir_(std::move(models_dir)), catalogue_(std::move(catalogue)) {
  if (!catalogue_) {
    catalogue_ = &info;
  }
}

std::filesystem::path model_manager::model_path(model_id id) const { return models_dir_ / catalogue_(id).filename; }

std::filesystem::path model_manager::partial_path(model_id id) const {
  auto path = model_path(id);
  path.replace_extension(".tmp");
  return path;
}

std::error_code model_manager::ensure_model(model_id id,
  const progress_fn& on_progress,
  std::filesystem::path& model_path_out,
  std::stop_token stop) {
  const model_info meta = catalogue_(id);
  const fs::path dest = model_path(id);

  std::error_code ec;
  bool needs_download = !fs::exists(dest, ec);
  if (ec) {
    return errc::io_error;
  }
  if (!needs_download && meta.size_bytes != 0) {
    const auto actual = fs::file_size(dest, ec);
    if (ec) {
      return errc::io_error;
    }
    if (actual != meta.size_bytes) {
      spdlog::warn("models: {} size mismatch (expected={} actual={}), re-downloading",
        to_string(id),
        meta.size_bytes,
        actual);
      fs::remove(dest, ec);
      if (ec) {
        return errc::io_error;
      }
      needs_download = true;
    } else {
      spdlog::debug("models: {} already present at {}", to_string(id), dest.string());
    }
  }

  if (needs_download) {
    if (const auto dl = download(meta, dest, on_progress, stop, true)) {
      return dl;
    }
  }
  model_path_out = dest;
  return {};
}

std::error_code model_manager::download(const model_info& meta,
  const std::filesystem::path& dest,
  const progress_fn& on_progress,
  const std::stop_token& stop,
  bool allow_restart) {
  if (stop.stop_requested()) {
    return errc::cancelled;
  }
  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    spdlog::error("models: cannot create {}: {}", dest.parent_path().string(), ec.message());
    return errc::io_error;
  }

  fs::path temp_path = dest;
  temp_path.replace_extension(".tmp");

  uint64_t existing = 0;
  if (fs::exists(temp_path, ec)) {
    existing = fs::file_size(temp_path, ec);
    if (ec) {
      return errc::io_error;
    }
  }

  if (existing > 0 && existing == meta.size_bytes) {
    spdlog::info("models: found complete partial download {}, finalizing", temp_path.string());
    fs::rename(temp_path, dest, ec);
    return ec ? std::error_code{errc::io_error} : std::error_code{};
  }

  spdlog::info("models: downloading {} -> {} (resume_from={})", meta.url, dest.string(), existing);

  ensure_curl_global_init();
  const std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    spdlog::error("models: curl_easy_init failed");
    return errc::model_download_failed;
  }

  transfer t{};
  t.curl = curl.get();
  t.temp_path = temp_path;
  t.resume_from = existing;
  t.downloaded = existing;
  t.total = meta.size_bytes;
  t.on_progress = &on_progress;
  t.stop = &stop;

  const std::string url(meta.url);
  const std::string range = std::to_string(existing) + "-";
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "dictum/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &t);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &check_stop);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &t);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  if (existing > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
  }

  const CURLcode res = curl_easy_perform(curl.get());
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (t.file.is_open()) {
    t.file.close();
  }

  if (res == CURLE_ABORTED_BY_CALLBACK) {
    spdlog::info("models: download of {} cancelled, partial kept for resume", dest.filename().string());
    return errc::cancelled;
  }
  if (status == http_range_not_satisfiable) {
    spdlog::warn("models: server rejected range request (416), restarting from scratch");
    fs::remove(temp_path, ec);
    if (!allow_restart) {
      return errc::model_download_failed;
    }
    return download(meta, dest, on_progress, stop, false);
  }
  if (status != 0 && status != http_ok && status != http_partial_content) {
    spdlog::error("models: HTTP {} from {}", status, meta.url);
    return errc::model_download_failed;
  }
  if (t.write_failed) {
    return errc::io_error;
  }
  if (res != CURLE_OK) {
    spdlog::error("models: download failed: {}", curl_easy_strerror(res));
    return errc::model_download_failed;
  }

  if (meta.size_bytes != 0 && t.downloaded != meta.size_bytes) {
    spdlog::warn("models: incomplete download, got {} of {} bytes (kept for resume)",
      t.downloaded,
      meta.size_bytes);
    return errc::model_size_mismatch;
  }

  fs::rename(temp_path, dest, ec);
  if (ec) {
    spdlog::error("models: cannot finalize {}: {}", dest.string(), ec.message());
    return errc::io_error;
  }
  spdlog::info("models: downloaded {} ({} bytes)", dest.string(), t.downloaded);
  return {};
}

} // namespace dictum::models
