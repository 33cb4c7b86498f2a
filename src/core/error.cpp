#include <Dictum/core/error.hpp>

#include <string>
#include <system_error>

namespace dictum {
namespace {

class dictum_error_category final : public std::error_category {
public:
  const char* name() const noexcept override { return "dictum"; }

  std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
    case errc::ok:
      return "success";
    case errc::not_initialized:
      return "engine not initialized, call initialize() first";
    case errc::sample_rate_mismatch:
      return "audio must be 16 kHz mono, resample before transcribing";
    case errc::invalid_chunk_size:
      return "audio chunk size is not supported";
    case errc::no_input_device:
      return "no input device available";
    case errc::unsupported_sample_format:
      return "unsupported input sample format";
    case errc::device_start_failed:
      return "failed to start audio stream";
    case errc::resampler_setup_failed:
      return "failed to create resampler";
    case errc::model_load_failed:
      return "failed to load model";
    case errc::inference_failed:
      return "model inference failed";
    case errc::transcription_failed:
      return "transcription failed";
    case errc::model_download_failed:
      return "model download failed";
    case errc::model_size_mismatch:
      return "downloaded model size mismatch, partial download kept for resume";
    case errc::io_error:
      return "file system error";
    case errc::config_parse_failed:
      return "failed to parse config file";
    case errc::engine_unavailable:
      return "engine not available";
    case errc::engine_lost:
      return "engine lost after a task failure, restart the daemon";
    case errc::daemon_stopped:
      return "daemon is stopped";
    case errc::daemon_initializing:
      return "daemon is still initializing";
    case errc::invalid_argument:
      return "invalid argument";
    case errc::cancelled:
      return "operation cancelled";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category& dictum_category() noexcept {
  static const dictum_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), dictum_category()};
}

} // namespace dictum
