#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace dictum {

enum class errc {
  ok = 0,
  not_initialized,
  sample_rate_mismatch,
  invalid_chunk_size,
  no_input_device,
  unsupported_sample_format,
  device_start_failed,
  resampler_setup_failed,
  model_load_failed,
  inference_failed,
  transcription_failed,
  model_download_failed,
  model_size_mismatch,
  io_error,
  config_parse_failed,
  engine_unavailable,
  engine_lost,
  daemon_stopped,
  daemon_initializing,
  invalid_argument,
  cancelled,
};

const std::error_category& dictum_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

} // namespace dictum

template <>
struct std::is_error_code_enum<dictum::errc> : std::true_type {};
