#include <Dictum/audio/resampler.hpp>
#include <Dictum/core/error.hpp>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <new>
#include <numbers>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <fftw3.h>
#include <spdlog/spdlog.h>

namespace dictum::audio {
namespace {

// Fraction of the lower Nyquist frequency kept by the anti-aliasing filter.
constexpr double cutoff_ratio = 0.95;

// FFTW's planner is not thread-safe.
std::mutex& planner_mutex() {
  static std::mutex mutex;
  return mutex;
}

// Blackman-Harris windowed sinc, normalised to unity DC gain.
std::vector<float> lowpass_taps(std::size_t length, double cutoff) {
  std::vector<float> taps(length);
  const double center = static_cast<double>(length - 1) / 2.0;
  const double span = length > 1 ? static_cast<double>(length - 1) : 1.0;
  double sum = 0.0;
  for (std::size_t n = 0; n < length; ++n) {
    const double x = static_cast<double>(n) - center;
    const double arg = 2.0 * cutoff * x;
    const double sinc = x == 0.0 ? 1.0 : std::sin(std::numbers::pi * arg) / (std::numbers::pi * arg);
    const double phase = 2.0 * std::numbers::pi * static_cast<double>(n) / span;
    const double window = length > 1
      ? 0.35875 - 0.48829 * std::cos(phase) + 0.14128 * std::cos(2.0 * phase) - 0.01168 * std::cos(3.0 * phase)
      : 1.0;
    const double value = 2.0 * cutoff * sinc * window;
    taps[n] = static_cast<float>(value);
    sum += value;
  }
  if (sum != 0.0) {
    for (auto& tap : taps) {
      tap = static_cast<float>(tap / sum);
    }
  }
  return taps;
}

} // namespace

struct audio_resampler::impl {
  impl() = default;
  ~impl() {
    {
      const std::lock_guard<std::mutex> lock(planner_mutex());
      if (forward != nullptr) {
        fftwf_destroy_plan(forward);
      }
      if (inverse != nullptr) {
        fftwf_destroy_plan(inverse);
      }
    }
    fftwf_free(time_in);
    fftwf_free(spectrum_in);
    fftwf_free(spectrum_out);
    fftwf_free(time_out);
  }

  impl(const impl&) = delete;
  impl& operator=(const impl&) = delete;
  impl(impl&&) = delete;
  impl& operator=(impl&&) = delete;

  std::size_t n_in{0};
  std::size_t n_out{0};
  float* time_in{nullptr};
  fftwf_complex* spectrum_in{nullptr};
  fftwf_complex* spectrum_out{nullptr};
  float* time_out{nullptr};
  fftwf_plan forward{nullptr};
  fftwf_plan inverse{nullptr};
  std::vector<std::complex<float>> filter;
  std::vector<float> overlap;

  bool build(std::size_t chunk_in, std::size_t chunk_out) {
    n_in = chunk_in;
    n_out = chunk_out;

    time_in = fftwf_alloc_real(2 * n_in);
    spectrum_in = fftwf_alloc_complex(n_in + 1);
    spectrum_out = fftwf_alloc_complex(n_out + 1);
    time_out = fftwf_alloc_real(2 * n_out);
    if (time_in == nullptr || spectrum_in == nullptr || spectrum_out == nullptr || time_out == nullptr) {
      return false;
    }

    {
      const std::lock_guard<std::mutex> lock(planner_mutex());
      forward = fftwf_plan_dft_r2c_1d(static_cast<int>(2 * n_in), time_in, spectrum_in, FFTW_ESTIMATE);
      inverse = fftwf_plan_dft_c2r_1d(static_cast<int>(2 * n_out), spectrum_out, time_out, FFTW_ESTIMATE);
    }
    if (forward == nullptr || inverse == nullptr) {
      return false;
    }

    const double ratio = static_cast<double>(n_out) / static_cast<double>(n_in);
    const double cutoff = 0.5 * (std::min)(1.0, ratio) * cutoff_ratio;
    const auto taps = lowpass_taps(n_in, cutoff);

    std::fill(time_in, time_in + 2 * n_in, 0.0F);
    std::copy(taps.begin(), taps.end(), time_in);
    fftwf_execute(forward);

    filter.resize(n_in + 1);
    for (std::size_t k = 0; k <= n_in; ++k) {
      filter[k] = {spectrum_in[k][0], spectrum_in[k][1]};
    }

    overlap.assign(n_out, 0.0F);
    return true;
  }

  void process_block(std::span<const float> block, std::vector<float>& output) {
    std::copy(block.begin(), block.end(), time_in);
    std::fill(time_in + n_in, time_in + 2 * n_in, 0.0F);
    fftwf_execute(forward);

    const fftwf_complex* spec_in = spectrum_in;
    fftwf_complex* spec_out = spectrum_out;
    const std::size_t shared_bins = (std::min)(n_in, n_out);
    for (std::size_t k = 0; k <= n_out; ++k) {
      if (k <= shared_bins) {
        const std::complex<float> value = std::complex<float>(spec_in[k][0], spec_in[k][1]) * filter[k];
        spec_out[k][0] = value.real();
        spec_out[k][1] = value.imag();
      } else {
        spec_out[k][0] = 0.0F;
        spec_out[k][1] = 0.0F;
      }
    }
    fftwf_execute(inverse);

    const float scale = 1.0F / static_cast<float>(2 * n_in);
    const float* out = time_out;
    for (std::size_t i = 0; i < n_out; ++i) {
      output.push_back(out[i] * scale + overlap[i]);
      overlap[i] = out[n_out + i] * scale;
    }
  }
};

audio_resampler::audio_resampler() = default;
audio_resampler::~audio_resampler() = default;

audio_resampler::audio_resampler(audio_resampler&& other) noexcept
  : pimpl_(std::move(other.pimpl_)),
    input_rate_(other.input_rate_),
    output_rate_(other.output_rate_),
    chunk_size_in_(other.chunk_size_in_),
    chunk_size_out_(other.chunk_size_out_) {
  other.chunk_size_in_ = 0;
  other.chunk_size_out_ = 0;
}

audio_resampler& audio_resampler::operator=(audio_resampler&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  pimpl_ = std::move(other.pimpl_);
  input_rate_ = other.input_rate_;
  output_rate_ = other.output_rate_;
  chunk_size_in_ = other.chunk_size_in_;
  chunk_size_out_ = other.chunk_size_out_;
  other.chunk_size_in_ = 0;
  other.chunk_size_out_ = 0;
  return *this;
}

std::error_code audio_resampler::init(uint32_t input_rate, uint32_t output_rate, std::size_t chunk_size) noexcept {
  pimpl_.reset();
  chunk_size_in_ = 0;
  chunk_size_out_ = 0;

  if (input_rate == 0 || output_rate == 0 || chunk_size == 0) {
    spdlog::error("resampler: invalid parameters {} Hz -> {} Hz, chunk {}", input_rate, output_rate, chunk_size);
    return errc::resampler_setup_failed;
  }

  const double exact = static_cast<double>(chunk_size) * output_rate / input_rate;
  const auto chunk_out = (std::max)(std::size_t{1}, static_cast<std::size_t>(std::llround(exact)));

  try {
    auto state = std::make_unique<impl>();
    if (!state->build(chunk_size, chunk_out)) {
      spdlog::error("resampler: failed to plan transforms for chunk {}", chunk_size);
      return errc::resampler_setup_failed;
    }
    pimpl_ = std::move(state);
  } catch (const std::bad_alloc&) {
    return errc::resampler_setup_failed;
  }

  input_rate_ = input_rate;
  output_rate_ = output_rate;
  chunk_size_in_ = chunk_size;
  chunk_size_out_ = chunk_out;
  spdlog::debug("resampler: {} Hz -> {} Hz, chunk {} -> {}", input_rate, output_rate, chunk_size_in_, chunk_size_out_);
  return {};
}

std::vector<float> audio_resampler::process(std::span<const float> input) {
  std::vector<float> output;
  if (!pimpl_ || input.empty()) {
    return output;
  }

  const std::size_t chunks = input.size() / chunk_size_in_;
  output.reserve(chunks * chunk_size_out_);
  for (std::size_t i = 0; i < chunks; ++i) {
    pimpl_->process_block(input.subspan(i * chunk_size_in_, chunk_size_in_), output);
  }
  return output;
}

void audio_resampler::reset() noexcept {
  if (pimpl_) {
    std::fill(pimpl_->overlap.begin(), pimpl_->overlap.end(), 0.0F);
  }
}

} // namespace dictum::audio
