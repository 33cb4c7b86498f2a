// SPDX-License-Identifier: UNLICENSED
#include "wav.hpp"

#include <Dictum/core/error.hpp>
#include <Dictum/vad/detector.hpp>
#include <Dictum/vad/silero_model.hpp>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

static std::optional<std::filesystem::path> env_path(const char* name) {
  const char* val_c = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
  if (val_c == nullptr || *val_c == '\0') {
    return std::nullopt;
  }
  return std::filesystem::path(val_c);
}

TEST_CASE("silero model reports a missing file", "[vad][onnx]") {
  dictum::vad::silero_vad_model model;
  REQUIRE(model.load("/nonexistent/silero_vad.onnx") == dictum::errc::model_load_failed);

  float probability = 0.0F;
  std::vector<float> next;
  const std::vector<float> input(64 + 512, 0.0F);
  const std::vector<float> state(dictum::vad::state_size, 0.0F);
  REQUIRE(model.infer(input, state, probability, next) == dictum::errc::not_initialized);
}

TEST_CASE("silero model scores silence low", "[vad][onnx]") {
  const auto model_path = env_path("DICTUM_VAD_MODEL");
  if (!model_path) {
    SKIP("DICTUM_VAD_MODEL not set");
  }

  auto model = std::make_unique<dictum::vad::silero_vad_model>();
  REQUIRE_FALSE(model->load(*model_path));

  dictum::vad::voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::move(model), dictum::vad::vad_config{}));

  const std::vector<float> silence(vad.chunk_size(), 0.0F);
  for (int i = 0; i < 10; ++i) {
    float probability = 1.0F;
    REQUIRE_FALSE(vad.process_chunk(silence, probability));
    REQUIRE(probability >= 0.0F);
    REQUIRE(probability < 0.5F);
  }
}

TEST_CASE("silence fixture produces no speech events", "[vad][onnx]") {
  const auto model_path = env_path("DICTUM_VAD_MODEL");
  const auto data_dir = env_path("DICTUM_TESTDATA");
  if (!model_path || !data_dir) {
    SKIP("DICTUM_VAD_MODEL or DICTUM_TESTDATA not set");
  }

  dictum::test::wav_data wav;
  REQUIRE(dictum::test::read_wav(*data_dir / "silence.wav", wav));
  REQUIRE(wav.sample_rate == dictum::vad::vad_sample_rate);

  auto model = std::make_unique<dictum::vad::silero_vad_model>();
  REQUIRE_FALSE(model->load(*model_path));
  dictum::vad::voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::move(model), dictum::vad::vad_config{}));

  const std::size_t chunk = vad.chunk_size();
  int events = 0;
  for (std::size_t offset = 0; offset + chunk <= wav.samples.size(); offset += chunk) {
    std::optional<dictum::vad::vad_event> ev;
    REQUIRE_FALSE(vad.process(std::span<const float>(wav.samples).subspan(offset, chunk), ev));
    if (ev) {
      ++events;
    }
  }
  REQUIRE(events == 0);
}
