// SPDX-License-Identifier: UNLICENSED
#include "fakes.hpp"

#include <Dictum/core/error.hpp>
#include <Dictum/vad/detector.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using dictum::test::scripted_vad_model;
using dictum::test::vad_script;
using dictum::vad::vad_config;
using dictum::vad::vad_event;
using dictum::vad::voice_activity_detector;

TEST_CASE("detector rejects unsupported chunk sizes", "[vad]") {
  for (const std::size_t size : {0UL, 256UL, 480UL, 513UL, 2048UL}) {
    voice_activity_detector vad;
    auto script = std::make_shared<vad_script>();
    REQUIRE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, size) == dictum::errc::invalid_chunk_size);
    REQUIRE_FALSE(vad.is_loaded());
  }
  for (const std::size_t size : dictum::vad::supported_chunk_sizes) {
    voice_activity_detector vad;
    auto script = std::make_shared<vad_script>();
    REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, size));
    REQUIRE(vad.chunk_size() == size);
  }
}

TEST_CASE("detector requires initialization", "[vad]") {
  voice_activity_detector vad;
  float probability = 0.0F;
  const std::vector<float> chunk(512, 0.0F);
  REQUIRE(vad.process_chunk(chunk, probability) == dictum::errc::not_initialized);
}

TEST_CASE("detector rejects chunks of the wrong length", "[vad]") {
  auto script = std::make_shared<vad_script>();
  voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, 512));

  float probability = 0.0F;
  REQUIRE(vad.process_chunk(std::vector<float>(511, 0.0F), probability) == dictum::errc::invalid_chunk_size);
  REQUIRE(vad.process_chunk(std::vector<float>(1024, 0.0F), probability) == dictum::errc::invalid_chunk_size);
  REQUIRE(script->calls == 0);
}

TEST_CASE("detector prepends the previous chunk tail as context", "[vad]") {
  auto script = std::make_shared<vad_script>();
  voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, 512));

  std::vector<float> first(512);
  for (std::size_t i = 0; i < first.size(); ++i) {
    first[i] = static_cast<float>(i);
  }
  const std::vector<float> second(512, -1.0F);

  float probability = 0.0F;
  REQUIRE_FALSE(vad.process_chunk(first, probability));
  REQUIRE_FALSE(vad.process_chunk(second, probability));

  REQUIRE(script->inputs.size() == 2);
  const auto& in0 = script->inputs[0];
  const auto& in1 = script->inputs[1];
  REQUIRE(in0.size() == dictum::vad::context_size + 512);
  REQUIRE(std::all_of(in0.begin(), in0.begin() + 64, [](float v) { return v == 0.0F; }));
  REQUIRE(in0[64] == 0.0F);
  REQUIRE(in0.back() == 511.0F);

  // Context of the second call is the last 64 samples of the first chunk.
  REQUIRE(in1[0] == 448.0F);
  REQUIRE(in1[63] == 511.0F);
  REQUIRE(in1[64] == -1.0F);
}

TEST_CASE("detector feeds the returned state into the next call", "[vad]") {
  auto script = std::make_shared<vad_script>();
  voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, 512));

  float probability = 0.0F;
  const std::vector<float> chunk(512, 0.0F);
  REQUIRE_FALSE(vad.process_chunk(chunk, probability));
  REQUIRE_FALSE(vad.process_chunk(chunk, probability));

  REQUIRE(script->states[0].size() == dictum::vad::state_size);
  REQUIRE(script->states[0][0] == 0.0F);
  REQUIRE(script->states[1][0] == 1.0F);

  vad.reset();
  REQUIRE_FALSE(vad.process_chunk(chunk, probability));
  REQUIRE(script->states[2][0] == 0.0F);
}

TEST_CASE("failed inference leaves the state unchanged", "[vad]") {
  auto script = std::make_shared<vad_script>();
  script->fail_at_call = 2;
  voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{}, 512));

  float probability = 0.0F;
  const std::vector<float> chunk(512, 0.25F);
  REQUIRE_FALSE(vad.process_chunk(chunk, probability));
  REQUIRE(vad.process_chunk(chunk, probability) == dictum::errc::inference_failed);
  REQUIRE_FALSE(vad.process_chunk(chunk, probability));

  REQUIRE(script->states[1] == script->states[2]);
  REQUIRE(script->inputs[2][0] == 0.25F);
}

TEST_CASE("detector runs the end-to-end probability scenario", "[vad]") {
  auto script = std::make_shared<vad_script>();
  script->probabilities = {0.2F, 0.8F, 0.9F, 0.7F, 0.2F, 0.1F};
  voice_activity_detector vad;
  REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), vad_config{0.5F, 2, 2}, 512));

  const std::vector<float> chunk(512, 0.0F);
  std::vector<std::optional<vad_event>> events;
  for (int i = 0; i < 6; ++i) {
    std::optional<vad_event> ev;
    REQUIRE_FALSE(vad.process(chunk, ev));
    events.push_back(ev);
  }

  const std::vector<std::optional<vad_event>> expected{
    std::nullopt, std::nullopt, vad_event::speech_start, std::nullopt, std::nullopt, vad_event::speech_end};
  REQUIRE(events == expected);
}
