// SPDX-License-Identifier: UNLICENSED
#include "fakes.hpp"

#include <Dictum/core/error.hpp>
#include <Dictum/engine/segmenter.hpp>
#include <Dictum/vad/detector.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using dictum::engine::utterance_segmenter;
using namespace dictum::test;

namespace {

struct pipeline {
  explicit pipeline(std::vector<float> probabilities, uint32_t native_rate = 16000) {
    script->probabilities.assign(probabilities.begin(), probabilities.end());
    REQUIRE_FALSE(vad.init(std::make_unique<scripted_vad_model>(script), dictum::vad::vad_config{0.5F, 2, 2}, 512));
    REQUIRE_FALSE(segmenter.init(native_rate));
  }

  void feed(std::size_t samples) {
    const std::vector<float> audio(samples, 0.1F);
    segmenter.feed(audio, [this](const std::string& text) { texts.push_back(text); });
  }

  std::shared_ptr<vad_script> script{std::make_shared<vad_script>()};
  std::shared_ptr<transcriber_script> stt{std::make_shared<transcriber_script>()};
  dictum::vad::voice_activity_detector vad;
  fake_transcriber transcriber{stt};
  utterance_segmenter segmenter{vad, transcriber};
  std::vector<std::string> texts;
};

} // namespace

TEST_CASE("utterance is transcribed on speech end with each chunk buffered once", "[engine][segmenter]") {
  pipeline p({0.9F, 0.9F, 0.9F, 0.1F, 0.1F, 0.0F});
  p.feed(6 * 512);

  REQUIRE(p.script->calls == 6);
  // The speech_start chunk opens the buffer; the chunk before it is dropped.
  REQUIRE(p.stt->utterance_sizes == std::vector<std::size_t>{4 * 512});
  REQUIRE(p.texts == std::vector<std::string>{"hello world"});
  REQUIRE(p.segmenter.buffered_samples() == 0);
  REQUIRE_FALSE(p.segmenter.in_utterance());
}

TEST_CASE("audio is carried over until a full chunk is available", "[engine][segmenter]") {
  pipeline p({});
  p.feed(1000);
  REQUIRE(p.script->calls == 0);
  p.feed(24);
  REQUIRE(p.script->calls == 2);
  p.feed(511);
  REQUIRE(p.script->calls == 2);
}

TEST_CASE("non-16 kHz input is resampled before the vad", "[engine][segmenter]") {
  pipeline p({}, 48000);
  p.feed(3 * 1024); // 3 * 341 = 1023 samples at 16 kHz
  REQUIRE(p.script->calls == 1);
  p.feed(1024); // 511 carried + 341
  REQUIRE(p.script->calls == 2);
}

TEST_CASE("failed transcription clears the utterance", "[engine][segmenter]") {
  pipeline p({0.9F, 0.9F, 0.1F, 0.1F, 0.9F, 0.9F, 0.1F, 0.1F});
  p.stt->error = dictum::errc::transcription_failed;
  p.feed(4 * 512);
  REQUIRE(p.stt->utterance_sizes.size() == 1);
  REQUIRE(p.texts.empty());
  REQUIRE(p.segmenter.buffered_samples() == 0);

  p.stt->error = {};
  p.feed(4 * 512);
  REQUIRE(p.stt->utterance_sizes == std::vector<std::size_t>{3 * 512, 3 * 512});
  REQUIRE(p.texts == std::vector<std::string>{"hello world"});
}

TEST_CASE("empty transcription is not delivered", "[engine][segmenter]") {
  pipeline p({0.9F, 0.9F, 0.1F, 0.1F});
  p.stt->text.clear();
  p.feed(4 * 512);
  REQUIRE(p.stt->utterance_sizes.size() == 1);
  REQUIRE(p.texts.empty());
}

TEST_CASE("bursts shorter than the speech debounce are ignored", "[engine][segmenter]") {
  pipeline p({0.9F, 0.1F, 0.9F, 0.1F, 0.9F, 0.1F});
  p.feed(6 * 512);
  REQUIRE(p.script->calls == 6);
  REQUIRE(p.stt->utterance_sizes.empty());
  REQUIRE(p.texts.empty());
}

TEST_CASE("vad failure discards the utterance and resets the detector", "[engine][segmenter]") {
  pipeline p({0.9F, 0.9F, 0.9F, 0.1F, 0.1F});
  p.script->fail_at_call = 4;
  p.feed(2 * 512);
  REQUIRE(p.segmenter.in_utterance());
  REQUIRE(p.segmenter.buffered_samples() == 512);

  p.feed(4 * 512); // call 3 speech, call 4 fails, calls 5-6 silence
  REQUIRE(p.script->calls == 6);
  REQUIRE_FALSE(p.segmenter.in_utterance());
  REQUIRE(p.segmenter.buffered_samples() == 0);
  REQUIRE(p.stt->utterance_sizes.empty());
}
