// SPDX-License-Identifier: UNLICENSED
#include <Dictum/audio/buffer.hpp>

#include <stdexcept>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using dictum::audio::audio_buffer;
using Catch::Approx;

TEST_CASE("audio_buffer duration follows sample count and rate", "[audio]") {
  const audio_buffer one_second(std::vector<float>(16000, 0.0F), 16000);
  REQUIRE(one_second.duration_secs() == Approx(1.0F));

  const audio_buffer half(std::vector<float>(24000, 0.0F), 48000);
  REQUIRE(half.duration_secs() == Approx(0.5F));

  const audio_buffer no_rate(std::vector<float>(100, 0.0F), 0);
  REQUIRE(no_rate.duration_secs() == 0.0F);

  REQUIRE(audio_buffer::empty(16000).duration_secs() == 0.0F);
}

TEST_CASE("audio_buffer append concatenates same-rate buffers", "[audio]") {
  audio_buffer a({0.1F, 0.2F}, 16000);
  const audio_buffer b({0.3F}, 16000);
  a.append(b);
  REQUIRE(a.samples == std::vector<float>{0.1F, 0.2F, 0.3F});
  REQUIRE(a.sample_rate == 16000);

  a.clear();
  REQUIRE(a.samples.empty());
  REQUIRE(a.sample_rate == 16000);
}

TEST_CASE("audio_buffer append rejects mismatched rates", "[audio]") {
  audio_buffer a({0.1F}, 16000);
  const audio_buffer b({0.2F}, 48000);
  REQUIRE_THROWS_AS(a.append(b), std::invalid_argument);
  REQUIRE(a.samples.size() == 1);
}

TEST_CASE("samples outside [-1, 1] are kept as is", "[audio]") {
  audio_buffer a({1.5F, -2.0F}, 16000);
  a.append(audio_buffer({3.0F}, 16000));
  REQUIRE(a.samples == std::vector<float>{1.5F, -2.0F, 3.0F});
}

TEST_CASE("to_mono averages interleaved frames", "[audio]") {
  const std::vector<float> stereo{1.0F, 0.0F, 0.5F, 0.5F, -1.0F, 1.0F};
  const auto mono = dictum::audio::stereo_to_mono(stereo);
  REQUIRE(mono.size() == 3);
  REQUIRE(mono[0] == Approx(0.5F));
  REQUIRE(mono[1] == Approx(0.5F));
  REQUIRE(mono[2] == Approx(0.0F));

  const std::vector<float> quad{1.0F, 1.0F, 1.0F, 1.0F, 0.0F, 0.0F};
  const auto from_quad = dictum::audio::to_mono(quad, 4);
  REQUIRE(from_quad.size() == 1); // trailing partial frame dropped
  REQUIRE(from_quad[0] == Approx(1.0F));

  const std::vector<float> already{0.25F, -0.25F};
  REQUIRE(dictum::audio::to_mono(already, 1) == already);
}
