// SPDX-License-Identifier: UNLICENSED
#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace dictum::test {

struct wav_data {
  std::vector<float> samples; // first channel only
  uint32_t sample_rate{0};
};

// Minimal RIFF reader for 16-bit PCM fixtures.
inline bool read_wav(const std::filesystem::path& path, wav_data& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  const std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
    return false;
  }

  const auto u16 = [&](std::size_t at) {
    uint16_t v = 0;
    std::memcpy(&v, bytes.data() + at, sizeof(v));
    return v;
  };
  const auto u32 = [&](std::size_t at) {
    uint32_t v = 0;
    std::memcpy(&v, bytes.data() + at, sizeof(v));
    return v;
  };

  uint16_t channels = 0;
  uint16_t bits = 0;
  std::size_t pos = 12;
  while (pos + 8 <= bytes.size()) {
    const uint32_t size = u32(pos + 4);
    const std::size_t body = pos + 8;
    if (body + size > bytes.size()) {
      return false;
    }
    if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0 && size >= 16) {
      if (u16(body) != 1) {
        return false;
      }
      channels = u16(body + 2);
      out.sample_rate = u32(body + 4);
      bits = u16(body + 14);
    } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
      if (channels == 0 || bits != 16) {
        return false;
      }
      const std::size_t frames = size / (2U * channels);
      out.samples.resize(frames);
      for (std::size_t i = 0; i < frames; ++i) {
        int16_t s = 0;
        std::memcpy(&s, bytes.data() + body + i * 2U * channels, sizeof(s));
        out.samples[i] = static_cast<float>(s) / 32768.0F;
      }
      return true;
    }
    pos = body + size + (size & 1U);
  }
  return false;
}

} // namespace dictum::test
