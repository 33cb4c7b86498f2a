#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dictum {

inline constexpr std::string_view auto_language = "auto";

// Active transcription language shared between the control plane and a
// running engine. "auto" (or empty) selects detection.
class language_cell {
public:
  language_cell() = default;
  explicit language_cell(std::string language) : language_(std::move(language)) {}

  void set(std::string language) {
    const std::lock_guard<std::mutex> lock(mutex_);
    language_ = std::move(language);
  }

  std::string get() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return language_;
  }

  // Code to pass to the backend, or nullopt for auto-detection.
  std::optional<std::string> forced() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (language_.empty() || language_ == auto_language) {
      return std::nullopt;
    }
    return language_;
  }

private:
  mutable std::mutex mutex_;
  std::string language_{auto_language};
};

} // namespace dictum
