#include <Dictum/transcribe/transcriber.hpp>

#include <string>
#include <string_view>

namespace dictum::transcribe {

std::string trim_text(std::string_view text) {
  constexpr std::string_view whitespace = " \t\r\n\v\f";
  const auto first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(whitespace);
  return std::string(text.substr(first, last - first + 1));
}

} // namespace dictum::transcribe
