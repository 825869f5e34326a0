#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hc {

// U+FFFD as UTF-8.
inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// Incremental UTF-8 -> UTF-8 sanitizer. Every maximal ill-formed subpart
// becomes one U+FFFD; a sequence split across feed() calls is carried over.
class Utf8LossyDecoder {
public:
  void feed(std::string_view chunk, std::string& out);

  // Flushes a carried incomplete sequence (as one U+FFFD) and resets.
  void finish(std::string& out);

  std::uint64_t replacements() const noexcept { return replacements_; }

private:
  void decode_slow(std::string_view s, std::string& out);

  char pending_[4]{};
  std::size_t pending_len_{0};
  int need_{0};                 // continuation bytes still expected
  unsigned char lo_{0x80}, hi_{0xBF}; // accepted range for the next one
  std::uint64_t replacements_{0};
};

// One-shot convenience over the decoder.
std::string decode_utf8_lossy(std::string_view bytes);

}
