#include "headcat/utf8_lossy.hpp"
#include <simdjson.h>

namespace hc {

void Utf8LossyDecoder::feed(std::string_view chunk, std::string& out) {
  if (chunk.empty()) return;
  // Nothing carried and the whole chunk is well-formed: copy through.
  if (need_ == 0 && simdjson::validate_utf8(chunk.data(), chunk.size())) {
    out.append(chunk.data(), chunk.size());
    return;
  }
  out.reserve(out.size() + chunk.size());
  decode_slow(chunk, out);
}

void Utf8LossyDecoder::decode_slow(std::string_view s, std::string& out) {
  std::size_t i = 0;
  while (i < s.size()) {
    const unsigned char b = static_cast<unsigned char>(s[i]);

    if (need_ > 0) {
      if (b >= lo_ && b <= hi_) {
        pending_[pending_len_++] = s[i++];
        lo_ = 0x80; hi_ = 0xBF;
        if (--need_ == 0) {
          out.append(pending_, pending_len_);
          pending_len_ = 0;
        }
        continue;
      }
      // Truncated sequence; `b` is looked at again as a fresh lead byte.
      out.append(kReplacementChar);
      ++replacements_;
      need_ = 0;
      pending_len_ = 0;
      continue;
    }

    ++i;
    if (b < 0x80) { out.push_back(static_cast<char>(b)); continue; }

    if (b >= 0xC2 && b <= 0xDF)      { need_ = 1; lo_ = 0x80; hi_ = 0xBF; }
    else if (b == 0xE0)              { need_ = 2; lo_ = 0xA0; hi_ = 0xBF; }
    else if (b == 0xED)              { need_ = 2; lo_ = 0x80; hi_ = 0x9F; } // no surrogates
    else if (b >= 0xE1 && b <= 0xEF) { need_ = 2; lo_ = 0x80; hi_ = 0xBF; }
    else if (b == 0xF0)              { need_ = 3; lo_ = 0x90; hi_ = 0xBF; }
    else if (b >= 0xF1 && b <= 0xF3) { need_ = 3; lo_ = 0x80; hi_ = 0xBF; }
    else if (b == 0xF4)              { need_ = 3; lo_ = 0x80; hi_ = 0x8F; } // <= U+10FFFF
    else {
      // stray continuation byte, overlong lead (C0/C1) or F5..FF
      out.append(kReplacementChar);
      ++replacements_;
      continue;
    }
    pending_[0] = static_cast<char>(b);
    pending_len_ = 1;
  }
}

void Utf8LossyDecoder::finish(std::string& out) {
  if (need_ > 0) {
    out.append(kReplacementChar);
    ++replacements_;
  }
  need_ = 0;
  pending_len_ = 0;
  lo_ = 0x80; hi_ = 0xBF;
}

std::string decode_utf8_lossy(std::string_view bytes) {
  std::string out;
  Utf8LossyDecoder dec;
  dec.feed(bytes, out);
  dec.finish(out);
  return out;
}

}
