#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hc {

// Strictly-positive base-10 count (fast_float in .cpp).
// Zero, negative, non-numeric and out-of-range tokens all fail; on failure
// `bad_token` (if given) receives the token exactly as passed in.
std::optional<std::uint64_t> parse_positive_count(std::string_view token,
                                                  std::string* bad_token = nullptr);

}
