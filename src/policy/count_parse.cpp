#include "headcat/count_parse.hpp"
#include <system_error>
#include <fast_float/fast_float.h>

namespace hc {

std::optional<std::uint64_t> parse_positive_count(std::string_view token,
                                                  std::string* bad_token) {
  auto fail = [&]() -> std::optional<std::uint64_t> {
    if (bad_token) bad_token->assign(token.data(), token.size());
    return std::nullopt;
  };

  std::string_view digits = token;
  if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
  if (digits.empty()) return fail();

  // fast_float rejects a sign on unsigned targets, so "-3" and "+-3" land here too
  std::uint64_t out = 0;
  auto [ptr, ec] = fast_float::from_chars(digits.data(), digits.data() + digits.size(), out, 10);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) return fail();
  if (out == 0) return fail();
  return out;
}

}
