#include "headcat/count_parse.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

int main(){
  int fails = 0;

  auto expect_ok = [&](const char* tok, std::uint64_t want){
    std::string bad = "untouched";
    auto v = hc::parse_positive_count(tok, &bad);
    if (!v || *v != want) {
      std::cerr << "[FAIL] '" << tok << "' expected " << want << "\n"; ++fails;
    } else if (bad != "untouched") {
      std::cerr << "[FAIL] '" << tok << "' wrote bad_token on success\n"; ++fails;
    }
  };
  auto expect_bad = [&](const char* tok){
    std::string bad;
    auto v = hc::parse_positive_count(tok, &bad);
    if (v) { std::cerr << "[FAIL] '" << tok << "' accepted as " << *v << "\n"; ++fails; return; }
    if (bad != tok) { std::cerr << "[FAIL] '" << tok << "' carried '" << bad << "'\n"; ++fails; }
  };

  expect_ok("3", 3);
  expect_ok("1", 1);
  expect_ok("10", 10);
  expect_ok("007", 7);
  expect_ok("+7", 7);
  expect_ok("18446744073709551615", std::numeric_limits<std::uint64_t>::max());

  expect_bad("0");
  expect_bad("00");
  expect_bad("foo");
  expect_bad("-3");
  expect_bad("-0");
  expect_bad("");
  expect_bad("+");
  expect_bad("+-3");
  expect_bad(" 3");
  expect_bad("3 ");
  expect_bad("3.0");
  expect_bad("1e3");
  expect_bad("12abc");
  expect_bad("18446744073709551616");

  // null bad_token is allowed
  if (hc::parse_positive_count("nope")) { std::cerr << "[FAIL] 'nope' accepted\n"; ++fails; }

  if (fails) { std::cerr << "[FAIL] " << fails << " count parse case(s)\n"; return 1; }
  std::cout << "[PASS] count parse\n";
  return 0;
}
