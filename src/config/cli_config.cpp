#include "headcat/cli_config.hpp"
#include "headcat/count_parse.hpp"

#include <optional>
#include <string>
#include <utility>

#ifndef HC_VERSION
#define HC_VERSION "0.1.0"
#endif

namespace hc {

namespace {

enum class Take { NoMatch, Value, Missing };

CliResult fail(ConfigError e, std::string msg, std::string token = {}) {
  CliResult r;
  r.action = CliAction::Error;
  r.error = e;
  r.message = std::move(msg);
  r.bad_token = std::move(token);
  return r;
}

}

const char* usage_text() noexcept {
  return
    "Usage: headcat [-n LINES | -c BYTES] [FILE]...\n"
    "Print the first 10 lines of each FILE to standard output.\n"
    "With more than one FILE, precede each with a header giving the file name.\n"
    "With no FILE, or when FILE is -, read standard input.\n"
    "\n"
    "  -n, --lines=LINES   print the first LINES lines (default 10)\n"
    "  -c, --bytes=BYTES   print the first BYTES bytes; overrides --lines\n"
    "  -h, --help          display this help and exit\n"
    "  -V, --version       output version information and exit\n";
}

const char* version_text() noexcept {
  return "headcat " HC_VERSION "\n";
}

CliResult parse_cli(int argc, const char* const* argv) {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return parse_cli(args);
}

CliResult parse_cli(const std::vector<std::string>& args) {
  CliResult res;
  std::vector<std::string> sources;
  std::optional<std::string> lines_tok;
  std::optional<std::string> bytes_tok;
  bool options_done = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];

    // -n N | -nN | --lines N | --lines=N
    auto take = [&](const char* shrt, const std::string& lng, std::optional<std::string>* out) {
      if (a == shrt || a == lng) {
        if (i + 1 >= args.size()) return Take::Missing;
        *out = args[++i];
        return Take::Value;
      }
      if (a.rfind(lng + "=", 0) == 0) { *out = a.substr(lng.size() + 1); return Take::Value; }
      if (a.size() > 2 && a.rfind(shrt, 0) == 0) { *out = a.substr(2); return Take::Value; }
      return Take::NoMatch;
    };

    if (!options_done && a.size() > 1 && a[0] == '-') {
      if (a == "--") { options_done = true; continue; }
      if (a == "-h" || a == "--help")    { res.action = CliAction::Help;    return res; }
      if (a == "-V" || a == "--version") { res.action = CliAction::Version; return res; }

      Take t = take("-n", "--lines", &lines_tok);
      if (t == Take::Missing) return fail(ConfigError::MissingValue, "option '--lines' requires a value");
      if (t == Take::Value) continue;

      t = take("-c", "--bytes", &bytes_tok);
      if (t == Take::Missing) return fail(ConfigError::MissingValue, "option '--bytes' requires a value");
      if (t == Take::Value) continue;

      return fail(ConfigError::UnknownOption, "unrecognized option '" + a + "'");
    }
    sources.push_back(a);
  }

  if (lines_tok && bytes_tok) {
    return fail(ConfigError::ConflictingFlags,
                "the argument '--lines <LINES>' cannot be used with '--bytes <BYTES>'");
  }

  if (lines_tok) {
    std::string bad;
    auto n = parse_positive_count(*lines_tok, &bad);
    if (!n) return fail(ConfigError::InvalidLineCount, "illegal line count -- " + bad, bad);
    res.config.lines = *n;
  }

  if (bytes_tok) {
    std::string bad;
    auto n = parse_positive_count(*bytes_tok, &bad);
    if (!n) return fail(ConfigError::InvalidByteCount, "illegal byte count -- " + bad, bad);
    res.config.bytes = *n;
  }

  if (!sources.empty()) res.config.sources = std::move(sources);
  return res;
}

}
