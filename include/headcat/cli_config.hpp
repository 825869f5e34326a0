#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hc {

inline constexpr std::uint64_t kDefaultLineCount = 10;

struct RunConfig {
  std::vector<std::string> sources{"-"};   // never empty; "-" is stdin
  std::uint64_t lines = kDefaultLineCount;  // ignored while `bytes` is set
  std::optional<std::uint64_t> bytes;       // byte mode when present

  bool byte_mode() const noexcept { return bytes.has_value(); }
};

enum class CliAction { Run, Help, Version, Error };

enum class ConfigError {
  None,
  InvalidLineCount,
  InvalidByteCount,
  ConflictingFlags,
  MissingValue,
  UnknownOption,
};

struct CliResult {
  CliAction action = CliAction::Run;
  RunConfig config;
  ConfigError error = ConfigError::None;
  std::string message;   // human-readable, set when action == Error
  std::string bad_token; // offending count token for Invalid*Count
};

// Parses argv[1..]. Both count flags given -> ConflictingFlags, checked
// before either value is validated. Repeated flags: last value wins.
CliResult parse_cli(int argc, const char* const* argv);
CliResult parse_cli(const std::vector<std::string>& args);

const char* usage_text() noexcept;
const char* version_text() noexcept;

}
