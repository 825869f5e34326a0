#pragma once
#include "headcat/cli_config.hpp"
#include "headcat/input_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace hc {

enum class SourceStatus { Ok, OpenError, ReadError, OutputError };

// Result of one source. OpenError/ReadError are reported and skipped;
// OutputError stops the run.
struct SourceOutcome {
  SourceStatus status = SourceStatus::Ok;
  int error = 0; // errno for any non-Ok status
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  std::uint64_t lines_out = 0;

  bool fatal() const noexcept { return status == SourceStatus::OutputError; }
};

struct RunSummary {
  std::size_t sources = 0;        // attempted, in order
  std::size_t failed_sources = 0; // open/read errors (diagnosed)
  std::uint64_t bytes_read = 0;
  std::uint64_t bytes_written = 0;
  bool output_failed = false;
  int output_error = 0;

  bool ok() const noexcept { return !output_failed; }
};

class HeadPrinter {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // byte-mode read size
    OpenOptions open;
  };

  HeadPrinter(RunConfig run, std::FILE* out, std::FILE* err);
  HeadPrinter(RunConfig run, Config cfg, std::FILE* out, std::FILE* err);

  // Processes every source in order. Stops early only on an output error.
  RunSummary run();

  // Opens, heads and closes the source at `index`; writes the header and
  // any diagnostic itself.
  SourceOutcome print_source(std::size_t index, const std::string& name);

private:
  SourceOutcome copy_lines(InputStream& in);
  SourceOutcome copy_bytes(InputStream& in);
  bool write_out(const char* data, std::size_t n, SourceOutcome& o);
  bool write_out(const std::string& s, SourceOutcome& o) { return write_out(s.data(), s.size(), o); }
  bool flush_out(SourceOutcome& o);
  void diagnose(const std::string& name, int err);

  RunConfig run_;
  Config cfg_;
  std::FILE* out_;
  std::FILE* err_;
};

// "<name>: <cause>"
std::string format_diagnostic(const std::string& name, int err);

}
