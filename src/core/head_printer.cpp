#include "headcat/head_printer.hpp"
#include "headcat/utf8_lossy.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

namespace hc {

std::string format_diagnostic(const std::string& name, int err) {
  return name + ": " + std::strerror(err);
}

HeadPrinter::HeadPrinter(RunConfig run, std::FILE* out, std::FILE* err)
  : HeadPrinter(std::move(run), Config{}, out, err) {}

HeadPrinter::HeadPrinter(RunConfig run, Config cfg, std::FILE* out, std::FILE* err)
  : run_(std::move(run)), cfg_(cfg), out_(out), err_(err) {
  if (run_.sources.empty()) run_.sources.emplace_back("-");
  if (cfg_.chunk_bytes == 0) cfg_.chunk_bytes = 64 * 1024;
}

RunSummary HeadPrinter::run() {
  RunSummary s;
  for (std::size_t i = 0; i < run_.sources.size(); ++i) {
    SourceOutcome o = print_source(i, run_.sources[i]);
    ++s.sources;
    s.bytes_read += o.bytes_in;
    s.bytes_written += o.bytes_out;
    if (o.fatal()) {
      s.output_failed = true;
      s.output_error = o.error;
      return s;
    }
    if (o.status != SourceStatus::Ok) ++s.failed_sources;
  }
  return s;
}

SourceOutcome HeadPrinter::print_source(std::size_t index, const std::string& name) {
  int open_err = 0;
  std::unique_ptr<InputStream> in = open_source(name, cfg_.open, &open_err);
  if (!in) {
    SourceOutcome o;
    if (!flush_out(o)) return o;
    o.status = SourceStatus::OpenError;
    o.error = open_err;
    diagnose(name, open_err);
    return o;
  }

  SourceOutcome o;
  if (run_.sources.size() > 1) {
    std::string header;
    if (index > 0) header.push_back('\n');
    header += "==> " + name + " <==\n";
    if (!write_out(header, o)) return o;
  }

  SourceOutcome body = run_.byte_mode() ? copy_bytes(*in) : copy_lines(*in);
  body.bytes_out += o.bytes_out;
  if (body.fatal()) return body;

  // Flush per source so an output error is charged to this source.
  if (!flush_out(body)) return body;
  if (body.status == SourceStatus::ReadError) diagnose(name, body.error);
  return body;
}

SourceOutcome HeadPrinter::copy_lines(InputStream& in) {
  SourceOutcome o;
  std::string line;
  while (o.lines_out < run_.lines) {
    line.clear();
    if (!in.read_line(line)) break;
    if (!write_out(line, o)) break;
    ++o.lines_out;
  }
  o.bytes_in = in.bytes_read();
  if (!o.fatal() && in.failed()) {
    o.status = SourceStatus::ReadError;
    o.error = in.last_error();
  }
  return o;
}

SourceOutcome HeadPrinter::copy_bytes(InputStream& in) {
  SourceOutcome o;
  std::uint64_t remaining = *run_.bytes;
  std::vector<char> buf(static_cast<std::size_t>(
      std::min<std::uint64_t>(remaining, cfg_.chunk_bytes)));
  Utf8LossyDecoder dec;
  std::string text;

  while (remaining > 0) {
    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buf.size()));
    const std::size_t got = in.read(buf.data(), want);
    if (got == 0) break;
    remaining -= got;
    text.clear();
    dec.feed(std::string_view(buf.data(), got), text);
    if (!write_out(text, o)) break;
    if (got < want) break; // end of source or error
  }

  if (!o.fatal()) {
    text.clear();
    dec.finish(text);
    write_out(text, o);
  }
  o.bytes_in = in.bytes_read();
  if (!o.fatal() && in.failed()) {
    o.status = SourceStatus::ReadError;
    o.error = in.last_error();
  }
  return o;
}

bool HeadPrinter::write_out(const char* data, std::size_t n, SourceOutcome& o) {
  if (n == 0) return true;
  errno = 0;
  const std::size_t put = std::fwrite(data, 1, n, out_);
  o.bytes_out += put;
  if (put != n) {
    o.status = SourceStatus::OutputError;
    o.error = errno ? errno : EIO;
    return false;
  }
  return true;
}

bool HeadPrinter::flush_out(SourceOutcome& o) {
  errno = 0;
  if (std::fflush(out_) != 0) {
    o.status = SourceStatus::OutputError;
    o.error = errno ? errno : EIO;
    return false;
  }
  return true;
}

// Callers flush stdout first so the two streams interleave in order.
void HeadPrinter::diagnose(const std::string& name, int err) {
  std::fprintf(err_, "%s\n", format_diagnostic(name, err).c_str());
  std::fflush(err_);
}

}
