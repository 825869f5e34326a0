#include "headcat/input_stream.hpp"
#include <cerrno>
#include <cstdio>

namespace hc {

void InputStream::note_error() noexcept {
  last_errno_ = errno ? errno : EIO;
}

std::size_t InputStream::read(char* dst, std::size_t n) {
  if (n == 0) return 0;
  errno = 0;
  std::size_t got = std::fread(dst, 1, n, f_);
  bytes_ += got;
  if (got < n && std::ferror(f_)) note_error();
  return got;
}

bool InputStream::read_line(std::string& out) {
  errno = 0;
  std::size_t got = 0;
  int c;
  while ((c = std::getc(f_)) != EOF) {
    out.push_back(static_cast<char>(c));
    ++got;
    if (c == '\n') break;
  }
  bytes_ += got;
  if (c == EOF && std::ferror(f_)) note_error();
  return got > 0;
}

StdinStream::StdinStream(std::FILE* in) : InputStream("-", in) {}

// Leave the handle reusable: a terminal can be read again after ^D.
StdinStream::~StdinStream() { std::clearerr(file()); }

FileStream::FileStream(std::string path, std::FILE* f, Config cfg)
  : InputStream(std::move(path), f) {
  if (cfg.buffer_bytes > 0) {
    buf_.reset(new char[cfg.buffer_bytes]);
    if (std::setvbuf(f, buf_.get(), _IOFBF, cfg.buffer_bytes) != 0) buf_.reset();
  }
}

FileStream::~FileStream() { std::fclose(file()); }

std::unique_ptr<FileStream> FileStream::open(const std::string& path, int* errno_out) {
  return open(path, Config{}, errno_out);
}

std::unique_ptr<FileStream> FileStream::open(const std::string& path, Config cfg, int* errno_out) {
  errno = 0;
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (errno_out) *errno_out = errno ? errno : ENOENT;
    return nullptr;
  }
  if (errno_out) *errno_out = 0;
  return std::unique_ptr<FileStream>(new FileStream(path, f, cfg));
}

std::unique_ptr<InputStream> open_source(const std::string& name,
                                         const OpenOptions& opts,
                                         int* errno_out) {
  if (name == "-") {
    if (errno_out) *errno_out = 0;
    return std::make_unique<StdinStream>(opts.stdin_file);
  }
  return FileStream::open(name, opts.file, errno_out);
}

}
