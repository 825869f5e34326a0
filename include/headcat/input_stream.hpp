#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace hc {

// A named, buffered, read-once byte source. Reads go through stdio, so
// several streams over the same FILE* (e.g. "-" twice) continue where the
// previous one stopped.
class InputStream {
public:
  virtual ~InputStream() = default;

  InputStream(const InputStream&) = delete;
  InputStream& operator=(const InputStream&) = delete;

  // Up to `n` bytes into `dst`; fewer only at end of source or on error.
  // Returns 0 at end of source; check last_error() to tell the two apart.
  std::size_t read(char* dst, std::size_t n);

  // Appends one line to `out`, including its '\n' when the data has one.
  // Returns false when nothing was read (end of source or error).
  bool read_line(std::string& out);

  const std::string& name() const noexcept { return name_; }
  int  last_error() const noexcept { return last_errno_; }
  bool failed() const noexcept { return last_errno_ != 0; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

protected:
  InputStream(std::string name, std::FILE* f) : name_(std::move(name)), f_(f) {}

  std::FILE* file() const noexcept { return f_; }

private:
  void note_error() noexcept;

  std::string name_;
  std::FILE* f_;
  int last_errno_{0};
  std::uint64_t bytes_{0};
};

// Process standard input (or a substitute handle). Never closes it.
class StdinStream final : public InputStream {
public:
  explicit StdinStream(std::FILE* in = stdin);
  ~StdinStream() override;
};

// A file opened by path; closed on destruction.
class FileStream final : public InputStream {
public:
  struct Config {
    std::size_t buffer_bytes = 64 * 1024;
  };

  // nullptr on failure, with the cause in *errno_out.
  static std::unique_ptr<FileStream> open(const std::string& path, Config cfg, int* errno_out);
  static std::unique_ptr<FileStream> open(const std::string& path, int* errno_out);

  ~FileStream() override;

private:
  FileStream(std::string path, std::FILE* f, Config cfg);

  std::unique_ptr<char[]> buf_; // stdio buffer; must outlive fclose
};

struct OpenOptions {
  std::FILE* stdin_file = stdin;
  FileStream::Config file;
};

// "-" -> StdinStream (cannot fail); anything else -> FileStream.
std::unique_ptr<InputStream> open_source(const std::string& name,
                                         const OpenOptions& opts,
                                         int* errno_out);

}
