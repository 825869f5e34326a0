#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string read_all(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct Run {
  int rc = -1;
  std::string out;
  std::string err;
};

static Run run_cli(const std::string& bin, const std::string& args, const fs::path& work) {
  const fs::path out = work / "stdout.txt";
  const fs::path err = work / "stderr.txt";
  std::string cmd = "\"" + bin + "\" " + args +
                    " >\"" + out.string() + "\" 2>\"" + err.string() + "\"";
  Run r;
  r.rc = std::system(cmd.c_str());
  r.out = read_all(out);
  r.err = read_all(err);
  return r;
}

int main() {
  const std::string bin = env_or("HC_HEADCAT_BIN", "build/headcat");
  if (!fs::exists(bin)) { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }
  if (!fs::exists("tests/data/abcd.txt")) { std::cerr << "[ERR] fixtures not found\n"; return 2; }

  const fs::path work = fs::temp_directory_path() / ("headcat-it-" + std::to_string(std::time(nullptr)));
  fs::create_directories(work);

  bool ok = true;
  auto check = [&](bool cond, const std::string& what, const Run& r) {
    if (cond) return;
    std::cerr << "[FAIL] " << what << " (rc=" << r.rc << ")\n"
              << "  stdout: " << r.out << "\n  stderr: " << r.err << "\n";
    ok = false;
  };

  {
    Run r = run_cli(bin, "-n 3 tests/data/abcd.txt", work);
    check(r.rc == 0 && r.out == "a\nb\nc\n" && r.err.empty(), "line mode", r);
  }
  {
    Run r = run_cli(bin, "-c 5 tests/data/hello.txt", work);
    check(r.rc == 0 && r.out == "hello", "byte mode", r);
  }
  {
    Run r = run_cli(bin, "tests/data/twelve.txt", work);
    check(r.rc == 0 && r.out == "one\ntwo\nthree\nfour\nfive\nsix\nseven\neight\nnine\nten\n",
          "default ten lines", r);
  }
  {
    Run r = run_cli(bin, "--lines=1 < tests/data/two.txt", work);
    check(r.rc == 0 && r.out == "Two lines.\n", "stdin by default", r);
  }
  {
    Run r = run_cli(bin, "-n 1 tests/data/abcd.txt - < tests/data/two.txt", work);
    check(r.rc == 0 && r.out == "==> tests/data/abcd.txt <==\na\n\n==> - <==\nTwo lines.\n",
          "file and stdin headers", r);
  }
  {
    Run r = run_cli(bin, "--lines 5 --bytes 5 tests/data/does-not-exist.txt", work);
    check(r.rc != 0 && r.out.empty() && r.err.find("cannot be used with") != std::string::npos,
          "conflicting flags", r);
    check(r.err.find("does-not-exist") == std::string::npos, "conflict reported before any open", r);
  }
  {
    Run r = run_cli(bin, "-n foo tests/data/abcd.txt", work);
    check(r.rc != 0 && r.out.empty() && r.err.find("headcat: illegal line count -- foo") == 0,
          "illegal line count", r);
  }
  {
    Run r = run_cli(bin, "-c 0 tests/data/abcd.txt", work);
    check(r.rc != 0 && r.err.find("illegal byte count -- 0") != std::string::npos, "illegal byte count", r);
  }
  {
    Run r = run_cli(bin, "-n 1 tests/data/abcd.txt nope.txt tests/data/two.txt", work);
    const std::string want_err = std::string("nope.txt: ") + std::strerror(ENOENT) + "\n";
    check(r.rc == 0, "missing source is not fatal", r);
    check(r.err == want_err, "missing source diagnostic", r);
    check(r.out == "==> tests/data/abcd.txt <==\na\n\n==> tests/data/two.txt <==\nTwo lines.\n",
          "remaining sources printed", r);
  }
  {
    Run r = run_cli(bin, "--help", work);
    check(r.rc == 0 && r.out.rfind("Usage: headcat", 0) == 0, "help", r);
  }
  {
    Run r = run_cli(bin, "--version", work);
    check(r.rc == 0 && r.out.rfind("headcat ", 0) == 0, "version", r);
  }

  std::error_code ec;
  fs::remove_all(work, ec);

  if (!ok) return 1;
  std::cout << "[PASS] end-to-end cli\n";
  return 0;
}
