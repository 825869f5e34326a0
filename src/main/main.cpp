#include "headcat/cli_config.hpp"
#include "headcat/head_printer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

int report_write_error(int err) {
  std::cerr << "headcat: write error: " << std::strerror(err) << "\n";
  return kExitFailure;
}

}

int main(int argc, char** argv) {
  hc::CliResult cli = hc::parse_cli(argc, argv);

  switch (cli.action) {
    case hc::CliAction::Help:
      std::cout << hc::usage_text();
      return std::cout.flush() ? kExitOk : report_write_error(EIO);
    case hc::CliAction::Version:
      std::cout << hc::version_text();
      return std::cout.flush() ? kExitOk : report_write_error(EIO);
    case hc::CliAction::Error:
      std::cerr << "headcat: " << cli.message << "\n"
                << "Try 'headcat --help' for more information.\n";
      return kExitFailure;
    case hc::CliAction::Run:
      break;
  }

  hc::HeadPrinter printer(cli.config, stdout, stderr);
  hc::RunSummary summary = printer.run();
  if (!summary.ok()) return report_write_error(summary.output_error);

  // Sources that failed to open or read were already diagnosed on stderr.
  return kExitOk;
}
