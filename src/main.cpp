#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "solvload/app/Runner.hpp"
#include "solvload/config/IniConfig.hpp"
#include "solvload/core/Errors.hpp"
#include "solvload/io/VectorFiles.hpp"

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  std::optional<int> threads;
  bool validate_config = false;

  // --pack-assignments <in.txt> <out.assn>
  fs::path pack_in;
  fs::path pack_out;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--threads N] [--validate-config]\n"
      << "       " << argv0 << " --pack-assignments <in.txt> <out.assn>\n"
      << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << SOLVLOAD_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--threads") {
      if (i + 1 >= argc) throw std::runtime_error("--threads requires a value");
      cli.threads = std::stoi(argv[++i]);
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else if (a == "--pack-assignments") {
      if (i + 2 >= argc) throw std::runtime_error("--pack-assignments requires <in.txt> <out.assn>");
      cli.pack_in = fs::path(argv[++i]);
      cli.pack_out = fs::path(argv[++i]);
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (cli.pack_in.empty() && cli.config.empty()) {
    throw std::runtime_error("--config is required (or use --pack-assignments)");
  }
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

    if (!cli.pack_in.empty()) {
      const auto rows = solvload::pack_assignment_text(cli.pack_in, cli.pack_out);
      std::cerr << "[SOLVLOAD] packed " << rows << " rows into " << cli.pack_out.string() << "\n";
      return 0;
    }

    solvload::IniConfig cfg(cli.config);
    solvload::Runner runner(cfg, solvload::RunOverrides{cli.threads});
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const solvload::Cancelled& e) {
    std::cerr << "Interrupted: " << e.what() << "\n";
    return 130;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
