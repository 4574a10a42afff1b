#include "cli/cli.hpp"
#include "crypto/key_manager.hpp"
#include "logger/logger.hpp"
#include "stash/stash.hpp"
#include "store/directory_backend.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <unordered_map>
#include <vector>
#include <boost/log/trivial.hpp>

struct ProgramOptions {
  std::string repo;
  std::string user;
  std::size_t jobs{0};
  std::string log_file;
  std::string verbosity{"warning"};
  std::string command;
  std::vector<std::string> args;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -r <repo> [options] <command> [args...]\n"
        << "Required arguments:\n"
        << "  -r, --repo <dir>          Object directory of the stash\n"
        << "Options:\n"
        << "  -u, --user <name>         User name mixed into key derivation\n"
        << "  -j, --jobs <n>            Worker threads (default: hardware threads)\n"
        << "  -l, --log <file>          Write the log to <file> instead of stderr\n"
        << "  -v, --verbosity <level>   trace, debug, info, warning, error or fatal\n"
        << "The passphrase is read from STASH_PASSPHRASE, or from standard input.\n\n";
  stash::cli::CLI::print_help(std::cerr);
  std::cerr << "Example: " << program_name << " -r /backup/objects commit ~/documents\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  std::size_t jobs_value = 0;

  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-r", &options.repo},
    {"--repo", &options.repo},
    {"-u", &options.user},
    {"--user", &options.user},
    {"-l", &options.log_file},
    {"--log", &options.log_file},
    {"-v", &options.verbosity},
    {"--verbosity", &options.verbosity},
    {"-j", nullptr},
    {"--jobs", nullptr}
  };

  int i = 1;
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.empty() || flag[0] != '-') {
      break;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (it->second) {
      *it->second = value;
      continue;
    }
    try {
      jobs_value = static_cast<std::size_t>(std::stoul(value));
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid job count: " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (i >= argc) {
    std::cerr << "Error: A command is required\n";
    print_usage(argv[0]);
    return options;
  }
  options.command = argv[i++];
  options.args.assign(argv + i, argv + argc);
  options.jobs = jobs_value;

  if (options.command != "help" && options.repo.empty()) {
    std::cerr << "Error: The repository directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

std::string read_passphrase() {
  if (const char* env = std::getenv("STASH_PASSPHRASE")) {
    return env;
  }
  return stash::cli::read_passphrase(std::cin, std::cerr, STDIN_FILENO);
}

int run_command(const ProgramOptions& options) {
  try {
    stash::logger::init_logging(options.log_file, stash::logger::parse_severity(options.verbosity));

    stash::StashConfig config;
    if (options.jobs > 0) {
      config.workers = options.jobs;
    }

    std::string passphrase = read_passphrase();
    if (passphrase.empty()) {
      std::cerr << "Error: Empty passphrase\n";
      return stash::cli::EXIT_FAILURE_STATUS;
    }

    stash::crypto::KeyManager keys(passphrase, options.user);
    stash::store::DirectoryBackend backend(options.repo);
    stash::Stash stash(backend, keys, config);
    stash.load();

    stash::cli::CLI cli(stash);
    return cli.process_command(options.command, options.args);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Fatal error: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return stash::cli::EXIT_FAILURE_STATUS;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return stash::cli::EXIT_FAILURE_STATUS;
  }
  if (options.command == "help") {
    stash::cli::CLI::print_help(std::cout);
    return stash::cli::EXIT_OK;
  }
  return run_command(options);
}
