#include "cli/cli.hpp"
#include <ctime>
#include <iomanip>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace stash {
namespace cli {

//==============================================
// PASSPHRASE INPUT
//==============================================

namespace {

// Terminal echo off for the lifetime of the guard
class EchoGuard {
public:
  explicit EchoGuard(int fd) : fd_(fd) {
    if (!::isatty(fd_)) {
      return;
    }
    if (::tcgetattr(fd_, &saved_) != 0) {
      throw std::runtime_error("cannot read terminal settings");
    }
    struct termios quiet = saved_;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (::tcsetattr(fd_, TCSAFLUSH, &quiet) != 0) {
      throw std::runtime_error("cannot disable terminal echo");
    }
    active_ = true;
  }

  ~EchoGuard() {
    if (active_ && ::tcsetattr(fd_, TCSAFLUSH, &saved_) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "CLI: Could not restore terminal echo";
    }
  }

  EchoGuard(const EchoGuard&) = delete;
  EchoGuard& operator=(const EchoGuard&) = delete;

  bool active() const { return active_; }

private:
  int fd_;
  struct termios saved_{};
  bool active_{false};
};

} // namespace

std::string read_passphrase(std::istream& in, std::ostream& prompt, int fd) {
  std::string passphrase;
  prompt << "Passphrase: " << std::flush;
  {
    EchoGuard guard(fd);
    std::getline(in, passphrase);
    if (guard.active()) {
      // The newline typed by the user was not echoed
      prompt << std::endl;
    }
  }
  return passphrase;
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(Stash& stash, std::ostream& out)
  : stash_(stash)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "commit") {
    return handle_commit_command(args);
  }
  if (command == "checkout") {
    return handle_checkout_command(args);
  }
  if (command == "ls") {
    return handle_list_command(args);
  }
  if (command == "help") {
    print_help(out_);
    return EXIT_OK;
  }

  out_ << "Unknown command: " << command << std::endl;
  print_help(out_);
  return EXIT_FAILURE_STATUS;
}

void CLI::print_help(std::ostream& out) {
  out << "Available commands:" << std::endl;
  out << "  commit <path>...               Store files and directory trees" << std::endl;
  out << "  checkout <target> [pattern...] Restore files matching the patterns into <target>" << std::endl;
  out << "  ls [pattern...]                List stored files" << std::endl;
  out << "  help                           Display this help message" << std::endl;
}


//==============================================
// COMMAND HANDLERS
//==============================================

int CLI::handle_commit_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    out_ << "Usage: commit <path>..." << std::endl;
    return EXIT_FAILURE_STATUS;
  }

  std::vector<std::filesystem::path> paths(args.begin(), args.end());
  try {
    CommitReport report = stash_.commit(paths);
    out_ << "Committed " << report.files_scanned << " files (" << report.files_unchanged << " unchanged, "
         << report.files_skipped << " skipped), " << report.directories << " directories, "
         << report.symlinks << " symlinks, " << report.entries_removed << " removed, " << report.chunks_new << " new chunks, "
         << report.chunks_reused << " reused, " << report.data_objects_written << " data objects" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Commit failed", e.what());
    return EXIT_FAILURE_STATUS;
  }
  return EXIT_OK;
}

int CLI::handle_checkout_command(const std::vector<std::string>& args) {
  if (args.empty()) {
    out_ << "Usage: checkout <target> [pattern...]" << std::endl;
    return EXIT_FAILURE_STATUS;
  }

  std::vector<std::string> patterns(args.begin() + 1, args.end());
  try {
    CheckoutReport report = stash_.checkout(args.front(), patterns);
    out_ << "Restored " << report.files_restored << " files (" << report.bytes_restored << " bytes), "
         << report.directories_restored << " directories, " << report.symlinks_restored << " symlinks" << std::endl;
    for (const auto& failure : report.failed) {
      out_ << "  FAILED " << failure.path << ": " << failure.reason << std::endl;
    }
    return report.ok() ? EXIT_OK : EXIT_PARTIAL;
  } catch (const std::exception& e) {
    log_and_display_error("Checkout failed", e.what());
    return EXIT_FAILURE_STATUS;
  }
}

int CLI::handle_list_command(const std::vector<std::string>& args) {
  for (const auto& entry : stash_.list(args)) {
    std::time_t mtime = static_cast<std::time_t>(entry.mtime_sec);
    std::tm local{};
    localtime_r(&mtime, &local);
    char type = entry.type == FileType::Directory ? 'd' : entry.type == FileType::Symlink ? 'l' : '-';
    out_ << type << std::oct << std::setw(4) << std::setfill('0') << entry.mode << std::dec << std::setfill(' ')
         << " " << std::setw(12) << entry.size
         << " " << std::put_time(&local, "%Y-%m-%d %H:%M")
         << " " << entry.path;
    if (entry.type == FileType::Symlink) {
      out_ << " -> " << entry.link_target;
    }
    out_ << std::endl;
  }
  return EXIT_OK;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace stash
