#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "stash/stash.hpp"

namespace stash {
namespace cli {

// Exit codes of a command
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;
constexpr int EXIT_PARTIAL = 2;

// Prompts on prompt and reads one line from in. When fd is a terminal its
// echo is switched off until the line is read.
std::string read_passphrase(std::istream& in, std::ostream& prompt, int fd);

class CLI {
public:
    // ---- CONSTRUCTOR ----
    explicit CLI(Stash& stash, std::ostream& out = std::cout);


    // ---- COMMAND PROCESSING ----
    // Runs one command against the loaded stash and returns its exit code
    int process_command(const std::string& command, const std::vector<std::string>& args);

    static void print_help(std::ostream& out);

private:
    // ---- PARAMETERS ----
    Stash& stash_;
    std::ostream& out_;


    // ---- COMMAND HANDLERS ----
    int handle_commit_command(const std::vector<std::string>& args);
    int handle_checkout_command(const std::vector<std::string>& args);
    int handle_list_command(const std::vector<std::string>& args);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace stash
