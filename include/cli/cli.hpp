#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include "unlock/inspector.hpp"

namespace vbaunlock {
namespace cli {

struct ReadOptions {
  std::string file;
  bool decode = false;
  std::string wordlist = "password.lst";
  std::size_t threads = 1;
};

struct RemoveOptions {
  std::string file;
  bool inplace = false;
};

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(std::ostream& out = std::cout, std::ostream& err = std::cerr);


    // ---- COMMAND PROCESSING ----
    // Both return false after reporting an error
    bool handle_read_command(const ReadOptions& options);
    bool handle_remove_command(const RemoveOptions& options);


    // ---- OUTPUT ----
    void print_report(const unlock::ProjectReport& report);

private:
    // ---- PARAMETERS ----
    std::ostream& out_;
    std::ostream& err_;


    void log_and_display_error(const std::string& message, const std::string& error);
    // Runs a command body, translating exceptions into messages
    template <typename Command>
    bool guarded(const std::string& message, Command&& command);
};

} // namespace cli
} // namespace vbaunlock
