#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

enum class Command { None, Read, Remove };

struct ProgramOptions {
  std::string log_file;
  vbaunlock::logging::severity_level log_level = boost::log::trivial::warning;
  Command command = Command::None;
  vbaunlock::cli::ReadOptions read;
  vbaunlock::cli::RemoveOptions remove;
  bool help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options] read [-d] [-w <wordlist>] [-t <threads>] <file>\n"
            << "       " << program_name << " [options] remove [-i] <file>\n"
            << "Options:\n"
            << "  --log-file <path>     Write the log to a file instead of the console\n"
            << "  --log-level <level>   trace, debug, info, warning, error or fatal (default warning)\n"
            << "  -h, --help            Show this message\n"
            << "read:\n"
            << "  -d, --decode          Look up a hashed password in the wordlist\n"
            << "  -w, --wordlist        Candidate passwords, one per line (default password.lst)\n"
            << "  -t, --threads         Worker threads for the lookup (default 1)\n"
            << "remove:\n"
            << "  -i, --inplace         Overwrite the file instead of writing <name>_unlocked\n"
            << "Example: " << program_name << " read -d book.xls\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  // Flags that consume the following argument
  const std::unordered_map<std::string, bool> flag_map = {
    {"--log-file", true},
    {"--log-level", true},
    {"-h", false},
    {"--help", false},
    {"-d", false},
    {"--decode", false},
    {"-w", true},
    {"--wordlist", true},
    {"-t", true},
    {"--threads", true},
    {"-i", false},
    {"--inplace", false}
  };

  ProgramOptions options;
  std::string file;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (options.command == Command::None && arg == "read") {
      options.command = Command::Read;
      continue;
    }
    if (options.command == Command::None && arg == "remove") {
      options.command = Command::Remove;
      continue;
    }

    if (arg.empty() || arg[0] != '-') {
      if (options.command == Command::None || !file.empty()) {
        std::cerr << "Error: Unexpected argument: " << arg << '\n';
        print_usage(argv[0]);
        return options;
      }
      file = arg;
      continue;
    }

    const auto flag = flag_map.find(arg);
    if (flag == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(argv[0]);
      return options;
    }

    std::string value;
    if (flag->second) {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_usage(argv[0]);
        return options;
      }
      value = argv[++i];
    }

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--log-file") {
      options.log_file = value;
    } else if (arg == "--log-level") {
      const auto level = vbaunlock::logging::parse_severity(value);
      if (!level) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.log_level = *level;
    } else if (options.command == Command::Read && (arg == "-d" || arg == "--decode")) {
      options.read.decode = true;
    } else if (options.command == Command::Read && (arg == "-w" || arg == "--wordlist")) {
      options.read.wordlist = value;
    } else if (options.command == Command::Read && (arg == "-t" || arg == "--threads")) {
      try {
        const int threads = std::stoi(value);
        if (threads < 1) {
          throw std::out_of_range("threads");
        }
        options.read.threads = static_cast<std::size_t>(threads);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid thread count: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    } else if (options.command == Command::Remove && (arg == "-i" || arg == "--inplace")) {
      options.remove.inplace = true;
    } else {
      std::cerr << "Error: " << arg << " is not valid here\n";
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.help) {
    print_usage(argv[0]);
    options.valid = true;
    return options;
  }

  if (options.command == Command::None || file.empty()) {
    std::cerr << "Error: A command and a file are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.read.file = file;
  options.remove.file = file;
  options.valid = true;
  return options;
}

bool run_command(const ProgramOptions& options) {
  try {
    if (options.log_file.empty()) {
      vbaunlock::logging::init_console_logging(options.log_level);
    } else {
      vbaunlock::logging::init_logging(options.log_file, options.log_level);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to set up logging: " << e.what() << '\n';
    return false;
  }

  vbaunlock::cli::CLI cli;
  if (options.command == Command::Read) {
    return cli.handle_read_command(options.read);
  }
  return cli.handle_remove_command(options.remove);
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (options.help) {
    return 0;
  } else if (!run_command(options)) {
    return 1;
  }
  return 0;
}
