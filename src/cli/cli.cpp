#include "cli/cli.hpp"
#include "container/container_error.hpp"
#include "store/file_store.hpp"
#include "store/wordlist.hpp"
#include "unlock/patcher.hpp"
#include "workbook/workbook.hpp"
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace cli {

namespace {

const char* yes_no(bool value) {
  return value ? "true" : "false";
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(std::ostream& out, std::ostream& err)
  : out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// COMMAND PROCESSING
//==============================================

template <typename Command>
bool CLI::guarded(const std::string& message, Command&& command) {
  try {
    command();
    return true;
  } catch (const container::StreamNotFoundError& e) {
    log_and_display_error(message, "file has no VBA project (" + std::string(e.what()) + ")");
  } catch (const workbook::NoVbaProjectError& e) {
    log_and_display_error(message, "file has no VBA project (" + std::string(e.what()) + ")");
  } catch (const std::exception& e) {
    log_and_display_error(message, e.what());
  }
  return false;
}

bool CLI::handle_read_command(const ReadOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Reading " << options.file;

  return guarded("Error reading file", [&]() {
    const auto bytes = store::FileStore::load(options.file);
    const auto kind = workbook::detect_kind(options.file, bytes);

    const auto container = workbook::project_container(kind, bytes);

    // The wordlist is only needed once a hashed password turns up
    unlock::CandidateSource candidates;
    if (options.decode) {
      candidates = [&options]() { return store::Wordlist::load(options.wordlist).candidates(); };
    }

    const auto report = unlock::Inspector::inspect(container, workbook::project_stream_path(kind),
                                                   candidates, options.threads);
    print_report(report);
  });
}

bool CLI::handle_remove_command(const RemoveOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Removing protection from " << options.file;

  return guarded("Error removing protection", [&]() {
    const auto bytes = store::FileStore::load(options.file);
    const auto kind = workbook::detect_kind(options.file, bytes);
    const auto container = workbook::project_container(kind, bytes);
    const auto unlocked = unlock::Patcher::remove_protection(container, workbook::project_stream_path(kind));
    const auto patched = workbook::with_project_container(kind, bytes, unlocked);

    const auto target = options.inplace ? std::filesystem::path(options.file)
                                        : store::FileStore::unlocked_path(options.file);
    store::FileStore::save(target, patched);
    out_ << "Protection removed, written to " << target.string() << std::endl;
  });
}


//==============================================
// OUTPUT
//==============================================

void CLI::print_report(const unlock::ProjectReport& report) {
  out_ << "Project Protection State:\n"
       << "  User Protected: " << yes_no(report.user_protected) << '\n'
       << "  Host Protected: " << yes_no(report.host_protected) << '\n'
       << "  VBE Protected: " << yes_no(report.vbe_protected) << '\n';

  out_ << "Project Password: ";
  if (report.scheme == project::SchemeKind::Legacy) {
    if (report.password && report.password->empty()) {
      out_ << "None\n";
    } else {
      out_ << report.password.value_or("") << " (plain-text)\n";
    }
  } else {
    out_ << "Hashed (SHA1)\n"
         << "  Salt: " << report.salt_hex << '\n'
         << "  SHA1 Hash: " << report.digest_hex << '\n';
    if (report.crack_attempted) {
      if (report.password) {
        out_ << "  Decoded Password: " << *report.password << '\n';
      } else {
        out_ << "  Decoded Password: not in list\n";
      }
    }
  }

  out_ << "Project Visibility:\n"
       << "  " << (report.visible ? "Visible" : "Not Visible") << '\n';
  out_.flush();
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace vbaunlock
