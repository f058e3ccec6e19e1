#include "store/wordlist.hpp"
#include "store/file_store.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace store {

namespace {

std::string trim(const std::string& line) {
  static constexpr const char* WHITESPACE = " \t\r\n\f\v";
  const auto begin = line.find_first_not_of(WHITESPACE);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = line.find_last_not_of(WHITESPACE);
  return line.substr(begin, end - begin + 1);
}

} // namespace

Wordlist::Wordlist(std::vector<std::string> candidates) : candidates_(std::move(candidates)) {}

Wordlist Wordlist::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Wordlist: Loading " << path.string();

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Wordlist: Failed to open " << path.string();
    throw FileStoreError("Wordlist: Failed to open file: " + path.string());
  }

  std::vector<std::string> candidates;
  std::string line;
  while (std::getline(file, line)) {
    std::string candidate = trim(line);
    if (!candidate.empty()) {
      candidates.push_back(std::move(candidate));
    }
  }

  if (file.bad()) {
    throw FileStoreError("Wordlist: Failed to read file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Wordlist: Loaded " << candidates.size() << " candidates";
  return Wordlist(std::move(candidates));
}

Wordlist Wordlist::from(std::vector<std::string> candidates) {
  return Wordlist(std::move(candidates));
}

} // namespace store
} // namespace vbaunlock
