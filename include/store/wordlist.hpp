#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vbaunlock {
namespace store {

// Candidate passwords in source order
class Wordlist {
public:
  // One candidate per line. Surrounding whitespace and a trailing \r are
  // trimmed, empty lines skipped. Missing file is FileStoreError.
  static Wordlist load(const std::filesystem::path& path);
  static Wordlist from(std::vector<std::string> candidates);

  const std::vector<std::string>& candidates() const { return candidates_; }
  std::size_t size() const { return candidates_.size(); }
  bool empty() const { return candidates_.empty(); }

private:
  explicit Wordlist(std::vector<std::string> candidates);

  std::vector<std::string> candidates_;
};

} // namespace store
} // namespace vbaunlock
