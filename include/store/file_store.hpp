#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace vbaunlock {
namespace store {

class FileStore {
public:

  // ---- CORE STORAGE OPERATIONS ----
  // Reads a whole file in binary mode
  static std::vector<uint8_t> load(const std::filesystem::path& path);
  // Writes to a temporary sibling then renames it over path, so a failure
  // leaves any existing file untouched
  static void save(const std::filesystem::path& path, const std::vector<uint8_t>& data);


  // ---- QUERY OPERATIONS ----
  // Where remove writes when not patching in place: <stem>_unlocked<ext>
  static std::filesystem::path unlocked_path(const std::filesystem::path& path);

private:
  // Sibling path the data is staged in before the rename
  static std::filesystem::path temporary_path(const std::filesystem::path& path);
};

class FileStoreError : public std::runtime_error {
public:
  explicit FileStoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace vbaunlock
