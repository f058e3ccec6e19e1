#include "store/file_store.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace store {

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::vector<uint8_t> FileStore::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "File store: Loading " << path.string();

  if (!std::filesystem::is_regular_file(path)) {
    BOOST_LOG_TRIVIAL(error) << "File store: File not found: " << path.string();
    throw FileStoreError("File store: File not found: " + path.string());
  }

  // Open file in binary mode, container images are not text
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw FileStoreError("File store: Failed to open file: " + path.string());
  }

  std::vector<uint8_t> data;
  char buffer[4096];

  // Read file in chunks
  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "File store: Read failed for " << path.string();
    throw FileStoreError("File store: Failed to read file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "File store: Loaded " << data.size() << " bytes";
  return data;
}

void FileStore::save(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  BOOST_LOG_TRIVIAL(info) << "File store: Saving " << data.size() << " bytes to " << path.string();

  const std::filesystem::path staging = temporary_path(path);
  {
    std::ofstream file(staging, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "File store: Failed to create " << staging.string();
      throw FileStoreError("File store: Failed to create file: " + staging.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(staging, ignored);
      BOOST_LOG_TRIVIAL(error) << "File store: Failed to write " << staging.string();
      throw FileStoreError("File store: Failed to write file: " + staging.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    BOOST_LOG_TRIVIAL(error) << "File store: Failed to move " << staging.string() << " into place: " << ec.message();
    throw FileStoreError("File store: Failed to replace " + path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "File store: Successfully saved " << path.string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::filesystem::path FileStore::unlocked_path(const std::filesystem::path& path) {
  std::filesystem::path result = path;
  result.replace_filename(path.stem().string() + "_unlocked" + path.extension().string());
  return result;
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path FileStore::temporary_path(const std::filesystem::path& path) {
  std::filesystem::path staging = path;
  staging += ".tmp";
  return staging;
}

} // namespace store
} // namespace vbaunlock
