#ifndef VBAUNLOCK_ZIP_ARCHIVE_HPP
#define VBAUNLOCK_ZIP_ARCHIVE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "workbook/workbook.hpp"

namespace vbaunlock::workbook {

// ---- ERRORS ----
// Truncated, multi-disk, zip64, encrypted or otherwise unreadable package
class ZipArchiveError : public WorkbookError {
public:
  explicit ZipArchiveError(const std::string& message)
    : WorkbookError("Zip archive: " + message) {}
};


// ---- ENTRIES ----
// One central directory record
struct ZipEntry {
  std::string name;
  uint16_t flags = 0;
  uint16_t method = 0;
  uint32_t crc32 = 0;
  uint32_t compressed_size = 0;
  uint32_t uncompressed_size = 0;
  uint32_t local_header_offset = 0;
  // Position and length of the central record inside the archive
  std::size_t central_offset = 0;
  std::size_t central_length = 0;
};


// ---- ARCHIVE ----
// Read access to the entries of an Office package, and a rewrite that swaps
// the contents of one entry while copying every other one verbatim
class ZipArchive {
public:
  static constexpr uint16_t STORED = 0;
  static constexpr uint16_t DEFLATED = 8;

  static constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
  static constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;

  // Locates the end record and parses the central directory
  explicit ZipArchive(std::vector<uint8_t> bytes);

  bool contains(const std::string& name) const;
  const std::vector<ZipEntry>& entries() const { return entries_; }
  const std::vector<uint8_t>& bytes() const { return bytes_; }

  // Uncompressed contents, checked against the recorded size and CRC
  std::vector<uint8_t> read(const std::string& name) const;

  // Whole archive with name holding data, compressed with the entry's
  // original method. Unchanged data returns the archive as it was.
  std::vector<uint8_t> replace(const std::string& name, const std::vector<uint8_t>& data) const;

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> bytes_;
  std::vector<ZipEntry> entries_;
  std::size_t end_record_offset_ = 0;
  std::size_t central_offset_ = 0;


  std::size_t find_end_record() const;
  void parse_central_directory();

  const ZipEntry& find(const std::string& name) const;
  std::size_t local_name_end(const ZipEntry& entry) const;
  // One past the data, or past the data descriptor when the entry has one
  std::size_t local_record_end(const ZipEntry& entry) const;
};

} // namespace vbaunlock::workbook

#endif // VBAUNLOCK_ZIP_ARCHIVE_HPP
