#pragma once

#include <array>
#include <cstdint>
#include <set>
#include <vector>
#include "container/allocation_table.hpp"
#include "container/container_error.hpp"

namespace vbaunlock {
namespace container {

// Fixed fields of the 512 byte compound file header
struct ContainerHeader {
  uint16_t minor_version = 0;
  uint16_t major_version = 0;
  uint16_t byte_order = 0;
  uint16_t sector_shift = 0;
  uint16_t mini_sector_shift = 0;
  uint32_t num_directory_sectors = 0;
  uint32_t num_fat_sectors = 0;
  uint32_t first_directory_sector = END_OF_CHAIN;
  uint32_t mini_stream_cutoff = 0;
  uint32_t first_mini_fat_sector = END_OF_CHAIN;
  uint32_t num_mini_fat_sectors = 0;
  uint32_t first_difat_sector = END_OF_CHAIN;
  uint32_t num_difat_sectors = 0;
  std::array<uint32_t, 109> difat{};
};

class SectorStore {
public:
  static constexpr std::size_t HEADER_SIZE = 512;
  static constexpr std::size_t HEADER_DIFAT_ENTRIES = 109;
  static constexpr std::array<uint8_t, 8> SIGNATURE = {
    0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1
  };
  static constexpr uint16_t BYTE_ORDER_MARK = 0xFFFE;
  static constexpr uint32_t MINI_STREAM_CUTOFF = 4096;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Takes ownership of a complete container image and loads header and FAT
  explicit SectorStore(std::vector<uint8_t> image);

  SectorStore(const SectorStore&) = delete;
  SectorStore& operator=(const SectorStore&) = delete;


  // ---- CHAIN OPERATIONS ----
  // Sector indices of the chain starting at start
  SectorChain chain(uint32_t start) const;
  // Concatenated payload of every sector in the chain
  std::vector<uint8_t> read_chain(uint32_t start) const;
  // Overwrites the leading bytes of a chain, never extends it
  void write_chain(uint32_t start, const std::vector<uint8_t>& data);


  // ---- SECTOR ACCESS ----
  std::vector<uint8_t> read_at(uint32_t sector, std::size_t offset, std::size_t length) const;
  void write_at(uint32_t sector, std::size_t offset, const uint8_t* data, std::size_t length);


  // ---- OUTPUT ----
  // Full container image including every mutation made so far
  std::vector<uint8_t> serialize() const { return image_; }


  // ---- GETTERS ----
  const ContainerHeader& header() const { return header_; }
  std::size_t sector_size() const { return sector_size_; }
  std::size_t mini_sector_size() const { return std::size_t(1) << header_.mini_sector_shift; }
  std::size_t sector_count() const { return sector_count_; }
  const std::vector<uint32_t>& fat() const { return fat_; }
  const std::set<uint32_t>& dirty_sectors() const { return dirty_sectors_; }

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> image_;
  ContainerHeader header_;
  std::size_t sector_size_ = 0;
  std::size_t sector_count_ = 0;
  std::vector<uint32_t> fat_;
  std::set<uint32_t> dirty_sectors_;


  // ---- LOADING ----
  void load_header();
  void validate_header();
  // FAT sector locations from the header and the DIFAT chain
  std::vector<uint32_t> load_difat() const;
  void load_fat(const std::vector<uint32_t>& fat_sectors);


  // ---- UTILITY METHODS ----
  std::size_t sector_offset(uint32_t sector) const;
  // Bytes actually present for a sector, the last one may be truncated
  std::size_t sector_length(uint32_t sector) const;
};

} // namespace container
} // namespace vbaunlock
