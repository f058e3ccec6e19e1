#ifndef VBAUNLOCK_MINI_STORE_HPP
#define VBAUNLOCK_MINI_STORE_HPP

#include <cstdint>
#include <utility>
#include <vector>
#include "container/allocation_table.hpp"
#include "container/sector_store.hpp"

namespace vbaunlock::container {

// Streams below the mini stream cutoff are stored as 64 byte mini sectors
// packed into the root entry's stream and chained through the mini FAT.
// Reads and writes land directly in the backing container sectors.
class MiniStore {
public:
  // ---- CONSTRUCTOR ----
  // root_start and root_size describe the root entry's stream
  MiniStore(SectorStore& store, uint32_t root_start, uint64_t root_size);


  // ---- CHAIN OPERATIONS ----
  SectorChain chain(uint32_t start) const;
  std::vector<uint8_t> read_chain(uint32_t start) const;
  void write_chain(uint32_t start, const std::vector<uint8_t>& data);


  // ---- GETTERS ----
  std::size_t mini_sector_size() const { return mini_sector_size_; }
  std::size_t mini_sector_count() const { return mini_sector_count_; }
  const std::vector<uint32_t>& mini_fat() const { return mini_fat_; }

private:
  // ---- PARAMETERS ----
  SectorStore& store_;
  SectorChain container_chain_;
  std::vector<uint32_t> mini_fat_;
  std::size_t mini_sector_size_;
  std::size_t mini_sector_count_ = 0;


  // ---- UTILITY METHODS ----
  // Container sector and byte offset holding a mini sector
  std::pair<uint32_t, std::size_t> locate(uint32_t mini_sector) const;
};

} // namespace vbaunlock::container

#endif // VBAUNLOCK_MINI_STORE_HPP
