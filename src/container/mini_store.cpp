#include "container/mini_store.hpp"
#include "container/byte_order.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace container {

MiniStore::MiniStore(SectorStore& store, uint32_t root_start, uint64_t root_size)
  : store_(store)
  , mini_sector_size_(store.mini_sector_size()) {
  const auto& header = store_.header();

  container_chain_ = store_.chain(root_start);
  if (header.first_mini_fat_sector != END_OF_CHAIN) {
    mini_fat_ = ByteOrder::toU32Array(store_.read_chain(header.first_mini_fat_sector));
  }

  // The root entry's size bounds the usable mini sectors, the backing chain must cover it
  const std::size_t backed = container_chain_.size() * store_.sector_size() / mini_sector_size_;
  const std::size_t declared = static_cast<std::size_t>((root_size + mini_sector_size_ - 1) / mini_sector_size_);
  if (declared > backed) {
    BOOST_LOG_TRIVIAL(warning) << "Mini store: Root entry declares " << declared
                               << " mini sectors but its chain backs only " << backed;
  }
  mini_sector_count_ = std::min(declared, backed);

  BOOST_LOG_TRIVIAL(debug) << "Mini store: " << mini_sector_count_ << " mini sectors in "
                           << container_chain_.size() << " container sectors, mini FAT has "
                           << mini_fat_.size() << " entries";
}

SectorChain MiniStore::chain(uint32_t start) const {
  return follow_chain(mini_fat_, start, mini_sector_count_);
}

std::vector<uint8_t> MiniStore::read_chain(uint32_t start) const {
  const SectorChain mini_sectors = chain(start);

  std::vector<uint8_t> data;
  data.reserve(mini_sectors.size() * mini_sector_size_);
  for (uint32_t mini_sector : mini_sectors) {
    const auto [sector, offset] = locate(mini_sector);
    const auto bytes = store_.read_at(sector, offset, mini_sector_size_);
    data.insert(data.end(), bytes.begin(), bytes.end());
  }

  BOOST_LOG_TRIVIAL(debug) << "Mini store: Read " << data.size() << " bytes from mini chain at " << start;
  return data;
}

void MiniStore::write_chain(uint32_t start, const std::vector<uint8_t>& data) {
  const SectorChain mini_sectors = chain(start);

  const std::size_t capacity = mini_sectors.size() * mini_sector_size_;
  if (data.size() > capacity) {
    BOOST_LOG_TRIVIAL(error) << "Mini store: " << data.size() << " bytes do not fit mini chain at "
                             << start << " with capacity " << capacity;
    throw ChainTooShortError(std::to_string(data.size()) + " bytes exceed mini chain capacity of " +
                             std::to_string(capacity));
  }

  std::size_t written = 0;
  for (uint32_t mini_sector : mini_sectors) {
    if (written == data.size()) {
      break;
    }
    const auto [sector, offset] = locate(mini_sector);
    const std::size_t count = std::min(mini_sector_size_, data.size() - written);
    store_.write_at(sector, offset, data.data() + written, count);
    written += count;
  }

  BOOST_LOG_TRIVIAL(debug) << "Mini store: Wrote " << written << " bytes to mini chain at " << start;
}

std::pair<uint32_t, std::size_t> MiniStore::locate(uint32_t mini_sector) const {
  const std::size_t position = static_cast<std::size_t>(mini_sector) * mini_sector_size_;
  const std::size_t index = position / store_.sector_size();
  if (index >= container_chain_.size()) {
    throw BrokenChainError("mini sector " + std::to_string(mini_sector) + " lies past the mini stream");
  }
  return {container_chain_[index], position % store_.sector_size()};
}

} // namespace container
} // namespace vbaunlock
