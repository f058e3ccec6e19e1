#include "container/sector_store.hpp"
#include "container/byte_order.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace container {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SectorStore::SectorStore(std::vector<uint8_t> image) : image_(std::move(image)) {
  BOOST_LOG_TRIVIAL(info) << "Sector store: Opening container image of " << image_.size() << " bytes";

  load_header();
  validate_header();
  load_fat(load_difat());

  BOOST_LOG_TRIVIAL(debug) << "Sector store: Loaded " << sector_count_ << " sectors of "
                           << sector_size_ << " bytes, FAT has " << fat_.size() << " entries";
}


//==============================================
// LOADING
//==============================================

void SectorStore::load_header() {
  if (image_.size() < HEADER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Image too small for a header: " << image_.size() << " bytes";
    throw CorruptContainerError("image of " + std::to_string(image_.size()) + " bytes is smaller than the header");
  }

  if (!std::equal(SIGNATURE.begin(), SIGNATURE.end(), image_.begin())) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Header signature mismatch";
    throw CorruptContainerError("header signature mismatch");
  }

  header_.minor_version = ByteOrder::readU16(image_, 24);
  header_.major_version = ByteOrder::readU16(image_, 26);
  header_.byte_order = ByteOrder::readU16(image_, 28);
  header_.sector_shift = ByteOrder::readU16(image_, 30);
  header_.mini_sector_shift = ByteOrder::readU16(image_, 32);
  header_.num_directory_sectors = ByteOrder::readU32(image_, 40);
  header_.num_fat_sectors = ByteOrder::readU32(image_, 44);
  header_.first_directory_sector = ByteOrder::readU32(image_, 48);
  header_.mini_stream_cutoff = ByteOrder::readU32(image_, 56);
  header_.first_mini_fat_sector = ByteOrder::readU32(image_, 60);
  header_.num_mini_fat_sectors = ByteOrder::readU32(image_, 64);
  header_.first_difat_sector = ByteOrder::readU32(image_, 68);
  header_.num_difat_sectors = ByteOrder::readU32(image_, 72);

  for (std::size_t i = 0; i < HEADER_DIFAT_ENTRIES; ++i) {
    header_.difat[i] = ByteOrder::readU32(image_, 76 + i * sizeof(uint32_t));
  }
}

void SectorStore::validate_header() {
  if (header_.byte_order != BYTE_ORDER_MARK) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Unexpected byte order mark 0x" << std::hex << header_.byte_order;
    throw CorruptContainerError("byte order mark is not 0xFFFE");
  }

  if (header_.sector_shift != 9 && header_.sector_shift != 12) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Unsupported sector shift " << header_.sector_shift;
    throw CorruptContainerError("sector shift " + std::to_string(header_.sector_shift) + " is not 9 or 12");
  }
  if ((header_.major_version == 3 && header_.sector_shift != 9) ||
      (header_.major_version == 4 && header_.sector_shift != 12)) {
    BOOST_LOG_TRIVIAL(warning) << "Sector store: Major version " << header_.major_version
                               << " declared with sector shift " << header_.sector_shift;
  }

  if (header_.mini_sector_shift != 6) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Unsupported mini sector shift " << header_.mini_sector_shift;
    throw CorruptContainerError("mini sector shift " + std::to_string(header_.mini_sector_shift) + " is not 6");
  }

  if (header_.mini_stream_cutoff != MINI_STREAM_CUTOFF) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Unexpected mini stream cutoff " << header_.mini_stream_cutoff;
    throw CorruptContainerError("mini stream cutoff " + std::to_string(header_.mini_stream_cutoff) + " is not 4096");
  }

  sector_size_ = std::size_t(1) << header_.sector_shift;
  if (image_.size() <= sector_size_) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Image holds no sectors";
    throw CorruptContainerError("image holds no sectors");
  }
  // A truncated final sector still counts, its missing tail is treated as absent
  sector_count_ = (image_.size() - sector_size_ + sector_size_ - 1) / sector_size_;

  if (header_.num_fat_sectors == 0) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Header declares no FAT sectors";
    throw CorruptContainerError("header declares no FAT sectors");
  }
  // Every FAT and DIFAT sector occupies a sector of the image
  if (header_.num_fat_sectors > sector_count_) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Header declares " << header_.num_fat_sectors
                             << " FAT sectors in an image of " << sector_count_;
    throw CorruptContainerError("header declares " + std::to_string(header_.num_fat_sectors) +
                                " FAT sectors but the image holds " + std::to_string(sector_count_));
  }
  if (header_.num_difat_sectors > sector_count_) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Header declares " << header_.num_difat_sectors
                             << " DIFAT sectors in an image of " << sector_count_;
    throw CorruptContainerError("header declares " + std::to_string(header_.num_difat_sectors) +
                                " DIFAT sectors but the image holds " + std::to_string(sector_count_));
  }
  if (header_.difat[0] >= sector_count_) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: First FAT sector " << header_.difat[0]
                             << " outside " << sector_count_ << " sectors";
    throw CorruptContainerError("first FAT sector is outside the image");
  }
}

std::vector<uint32_t> SectorStore::load_difat() const {
  const std::size_t wanted = header_.num_fat_sectors;
  std::vector<uint32_t> fat_sectors;
  fat_sectors.reserve(wanted);

  for (std::size_t i = 0; i < HEADER_DIFAT_ENTRIES && fat_sectors.size() < wanted; ++i) {
    fat_sectors.push_back(header_.difat[i]);
  }

  // Remaining FAT locations live in a chain of DIFAT sectors, the last slot of
  // each one links to the next
  const std::size_t entries_per_sector = sector_size_ / sizeof(uint32_t) - 1;
  std::vector<bool> visited(sector_count_, false);
  uint32_t difat_sector = header_.first_difat_sector;

  for (uint32_t n = 0; n < header_.num_difat_sectors && fat_sectors.size() < wanted; ++n) {
    if (difat_sector >= sector_count_ || visited[difat_sector]) {
      BOOST_LOG_TRIVIAL(error) << "Sector store: Invalid DIFAT sector " << difat_sector;
      throw CorruptContainerError("DIFAT chain is broken at sector " + std::to_string(difat_sector));
    }
    visited[difat_sector] = true;

    const auto entries = ByteOrder::toU32Array(read_at(difat_sector, 0, sector_length(difat_sector)));
    for (std::size_t i = 0; i < entries_per_sector && i < entries.size() && fat_sectors.size() < wanted; ++i) {
      fat_sectors.push_back(entries[i]);
    }
    difat_sector = entries.size() > entries_per_sector ? entries[entries_per_sector] : END_OF_CHAIN;
  }

  if (fat_sectors.size() < wanted) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: Located " << fat_sectors.size() << " of " << wanted << " FAT sectors";
    throw CorruptContainerError("DIFAT lists fewer FAT sectors than the header declares");
  }

  return fat_sectors;
}

void SectorStore::load_fat(const std::vector<uint32_t>& fat_sectors) {
  fat_.clear();
  fat_.reserve(fat_sectors.size() * (sector_size_ / sizeof(uint32_t)));

  for (uint32_t fat_sector : fat_sectors) {
    if (fat_sector >= sector_count_) {
      BOOST_LOG_TRIVIAL(error) << "Sector store: FAT sector " << fat_sector << " outside the image";
      throw CorruptContainerError("FAT sector " + std::to_string(fat_sector) + " is outside the image");
    }
    const auto entries = ByteOrder::toU32Array(read_at(fat_sector, 0, sector_length(fat_sector)));
    fat_.insert(fat_.end(), entries.begin(), entries.end());
  }
}


//==============================================
// CHAIN OPERATIONS
//==============================================

SectorChain SectorStore::chain(uint32_t start) const {
  return follow_chain(fat_, start, sector_count_);
}

std::vector<uint8_t> SectorStore::read_chain(uint32_t start) const {
  const SectorChain sectors = chain(start);

  std::vector<uint8_t> data;
  data.reserve(sectors.size() * sector_size_);
  for (uint32_t sector : sectors) {
    const std::size_t offset = sector_offset(sector);
    data.insert(data.end(), image_.begin() + offset, image_.begin() + offset + sector_length(sector));
  }

  BOOST_LOG_TRIVIAL(debug) << "Sector store: Read " << data.size() << " bytes from chain at " << start;
  return data;
}

void SectorStore::write_chain(uint32_t start, const std::vector<uint8_t>& data) {
  const SectorChain sectors = chain(start);

  std::size_t capacity = 0;
  for (uint32_t sector : sectors) {
    capacity += sector_length(sector);
  }
  if (data.size() > capacity) {
    BOOST_LOG_TRIVIAL(error) << "Sector store: " << data.size() << " bytes do not fit chain at "
                             << start << " with capacity " << capacity;
    throw ChainTooShortError(std::to_string(data.size()) + " bytes exceed chain capacity of " +
                             std::to_string(capacity));
  }

  std::size_t written = 0;
  for (uint32_t sector : sectors) {
    if (written == data.size()) {
      break;
    }
    const std::size_t count = std::min(sector_length(sector), data.size() - written);
    write_at(sector, 0, data.data() + written, count);
    written += count;
  }

  BOOST_LOG_TRIVIAL(debug) << "Sector store: Wrote " << written << " bytes to chain at " << start;
}


//==============================================
// SECTOR ACCESS
//==============================================

std::vector<uint8_t> SectorStore::read_at(uint32_t sector, std::size_t offset, std::size_t length) const {
  if (sector >= sector_count_ || offset + length > sector_length(sector)) {
    throw BrokenChainError("read of " + std::to_string(length) + " bytes at offset " +
                           std::to_string(offset) + " exceeds sector " + std::to_string(sector));
  }
  const std::size_t begin = sector_offset(sector) + offset;
  return std::vector<uint8_t>(image_.begin() + begin, image_.begin() + begin + length);
}

void SectorStore::write_at(uint32_t sector, std::size_t offset, const uint8_t* data, std::size_t length) {
  if (sector >= sector_count_ || offset + length > sector_length(sector)) {
    throw BrokenChainError("write of " + std::to_string(length) + " bytes at offset " +
                           std::to_string(offset) + " exceeds sector " + std::to_string(sector));
  }

  uint8_t* target = image_.data() + sector_offset(sector) + offset;
  if (std::memcmp(target, data, length) != 0) {
    std::memcpy(target, data, length);
    dirty_sectors_.insert(sector);
    BOOST_LOG_TRIVIAL(trace) << "Sector store: Sector " << sector << " modified";
  }
}


//==============================================
// UTILITY METHODS
//==============================================

std::size_t SectorStore::sector_offset(uint32_t sector) const {
  // Sector 0 starts right after the header, which is padded to a full sector
  return (static_cast<std::size_t>(sector) + 1) * sector_size_;
}

std::size_t SectorStore::sector_length(uint32_t sector) const {
  const std::size_t offset = sector_offset(sector);
  if (offset >= image_.size()) {
    return 0;
  }
  return std::min(sector_size_, image_.size() - offset);
}

} // namespace container
} // namespace vbaunlock
