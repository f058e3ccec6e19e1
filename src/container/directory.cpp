#include "container/directory.hpp"
#include "container/byte_order.hpp"
#include <algorithm>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace container {

namespace {

constexpr std::size_t NAME_FIELD_SIZE = 64;

void append_utf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Name field is UTF-16LE, name_length counts bytes including the terminator
std::string decode_name(const std::vector<uint8_t>& data, std::size_t offset, uint16_t name_length) {
  std::size_t units = std::min<std::size_t>(name_length, NAME_FIELD_SIZE) / 2;
  if (units > 0) {
    --units;
  }

  std::string name;
  for (std::size_t i = 0; i < units; ++i) {
    uint32_t unit = ByteOrder::readU16(data, offset + i * 2);
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
      const uint32_t low = ByteOrder::readU16(data, offset + (i + 1) * 2);
      if (low >= 0xDC00 && low <= 0xDFFF) {
        unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        ++i;
      }
    }
    append_utf8(name, unit);
  }
  return name;
}

EntryType to_entry_type(uint8_t raw, uint32_t id) {
  switch (raw) {
    case 0: return EntryType::Unallocated;
    case 1: return EntryType::Storage;
    case 2: return EntryType::Stream;
    case 5: return EntryType::Root;
    default:
      BOOST_LOG_TRIVIAL(warning) << "Directory: Entry " << id << " has unknown type "
                                 << static_cast<int>(raw) << ", treating as unallocated";
      return EntryType::Unallocated;
  }
}

} // namespace

bool names_equal(const std::string& lhs, const std::string& rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
         });
}


//==============================================
// STREAM HANDLE
//==============================================

StreamHandle::StreamHandle(SectorStore& store, MiniStore& mini_store, const DirectoryEntry& entry, bool mini)
  : store_(store)
  , mini_store_(mini_store)
  , entry_(entry)
  , mini_(mini) {}

std::vector<uint8_t> StreamHandle::read() const {
  std::vector<uint8_t> data = mini_ ? mini_store_.read_chain(entry_.start_sector)
                                    : store_.read_chain(entry_.start_sector);
  if (data.size() < entry_.size) {
    BOOST_LOG_TRIVIAL(error) << "Directory: Stream '" << entry_.name << "' declares " << entry_.size
                             << " bytes but its chain holds " << data.size();
    throw BrokenChainError("stream '" + entry_.name + "' is shorter than its declared size");
  }
  data.resize(static_cast<std::size_t>(entry_.size));
  return data;
}

void StreamHandle::write(const std::vector<uint8_t>& data) {
  if (data.size() > entry_.size) {
    BOOST_LOG_TRIVIAL(error) << "Directory: Refusing to grow stream '" << entry_.name << "' from "
                             << entry_.size << " to " << data.size() << " bytes";
    throw ChainTooShortError(std::to_string(data.size()) + " bytes exceed the " +
                             std::to_string(entry_.size) + " bytes of stream '" + entry_.name + "'");
  }

  if (mini_) {
    mini_store_.write_chain(entry_.start_sector, data);
  } else {
    store_.write_chain(entry_.start_sector, data);
  }
  BOOST_LOG_TRIVIAL(debug) << "Directory: Wrote " << data.size() << " bytes to stream '" << entry_.name << "'";
}


//==============================================
// DIRECTORY
//==============================================

Directory::Directory(SectorStore& store) : store_(store) {
  const auto data = store_.read_chain(store_.header().first_directory_sector);
  const std::size_t count = data.size() / ENTRY_SIZE;

  entries_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    entries_.push_back(parse_entry(data, static_cast<uint32_t>(i)));
  }

  if (entries_.empty() || entries_.front().type != EntryType::Root) {
    BOOST_LOG_TRIVIAL(error) << "Directory: Entry 0 is not a root entry";
    throw MissingRootError("entry 0 of " + std::to_string(entries_.size()) + " is not the root storage");
  }

  const auto& root_entry = entries_.front();
  mini_store_ = std::make_unique<MiniStore>(store_, root_entry.start_sector, root_entry.size);

  BOOST_LOG_TRIVIAL(info) << "Directory: Parsed " << entries_.size() << " entries";
}

DirectoryEntry Directory::parse_entry(const std::vector<uint8_t>& data, uint32_t id) const {
  const std::size_t base = static_cast<std::size_t>(id) * ENTRY_SIZE;

  DirectoryEntry entry;
  entry.id = id;
  entry.name = decode_name(data, base, ByteOrder::readU16(data, base + 64));
  entry.type = to_entry_type(data[base + 66], id);
  entry.color = data[base + 67];
  entry.left_sibling = ByteOrder::readU32(data, base + 68);
  entry.right_sibling = ByteOrder::readU32(data, base + 72);
  entry.child = ByteOrder::readU32(data, base + 76);
  std::copy(data.begin() + base + 80, data.begin() + base + 96, entry.clsid.begin());
  entry.state_bits = ByteOrder::readU32(data, base + 96);
  entry.creation_time = ByteOrder::readU64(data, base + 100);
  entry.modified_time = ByteOrder::readU64(data, base + 108);
  entry.start_sector = ByteOrder::readU32(data, base + 116);
  entry.size = ByteOrder::readU64(data, base + 120);

  // Version 3 writers may leave garbage in the high half of the size
  if (store_.header().major_version == 3) {
    entry.size &= 0xFFFFFFFFull;
  }

  return entry;
}

std::optional<uint32_t> Directory::find_child(uint32_t parent, const std::string& name) const {
  std::vector<bool> visited(entries_.size(), false);
  std::vector<uint32_t> pending{entries_[parent].child};

  while (!pending.empty()) {
    const uint32_t id = pending.back();
    pending.pop_back();

    if (id == NO_STREAM) {
      continue;
    }
    if (id >= entries_.size()) {
      BOOST_LOG_TRIVIAL(error) << "Directory: Sibling id " << id << " outside " << entries_.size() << " entries";
      throw CorruptContainerError("directory id " + std::to_string(id) + " is out of range");
    }
    if (visited[id]) {
      BOOST_LOG_TRIVIAL(warning) << "Directory: Sibling tree under entry " << parent << " revisits entry " << id;
      continue;
    }
    visited[id] = true;

    const auto& entry = entries_[id];
    if (entry.type != EntryType::Unallocated && names_equal(entry.name, name)) {
      return id;
    }
    pending.push_back(entry.left_sibling);
    pending.push_back(entry.right_sibling);
  }

  return std::nullopt;
}

StreamHandle Directory::find_stream(const std::vector<std::string>& path) {
  if (path.empty()) {
    throw StreamNotFoundError("empty stream path");
  }

  std::string joined;
  uint32_t current = 0;
  for (std::size_t i = 0; i < path.size(); ++i) {
    joined += (i == 0 ? "" : "/") + path[i];

    const auto found = find_child(current, path[i]);
    if (!found) {
      BOOST_LOG_TRIVIAL(info) << "Directory: No entry named '" << joined << "'";
      throw StreamNotFoundError(joined);
    }

    const bool leaf = i + 1 == path.size();
    const EntryType expected = leaf ? EntryType::Stream : EntryType::Storage;
    if (entries_[*found].type != expected) {
      BOOST_LOG_TRIVIAL(info) << "Directory: Entry '" << joined << "' is not a "
                              << (leaf ? "stream" : "storage");
      throw StreamNotFoundError(joined + " (wrong entry type)");
    }
    current = *found;
  }

  const auto& entry = entries_[current];
  const bool mini = entry.size < store_.header().mini_stream_cutoff;
  BOOST_LOG_TRIVIAL(debug) << "Directory: Resolved '" << joined << "' to entry " << current << ", "
                           << entry.size << " bytes in the " << (mini ? "mini stream" : "regular sectors");
  return StreamHandle(store_, *mini_store_, entry, mini);
}

} // namespace container
} // namespace vbaunlock
