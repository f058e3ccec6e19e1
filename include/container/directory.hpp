#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "container/mini_store.hpp"
#include "container/sector_store.hpp"

namespace vbaunlock {
namespace container {

enum class EntryType : uint8_t {
  Unallocated = 0,
  Storage = 1,
  Stream = 2,
  Root = 5
};

// One parsed 128 byte directory entry
struct DirectoryEntry {
  uint32_t id = 0;
  std::string name;               // UTF-8
  EntryType type = EntryType::Unallocated;
  uint8_t color = 0;
  uint32_t left_sibling = NO_STREAM;
  uint32_t right_sibling = NO_STREAM;
  uint32_t child = NO_STREAM;
  std::array<uint8_t, 16> clsid{};
  uint32_t state_bits = 0;
  uint64_t creation_time = 0;
  uint64_t modified_time = 0;
  uint32_t start_sector = END_OF_CHAIN;
  uint64_t size = 0;
};

class Directory;

// A resolved stream. Only valid while the Directory that produced it is alive.
class StreamHandle {
public:
  // Exactly `size` bytes, BrokenChainError when the chain holds fewer
  std::vector<uint8_t> read() const;
  // Overwrites the stream in place. Never grows it: more than `size` bytes is ChainTooShortError.
  void write(const std::vector<uint8_t>& data);

  const DirectoryEntry& entry() const { return entry_; }
  uint64_t size() const { return entry_.size; }
  bool in_mini_stream() const { return mini_; }

private:
  friend class Directory;
  StreamHandle(SectorStore& store, MiniStore& mini_store, const DirectoryEntry& entry, bool mini);

  SectorStore& store_;
  MiniStore& mini_store_;
  DirectoryEntry entry_;
  bool mini_;
};

class Directory {
public:
  static constexpr std::size_t ENTRY_SIZE = 128;

  // ---- CONSTRUCTOR ----
  // Parses every directory sector and builds the mini store from the root entry
  explicit Directory(SectorStore& store);

  Directory(const Directory&) = delete;
  Directory& operator=(const Directory&) = delete;


  // ---- LOOKUP ----
  // path holds storage names followed by the stream name, compared case-insensitively
  StreamHandle find_stream(const std::vector<std::string>& path);


  // ---- GETTERS ----
  const std::vector<DirectoryEntry>& entries() const { return entries_; }
  const DirectoryEntry& root() const { return entries_.front(); }

private:
  // ---- PARAMETERS ----
  SectorStore& store_;
  std::vector<DirectoryEntry> entries_;
  std::unique_ptr<MiniStore> mini_store_;


  // ---- UTILITY METHODS ----
  DirectoryEntry parse_entry(const std::vector<uint8_t>& data, uint32_t id) const;
  // Searches the sibling tree under parent for name
  std::optional<uint32_t> find_child(uint32_t parent, const std::string& name) const;
};

// Case-insensitive comparison used for entry names
bool names_equal(const std::string& lhs, const std::string& rhs);

} // namespace container
} // namespace vbaunlock
