#include "workbook/zip_archive.hpp"
#include "container/byte_order.hpp"
#include <algorithm>
#include <numeric>
#include <utility>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace vbaunlock::workbook {

using container::ByteOrder;

namespace {

constexpr uint32_t LOCAL_SIGNATURE = 0x04034B50;
constexpr uint32_t CENTRAL_SIGNATURE = 0x02014B50;
constexpr uint32_t END_SIGNATURE = 0x06054B50;
constexpr uint32_t DESCRIPTOR_SIGNATURE = 0x08074B50;

constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t CENTRAL_HEADER_SIZE = 46;
constexpr std::size_t END_RECORD_SIZE = 22;
constexpr std::size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint32_t ZIP64_MARKER = 0xFFFFFFFF;

// Deflate compresses by at most this factor
constexpr uint64_t MAX_DEFLATE_RATIO = 1032;

uint32_t checksum(const std::vector<uint8_t>& data) {
  return static_cast<uint32_t>(::crc32(0L, data.data(), static_cast<uInt>(data.size())));
}


//=================================================
// RAII WRAPPERS TO MANAGE ZLIB STREAM LIFECYCLE
//=================================================

struct InflateStream {
  z_stream stream{};

  InflateStream() {
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
      throw ZipArchiveError("Failed to initialize inflate");
    }
  }

  ~InflateStream() { inflateEnd(&stream); }

  z_stream* get() { return &stream; }
};

struct DeflateStream {
  z_stream stream{};

  DeflateStream() {
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
      throw ZipArchiveError("Failed to initialize deflate");
    }
  }

  ~DeflateStream() { deflateEnd(&stream); }

  z_stream* get() { return &stream; }
};


//==============================================
// RAW DEFLATE
//==============================================

std::vector<uint8_t> inflate_raw(const uint8_t* data, std::size_t size, std::size_t expected) {
  InflateStream inflater;
  z_stream* stream = inflater.get();

  // One spare byte so a stream longer than declared is caught
  std::vector<uint8_t> output(expected + 1);
  stream->next_in = const_cast<Bytef*>(data);
  stream->avail_in = static_cast<uInt>(size);
  stream->next_out = output.data();
  stream->avail_out = static_cast<uInt>(output.size());

  const int status = inflate(stream, Z_FINISH);
  if (status != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: Inflate stopped with status " << status;
    throw ZipArchiveError("deflated data is corrupt or longer than declared");
  }

  output.resize(stream->total_out);
  return output;
}

std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data) {
  DeflateStream deflater;
  z_stream* stream = deflater.get();

  std::vector<uint8_t> output(deflateBound(stream, static_cast<uLong>(data.size())));
  stream->next_in = const_cast<Bytef*>(data.data());
  stream->avail_in = static_cast<uInt>(data.size());
  stream->next_out = output.data();
  stream->avail_out = static_cast<uInt>(output.size());

  if (deflate(stream, Z_FINISH) != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: Deflate did not finish";
    throw ZipArchiveError("Failed to deflate entry");
  }

  output.resize(stream->total_out);
  return output;
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

ZipArchive::ZipArchive(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
  end_record_offset_ = find_end_record();
  parse_central_directory();

  BOOST_LOG_TRIVIAL(debug) << "Zip archive: " << entries_.size() << " entries, central directory at "
                           << central_offset_;
}


//==============================================
// PARSING
//==============================================

std::size_t ZipArchive::find_end_record() const {
  if (bytes_.size() < END_RECORD_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: " << bytes_.size() << " bytes is too short";
    throw ZipArchiveError("too short for an end of central directory record");
  }

  // The record sits at the end, followed only by its comment
  const std::size_t last = bytes_.size() - END_RECORD_SIZE;
  const std::size_t first = last > MAX_COMMENT_SIZE ? last - MAX_COMMENT_SIZE : 0;
  for (std::size_t offset = last + 1; offset-- > first;) {
    if (ByteOrder::readU32(bytes_, offset) != END_SIGNATURE) {
      continue;
    }
    const std::size_t comment = ByteOrder::readU16(bytes_, offset + 20);
    if (offset + END_RECORD_SIZE + comment <= bytes_.size()) {
      return offset;
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Zip archive: No end of central directory record";
  throw ZipArchiveError("no end of central directory record");
}

void ZipArchive::parse_central_directory() {
  const std::size_t end = end_record_offset_;
  const uint16_t disk = ByteOrder::readU16(bytes_, end + 4);
  const uint16_t directory_disk = ByteOrder::readU16(bytes_, end + 6);
  const uint16_t disk_entries = ByteOrder::readU16(bytes_, end + 8);
  const uint16_t total_entries = ByteOrder::readU16(bytes_, end + 10);
  const uint32_t central_size = ByteOrder::readU32(bytes_, end + 12);
  const uint32_t central_offset = ByteOrder::readU32(bytes_, end + 16);

  if (total_entries == 0xFFFF || central_size == ZIP64_MARKER || central_offset == ZIP64_MARKER) {
    throw ZipArchiveError("zip64 archives are not supported");
  }
  if (disk != 0 || directory_disk != 0 || disk_entries != total_entries) {
    throw ZipArchiveError("multi-disk archives are not supported");
  }
  if (static_cast<std::size_t>(central_offset) + central_size > end) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: Central directory at " << central_offset << " of "
                             << central_size << " bytes overruns the end record at " << end;
    throw ZipArchiveError("central directory lies outside the archive");
  }

  central_offset_ = central_offset;
  const std::size_t central_end = central_offset_ + central_size;
  std::size_t position = central_offset_;

  entries_.clear();
  entries_.reserve(total_entries);
  for (uint16_t i = 0; i < total_entries; ++i) {
    if (position + CENTRAL_HEADER_SIZE > central_end ||
        ByteOrder::readU32(bytes_, position) != CENTRAL_SIGNATURE) {
      throw ZipArchiveError("central directory record " + std::to_string(i) + " is damaged");
    }

    const std::size_t name_length = ByteOrder::readU16(bytes_, position + 28);
    const std::size_t extra_length = ByteOrder::readU16(bytes_, position + 30);
    const std::size_t comment_length = ByteOrder::readU16(bytes_, position + 32);
    const std::size_t length = CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    if (position + length > central_end) {
      throw ZipArchiveError("central directory record " + std::to_string(i) + " is truncated");
    }

    ZipEntry entry;
    entry.flags = ByteOrder::readU16(bytes_, position + 8);
    entry.method = ByteOrder::readU16(bytes_, position + 10);
    entry.crc32 = ByteOrder::readU32(bytes_, position + 16);
    entry.compressed_size = ByteOrder::readU32(bytes_, position + 20);
    entry.uncompressed_size = ByteOrder::readU32(bytes_, position + 24);
    entry.local_header_offset = ByteOrder::readU32(bytes_, position + 42);
    entry.name.assign(bytes_.begin() + position + CENTRAL_HEADER_SIZE,
                      bytes_.begin() + position + CENTRAL_HEADER_SIZE + name_length);
    entry.central_offset = position;
    entry.central_length = length;

    if (entry.compressed_size == ZIP64_MARKER || entry.uncompressed_size == ZIP64_MARKER ||
        entry.local_header_offset == ZIP64_MARKER) {
      throw ZipArchiveError("zip64 entry " + entry.name + " is not supported");
    }
    if (static_cast<std::size_t>(entry.local_header_offset) + LOCAL_HEADER_SIZE > central_offset_) {
      throw ZipArchiveError("local header of " + entry.name + " lies outside the archive");
    }

    entries_.push_back(std::move(entry));
    position += length;
  }
}


//==============================================
// ENTRY ACCESS
//==============================================

bool ZipArchive::contains(const std::string& name) const {
  return std::any_of(entries_.begin(), entries_.end(),
                     [&name](const ZipEntry& entry) { return entry.name == name; });
}

const ZipEntry& ZipArchive::find(const std::string& name) const {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&name](const ZipEntry& entry) { return entry.name == name; });
  if (it == entries_.end()) {
    throw ZipArchiveError("no entry named " + name);
  }
  return *it;
}

std::size_t ZipArchive::local_name_end(const ZipEntry& entry) const {
  const std::size_t offset = entry.local_header_offset;
  if (ByteOrder::readU32(bytes_, offset) != LOCAL_SIGNATURE) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: Bad local header signature for " << entry.name;
    throw ZipArchiveError("local header of " + entry.name + " is damaged");
  }

  const std::size_t name_length = ByteOrder::readU16(bytes_, offset + 26);
  const std::size_t extra_length = ByteOrder::readU16(bytes_, offset + 28);
  const std::size_t data_offset = offset + LOCAL_HEADER_SIZE + name_length + extra_length;
  if (data_offset + entry.compressed_size > central_offset_) {
    throw ZipArchiveError("data of " + entry.name + " runs into the central directory");
  }
  return data_offset;
}

std::size_t ZipArchive::local_record_end(const ZipEntry& entry) const {
  std::size_t end = local_name_end(entry) + entry.compressed_size;
  if (entry.flags & FLAG_DATA_DESCRIPTOR) {
    // crc and both sizes, optionally behind a signature
    std::size_t descriptor = 12;
    if (end + 4 <= central_offset_ && ByteOrder::readU32(bytes_, end) == DESCRIPTOR_SIGNATURE) {
      descriptor = 16;
    }
    if (end + descriptor > central_offset_) {
      throw ZipArchiveError("data descriptor of " + entry.name + " is truncated");
    }
    end += descriptor;
  }
  return end;
}

std::vector<uint8_t> ZipArchive::read(const std::string& name) const {
  const ZipEntry& entry = find(name);
  if (entry.flags & FLAG_ENCRYPTED) {
    throw ZipArchiveError(name + " is encrypted");
  }

  const std::size_t data_offset = local_name_end(entry);
  const uint8_t* data = bytes_.data() + data_offset;

  std::vector<uint8_t> contents;
  switch (entry.method) {
    case STORED:
      if (entry.compressed_size != entry.uncompressed_size) {
        throw ZipArchiveError("stored entry " + name + " has mismatched sizes");
      }
      contents.assign(data, data + entry.compressed_size);
      break;
    case DEFLATED:
      if (entry.uncompressed_size > uint64_t{entry.compressed_size} * MAX_DEFLATE_RATIO + 64) {
        throw ZipArchiveError(name + " declares an implausible size of " +
                              std::to_string(entry.uncompressed_size) + " bytes");
      }
      contents = inflate_raw(data, entry.compressed_size, entry.uncompressed_size);
      break;
    default:
      throw ZipArchiveError(name + " uses unsupported compression method " + std::to_string(entry.method));
  }

  if (contents.size() != entry.uncompressed_size) {
    throw ZipArchiveError(name + " inflated to " + std::to_string(contents.size()) + " bytes, expected " +
                          std::to_string(entry.uncompressed_size));
  }
  if (checksum(contents) != entry.crc32) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: CRC mismatch for " << name;
    throw ZipArchiveError(name + " fails its CRC check");
  }

  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Read " << contents.size() << " bytes from " << name;
  return contents;
}


//==============================================
// REWRITE
//==============================================

std::vector<uint8_t> ZipArchive::replace(const std::string& name, const std::vector<uint8_t>& data) const {
  const ZipEntry& target = find(name);
  if (read(name) == data) {
    BOOST_LOG_TRIVIAL(info) << "Zip archive: " << name << " unchanged, keeping the archive as is";
    return bytes_;
  }
  if (data.size() >= ZIP64_MARKER) {
    throw ZipArchiveError(name + " would need zip64 sizes");
  }

  const std::vector<uint8_t> payload = target.method == DEFLATED ? deflate_raw(data) : data;
  const uint32_t crc = checksum(data);

  // Local records keep their order in the file
  std::vector<std::size_t> order(entries_.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
    return entries_[a].local_header_offset < entries_[b].local_header_offset;
  });

  std::vector<uint8_t> output;
  output.reserve(bytes_.size() + payload.size());
  std::vector<std::size_t> new_offsets(entries_.size());

  for (std::size_t index : order) {
    const ZipEntry& entry = entries_[index];
    new_offsets[index] = output.size();
    const auto begin = bytes_.begin() + entry.local_header_offset;

    if (&entry != &target) {
      output.insert(output.end(), begin, bytes_.begin() + local_record_end(entry));
      continue;
    }

    const std::size_t header_start = output.size();
    output.insert(output.end(), begin, bytes_.begin() + local_name_end(entry));
    const uint16_t flags = ByteOrder::readU16(output, header_start + 6);
    ByteOrder::writeU16(output, header_start + 6, static_cast<uint16_t>(flags & ~FLAG_DATA_DESCRIPTOR));
    ByteOrder::writeU32(output, header_start + 14, crc);
    ByteOrder::writeU32(output, header_start + 18, static_cast<uint32_t>(payload.size()));
    ByteOrder::writeU32(output, header_start + 22, static_cast<uint32_t>(data.size()));
    output.insert(output.end(), payload.begin(), payload.end());
  }

  const std::size_t central_offset = output.size();
  for (std::size_t index = 0; index < entries_.size(); ++index) {
    const ZipEntry& entry = entries_[index];
    const std::size_t record = output.size();
    output.insert(output.end(), bytes_.begin() + entry.central_offset,
                  bytes_.begin() + entry.central_offset + entry.central_length);
    ByteOrder::writeU32(output, record + 42, static_cast<uint32_t>(new_offsets[index]));

    if (&entry == &target) {
      ByteOrder::writeU16(output, record + 8, static_cast<uint16_t>(entry.flags & ~FLAG_DATA_DESCRIPTOR));
      ByteOrder::writeU32(output, record + 16, crc);
      ByteOrder::writeU32(output, record + 20, static_cast<uint32_t>(payload.size()));
      ByteOrder::writeU32(output, record + 24, static_cast<uint32_t>(data.size()));
    }
  }

  if (output.size() >= ZIP64_MARKER) {
    throw ZipArchiveError("rewritten archive would need zip64 offsets");
  }

  const std::size_t central_size = output.size() - central_offset;
  const std::size_t end_record = output.size();
  output.insert(output.end(), bytes_.begin() + end_record_offset_, bytes_.end());
  ByteOrder::writeU32(output, end_record + 12, static_cast<uint32_t>(central_size));
  ByteOrder::writeU32(output, end_record + 16, static_cast<uint32_t>(central_offset));

  BOOST_LOG_TRIVIAL(info) << "Zip archive: Replaced " << name << " (" << data.size() << " bytes, "
                          << payload.size() << " stored)";
  return output;
}

} // namespace vbaunlock::workbook
