#include "project/protection_record.hpp"
#include "project/hex.hpp"
#include "project/project_error.hpp"
#include <cctype>
#include <boost/log/trivial.hpp>

namespace vbaunlock {
namespace project {

namespace {

constexpr uint8_t HASH_RESERVED = 0xFF;
constexpr uint8_t TERMINATOR = 0x00;
constexpr uint8_t NULL_PLACEHOLDER = 0x01;

// Locates KEY="..." at the start of a line. Returns false when the line holds another key.
bool parse_field(const std::string& text, std::size_t line_begin, std::size_t line_end,
                 const std::string& key, std::optional<RecordField>& field) {
  const std::string prefix = key + "=\"";
  if (line_end - line_begin < prefix.size() || text.compare(line_begin, prefix.size(), prefix) != 0) {
    return false;
  }

  if (field) {
    BOOST_LOG_TRIVIAL(error) << "Protection record: Duplicate " << key << " line";
    throw MalformedRecordError("duplicate " + key + " line");
  }

  const std::size_t value_begin = line_begin + prefix.size();
  const std::size_t closing = text.find('"', value_begin);
  if (closing == std::string::npos || closing >= line_end) {
    BOOST_LOG_TRIVIAL(error) << "Protection record: Unterminated " << key << " value";
    throw MalformedRecordError(key + " value has no closing quote");
  }

  RecordField parsed;
  parsed.value_offset = value_begin;
  parsed.hex = text.substr(value_begin, closing - value_begin);
  parsed.blob = DataEncryption::decrypt(from_hex(parsed.hex));
  field = std::move(parsed);
  return true;
}

RecordField require(std::optional<RecordField>& field, const std::string& key) {
  if (!field) {
    BOOST_LOG_TRIVIAL(error) << "Protection record: Missing " << key << " line";
    throw MalformedRecordError("missing " + key + " line");
  }
  return std::move(*field);
}

// Keeps each original digit where it still matches, so lowercase input stays lowercase
std::string render_like(const std::string& original, const std::vector<uint8_t>& bytes) {
  std::string rendered = to_hex(bytes);
  for (std::size_t i = 0; i < rendered.size() && i < original.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(original[i])) == rendered[i]) {
      rendered[i] = original[i];
    }
  }
  return rendered;
}

void replace_field(std::string& text, const RecordField& field, const std::vector<uint8_t>& data,
                   const std::string& key) {
  EncryptedBlob blob = field.blob;
  blob.data = data;

  const std::string hex = render_like(field.hex, DataEncryption::encrypt(blob));
  if (hex.size() != field.hex.size()) {
    BOOST_LOG_TRIVIAL(error) << "Protection record: Re-encoded " << key << " is " << hex.size()
                             << " digits, original was " << field.hex.size();
    throw MalformedRecordError(key + " value changed length when re-encoded");
  }
  text.replace(field.value_offset, hex.size(), hex);
}

} // namespace


//==============================================
// PROTECTION RECORD
//==============================================

ProtectionRecord::ProtectionRecord(uint32_t protection_bits, bool visible, PasswordScheme scheme)
  : protection_bits_(protection_bits)
  , visible_(visible)
  , scheme_(std::move(scheme)) {}

ProtectionState ProtectionRecord::state() const {
  return vbe_protected() ? ProtectionState::Protected : ProtectionState::Unprotected;
}

void ProtectionRecord::set_unprotected() {
  protection_bits_ &= ~(VBE_PROTECTED | USER_PROTECTED);
}

SchemeKind ProtectionRecord::scheme_kind() const {
  return std::holds_alternative<ModernPassword>(scheme_) ? SchemeKind::Modern : SchemeKind::Legacy;
}

std::vector<uint8_t> ProtectionRecord::salt() const {
  if (const auto* modern = std::get_if<ModernPassword>(&scheme_)) {
    return std::vector<uint8_t>(modern->salt.begin(), modern->salt.end());
  }
  return {};
}

std::vector<uint8_t> ProtectionRecord::digest() const {
  if (const auto* modern = std::get_if<ModernPassword>(&scheme_)) {
    return std::vector<uint8_t>(modern->digest.begin(), modern->digest.end());
  }
  return std::get<LegacyPassword>(scheme_).check_value;
}

uint32_t ProtectionRecord::iteration_hint() const {
  if (const auto* modern = std::get_if<ModernPassword>(&scheme_)) {
    return modern->iteration_hint;
  }
  return 0;
}

std::optional<std::string> ProtectionRecord::plaintext_password() const {
  const auto* legacy = std::get_if<LegacyPassword>(&scheme_);
  if (!legacy || legacy->check_value.empty()) {
    return std::nullopt;
  }
  return std::string(legacy->check_value.begin(), legacy->check_value.end() - 1);
}


//==============================================
// PASSWORD PAYLOAD
//==============================================

PasswordScheme ProtectionRecordCodec::decode_password(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    throw MalformedRecordError("password value holds no data");
  }

  // Only a 29 byte value led by the reserved byte is a hash, a plaintext
  // password may itself start with 0xFF
  if (data.size() != PASSWORD_HASH_SIZE || data.front() != HASH_RESERVED) {
    if (data.back() != TERMINATOR) {
      BOOST_LOG_TRIVIAL(error) << "Protection record: Password bytes are neither hashed nor terminated";
      throw UnrecognizedSchemeError("password value of " + std::to_string(data.size()) +
                                    " bytes has no known layout");
    }
    return LegacyPassword{data};
  }

  if (data.back() != TERMINATOR) {
    throw MalformedRecordError("password hash is not null terminated");
  }

  ModernPassword modern;
  modern.iteration_hint = kModernHashRounds;

  // A cleared bit marks a stored 0x01 that stands for 0x00
  const uint32_t grbit_key = data[1] & 0x0F;
  const uint32_t grbit_hash_null = (uint32_t(data[1]) >> 4) | (uint32_t(data[2]) << 4) | (uint32_t(data[3]) << 12);

  auto restore = [](uint8_t stored, bool kept, const char* part, std::size_t index) -> uint8_t {
    if (kept) {
      if (stored == 0x00) {
        throw MalformedRecordError(std::string("raw null in ") + part + " byte " + std::to_string(index));
      }
      return stored;
    }
    if (stored != NULL_PLACEHOLDER) {
      throw MalformedRecordError(std::string("mis-coded null in ") + part + " byte " + std::to_string(index));
    }
    return 0x00;
  };

  for (std::size_t i = 0; i < ModernPassword::SALT_SIZE; ++i) {
    modern.salt[i] = restore(data[4 + i], (grbit_key >> i) & 1, "salt", i);
  }
  for (std::size_t i = 0; i < ModernPassword::DIGEST_SIZE; ++i) {
    modern.digest[i] = restore(data[8 + i], (grbit_hash_null >> i) & 1, "digest", i);
  }

  return modern;
}

std::vector<uint8_t> ProtectionRecordCodec::encode_password(const PasswordScheme& scheme) {
  if (const auto* legacy = std::get_if<LegacyPassword>(&scheme)) {
    return legacy->check_value;
  }

  const auto& modern = std::get<ModernPassword>(scheme);
  std::vector<uint8_t> data(PASSWORD_HASH_SIZE, 0x00);
  data[0] = HASH_RESERVED;

  uint32_t grbit_key = 0;
  for (std::size_t i = 0; i < ModernPassword::SALT_SIZE; ++i) {
    if (modern.salt[i] == 0x00) {
      data[4 + i] = NULL_PLACEHOLDER;
    } else {
      data[4 + i] = modern.salt[i];
      grbit_key |= 1u << i;
    }
  }

  uint32_t grbit_hash_null = 0;
  for (std::size_t i = 0; i < ModernPassword::DIGEST_SIZE; ++i) {
    if (modern.digest[i] == 0x00) {
      data[8 + i] = NULL_PLACEHOLDER;
    } else {
      data[8 + i] = modern.digest[i];
      grbit_hash_null |= 1u << i;
    }
  }

  data[1] = static_cast<uint8_t>(((grbit_hash_null & 0x0F) << 4) | grbit_key);
  data[2] = static_cast<uint8_t>(grbit_hash_null >> 4);
  data[3] = static_cast<uint8_t>(grbit_hash_null >> 12);
  data[28] = TERMINATOR;
  return data;
}


//==============================================
// STREAM DECODE AND ENCODE
//==============================================

ProtectionRecord ProtectionRecordCodec::decode(const std::vector<uint8_t>& stream) {
  RecordLayout layout;
  layout.text.assign(stream.begin(), stream.end());
  const std::string& text = layout.text;

  std::optional<RecordField> cmg;
  std::optional<RecordField> dpb;
  std::optional<RecordField> gc;

  std::size_t line_begin = 0;
  while (line_begin < text.size()) {
    std::size_t line_end = text.find('\n', line_begin);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    if (!parse_field(text, line_begin, line_end, "CMG", cmg) &&
        !parse_field(text, line_begin, line_end, "DPB", dpb)) {
      parse_field(text, line_begin, line_end, "GC", gc);
    }

    line_begin = line_end + 1;
  }

  layout.cmg = require(cmg, "CMG");
  layout.dpb = require(dpb, "DPB");
  layout.gc = require(gc, "GC");

  const auto& state = layout.cmg.blob.data;
  if (state.size() != STATE_SIZE) {
    throw MalformedRecordError("protection state of " + std::to_string(state.size()) + " bytes, expected 4");
  }
  const uint32_t bits = uint32_t(state[0]) | (uint32_t(state[1]) << 8) |
                        (uint32_t(state[2]) << 16) | (uint32_t(state[3]) << 24);
  if (bits & ProtectionRecord::RESERVED_BITS) {
    BOOST_LOG_TRIVIAL(error) << "Protection record: Reserved protection bits set in 0x" << std::hex << bits;
    throw MalformedRecordError("reserved protection state bits are set");
  }

  const auto& visibility = layout.gc.blob.data;
  if (visibility.size() != VISIBILITY_SIZE) {
    throw MalformedRecordError("visibility of " + std::to_string(visibility.size()) + " bytes, expected 1");
  }
  if (visibility[0] != ProtectionRecord::VISIBLE && visibility[0] != ProtectionRecord::NOT_VISIBLE) {
    throw MalformedRecordError("visibility byte " + std::to_string(visibility[0]) + " is neither 0x00 nor 0xFF");
  }

  ProtectionRecord record(bits, visibility[0] == ProtectionRecord::VISIBLE, decode_password(layout.dpb.blob.data));
  record.layout_ = std::move(layout);

  BOOST_LOG_TRIVIAL(info) << "Protection record: Decoded "
                          << (record.state() == ProtectionState::Protected ? "protected" : "unprotected")
                          << " project, " << (record.scheme_kind() == SchemeKind::Modern ? "modern" : "legacy")
                          << " password";
  return record;
}

std::vector<uint8_t> ProtectionRecordCodec::encode(const ProtectionRecord& record) {
  if (!record.layout_) {
    throw MalformedRecordError("record was not decoded from a stream and cannot be re-encoded");
  }
  const RecordLayout& layout = *record.layout_;
  std::string text = layout.text;

  const uint32_t bits = record.protection_bits_;
  replace_field(text, layout.cmg,
                {uint8_t(bits), uint8_t(bits >> 8), uint8_t(bits >> 16), uint8_t(bits >> 24)}, "CMG");
  replace_field(text, layout.dpb, encode_password(record.scheme_), "DPB");
  replace_field(text, layout.gc,
                {record.visible_ ? ProtectionRecord::VISIBLE : ProtectionRecord::NOT_VISIBLE}, "GC");

  BOOST_LOG_TRIVIAL(debug) << "Protection record: Encoded " << text.size() << " bytes";
  return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace project
} // namespace vbaunlock
