#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "project/data_encryption.hpp"

namespace vbaunlock {
namespace project {

enum class ProtectionState { Unprotected, Protected };

enum class SchemeKind { Legacy, Modern };

// Plaintext password followed by a 0x00 terminator. No password at all is
// stored as the check value of the empty password, a single 0x00.
struct LegacyPassword {
  std::vector<uint8_t> check_value;
};

// Salted SHA-1 of the password
struct ModernPassword {
  static constexpr std::size_t SALT_SIZE = 4;
  static constexpr std::size_t DIGEST_SIZE = 20;

  std::array<uint8_t, SALT_SIZE> salt{};
  std::array<uint8_t, DIGEST_SIZE> digest{};
  uint32_t iteration_hint = 0;
};

using PasswordScheme = std::variant<LegacyPassword, ModernPassword>;

// Extra SHA-1 rounds applied by VBA project passwords
constexpr uint32_t kModernHashRounds = 0;

// Where one protection value sits in the PROJECT stream and how it was encrypted
struct RecordField {
  std::size_t value_offset = 0;   // first hex digit within the stream text
  std::string hex;
  EncryptedBlob blob;
};

struct RecordLayout {
  std::string text;
  RecordField cmg;
  RecordField dpb;
  RecordField gc;
};

class ProtectionRecord {
public:
  static constexpr uint32_t USER_PROTECTED = 0x1;
  static constexpr uint32_t HOST_PROTECTED = 0x2;
  static constexpr uint32_t VBE_PROTECTED = 0x4;
  static constexpr uint32_t RESERVED_BITS = ~uint32_t(0x7);

  static constexpr uint8_t NOT_VISIBLE = 0x00;
  static constexpr uint8_t VISIBLE = 0xFF;

  // A record with no PROJECT stream behind it, which therefore cannot be re-encoded
  ProtectionRecord(uint32_t protection_bits, bool visible, PasswordScheme scheme);

  // ---- STATE ----
  ProtectionState state() const;
  uint32_t protection_bits() const { return protection_bits_; }
  bool user_protected() const { return protection_bits_ & USER_PROTECTED; }
  bool host_protected() const { return protection_bits_ & HOST_PROTECTED; }
  bool vbe_protected() const { return protection_bits_ & VBE_PROTECTED; }
  bool visible() const { return visible_; }

  // Clears the VBE and user bits, host protection is left alone
  void set_unprotected();


  // ---- PASSWORD ----
  const PasswordScheme& scheme() const { return scheme_; }
  SchemeKind scheme_kind() const;
  // Empty under Legacy
  std::vector<uint8_t> salt() const;
  // Legacy check value or Modern SHA-1 digest
  std::vector<uint8_t> digest() const;
  uint32_t iteration_hint() const;
  // Only Legacy records carry the password itself
  std::optional<std::string> plaintext_password() const;


  const std::optional<RecordLayout>& layout() const { return layout_; }

private:
  friend class ProtectionRecordCodec;

  uint32_t protection_bits_;
  bool visible_;
  PasswordScheme scheme_;
  std::optional<RecordLayout> layout_;
};

// Reads and writes the CMG, DPB and GC lines of a PROJECT stream
class ProtectionRecordCodec {
public:
  static constexpr std::size_t STATE_SIZE = 4;
  static constexpr std::size_t VISIBILITY_SIZE = 1;
  static constexpr std::size_t PASSWORD_HASH_SIZE = 29;

  static ProtectionRecord decode(const std::vector<uint8_t>& stream);

  // Same length as the decoded stream, untouched lines are copied verbatim
  static std::vector<uint8_t> encode(const ProtectionRecord& record);

  // DPB payload before Data Encryption
  static std::vector<uint8_t> encode_password(const PasswordScheme& scheme);
  static PasswordScheme decode_password(const std::vector<uint8_t>& data);
};

} // namespace project
} // namespace vbaunlock
