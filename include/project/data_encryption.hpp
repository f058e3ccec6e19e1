#ifndef VBAUNLOCK_DATA_ENCRYPTION_HPP
#define VBAUNLOCK_DATA_ENCRYPTION_HPP

#include <cstdint>
#include <vector>

namespace vbaunlock::project {

// Everything needed to reproduce an encrypted value byte for byte
struct EncryptedBlob {
  uint8_t seed = 0;
  uint8_t project_key = 0;
  std::vector<uint8_t> ignored;   // (seed & 6) >> 1 bytes
  std::vector<uint8_t> data;
};

// Reversible obfuscation wrapping the protection values of a PROJECT stream.
// Layout: seed, version ^ seed, key ^ seed, then ignored bytes, a little endian
// 32 bit length and the data, each byte chained to the two previous ciphertext
// bytes and the previous plaintext byte.
class DataEncryption {
public:
  static constexpr uint8_t VERSION = 2;
  // Seed, version, key, length and at least one data byte
  static constexpr std::size_t MIN_ENCRYPTED_SIZE = 8;

  // Throws UnrecognizedSchemeError for a version other than 2 and
  // MalformedRecordError when too short or the length field disagrees with the data
  static EncryptedBlob decrypt(const std::vector<uint8_t>& encrypted);

  // blob.ignored must hold exactly ignored_length(blob.seed) bytes
  static std::vector<uint8_t> encrypt(const EncryptedBlob& blob);

  static std::size_t ignored_length(uint8_t seed) { return (seed & 6) >> 1; }
};

} // namespace vbaunlock::project

#endif // VBAUNLOCK_DATA_ENCRYPTION_HPP
