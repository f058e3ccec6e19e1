#ifndef VBAUNLOCK_HASH_ENGINE_HPP
#define VBAUNLOCK_HASH_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"
#include "project/protection_record.hpp"

namespace vbaunlock::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Computes the stored form of a candidate password for either scheme.
// Owns one EVP context, so an engine must not be shared between threads.
class HashEngine {
public:
  static constexpr std::size_t SHA1_SIZE = 20;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HashEngine();
  ~HashEngine();

  HashEngine(const HashEngine&) = delete;
  HashEngine& operator=(const HashEngine&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Legacy: password bytes plus a 0x00 terminator, salt must be empty.
  // Modern: SHA1(password || salt) then `rounds` extra rounds of SHA1(H || LE32(i)),
  // rounds defaults to kModernHashRounds.
  std::vector<uint8_t> digest_for(project::SchemeKind scheme, const std::vector<uint8_t>& salt,
                                  const std::string& password,
                                  std::optional<uint32_t> rounds = std::nullopt);

  // True when password reproduces the record's stored digest exactly
  bool matches(const project::ProtectionRecord& record, const std::string& password);

  // Plain SHA-1 of data
  std::vector<uint8_t> sha1(const std::vector<uint8_t>& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
};

} // namespace vbaunlock::crypto

#endif // VBAUNLOCK_HASH_ENGINE_HPP
