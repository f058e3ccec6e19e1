#include "crypto/hash_engine.hpp"
#include <openssl/evp.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace vbaunlock::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HashEngine::HashEngine() : context_(std::make_unique<DigestContext>()) {
  BOOST_LOG_TRIVIAL(debug) << "Hash engine: Digest context created";
}

HashEngine::~HashEngine() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

std::vector<uint8_t> HashEngine::sha1(const std::vector<uint8_t>& data) {
  EVP_MD_CTX* ctx = context_->get();

  if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Hash engine: Failed to initialize SHA-1";
    throw DigestError("Failed to initialize SHA-1");
  }
  if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Hash engine: Failed to update SHA-1";
    throw DigestError("Failed to update SHA-1");
  }

  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Hash engine: Failed to finalize SHA-1";
    throw DigestError("Failed to finalize SHA-1");
  }
  digest.resize(length);
  return digest;
}

std::vector<uint8_t> HashEngine::digest_for(project::SchemeKind scheme, const std::vector<uint8_t>& salt,
                                            const std::string& password, std::optional<uint32_t> rounds) {
  std::vector<uint8_t> buffer(password.begin(), password.end());

  if (scheme == project::SchemeKind::Legacy) {
    if (!salt.empty()) {
      BOOST_LOG_TRIVIAL(error) << "Hash engine: Salt of " << salt.size() << " bytes given to legacy scheme";
      throw SaltError("legacy passwords are not salted");
    }
    buffer.push_back(0x00);
    return buffer;
  }

  buffer.insert(buffer.end(), salt.begin(), salt.end());
  std::vector<uint8_t> digest = sha1(buffer);

  const uint32_t extra = rounds.value_or(project::kModernHashRounds);
  for (uint32_t i = 0; i < extra; ++i) {
    uint8_t counter[4];
    boost::endian::store_little_u32(counter, i);
    digest.insert(digest.end(), counter, counter + 4);
    digest = sha1(digest);
  }

  return digest;
}

bool HashEngine::matches(const project::ProtectionRecord& record, const std::string& password) {
  return digest_for(record.scheme_kind(), record.salt(), password, record.iteration_hint()) == record.digest();
}

} // namespace vbaunlock::crypto
