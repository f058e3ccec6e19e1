#include "project/data_encryption.hpp"
#include "project/project_error.hpp"
#include <boost/log/trivial.hpp>

namespace vbaunlock::project {

namespace {

// Running state shared by both directions
struct CipherState {
  uint8_t unencrypted_byte_1;
  uint8_t encrypted_byte_1;
  uint8_t encrypted_byte_2;

  uint8_t mask() const { return static_cast<uint8_t>(encrypted_byte_2 + unencrypted_byte_1); }

  void advance(uint8_t plain, uint8_t cipher) {
    encrypted_byte_2 = encrypted_byte_1;
    encrypted_byte_1 = cipher;
    unencrypted_byte_1 = plain;
  }
};

} // namespace

//==============================================
// DECRYPTION
//==============================================

EncryptedBlob DataEncryption::decrypt(const std::vector<uint8_t>& encrypted) {
  if (encrypted.size() < MIN_ENCRYPTED_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Data encryption: Value of " << encrypted.size() << " bytes is too short";
    throw MalformedRecordError("encrypted value of " + std::to_string(encrypted.size()) + " bytes is too short");
  }

  EncryptedBlob blob;
  blob.seed = encrypted[0];
  const uint8_t version_enc = encrypted[1];
  const uint8_t project_key_enc = encrypted[2];

  const uint8_t version = blob.seed ^ version_enc;
  if (version != VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Data encryption: Unsupported version " << static_cast<int>(version);
    throw UnrecognizedSchemeError("data encryption version " + std::to_string(version) + " is not 2");
  }
  blob.project_key = blob.seed ^ project_key_enc;

  const std::size_t ignored = ignored_length(blob.seed);
  if (encrypted.size() < 3 + ignored + 4) {
    throw MalformedRecordError("encrypted value ends inside its length field");
  }

  CipherState state{blob.project_key, project_key_enc, version_enc};
  uint32_t length = 0;

  for (std::size_t i = 3; i < encrypted.size(); ++i) {
    const uint8_t cipher = encrypted[i];
    const uint8_t plain = cipher ^ state.mask();
    state.advance(plain, cipher);

    const std::size_t index = i - 3;
    if (index < ignored) {
      blob.ignored.push_back(plain);
    } else if (index < ignored + 4) {
      length |= static_cast<uint32_t>(plain) << (8 * (index - ignored));
    } else {
      blob.data.push_back(plain);
    }
  }

  if (blob.data.size() != length) {
    BOOST_LOG_TRIVIAL(error) << "Data encryption: Length field says " << length << " bytes, "
                             << blob.data.size() << " follow";
    throw MalformedRecordError("declared length " + std::to_string(length) + " does not match " +
                               std::to_string(blob.data.size()) + " data bytes");
  }

  BOOST_LOG_TRIVIAL(trace) << "Data encryption: Decrypted " << blob.data.size() << " bytes";
  return blob;
}


//==============================================
// ENCRYPTION
//==============================================

std::vector<uint8_t> DataEncryption::encrypt(const EncryptedBlob& blob) {
  const std::size_t ignored = ignored_length(blob.seed);
  if (blob.ignored.size() != ignored) {
    throw MalformedRecordError("seed requires " + std::to_string(ignored) + " ignored bytes, got " +
                               std::to_string(blob.ignored.size()));
  }

  const uint8_t version_enc = blob.seed ^ VERSION;
  const uint8_t project_key_enc = blob.seed ^ blob.project_key;

  std::vector<uint8_t> plain(blob.ignored);
  const auto length = static_cast<uint32_t>(blob.data.size());
  for (int i = 0; i < 4; ++i) {
    plain.push_back(static_cast<uint8_t>(length >> (8 * i)));
  }
  plain.insert(plain.end(), blob.data.begin(), blob.data.end());

  std::vector<uint8_t> encrypted{blob.seed, version_enc, project_key_enc};
  encrypted.reserve(3 + plain.size());

  CipherState state{blob.project_key, project_key_enc, version_enc};
  for (uint8_t byte : plain) {
    const uint8_t cipher = byte ^ state.mask();
    encrypted.push_back(cipher);
    state.advance(byte, cipher);
  }

  return encrypted;
}

} // namespace vbaunlock::project
