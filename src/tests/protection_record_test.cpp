#include <gtest/gtest.h>
#include "crypto/hash_engine.hpp"
#include "project/hex.hpp"
#include "project/project_error.hpp"
#include "project/protection_record.hpp"
#include "test_container.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <cctype>

using namespace vbaunlock::project;
using namespace vbaunlock::test_support;

namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

} // namespace

class ProtectionRecordTest : public ::testing::Test {
protected:
  ModernPassword modern;

  void SetUp() override {
    init_logging();

    modern.salt = {0x4B, 0x00, 0x9A, 0x21};
    vbaunlock::crypto::HashEngine engine;
    const auto digest = engine.digest_for(SchemeKind::Modern, {modern.salt.begin(), modern.salt.end()}, "letmein");
    std::copy(digest.begin(), digest.end(), modern.digest.begin());
  }

  std::string modern_text(uint32_t bits, bool visible = true) const {
    return project_text(bits, ProtectionRecordCodec::encode_password(modern), visible);
  }
};

TEST_F(ProtectionRecordTest, DecodesModernProtectedRecord) {
  const auto record = ProtectionRecordCodec::decode(bytes_of(modern_text(0x7)));

  EXPECT_EQ(record.state(), ProtectionState::Protected);
  EXPECT_TRUE(record.user_protected());
  EXPECT_TRUE(record.host_protected());
  EXPECT_TRUE(record.vbe_protected());
  EXPECT_TRUE(record.visible());
  EXPECT_EQ(record.scheme_kind(), SchemeKind::Modern);
  EXPECT_EQ(record.salt(), std::vector<uint8_t>(modern.salt.begin(), modern.salt.end()));
  EXPECT_EQ(record.digest(), std::vector<uint8_t>(modern.digest.begin(), modern.digest.end()));
  EXPECT_EQ(record.iteration_hint(), kModernHashRounds);
  EXPECT_FALSE(record.plaintext_password().has_value());
}

TEST_F(ProtectionRecordTest, DecodesLegacyPassword) {
  const auto record = ProtectionRecordCodec::decode(bytes_of(project_text(0x4, legacy_password("secret"), false)));

  EXPECT_EQ(record.state(), ProtectionState::Protected);
  EXPECT_FALSE(record.visible());
  EXPECT_EQ(record.scheme_kind(), SchemeKind::Legacy);
  EXPECT_TRUE(record.salt().empty());
  EXPECT_EQ(record.digest(), legacy_password("secret"));
  ASSERT_TRUE(record.plaintext_password().has_value());
  EXPECT_EQ(*record.plaintext_password(), "secret");
}

TEST_F(ProtectionRecordTest, PlaintextPasswordMayStartWithReservedByte) {
  // cp1252 "\xFFabc", not a hash because it is not 29 bytes long
  const std::vector<uint8_t> check_value = {0xFF, 'a', 'b', 'c', 0x00};
  const auto record = ProtectionRecordCodec::decode(bytes_of(project_text(0x7, check_value, true)));

  EXPECT_EQ(record.scheme_kind(), SchemeKind::Legacy);
  EXPECT_EQ(record.digest(), check_value);
  ASSERT_TRUE(record.plaintext_password().has_value());
  EXPECT_EQ(*record.plaintext_password(), std::string("\xFF" "abc"));

  auto unprotected = record;
  unprotected.set_unprotected();
  EXPECT_EQ(ProtectionRecordCodec::encode(unprotected).size(), record.layout()->text.size());
}

TEST_F(ProtectionRecordTest, HashSizedPlaintextIsLegacy) {
  // 28 characters and the terminator, without the reserved lead byte
  std::vector<uint8_t> check_value(29, 'p');
  check_value.back() = 0x00;

  const auto scheme = ProtectionRecordCodec::decode_password(check_value);
  EXPECT_TRUE(std::holds_alternative<LegacyPassword>(scheme));
}

TEST_F(ProtectionRecordTest, DecodesProjectWithoutPassword) {
  const auto record = ProtectionRecordCodec::decode(bytes_of(project_text(0x0, {0x00}, true)));

  EXPECT_EQ(record.state(), ProtectionState::Unprotected);
  EXPECT_EQ(record.scheme_kind(), SchemeKind::Legacy);
  EXPECT_EQ(record.plaintext_password(), std::optional<std::string>(""));
}

TEST_F(ProtectionRecordTest, NullCodingRoundTrips) {
  modern.salt = {0x00, 0x11, 0x00, 0x22};
  modern.digest.fill(0x33);
  modern.digest[0] = 0x00;
  modern.digest[5] = 0x00;
  modern.digest[19] = 0x00;

  const auto data = ProtectionRecordCodec::encode_password(modern);
  ASSERT_EQ(data.size(), 29u);
  EXPECT_EQ(data[0], 0xFF);
  // grbitKey: salt bytes 1 and 3 kept, grbitHashNull low nibble: digest byte 0 nulled
  EXPECT_EQ(data[1], 0xEA);
  EXPECT_EQ(data[4], 0x01);
  EXPECT_EQ(data[8], 0x01);
  EXPECT_EQ(data[28], 0x00);

  const auto decoded = std::get<ModernPassword>(ProtectionRecordCodec::decode_password(data));
  EXPECT_EQ(decoded.salt, modern.salt);
  EXPECT_EQ(decoded.digest, modern.digest);
}

TEST_F(ProtectionRecordTest, RejectsMiscodedNull) {
  modern.salt = {0x00, 0x11, 0x12, 0x13};
  auto data = ProtectionRecordCodec::encode_password(modern);
  data[4] = 0x02;

  EXPECT_THROW(ProtectionRecordCodec::decode_password(data), MalformedRecordError);
}

TEST_F(ProtectionRecordTest, RejectsUnknownPasswordLayout) {
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(project_text(0x4, {0x41, 0x42}, true))),
               UnrecognizedSchemeError);
}

TEST_F(ProtectionRecordTest, RejectsUnsupportedEncryptionVersion) {
  const std::string text = project_text(encrypted_hex(state_bytes(0x4)), "0123456789ABCDEF",
                                        encrypted_hex({0xFF}));

  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(text)), UnrecognizedSchemeError);
}

TEST_F(ProtectionRecordTest, RejectsMalformedFields) {
  // Hash sized value without its terminator
  auto unterminated = ProtectionRecordCodec::encode_password(modern);
  unterminated.back() = 0x44;
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(project_text(0x4, unterminated, true))), MalformedRecordError);

  // Reserved protection state bit
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(modern_text(0x8 | 0x4))), MalformedRecordError);

  // Visibility neither 0x00 nor 0xFF
  const std::string bad_visibility = project_text(encrypted_hex(state_bytes(0x4)),
                                                  encrypted_hex(legacy_password("pw")),
                                                  encrypted_hex({0x01}));
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(bad_visibility)), MalformedRecordError);

  // Not hex
  const std::string not_hex = project_text(encrypted_hex(state_bytes(0x4)), "ZZ", encrypted_hex({0xFF}));
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(not_hex)), MalformedRecordError);
}

TEST_F(ProtectionRecordTest, RejectsMissingOrDuplicateLines) {
  std::string text = modern_text(0x7);

  const auto gc = text.find("GC=");
  std::string missing = text;
  missing.erase(gc, text.find('\n', gc) - gc + 1);
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(missing)), MalformedRecordError);

  const auto cmg = text.find("CMG=");
  std::string duplicate = text;
  duplicate.insert(0, text.substr(cmg, text.find('\n', cmg) - cmg + 1));
  EXPECT_THROW(ProtectionRecordCodec::decode(bytes_of(duplicate)), MalformedRecordError);
}

TEST_F(ProtectionRecordTest, EncodeReproducesDecodedStream) {
  // Lowercase digits must survive re-encoding
  const std::string text = project_text(encrypted_hex(state_bytes(0x7)),
                                        lowercase(encrypted_hex(ProtectionRecordCodec::encode_password(modern), 0x2A)),
                                        encrypted_hex({0xFF}, 0x57));

  const auto record = ProtectionRecordCodec::decode(bytes_of(text));
  EXPECT_EQ(ProtectionRecordCodec::encode(record), bytes_of(text));
}

TEST_F(ProtectionRecordTest, UnprotectKeepsHostBitAndLength) {
  const std::string text = modern_text(0x7);
  auto record = ProtectionRecordCodec::decode(bytes_of(text));

  record.set_unprotected();
  EXPECT_EQ(record.state(), ProtectionState::Unprotected);
  EXPECT_EQ(record.protection_bits(), ProtectionRecord::HOST_PROTECTED);

  const auto encoded = ProtectionRecordCodec::encode(record);
  ASSERT_EQ(encoded.size(), text.size());

  const auto reread = ProtectionRecordCodec::decode(encoded);
  EXPECT_EQ(reread.state(), ProtectionState::Unprotected);
  EXPECT_FALSE(reread.user_protected());
  EXPECT_TRUE(reread.host_protected());
  EXPECT_EQ(reread.digest(), record.digest());

  // Only the CMG value differs
  const std::string out(encoded.begin(), encoded.end());
  const auto cmg = text.find("CMG=\"") + 5;
  const auto cmg_end = text.find('"', cmg);
  EXPECT_EQ(out.substr(0, cmg), text.substr(0, cmg));
  EXPECT_EQ(out.substr(cmg_end), text.substr(cmg_end));
  EXPECT_NE(out.substr(cmg, cmg_end - cmg), text.substr(cmg, cmg_end - cmg));
}

TEST_F(ProtectionRecordTest, RecordWithoutStreamCannotBeEncoded) {
  const ProtectionRecord record(ProtectionRecord::VBE_PROTECTED, true, modern);

  EXPECT_EQ(record.state(), ProtectionState::Protected);
  EXPECT_THROW(ProtectionRecordCodec::encode(record), MalformedRecordError);
}
