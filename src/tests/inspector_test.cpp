#include <gtest/gtest.h>
#include "container/container_error.hpp"
#include "crypto/hash_engine.hpp"
#include "project/project_error.hpp"
#include "unlock/inspector.hpp"
#include "test_container.hpp"
#include "test_utils.hpp"

using namespace vbaunlock;
using namespace vbaunlock::test_support;

class InspectorTest : public ::testing::Test {
protected:
  const std::vector<std::string> path = {"_VBA_PROJECT_CUR", "PROJECT"};
  std::vector<uint8_t> password_data;

  void SetUp() override {
    init_logging();

    project::ModernPassword modern;
    modern.salt = {0xDE, 0xAD, 0xBE, 0xEF};
    crypto::HashEngine engine;
    const auto digest = engine.digest_for(project::SchemeKind::Modern, {0xDE, 0xAD, 0xBE, 0xEF}, "mypass");
    std::copy(digest.begin(), digest.end(), modern.digest.begin());
    password_data = project::ProtectionRecordCodec::encode_password(modern);
  }

  std::vector<uint8_t> workbook(uint32_t bits, const std::vector<uint8_t>& password, bool visible) const {
    return ContainerBuilder()
      .add_stream({"_VBA_PROJECT_CUR", "PROJECT"}, project_text(bits, password, visible))
      .build()
      .image;
  }
};

TEST_F(InspectorTest, ReportsModernProtection) {
  const auto report = unlock::Inspector::inspect(workbook(0x7, password_data, true), path);

  EXPECT_EQ(report.state, project::ProtectionState::Protected);
  EXPECT_TRUE(report.user_protected);
  EXPECT_TRUE(report.host_protected);
  EXPECT_TRUE(report.vbe_protected);
  EXPECT_TRUE(report.visible);
  EXPECT_EQ(report.scheme, project::SchemeKind::Modern);
  EXPECT_EQ(report.salt_hex, "DEADBEEF");
  EXPECT_EQ(report.digest_hex.size(), 40u);
  EXPECT_FALSE(report.password.has_value());
  EXPECT_FALSE(report.crack_attempted);
}

TEST_F(InspectorTest, CracksWithCandidates) {
  const std::vector<std::string> candidates = {"123456", "password", "mypass", "qwerty"};

  const auto report = unlock::Inspector::inspect(workbook(0x7, password_data, true), path, &candidates, 2);

  EXPECT_TRUE(report.crack_attempted);
  EXPECT_EQ(report.password, std::optional<std::string>("mypass"));
}

TEST_F(InspectorTest, CrackMissReported) {
  const std::vector<std::string> candidates = {"123456", "password"};

  const auto report = unlock::Inspector::inspect(workbook(0x7, password_data, true), path, &candidates);

  EXPECT_TRUE(report.crack_attempted);
  EXPECT_FALSE(report.password.has_value());
}

TEST_F(InspectorTest, LegacyPasswordNeedsNoCandidates) {
  const std::vector<std::string> candidates = {"unused"};

  const auto report = unlock::Inspector::inspect(workbook(0x4, legacy_password("plain"), false), path,
                                                 &candidates);

  EXPECT_EQ(report.scheme, project::SchemeKind::Legacy);
  EXPECT_FALSE(report.crack_attempted);
  EXPECT_EQ(report.password, std::optional<std::string>("plain"));
  EXPECT_TRUE(report.salt_hex.empty());
  EXPECT_FALSE(report.visible);
  EXPECT_FALSE(report.user_protected);
}

TEST_F(InspectorTest, CandidateSourceOnlyCalledForHashes) {
  int calls = 0;
  const unlock::CandidateSource source = [&calls]() {
    ++calls;
    return std::vector<std::string>{"password", "mypass"};
  };

  const auto legacy = unlock::Inspector::inspect(workbook(0x4, legacy_password("plain"), false), path, source);
  EXPECT_EQ(calls, 0);
  EXPECT_FALSE(legacy.crack_attempted);

  const auto modern = unlock::Inspector::inspect(workbook(0x7, password_data, true), path, source, 2);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(modern.crack_attempted);
  EXPECT_EQ(modern.password, std::optional<std::string>("mypass"));
}

TEST_F(InspectorTest, EmptyCandidateSourceSkipsCracking) {
  const auto report = unlock::Inspector::inspect(workbook(0x7, password_data, true), path,
                                                 unlock::CandidateSource());

  EXPECT_FALSE(report.crack_attempted);
  EXPECT_FALSE(report.password.has_value());
}

TEST_F(InspectorTest, ReportsUnprotectedProject) {
  const auto report = unlock::Inspector::inspect(workbook(0x0, {0x00}, true), path);

  EXPECT_EQ(report.state, project::ProtectionState::Unprotected);
  EXPECT_EQ(report.password, std::optional<std::string>(""));
}

TEST_F(InspectorTest, PropagatesFailures) {
  const auto no_project = ContainerBuilder().add_stream({"Workbook"}, std::string("cells")).build().image;
  EXPECT_THROW(unlock::Inspector::inspect(no_project, path), container::StreamNotFoundError);

  EXPECT_THROW(unlock::Inspector::inspect(workbook(0x7, {0x41}, true), path), project::UnrecognizedSchemeError);

  std::vector<uint8_t> garbage(1024, 0x00);
  EXPECT_THROW(unlock::Inspector::inspect(garbage, path), container::ContainerError);
}
