#include <gtest/gtest.h>
#include "container/byte_order.hpp"
#include "workbook/zip_archive.hpp"
#include "test_utils.hpp"
#include "test_zip.hpp"
#include <algorithm>

using namespace vbaunlock::workbook;
using vbaunlock::container::ByteOrder;
using vbaunlock::test_support::ZipBuilder;

class ZipArchiveTest : public ::testing::Test {
protected:
  std::vector<uint8_t> project;

  void SetUp() override {
    init_logging();
    for (int i = 0; i < 3000; ++i) {
      project.push_back(static_cast<uint8_t>((i * 7) % 251));
    }
  }

  std::vector<uint8_t> package() const {
    return ZipBuilder()
      .add("[Content_Types].xml", std::string("<Types/>"), false)
      .add(ZIP_VBA_ENTRY, project, true, true)
      .add("xl/workbook.xml", std::string("<workbook><sheets/></workbook>"))
      .build();
  }
};

TEST_F(ZipArchiveTest, ListsEntriesInDirectoryOrder) {
  const ZipArchive archive(package());

  ASSERT_EQ(archive.entries().size(), 3u);
  EXPECT_EQ(archive.entries()[0].name, "[Content_Types].xml");
  EXPECT_EQ(archive.entries()[1].name, ZIP_VBA_ENTRY);
  EXPECT_EQ(archive.entries()[2].name, "xl/workbook.xml");
  EXPECT_TRUE(archive.contains(ZIP_VBA_ENTRY));
  EXPECT_FALSE(archive.contains("xl/VBAPROJECT.bin"));
}

TEST_F(ZipArchiveTest, ReadsStoredAndDeflatedEntries) {
  const ZipArchive archive(package());

  const auto types = archive.read("[Content_Types].xml");
  EXPECT_EQ(std::string(types.begin(), types.end()), "<Types/>");
  EXPECT_EQ(archive.read(ZIP_VBA_ENTRY), project);
  EXPECT_EQ(archive.entries()[1].method, ZipArchive::DEFLATED);
  EXPECT_TRUE(archive.entries()[1].flags & ZipArchive::FLAG_DATA_DESCRIPTOR);
}

TEST_F(ZipArchiveTest, FindsEndRecordBehindComment) {
  const auto bytes = ZipBuilder()
    .add("a.txt", std::string("alpha"))
    .comment("written by a spreadsheet")
    .build();

  const ZipArchive archive(bytes);
  const auto a = archive.read("a.txt");
  EXPECT_EQ(std::string(a.begin(), a.end()), "alpha");
}

TEST_F(ZipArchiveTest, EmptyEntryIsReadable) {
  const ZipArchive archive(ZipBuilder().add("empty", std::vector<uint8_t>()).build());

  EXPECT_TRUE(archive.read("empty").empty());
}

TEST_F(ZipArchiveTest, RejectsDamagedArchives) {
  EXPECT_THROW(ZipArchive{std::vector<uint8_t>({0x50, 0x4B, 0x03, 0x04})}, ZipArchiveError);

  auto truncated = package();
  truncated.resize(truncated.size() - 10);
  EXPECT_THROW(ZipArchive{truncated}, ZipArchiveError);

  auto zip64 = package();
  ByteOrder::writeU16(zip64, zip64.size() - 22 + 10, 0xFFFF);
  EXPECT_THROW(ZipArchive{zip64}, ZipArchiveError);

  auto outside = package();
  ByteOrder::writeU32(outside, outside.size() - 22 + 16, static_cast<uint32_t>(outside.size()));
  EXPECT_THROW(ZipArchive{outside}, ZipArchiveError);
}

TEST_F(ZipArchiveTest, DetectsCorruptData) {
  auto bytes = ZipBuilder().add("stored.txt", std::string("plain text"), false).build();
  // First data byte follows the 30 byte header and the name
  bytes[30 + std::string("stored.txt").size()] ^= 0xFF;

  const ZipArchive archive(bytes);
  EXPECT_THROW(archive.read("stored.txt"), ZipArchiveError);
}

TEST_F(ZipArchiveTest, RefusesEncryptedAndMissingEntries) {
  const ZipArchive archive(ZipBuilder()
    .add("secret.bin", std::string("xyz"), false)
    .flag_last(ZipArchive::FLAG_ENCRYPTED)
    .build());

  EXPECT_THROW(archive.read("secret.bin"), ZipArchiveError);
  EXPECT_THROW(archive.read("absent.bin"), ZipArchiveError);
  EXPECT_THROW(archive.replace("absent.bin", {0x01}), ZipArchiveError);
}

TEST_F(ZipArchiveTest, ReplaceSwapsOnlyTheTarget) {
  const auto original = package();
  const ZipArchive archive(original);

  std::vector<uint8_t> changed = project;
  changed[100] ^= 0x55;
  changed.push_back(0x42);

  const ZipArchive rewritten(archive.replace(ZIP_VBA_ENTRY, changed));

  ASSERT_EQ(rewritten.entries().size(), 3u);
  EXPECT_EQ(rewritten.read(ZIP_VBA_ENTRY), changed);
  EXPECT_EQ(rewritten.read("[Content_Types].xml"), archive.read("[Content_Types].xml"));
  EXPECT_EQ(rewritten.read("xl/workbook.xml"), archive.read("xl/workbook.xml"));
  EXPECT_EQ(rewritten.entries()[1].method, ZipArchive::DEFLATED);
  EXPECT_FALSE(rewritten.entries()[1].flags & ZipArchive::FLAG_DATA_DESCRIPTOR);

  // Entries before the target keep their bytes and position
  const auto& first = rewritten.entries()[0];
  EXPECT_EQ(first.local_header_offset, archive.entries()[0].local_header_offset);
  EXPECT_TRUE(std::equal(original.begin(), original.begin() + archive.entries()[1].local_header_offset,
                         rewritten.bytes().begin()));
}

TEST_F(ZipArchiveTest, ReplaceWithSameDataKeepsArchive) {
  const auto original = ZipBuilder()
    .add(ZIP_VBA_ENTRY, project)
    .comment("keep me")
    .build();
  const ZipArchive archive(original);

  EXPECT_EQ(archive.replace(ZIP_VBA_ENTRY, project), original);
}

TEST_F(ZipArchiveTest, ReplaceKeepsStoredMethodAndComment) {
  const ZipArchive archive(ZipBuilder()
    .add("a.txt", std::string("alpha"), false)
    .add("b.txt", std::string("beta"), false)
    .comment("note")
    .build());

  const auto bytes = archive.replace("a.txt", std::vector<uint8_t>{'o', 'm', 'e', 'g', 'a', '!'});
  const ZipArchive rewritten(bytes);

  const auto a = rewritten.read("a.txt");
  const auto b = rewritten.read("b.txt");
  EXPECT_EQ(std::string(a.begin(), a.end()), "omega!");
  EXPECT_EQ(std::string(b.begin(), b.end()), "beta");
  EXPECT_EQ(rewritten.entries()[0].method, ZipArchive::STORED);
  EXPECT_EQ(std::string(bytes.end() - 4, bytes.end()), "note");
}
