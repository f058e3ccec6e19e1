#include <gtest/gtest.h>
#include "container/directory.hpp"
#include "test_container.hpp"
#include "test_utils.hpp"

using namespace vbaunlock::container;
using vbaunlock::test_support::BuiltContainer;
using vbaunlock::test_support::ContainerBuilder;

class DirectoryTest : public ::testing::Test {
protected:
  std::string project;
  std::vector<uint8_t> module_data;
  BuiltContainer built;

  void SetUp() override {
    init_logging();

    project = "ID=\"{00000000-0000-0000-0000-000000000000}\"\r\nName=\"VBAProject\"\r\n";
    module_data.resize(6000);
    for (std::size_t i = 0; i < module_data.size(); ++i) {
      module_data[i] = static_cast<uint8_t>(i % 251);
    }

    // Entry ids: 0 root, 1 _VBA_PROJECT_CUR, 2 PROJECT, 3 VBA, 4 dir, 5 Module1, 6 Other
    built = ContainerBuilder()
      .add_stream({"_VBA_PROJECT_CUR", "PROJECT"}, project)
      .add_stream({"_VBA_PROJECT_CUR", "VBA", "dir"}, std::string("dir stream"))
      .add_stream({"_VBA_PROJECT_CUR", "VBA", "Module1"}, module_data)
      .add_stream({"Other"}, std::string("other"))
      .build();
  }

  // Store and directory over a fresh copy of the image
  struct Opened {
    std::unique_ptr<SectorStore> store;
    std::unique_ptr<Directory> directory;
  };

  Opened open(const std::vector<uint8_t>& image) {
    Opened opened;
    opened.store = std::make_unique<SectorStore>(image);
    opened.directory = std::make_unique<Directory>(*opened.store);
    return opened;
  }
};

TEST_F(DirectoryTest, ParsesEntries) {
  auto opened = open(built.image);
  const auto& entries = opened.directory->entries();

  ASSERT_GE(entries.size(), 7u);
  EXPECT_EQ(opened.directory->root().name, "Root Entry");
  EXPECT_EQ(opened.directory->root().type, EntryType::Root);
  EXPECT_EQ(entries[1].name, "_VBA_PROJECT_CUR");
  EXPECT_EQ(entries[1].type, EntryType::Storage);
  EXPECT_EQ(entries[2].name, "PROJECT");
  EXPECT_EQ(entries[2].size, project.size());
}

TEST_F(DirectoryTest, ReadsMiniStream) {
  auto opened = open(built.image);
  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "PROJECT"});

  EXPECT_TRUE(handle.in_mini_stream());
  const auto data = handle.read();
  EXPECT_EQ(std::string(data.begin(), data.end()), project);
}

TEST_F(DirectoryTest, ReadsRegularStream) {
  auto opened = open(built.image);
  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "VBA", "Module1"});

  EXPECT_FALSE(handle.in_mini_stream());
  EXPECT_EQ(handle.read(), module_data);
}

TEST_F(DirectoryTest, LookupIgnoresCase) {
  auto opened = open(built.image);

  auto handle = opened.directory->find_stream({"_vba_project_cur", "project"});
  EXPECT_EQ(handle.entry().name, "PROJECT");
  EXPECT_TRUE(names_equal("Module1", "MODULE1"));
  EXPECT_FALSE(names_equal("Module1", "Module2"));
}

TEST_F(DirectoryTest, MissingOrMistypedPathIsNotFound) {
  auto opened = open(built.image);

  EXPECT_THROW(opened.directory->find_stream({"PROJECT"}), StreamNotFoundError);
  EXPECT_THROW(opened.directory->find_stream({"_VBA_PROJECT_CUR", "NOPE"}), StreamNotFoundError);
  // Storage where a stream is expected and the reverse
  EXPECT_THROW(opened.directory->find_stream({"_VBA_PROJECT_CUR", "VBA"}), StreamNotFoundError);
  EXPECT_THROW(opened.directory->find_stream({"Other", "PROJECT"}), StreamNotFoundError);
  EXPECT_THROW(opened.directory->find_stream({}), StreamNotFoundError);
}

TEST_F(DirectoryTest, MissingRootEntry) {
  built.image[built.entry_offset(0) + 66] = 1;
  SectorStore store(built.image);

  EXPECT_THROW(Directory{store}, MissingRootError);
}

TEST_F(DirectoryTest, SiblingCycleTerminates) {
  // Other (6) links back to the storage (1), which links on to Other again
  built.put32(built.entry_offset(6) + 72, 1);
  auto opened = open(built.image);

  EXPECT_THROW(opened.directory->find_stream({"Missing"}), StreamNotFoundError);
  EXPECT_NO_THROW(opened.directory->find_stream({"Other"}));
}

TEST_F(DirectoryTest, SiblingIdOutOfRange) {
  built.put32(built.entry_offset(6) + 72, 4000);
  auto opened = open(built.image);

  EXPECT_THROW(opened.directory->find_stream({"Missing"}), CorruptContainerError);
}

TEST_F(DirectoryTest, IgnoresHighSizeBitsForVersion3) {
  built.put32(built.entry_offset(2) + 124, 0x00000001);
  auto opened = open(built.image);

  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "PROJECT"});
  EXPECT_EQ(handle.size(), project.size());
}

TEST_F(DirectoryTest, MiniStreamWriteStaysInPlace) {
  auto opened = open(built.image);
  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "PROJECT"});

  std::string changed = project;
  changed[5] = 'F';
  changed[changed.size() - 3] = 'x';
  handle.write(std::vector<uint8_t>(changed.begin(), changed.end()));

  for (uint32_t sector : opened.store->dirty_sectors()) {
    EXPECT_GE(sector, built.mini_stream_start);
    EXPECT_LT(sector, built.mini_stream_start + built.mini_stream_sectors);
  }

  auto reopened = open(opened.store->serialize());
  const auto data = reopened.directory->find_stream({"_VBA_PROJECT_CUR", "PROJECT"}).read();
  EXPECT_EQ(std::string(data.begin(), data.end()), changed);

  const auto other = reopened.directory->find_stream({"Other"}).read();
  EXPECT_EQ(std::string(other.begin(), other.end()), "other");
}

TEST_F(DirectoryTest, RegularStreamWriteStaysInPlace) {
  auto opened = open(built.image);
  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "VBA", "Module1"});

  auto changed = module_data;
  changed[4000] ^= 0x5A;
  handle.write(changed);

  const uint32_t start = built.stream_starts.at("_VBA_PROJECT_CUR/VBA/Module1");
  EXPECT_EQ(opened.store->dirty_sectors(), std::set<uint32_t>{start + 7});

  auto reopened = open(opened.store->serialize());
  EXPECT_EQ(reopened.directory->find_stream({"_VBA_PROJECT_CUR", "VBA", "Module1"}).read(), changed);
}

TEST_F(DirectoryTest, WriteNeverGrowsStream) {
  auto opened = open(built.image);
  auto handle = opened.directory->find_stream({"Other"});

  EXPECT_THROW(handle.write(std::vector<uint8_t>(6, 'x')), ChainTooShortError);
  EXPECT_TRUE(opened.store->dirty_sectors().empty());
}

TEST_F(DirectoryTest, TruncatedChainIsBroken) {
  const uint32_t start = built.stream_starts.at("_VBA_PROJECT_CUR/VBA/Module1");
  built.set_fat_entry(start + 5, END_OF_CHAIN);
  auto opened = open(built.image);

  auto handle = opened.directory->find_stream({"_VBA_PROJECT_CUR", "VBA", "Module1"});
  EXPECT_THROW(handle.read(), BrokenChainError);
}
