#include <gtest/gtest.h>
#include "workbook/workbook.hpp"
#include "workbook/zip_archive.hpp"
#include "test_container.hpp"
#include "test_utils.hpp"
#include "test_zip.hpp"

using namespace vbaunlock::workbook;

class WorkbookTest : public ::testing::Test {
protected:
  std::vector<uint8_t> compound;
  std::vector<uint8_t> zip = {0x50, 0x4B, 0x03, 0x04, 0x14, 0x00, 0x06, 0x00};

  void SetUp() override {
    init_logging();
    compound = vbaunlock::test_support::ContainerBuilder()
      .add_stream({"Workbook"}, std::string("cells"))
      .build()
      .image;
  }
};

TEST_F(WorkbookTest, DetectsCompoundFiles) {
  EXPECT_EQ(detect_kind("book.xls", compound), WorkbookKind::Xls);
  EXPECT_EQ(detect_kind("dir/BOOK.XLS", compound), WorkbookKind::Xls);
  EXPECT_EQ(detect_kind("vbaProject.bin", compound), WorkbookKind::VbaProjectBin);
}

TEST_F(WorkbookTest, StreamPathDependsOnKind) {
  EXPECT_EQ(project_stream_path(WorkbookKind::Xls), std::vector<std::string>({"_VBA_PROJECT_CUR", "PROJECT"}));
  EXPECT_EQ(project_stream_path(WorkbookKind::VbaProjectBin), std::vector<std::string>({"PROJECT"}));
  EXPECT_EQ(project_stream_path(WorkbookKind::ZipPackage), std::vector<std::string>({"PROJECT"}));
}

TEST_F(WorkbookTest, MacroFreeWorkbookHasNoProject) {
  EXPECT_THROW(detect_kind("book.xlsx", zip), NoVbaProjectError);
}

TEST_F(WorkbookTest, DetectsZipPackages) {
  EXPECT_EQ(detect_kind("book.xlsm", zip), WorkbookKind::ZipPackage);
  EXPECT_EQ(detect_kind("Book.XLSB", zip), WorkbookKind::ZipPackage);
}

TEST_F(WorkbookTest, CompoundFilesAreTheirOwnContainer) {
  EXPECT_EQ(project_container(WorkbookKind::Xls, compound), compound);
  EXPECT_EQ(with_project_container(WorkbookKind::VbaProjectBin, compound, zip), zip);
}

TEST_F(WorkbookTest, ExtractsProjectFromPackage) {
  const auto package = vbaunlock::test_support::ZipBuilder()
    .add("xl/workbook.xml", std::string("<workbook/>"))
    .add(ZIP_VBA_ENTRY, compound)
    .build();

  EXPECT_EQ(project_container(WorkbookKind::ZipPackage, package), compound);

  auto changed = compound;
  changed[600] ^= 0x01;
  const ZipArchive rewritten(with_project_container(WorkbookKind::ZipPackage, package, changed));
  EXPECT_EQ(rewritten.read(ZIP_VBA_ENTRY), changed);
  const auto sheet = rewritten.read("xl/workbook.xml");
  EXPECT_EQ(std::string(sheet.begin(), sheet.end()), "<workbook/>");
}

TEST_F(WorkbookTest, PackageWithoutProjectEntry) {
  const auto package = vbaunlock::test_support::ZipBuilder()
    .add("xl/workbook.xml", std::string("<workbook/>"))
    .build();

  EXPECT_THROW(project_container(WorkbookKind::ZipPackage, package), NoVbaProjectError);
  EXPECT_THROW(project_container(WorkbookKind::ZipPackage, zip), ZipArchiveError);
}

TEST_F(WorkbookTest, RejectsMismatchedContent) {
  EXPECT_THROW(detect_kind("book.xls", zip), NotAWorkbookError);
  EXPECT_THROW(detect_kind("book.xlsm", compound), NotAWorkbookError);
  EXPECT_THROW(detect_kind("book.xls", {}), NotAWorkbookError);
}

TEST_F(WorkbookTest, RejectsOtherExtensions) {
  EXPECT_THROW(detect_kind("notes.txt", compound), NotAWorkbookError);
  EXPECT_THROW(detect_kind("noextension", compound), NotAWorkbookError);
  EXPECT_THROW(detect_kind("book.csv", zip), WorkbookError);
}
