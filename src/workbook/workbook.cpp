#include "workbook/workbook.hpp"
#include "container/sector_store.hpp"
#include "workbook/zip_archive.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <boost/log/trivial.hpp>

namespace vbaunlock::workbook {

namespace {

constexpr std::array<uint8_t, 4> ZIP_SIGNATURE = {0x50, 0x4B, 0x03, 0x04};

template <std::size_t N>
bool starts_with(const std::vector<uint8_t>& bytes, const std::array<uint8_t, N>& magic) {
  return bytes.size() >= N && std::equal(magic.begin(), magic.end(), bytes.begin());
}

std::string lowercase_extension(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

} // namespace

WorkbookKind detect_kind(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
  const std::string extension = lowercase_extension(path);
  const bool compound = starts_with(bytes, container::SectorStore::SIGNATURE);
  const bool zip = starts_with(bytes, ZIP_SIGNATURE);

  BOOST_LOG_TRIVIAL(debug) << "Workbook: Detecting kind of " << path.string() << " (extension '"
                           << extension << "')";

  if (extension == ".xlsx") {
    throw NoVbaProjectError(path.string() + " is the macro free format, there is nothing to operate on");
  }

  if (extension == ".xls" || extension == ".bin") {
    if (!compound) {
      BOOST_LOG_TRIVIAL(error) << "Workbook: " << path.string() << " lacks the compound file signature";
      throw NotAWorkbookError(path.string() + " does not start with a compound file signature");
    }
    return extension == ".xls" ? WorkbookKind::Xls : WorkbookKind::VbaProjectBin;
  }

  if (extension == ".xlsm" || extension == ".xlsb") {
    if (!zip) {
      BOOST_LOG_TRIVIAL(error) << "Workbook: " << path.string() << " lacks the zip signature";
      throw NotAWorkbookError(path.string() + " does not start with a zip signature");
    }
    return WorkbookKind::ZipPackage;
  }

  throw NotAWorkbookError(path.string());
}

std::vector<std::string> project_stream_path(WorkbookKind kind) {
  switch (kind) {
    case WorkbookKind::Xls:
      return {"_VBA_PROJECT_CUR", "PROJECT"};
    case WorkbookKind::VbaProjectBin:
    case WorkbookKind::ZipPackage:
      return {"PROJECT"};
  }
  return {"PROJECT"};
}

std::vector<uint8_t> project_container(WorkbookKind kind, const std::vector<uint8_t>& file_bytes) {
  if (kind != WorkbookKind::ZipPackage) {
    return file_bytes;
  }

  ZipArchive archive(file_bytes);
  if (!archive.contains(ZIP_VBA_ENTRY)) {
    BOOST_LOG_TRIVIAL(error) << "Workbook: Package has no " << ZIP_VBA_ENTRY;
    throw NoVbaProjectError(ZIP_VBA_ENTRY + " is missing from the package");
  }
  return archive.read(ZIP_VBA_ENTRY);
}

std::vector<uint8_t> with_project_container(WorkbookKind kind, const std::vector<uint8_t>& file_bytes,
                                            const std::vector<uint8_t>& container) {
  if (kind != WorkbookKind::ZipPackage) {
    return container;
  }
  return ZipArchive(file_bytes).replace(ZIP_VBA_ENTRY, container);
}

} // namespace vbaunlock::workbook
