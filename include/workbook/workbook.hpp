#ifndef VBAUNLOCK_WORKBOOK_HPP
#define VBAUNLOCK_WORKBOOK_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace vbaunlock::workbook {

// ---- ERRORS ----
class WorkbookError : public std::runtime_error {
public:
  explicit WorkbookError(const std::string& message) : std::runtime_error(message) {}
};

class NotAWorkbookError : public WorkbookError {
public:
  explicit NotAWorkbookError(const std::string& message)
    : WorkbookError("Not an Excel file: " + message) {}
};

// .xlsx never carries a VBA project
class NoVbaProjectError : public WorkbookError {
public:
  explicit NoVbaProjectError(const std::string& message)
    : WorkbookError("No VBA project: " + message) {}
};


// ---- FORMAT DETECTION ----
enum class WorkbookKind {
  Xls,            // compound file with the project under _VBA_PROJECT_CUR
  VbaProjectBin,  // vbaProject.bin taken out of an .xlsm or .xlsb
  ZipPackage      // .xlsm or .xlsb, vbaProject.bin is a zip entry
};

// Entry holding the VBA project inside .xlsm and .xlsb archives
inline const std::string ZIP_VBA_ENTRY = "xl/vbaProject.bin";

// Decides from the extension, then checks the magic bytes agree
WorkbookKind detect_kind(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

// Storage names leading to the PROJECT stream
std::vector<std::string> project_stream_path(WorkbookKind kind);


// ---- PROJECT CONTAINER ----
// Compound file holding the project: the file itself, or the ZIP_VBA_ENTRY
// of a package. A package without that entry throws NoVbaProjectError.
std::vector<uint8_t> project_container(WorkbookKind kind, const std::vector<uint8_t>& file_bytes);

// File bytes with container put back where project_container found it
std::vector<uint8_t> with_project_container(WorkbookKind kind, const std::vector<uint8_t>& file_bytes,
                                            const std::vector<uint8_t>& container);

} // namespace vbaunlock::workbook

#endif // VBAUNLOCK_WORKBOOK_HPP
