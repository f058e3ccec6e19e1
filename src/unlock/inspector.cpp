#include "unlock/inspector.hpp"
#include "container/directory.hpp"
#include "container/sector_store.hpp"
#include "crypto/cracker.hpp"
#include "project/hex.hpp"
#include <boost/log/trivial.hpp>

namespace vbaunlock::unlock {

ProjectReport Inspector::report_for(const project::ProtectionRecord& record) {
  ProjectReport report;
  report.state = record.state();
  report.user_protected = record.user_protected();
  report.host_protected = record.host_protected();
  report.vbe_protected = record.vbe_protected();
  report.visible = record.visible();
  report.scheme = record.scheme_kind();
  report.salt_hex = project::to_hex(record.salt());
  report.digest_hex = project::to_hex(record.digest());
  report.password = record.plaintext_password();
  return report;
}

ProjectReport Inspector::inspect(const std::vector<uint8_t>& container_bytes,
                                 const std::vector<std::string>& stream_path,
                                 const std::vector<std::string>* candidates,
                                 std::size_t workers) {
  CandidateSource source;
  if (candidates) {
    source = [candidates]() { return *candidates; };
  }
  return inspect(container_bytes, stream_path, source, workers);
}

ProjectReport Inspector::inspect(const std::vector<uint8_t>& container_bytes,
                                 const std::vector<std::string>& stream_path,
                                 const CandidateSource& candidates,
                                 std::size_t workers) {
  container::SectorStore store(container_bytes);
  container::Directory directory(store);
  auto stream = directory.find_stream(stream_path);

  const auto record = project::ProtectionRecordCodec::decode(stream.read());
  ProjectReport report = report_for(record);

  if (report.scheme == project::SchemeKind::Modern && candidates) {
    const auto list = candidates();
    crypto::Cracker cracker(workers);
    report.password = cracker.crack(record, list);
    report.crack_attempted = true;
  }

  BOOST_LOG_TRIVIAL(info) << "Inspector: Report ready, password "
                          << (report.password ? "known" : "unknown");
  return report;
}

} // namespace vbaunlock::unlock
