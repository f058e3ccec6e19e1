#include "unlock/patcher.hpp"
#include "container/directory.hpp"
#include "container/sector_store.hpp"
#include "project/project_error.hpp"
#include "project/protection_record.hpp"
#include <boost/log/trivial.hpp>

namespace vbaunlock::unlock {

std::vector<uint8_t> Patcher::remove_protection(const std::vector<uint8_t>& container_bytes,
                                                const std::vector<std::string>& stream_path) {
  container::SectorStore store(container_bytes);
  container::Directory directory(store);
  auto stream = directory.find_stream(stream_path);

  const auto original = stream.read();
  auto record = project::ProtectionRecordCodec::decode(original);

  if (record.state() == project::ProtectionState::Unprotected) {
    BOOST_LOG_TRIVIAL(info) << "Patcher: Project is not protected, nothing to do";
    return container_bytes;
  }

  record.set_unprotected();
  const auto encoded = project::ProtectionRecordCodec::encode(record);
  if (encoded.size() != original.size()) {
    BOOST_LOG_TRIVIAL(error) << "Patcher: Encoded stream is " << encoded.size()
                             << " bytes, original was " << original.size();
    throw project::MalformedRecordError("re-encoded PROJECT stream changed length");
  }

  stream.write(encoded);

  BOOST_LOG_TRIVIAL(info) << "Patcher: Protection removed, " << store.dirty_sectors().size()
                          << " sector(s) rewritten";
  return store.serialize();
}

} // namespace vbaunlock::unlock
