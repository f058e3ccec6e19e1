#ifndef VBAUNLOCK_INSPECTOR_HPP
#define VBAUNLOCK_INSPECTOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "project/protection_record.hpp"

namespace vbaunlock::unlock {

// What the read command prints
struct ProjectReport {
  project::ProtectionState state = project::ProtectionState::Unprotected;
  bool user_protected = false;
  bool host_protected = false;
  bool vbe_protected = false;
  bool visible = false;
  project::SchemeKind scheme = project::SchemeKind::Legacy;
  std::string salt_hex;
  std::string digest_hex;
  // Recovered from a Legacy check value, or cracked from a Modern digest
  std::optional<std::string> password;
  bool crack_attempted = false;
};

// Produces the candidate passwords, only called once a Modern digest needs them
using CandidateSource = std::function<std::vector<std::string>()>;

class Inspector {
public:
  // Reads the protection record at stream_path. Modern digests are only looked
  // up when candidates is non-null.
  static ProjectReport inspect(const std::vector<uint8_t>& container_bytes,
                               const std::vector<std::string>& stream_path,
                               const std::vector<std::string>* candidates = nullptr,
                               std::size_t workers = 1);

  // Same, with candidates fetched lazily. An empty source means no lookup.
  static ProjectReport inspect(const std::vector<uint8_t>& container_bytes,
                               const std::vector<std::string>& stream_path,
                               const CandidateSource& candidates,
                               std::size_t workers = 1);

  static ProjectReport report_for(const project::ProtectionRecord& record);
};

} // namespace vbaunlock::unlock

#endif // VBAUNLOCK_INSPECTOR_HPP
