#ifndef VBAUNLOCK_CRACKER_HPP
#define VBAUNLOCK_CRACKER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "project/protection_record.hpp"

namespace vbaunlock::crypto {

// Dictionary lookup of the password behind a protection record
class Cracker {
public:
  // worker_count of 0 is treated as 1
  explicit Cracker(std::size_t worker_count = 1);

  // First candidate in list order that matches, std::nullopt when none does.
  // The parallel search returns the same candidate as the sequential one.
  std::optional<std::string> crack(const project::ProtectionRecord& record,
                                   const std::vector<std::string>& candidates) const;

  std::size_t worker_count() const { return worker_count_; }

private:
  std::size_t worker_count_;

  std::optional<std::string> crack_sequential(const project::ProtectionRecord& record,
                                              const std::vector<std::string>& candidates) const;
  std::optional<std::string> crack_parallel(const project::ProtectionRecord& record,
                                            const std::vector<std::string>& candidates) const;
};

} // namespace vbaunlock::crypto

#endif // VBAUNLOCK_CRACKER_HPP
