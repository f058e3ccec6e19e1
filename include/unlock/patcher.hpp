#ifndef VBAUNLOCK_PATCHER_HPP
#define VBAUNLOCK_PATCHER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace vbaunlock::unlock {

class Patcher {
public:
  // Returns a copy of the container with VBE and user protection cleared in the
  // PROJECT stream at stream_path. Every byte outside that stream's chain is
  // unchanged, and an already unprotected container is returned as is.
  static std::vector<uint8_t> remove_protection(const std::vector<uint8_t>& container_bytes,
                                                const std::vector<std::string>& stream_path);
};

} // namespace vbaunlock::unlock

#endif // VBAUNLOCK_PATCHER_HPP
