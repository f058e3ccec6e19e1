#ifndef VBAUNLOCK_HEX_HPP
#define VBAUNLOCK_HEX_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace vbaunlock::project {

// Uppercase, two digits per byte
std::string to_hex(const std::vector<uint8_t>& bytes);

// Accepts either letter case. Odd length or a non-hex digit is MalformedRecordError.
std::vector<uint8_t> from_hex(const std::string& text);

} // namespace vbaunlock::project

#endif // VBAUNLOCK_HEX_HPP
