#ifndef VBAUNLOCK_BYTE_ORDER_HPP
#define VBAUNLOCK_BYTE_ORDER_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <boost/endian/conversion.hpp>

namespace vbaunlock::container {

// Compound file structures are little endian regardless of host order.
// Callers are responsible for bounds checking the offset.
class ByteOrder {
public:
    static uint16_t readU16(const std::vector<uint8_t>& buffer, std::size_t offset) {
        return boost::endian::load_little_u16(buffer.data() + offset);
    }

    static uint32_t readU32(const std::vector<uint8_t>& buffer, std::size_t offset) {
        return boost::endian::load_little_u32(buffer.data() + offset);
    }

    static uint64_t readU64(const std::vector<uint8_t>& buffer, std::size_t offset) {
        return boost::endian::load_little_u64(buffer.data() + offset);
    }

    static void writeU16(std::vector<uint8_t>& buffer, std::size_t offset, uint16_t value) {
        boost::endian::store_little_u16(buffer.data() + offset, value);
    }

    static void writeU32(std::vector<uint8_t>& buffer, std::size_t offset, uint32_t value) {
        boost::endian::store_little_u32(buffer.data() + offset, value);
    }

    // Interprets a whole buffer as an array of little endian 32 bit values
    static std::vector<uint32_t> toU32Array(const std::vector<uint8_t>& buffer) {
        std::vector<uint32_t> values(buffer.size() / sizeof(uint32_t));
        for (std::size_t i = 0; i < values.size(); ++i) {
            values[i] = readU32(buffer, i * sizeof(uint32_t));
        }
        return values;
    }
};

} // namespace vbaunlock::container

#endif // VBAUNLOCK_BYTE_ORDER_HPP
