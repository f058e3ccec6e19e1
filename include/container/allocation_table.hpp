#ifndef VBAUNLOCK_ALLOCATION_TABLE_HPP
#define VBAUNLOCK_ALLOCATION_TABLE_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

namespace vbaunlock::container {

// Reserved allocation table values
constexpr uint32_t MAX_REG_SECT = 0xFFFFFFFA;
constexpr uint32_t DIFAT_SECT = 0xFFFFFFFC;
constexpr uint32_t FAT_SECT = 0xFFFFFFFD;
constexpr uint32_t END_OF_CHAIN = 0xFFFFFFFE;
constexpr uint32_t FREE_SECT = 0xFFFFFFFF;

// Directory sibling/child ids use the same sentinel as a free sector
constexpr uint32_t NO_STREAM = 0xFFFFFFFF;

using SectorChain = std::vector<uint32_t>;

// Walks table from start until END_OF_CHAIN and returns the visited indices in order.
// Throws BrokenChainError when an index is >= sector_count or >= table.size(),
// when a sector is visited twice, or when a link is a reserved marker other than
// END_OF_CHAIN. A start of END_OF_CHAIN yields an empty chain.
SectorChain follow_chain(const std::vector<uint32_t>& table, uint32_t start,
                         std::size_t sector_count);

} // namespace vbaunlock::container

#endif // VBAUNLOCK_ALLOCATION_TABLE_HPP
