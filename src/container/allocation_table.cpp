#include "container/allocation_table.hpp"
#include "container/container_error.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace vbaunlock {
namespace container {

SectorChain follow_chain(const std::vector<uint32_t>& table, uint32_t start,
                         std::size_t sector_count) {
  SectorChain chain;
  if (start == END_OF_CHAIN) {
    return chain;
  }

  std::vector<bool> visited(sector_count, false);
  uint32_t current = start;

  while (current != END_OF_CHAIN) {
    if (current > MAX_REG_SECT) {
      std::ostringstream msg;
      msg << "link 0x" << std::hex << current << " after " << std::dec << chain.size()
          << " sectors is not a chain entry";
      BOOST_LOG_TRIVIAL(error) << "Allocation table: " << msg.str();
      throw BrokenChainError(msg.str());
    }
    if (current >= sector_count || current >= table.size()) {
      std::ostringstream msg;
      msg << "sector " << current << " is outside the " << sector_count << " available sectors";
      BOOST_LOG_TRIVIAL(error) << "Allocation table: " << msg.str();
      throw BrokenChainError(msg.str());
    }
    if (visited[current]) {
      std::ostringstream msg;
      msg << "sector " << current << " revisited, chain starting at " << start << " cycles";
      BOOST_LOG_TRIVIAL(error) << "Allocation table: " << msg.str();
      throw BrokenChainError(msg.str());
    }

    visited[current] = true;
    chain.push_back(current);
    current = table[current];
  }

  BOOST_LOG_TRIVIAL(trace) << "Allocation table: Chain from " << start << " spans " << chain.size() << " sectors";
  return chain;
}

} // namespace container
} // namespace vbaunlock
