#include "crypto/cracker.hpp"
#include "crypto/hash_engine.hpp"
#include "crypto/worker_group.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace vbaunlock::crypto {

namespace {

constexpr std::size_t NO_MATCH = std::numeric_limits<std::size_t>::max();

} // namespace

Cracker::Cracker(std::size_t worker_count) : worker_count_(std::max<std::size_t>(worker_count, 1)) {}

std::optional<std::string> Cracker::crack(const project::ProtectionRecord& record,
                                          const std::vector<std::string>& candidates) const {
  BOOST_LOG_TRIVIAL(info) << "Cracker: Trying " << candidates.size() << " candidates with "
                          << worker_count_ << " worker(s)";

  auto result = (worker_count_ == 1 || candidates.size() < 2) ? crack_sequential(record, candidates)
                                                              : crack_parallel(record, candidates);

  if (result) {
    BOOST_LOG_TRIVIAL(info) << "Cracker: Password found";
  } else {
    BOOST_LOG_TRIVIAL(info) << "Cracker: No candidate matched";
  }
  return result;
}

std::optional<std::string> Cracker::crack_sequential(const project::ProtectionRecord& record,
                                                     const std::vector<std::string>& candidates) const {
  HashEngine engine;
  for (const auto& candidate : candidates) {
    if (engine.matches(record, candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<std::string> Cracker::crack_parallel(const project::ProtectionRecord& record,
                                                   const std::vector<std::string>& candidates) const {
  const std::size_t workers = std::min(worker_count_, candidates.size());

  // Lowest matching index seen so far, workers stop once they pass it
  std::atomic<std::size_t> best{NO_MATCH};
  std::atomic<bool> failed{false};
  std::vector<std::exception_ptr> errors(workers);
  WorkerGroup group;
  group.reserve(workers);

  // Started workers stop early and are joined by the group if a spawn fails
  try {
    for (std::size_t w = 0; w < workers; ++w) {
      group.spawn([&, w]() {
        try {
          HashEngine engine;
          for (std::size_t i = w; i < candidates.size(); i += workers) {
            if (failed.load() || i >= best.load()) {
              break;
            }
            if (engine.matches(record, candidates[i])) {
              std::size_t current = best.load();
              while (i < current && !best.compare_exchange_weak(current, i)) {
              }
              break;
            }
          }
        } catch (...) {
          errors[w] = std::current_exception();
          failed.store(true);
        }
      });
    }
  } catch (const std::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Cracker: Could not start worker " << group.size() << ": " << e.what();
    failed.store(true);
    throw;
  }

  group.join();

  for (const auto& error : errors) {
    if (error) {
      BOOST_LOG_TRIVIAL(error) << "Cracker: Worker failed, rethrowing";
      std::rethrow_exception(error);
    }
  }

  const std::size_t index = best.load();
  if (index == NO_MATCH) {
    return std::nullopt;
  }
  return candidates[index];
}

} // namespace vbaunlock::crypto
