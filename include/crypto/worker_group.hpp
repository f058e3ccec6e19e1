#ifndef VBAUNLOCK_WORKER_GROUP_HPP
#define VBAUNLOCK_WORKER_GROUP_HPP

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace vbaunlock::crypto {

// Threads that are always joined, also when the owner unwinds
// before every worker could be started
class WorkerGroup {
public:
  WorkerGroup() = default;
  ~WorkerGroup() { join(); }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  void reserve(std::size_t count) { threads_.reserve(count); }

  template <typename Func>
  void spawn(Func&& func) {
    threads_.emplace_back(std::forward<Func>(func));
  }

  // Waits for every started worker, safe to call more than once
  void join() {
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  std::size_t size() const { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

} // namespace vbaunlock::crypto

#endif // VBAUNLOCK_WORKER_GROUP_HPP
