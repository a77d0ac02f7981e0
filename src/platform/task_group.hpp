#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <list>

namespace platform {

// Runs tasks on their own threads with at most `max_in_flight` running at
// once. Submit and Wait must be called from a single thread.
class TaskGroup {
 public:
  explicit TaskGroup(std::size_t max_in_flight);
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  // Blocks while the group is full. Rethrows an exception escaping an
  // already finished task.
  void Submit(std::function<void()> task);

  // Waits for every submitted task.
  void Wait();

  std::size_t InFlight();

 private:
  void ReapFinished();

  std::size_t max_in_flight_;
  std::list<std::future<void>> in_flight_;
};

}  // namespace platform
