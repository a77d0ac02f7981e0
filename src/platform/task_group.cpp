#include "platform/task_group.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace platform {

namespace {

constexpr auto kSlotPollInterval = std::chrono::milliseconds(20);

}  // namespace

TaskGroup::TaskGroup(std::size_t max_in_flight) : max_in_flight_(max_in_flight) {
  if (max_in_flight_ == 0) {
    throw std::invalid_argument("TaskGroup needs room for at least one task");
  }
}

TaskGroup::~TaskGroup() {
  for (auto& task : in_flight_) {
    task.wait();
  }
}

void TaskGroup::Submit(std::function<void()> task) {
  ReapFinished();
  while (in_flight_.size() >= max_in_flight_) {
    in_flight_.front().wait_for(kSlotPollInterval);
    ReapFinished();
  }
  in_flight_.push_back(std::async(std::launch::async, std::move(task)));
}

void TaskGroup::Wait() {
  while (!in_flight_.empty()) {
    auto task = std::move(in_flight_.front());
    in_flight_.pop_front();
    task.get();
  }
}

std::size_t TaskGroup::InFlight() {
  ReapFinished();
  return in_flight_.size();
}

void TaskGroup::ReapFinished() {
  for (auto it = in_flight_.begin(); it != in_flight_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      auto finished = std::move(*it);
      it = in_flight_.erase(it);
      finished.get();
    } else {
      ++it;
    }
  }
}

}  // namespace platform
