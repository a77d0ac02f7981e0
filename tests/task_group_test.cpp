#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "platform/task_group.hpp"
#include "support/test_util.hpp"

namespace {

using sda::testing::Assert;

bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

void TestSubmitBlocksWhileFull() {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> started{0};
  std::atomic<int> finished{0};
  auto blocked_task = [gate, &started, &finished] {
    ++started;
    gate.wait();
    ++finished;
  };

  platform::TaskGroup group(2);
  group.Submit(blocked_task);
  group.Submit(blocked_task);
  Assert(WaitUntil([&started] { return started.load() == 2; }, std::chrono::seconds(2)),
         "the first two tasks must start");

  std::atomic<bool> third_submitted{false};
  auto submitter = std::async(std::launch::async, [&group, &blocked_task, &third_submitted] {
    group.Submit(blocked_task);
    third_submitted = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  Assert(!third_submitted.load() && started.load() == 2,
         "a full group must hold back the next task");

  release.set_value();
  submitter.get();
  Assert(third_submitted.load(), "the third task must be submitted once a slot frees up");
  group.Wait();
  Assert(finished.load() == 3, "every task must run to completion");
  Assert(group.InFlight() == 0, "nothing may remain in flight after Wait");
}

void TestTaskExceptionsSurface() {
  platform::TaskGroup group(1);
  group.Submit([] { throw std::runtime_error("task failed"); });
  bool threw = false;
  try {
    group.Wait();
  } catch (const std::runtime_error& ex) {
    threw = std::string{ex.what()} == "task failed";
  }
  Assert(threw, "Wait must rethrow a task's exception");
}

void TestZeroCapacityIsRejected() {
  bool threw = false;
  try {
    platform::TaskGroup group(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Assert(threw, "a group without capacity must be rejected");
}

}  // namespace

int main() {
  try {
    TestSubmitBlocksWhileFull();
    TestTaskExceptionsSurface();
    TestZeroCapacityIsRejected();
  } catch (const std::exception& ex) {
    std::cerr << "task_group_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
