#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace utils {

// Single-thread scheduler for one-shot callbacks. Periodic work re-arms itself
// from inside its callback, so a slow run delays the next one instead of
// piling up behind it.
class Timer {
 public:
  using TaskId = uint64_t;

  struct TimerTask {
    std::chrono::steady_clock::time_point execTimestamp;
    TaskId id;
    std::function<void()> callback;

    TimerTask(std::chrono::steady_clock::time_point execTime, TaskId taskId,
              std::function<void()> cb)
        : execTimestamp(execTime), id(taskId), callback(std::move(cb)) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  Timer();
  ~Timer();

  TaskId addOnceTask(std::chrono::milliseconds delay,
                     std::function<void()> callback);

  void start();
  // Pending tasks are dropped.
  void stop();

 private:
  void loop();

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  TaskId nextId_;
  bool running_;
};

}  // namespace utils
