#include "timer.hpp"

#include <exception>

#include "logger.hpp"

namespace utils {

Timer::Timer() : nextId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;

  std::lock_guard<std::mutex> lock(tasksMutex_);
  TaskId id = nextId_++;
  taskQueue_.emplace(execution_time, id, std::move(callback));
  tasksCv_.notify_one();
  return id;
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }
  timerThread_ = std::thread(&Timer::loop, this);
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (timerThread_.joinable()) {
    if (timerThread_.get_id() == std::this_thread::get_id()) {
      timerThread_.detach();  // stop() called from a callback
    } else {
      timerThread_.join();
    }
  }

  std::lock_guard<std::mutex> lock(tasksMutex_);
  while (!taskQueue_.empty()) taskQueue_.pop();
}

void Timer::loop() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (taskQueue_.empty()) {
      tasksCv_.wait(lock, [this]() { return !taskQueue_.empty() || !running_; });
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    auto due = taskQueue_.top().execTimestamp;
    if (due > now) {
      // Woken early by a new (possibly earlier) task or by stop().
      tasksCv_.wait_until(lock, due);
      continue;
    }

    TimerTask task = taskQueue_.top();
    taskQueue_.pop();

    lock.unlock();  // Unlock before executing the callback
    try {
      task.callback();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[Timer] Task " << task.id << " threw: " << e.what();
    }
    lock.lock();
  }
}

}  // namespace utils
