#include "WorkerSupervisor.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

#include "utils/logger.hpp"

namespace jobdl {

WorkerSupervisor::WorkerSupervisor(Transport& transport, FileStore& store)
    : transport_(transport), store_(store) {}

WorkerSupervisor::~WorkerSupervisor() { shutdown(); }

WorkerHandle WorkerSupervisor::add(WorkerSpec spec) {
  reap();

  const JobId jobId = spec.id;
  WorkerHandle handle = 0;
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw SupervisorError("Supervisor is shutting down, job " + jobId +
                            " not started");
    }
    handle = nextHandle_++;
    worker = std::make_shared<Worker>(
        handle, std::move(spec), transport_, store_,
        [this](WorkerHandle h) { onWorkerExit(h); });
    // Registered before start() so a worker that exits at once still finds
    // itself in the live set.
    live_.emplace(handle, worker);
  }

  try {
    worker->start();
  } catch (const std::system_error& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(handle);
    throw SupervisorError("Failed to start worker for job " + jobId + ": " +
                          e.what());
  }

  LOG(INFO) << "[Supervisor] Worker " << handle << " added for job " << jobId;
  return handle;
}

bool WorkerSupervisor::remove(WorkerHandle handle,
                              Worker::ReleaseHook onReleased) {
  std::shared_ptr<Worker> worker;
  bool wasLive = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(handle);
    if (it != live_.end()) {
      worker = it->second;
      live_.erase(it);
      retired_.push_back(worker);
      wasLive = true;
    } else {
      // An exited worker may still be unwinding; its hook must wait too.
      auto retired = std::find_if(
          retired_.begin(), retired_.end(),
          [handle](const std::shared_ptr<Worker>& w) {
            return w->handle() == handle;
          });
      if (retired != retired_.end()) {
        worker = *retired;
      }
    }
  }

  if (!worker) {
    LOG(DEBUG) << "[Supervisor] Worker " << handle << " is not live";
    if (onReleased) {
      onReleased();
    }
    return false;
  }

  worker->cancel(std::move(onReleased));
  if (wasLive) {
    LOG(INFO) << "[Supervisor] Worker " << handle << " removed (job "
              << worker->jobId() << ")";
  }
  return wasLive;
}

bool WorkerSupervisor::inspect(
    WorkerHandle handle,
    const std::function<void(const DownloadState&)>& fn) const {
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(handle);
    if (it == live_.end()) {
      return false;
    }
    worker = it->second;
  }
  worker->inspect(fn);
  return true;
}

std::optional<DownloadState> WorkerSupervisor::status(
    WorkerHandle handle, std::chrono::milliseconds timeout) const {
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(handle);
    if (it == live_.end()) {
      return std::nullopt;
    }
    worker = it->second;
  }
  return worker->status(timeout);
}

std::vector<WorkerInfo> WorkerSupervisor::liveWorkers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WorkerInfo> workers;
  workers.reserve(live_.size());
  for (const auto& kv : live_) {
    workers.push_back({kv.first, kv.second->jobId()});
  }
  return workers;
}

size_t WorkerSupervisor::liveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

bool WorkerSupervisor::isLive(WorkerHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.count(handle) > 0;
}

void WorkerSupervisor::shutdown() {
  std::vector<std::shared_ptr<Worker>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && live_.empty() && retired_.empty()) return;
    stopping_ = true;
    for (auto& kv : live_) {
      all.push_back(std::move(kv.second));
    }
    live_.clear();
    std::move(retired_.begin(), retired_.end(), std::back_inserter(all));
    retired_.clear();
  }

  if (!all.empty()) {
    LOG(INFO) << "[Supervisor] Shutting down " << all.size() << " workers";
  }
  for (auto& worker : all) {
    worker->cancel();
  }
  for (auto& worker : all) {
    worker->join();
  }
}

// Runs on the exiting worker's own thread, so the worker is parked in
// retired_ instead of being released here.
void WorkerSupervisor::onWorkerExit(WorkerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = live_.find(handle);
  if (it == live_.end()) {
    return;
  }
  retired_.push_back(std::move(it->second));
  live_.erase(it);
}

size_t WorkerSupervisor::reap() {
  std::vector<std::shared_ptr<Worker>> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto split = std::partition(
        retired_.begin(), retired_.end(),
        [](const std::shared_ptr<Worker>& w) { return !w->stopped(); });
    std::move(split, retired_.end(), std::back_inserter(done));
    retired_.erase(split, retired_.end());
  }
  for (auto& worker : done) {
    worker->join();
  }
  return done.size();
}

}  // namespace jobdl
