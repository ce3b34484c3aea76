#ifndef JOBDL_WORKER_SUPERVISOR_HPP_
#define JOBDL_WORKER_SUPERVISOR_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "Job/Job.hpp"
#include "Storage/FileStore.hpp"
#include "Transport/Transport.hpp"
#include "Worker/Worker.hpp"

namespace jobdl {

class SupervisorError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct WorkerInfo {
  WorkerHandle handle;
  JobId jobId;
};

// Owns the population of running workers. There is no restart policy: a
// worker that exits, for whatever reason, is dropped from the live set and
// nothing else happens.
class WorkerSupervisor {
 public:
  WorkerSupervisor(Transport& transport, FileStore& store);
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

  // Starts a worker for the job. Throws SupervisorError if it cannot.
  WorkerHandle add(WorkerSpec spec);

  // Cancels the worker without waiting for it. onReleased runs once the
  // worker has let go of its destination file, which may be inline if it
  // already has or the handle is unknown. Returns whether the handle was
  // live; removing an exited handle is otherwise a no-op.
  bool remove(WorkerHandle handle, Worker::ReleaseHook onReleased = nullptr);

  // Empty if the handle is not live or did not answer within the timeout.
  std::optional<DownloadState> status(WorkerHandle handle,
                                      std::chrono::milliseconds timeout) const;

  // Runs fn on a live worker's state under its state lock. False if the
  // handle is not live.
  bool inspect(WorkerHandle handle,
               const std::function<void(const DownloadState&)>& fn) const;

  std::vector<WorkerInfo> liveWorkers() const;
  size_t liveCount() const;
  bool isLive(WorkerHandle handle) const;

  // Joins workers that have exited since the last call and returns how
  // many were joined.
  size_t reap();

  // Cancels and joins every worker. add() fails afterwards.
  void shutdown();

 private:
  void onWorkerExit(WorkerHandle handle);

  Transport& transport_;
  FileStore& store_;

  mutable std::mutex mutex_;
  WorkerHandle nextHandle_ = 1;
  bool stopping_ = false;
  std::unordered_map<WorkerHandle, std::shared_ptr<Worker>> live_;
  std::vector<std::shared_ptr<Worker>> retired_;  // exited or removed, not yet joined
};

}  // namespace jobdl

#endif  // JOBDL_WORKER_SUPERVISOR_HPP_
