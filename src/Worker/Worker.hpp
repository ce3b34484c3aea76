#ifndef JOBDL_WORKER_HPP_
#define JOBDL_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Job/Job.hpp"
#include "Storage/FileStore.hpp"
#include "Transport/Transport.hpp"

namespace jobdl {

// One-shot notice a worker sends to its owner on exit.
using TerminationCallback =
    std::function<void(const JobId& id, const DownloadState& finalState)>;

struct WorkerSpec {
  JobId id;
  std::string source;
  std::filesystem::path destination;
  TerminationCallback onTerminate;
};

/**
 * Drives a single download on its own thread:
 * initiate -> active -> {finish | error}, or cancel when asked to stop.
 *
 * Chunks are pulled from the transport one at a time and appended to the
 * destination in arrival order. Whatever way the thread ends, the owner's
 * TerminationCallback fires exactly once, then the exit hook runs.
 */
class Worker {
 public:
  using ExitHook = std::function<void(WorkerHandle)>;
  using ReleaseHook = std::function<void()>;

  Worker(WorkerHandle handle, WorkerSpec spec, Transport& transport,
         FileStore& store, ExitHook onExit = nullptr);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Spawns the download thread. Throws std::system_error if it cannot.
  void start();
  // Cooperative: the transfer stops at its next suspension point.
  void cancel() noexcept;
  // Cancels, then runs onReleased once the worker has let go of its
  // destination: on the worker thread, or inline if it already has.
  void cancel(ReleaseHook onReleased);

  // Empty if the state could not be read within the timeout.
  [[nodiscard]] std::optional<DownloadState> status(
      std::chrono::milliseconds timeout) const;

  // Runs fn on the live state under the state lock. status() callers wait
  // until fn returns.
  void inspect(const std::function<void(const DownloadState&)>& fn) const;

  [[nodiscard]] bool waitStopped(std::chrono::milliseconds timeout) const;
  [[nodiscard]] bool stopped() const;
  void join();

  [[nodiscard]] WorkerHandle handle() const { return handle_; }
  [[nodiscard]] const JobId& jobId() const { return spec_.id; }

 private:
  void run();
  void transfer(FileWriter& file);
  bool onHeaders(const StreamEvent& ev);
  bool onChunk(FileWriter& file, const StreamEvent& ev);
  void onEnd(FileWriter& file);

  void setActive(uint64_t totalSize);
  void fail(const std::string& reason, long httpStatus = 0);
  void markCancelled();
  [[nodiscard]] JobStatus currentStatus() const;
  [[nodiscard]] DownloadState snapshot() const;

  const WorkerHandle handle_;
  WorkerSpec spec_;
  Transport& transport_;
  FileStore& store_;
  ExitHook onExit_;

  mutable std::timed_mutex stateMutex_;
  DownloadState state_;

  std::atomic<bool> cancelled_{false};
  std::mutex streamMutex_;
  Stream* stream_ = nullptr;  // valid while transfer() runs

  std::mutex releaseMutex_;
  bool released_ = false;  // destination closed and dropped
  ReleaseHook onReleased_;

  std::promise<void> stoppedPromise_;
  std::shared_future<void> stopped_;
  std::thread thread_;
};

}  // namespace jobdl

#endif  // JOBDL_WORKER_HPP_
