#ifndef JOBDL_JOB_MANAGER_HPP_
#define JOBDL_JOB_MANAGER_HPP_

#include <tbb/concurrent_queue.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "Job/Job.hpp"
#include "Storage/FileStore.hpp"
#include "Supervisor/WorkerSupervisor.hpp"
#include "Transport/Transport.hpp"
#include "utils/timer.hpp"

namespace jobdl {

class JobError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ManagerOptions {
  std::filesystem::path downloadDir{"downloads"};
  std::chrono::milliseconds reconcileInterval{1000};
  std::chrono::milliseconds statusTimeout{200};

  static ManagerOptions FromFlags();
};

/**
 * Authoritative registry of download jobs.
 *
 * Every registry access runs on one event-loop thread: caller requests,
 * termination notices from workers and reconciliation passes are queued and
 * handled one at a time, so records are never updated concurrently. Caller
 * methods block only until their own event has been handled, never on a
 * download.
 */
class JobManager {
 public:
  JobManager(Transport& transport, FileStore& store,
             ManagerOptions options = ManagerOptions());
  ~JobManager();

  JobManager(const JobManager&) = delete;
  JobManager& operator=(const JobManager&) = delete;

  void start();
  // Stops reconciliation, cancels every worker and ends the event loop.
  // The manager cannot be started again.
  void stop();

  // Throws JobError if no worker could be started for the job or the
  // manager is not running. Download failures show up in the record instead.
  JobId add(const std::string& source);
  std::optional<JobRecord> get(const JobId& id) const;
  std::vector<JobRecord> list() const;
  // False if the id is unknown. Does not wait for a running worker: its
  // file is deleted once the worker has closed it.
  bool remove(const JobId& id);

  // Runs one reconciliation pass and waits for it.
  void reconcileNow();

  const WorkerSupervisor& supervisor() const { return supervisor_; }

 private:
  using Event = std::function<void()>;

  bool post(Event event) const;
  template <typename Fn>
  auto call(Fn fn) const -> decltype(fn());

  void eventLoop();
  void onTermination(const JobId& id, const DownloadState& finalState);
  void reconcile();
  void markLost(const JobId& id);
  void scheduleReconcile();

  FileStore& store_;
  ManagerOptions options_;

  std::unordered_map<JobId, JobRecord> jobs_;  // event loop thread only

  mutable tbb::concurrent_bounded_queue<Event> events_;
  mutable std::mutex postMutex_;
  bool accepting_ = false;
  bool stopped_ = false;

  std::mutex lifecycleMutex_;
  std::thread loopThread_;
  utils::Timer timer_;
  WorkerSupervisor supervisor_;
};

template <typename Fn>
auto JobManager::call(Fn fn) const -> decltype(fn()) {
  using Result = decltype(fn());
  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  if (!post([task] { (*task)(); })) {
    throw JobError("Job manager is not running");
  }
  return future.get();
}

}  // namespace jobdl

#endif  // JOBDL_JOB_MANAGER_HPP_
