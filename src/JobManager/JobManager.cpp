#include "JobManager.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "utils/flags.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace jobdl {

namespace {

constexpr char kLostContactReason[] =
    "Worker terminated externally (lost contact)";

// Best effort; a missing file is not worth a warning.
void deleteOutput(FileStore& store, const std::filesystem::path& path,
                  const JobId& id) {
  std::error_code ec = store.remove(path);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    LOG(WARN) << "Failed to delete " << path.string() << " for job " << id
              << ": " << ec.message();
  } else if (!ec) {
    LOG(DEBUG) << "Deleted " << path.string() << " for job " << id;
  }
}

}  // namespace

ManagerOptions ManagerOptions::FromFlags() {
  ManagerOptions options;
  options.downloadDir = FLAGS_download_dir;
  options.reconcileInterval =
      std::chrono::milliseconds(FLAGS_reconcile_interval_ms);
  options.statusTimeout = std::chrono::milliseconds(FLAGS_status_timeout_ms);
  return options;
}

JobManager::JobManager(Transport& transport, FileStore& store,
                       ManagerOptions options)
    : store_(store),
      options_(std::move(options)),
      supervisor_(transport, store) {}

JobManager::~JobManager() { stop(); }

void JobManager::start() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (loopThread_.joinable()) {
    LOG(WARN) << "Job manager already running";
    return;
  }
  if (stopped_) {
    throw JobError("Job manager cannot be restarted");
  }

  {
    std::lock_guard<std::mutex> postLock(postMutex_);
    accepting_ = true;
  }
  loopThread_ = std::thread(&JobManager::eventLoop, this);
  timer_.start();
  scheduleReconcile();

  LOG(INFO) << "Job manager started, downloads go to "
            << options_.downloadDir.string() << ", reconcile every "
            << options_.reconcileInterval.count() << " ms";
}

void JobManager::stop() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (stopped_) return;
  stopped_ = true;

  timer_.stop();
  // Workers still deliver their termination notices to the running loop.
  supervisor_.shutdown();

  {
    std::lock_guard<std::mutex> postLock(postMutex_);
    accepting_ = false;
    events_.push(Event());  // sentinel, always the last event
  }
  if (loopThread_.joinable()) {
    loopThread_.join();
  }
  events_.clear();
  LOG(INFO) << "Job manager stopped";
}

JobId JobManager::add(const std::string& source) {
  return call([this, source] {
    JobRecord record;
    do {
      record.id = generateJobId();
    } while (jobs_.count(record.id) > 0);
    record.name = deriveJobName(source, record.id);
    record.source = source;
    record.destination = options_.downloadDir / record.id;

    WorkerSpec spec;
    spec.id = record.id;
    spec.source = source;
    spec.destination = record.destination;
    spec.onTerminate = [this](const JobId& id, const DownloadState& state) {
      if (!post([this, id, state] { onTermination(id, state); })) {
        LOG(DEBUG) << "Dropping termination notice for job " << id
                   << ", manager stopped";
      }
    };

    try {
      record.worker = supervisor_.add(std::move(spec));
    } catch (const SupervisorError& e) {
      LOG(ERROR) << "Cannot start job for " << source << ": " << e.what();
      throw JobError(e.what());
    }

    const JobId id = record.id;
    LOG(INFO) << "Job " << id << " (" << record.name << ") added for "
              << source;
    jobs_.emplace(id, std::move(record));
    return id;
  });
}

std::optional<JobRecord> JobManager::get(const JobId& id) const {
  return call([this, id]() -> std::optional<JobRecord> {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      return std::nullopt;
    }
    return it->second;
  });
}

std::vector<JobRecord> JobManager::list() const {
  return call([this] {
    std::vector<JobRecord> records;
    records.reserve(jobs_.size());
    for (const auto& kv : jobs_) {
      records.push_back(kv.second);
    }
    return records;
  });
}

bool JobManager::remove(const JobId& id) {
  return call([this, id] {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      LOG(DEBUG) << "Remove of unknown job " << id;
      return false;
    }
    const JobRecord record = std::move(it->second);
    jobs_.erase(it);

    // The worker's own notice, if any, finds no record and is discarded.
    // The file belongs to the worker until it lets go, so deletion runs
    // from its release hook rather than here.
    FileStore& store = store_;
    const std::filesystem::path destination = record.destination;
    supervisor_.remove(record.worker, [&store, destination, id] {
      deleteOutput(store, destination, id);
    });

    LOG(INFO) << "Job " << id << " removed ("
              << toString(record.state.status) << ")";
    return true;
  });
}

void JobManager::reconcileNow() {
  call([this] { reconcile(); });
}

bool JobManager::post(Event event) const {
  std::lock_guard<std::mutex> lock(postMutex_);
  if (!accepting_) {
    return false;
  }
  events_.push(std::move(event));
  return true;
}

void JobManager::eventLoop() {
  while (true) {
    Event event;
    events_.pop(event);
    if (!event) {
      break;
    }
    try {
      event();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Job manager event failed: " << e.what();
    }
  }
}

void JobManager::onTermination(const JobId& id,
                               const DownloadState& finalState) {
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    LOG(DEBUG) << "Termination notice for removed job " << id << " ignored";
    return;
  }

  JobRecord& record = it->second;
  if (mergeState(record.state, finalState)) {
    LOG(INFO) << "Job " << id << " terminated: "
              << toString(record.state.status)
              << (record.state.error ? " (" + *record.state.error + ")" : "");
  }
}

void JobManager::reconcile() {
  if (size_t reaped = supervisor_.reap()) {
    LOG(DEBUG) << "Reaped " << reaped << " exited workers";
  }

  struct Probe {
    JobId id;
    WorkerHandle worker;
    std::optional<DownloadState> state;
  };

  std::vector<Probe> probes;
  for (const auto& kv : jobs_) {
    if (!isTerminal(kv.second.state.status)) {
      probes.push_back({kv.first, kv.second.worker, std::nullopt});
    }
  }
  if (probes.empty()) {
    return;
  }

  utils::TBBManager::GetInstance().ParallelFor<size_t>(
      "reconcile", 0, probes.size(), [this, &probes](size_t i) {
        probes[i].state =
            supervisor_.status(probes[i].worker, options_.statusTimeout);
      });

  for (auto& probe : probes) {
    auto it = jobs_.find(probe.id);
    if (it == jobs_.end()) {
      continue;
    }
    if (probe.state) {
      mergeState(it->second.state, *probe.state);
    } else {
      // Queued behind any termination notice the worker already sent, so a
      // real notice wins over the lost-contact verdict.
      const JobId id = probe.id;
      if (!post([this, id] { markLost(id); })) {
        LOG(DEBUG) << "Manager stopping, lost-contact check for " << id
                   << " skipped";
      }
    }
  }
}

void JobManager::markLost(const JobId& id) {
  auto it = jobs_.find(id);
  if (it == jobs_.end() || isTerminal(it->second.state.status)) {
    return;
  }

  JobRecord& record = it->second;
  record.state.status = JobStatus::kError;
  record.state.error = kLostContactReason;
  record.state.endTime = Clock::now();
  LOG(WARN) << "Job " << id << " lost contact with worker " << record.worker;

  // A worker that merely stopped answering must not outlive its job.
  supervisor_.remove(record.worker);
}

void JobManager::scheduleReconcile() {
  // Re-armed only after the pass has run: a slow pass delays the next one.
  timer_.addOnceTask(options_.reconcileInterval, [this] {
    bool queued = post([this] {
      try {
        reconcile();
      } catch (const std::exception& e) {
        LOG(ERROR) << "Reconciliation pass failed: " << e.what();
      }
      scheduleReconcile();
    });
    if (!queued) {
      LOG(DEBUG) << "Reconciliation stopped";
    }
  });
}

}  // namespace jobdl
