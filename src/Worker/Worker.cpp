#include "Worker.hpp"

#include <exception>
#include <utility>

#include "utils/logger.hpp"

namespace jobdl {

namespace {

// Publishes the live stream to cancel() for as long as it is in use.
class StreamSlot {
 public:
  StreamSlot(std::mutex& mutex, Stream*& slot, Stream* stream)
      : mutex_(mutex), slot_(slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = stream;
  }
  ~StreamSlot() {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = nullptr;
  }

 private:
  std::mutex& mutex_;
  Stream*& slot_;
};

}  // namespace

Worker::Worker(WorkerHandle handle, WorkerSpec spec, Transport& transport,
               FileStore& store, ExitHook onExit)
    : handle_(handle),
      spec_(std::move(spec)),
      transport_(transport),
      store_(store),
      onExit_(std::move(onExit)),
      stopped_(stoppedPromise_.get_future().share()) {}

Worker::~Worker() {
  cancel();
  join();
}

void Worker::start() {
  {
    std::lock_guard<std::timed_mutex> lock(stateMutex_);
    state_.startTime = Clock::now();
  }
  thread_ = std::thread(&Worker::run, this);
}

void Worker::cancel() noexcept {
  cancelled_.store(true);
  std::lock_guard<std::mutex> lock(streamMutex_);
  if (stream_) {
    stream_->interrupt();
  }
}

void Worker::cancel(ReleaseHook onReleased) {
  bool releasedAlready = false;
  {
    std::lock_guard<std::mutex> lock(releaseMutex_);
    if (released_) {
      releasedAlready = true;
    } else {
      onReleased_ = std::move(onReleased);
    }
  }
  cancel();
  if (releasedAlready && onReleased) {
    onReleased();
  }
}

void Worker::inspect(
    const std::function<void(const DownloadState&)>& fn) const {
  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  fn(state_);
}

std::optional<DownloadState> Worker::status(
    std::chrono::milliseconds timeout) const {
  std::unique_lock<std::timed_mutex> lock(stateMutex_, timeout);
  if (!lock.owns_lock()) {
    return std::nullopt;
  }
  return state_;
}

bool Worker::waitStopped(std::chrono::milliseconds timeout) const {
  return stopped_.wait_for(timeout) == std::future_status::ready;
}

bool Worker::stopped() const {
  return waitStopped(std::chrono::milliseconds(0));
}

void Worker::join() {
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
  } else {
    thread_.join();
  }
}

void Worker::run() {
  LOG(INFO) << "Worker " << handle_ << " started job " << spec_.id << " ("
            << spec_.source << " -> " << spec_.destination.string() << ")";

  std::error_code ec;
  std::unique_ptr<FileWriter> file = store_.open(spec_.destination, ec);
  if (!file) {
    fail("Cannot open destination " + spec_.destination.string() + ": " +
         ec.message());
  } else {
    try {
      transfer(*file);
    } catch (const std::exception& e) {
      fail(std::string{"Unexpected worker failure: "} + e.what());
    }
    // Already closed on finish; this covers error and cancel.
    std::error_code closeEc = file->close();
    if (closeEc) {
      LOG(WARN) << "Worker " << handle_ << " failed to close "
                << spec_.destination.string() << ": " << closeEc.message();
    }
  }

  const DownloadState finalState = snapshot();
  LOG(INFO) << "Worker " << handle_ << " exiting, job " << spec_.id << " "
            << toString(finalState.status) << " ("
            << finalState.bytesTransferred << "/" << finalState.totalSize
            << " bytes)";

  if (spec_.onTerminate) {
    try {
      spec_.onTerminate(spec_.id, finalState);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Termination notice for job " << spec_.id
                 << " failed: " << e.what();
    }
  }
  file.reset();

  ReleaseHook onReleased;
  {
    std::lock_guard<std::mutex> lock(releaseMutex_);
    released_ = true;
    onReleased = std::move(onReleased_);
  }
  if (onReleased) {
    try {
      onReleased();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Worker " << handle_ << " release hook failed: "
                 << e.what();
    }
  }

  if (onExit_) {
    onExit_(handle_);
  }
  // Nothing may touch *this after this line.
  stoppedPromise_.set_value();
}

void Worker::transfer(FileWriter& file) {
  std::unique_ptr<Stream> stream;
  try {
    stream = transport_.open(spec_.source);
  } catch (const TransportError& e) {
    fail(e.what());
    return;
  }
  StreamSlot slot(streamMutex_, stream_, stream.get());

  bool more = true;
  while (more) {
    if (cancelled_.load()) break;
    StreamEvent ev = stream->next();
    if (cancelled_.load()) break;

    switch (ev.kind) {
      case StreamEvent::Kind::kHeaders:
        more = onHeaders(ev);
        break;
      case StreamEvent::Kind::kChunk:
        more = onChunk(file, ev);
        break;
      case StreamEvent::Kind::kEnd:
        more = false;
        onEnd(file);
        break;
      case StreamEvent::Kind::kHttpError:
        more = false;
        fail("HTTP status " + std::to_string(ev.httpStatus), ev.httpStatus);
        break;
      case StreamEvent::Kind::kError:
        more = false;
        fail(ev.reason.empty() ? std::string{"transport error"} : ev.reason);
        break;
    }
  }

  if (cancelled_.load()) {
    markCancelled();
  }
}

bool Worker::onHeaders(const StreamEvent& ev) {
  if (currentStatus() != JobStatus::kInitiate) {
    fail("Unexpected response metadata mid-stream");
    return false;
  }
  setActive(ev.contentLength);
  return true;
}

bool Worker::onChunk(FileWriter& file, const StreamEvent& ev) {
  const DownloadState current = snapshot();
  if (current.status != JobStatus::kActive) {
    fail("Received data before response metadata");
    return false;
  }
  if (current.totalSize != 0 &&
      current.bytesTransferred + ev.data.size() > current.totalSize) {
    fail("Received more data than the advertised " +
         std::to_string(current.totalSize) + " bytes");
    return false;
  }

  std::error_code ec = file.write(ev.data.data(), ev.data.size());
  if (ec) {
    fail("Cannot write destination: " + ec.message());
    return false;
  }

  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  state_.bytesTransferred += ev.data.size();
  return true;
}

void Worker::onEnd(FileWriter& file) {
  const DownloadState current = snapshot();
  if (current.status != JobStatus::kActive) {
    fail("Stream ended before response metadata");
    return;
  }
  if (current.totalSize != 0 &&
      current.bytesTransferred != current.totalSize) {
    fail("Stream ended after " + std::to_string(current.bytesTransferred) +
         " of " + std::to_string(current.totalSize) + " bytes");
    return;
  }

  std::error_code ec = file.close();
  if (ec) {
    fail("Cannot close destination: " + ec.message());
    return;
  }

  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  state_.status = JobStatus::kFinish;
  if (state_.totalSize == 0) state_.totalSize = state_.bytesTransferred;
  state_.endTime = Clock::now();
}

void Worker::setActive(uint64_t totalSize) {
  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  state_.status = JobStatus::kActive;
  state_.totalSize = totalSize;
}

void Worker::fail(const std::string& reason, long httpStatus) {
  {
    std::lock_guard<std::timed_mutex> lock(stateMutex_);
    if (isTerminal(state_.status)) return;
    state_.status = JobStatus::kError;
    state_.error = reason;
    state_.httpStatus = httpStatus;
    state_.endTime = Clock::now();
  }
  LOG(WARN) << "Job " << spec_.id << " failed: " << reason;
}

void Worker::markCancelled() {
  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  if (isTerminal(state_.status)) return;
  state_.status = JobStatus::kCancel;
}

JobStatus Worker::currentStatus() const {
  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  return state_.status;
}

DownloadState Worker::snapshot() const {
  std::lock_guard<std::timed_mutex> lock(stateMutex_);
  return state_;
}

}  // namespace jobdl
