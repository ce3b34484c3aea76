#ifndef JOBDL_JOB_HPP_
#define JOBDL_JOB_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace jobdl {

using JobId = std::string;
using WorkerHandle = uint64_t;
using Clock = std::chrono::system_clock;

enum class JobStatus { kInitiate, kActive, kFinish, kError, kCancel };

const char* toString(JobStatus status);
bool isTerminal(JobStatus status);

// Mutable part of a job. The worker owns the live copy; the manager keeps a
// reconciled snapshot of it.
struct DownloadState {
  JobStatus status = JobStatus::kInitiate;
  uint64_t totalSize = 0;  // 0 until known
  uint64_t bytesTransferred = 0;
  long httpStatus = 0;  // set when the server answered with a failure code
  std::optional<Clock::time_point> startTime;
  std::optional<Clock::time_point> endTime;  // finish/error only
  std::optional<std::string> error;
};

struct JobRecord {
  JobId id;
  std::string name;
  std::string source;
  std::filesystem::path destination;
  WorkerHandle worker = 0;
  DownloadState state;
};

// Random version-4 UUID, e.g. "3f2b8c1e-9a4d-4f6b-8e2a-1c5d7b9e0f13".
JobId generateJobId();

// Last non-empty path segment of the URL, without query or fragment.
// Falls back to "download-<first 8 chars of id>".
std::string deriveJobName(const std::string& source, const JobId& id);

// Folds a worker-reported state into the stored one. A terminal stored state
// is never changed again, status never moves backwards and byte counts never
// shrink. Returns true if anything changed.
bool mergeState(DownloadState& stored, const DownloadState& reported);

}  // namespace jobdl

#endif  // JOBDL_JOB_HPP_
