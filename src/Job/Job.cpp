#include "Job.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace jobdl {

namespace {

int rank(JobStatus status) {
  switch (status) {
    case JobStatus::kInitiate:
      return 0;
    case JobStatus::kActive:
      return 1;
    default:
      return 2;
  }
}

template <typename T>
bool assignIfChanged(T& target, const T& value) {
  if (target == value) return false;
  target = value;
  return true;
}

}  // namespace

const char* toString(JobStatus status) {
  switch (status) {
    case JobStatus::kInitiate:
      return "initiate";
    case JobStatus::kActive:
      return "active";
    case JobStatus::kFinish:
      return "finish";
    case JobStatus::kError:
      return "error";
    case JobStatus::kCancel:
      return "cancel";
  }
  return "unknown";
}

bool isTerminal(JobStatus status) { return rank(status) == 2; }

JobId generateJobId() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(rd());
  static thread_local std::uniform_int_distribution<uint64_t> dis;

  uint64_t ab = dis(gen);
  uint64_t cd = dis(gen);

  // version 4, variant 10xx
  ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  oss << std::setw(8) << (ab >> 32) << '-';
  oss << std::setw(4) << ((ab >> 16) & 0xFFFF) << '-';
  oss << std::setw(4) << (ab & 0xFFFF) << '-';
  oss << std::setw(4) << (cd >> 48) << '-';
  oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
  return oss.str();
}

std::string deriveJobName(const std::string& source, const JobId& id) {
  const std::string fallback = "download-" + id.substr(0, 8);

  auto scheme = source.find("://");
  if (scheme == std::string::npos || scheme == 0) return fallback;

  std::string rest = source.substr(scheme + 3);
  rest = rest.substr(0, rest.find_first_of("?#"));

  auto slash = rest.find('/');
  if (slash == std::string::npos) return fallback;
  std::string path = rest.substr(slash);

  while (!path.empty() && path.back() == '/') path.pop_back();
  auto last = path.find_last_of('/');
  std::string segment =
      last == std::string::npos ? path : path.substr(last + 1);
  return segment.empty() ? fallback : segment;
}

bool mergeState(DownloadState& stored, const DownloadState& reported) {
  if (isTerminal(stored.status)) return false;

  bool changed = false;
  if (rank(reported.status) >= rank(stored.status)) {
    changed |= assignIfChanged(stored.status, reported.status);
  }
  if (reported.totalSize != 0) {
    changed |= assignIfChanged(stored.totalSize, reported.totalSize);
  }
  if (reported.bytesTransferred > stored.bytesTransferred) {
    stored.bytesTransferred = reported.bytesTransferred;
    changed = true;
  }
  if (reported.httpStatus != 0) {
    changed |= assignIfChanged(stored.httpStatus, reported.httpStatus);
  }
  if (reported.startTime) {
    changed |= assignIfChanged(stored.startTime, reported.startTime);
  }
  if (reported.endTime) {
    changed |= assignIfChanged(stored.endTime, reported.endTime);
  }
  if (reported.error) {
    changed |= assignIfChanged(stored.error, reported.error);
  }
  return changed;
}

}  // namespace jobdl
