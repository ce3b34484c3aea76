#include <gflags/gflags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "JobManager/JobManager.hpp"
#include "Storage/FileStore.hpp"
#include "Transport/CurlTransport.hpp"
#include "utils/flags.hpp"
#include "utils/logger.hpp"

namespace {

std::atomic<bool> interrupted{false};

void onSignal(int) { interrupted.store(true); }

void logProgress(const jobdl::JobRecord& record) {
  const auto& state = record.state;
  auto line = LOG(INFO);
  line << record.name << " [" << record.id << "] "
       << jobdl::toString(state.status) << " " << state.bytesTransferred;
  if (state.totalSize > 0) {
    line << "/" << state.totalSize << " bytes ("
         << state.bytesTransferred * 100 / state.totalSize << "%)";
  } else {
    line << " bytes";
  }
  if (state.error) line << " - " << *state.error;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("job_downloader [flags] <url> [<url> ...]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0]
              << " [--download_dir=DIR] [--reconcile_interval_ms=N] <url>..."
              << std::endl;
    return 1;
  }

  // 日志初始化
  utils::LogConfig logCfg;
  logCfg.logDir = FLAGS_log_dir;
  logCfg.minLevel = utils::parseLogLevel(FLAGS_log_level);
  logCfg.toConsole = FLAGS_log_to_console;
  utils::Logger::initialize(logCfg);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  try {
    jobdl::CurlTransport transport(jobdl::CurlOptions::FromFlags());
    jobdl::LocalFileStore store;
    jobdl::JobManager manager(transport, store,
                              jobdl::ManagerOptions::FromFlags());
    manager.start();

    std::vector<jobdl::JobId> ids;
    for (int i = 1; i < argc; ++i) {
      ids.push_back(manager.add(argv[i]));
    }

    const auto interval =
        std::chrono::milliseconds(std::max(100, FLAGS_reconcile_interval_ms));
    bool cancelling = false;
    while (true) {
      if (interrupted.load() && !cancelling) {
        LOG(WARN) << "Interrupted, cancelling " << ids.size() << " jobs";
        for (const auto& id : ids) {
          manager.remove(id);
        }
        cancelling = true;
      }

      auto records = manager.list();
      std::sort(records.begin(), records.end(),
                [](const jobdl::JobRecord& a, const jobdl::JobRecord& b) {
                  return a.name < b.name;
                });
      bool pending = false;
      for (const auto& record : records) {
        logProgress(record);
        pending |= !jobdl::isTerminal(record.state.status);
      }
      if (!pending) break;

      std::this_thread::sleep_for(interval);
    }

    int failed = 0;
    for (const auto& record : manager.list()) {
      if (record.state.status == jobdl::JobStatus::kError) ++failed;
    }
    manager.stop();

    if (cancelling) return 130;
    if (failed > 0) {
      LOG(ERROR) << failed << " of " << ids.size() << " downloads failed";
      return 2;
    }
    LOG(INFO) << "All " << ids.size() << " downloads finished in "
              << FLAGS_download_dir;
  } catch (const std::exception& ex) {
    LOG(FATAL) << "Fatal error: " << ex.what();
    return 1;
  }

  gflags::ShutDownCommandLineFlags();
  return 0;
}
