#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "JobManager/JobManager.hpp"
#include "Storage/FileStore.hpp"
#include "fake_store.hpp"
#include "fake_transport.hpp"
#include "test_helpers.hpp"

using namespace jobdl;
using namespace jobdl::fakes;
using namespace std::chrono_literals;

namespace {

class JobManagerTest : public ::testing::Test {
 protected:
  ManagerOptions options() const {
    ManagerOptions opts;
    opts.downloadDir = dir_.path();
    opts.reconcileInterval = 20ms;
    opts.statusTimeout = 100ms;
    return opts;
  }

  JobStatus statusOf(JobManager& manager, const JobId& id) {
    auto record = manager.get(id);
    return record ? record->state.status : JobStatus::kCancel;
  }

  bool reaches(JobManager& manager, const JobId& id, JobStatus status) {
    return waitFor([&] { return statusOf(manager, id) == status; });
  }

  TempDir dir_;
  FakeTransport transport_;
  GatedFileStore store_;
};

Script held(const std::string& body, size_t chunk, size_t holdAt) {
  Script script = servesBytes(body, chunk);
  script.holdAt = holdAt;
  return script;
}

}  // namespace

TEST_F(JobManagerTest, AddRecordsInitialJob) {
  transport_.serve("http://host/files/a.bin", held(makeBody(100), 10, 0));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/files/a.bin");
  auto record = manager.get(id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->id, id);
  EXPECT_EQ(record->name, "a.bin");
  EXPECT_EQ(record->source, "http://host/files/a.bin");
  EXPECT_EQ(record->destination.string(), (dir_.path() / id).string());
  EXPECT_NE(record->worker, 0u);
  EXPECT_EQ(record->state.status, JobStatus::kInitiate);
  EXPECT_EQ(record->state.bytesTransferred, 0u);
  EXPECT_FALSE(record->state.endTime.has_value());
}

TEST_F(JobManagerTest, DownloadGoesActiveThenFinishes) {
  const std::string body = makeBody(100000);
  transport_.serve("http://host/100MB-file", held(body, 1000, 10));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/100MB-file");
  ASSERT_TRUE(reaches(manager, id, JobStatus::kActive));
  auto active = manager.get(id);
  EXPECT_EQ(active->state.totalSize, body.size());
  EXPECT_LE(active->state.bytesTransferred, active->state.totalSize);

  transport_.release();
  ASSERT_TRUE(reaches(manager, id, JobStatus::kFinish));

  auto done = manager.get(id);
  EXPECT_EQ(done->state.bytesTransferred, done->state.totalSize);
  EXPECT_TRUE(done->state.endTime.has_value());
  EXPECT_EQ(std::filesystem::file_size(done->destination), body.size());
  EXPECT_EQ(readFile(done->destination), body);
}

TEST_F(JobManagerTest, ProgressIsMonotonic) {
  const std::string body = makeBody(50000);
  transport_.serve("http://host/big", servesBytes(body, 100));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/big");
  uint64_t last = 0;
  JobStatus previous = JobStatus::kInitiate;
  ASSERT_TRUE(waitFor([&] {
    auto record = manager.get(id);
    EXPECT_TRUE(record.has_value());
    if (!record) return true;
    EXPECT_GE(record->state.bytesTransferred, last);
    if (record->state.totalSize != 0) {
      EXPECT_LE(record->state.bytesTransferred, record->state.totalSize);
    }
    if (previous != JobStatus::kInitiate) {
      EXPECT_NE(record->state.status, JobStatus::kInitiate);
    }
    last = record->state.bytesTransferred;
    previous = record->state.status;
    return isTerminal(record->state.status);
  }));
  EXPECT_EQ(previous, JobStatus::kFinish);
}

TEST_F(JobManagerTest, MissingFileEndsInError) {
  transport_.serve("http://host/missing-file", notFound());
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/missing-file");
  ASSERT_TRUE(reaches(manager, id, JobStatus::kError));

  auto record = manager.get(id);
  ASSERT_TRUE(record->state.error.has_value());
  EXPECT_FALSE(record->state.error->empty());
  EXPECT_EQ(record->state.httpStatus, 404);
  EXPECT_EQ(readFile(record->destination), "");
}

TEST_F(JobManagerTest, OneBadSourceDoesNotAffectOthers) {
  const std::string body = makeBody(5000);
  const int kJobs = 8;
  std::vector<std::string> urls;
  for (int i = 0; i < kJobs; ++i) {
    urls.push_back("http://host/file-" + std::to_string(i));
    transport_.serve(urls.back(), servesBytes(body, 250));
  }
  urls[3] = "http://host/404";
  transport_.serve(urls[3], notFound());

  JobManager manager(transport_, store_, options());
  manager.start();

  std::vector<JobId> ids;
  for (const auto& url : urls) ids.push_back(manager.add(url));

  ASSERT_TRUE(waitFor([&] {
    for (const auto& record : manager.list()) {
      if (!isTerminal(record.state.status)) return false;
    }
    return true;
  }));

  auto records = manager.list();
  ASSERT_EQ(records.size(), static_cast<size_t>(kJobs));
  for (int i = 0; i < kJobs; ++i) {
    auto record = manager.get(ids[i]);
    ASSERT_TRUE(record.has_value());
    if (i == 3) {
      EXPECT_EQ(record->state.status, JobStatus::kError);
    } else {
      EXPECT_EQ(record->state.status, JobStatus::kFinish);
      EXPECT_EQ(record->state.bytesTransferred, body.size());
    }
  }
}

TEST_F(JobManagerTest, RemoveUnknownIsNotFound) {
  transport_.serve("http://host/a", servesBytes("abc", 1));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/a");
  const size_t before = manager.list().size();
  EXPECT_FALSE(manager.remove("no-such-job"));
  EXPECT_EQ(manager.list().size(), before);
  EXPECT_TRUE(manager.get(id).has_value());
  EXPECT_FALSE(manager.get("no-such-job").has_value());
}

TEST_F(JobManagerTest, RemoveActiveJobStopsWorker) {
  transport_.serve("http://host/slow", held(makeBody(1000), 100, 3));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/slow");
  ASSERT_TRUE(waitFor([&] {
    auto record = manager.get(id);
    return record && record->state.bytesTransferred == 200;
  }));
  const WorkerHandle worker = manager.get(id)->worker;
  const auto destination = manager.get(id)->destination;
  EXPECT_TRUE(manager.supervisor().isLive(worker));

  EXPECT_TRUE(manager.remove(id));
  EXPECT_FALSE(manager.supervisor().isLive(worker));
  EXPECT_FALSE(manager.get(id).has_value());
  EXPECT_TRUE(waitFor([&] { return !std::filesystem::exists(destination); }));
  EXPECT_FALSE(manager.remove(id));

  // A late termination notice must not resurrect the record.
  manager.reconcileNow();
  EXPECT_FALSE(manager.get(id).has_value());
  EXPECT_TRUE(manager.list().empty());
}

TEST_F(JobManagerTest, RemoveFinishedJobDeletesFile) {
  transport_.serve("http://host/a", servesBytes("abcdef", 2));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/a");
  ASSERT_TRUE(reaches(manager, id, JobStatus::kFinish));
  const auto destination = manager.get(id)->destination;
  ASSERT_TRUE(std::filesystem::exists(destination));

  EXPECT_TRUE(manager.remove(id));
  EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(JobManagerTest, TerminalRecordsAreLeftAlone) {
  transport_.serve("http://host/a", servesBytes("abcdef", 2));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/a");
  ASSERT_TRUE(reaches(manager, id, JobStatus::kFinish));
  auto before = manager.get(id);

  for (int i = 0; i < 5; ++i) manager.reconcileNow();
  std::this_thread::sleep_for(100ms);

  auto after = manager.get(id);
  EXPECT_EQ(after->state.status, JobStatus::kFinish);
  EXPECT_EQ(after->state.bytesTransferred, before->state.bytesTransferred);
  EXPECT_TRUE(after->state.endTime == before->state.endTime);
  EXPECT_FALSE(after->state.error.has_value());
}

TEST_F(JobManagerTest, StopCancelsRunningWorkers) {
  transport_.serve("http://host/slow", held(makeBody(1000), 100, 2));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/slow");
  ASSERT_TRUE(reaches(manager, id, JobStatus::kActive));

  manager.stop();
  EXPECT_EQ(manager.supervisor().liveCount(), 0u);
  EXPECT_THROW(manager.add("http://host/slow"), JobError);
  EXPECT_THROW(manager.get(id), JobError);
}

TEST_F(JobManagerTest, NotStartedRejectsCalls) {
  JobManager manager(transport_, store_, options());
  EXPECT_THROW(manager.list(), JobError);
}

TEST_F(JobManagerTest, RemoveDoesNotWaitForBlockedWorker) {
  transport_.serve("http://host/a", servesBytes(makeBody(1000), 100));
  JobManager manager(transport_, store_, options());
  manager.start();

  store_.blockWrites();
  JobId id = manager.add("http://host/a");
  ASSERT_TRUE(waitFor([&] { return store_.parkedWriters() == 1; }));
  const auto destination = dir_.path() / id;
  const WorkerHandle worker = manager.get(id)->worker;

  auto begin = std::chrono::steady_clock::now();
  EXPECT_TRUE(manager.remove(id));
  EXPECT_TRUE(manager.list().empty());
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - begin)
                     .count();
  EXPECT_LT(elapsed, 500);

  // Still the worker's file until its write returns.
  EXPECT_TRUE(std::filesystem::exists(destination));
  EXPECT_FALSE(manager.supervisor().isLive(worker));

  store_.unblock();
  EXPECT_TRUE(waitFor([&] { return !std::filesystem::exists(destination); }));
  EXPECT_FALSE(manager.get(id).has_value());
}

TEST_F(JobManagerTest, UnresponsiveWorkerIsMarkedLost) {
  transport_.serve("http://host/slow", held(makeBody(1000), 100, 3));
  JobManager manager(transport_, store_, options());
  manager.start();

  JobId id = manager.add("http://host/slow");
  ASSERT_TRUE(waitFor([&] {
    auto record = manager.get(id);
    return record && record->state.bytesTransferred == 200;
  }));
  const WorkerHandle worker = manager.get(id)->worker;

  // Holding the worker's state makes its status queries time out.
  std::atomic<bool> inside{false};
  std::atomic<bool> done{false};
  std::thread holder([&] {
    manager.supervisor().inspect(worker, [&](const DownloadState&) {
      inside = true;
      waitFor([&] { return done.load(); }, 3s);
    });
  });
  bool lost = waitFor([&] { return statusOf(manager, id) == JobStatus::kError; });
  done = true;
  holder.join();

  ASSERT_TRUE(inside.load());
  ASSERT_TRUE(lost);
  auto record = manager.get(id);
  ASSERT_TRUE(record->state.error.has_value());
  EXPECT_NE(record->state.error->find("lost contact"), std::string::npos);
  EXPECT_TRUE(record->state.endTime.has_value());
  EXPECT_FALSE(manager.supervisor().isLive(worker));

  // The cancelled worker's own notice comes later and changes nothing.
  ASSERT_TRUE(waitFor([&] { return manager.supervisor().liveCount() == 0; }));
  manager.reconcileNow();
  record = manager.get(id);
  EXPECT_EQ(record->state.status, JobStatus::kError);
  EXPECT_NE(record->state.error->find("lost contact"), std::string::npos);
}

TEST_F(JobManagerTest, TerminationNoticeWinsOverLostContact) {
  ManagerOptions opts = options();
  opts.reconcileInterval = std::chrono::hours(1);
  opts.statusTimeout = 2s;
  transport_.serve("http://host/a", held(makeBody(100), 10, 3));
  transport_.serve("http://host/b", held(makeBody(100), 10, 3));
  JobManager manager(transport_, store_, opts);
  manager.start();

  JobId a = manager.add("http://host/a");
  JobId b = manager.add("http://host/b");
  ASSERT_TRUE(reaches(manager, a, JobStatus::kActive));
  ASSERT_TRUE(reaches(manager, b, JobStatus::kActive));
  const WorkerHandle workerA = manager.get(a)->worker;
  const WorkerHandle workerB = manager.get(b)->worker;

  // Stall one pass on b, queue a second pass behind it, then let a finish:
  // a's notice lands after the second pass, which finds a gone.
  std::atomic<bool> inside{false};
  std::atomic<bool> done{false};
  std::thread holder([&] {
    manager.supervisor().inspect(workerB, [&](const DownloadState&) {
      inside = true;
      waitFor([&] { return done.load(); }, 3s);
    });
  });
  bool entered = waitFor([&] { return inside.load(); });
  std::thread first([&] { manager.reconcileNow(); });
  std::this_thread::sleep_for(50ms);
  std::thread second([&] { manager.reconcileNow(); });
  std::this_thread::sleep_for(50ms);

  transport_.release();
  bool exited =
      waitFor([&] { return !manager.supervisor().isLive(workerA); });
  done = true;
  holder.join();
  first.join();
  second.join();

  ASSERT_TRUE(entered);
  ASSERT_TRUE(exited);
  auto record = manager.get(a);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state.status, JobStatus::kFinish);
  EXPECT_FALSE(record->state.error.has_value());
  EXPECT_EQ(record->state.bytesTransferred, 100u);
}
