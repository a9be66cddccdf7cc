#include <gtest/gtest.h>

#include "errors.hpp"
#include "logging.hpp"
#include "memory.hpp"
#include "repair.hpp"

#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>
#include <unistd.h>

using namespace mender;

namespace {

// Serves section downloads from memory, or never completes them when stalled.
class FakeSectionDownloader : public SectionDownloader {
public:
  std::shared_ptr<PendingDownload> start(const RenterFile &, uint64_t offset,
                                         uint64_t length) override {
    calls++;
    if (fail_start)
      return nullptr;
    auto d = std::make_shared<PendingDownload>();
    if (!stall) {
      std::vector<uint8_t> data;
      if (offset + length <= contents.size())
        data.assign(contents.begin() + offset,
                    contents.begin() + offset + length);
      d->finish(std::move(data), error);
    }
    pending.push_back(d);
    return d;
  }

  std::vector<uint8_t> contents;
  std::error_code error;
  bool stall{false};
  bool fail_start{false};
  int calls{0};
  std::vector<std::shared_ptr<PendingDownload>> pending;
};

class RecordingWorker : public RepairWorker {
public:
  void queue_chunk_repair(std::shared_ptr<UnfinishedChunk> chunk) override {
    std::lock_guard<std::mutex> lk(mtx);
    queued.push_back(std::move(chunk));
  }
  std::mutex mtx;
  std::vector<std::shared_ptr<UnfinishedChunk>> queued;
};

class CountingMemory : public MemoryAccountant {
public:
  void credit(uint64_t bytes) override { credited += bytes; }
  std::atomic<uint64_t> credited{0};
};

// Produces fewer pieces than the chunk has slots for.
class ShortCoder : public ErasureCoder {
public:
  size_t num_pieces() const override { return 2; }
  size_t min_pieces() const override { return 1; }
  size_t shard_size(size_t data_len) const override { return data_len; }
  bool encode(const std::vector<uint8_t> &data, Shards &shards) const override {
    shards.assign(2, data);
    return true;
  }
  std::optional<std::vector<uint8_t>> recover(const Shards &,
                                              const std::vector<bool> &,
                                              size_t) const override {
    return std::nullopt;
  }
};

// Rejects every input.
class FailingCoder : public ErasureCoder {
public:
  size_t num_pieces() const override { return 10; }
  size_t min_pieces() const override { return 6; }
  size_t shard_size(size_t data_len) const override { return data_len; }
  bool encode(const std::vector<uint8_t> &, Shards &) const override {
    return false;
  }
  std::optional<std::vector<uint8_t>> recover(const Shards &,
                                              const std::vector<bool> &,
                                              size_t) const override {
    return std::nullopt;
  }
};

std::string read_all(std::FILE *f) {
  std::rewind(f);
  std::string text;
  char buf[256];
  while (std::fgets(buf, sizeof(buf), f))
    text += buf;
  return text;
}

std::vector<uint8_t> file_bytes(size_t n) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; i++)
    v[i] = (uint8_t)(i % 251);
  return v;
}

class RepairTest : public ::testing::Test {
protected:
  void SetUp() override {
    Logger::instance().set_level(LogLevel::OFF);
    file = std::make_shared<RenterFile>();
    file->name = "movie.mkv";
    file->erasure_code = std::make_shared<ParityCoder>(6, 4);
    contents = file_bytes(64 * 1024);
    downloader.contents = contents;
    for (uint8_t i = 0; i < 3; i++) {
      Hash id{};
      id[0] = i;
      auto w = std::make_shared<RecordingWorker>();
      workers.push_back(w);
      pool.add(id, w);
    }
  }

  void TearDown() override {
    if (!local_path.empty())
      ::unlink(local_path.c_str());
  }

  std::string write_local_copy() {
    char tmpl[] = "/tmp/mender-fileXXXXXX";
    int fd = ::mkstemp(tmpl);
    EXPECT_GE(fd, 0);
    size_t off = 0;
    while (off < contents.size()) {
      ssize_t n = ::write(fd, contents.data() + off, contents.size() - off);
      if (n <= 0)
        break;
      off += (size_t)n;
    }
    ::close(fd);
    local_path = tmpl;
    return local_path;
  }

  std::shared_ptr<UnfinishedChunk> make_chunk(size_t completed) {
    auto c = std::make_shared<UnfinishedChunk>();
    c->renter_file = file;
    c->index = 1;
    c->offset = 4096;
    c->length = 8192;
    c->pieces_needed = 10;
    c->minimum_pieces = 6;
    c->pieces_completed = completed;
    c->piece_usage.assign(10, false);
    return c;
  }

  std::vector<uint8_t> expected_logical(const UnfinishedChunk &c) {
    return std::vector<uint8_t>(contents.begin() + c.offset,
                                contents.begin() + c.offset + c.length);
  }

  std::shared_ptr<RenterFile> file;
  std::vector<uint8_t> contents;
  std::string local_path;
  FakeSectionDownloader downloader;
  CountingMemory memory;
  WorkerPool pool;
  std::vector<std::shared_ptr<RecordingWorker>> workers;
  StopSignal stop;
};

} // namespace

TEST_F(RepairTest, NearlyCompleteChunkStaysLocal) {
  auto c = make_chunk(9);
  EXPECT_FALSE(ChunkRepairer::should_download(*c));
}

TEST_F(RepairTest, DegradedChunkGoesToNetwork) {
  auto c = make_chunk(7);
  EXPECT_TRUE(ChunkRepairer::should_download(*c));
}

TEST_F(RepairTest, NoRedundancyAlwaysDownloadsWhenIncomplete) {
  auto c = make_chunk(5);
  c->pieces_needed = 6;
  EXPECT_TRUE(ChunkRepairer::should_download(*c));
  c->pieces_completed = 6;
  EXPECT_FALSE(ChunkRepairer::should_download(*c));
}

TEST_F(RepairTest, LocalCopyIsReadAtChunkOffset) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(9);
  c->local_path = write_local_copy();
  ASSERT_FALSE(repairer.fetch_logical_data(*c, false));
  EXPECT_EQ(c->logical_chunk_data, expected_logical(*c));
  EXPECT_EQ(downloader.calls, 0);
}

TEST_F(RepairTest, MissingLocalCopyWithoutDownloadFails) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(9);
  EXPECT_EQ(repairer.fetch_logical_data(*c, false), errc::file_not_local);

  c->local_path = "/nonexistent/movie.mkv";
  std::error_code ec = repairer.fetch_logical_data(*c, false);
  EXPECT_EQ(ec, errc::open_failed);
  EXPECT_EQ(classify(ec), error_class::local);
  EXPECT_EQ(downloader.calls, 0);
}

TEST_F(RepairTest, TruncatedLocalCopyFallsBackToDownload) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);
  contents.resize(c->offset + 10);
  c->local_path = write_local_copy();
  contents = downloader.contents;

  ASSERT_FALSE(repairer.fetch_logical_data(*c, true));
  EXPECT_EQ(downloader.calls, 1);
  EXPECT_EQ(c->logical_chunk_data, expected_logical(*c));
}

TEST_F(RepairTest, DownloadErrorIsReturned) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  downloader.error = make_error_code(errc::timed_out);
  auto c = make_chunk(7);
  EXPECT_EQ(repairer.fetch_logical_data(*c, true), errc::timed_out);
  EXPECT_TRUE(c->logical_chunk_data.empty());
}

TEST_F(RepairTest, RefusedDownloadIsReported) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  downloader.fail_start = true;
  auto c = make_chunk(7);
  EXPECT_EQ(repairer.download_logical_data(*c), errc::dial_failed);
}

TEST_F(RepairTest, RepairHandsRemainingPiecesToEveryWorker) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);
  c->piece_usage[0] = true;
  c->piece_usage[3] = true;
  c->piece_usage[8] = true;

  ASSERT_FALSE(repairer.repair_chunk(c));
  EXPECT_EQ(downloader.calls, 1);

  EXPECT_TRUE(c->logical_chunk_data.empty());
  size_t shard = file->erasure_code->shard_size(c->length);
  ASSERT_EQ(c->physical_chunk_data.size(), 10u);
  for (size_t i = 0; i < c->piece_usage.size(); i++) {
    if (c->piece_usage[i])
      EXPECT_TRUE(c->physical_chunk_data[i].empty()) << "slot " << i;
    else
      EXPECT_EQ(c->physical_chunk_data[i].size(), shard) << "slot " << i;
  }

  EXPECT_EQ(memory.credited.load(), c->length + 3 * shard);
  for (const auto &w : workers) {
    ASSERT_EQ(w->queued.size(), 1u);
    EXPECT_EQ(w->queued[0], c);
  }
}

TEST_F(RepairTest, LocalRepairDoesNotTouchNetwork) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(9);
  c->local_path = write_local_copy();
  ASSERT_FALSE(repairer.repair_chunk(c));
  EXPECT_EQ(downloader.calls, 0);
  EXPECT_EQ(memory.credited.load(), c->length);
}

TEST_F(RepairTest, LocalOnlyRepairWithoutLocalCopyLeavesChunkPending) {
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(9);
  EXPECT_EQ(repairer.repair_chunk(c), errc::file_not_local);
  EXPECT_EQ(downloader.calls, 0);
  EXPECT_EQ(memory.credited.load(), 0u);
  for (const auto &w : workers)
    EXPECT_TRUE(w->queued.empty());
}

TEST_F(RepairTest, TooFewShardsIsInternalFault) {
  file->erasure_code = std::make_shared<ShortCoder>();
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);

  std::error_code ec = repairer.repair_chunk(c);
  EXPECT_EQ(ec, errc::pieces_mismatch);
  EXPECT_EQ(classify(ec), error_class::internal);
  EXPECT_EQ(memory.credited.load(), c->length);
  for (const auto &w : workers)
    EXPECT_TRUE(w->queued.empty());
}

TEST_F(RepairTest, EncodeFailureLeavesChunkPending) {
  downloader.contents.clear();
  downloader.contents.resize(1);
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);
  c->length = 0;
  c->offset = 0;

  EXPECT_EQ(repairer.repair_chunk(c), errc::encode_failed);
  EXPECT_TRUE(c->logical_chunk_data.empty());
  for (const auto &w : workers)
    EXPECT_TRUE(w->queued.empty());
}

TEST_F(RepairTest, EncodeFailureReturnsLogicalBytesToBudget) {
  file->erasure_code = std::make_shared<FailingCoder>();
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);

  EXPECT_EQ(repairer.repair_chunk(c), errc::encode_failed);
  EXPECT_EQ(downloader.calls, 1);
  EXPECT_TRUE(c->logical_chunk_data.empty());
  EXPECT_EQ(memory.credited.load(), c->length);
  for (const auto &w : workers)
    EXPECT_TRUE(w->queued.empty());
}

TEST_F(RepairTest, LocalReadFailureLogsOsCause) {
  std::FILE *sink = std::tmpfile();
  ASSERT_NE(sink, nullptr);
  Logger::instance().set_sink(sink);
  Logger::instance().set_level(LogLevel::WARN);

  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(9);
  c->local_path = "/nonexistent/movie.mkv";
  EXPECT_EQ(repairer.fetch_logical_data(*c, false), errc::open_failed);

  Logger::instance().set_level(LogLevel::OFF);
  Logger::instance().set_sink(nullptr);
  std::string text = read_all(sink);
  std::fclose(sink);
  EXPECT_NE(text.find("/nonexistent/movie.mkv"), std::string::npos);
  EXPECT_NE(text.find(std::strerror(ENOENT)), std::string::npos);
  EXPECT_NE(text.find("failed to open file locally"), std::string::npos);
}

TEST_F(RepairTest, ShutdownInterruptsDownloadWaitPromptly) {
  downloader.stall = true;
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);

  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stop.stop();
  });
  auto start = std::chrono::steady_clock::now();
  std::error_code ec = repairer.repair_chunk(c);
  auto elapsed = std::chrono::steady_clock::now() - start;
  stopper.join();

  EXPECT_EQ(ec, errc::interrupted);
  EXPECT_TRUE(is_interruption(ec));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  for (const auto &w : workers)
    EXPECT_TRUE(w->queued.empty());
}

TEST_F(RepairTest, StoppedBeforeStartIsInterruption) {
  downloader.fail_start = true;
  stop.stop();
  ChunkRepairer repairer(downloader, memory, pool, stop);
  auto c = make_chunk(7);
  EXPECT_EQ(repairer.download_logical_data(*c), errc::interrupted);
}

TEST(PendingDownloadTest, FirstFinishWins) {
  PendingDownload d;
  EXPECT_FALSE(d.finished());
  d.finish({1, 2, 3}, {});
  d.finish({}, make_error_code(errc::timed_out));
  EXPECT_TRUE(d.finished());

  std::vector<uint8_t> data;
  EXPECT_FALSE(d.wait(nullptr, data));
  EXPECT_EQ(data.size(), 3u);
}

TEST(PendingDownloadTest, WaitWakesOnFinishFromAnotherThread) {
  PendingDownload d;
  StopSignal stop;
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    d.finish({9}, {});
  });
  std::vector<uint8_t> data;
  EXPECT_FALSE(d.wait(&stop, data));
  t.join();
  EXPECT_EQ(data, std::vector<uint8_t>{9});
}

TEST(MemoryManagerTest, RequestBlocksUntilCredited) {
  MemoryManager mm(100);
  ASSERT_TRUE(mm.request(80, nullptr));
  EXPECT_EQ(mm.available(), 20u);

  std::atomic<bool> granted{false};
  std::thread t([&] { granted = mm.request(50, nullptr); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(granted.load());
  mm.credit(80);
  t.join();
  EXPECT_TRUE(granted.load());
  EXPECT_EQ(mm.available(), 50u);
}

TEST(MemoryManagerTest, StopReleasesWaiter) {
  MemoryManager mm(10);
  ASSERT_TRUE(mm.request(10, nullptr));
  StopSignal stop;
  std::thread t([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.stop();
  });
  EXPECT_FALSE(mm.request(5, &stop));
  t.join();
}

TEST(MemoryManagerTest, OversizedRequestIsRepaidBeforeFreeingBudget) {
  MemoryManager mm(100);
  ASSERT_TRUE(mm.request(150, nullptr));
  EXPECT_EQ(mm.available(), 0u);
  mm.credit(60);
  EXPECT_EQ(mm.available(), 10u);
  mm.credit(90);
  EXPECT_EQ(mm.available(), 100u);
}

TEST(MemoryManagerTest, OvercreditIsClampedToCapacity) {
  MemoryManager mm(100);
  mm.credit(5);
  EXPECT_EQ(mm.available(), 100u);
}

TEST(WorkerPoolTest, MembershipAndSnapshot) {
  WorkerPool pool;
  Hash a{}, b{};
  b[0] = 1;
  pool.add(a, std::make_shared<RecordingWorker>());
  pool.add(b, std::make_shared<RecordingWorker>());
  auto snap = pool.snapshot();
  EXPECT_EQ(snap.size(), 2u);
  EXPECT_TRUE(pool.remove(a));
  EXPECT_FALSE(pool.remove(a));
  EXPECT_EQ(pool.size(), 1u);
  // the snapshot keeps removed workers alive
  EXPECT_EQ(snap.size(), 2u);
}

TEST(StopSignalTest, LateSubscriberRunsImmediately) {
  StopSignal sig;
  int runs = 0;
  {
    StopSubscription sub(&sig, [&] { runs++; });
    sig.stop();
    sig.stop();
  }
  EXPECT_EQ(runs, 1);
  StopSubscription late(&sig, [&] { runs++; });
  EXPECT_EQ(runs, 2);
  EXPECT_TRUE(sig.wait_for(std::chrono::milliseconds(0)));
}

TEST(StopSignalTest, UnsubscribedCallbackNeverRuns) {
  StopSignal sig;
  int runs = 0;
  {
    StopSubscription sub(&sig, [&] { runs++; });
  }
  sig.stop();
  EXPECT_EQ(runs, 0);
}
