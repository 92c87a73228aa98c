#include "internal/transfer/retrieval_engine.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/transfer/file_sink.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

namespace {

namespace fs = std::filesystem;
using sitepull::manifest::FileDescriptor;
using sitepull::testing::FakeTransport;
using sitepull::testing::ReadFile;
using sitepull::testing::TempDir;
using sitepull::transfer::RetrievalEngine;
using sitepull::transfer::RetrievalOptions;
using sitepull::transfer::RetrievalUnit;
using namespace std::chrono_literals;

RetrievalOptions FastRetries(std::uint32_t concurrency = 4) {
  RetrievalOptions options;
  options.concurrency   = concurrency;
  options.max_attempts  = 3;
  options.retry_backoff = 1ms;
  return options;
}

RetrievalUnit Batch(std::vector<std::string> paths, const FakeTransport& transport) {
  RetrievalUnit unit;
  unit.kind = RetrievalUnit::Kind::kBatch;
  for (auto& path : paths) {
    const auto it   = transport.files.find(path);
    const auto size = it == transport.files.end() ? 0 : it->second.size();
    unit.files.push_back(FileDescriptor{path, size});
    unit.total_bytes += size;
  }
  return unit;
}

RetrievalUnit Large(const std::string& path, const FakeTransport& transport) {
  auto unit = Batch({path}, transport);
  unit.kind = RetrievalUnit::Kind::kLargeFile;
  return unit;
}

bool NoPartFiles(const fs::path& root) {
  for (const auto& entry : fs::recursive_directory_iterator(root)) {
    if (entry.path().extension() == ".part") return false;
  }
  return true;
}

void TestBuildUnitsPutsLargeFilesFirst() {
  sitepull::manifest::Partition partition;
  partition.batches.push_back(sitepull::manifest::Batch{{{"a", 1}, {"b", 2}}, 3});
  partition.large.push_back({"big1", 100});
  partition.large.push_back({"big2", 200});

  const auto units = sitepull::transfer::BuildUnits(partition);
  assert(units.size() == 3);
  assert(units[0].kind == RetrievalUnit::Kind::kLargeFile);
  assert(units[0].files[0].path == "big1");
  assert(units[1].files[0].path == "big2");
  assert(units[2].kind == RetrievalUnit::Kind::kBatch);
  assert(units[2].total_bytes == 3);
}

void TestAllFilesLandIntact() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {
      {"index.php", "<?php echo 'hi';"},
      {"wp-content/uploads/2024/a.jpg", std::string(100, 'a')},
      {"wp-content/uploads/2024/b.jpg", std::string(37, 'b')},
      {"empty.txt", ""},
      {"big.zip", std::string(1000, 'z')},
  };

  std::vector<RetrievalUnit> units;
  units.push_back(Large("big.zip", *transport));
  units.push_back(Batch({"index.php", "empty.txt"}, *transport));
  units.push_back(Batch({"wp-content/uploads/2024/a.jpg", "wp-content/uploads/2024/b.jpg"}, *transport));

  sitepull::transfer::ProgressAggregator progress;
  std::atomic<std::uint64_t>             streamed{0};
  RetrievalEngine                        engine(transport, FastRetries(), &progress);

  const auto result = engine.Retrieve(units, dir.Path(), [&](std::uint64_t bytes) { streamed += bytes; });

  assert(result.files_succeeded == 5);
  assert(result.files_failed == 0);
  assert(result.units_succeeded == 3);
  assert(result.units_failed == 0);
  assert(result.bytes_transferred == 1000 + 16 + 100 + 37);
  assert(streamed == result.bytes_transferred);
  assert(progress.Snapshot().files_completed == 5);

  for (const auto& [path, content] : transport->files) {
    assert(fs::exists(dir.Path() / path));
    assert(ReadFile(dir.Path() / path) == content);
  }
  assert(NoPartFiles(dir.Path()));
  assert(transport->fetch_file_calls == 1);
  assert(transport->fetch_batch_calls == 2);
}

void TestTransientFailuresAreRetried() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"a.txt", "aaaaaa"}, {"b.txt", "bbbbbbbb"}, {"c.txt", "cccc"}, {"large.bin", std::string(50, 'L')}};
  transport->transient_failures["b.txt"]     = 1;
  transport->transient_failures["large.bin"] = 2;

  RetrievalEngine engine(transport, FastRetries(2));
  const auto      result = engine.Retrieve({Batch({"a.txt", "b.txt", "c.txt"}, *transport), Large("large.bin", *transport)}, dir.Path());

  assert(result.files_succeeded == 4);
  assert(result.files_failed == 0);
  // a.txt settled on the first attempt and is counted once
  assert(result.bytes_transferred == 6 + 8 + 4 + 50);
  assert(ReadFile(dir.Path() / "b.txt") == "bbbbbbbb");
  assert(ReadFile(dir.Path() / "large.bin") == std::string(50, 'L'));
  assert(transport->fetch_batch_calls == 2);
  assert(transport->fetch_file_calls == 3);
  assert(NoPartFiles(dir.Path()));
}

void TestProgressCountsCommittedFilesOnly() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"blank-1.txt", ""}, {"blank-2.txt", ""}, {"retried.txt", "rrrrrrrrrr"}, {"retried.bin", std::string(40, 'R')}};
  transport->transient_failures["retried.txt"] = 1;
  transport->transient_failures["retried.bin"] = 2;

  std::atomic<std::uint64_t> streamed{0};
  std::atomic<int>           calls{0};
  RetrievalEngine            engine(transport, FastRetries(1));

  // a batch of empty files still reports each one
  auto result = engine.Retrieve({Batch({"blank-1.txt", "blank-2.txt"}, *transport)}, dir.Path(), [&](std::uint64_t bytes) {
    streamed += bytes;
    ++calls;
  });
  assert(result.files_succeeded == 2);
  assert(calls == 2);
  assert(streamed == 0);

  // the partial data of broken attempts is not reported
  calls    = 0;
  streamed = 0;
  result   = engine.Retrieve({Batch({"retried.txt"}, *transport), Large("retried.bin", *transport)}, dir.Path(), [&](std::uint64_t bytes) {
    streamed += bytes;
    ++calls;
  });
  assert(result.files_succeeded == 2);
  assert(result.bytes_transferred == 10 + 40);
  assert(streamed == result.bytes_transferred);
  assert(calls == 2);
}

void TestRetriesAreBounded() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"flaky.bin", "0123456789"}, {"ok.txt", "fine"}};
  transport->transient_failures["flaky.bin"] = 10;

  RetrievalEngine engine(transport, FastRetries());
  const auto      result = engine.Retrieve({Large("flaky.bin", *transport), Batch({"ok.txt"}, *transport)}, dir.Path());

  assert(transport->fetch_file_calls == 3);
  assert(result.files_failed == 1);
  assert(result.files_succeeded == 1);
  assert(result.units_failed == 1);
  assert(result.units_succeeded == 1);
  assert(!fs::exists(dir.Path() / "flaky.bin"));
  assert(fs::exists(dir.Path() / "ok.txt"));
  assert(NoPartFiles(dir.Path()));
}

void TestErrorFramesFailOnlyThatFile() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"keep.txt", "keep"}, {"locked.txt", "secret"}};
  transport->unreadable.insert("locked.txt");

  RetrievalEngine engine(transport, FastRetries());
  const auto      result = engine.Retrieve({Batch({"locked.txt", "keep.txt"}, *transport)}, dir.Path());

  assert(result.files_failed == 1);
  assert(result.files_succeeded == 1);
  assert(result.units_failed == 1);
  // no retry for a file the server reported as unreadable
  assert(transport->fetch_batch_calls == 1);
  assert(!fs::exists(dir.Path() / "locked.txt"));
  assert(ReadFile(dir.Path() / "keep.txt") == "keep");
}

void TestNonRetryableFailureStopsAtOnce() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"a.txt", "a"}, {"b.txt", "b"}};
  transport->permission_denied = true;

  RetrievalEngine engine(transport, FastRetries());
  const auto      result = engine.Retrieve({Batch({"a.txt", "b.txt"}, *transport)}, dir.Path());

  assert(result.files_failed == 2);
  assert(result.units_failed == 1);
  assert(transport->fetch_batch_calls == 1);
}

void TestEscapingPathsAreNeverFetched() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"../outside.txt", "evil"}, {"good.txt", "good"}, {"/etc/passwd", "root"}};

  RetrievalEngine engine(transport, FastRetries());
  const auto      result = engine.Retrieve(
      {Batch({"../outside.txt", "good.txt"}, *transport), Large("/etc/passwd", *transport), Batch({"good.txt"}, *transport)},
      dir.Path());

  // the unit with a bad path fails as a whole before any request
  assert(result.files_failed == 3);
  assert(result.files_succeeded == 1);
  assert(transport->fetch_file_calls == 0);
  assert(transport->fetch_batch_calls == 1);
  assert(ReadFile(dir.Path() / "good.txt") == "good");
}

void TestConcurrencyIsClamped() {
  TempDir dir("sitepull-retrieval");
  auto    transport = std::make_shared<FakeTransport>();
  transport->files  = {{"x", "1"}, {"y", "2"}};

  // zero workers still runs one
  RetrievalEngine engine(transport, FastRetries(0));
  auto            result = engine.Retrieve({Batch({"x"}, *transport), Batch({"y"}, *transport)}, dir.Path());
  assert(result.files_succeeded == 2);

  RetrievalEngine wide(transport, FastRetries(64));
  TempDir         other("sitepull-retrieval");
  result = wide.Retrieve({Batch({"x", "y"}, *transport)}, other.Path());
  assert(result.files_succeeded == 2);

  result = wide.Retrieve({}, other.Path());
  assert(result == sitepull::transfer::TransferResult{});
}

void TestFileSinkDiscardsUncommittedData() {
  TempDir dir("sitepull-retrieval");
  {
    sitepull::transfer::FileSink sink(dir.Path(), "nested/dir/file.txt");
    sink.Write("partial");
    assert(fs::exists(dir.Path() / "nested/dir/file.txt.part"));
  }
  assert(!fs::exists(dir.Path() / "nested/dir/file.txt.part"));
  assert(!fs::exists(dir.Path() / "nested/dir/file.txt"));

  {
    sitepull::transfer::FileSink sink(dir.Path(), "nested/done.txt");
    sink.Write("all ");
    sink.Write("there");
    sink.Commit();
    assert(sink.BytesWritten() == 9);
  }
  assert(ReadFile(dir.Path() / "nested/done.txt") == "all there");

  bool threw = false;
  try {
    sitepull::transfer::FileSink sink(dir.Path(), "../escape.txt");
  } catch (const sitepull::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildUnitsPutsLargeFilesFirst();
  TestAllFilesLandIntact();
  TestTransientFailuresAreRetried();
  TestProgressCountsCommittedFilesOnly();
  TestRetriesAreBounded();
  TestErrorFramesFailOnlyThatFile();
  TestNonRetryableFailureStopsAtOnce();
  TestEscapingPathsAreNeverFetched();
  TestConcurrencyIsClamped();
  TestFileSinkDiscardsUncommittedData();

  std::cout << "sitepull_unit_retrieval_engine: pass\n";
  return 0;
}
