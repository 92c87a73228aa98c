#include "internal/manifest/partitioner.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = sitepull::core::v1;
using sitepull::manifest::PartitionManifest;
using sitepull::manifest::PartitionOptions;

v1::ManifestEntry Entry(const std::string& path, std::uint64_t size) {
  v1::ManifestEntry entry;
  entry.set_path(path);
  entry.set_size(size);
  return entry;
}

PartitionOptions SmallCaps() {
  PartitionOptions options;
  options.large_threshold = 100;
  options.batch_byte_cap  = 50;
  options.batch_count_cap = 3;
  return options;
}

void TestEmptyManifest() {
  const auto partition = PartitionManifest({}, SmallCaps());
  assert(partition.large.empty());
  assert(partition.batches.empty());
  assert(partition.total_files == 0);
}

void TestLargeFilesStandAlone() {
  const auto partition = PartitionManifest({Entry("a", 10), Entry("huge", 101), Entry("b", 10), Entry("edge", 100)}, SmallCaps());

  assert(partition.large.size() == 1);
  assert(partition.large[0].path == "huge");
  // at the threshold is still batched
  assert(partition.batches.size() == 2);
  assert(partition.total_files == 4);
  assert(partition.total_bytes == 221);
}

void TestBatchesCloseOnEitherCap() {
  // count cap: 3 files per batch
  auto partition = PartitionManifest({Entry("1", 1), Entry("2", 1), Entry("3", 1), Entry("4", 1)}, SmallCaps());
  assert(partition.batches.size() == 2);
  assert(partition.batches[0].files.size() == 3);
  assert(partition.batches[1].files[0].path == "4");

  // byte cap: 30 + 30 > 50
  partition = PartitionManifest({Entry("x", 30), Entry("y", 30), Entry("z", 20)}, SmallCaps());
  assert(partition.batches.size() == 2);
  assert(partition.batches[0].total_bytes == 30);
  assert(partition.batches[1].total_bytes == 50);

  // a file above the byte cap but under the large threshold still gets a batch of its own
  partition = PartitionManifest({Entry("big", 80), Entry("small", 1)}, SmallCaps());
  assert(partition.batches.size() == 2);
  assert(partition.batches[0].files.size() == 1);
  assert(partition.batches[0].total_bytes == 80);
}

void TestEveryFileAppearsOnceInOrder() {
  std::vector<v1::ManifestEntry> entries;
  for (int i = 0; i < 40; ++i) {
    entries.push_back(Entry("f" + std::to_string(i), static_cast<std::uint64_t>((i * 37) % 130)));
  }

  const auto partition = PartitionManifest(entries, SmallCaps());

  std::vector<std::string> batched;
  for (const auto& batch : partition.batches) {
    assert(!batch.files.empty());
    assert(batch.files.size() <= 3);
    std::uint64_t bytes = 0;
    for (const auto& file : batch.files) {
      bytes += file.size;
      batched.push_back(file.path);
    }
    assert(bytes == batch.total_bytes);
    assert(batch.files.size() == 1 || batch.total_bytes <= 50);
  }

  std::vector<std::string> expected;
  for (const auto& entry : entries) {
    if (entry.size() <= 100) expected.push_back(entry.path());
  }
  assert(batched == expected);
  assert(partition.large.size() + batched.size() == entries.size());

  // deterministic
  const auto again = PartitionManifest(entries, SmallCaps());
  assert(again.batches.size() == partition.batches.size());
  assert(again.large.size() == partition.large.size());
}

void TestCountCapSplitsThousandsOfSmallFiles() {
  std::vector<v1::ManifestEntry> entries;
  for (int i = 0; i < 2100; ++i) {
    entries.push_back(Entry("uploads/img" + std::to_string(i) + ".jpg", 1024));
  }

  PartitionOptions options;
  options.large_threshold = 10 * 1024 * 1024;
  options.batch_byte_cap  = 1024ull * 1024 * 1024;
  options.batch_count_cap = 2000;

  const auto partition = PartitionManifest(entries, options);
  assert(partition.large.empty());
  assert(partition.batches.size() == 2);
  assert(partition.batches[0].files.size() == 2000);
  assert(partition.batches[1].files.size() == 100);
  assert(partition.batches[1].files.front().path == "uploads/img2000.jpg");
  assert(partition.total_files == 2100);
}

void TestZeroCapsAreRejected() {
  auto options            = SmallCaps();
  options.batch_count_cap = 0;

  bool threw = false;
  try {
    (void)PartitionManifest({Entry("a", 1)}, options);
  } catch (const sitepull::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyManifest();
  TestLargeFilesStandAlone();
  TestBatchesCloseOnEitherCap();
  TestEveryFileAppearsOnceInOrder();
  TestCountCapSplitsThousandsOfSmallFiles();
  TestZeroCapsAreRejected();

  std::cout << "sitepull_unit_partitioner: pass\n";
  return 0;
}
