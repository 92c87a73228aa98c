#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/jobs/database_job_store.hpp"
#include "internal/jobs/expiry_worker.hpp"
#include "internal/jobs/manifest_job_store.hpp"
#include "internal/util/errors.hpp"
#include "support/temp_dir.hpp"

namespace {

namespace fs = std::filesystem;
namespace v1 = sitepull::core::v1;
using sitepull::db::ErrorCode;
using sitepull::db::KeyValueStore;
using sitepull::jobs::JobStoreOptions;
using sitepull::jobs::ManifestJobStore;
using namespace std::chrono_literals;

using StoreFactory = std::function<std::shared_ptr<KeyValueStore>(const fs::path&, std::uint64_t)>;

std::shared_ptr<KeyValueStore> MemoryStore(const fs::path&, std::uint64_t max_value_bytes) {
  return std::make_shared<sitepull::db::memory::MemoryKeyValueStore>(max_value_bytes);
}

std::shared_ptr<KeyValueStore> SqliteStore(const fs::path& dir, std::uint64_t max_value_bytes) {
  auto db = std::make_shared<sitepull::db::sqlite::SqliteDB>((dir / "jobs.db").string());
  sitepull::db::sqlite::SqliteKeyValueStore::BootstrapSchema(*db);
  return std::make_shared<sitepull::db::sqlite::SqliteKeyValueStore>(db, max_value_bytes);
}

std::vector<v1::ManifestEntry> Entries(int count) {
  std::vector<v1::ManifestEntry> entries;
  for (int i = 0; i < count; ++i) {
    v1::ManifestEntry entry;
    entry.set_path("dir/file" + std::to_string(i) + ".html");
    entry.set_size(static_cast<std::uint64_t>(i + 1));
    entries.push_back(std::move(entry));
  }
  return entries;
}

void TestKeyValueBasics(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-kv");
  auto                       kv = make(dir.Path(), 8);

  assert(kv->Put("a", "1234", 1min));
  assert(kv->Get("a") == std::optional<std::string>("1234"));
  assert(!kv->Get("missing"));

  const auto too_large = kv->Put("b", "123456789", 1min);
  assert(!too_large);
  assert(too_large.code == ErrorCode::ValueTooLarge);

  // all or nothing
  assert(!kv->PutMany({{"c", "ok"}, {"d", "far too large"}}, 1min));
  assert(!kv->Get("c"));

  assert(kv->Delete("a"));
  assert(!kv->Get("a"));
  assert(kv->Delete("never-there"));
}

void TestExpiredEntriesAreInvisible(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-kv");
  auto                       kv = make(dir.Path(), 1024);

  assert(kv->Put("gone", "x", 0ms));
  assert(kv->Put("kept", "y", 1h));
  assert(!kv->Get("gone"));
  assert(kv->PurgeExpired() <= 1);
  assert(kv->Get("kept") == std::optional<std::string>("y"));
}

void TestManifestChunking(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  ManifestJobStore           store(make(dir.Path(), 1 << 20), JobStoreOptions{1h, 4});

  const auto entries = Entries(10);
  const auto meta    = store.Save("job1", entries);
  assert(meta.total_files() == 10);
  assert(meta.total_bytes() == 55);
  assert(meta.chunk_count() == 3);

  const auto job = store.Load("job1");
  assert(job);
  assert(job->entries.size() == 10);
  for (int i = 0; i < 10; ++i) {
    assert(job->entries[static_cast<std::size_t>(i)].path() == entries[static_cast<std::size_t>(i)].path());
  }

  // window spanning chunk 0 and 1
  auto page = store.LoadPage("job1", 3, 3);
  assert(page);
  assert(page->entries.size() == 3);
  assert(page->entries[0].path() == "dir/file3.html");
  assert(page->entries[2].path() == "dir/file5.html");

  page = store.LoadPage("job1", 8, 100);
  assert(page && page->entries.size() == 2);
  page = store.LoadPage("job1", 10, 5);
  assert(page && page->entries.empty());

  store.Delete("job1");
  assert(!store.Load("job1"));
  assert(!store.LoadPage("job1", 0, 1));
}

void TestEmptyManifest(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  ManifestJobStore           store(make(dir.Path(), 1 << 20), JobStoreOptions{1h, 4});

  const auto meta = store.Save("empty", {});
  assert(meta.chunk_count() == 0);
  const auto job = store.Load("empty");
  assert(job && job->entries.empty());
}

void TestMissingChunkMakesJobMissing(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  auto                       kv = make(dir.Path(), 1 << 20);
  ManifestJobStore           store(kv, JobStoreOptions{1h, 4});

  store.Save("job2", Entries(9));
  assert(kv->Delete("job_chunk:job2:1"));

  assert(!store.Load("job2"));
  assert(!store.LoadPage("job2", 4, 2));
  // chunk 0 alone is still readable
  assert(store.LoadPage("job2", 0, 2));
}

void TestExpiredManifestIsGone(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  ManifestJobStore           store(make(dir.Path(), 1 << 20), JobStoreOptions{0ms, 4});

  store.Save("job3", Entries(3));
  assert(!store.Load("job3"));
}

void TestLongPathsSplitByValueSize(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  auto                       kv = make(dir.Path(), 1 << 20);
  ManifestJobStore           store(kv, JobStoreOptions{1h, 2000});

  std::vector<v1::ManifestEntry> entries;
  for (int i = 0; i < 2000; ++i) {
    v1::ManifestEntry entry;
    entry.set_path("wp-content/uploads/" + std::string(540, 'p') + "/" + std::to_string(i) + ".jpg");
    entry.set_size(1);
    entries.push_back(std::move(entry));
  }

  const auto meta = store.Save("long", entries);
  assert(meta.chunk_count() >= 2);
  assert(meta.chunk_starts_size() == static_cast<int>(meta.chunk_count()));
  for (std::uint32_t i = 0; i < meta.chunk_count(); ++i) {
    const auto raw = kv->Get("job_chunk:long:" + std::to_string(i));
    assert(raw && raw->size() <= kv->MaxValueBytes());
  }

  const auto job = store.Load("long");
  assert(job && job->entries.size() == 2000);
  assert(job->entries[1999].path() == entries[1999].path());

  // window across the first chunk boundary
  const auto boundary = meta.chunk_starts(1);
  const auto page     = store.LoadPage("long", boundary - 2, 4);
  assert(page && page->entries.size() == 4);
  for (std::uint64_t i = 0; i < 4; ++i) {
    assert(page->entries[i].path() == entries[boundary - 2 + i].path());
  }
}

void TestEntryLargerThanValueLimitIsStorageError(const StoreFactory& make) {
  sitepull::testing::TempDir dir("sitepull-manifest-store");
  ManifestJobStore           store(make(dir.Path(), 16), JobStoreOptions{1h, 100});

  bool threw = false;
  try {
    store.Save("job4", Entries(20));
  } catch (const sitepull::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Load("job4"));
}

void TestDatabaseJobState(const StoreFactory& make) {
  sitepull::testing::TempDir     dir("sitepull-db-job-store");
  sitepull::jobs::DatabaseJobStore store(make(dir.Path(), 1 << 20), 1h);

  v1::DatabaseJobState state;
  state.set_job_id("dbjob1");
  state.set_cursor("token");
  state.set_total_tables(4);
  state.set_bytes_written(100);
  store.Save(state);

  state.set_completed_tables(2);
  state.set_bytes_written(250);
  store.Save(state);

  const auto loaded = store.Load("dbjob1");
  assert(loaded);
  assert(loaded->completed_tables() == 2);
  assert(loaded->bytes_written() == 250);
  assert(loaded->cursor() == "token");

  store.Delete("dbjob1");
  assert(!store.Load("dbjob1"));
}

void TestExpiryWorkerSweepsStaleSpools() {
  sitepull::testing::TempDir dir("sitepull-expiry");
  auto                       kv    = MemoryStore(dir.Path(), 1024);
  const auto                 spool = dir.Path() / "spool";

  sitepull::testing::WriteFile(spool / "old.sql", "-- old");
  sitepull::testing::WriteFile(spool / "fresh.sql", "-- fresh");
  sitepull::testing::WriteFile(spool / "notes.txt", "keep");
  fs::last_write_time(spool / "old.sql", fs::file_time_type::clock::now() - 2h);
  fs::last_write_time(spool / "notes.txt", fs::file_time_type::clock::now() - 2h);

  assert(kv->Put("stale", "x", 0ms));

  sitepull::jobs::ExpiryWorker worker(kv, spool, 1h, 1h);
  worker.SweepOnce();

  assert(!fs::exists(spool / "old.sql"));
  assert(fs::exists(spool / "fresh.sql"));
  assert(fs::exists(spool / "notes.txt"));

  // Start/Stop with a long interval returns promptly
  worker.Start();
  worker.Stop();
}

void RunBackend(const StoreFactory& make) {
  TestKeyValueBasics(make);
  TestExpiredEntriesAreInvisible(make);
  TestManifestChunking(make);
  TestEmptyManifest(make);
  TestMissingChunkMakesJobMissing(make);
  TestExpiredManifestIsGone(make);
  TestLongPathsSplitByValueSize(make);
  TestEntryLargerThanValueLimitIsStorageError(make);
  TestDatabaseJobState(make);
}

} // namespace

int main() {
  RunBackend(MemoryStore);
  RunBackend(SqliteStore);
  TestExpiryWorkerSweepsStaleSpools();

  std::cout << "sitepull_unit_job_store: pass\n";
  return 0;
}
