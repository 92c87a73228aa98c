#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/kv_store.hpp"
#include "sitepull/core/v1/jobs.pb.h"
#include "sitepull/core/v1/types.pb.h"

namespace sitepull::jobs {

struct ManifestJob {
  std::string                                    job_id;
  sitepull::core::v1::ManifestJobMeta            meta;
  std::vector<sitepull::core::v1::ManifestEntry> entries;
};

struct JobStoreOptions {
  std::chrono::milliseconds ttl               = std::chrono::minutes(15);
  std::uint32_t             entries_per_chunk = 2000;
};

/*
  Manifest persistence over a TTL key/value store.

  Keys:
    job_meta:<id>         ManifestJobMeta
    job_chunk:<id>:<n>    ManifestChunk, n in [0, chunk_count)

  A chunk closes at entries_per_chunk entries or when the next entry
  would take it past the store's MaxValueBytes().

  Chunks are written before the metadata record, so a reader that finds
  the metadata finds every chunk unless one expired or was deleted, in
  which case Load reports the whole job as missing.
*/
class ManifestJobStore {
 public:
  ManifestJobStore(std::shared_ptr<db::KeyValueStore> kv, JobStoreOptions options);

  // Throws util::StorageError when the backend refuses a write.
  sitepull::core::v1::ManifestJobMeta Save(const std::string& job_id, const std::vector<sitepull::core::v1::ManifestEntry>& entries);

  std::optional<ManifestJob> Load(const std::string& job_id) const;

  // Entries [offset, offset + limit), reading only the chunks they live in.
  std::optional<ManifestJob> LoadPage(const std::string& job_id, std::uint64_t offset, std::uint32_t limit) const;

  void Delete(const std::string& job_id);

 private:
  // Bytes an entry adds to a serialized ManifestChunk.
  static std::uint64_t ChunkFieldBytes(const sitepull::core::v1::ManifestEntry& entry);

  static std::string MetaKey(const std::string& job_id);
  static std::string ChunkKey(const std::string& job_id, std::uint32_t index);

  std::optional<sitepull::core::v1::ManifestJobMeta> LoadMeta(const std::string& job_id) const;
  bool AppendChunk(const std::string& job_id, std::uint32_t index, std::vector<sitepull::core::v1::ManifestEntry>* out) const;

  std::shared_ptr<db::KeyValueStore> kv_;
  JobStoreOptions                    options_;
};

} // namespace sitepull::jobs
