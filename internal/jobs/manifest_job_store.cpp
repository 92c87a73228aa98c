#include "internal/jobs/manifest_job_store.hpp"

#include <algorithm>

#include <google/protobuf/io/coded_stream.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sitepull::jobs {

namespace v1 = sitepull::core::v1;

ManifestJobStore::ManifestJobStore(std::shared_ptr<db::KeyValueStore> kv, JobStoreOptions options)
    : kv_(std::move(kv)), options_(options) {
  if (options_.entries_per_chunk == 0) {
    throw util::ValidationError("entries_per_chunk must be positive");
  }
}

std::uint64_t ManifestJobStore::ChunkFieldBytes(const v1::ManifestEntry& entry) {
  // tag byte + length prefix + message
  const auto size = entry.ByteSizeLong();
  return 1 + google::protobuf::io::CodedOutputStream::VarintSize64(size) + size;
}

std::string ManifestJobStore::MetaKey(const std::string& job_id) {
  return "job_meta:" + job_id;
}

std::string ManifestJobStore::ChunkKey(const std::string& job_id, std::uint32_t index) {
  return "job_chunk:" + job_id + ":" + std::to_string(index);
}

v1::ManifestJobMeta ManifestJobStore::Save(const std::string& job_id, const std::vector<v1::ManifestEntry>& entries) {
  v1::ManifestJobMeta meta;
  meta.set_created_at_ms(util::ToUnixMillis(util::Now()));
  meta.set_total_files(entries.size());
  meta.set_entries_per_chunk(options_.entries_per_chunk);

  const auto value_limit = kv_->MaxValueBytes();

  std::vector<db::KeyValueStore::Entry> records;
  v1::ManifestChunk                     chunk;
  std::uint64_t                         chunk_bytes = 0;

  auto close_chunk = [&] {
    records.emplace_back(ChunkKey(job_id, static_cast<std::uint32_t>(records.size())), chunk.SerializeAsString());
    chunk.Clear();
    chunk_bytes = 0;
  };

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto entry_bytes = ChunkFieldBytes(entries[i]);
    if (entry_bytes > value_limit) {
      throw util::StorageError("manifest entry of " + job_id + " exceeds the value size limit: " + entries[i].path());
    }

    const bool count_full = chunk.entries_size() >= static_cast<int>(options_.entries_per_chunk);
    if (chunk.entries_size() > 0 && (count_full || chunk_bytes + entry_bytes > value_limit)) {
      close_chunk();
    }
    if (chunk.entries_size() == 0) meta.add_chunk_starts(i);

    *chunk.add_entries() = entries[i];
    chunk_bytes += entry_bytes;
    meta.set_total_bytes(meta.total_bytes() + entries[i].size());
  }
  if (chunk.entries_size() > 0) close_chunk();
  meta.set_chunk_count(static_cast<std::uint32_t>(records.size()));

  if (auto r = kv_->PutMany(records, options_.ttl); !r) {
    throw util::StorageError("saving manifest chunks of " + job_id + " failed: " + r.message);
  }
  if (auto r = kv_->Put(MetaKey(job_id), meta.SerializeAsString(), options_.ttl); !r) {
    Delete(job_id);
    throw util::StorageError("saving manifest metadata of " + job_id + " failed: " + r.message);
  }
  return meta;
}

std::optional<v1::ManifestJobMeta> ManifestJobStore::LoadMeta(const std::string& job_id) const {
  auto raw_meta = kv_->Get(MetaKey(job_id));
  if (!raw_meta) return std::nullopt;

  v1::ManifestJobMeta meta;
  if (!meta.ParseFromString(*raw_meta) || meta.chunk_starts_size() != static_cast<int>(meta.chunk_count())) {
    SITEPULL_LOG_WARN("corrupt manifest metadata", {observability::StringField("job_id", job_id)});
    return std::nullopt;
  }
  return meta;
}

bool ManifestJobStore::AppendChunk(const std::string& job_id, std::uint32_t index, std::vector<v1::ManifestEntry>* out) const {
  auto              raw_chunk = kv_->Get(ChunkKey(job_id, index));
  v1::ManifestChunk chunk;
  if (!raw_chunk || !chunk.ParseFromString(*raw_chunk)) {
    SITEPULL_LOG_WARN("manifest chunk missing", {observability::StringField("job_id", job_id), observability::IntField("chunk", index)});
    return false;
  }
  for (auto& entry : *chunk.mutable_entries()) {
    out->push_back(std::move(entry));
  }
  return true;
}

std::optional<ManifestJob> ManifestJobStore::Load(const std::string& job_id) const {
  auto meta = LoadMeta(job_id);
  if (!meta) return std::nullopt;

  ManifestJob job{job_id, *meta, {}};
  job.entries.reserve(meta->total_files());
  for (std::uint32_t i = 0; i < meta->chunk_count(); ++i) {
    if (!AppendChunk(job_id, i, &job.entries)) return std::nullopt;
  }

  if (job.entries.size() != meta->total_files()) {
    SITEPULL_LOG_WARN("manifest entry count mismatch", {observability::StringField("job_id", job_id)});
    return std::nullopt;
  }
  return job;
}

std::optional<ManifestJob> ManifestJobStore::LoadPage(const std::string& job_id, std::uint64_t offset, std::uint32_t limit) const {
  auto meta = LoadMeta(job_id);
  if (!meta) return std::nullopt;

  ManifestJob page{job_id, *meta, {}};
  if (limit == 0 || offset >= meta->total_files()) {
    return page;
  }

  // chunks holding [offset, last)
  const auto& starts   = meta->chunk_starts();
  const auto  chunk_of = [&](std::uint64_t index) {
    return static_cast<std::uint32_t>(std::upper_bound(starts.begin(), starts.end(), index) - starts.begin() - 1);
  };
  const auto last        = std::min<std::uint64_t>(meta->total_files(), offset + limit);
  const auto first_chunk = chunk_of(offset);
  const auto last_chunk  = chunk_of(last - 1);

  std::vector<v1::ManifestEntry> window;
  for (std::uint32_t i = first_chunk; i <= last_chunk; ++i) {
    if (!AppendChunk(job_id, i, &window)) return std::nullopt;
  }

  const auto skip = offset - starts[static_cast<int>(first_chunk)];
  if (window.size() < skip + (last - offset)) {
    SITEPULL_LOG_WARN("manifest chunk shorter than recorded", {observability::StringField("job_id", job_id)});
    return std::nullopt;
  }
  page.entries.assign(std::make_move_iterator(window.begin() + static_cast<std::ptrdiff_t>(skip)),
                      std::make_move_iterator(window.begin() + static_cast<std::ptrdiff_t>(skip + (last - offset))));
  return page;
}

void ManifestJobStore::Delete(const std::string& job_id) {
  std::uint32_t chunk_count = 0;
  if (auto raw_meta = kv_->Get(MetaKey(job_id))) {
    v1::ManifestJobMeta meta;
    if (meta.ParseFromString(*raw_meta)) chunk_count = meta.chunk_count();
  }

  // without metadata, walk chunk keys until the first gap
  for (std::uint32_t i = 0;; ++i) {
    if (i >= chunk_count && !kv_->Get(ChunkKey(job_id, i))) break;
    if (auto r = kv_->Delete(ChunkKey(job_id, i)); !r) {
      SITEPULL_LOG_WARN("manifest chunk delete failed", {observability::StringField("job_id", job_id), observability::StringField("error", r.message)});
    }
  }
  if (auto r = kv_->Delete(MetaKey(job_id)); !r) {
    SITEPULL_LOG_WARN("manifest metadata delete failed", {observability::StringField("job_id", job_id), observability::StringField("error", r.message)});
  }
}

} // namespace sitepull::jobs
