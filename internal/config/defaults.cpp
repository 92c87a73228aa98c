#include "internal/config/defaults.hpp"

#include "config/config.pb.h"
#include "internal/export/cursor_limits.hpp"

namespace sitepull::config {

void ApplyDefaults(sitepull::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);
  if (server->spool_dir().empty()) server->set_spool_dir(kDefaultSpoolDir);

  auto* jobs = config->mutable_job_store();
  if (jobs->backend().empty()) jobs->set_backend(kDefaultJobBackend);
  if (jobs->entries_per_chunk() == 0) jobs->set_entries_per_chunk(kDefaultEntriesPerChunk);
  if (jobs->max_value_bytes() == 0) jobs->set_max_value_bytes(kDefaultMaxValueBytes);

  auto* exporter = config->mutable_exporter();
  if (exporter->default_chunk_size() == 0) exporter->set_default_chunk_size(sitepull::exporter::kDefaultChunkRows);

  auto* client = config->mutable_client();
  if (client->concurrency() == 0) client->set_concurrency(kDefaultConcurrency);
  if (client->large_file_threshold_bytes() == 0) client->set_large_file_threshold_bytes(kDefaultLargeFileBytes);
  if (client->batch_byte_cap() == 0) client->set_batch_byte_cap(kDefaultBatchByteCap);
  if (client->batch_count_cap() == 0) client->set_batch_count_cap(kDefaultBatchCountCap);
  if (client->max_attempts() == 0) client->set_max_attempts(kDefaultMaxAttempts);
  if (client->manifest_page_size() == 0) client->set_manifest_page_size(kDefaultManifestPageSize);
}

} // namespace sitepull::config
