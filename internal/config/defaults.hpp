#pragma once

#include <chrono>
#include <cstdint>

namespace sitepull::runtime::config {
class RuntimeConfig;
}

namespace sitepull::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
inline constexpr const char* kDefaultSpoolDir    = "/tmp/sitepull-spool";
inline constexpr const char* kDefaultJobBackend  = "memory";

inline constexpr std::chrono::seconds      kDefaultJobTtl{15 * 60};
inline constexpr uint32_t                  kDefaultEntriesPerChunk = 2000;
inline constexpr uint64_t                  kDefaultMaxValueBytes   = 1024 * 1024;
inline constexpr std::chrono::milliseconds kDefaultTimeBudget{5000};

inline constexpr uint32_t                  kDefaultConcurrency       = 4;
inline constexpr uint64_t                  kDefaultLargeFileBytes    = 8ull * 1024 * 1024;
inline constexpr uint64_t                  kDefaultBatchByteCap      = 16ull * 1024 * 1024;
inline constexpr uint32_t                  kDefaultBatchCountCap     = 2000;
inline constexpr uint32_t                  kDefaultMaxAttempts       = 3;
inline constexpr std::chrono::milliseconds kDefaultRetryBackoff{500};
inline constexpr std::chrono::milliseconds kDefaultPacingDelay{100};
inline constexpr uint32_t                  kDefaultManifestPageSize  = 5000;
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{120000};

// Fills every unset field with its default. Durations stay unset; readers
// resolve them through util::ToMillis with the constants above.
void ApplyDefaults(sitepull::runtime::config::RuntimeConfig* config);

} // namespace sitepull::config
