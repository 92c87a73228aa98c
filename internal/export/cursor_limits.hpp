#pragma once

#include <cstdint>

namespace sitepull::exporter {

inline constexpr std::uint32_t kCursorVersion = 1;

inline constexpr std::uint32_t kMinChunkRows     = 100;
inline constexpr std::uint32_t kMaxChunkRows     = 5000;
inline constexpr std::uint32_t kDefaultChunkRows = 1000;

// Tables above either threshold page by primary key instead of OFFSET.
inline constexpr std::uint64_t kKeysetThresholdRows  = 100000;
inline constexpr std::uint64_t kKeysetThresholdBytes = 100ull * 1024 * 1024;

// Adaptive sizing: grow under kFastStepMs, shrink over kSlowStepMs.
inline constexpr double kFastStepMs   = 1000.0;
inline constexpr double kSlowStepMs   = 3000.0;
inline constexpr double kGrowFactor   = 1.5;
inline constexpr double kShrinkFactor = 0.75;

// 0 selects the default; everything else is clamped to the bounds.
constexpr std::uint32_t ClampChunkSize(std::uint32_t hint) {
  if (hint == 0) return kDefaultChunkRows;
  if (hint < kMinChunkRows) return kMinChunkRows;
  if (hint > kMaxChunkRows) return kMaxChunkRows;
  return hint;
}

} // namespace sitepull::exporter
