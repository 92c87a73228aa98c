#pragma once

#include <cstdint>
#include <string_view>

namespace sitepull::orchestrator {

enum class RunState : std::uint8_t {
  kInit         = 0,
  kDbExport     = 1,
  kDbDownload   = 2,
  kManifestInit = 3,
  kPartition    = 4,
  kRetrieve     = 5,
  kPackage      = 6,
  kDone         = 7,
  kFailed       = 8,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kDone || state == RunState::kFailed;
}

// Strictly forward, one step at a time; FAILED from anywhere not terminal.
constexpr bool CanTransition(RunState from, RunState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == RunState::kFailed) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kInit:
      return "INIT";
    case RunState::kDbExport:
      return "DB_EXPORT";
    case RunState::kDbDownload:
      return "DB_DOWNLOAD";
    case RunState::kManifestInit:
      return "MANIFEST_INIT";
    case RunState::kPartition:
      return "PARTITION";
    case RunState::kRetrieve:
      return "RETRIEVE";
    case RunState::kPackage:
      return "PACKAGE";
    case RunState::kDone:
      return "DONE";
    case RunState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

} // namespace sitepull::orchestrator
