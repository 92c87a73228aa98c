#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace sitepull::util {

/*
  Time utilities. All wall-clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// Zero or negative durations yield `fallback`.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback);

// UTC, filesystem friendly: 20240131-235959.
std::string FormatCompactUtc(TimePoint tp);

// UTC, ISO 8601: 2024-01-31T23:59:59Z.
std::string FormatIsoUtc(TimePoint tp);

} // namespace sitepull::util
