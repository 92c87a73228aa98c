#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/table_source.hpp"
#include "internal/export/sql_dump_writer.hpp"
#include "sitepull/core/v1/cursor.pb.h"
#include "sitepull/core/v1/types.pb.h"

namespace sitepull::exporter {

struct InitResult {
  std::string                        cursor;
  std::string                        preamble;
  sitepull::core::v1::ExportMetadata metadata;
};

struct StepResult {
  std::string                       slice;
  std::string                       cursor;
  bool                              is_complete = false;
  sitepull::core::v1::SliceProgress progress;
  sitepull::core::v1::PerfStats     performance;
};

/*
  Cursor-driven export of every table of a TableSource in bounded slices.

  The engine holds no per-session state: everything needed to resume lives
  in the cursor token handed back to the caller. One Next call reads at most
  one page of the current table and always emits at least one row when the
  table has any left.
*/
class ExportEngine {
 public:
  using SteadyClock = std::chrono::steady_clock;
  using ClockFn     = std::function<SteadyClock::time_point()>;

  explicit ExportEngine(std::shared_ptr<db::TableSource> source, ClockFn clock = &SteadyClock::now);

  // chunk_size_hint 0 selects the default page size.
  InitResult Init(std::uint32_t chunk_size_hint);

  StepResult Next(const std::string& cursor_token, std::chrono::milliseconds time_budget,
                  sitepull::core::v1::Compression compression = sitepull::core::v1::COMPRESSION_NONE);

 private:
  void DecideStrategy(const std::string& table, sitepull::core::v1::TableInfo* info);
  void AdvanceTable(sitepull::core::v1::Cursor* cursor);

  double ElapsedMs(SteadyClock::time_point since) const;

  std::shared_ptr<db::TableSource> source_;
  SqlDumpWriter                    writer_;
  ClockFn                          clock_;
};

} // namespace sitepull::exporter
