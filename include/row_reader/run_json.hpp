#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "row_reader/format_violation.hpp"

namespace rr {

struct RunStats;

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t fields = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;

  // Outcome: "ok" | "format_error" | "io_error"
  std::string status = "ok";
  std::string error;
  std::optional<FormatViolation> violation;

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
};

// Copy KPIs and stage timings out of a metrics snapshot.
void fill_from_stats(RunJsonPayload& p, const RunStats& s);

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);

  // Write to_json(p) to `path`; false with *err_out set on failure.
  static bool write_file(const std::string& path, const RunJsonPayload& p,
                         std::string* err_out = nullptr);
};

}
