#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t fields = 0;
  std::uint64_t bytes = 0;
  std::uint64_t violations = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages;
};

// Counters for one pass of a RowReader over a source.
class MetricsRegistry {
public:
  void reset();
  void add_row(std::size_t nfields) noexcept { ++rows_; fields_ += nfields; }
  void add_violation() noexcept { ++violations_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t fields_{0};
  std::uint64_t bytes_{0};
  std::uint64_t violations_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
