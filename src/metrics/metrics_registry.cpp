#include "row_reader/metrics.hpp"
#include <chrono>

namespace rr {

void MetricsRegistry::reset() {
  rows_ = fields_ = bytes_ = violations_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) stage_order_.push_back(key);
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.fields = fields_;
  r.bytes = bytes_;
  r.violations = violations_;
  r.wall_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.rows_per_sec    = (sec > 0.0) ? rows_ / sec : 0.0;

  // Stages are reported in the order they first finished.
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
