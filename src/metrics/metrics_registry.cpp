#include "csv_reflow/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cr {

void MetricsRegistry::add_malformed(const MalformedRecord& m) {
  ++malformed_;
  if (warnings_.size() < max_warnings_) warnings_.push_back(m);
}

void MetricsRegistry::set_error(const ReflowError& e) { error_ = e; }

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  if (stage_accum_us_.find(key) == stage_accum_us_.end()) stage_order_.push_back(key);
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records = records_;
  r.bytes = bytes_;
  r.batches = batches_;
  r.lines = lines_;
  r.malformed = malformed_;
  r.peak_batch_bytes = peak_batch_bytes_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.input_delimiter = delim_;
  r.delimiter_fallback = fallback_;
  r.columns = columns_;
  r.warnings = warnings_;
  r.error = error_.kind;
  r.error_message = error_.message;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_us_.at(name)});
  return r;
}

}
