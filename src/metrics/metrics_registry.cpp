#include "playsync/metrics.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace ps {

void MetricsRegistry::reset() {
  items_ = chunks_ = bytes_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

SyncReport MetricsRegistry::snapshot(std::string resource_id, std::string outcome,
                                     double wall_ms) const {
  SyncReport r;
  r.resource_id = std::move(resource_id);
  r.outcome = std::move(outcome);
  r.items = items_;
  r.chunks = chunks_;
  r.bytes = bytes_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0 : it->second});
  }
  return r;
}

std::string format_report(const SyncReport& r) {
  std::ostringstream o;
  o << "[sync] " << r.resource_id << " " << r.outcome << ": "
    << r.items << " items, " << r.chunks << " chunks, "
    << std::fixed << std::setprecision(2) << (r.bytes / (1024.0*1024.0)) << " MiB in "
    << std::setprecision(0) << r.wall_ms << " ms";
  if (!r.stages.empty()) {
    o << " (";
    for (size_t i = 0; i < r.stages.size(); ++i) {
      if (i) o << ", ";
      o << r.stages[i].name << " " << r.stages[i].duration_ms << " ms";
    }
    o << ")";
  }
  return o.str();
}

}
