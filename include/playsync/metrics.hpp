#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ps {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct SyncReport {
  std::string resource_id;
  std::string outcome;              // status name
  std::uint64_t items = 0;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  std::vector<StageTiming> stages;  // in start order
};

// Counters and stage timings of one sync flow. Not thread-safe; the writer
// side of a flow owns it.
class MetricsRegistry {
public:
  void reset();
  void add_items(std::uint64_t n) noexcept { items_ += n; }
  void add_chunk() noexcept { ++chunks_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  SyncReport snapshot(std::string resource_id, std::string outcome, double wall_ms) const;

private:
  std::uint64_t items_{0};
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// "[sync] <id> synced: 4500 items, 3 chunks, 1.20 MiB in 830 ms (fetch+parse 790 ms, commit 12 ms)"
std::string format_report(const SyncReport& r);

}
