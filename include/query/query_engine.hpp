#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/live_tail.hpp"
#include "model/sample.hpp"
#include "storage/sqlite.hpp"

namespace netspeed::query {

enum class FilterKind : std::uint8_t {
  ALL = 0,
  PHYSICAL = 1,
  SELECTED = 2,
  SINGLE = 3,
};

struct InterfaceFilter {
  FilterKind kind{FilterKind::ALL};
  std::set<model::InterfaceId> ids{};

  static InterfaceFilter all() { return {}; }
  static InterfaceFilter physical() { return {FilterKind::PHYSICAL, {}}; }
  static InterfaceFilter selected(std::set<model::InterfaceId> ids) { return {FilterKind::SELECTED, std::move(ids)}; }
  static InterfaceFilter single(const model::InterfaceId& id) { return {FilterKind::SINGLE, {id}}; }
};

struct QueryRequest {
  InterfaceFilter filter{};
  std::int64_t range_start_ms{0};
  std::int64_t range_end_ms{0};
  // 0 means unbounded.
  std::size_t max_points{0};
};

struct QueryPoint {
  std::int64_t bucket_start_ms{0};
  std::int64_t bucket_end_ms{0};
  std::uint64_t bytes_down{0};
  std::uint64_t bytes_up{0};
  double min_rate_down_bps{0.0};
  double min_rate_up_bps{0.0};
  double peak_rate_down_bps{0.0};
  double peak_rate_up_bps{0.0};
  std::uint64_t sample_count{0};
  bool is_downsampled{false};

  [[nodiscard]] double mean_rate_down_bps() const noexcept;
  [[nodiscard]] double mean_rate_up_bps() const noexcept;
};

struct QueryStats {
  std::uint64_t total_down{0};
  std::uint64_t total_up{0};
  double peak_rate_down_bps{0.0};
  double peak_rate_up_bps{0.0};
};

struct QueryResponse {
  model::Tier tier{model::Tier::RAW};
  std::vector<QueryPoint> points{};
  QueryStats stats{};
  // False when the store could not be read; points then come from the live tail only.
  bool history_available{true};
};

struct QueryOptions {
  std::chrono::milliseconds raw_span_threshold{std::chrono::hours(6)};
  std::chrono::milliseconds minute_span_threshold{std::chrono::hours(72)};
  // Case-insensitive; a keyword excludes an interface whose id equals it or,
  // for keywords of three or more characters, contains it.
  std::vector<std::string> virtual_keywords{"lo",     "loopback", "virtual", "vmware", "vbox",   "vpn",
                                            "docker", "veth",     "virbr",   "teredo", "isatap", "bluetooth"};
  int busy_timeout_ms{2000};
};

struct StoreInfo {
  bool available{false};
  int schema_version{0};
  std::int64_t minute_watermark_ms{0};
  std::int64_t hour_watermark_ms{0};
  std::int64_t raw_rows{0};
  std::int64_t minute_rows{0};
  std::int64_t hour_rows{0};
};

struct InterfaceInfo {
  model::InterfaceId id{};
  std::string name{};
  std::string description{};
  std::int64_t first_seen_ms{0};
  std::int64_t last_seen_ms{0};
  bool active{false};
};

[[nodiscard]] model::Tier select_tier(std::int64_t span_ms, const QueryOptions& options) noexcept;
[[nodiscard]] bool is_virtual_interface(const model::InterfaceId& id, const std::vector<std::string>& keywords);
// Folds adjacent points in groups of ceil(n / max_points).
[[nodiscard]] std::vector<QueryPoint> downsample(const std::vector<QueryPoint>& points, std::size_t max_points);

// Read side of the pipeline. Uses its own read-only connection, serialized
// internally, so callers on any thread never share a cursor with the writer.
class QueryEngine {
 public:
  QueryEngine(std::string store_path, QueryOptions options, const core::LiveTail* live_tail = nullptr);

  QueryEngine(const QueryEngine&) = delete;
  QueryEngine& operator=(const QueryEngine&) = delete;

  [[nodiscard]] std::future<QueryResponse> submit(QueryRequest request);

  QueryResponse run(const QueryRequest& request);

  // Full-fidelity dump for CSV export.
  QueryResponse export_range(const InterfaceFilter& filter, std::int64_t range_start_ms, std::int64_t range_end_ms);

  std::vector<InterfaceInfo> interfaces();
  StoreInfo store_info();

  [[nodiscard]] const QueryOptions& options() const noexcept { return options_; }

 private:
  struct Contribution {
    std::int64_t start_ms{0};
    std::uint64_t bytes_down{0};
    std::uint64_t bytes_up{0};
    double peak_rate_down_bps{0.0};
    double peak_rate_up_bps{0.0};
    std::uint64_t sample_count{0};
  };

  struct Bucket {
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};
    std::unordered_map<model::InterfaceId, Contribution> by_interface{};
  };

  // Keyed by interval end on the raw tier, by bucket start on coarse tiers.
  using BucketMap = std::map<std::int64_t, Bucket>;
  using Watermarks = std::unordered_map<model::InterfaceId, std::int64_t>;

  bool ensure_open();
  void read_raw(const QueryRequest& request, model::Tier tier, const Watermarks& tier_watermarks, BucketMap& buckets,
                Watermarks& raw_watermarks);
  void read_tier(const QueryRequest& request, model::Tier tier, BucketMap& buckets, Watermarks& tier_watermarks);
  void merge_live_tail(const QueryRequest& request, model::Tier tier, const Watermarks& persisted, BucketMap& buckets) const;
  [[nodiscard]] std::vector<QueryPoint> flatten(const BucketMap& buckets, const InterfaceFilter& filter) const;
  [[nodiscard]] bool matches(const InterfaceFilter& filter, const model::InterfaceId& id) const;

  std::string store_path_;
  QueryOptions options_;
  const core::LiveTail* live_tail_;
  std::mutex mutex_;
  std::unique_ptr<storage::Database> db_{};
};

}  // namespace netspeed::query
