#include "query/query_engine.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>
#include <utility>

namespace netspeed::query {

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

const char* tier_table(const model::Tier tier) {
  return tier == model::Tier::HOUR ? "hour_buckets" : "minute_buckets";
}

// Raw points start where their earliest interval starts; coarse points at the
// bucket key.
std::int64_t bucket_start_of(const model::Sample& sample, const std::int64_t key, const model::Tier tier) {
  return tier == model::Tier::RAW ? sample.interval_start_ms : key;
}

double rate_bps(const std::uint64_t bytes, const std::int64_t duration_ms) {
  return duration_ms > 0 ? static_cast<double>(bytes) * 1000.0 / static_cast<double>(duration_ms) : 0.0;
}

}  // namespace

double QueryPoint::mean_rate_down_bps() const noexcept { return rate_bps(bytes_down, bucket_end_ms - bucket_start_ms); }

double QueryPoint::mean_rate_up_bps() const noexcept { return rate_bps(bytes_up, bucket_end_ms - bucket_start_ms); }

model::Tier select_tier(const std::int64_t span_ms, const QueryOptions& options) noexcept {
  if (span_ms <= options.raw_span_threshold.count()) {
    return model::Tier::RAW;
  }
  if (span_ms <= options.minute_span_threshold.count()) {
    return model::Tier::MINUTE;
  }
  return model::Tier::HOUR;
}

bool is_virtual_interface(const model::InterfaceId& id, const std::vector<std::string>& keywords) {
  const std::string name = lowercase(id);
  for (const auto& keyword : keywords) {
    const std::string needle = lowercase(keyword);
    if (needle.empty()) {
      continue;
    }
    if (name == needle || (needle.size() >= 3 && name.find(needle) != std::string::npos)) {
      return true;
    }
  }
  return false;
}

std::vector<QueryPoint> downsample(const std::vector<QueryPoint>& points, const std::size_t max_points) {
  if (max_points == 0 || points.size() <= max_points) {
    return points;
  }

  const std::size_t group = (points.size() + max_points - 1) / max_points;
  std::vector<QueryPoint> out;
  out.reserve((points.size() + group - 1) / group);

  for (std::size_t begin = 0; begin < points.size(); begin += group) {
    const std::size_t end = std::min(begin + group, points.size());
    QueryPoint folded{};
    folded.bucket_start_ms = points[begin].bucket_start_ms;
    folded.bucket_end_ms = points[end - 1].bucket_end_ms;
    folded.min_rate_down_bps = points[begin].min_rate_down_bps;
    folded.min_rate_up_bps = points[begin].min_rate_up_bps;
    folded.is_downsampled = true;
    for (std::size_t i = begin; i < end; ++i) {
      const auto& point = points[i];
      folded.bytes_down += point.bytes_down;
      folded.bytes_up += point.bytes_up;
      folded.sample_count += point.sample_count;
      folded.min_rate_down_bps = std::min(folded.min_rate_down_bps, point.min_rate_down_bps);
      folded.min_rate_up_bps = std::min(folded.min_rate_up_bps, point.min_rate_up_bps);
      folded.peak_rate_down_bps = std::max(folded.peak_rate_down_bps, point.peak_rate_down_bps);
      folded.peak_rate_up_bps = std::max(folded.peak_rate_up_bps, point.peak_rate_up_bps);
    }
    out.push_back(folded);
  }
  return out;
}

QueryEngine::QueryEngine(std::string store_path, QueryOptions options, const core::LiveTail* live_tail)
    : store_path_(std::move(store_path)), options_(std::move(options)), live_tail_(live_tail) {}

std::future<QueryResponse> QueryEngine::submit(QueryRequest request) {
  return std::async(std::launch::async, [this, request = std::move(request)] { return run(request); });
}

QueryResponse QueryEngine::export_range(const InterfaceFilter& filter, const std::int64_t range_start_ms,
                                        const std::int64_t range_end_ms) {
  return run(QueryRequest{.filter = filter, .range_start_ms = range_start_ms, .range_end_ms = range_end_ms, .max_points = 0});
}

QueryResponse QueryEngine::run(const QueryRequest& request) {
  QueryResponse response{};
  response.tier = select_tier(request.range_end_ms - request.range_start_ms, options_);
  if (request.range_end_ms <= request.range_start_ms) {
    return response;
  }

  BucketMap buckets;
  Watermarks tier_watermarks;
  Watermarks persisted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    response.history_available = ensure_open();
    if (response.history_available) {
      try {
        storage::ReadTransaction snapshot(*db_);
        if (response.tier != model::Tier::RAW) {
          read_tier(request, response.tier, buckets, tier_watermarks);
        }
        read_raw(request, response.tier, tier_watermarks, buckets, persisted);
      } catch (const storage::StoreError& ex) {
        std::cerr << "[query] history read failed: " << ex.what() << '\n';
        response.history_available = false;
        db_.reset();
        buckets.clear();
        persisted.clear();
      }
    }
  }

  merge_live_tail(request, response.tier, persisted, buckets);

  const auto points = flatten(buckets, request.filter);
  for (const auto& point : points) {
    response.stats.total_down += point.bytes_down;
    response.stats.total_up += point.bytes_up;
    response.stats.peak_rate_down_bps = std::max(response.stats.peak_rate_down_bps, point.peak_rate_down_bps);
    response.stats.peak_rate_up_bps = std::max(response.stats.peak_rate_up_bps, point.peak_rate_up_bps);
  }
  response.points = downsample(points, request.max_points);
  return response;
}

std::vector<InterfaceInfo> QueryEngine::interfaces() {
  std::vector<InterfaceInfo> out;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_open()) {
    return out;
  }

  try {
    storage::Statement select(*db_,
                              "SELECT interface_id, name, description, first_seen, last_seen, active "
                              "FROM interfaces ORDER BY interface_id");
    while (select.step()) {
      out.push_back(InterfaceInfo{.id = select.column_text(0),
                                  .name = select.column_text(1),
                                  .description = select.column_text(2),
                                  .first_seen_ms = select.column_int64(3),
                                  .last_seen_ms = select.column_int64(4),
                                  .active = select.column_int64(5) != 0});
    }
  } catch (const storage::StoreError& ex) {
    std::cerr << "[query] interface listing failed: " << ex.what() << '\n';
    db_.reset();
    out.clear();
  }
  return out;
}

StoreInfo QueryEngine::store_info() {
  StoreInfo info{};
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_open()) {
    return info;
  }

  try {
    storage::Statement meta(*db_, "SELECT key, value FROM metadata");
    while (meta.step()) {
      const std::string key = meta.column_text(0);
      const std::string value = meta.column_text(1);
      if (key == "db_version") {
        info.schema_version = std::stoi(value);
      } else if (key == "watermark.minute") {
        info.minute_watermark_ms = std::stoll(value);
      } else if (key == "watermark.hour") {
        info.hour_watermark_ms = std::stoll(value);
      }
    }

    storage::Statement counts(*db_,
                              "SELECT (SELECT COUNT(*) FROM raw_samples), (SELECT COUNT(*) FROM minute_buckets), "
                              "(SELECT COUNT(*) FROM hour_buckets)");
    counts.step();
    info.raw_rows = counts.column_int64(0);
    info.minute_rows = counts.column_int64(1);
    info.hour_rows = counts.column_int64(2);
    info.available = true;
  } catch (const storage::StoreError& ex) {
    std::cerr << "[query] store info failed: " << ex.what() << '\n';
    db_.reset();
    return StoreInfo{};
  } catch (const std::logic_error&) {
    return StoreInfo{};
  }
  return info;
}

bool QueryEngine::ensure_open() {
  if (db_ != nullptr) {
    return true;
  }

  std::error_code ec;
  if (!std::filesystem::exists(store_path_, ec)) {
    return false;
  }

  try {
    db_ = std::make_unique<storage::Database>(store_path_, storage::Database::Mode::READ_ONLY, options_.busy_timeout_ms);
  } catch (const storage::StoreError& ex) {
    std::cerr << "[query] store unavailable: " << ex.what() << '\n';
    db_.reset();
    return false;
  }
  return true;
}

void QueryEngine::read_tier(const QueryRequest& request, const model::Tier tier, BucketMap& buckets,
                            Watermarks& tier_watermarks) {
  const std::int64_t width = model::bucket_width_ms(tier);
  const std::string table = tier_table(tier);

  storage::Statement freshness(*db_, "SELECT interface_id, MAX(last_interval_end) FROM " + table + " GROUP BY interface_id");
  while (freshness.step()) {
    tier_watermarks[freshness.column_text(0)] = freshness.column_int64(1);
  }

  storage::Statement select(*db_,
                            "SELECT interface_id, bucket_start, bytes_down_total, bytes_up_total, bytes_down_max_rate, "
                            "bytes_up_max_rate, sample_count FROM " + table +
                                " WHERE bucket_start < ?2 AND bucket_start + ?3 > ?1");
  select.bind(1, request.range_start_ms).bind(2, request.range_end_ms).bind(3, width);
  while (select.step()) {
    const std::int64_t start = select.column_int64(1);
    Bucket& bucket = buckets[start];
    bucket.start_ms = start;
    bucket.end_ms = start + width;

    Contribution& c = bucket.by_interface[select.column_text(0)];
    c.start_ms = start;
    c.bytes_down += static_cast<std::uint64_t>(select.column_int64(2));
    c.bytes_up += static_cast<std::uint64_t>(select.column_int64(3));
    c.peak_rate_down_bps = std::max(c.peak_rate_down_bps, select.column_double(4));
    c.peak_rate_up_bps = std::max(c.peak_rate_up_bps, select.column_double(5));
    c.sample_count += static_cast<std::uint64_t>(select.column_int64(6));
  }
}

void QueryEngine::read_raw(const QueryRequest& request, const model::Tier tier, const Watermarks& tier_watermarks,
                           BucketMap& buckets, Watermarks& raw_watermarks) {
  storage::Statement freshness(*db_, "SELECT interface_id, MAX(interval_end) FROM raw_samples GROUP BY interface_id");
  while (freshness.step()) {
    raw_watermarks[freshness.column_text(0)] = freshness.column_int64(1);
  }
  // Tier rows may be fresher than the raw table once raw rows were pruned.
  for (const auto& [id, watermark] : tier_watermarks) {
    auto& persisted = raw_watermarks[id];
    persisted = std::max(persisted, watermark);
  }

  const std::int64_t width = model::bucket_width_ms(tier);
  storage::Statement select(*db_,
                            "SELECT interface_id, interval_start, interval_end, bytes_down, bytes_up FROM raw_samples "
                            "WHERE interval_start < ?2 AND interval_end > ?1 ORDER BY interval_end");
  select.bind(1, request.range_start_ms).bind(2, request.range_end_ms);
  while (select.step()) {
    const model::Sample sample{.interface_id = select.column_text(0),
                               .interval_start_ms = select.column_int64(1),
                               .interval_end_ms = select.column_int64(2),
                               .bytes_down = static_cast<std::uint64_t>(select.column_int64(3)),
                               .bytes_up = static_cast<std::uint64_t>(select.column_int64(4))};

    std::int64_t key = sample.interval_end_ms;
    if (tier != model::Tier::RAW) {
      // Only rows the tier has not folded yet.
      const auto folded = tier_watermarks.find(sample.interface_id);
      if (folded != tier_watermarks.end() && sample.interval_end_ms <= folded->second) {
        continue;
      }
      key = model::bucket_start_for(sample.interval_end_ms, width);
    }

    Bucket& bucket = buckets[key];
    if (tier == model::Tier::RAW) {
      bucket.start_ms = bucket.by_interface.empty() ? sample.interval_start_ms : std::min(bucket.start_ms, sample.interval_start_ms);
      bucket.end_ms = sample.interval_end_ms;
    } else {
      bucket.start_ms = key;
      bucket.end_ms = key + width;
    }

    Contribution& c = bucket.by_interface[sample.interface_id];
    const std::int64_t contributed_start = bucket_start_of(sample, key, tier);
    c.start_ms = c.sample_count == 0 ? contributed_start : std::min(c.start_ms, contributed_start);
    c.bytes_down += sample.bytes_down;
    c.bytes_up += sample.bytes_up;
    c.peak_rate_down_bps = std::max(c.peak_rate_down_bps, sample.rate_down_bps());
    c.peak_rate_up_bps = std::max(c.peak_rate_up_bps, sample.rate_up_bps());
    c.sample_count += 1;
  }
}

void QueryEngine::merge_live_tail(const QueryRequest& request, const model::Tier tier, const Watermarks& persisted,
                                  BucketMap& buckets) const {
  if (live_tail_ == nullptr) {
    return;
  }

  const std::int64_t width = model::bucket_width_ms(tier);
  for (const auto& [id, samples] : live_tail_->snapshot(request.range_start_ms)) {
    const auto it = persisted.find(id);
    const std::int64_t newest_persisted = it != persisted.end() ? it->second : 0;

    for (const auto& sample : samples) {
      if (sample.interval_end_ms <= newest_persisted || sample.interval_start_ms >= request.range_end_ms) {
        continue;
      }

      const std::int64_t key = tier == model::Tier::RAW ? sample.interval_end_ms
                                                        : model::bucket_start_for(sample.interval_end_ms, width);
      Bucket& bucket = buckets[key];
      if (tier == model::Tier::RAW) {
        bucket.start_ms = bucket.by_interface.empty() ? sample.interval_start_ms : std::min(bucket.start_ms, sample.interval_start_ms);
        bucket.end_ms = sample.interval_end_ms;
      } else {
        bucket.start_ms = key;
        bucket.end_ms = key + width;
      }

      Contribution& c = bucket.by_interface[id];
      const std::int64_t contributed_start = bucket_start_of(sample, key, tier);
    c.start_ms = c.sample_count == 0 ? contributed_start : std::min(c.start_ms, contributed_start);
      c.bytes_down += sample.bytes_down;
      c.bytes_up += sample.bytes_up;
      c.peak_rate_down_bps = std::max(c.peak_rate_down_bps, sample.rate_down_bps());
      c.peak_rate_up_bps = std::max(c.peak_rate_up_bps, sample.rate_up_bps());
      c.sample_count += 1;
    }
  }
}

std::vector<QueryPoint> QueryEngine::flatten(const BucketMap& buckets, const InterfaceFilter& filter) const {
  std::vector<QueryPoint> points;
  points.reserve(buckets.size());
  for (const auto& [_, bucket] : buckets) {
    QueryPoint point{};
    point.bucket_end_ms = bucket.end_ms;
    std::optional<std::int64_t> start;
    for (const auto& [id, c] : bucket.by_interface) {
      if (!matches(filter, id)) {
        continue;
      }
      start = start.has_value() ? std::min(*start, c.start_ms) : c.start_ms;
      point.bytes_down += c.bytes_down;
      point.bytes_up += c.bytes_up;
      point.peak_rate_down_bps += c.peak_rate_down_bps;
      point.peak_rate_up_bps += c.peak_rate_up_bps;
      point.sample_count += c.sample_count;
    }
    // Zero-filled points keep the key's own span.
    point.bucket_start_ms = start.value_or(bucket.start_ms);
    point.min_rate_down_bps = point.mean_rate_down_bps();
    point.min_rate_up_bps = point.mean_rate_up_bps();
    points.push_back(point);
  }
  return points;
}

bool QueryEngine::matches(const InterfaceFilter& filter, const model::InterfaceId& id) const {
  switch (filter.kind) {
    case FilterKind::ALL:
      return true;
    case FilterKind::PHYSICAL:
      return !is_virtual_interface(id, options_.virtual_keywords);
    case FilterKind::SELECTED:
    case FilterKind::SINGLE:
      return filter.ids.find(id) != filter.ids.end();
  }
  return false;
}

}  // namespace netspeed::query
