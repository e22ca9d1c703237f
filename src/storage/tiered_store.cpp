#include "storage/tiered_store.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <sqlite3.h>

namespace netspeed::storage {

namespace {

constexpr int kNoSchema = -1;

constexpr const char* kMetaVersion = "db_version";
constexpr const char* kMetaMinuteWatermark = "watermark.minute";
constexpr const char* kMetaHourWatermark = "watermark.hour";

constexpr const char* kCreateSchema = R"sql(
CREATE TABLE IF NOT EXISTS metadata (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS interfaces (
  interface_id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  description TEXT NOT NULL DEFAULT '',
  first_seen INTEGER NOT NULL,
  last_seen INTEGER NOT NULL,
  active INTEGER NOT NULL DEFAULT 1
);
CREATE TABLE IF NOT EXISTS raw_samples (
  interface_id TEXT NOT NULL,
  interval_start INTEGER NOT NULL,
  interval_end INTEGER NOT NULL,
  bytes_down INTEGER NOT NULL,
  bytes_up INTEGER NOT NULL,
  PRIMARY KEY (interface_id, interval_start)
) WITHOUT ROWID;
CREATE INDEX IF NOT EXISTS idx_raw_samples_end ON raw_samples (interval_end);
CREATE TABLE IF NOT EXISTS discontinuities (
  interface_id TEXT NOT NULL,
  start_ms INTEGER NOT NULL,
  end_ms INTEGER NOT NULL,
  reason TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_discontinuities_end ON discontinuities (end_ms);
CREATE TABLE IF NOT EXISTS minute_buckets (
  interface_id TEXT NOT NULL,
  bucket_start INTEGER NOT NULL,
  bytes_down_total INTEGER NOT NULL,
  bytes_up_total INTEGER NOT NULL,
  bytes_down_max_rate REAL NOT NULL,
  bytes_up_max_rate REAL NOT NULL,
  sample_count INTEGER NOT NULL,
  last_interval_end INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY (interface_id, bucket_start)
) WITHOUT ROWID;
CREATE INDEX IF NOT EXISTS idx_minute_buckets_start ON minute_buckets (bucket_start);
CREATE TABLE IF NOT EXISTS hour_buckets (
  interface_id TEXT NOT NULL,
  bucket_start INTEGER NOT NULL,
  bytes_down_total INTEGER NOT NULL,
  bytes_up_total INTEGER NOT NULL,
  bytes_down_max_rate REAL NOT NULL,
  bytes_up_max_rate REAL NOT NULL,
  sample_count INTEGER NOT NULL,
  last_interval_end INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY (interface_id, bucket_start)
) WITHOUT ROWID;
CREATE INDEX IF NOT EXISTS idx_hour_buckets_start ON hour_buckets (bucket_start);
)sql";

// v1 had no interface table, no gap log and no per-bucket freshness column.
constexpr const char* kMigrateV1ToV2 = R"sql(
ALTER TABLE minute_buckets ADD COLUMN last_interval_end INTEGER NOT NULL DEFAULT 0;
UPDATE minute_buckets SET last_interval_end = bucket_start + 60000;
ALTER TABLE hour_buckets ADD COLUMN last_interval_end INTEGER NOT NULL DEFAULT 0;
UPDATE hour_buckets SET last_interval_end = bucket_start + 3600000;
)sql";

constexpr const char* kBackfillInterfaces = R"sql(
INSERT OR IGNORE INTO interfaces (interface_id, name, description, first_seen, last_seen, active)
SELECT interface_id, interface_id, '', MIN(interval_start), MAX(interval_end), 1
FROM raw_samples WHERE interval_end > 0 GROUP BY interface_id
)sql";

constexpr const char* kInsertSample =
    "INSERT OR IGNORE INTO raw_samples (interface_id, interval_start, interval_end, bytes_down, bytes_up) "
    "VALUES (?1, ?2, ?3, ?4, ?5)";

constexpr const char* kInsertDiscontinuity =
    "INSERT INTO discontinuities (interface_id, start_ms, end_ms, reason) VALUES (?1, ?2, ?3, ?4)";

constexpr const char* kUpsertInterface = R"sql(
INSERT INTO interfaces (interface_id, name, description, first_seen, last_seen, active)
VALUES (?1, ?2, ?3, ?4, ?4, ?5)
ON CONFLICT (interface_id) DO UPDATE SET
  description = CASE WHEN excluded.description <> '' THEN excluded.description ELSE interfaces.description END,
  last_seen = MAX(interfaces.last_seen, excluded.last_seen),
  active = excluded.active
)sql";

constexpr const char* kFoldRawIntoMinutes = R"sql(
INSERT INTO minute_buckets (interface_id, bucket_start, bytes_down_total, bytes_up_total,
                            bytes_down_max_rate, bytes_up_max_rate, sample_count, last_interval_end)
SELECT interface_id,
       ((interval_end - 1) / 60000) * 60000 AS bucket,
       SUM(bytes_down),
       SUM(bytes_up),
       MAX(CAST(bytes_down AS REAL) * 1000.0 / (interval_end - interval_start)),
       MAX(CAST(bytes_up AS REAL) * 1000.0 / (interval_end - interval_start)),
       COUNT(*),
       MAX(interval_end)
FROM raw_samples
WHERE interval_end > ?1
GROUP BY interface_id, bucket
ON CONFLICT (interface_id, bucket_start) DO UPDATE SET
  bytes_down_total = excluded.bytes_down_total,
  bytes_up_total = excluded.bytes_up_total,
  bytes_down_max_rate = excluded.bytes_down_max_rate,
  bytes_up_max_rate = excluded.bytes_up_max_rate,
  sample_count = excluded.sample_count,
  last_interval_end = excluded.last_interval_end
)sql";

constexpr const char* kFoldMinutesIntoHours = R"sql(
INSERT INTO hour_buckets (interface_id, bucket_start, bytes_down_total, bytes_up_total,
                          bytes_down_max_rate, bytes_up_max_rate, sample_count, last_interval_end)
SELECT interface_id,
       (bucket_start / 3600000) * 3600000 AS bucket,
       SUM(bytes_down_total),
       SUM(bytes_up_total),
       MAX(bytes_down_max_rate),
       MAX(bytes_up_max_rate),
       SUM(sample_count),
       MAX(last_interval_end)
FROM minute_buckets
WHERE bucket_start >= ?1
GROUP BY interface_id, bucket
ON CONFLICT (interface_id, bucket_start) DO UPDATE SET
  bytes_down_total = excluded.bytes_down_total,
  bytes_up_total = excluded.bytes_up_total,
  bytes_down_max_rate = excluded.bytes_down_max_rate,
  bytes_up_max_rate = excluded.bytes_up_max_rate,
  sample_count = excluded.sample_count,
  last_interval_end = excluded.last_interval_end
)sql";

std::int64_t floor_to(const std::int64_t value_ms, const std::int64_t width_ms) {
  return value_ms > 0 ? (value_ms / width_ms) * width_ms : 0;
}

std::string utc_stamp() {
  const std::time_t now = std::time(nullptr);
  std::tm parts{};
  gmtime_r(&now, &parts);
  char buffer[32] = {};
  std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &parts);
  return buffer;
}

const char* tier_table(const model::Tier tier) {
  switch (tier) {
    case model::Tier::RAW:
      return "raw_samples";
    case model::Tier::MINUTE:
      return "minute_buckets";
    case model::Tier::HOUR:
      return "hour_buckets";
  }
  return "raw_samples";
}

std::string retention_key(std::string_view tier, std::string_view field) {
  return "retention." + std::string(tier) + "." + std::string(field);
}

}  // namespace

const char* to_string(const OpenOutcome outcome) noexcept {
  switch (outcome) {
    case OpenOutcome::CREATED:
      return "created";
    case OpenOutcome::OPENED:
      return "opened";
    case OpenOutcome::MIGRATED:
      return "migrated";
    case OpenOutcome::RECREATED:
      return "recreated";
  }
  return "unknown";
}

TieredStore::TieredStore(StoreOptions options) : options_(std::move(options)) { open(); }

const OpenReport& TieredStore::open_report() const noexcept { return report_; }

void TieredStore::open() {
  std::error_code ec;
  const bool has_file = std::filesystem::exists(options_.path, ec) && std::filesystem::file_size(options_.path, ec) > 0;
  if (!has_file) {
    create_fresh();
    report_ = OpenReport{.outcome = OpenOutcome::CREATED};
    return;
  }

  try {
    db_ = std::make_unique<Database>(options_.path, Database::Mode::READ_WRITE, options_.busy_timeout_ms);
    check_integrity();
  } catch (const StoreError& ex) {
    std::cerr << "[store] " << options_.path << " failed integrity check: " << ex.what() << '\n';
    const std::string backup = move_aside(".corrupt_" + utc_stamp());
    create_fresh();
    report_ = OpenReport{.outcome = OpenOutcome::RECREATED, .found_version = 0, .backup_path = backup, .reason = ex.what()};
    return;
  }

  const int version = read_version();
  if (version == kSchemaVersion) {
    configure_connection();
    report_ = OpenReport{.outcome = OpenOutcome::OPENED, .found_version = version};
    return;
  }

  if (version == kNoSchema) {
    configure_connection();
    create_schema();
    report_ = OpenReport{.outcome = OpenOutcome::CREATED};
    return;
  }

  if (version == 1) {
    std::string copy;
    try {
      copy = backup_copy(version);
      migrate_v1_to_v2();
      configure_connection();
      std::cerr << "[store] migrated schema v1 -> v" << kSchemaVersion << " (backup " << copy << ")\n";
      report_ = OpenReport{.outcome = OpenOutcome::MIGRATED, .found_version = version, .backup_path = copy};
      return;
    } catch (const StoreError& ex) {
      std::cerr << "[store] migration from v1 failed: " << ex.what() << '\n';
      const std::string backup = move_aside(".bak.v1_" + utc_stamp());
      create_fresh();
      report_ = OpenReport{.outcome = OpenOutcome::RECREATED, .found_version = version, .backup_path = backup, .reason = ex.what()};
      return;
    }
  }

  const std::string reason = "no migration from schema version " + std::to_string(version);
  std::cerr << "[store] " << reason << "; moving store aside\n";
  const std::string backup = move_aside(".bak.v" + std::to_string(version) + "_" + utc_stamp());
  create_fresh();
  report_ = OpenReport{.outcome = OpenOutcome::RECREATED, .found_version = version, .backup_path = backup, .reason = reason};
}

void TieredStore::create_fresh() {
  db_ = std::make_unique<Database>(options_.path, Database::Mode::READ_WRITE, options_.busy_timeout_ms);
  configure_connection();
  create_schema();
}

void TieredStore::create_schema() {
  Transaction tx(*db_);
  db_->exec(kCreateSchema);
  write_meta(kMetaVersion, std::to_string(kSchemaVersion));
  tx.commit();
}

void TieredStore::configure_connection() {
  db_->exec("PRAGMA journal_mode=WAL");
  db_->exec("PRAGMA synchronous=NORMAL");
}

void TieredStore::check_integrity() {
  Statement check(*db_, "PRAGMA quick_check");
  if (!check.step()) {
    throw StoreError("quick_check returned no result", SQLITE_CORRUPT);
  }
  const std::string result = check.column_text(0);
  if (result != "ok") {
    throw StoreError("quick_check: " + result, SQLITE_CORRUPT);
  }
}

int TieredStore::read_version() {
  Statement tables(*db_,
                   "SELECT SUM(name = 'metadata'), COUNT(*) FROM sqlite_master "
                   "WHERE type = 'table' AND name NOT LIKE 'sqlite_%'");
  tables.step();
  const bool has_metadata = tables.column_int64(0) > 0;
  const std::int64_t table_count = tables.column_int64(1);
  if (!has_metadata) {
    return table_count == 0 ? kNoSchema : 0;
  }

  Statement version(*db_, "SELECT value FROM metadata WHERE key = ?1");
  version.bind(1, std::string(kMetaVersion));
  if (!version.step()) {
    return 0;
  }
  try {
    return std::stoi(version.column_text(0));
  } catch (const std::exception&) {
    return 0;
  }
}

void TieredStore::migrate_v1_to_v2() {
  Transaction tx(*db_);
  db_->exec(kMigrateV1ToV2);
  db_->exec(kCreateSchema);
  db_->exec(kBackfillInterfaces);
  write_meta(kMetaVersion, std::to_string(kSchemaVersion));
  tx.commit();
}

std::string TieredStore::backup_copy(const int version) {
  db_->exec("PRAGMA wal_checkpoint(TRUNCATE)");
  const std::string target = options_.path + ".bak.v" + std::to_string(version) + "_" + utc_stamp();
  std::error_code ec;
  std::filesystem::copy_file(options_.path, target, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw StoreError("unable to back up " + options_.path + ": " + ec.message(), SQLITE_CANTOPEN);
  }
  return target;
}

std::string TieredStore::move_aside(const std::string& suffix) {
  db_.reset();

  std::string target = options_.path + suffix;
  std::error_code ec;
  for (int n = 1; std::filesystem::exists(target, ec); ++n) {
    target = options_.path + suffix + "_" + std::to_string(n);
  }

  std::filesystem::rename(options_.path, target, ec);
  if (ec) {
    throw StoreError("unable to move " + options_.path + " aside: " + ec.message(), SQLITE_CANTOPEN);
  }
  for (const char* sidecar : {"-wal", "-shm"}) {
    const std::string from = options_.path + sidecar;
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, target + sidecar, ec);
      if (ec) {
        std::filesystem::remove(from, ec);
      }
    }
  }

  std::cerr << "[store] previous store preserved as " << target << '\n';
  return target;
}

InsertReport TieredStore::insert_batch(const std::vector<model::IngestItem>& items) {
  InsertReport report{};
  if (items.empty()) {
    return report;
  }

  Transaction tx(*db_);
  Statement insert_sample(*db_, kInsertSample);
  Statement insert_gap(*db_, kInsertDiscontinuity);
  Statement upsert_interface(*db_, kUpsertInterface);

  for (const auto& item : items) {
    if (const auto* sample = std::get_if<model::Sample>(&item)) {
      insert_sample.bind(1, sample->interface_id)
          .bind(2, sample->interval_start_ms)
          .bind(3, sample->interval_end_ms)
          .bind(4, static_cast<std::int64_t>(sample->bytes_down))
          .bind(5, static_cast<std::int64_t>(sample->bytes_up));
      insert_sample.step();
      if (db_->changes() > 0) {
        ++report.samples_inserted;
      } else {
        ++report.samples_ignored;
      }
      insert_sample.reset();
    } else if (const auto* gap = std::get_if<model::Discontinuity>(&item)) {
      insert_gap.bind(1, gap->interface_id)
          .bind(2, gap->start_ms)
          .bind(3, gap->end_ms)
          .bind(4, std::string(model::to_string(gap->reason)));
      insert_gap.step();
      insert_gap.reset();
      ++report.discontinuities;
    } else if (const auto* update = std::get_if<model::InterfaceUpdate>(&item)) {
      upsert_interface.bind(1, update->interface_id)
          .bind(2, update->name)
          .bind(3, update->description)
          .bind(4, update->seen_at_ms)
          .bind(5, static_cast<std::int64_t>(update->active ? 1 : 0));
      upsert_interface.step();
      upsert_interface.reset();
      ++report.interface_updates;
    }
  }

  tx.commit();
  return report;
}

RollupReport TieredStore::rollup(const std::int64_t now_ms) {
  RollupReport report{};
  Transaction tx(*db_);

  const std::int64_t minute_watermark = read_meta_int(kMetaMinuteWatermark, 0);
  Statement fold_minutes(*db_, kFoldRawIntoMinutes);
  fold_minutes.bind(1, minute_watermark);
  fold_minutes.step();
  report.minute_buckets = static_cast<std::size_t>(db_->changes());

  const std::int64_t finalized_before = now_ms - options_.finalization_delay.count();
  report.minute_watermark_ms = std::max(minute_watermark, floor_to(finalized_before, model::kMinuteBucketMs));

  const std::int64_t hour_watermark = read_meta_int(kMetaHourWatermark, 0);
  Statement fold_hours(*db_, kFoldMinutesIntoHours);
  fold_hours.bind(1, hour_watermark);
  fold_hours.step();
  report.hour_buckets = static_cast<std::size_t>(db_->changes());

  // An hour is final only once every minute inside it is.
  report.hour_watermark_ms = std::max(hour_watermark, floor_to(report.minute_watermark_ms, model::kHourBucketMs));

  write_meta(kMetaMinuteWatermark, std::to_string(report.minute_watermark_ms));
  write_meta(kMetaHourWatermark, std::to_string(report.hour_watermark_ms));
  tx.commit();
  return report;
}

PruneReport TieredStore::prune(const TierTtls& ttls, const std::int64_t now_ms) {
  PruneReport report{};
  {
    Transaction tx(*db_);
    const std::int64_t minute_watermark = read_meta_int(kMetaMinuteWatermark, 0);
    const std::int64_t hour_watermark = read_meta_int(kMetaHourWatermark, 0);

    Statement raw(*db_, "DELETE FROM raw_samples WHERE interval_end <= ?1 AND interval_end <= ?2");
    raw.bind(1, now_ms - ttls.raw.count()).bind(2, minute_watermark);
    raw.step();
    report.raw_rows = static_cast<std::size_t>(db_->changes());

    Statement minutes(*db_, "DELETE FROM minute_buckets WHERE bucket_start + 60000 <= ?1 AND bucket_start < ?2");
    minutes.bind(1, now_ms - ttls.minute.count()).bind(2, hour_watermark);
    minutes.step();
    report.minute_rows = static_cast<std::size_t>(db_->changes());

    Statement hours(*db_, "DELETE FROM hour_buckets WHERE bucket_start + 3600000 <= ?1 AND bucket_start < ?2");
    hours.bind(1, now_ms - ttls.hour.count()).bind(2, hour_watermark);
    hours.step();
    report.hour_rows = static_cast<std::size_t>(db_->changes());

    Statement gaps(*db_, "DELETE FROM discontinuities WHERE end_ms <= ?1");
    gaps.bind(1, now_ms - ttls.hour.count());
    gaps.step();
    report.discontinuities = static_cast<std::size_t>(db_->changes());

    tx.commit();
  }

  if (options_.vacuum_after_prune && report.total() > 0) {
    try {
      db_->exec("VACUUM");
      report.vacuumed = true;
    } catch (const StoreError& ex) {
      std::cerr << "[store] vacuum skipped: " << ex.what() << '\n';
    }
  }
  return report;
}

RetentionPolicy TieredStore::load_retention(const TierTtls& defaults, const std::chrono::milliseconds grace_period) {
  RetentionPolicy policy{};
  policy.current = defaults;
  policy.grace_period = grace_period;

  const auto load_tier = [this](std::string_view tier, std::chrono::milliseconds& current,
                                std::optional<PendingTtl>& pending) {
    const std::string ttl_key = retention_key(tier, "ttl_ms");
    if (has_meta(ttl_key)) {
      current = std::chrono::milliseconds(read_meta_int(ttl_key, current.count()));
    }
    const std::string pending_key = retention_key(tier, "pending_ttl_ms");
    if (has_meta(pending_key)) {
      pending = PendingTtl{std::chrono::milliseconds(read_meta_int(pending_key, 0)),
                           read_meta_int(retention_key(tier, "pending_at_ms"), 0)};
    }
  };

  load_tier("raw", policy.current.raw, policy.pending_raw);
  load_tier("minute", policy.current.minute, policy.pending_minute);
  load_tier("hour", policy.current.hour, policy.pending_hour);
  return policy;
}

void TieredStore::save_retention(const RetentionPolicy& policy) {
  Transaction tx(*db_);
  const auto save_tier = [this](std::string_view tier, const std::chrono::milliseconds current,
                                const std::optional<PendingTtl>& pending) {
    write_meta(retention_key(tier, "ttl_ms"), std::to_string(current.count()));
    if (pending.has_value()) {
      write_meta(retention_key(tier, "pending_ttl_ms"), std::to_string(pending->ttl.count()));
      write_meta(retention_key(tier, "pending_at_ms"), std::to_string(pending->requested_at_ms));
    } else {
      delete_meta(retention_key(tier, "pending_ttl_ms"));
      delete_meta(retention_key(tier, "pending_at_ms"));
    }
  };

  save_tier("raw", policy.current.raw, policy.pending_raw);
  save_tier("minute", policy.current.minute, policy.pending_minute);
  save_tier("hour", policy.current.hour, policy.pending_hour);
  tx.commit();
}

std::optional<TierTtls> TieredStore::load_configured_ttls() {
  const std::string raw_key = retention_key("raw", "configured_ms");
  if (!has_meta(raw_key)) {
    return std::nullopt;
  }
  TierTtls ttls{};
  ttls.raw = std::chrono::milliseconds(read_meta_int(raw_key, ttls.raw.count()));
  ttls.minute = std::chrono::milliseconds(read_meta_int(retention_key("minute", "configured_ms"), ttls.minute.count()));
  ttls.hour = std::chrono::milliseconds(read_meta_int(retention_key("hour", "configured_ms"), ttls.hour.count()));
  return ttls;
}

void TieredStore::save_configured_ttls(const TierTtls& ttls) {
  Transaction tx(*db_);
  write_meta(retention_key("raw", "configured_ms"), std::to_string(ttls.raw.count()));
  write_meta(retention_key("minute", "configured_ms"), std::to_string(ttls.minute.count()));
  write_meta(retention_key("hour", "configured_ms"), std::to_string(ttls.hour.count()));
  tx.commit();
}

int TieredStore::schema_version() { return static_cast<int>(read_meta_int(kMetaVersion, 0)); }

std::int64_t TieredStore::row_count(const model::Tier tier) {
  Statement count(*db_, std::string("SELECT COUNT(*) FROM ") + tier_table(tier));
  count.step();
  return count.column_int64(0);
}

Database& TieredStore::database() noexcept { return *db_; }

std::int64_t TieredStore::read_meta_int(const std::string& key, const std::int64_t fallback) {
  Statement select(*db_, "SELECT value FROM metadata WHERE key = ?1");
  select.bind(1, key);
  if (!select.step()) {
    return fallback;
  }
  try {
    return std::stoll(select.column_text(0));
  } catch (const std::exception&) {
    return fallback;
  }
}

bool TieredStore::has_meta(const std::string& key) {
  Statement select(*db_, "SELECT 1 FROM metadata WHERE key = ?1");
  select.bind(1, key);
  return select.step();
}

void TieredStore::write_meta(const std::string& key, const std::string& value) {
  Statement upsert(*db_, "INSERT OR REPLACE INTO metadata (key, value) VALUES (?1, ?2)");
  upsert.bind(1, key).bind(2, value);
  upsert.step();
}

void TieredStore::delete_meta(const std::string& key) {
  Statement remove(*db_, "DELETE FROM metadata WHERE key = ?1");
  remove.bind(1, key);
  remove.step();
}

}  // namespace netspeed::storage
