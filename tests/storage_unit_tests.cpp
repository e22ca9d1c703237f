#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <sqlite3.h>
#include <unistd.h>

#include "storage/retention.hpp"
#include "storage/sqlite.hpp"
#include "storage/tiered_store.hpp"
#include "storage/writer.hpp"

using netspeed::model::Discontinuity;
using netspeed::model::DiscontinuityReason;
using netspeed::model::IngestItem;
using netspeed::model::InterfaceUpdate;
using netspeed::model::Sample;
using netspeed::model::Tier;
using netspeed::storage::Database;
using netspeed::storage::IngestQueue;
using netspeed::storage::NoticeChannel;
using netspeed::storage::NoticeKind;
using netspeed::storage::OpenOutcome;
using netspeed::storage::RetentionPolicy;
using netspeed::storage::Statement;
using netspeed::storage::StoreOptions;
using netspeed::storage::StoreWriter;
using netspeed::storage::TieredStore;
using netspeed::storage::TierTtls;
using netspeed::storage::WriterOptions;

namespace {

// Hour-aligned base timestamp.
constexpr std::int64_t kT0 = 472'222LL * 3'600'000LL;
constexpr std::int64_t kMinute = 60'000;
constexpr std::int64_t kHour = 3'600'000;
constexpr std::int64_t kDay = 24 * kHour;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

void remove_store_files(const std::filesystem::path& path) {
  std::error_code ec;
  const std::string prefix = path.filename().string();
  for (const auto& entry : std::filesystem::directory_iterator(path.parent_path(), ec)) {
    if (entry.path().filename().string().rfind(prefix, 0) == 0) {
      std::filesystem::remove(entry.path(), ec);
    }
  }
}

std::filesystem::path temp_store(const std::string& name) {
  const auto path =
      std::filesystem::temp_directory_path() / ("netspeed_" + name + "_" + std::to_string(::getpid()) + ".db");
  remove_store_files(path);
  return path;
}

StoreOptions options_for(const std::filesystem::path& path) {
  StoreOptions options{};
  options.path = path.string();
  return options;
}

Sample sample_of(const std::string& id, std::int64_t start, std::int64_t end, std::uint64_t down, std::uint64_t up) {
  return Sample{.interface_id = id, .interval_start_ms = start, .interval_end_ms = end, .bytes_down = down, .bytes_up = up};
}

struct BucketRow {
  std::int64_t down{0};
  std::int64_t up{0};
  std::int64_t count{0};
  bool found{false};
};

BucketRow read_bucket(TieredStore& store, const char* table, const std::string& id, std::int64_t start) {
  Statement select(store.database(), std::string("SELECT bytes_down_total, bytes_up_total, sample_count FROM ") + table +
                                         " WHERE interface_id = ?1 AND bucket_start = ?2");
  select.bind(1, id).bind(2, start);
  if (!select.step()) {
    return {};
  }
  return BucketRow{select.column_int64(0), select.column_int64(1), select.column_int64(2), true};
}

std::vector<IngestItem> fixture_items() {
  return {InterfaceUpdate{.interface_id = "eth0", .name = "eth0", .description = "aa:bb", .seen_at_ms = kT0, .active = true},
          sample_of("eth0", kT0, kT0 + 30'000, 3000, 300),
          sample_of("eth0", kT0 + 30'000, kT0 + kMinute, 6000, 600),
          sample_of("eth0", kT0 + kMinute, kT0 + 90'000, 9000, 900),
          sample_of("wlan0", kT0, kT0 + kMinute, 1200, 0),
          Discontinuity{.interface_id = "eth0", .start_ms = kT0 + 90'000, .end_ms = kT0 + 90'000,
                        .reason = DiscontinuityReason::COUNTER_RESET}};
}

int test_fresh_store_insert_is_idempotent() {
  const auto path = temp_store("insert");
  TieredStore store(options_for(path));
  if (store.open_report().outcome != OpenOutcome::CREATED || store.schema_version() != TieredStore::kSchemaVersion) {
    return fail("test_fresh_store_insert_is_idempotent", "new file should be created at the current schema");
  }

  const auto first = store.insert_batch(fixture_items());
  if (first.samples_inserted != 4 || first.discontinuities != 1 || first.interface_updates != 1) {
    return fail("test_fresh_store_insert_is_idempotent", "first batch counts mismatch");
  }

  const auto again = store.insert_batch(fixture_items());
  if (again.samples_inserted != 0 || again.samples_ignored != 4 || store.row_count(Tier::RAW) != 4) {
    return fail("test_fresh_store_insert_is_idempotent", "re-inserted samples must be ignored");
  }

  remove_store_files(path);
  return 0;
}

int test_rollup_is_additive_and_idempotent() {
  const auto path = temp_store("rollup");
  TieredStore store(options_for(path));
  (void)store.insert_batch(fixture_items());

  const std::int64_t now = kT0 + 3 * kHour;
  const auto report = store.rollup(now);
  if (report.minute_watermark_ms != now - kMinute || report.hour_watermark_ms != kT0 + 2 * kHour) {
    return fail("test_rollup_is_additive_and_idempotent", "watermarks should trail now by the finalization delay");
  }

  const auto first_minute = read_bucket(store, "minute_buckets", "eth0", kT0);
  const auto second_minute = read_bucket(store, "minute_buckets", "eth0", kT0 + kMinute);
  if (first_minute.down != 9000 || first_minute.up != 900 || first_minute.count != 2) {
    return fail("test_rollup_is_additive_and_idempotent", "first minute should sum its two samples");
  }
  if (second_minute.down != 9000 || second_minute.count != 1) {
    return fail("test_rollup_is_additive_and_idempotent", "second minute should hold the third sample");
  }

  const auto hour = read_bucket(store, "hour_buckets", "eth0", kT0);
  if (hour.down != first_minute.down + second_minute.down || hour.up != 1800 || hour.count != 3) {
    return fail("test_rollup_is_additive_and_idempotent", "hour bucket should equal the sum of its minutes");
  }
  if (read_bucket(store, "hour_buckets", "wlan0", kT0).down != 1200) {
    return fail("test_rollup_is_additive_and_idempotent", "interfaces should roll up independently");
  }

  (void)store.rollup(now);
  (void)store.rollup(now + 1000);
  const auto hour_again = read_bucket(store, "hour_buckets", "eth0", kT0);
  if (hour_again.down != hour.down || hour_again.count != hour.count || store.row_count(Tier::MINUTE) != 3 ||
      store.row_count(Tier::HOUR) != 2) {
    return fail("test_rollup_is_additive_and_idempotent", "repeated rollups must not change results");
  }

  remove_store_files(path);
  return 0;
}

int test_open_bucket_absorbs_rows_and_late_rows_are_not_folded() {
  const auto path = temp_store("late");
  TieredStore store(options_for(path));
  (void)store.insert_batch({sample_of("eth0", kT0, kT0 + 20'000, 100, 0)});

  // Bucket kT0 is still inside the finalization delay.
  (void)store.rollup(kT0 + 30'000);
  (void)store.insert_batch({sample_of("eth0", kT0 + 20'000, kT0 + 40'000, 200, 0)});
  (void)store.rollup(kT0 + 45'000);
  if (read_bucket(store, "minute_buckets", "eth0", kT0).down != 300) {
    return fail("test_open_bucket_absorbs_rows_and_late_rows_are_not_folded", "open bucket should absorb new rows");
  }

  (void)store.rollup(kT0 + 10 * kMinute);
  (void)store.insert_batch({sample_of("eth0", kT0 + 40'000, kT0 + 50'000, 5000, 0)});
  (void)store.rollup(kT0 + 11 * kMinute);
  if (read_bucket(store, "minute_buckets", "eth0", kT0).down != 300) {
    return fail("test_open_bucket_absorbs_rows_and_late_rows_are_not_folded", "finalized bucket must not change");
  }
  if (store.row_count(Tier::RAW) != 3) {
    return fail("test_open_bucket_absorbs_rows_and_late_rows_are_not_folded", "late row should still be stored");
  }

  remove_store_files(path);
  return 0;
}

int test_retention_request_rules() {
  RetentionPolicy policy{};
  policy.current = TierTtls{std::chrono::hours(24 * 30), std::chrono::hours(24 * 30), std::chrono::hours(24 * 365)};
  policy.grace_period = std::chrono::hours(48);

  TierTtls shorter = policy.current;
  shorter.raw = std::chrono::hours(24 * 7);
  netspeed::storage::request_retention(policy, shorter, 1000);
  if (policy.current.raw != std::chrono::hours(24 * 30) || !policy.pending_raw.has_value()) {
    return fail("test_retention_request_rules", "shortening should wait for the grace period");
  }

  netspeed::storage::request_retention(policy, shorter, 5000);
  if (policy.pending_raw->requested_at_ms != 1000) {
    return fail("test_retention_request_rules", "re-requesting a pending value keeps its request time");
  }

  TierTtls undo = policy.current;
  netspeed::storage::request_retention(policy, undo, 6000);
  if (policy.has_pending()) {
    return fail("test_retention_request_rules", "requesting the current value cancels the pending change");
  }

  TierTtls longer = policy.current;
  longer.hour = std::chrono::hours(24 * 730);
  netspeed::storage::request_retention(policy, longer, 7000);
  if (policy.current.hour != std::chrono::hours(24 * 730) || policy.has_pending()) {
    return fail("test_retention_request_rules", "lengthening applies immediately");
  }

  return 0;
}

// 30 d -> 7 d keeps 10-day-old raw rows until the grace period has elapsed.
int test_retention_grace_period_protects_rows() {
  const auto path = temp_store("grace");
  const std::int64_t now = kT0 + 10 * kDay;
  const TierTtls configured{std::chrono::hours(24 * 30), std::chrono::hours(24 * 30), std::chrono::hours(24 * 365)};

  RetentionPolicy policy{};
  {
    TieredStore store(options_for(path));
    (void)store.insert_batch(fixture_items());
    (void)store.rollup(now);

    policy = store.load_retention(configured, std::chrono::hours(48));
    TierTtls shorter = configured;
    shorter.raw = std::chrono::hours(24 * 7);
    netspeed::storage::request_retention(policy, shorter, now);
    store.save_retention(policy);

    if (store.prune(policy.current, now).raw_rows != 0 || store.row_count(Tier::RAW) != 4) {
      return fail("test_retention_grace_period_protects_rows", "rows must survive right after shortening");
    }
  }

  TieredStore reopened(options_for(path));
  auto loaded = reopened.load_retention(configured, std::chrono::hours(48));
  if (!loaded.pending_raw.has_value() || loaded.pending_raw->requested_at_ms != now ||
      loaded.pending_raw->ttl != std::chrono::hours(24 * 7)) {
    return fail("test_retention_grace_period_protects_rows", "pending shortening should persist across reopen");
  }

  const std::int64_t almost = now + 47 * kHour;
  if (netspeed::storage::settle_retention(loaded, almost) || reopened.prune(loaded.current, almost).raw_rows != 0) {
    return fail("test_retention_grace_period_protects_rows", "rows must survive inside the grace period");
  }

  const std::int64_t elapsed = now + 48 * kHour;
  if (!netspeed::storage::settle_retention(loaded, elapsed) || loaded.current.raw != std::chrono::hours(24 * 7)) {
    return fail("test_retention_grace_period_protects_rows", "shortening should apply after the grace period");
  }
  (void)reopened.rollup(elapsed);
  const auto pruned = reopened.prune(loaded.current, elapsed);
  if (pruned.raw_rows != 4 || reopened.row_count(Tier::RAW) != 0 || !pruned.vacuumed) {
    return fail("test_retention_grace_period_protects_rows", "expired raw rows should be pruned");
  }
  if (reopened.row_count(Tier::MINUTE) != 3) {
    return fail("test_retention_grace_period_protects_rows", "minute rows keep their own retention");
  }

  remove_store_files(path);
  return 0;
}

void write_v1_fixture(const std::filesystem::path& path, const std::string& version) {
  Database db(path.string(), Database::Mode::READ_WRITE);
  db.exec(R"sql(
CREATE TABLE metadata (key TEXT PRIMARY KEY, value TEXT NOT NULL);
CREATE TABLE raw_samples (
  interface_id TEXT NOT NULL, interval_start INTEGER NOT NULL, interval_end INTEGER NOT NULL,
  bytes_down INTEGER NOT NULL, bytes_up INTEGER NOT NULL,
  PRIMARY KEY (interface_id, interval_start)) WITHOUT ROWID;
CREATE TABLE minute_buckets (
  interface_id TEXT NOT NULL, bucket_start INTEGER NOT NULL, bytes_down_total INTEGER NOT NULL,
  bytes_up_total INTEGER NOT NULL, bytes_down_max_rate REAL NOT NULL, bytes_up_max_rate REAL NOT NULL,
  sample_count INTEGER NOT NULL, PRIMARY KEY (interface_id, bucket_start)) WITHOUT ROWID;
CREATE TABLE hour_buckets (
  interface_id TEXT NOT NULL, bucket_start INTEGER NOT NULL, bytes_down_total INTEGER NOT NULL,
  bytes_up_total INTEGER NOT NULL, bytes_down_max_rate REAL NOT NULL, bytes_up_max_rate REAL NOT NULL,
  sample_count INTEGER NOT NULL, PRIMARY KEY (interface_id, bucket_start)) WITHOUT ROWID;
INSERT INTO raw_samples VALUES ('eth0', 1000, 2000, 500, 50);
INSERT INTO minute_buckets VALUES ('eth0', 0, 500, 50, 500.0, 50.0, 1);
)sql");
  db.exec("INSERT INTO metadata VALUES ('db_version', '" + version + "')");
}

int test_v1_store_is_migrated_in_place() {
  const auto path = temp_store("v1");
  write_v1_fixture(path, "1");

  TieredStore store(options_for(path));
  const auto& report = store.open_report();
  if (report.outcome != OpenOutcome::MIGRATED || report.found_version != 1) {
    return fail("test_v1_store_is_migrated_in_place", "v1 store should be migrated");
  }
  if (report.backup_path.find(".bak.v1_") == std::string::npos || !std::filesystem::exists(report.backup_path)) {
    return fail("test_v1_store_is_migrated_in_place", "a v1 backup copy should be kept");
  }
  if (store.schema_version() != 2 || store.row_count(Tier::RAW) != 1 || store.row_count(Tier::MINUTE) != 1) {
    return fail("test_v1_store_is_migrated_in_place", "data should survive the migration");
  }

  Statement freshness(store.database(), "SELECT last_interval_end FROM minute_buckets WHERE interface_id = 'eth0'");
  if (!freshness.step() || freshness.column_int64(0) != kMinute) {
    return fail("test_v1_store_is_migrated_in_place", "migrated buckets should be marked complete");
  }

  Statement interfaces(store.database(), "SELECT COUNT(*) FROM interfaces WHERE interface_id = 'eth0'");
  if (!interfaces.step() || interfaces.column_int64(0) != 1) {
    return fail("test_v1_store_is_migrated_in_place", "interfaces should be backfilled from raw samples");
  }

  remove_store_files(path);
  return 0;
}

int test_unknown_version_is_moved_aside() {
  const auto path = temp_store("future");
  write_v1_fixture(path, "9");

  TieredStore store(options_for(path));
  const auto& report = store.open_report();
  if (report.outcome != OpenOutcome::RECREATED || report.found_version != 9) {
    return fail("test_unknown_version_is_moved_aside", "unknown version should be recreated");
  }
  if (report.backup_path.find(".bak.v9_") == std::string::npos || !std::filesystem::exists(report.backup_path)) {
    return fail("test_unknown_version_is_moved_aside", "previous file should be preserved under a versioned name");
  }
  if (store.schema_version() != 2 || store.row_count(Tier::RAW) != 0) {
    return fail("test_unknown_version_is_moved_aside", "new store should start empty at the current schema");
  }

  remove_store_files(path);
  return 0;
}

int test_corrupt_file_is_moved_aside() {
  const auto path = temp_store("corrupt");
  {
    std::ofstream out(path, std::ios::binary);
    for (int i = 0; i < 64; ++i) {
      out << "this is not a database file, only text pretending to be one.\n";
    }
  }

  TieredStore store(options_for(path));
  const auto& report = store.open_report();
  if (report.outcome != OpenOutcome::RECREATED || report.backup_path.find(".corrupt_") == std::string::npos) {
    return fail("test_corrupt_file_is_moved_aside", "corrupt store should be renamed aside");
  }
  if (!std::filesystem::exists(report.backup_path) || store.schema_version() != 2) {
    return fail("test_corrupt_file_is_moved_aside", "backup should exist and the new store be usable");
  }

  remove_store_files(path);
  return 0;
}

int test_writer_drains_queue_on_stop() {
  const auto path = temp_store("writer");
  IngestQueue queue(64);
  NoticeChannel notices(8);

  WriterOptions options{};
  options.flush_interval = std::chrono::milliseconds(20);
  const std::int64_t now = kT0 + 3 * kHour;
  {
    StoreWriter writer(options_for(path), options, TierTtls{}, std::chrono::hours(48), queue, notices,
                       [now] { return now; });
    writer.start();
    for (auto& item : fixture_items()) {
      queue.push(std::move(item));
    }
    writer.stop();

    const auto stats = writer.stats();
    if (stats.items_written != 6 || stats.degraded || stats.items_lost != 0) {
      return fail("test_writer_drains_queue_on_stop", "every queued item should be written before exit");
    }
  }

  if (notices.size() != 0) {
    return fail("test_writer_drains_queue_on_stop", "a healthy store should not post notices");
  }

  TieredStore store(options_for(path));
  if (store.row_count(Tier::RAW) != 4 || store.row_count(Tier::MINUTE) != 3 || store.row_count(Tier::HOUR) != 2) {
    return fail("test_writer_drains_queue_on_stop", "writer should persist and roll up on shutdown");
  }

  remove_store_files(path);
  return 0;
}

int test_writer_degrades_with_one_notice() {
  IngestQueue queue(64);
  NoticeChannel notices(8);

  StoreOptions store_options{};
  store_options.path = "/nonexistent-netspeed-dir/history.db";
  WriterOptions options{};
  options.flush_interval = std::chrono::milliseconds(20);

  StoreWriter writer(store_options, options, TierTtls{}, std::chrono::hours(48), queue, notices, [] { return kT0; });
  writer.start();
  for (auto& item : fixture_items()) {
    queue.push(std::move(item));
  }
  writer.stop();

  const auto stats = writer.stats();
  if (!stats.degraded || stats.items_lost != 6 || stats.items_written != 0) {
    return fail("test_writer_degrades_with_one_notice", "unwritable store should drop batches and count them");
  }

  const auto notice = notices.try_pop();
  if (!notice.has_value() || notice->kind != NoticeKind::STORE_DEGRADED || notices.try_pop().has_value()) {
    return fail("test_writer_degrades_with_one_notice", "exactly one degraded notice expected");
  }

  return 0;
}

RetentionPolicy run_writer_once(const std::filesystem::path& path, const TierTtls& configured, std::int64_t now,
                                const TierTtls* requested) {
  IngestQueue queue(64);
  NoticeChannel notices(8);
  WriterOptions options{};
  options.flush_interval = std::chrono::milliseconds(20);
  {
    StoreWriter writer(options_for(path), options, configured, std::chrono::hours(48), queue, notices,
                       [now] { return now; });
    writer.start();
    if (requested != nullptr) {
      writer.request_retention(*requested);
    }
    for (auto& item : fixture_items()) {
      queue.push(std::move(item));
    }
    writer.stop();
  }
  TieredStore store(options_for(path));
  return store.load_retention(configured, std::chrono::hours(48));
}

int test_pending_shortening_survives_writer_restart() {
  const auto path = temp_store("restart");
  const std::int64_t now = kT0 + 10 * kDay;
  const TierTtls configured{std::chrono::hours(24 * 30), std::chrono::hours(24 * 30), std::chrono::hours(24 * 365)};
  TierTtls shorter = configured;
  shorter.raw = std::chrono::hours(24 * 7);

  auto policy = run_writer_once(path, configured, now, &shorter);
  if (!policy.pending_raw.has_value() || policy.pending_raw->ttl != shorter.raw) {
    return fail("test_pending_shortening_survives_writer_restart", "requested shortening should be pending");
  }

  policy = run_writer_once(path, configured, now + kHour, nullptr);
  if (!policy.pending_raw.has_value() || policy.pending_raw->requested_at_ms != now ||
      policy.current.raw != configured.raw) {
    return fail("test_pending_shortening_survives_writer_restart", "restart with the same config must keep it pending");
  }

  TierTtls longer = configured;
  longer.raw = std::chrono::hours(24 * 60);
  policy = run_writer_once(path, longer, now + 2 * kHour, nullptr);
  if (policy.pending_raw.has_value() || policy.current.raw != longer.raw) {
    return fail("test_pending_shortening_survives_writer_restart", "an edited config should apply its TTLs");
  }

  remove_store_files(path);
  return 0;
}

std::int64_t count_raw(Database& db) {
  Statement count(db, "SELECT COUNT(*) FROM raw_samples");
  count.step();
  return count.column_int64(0);
}

int test_read_transaction_keeps_one_snapshot() {
  const auto path = temp_store("snapshot");
  TieredStore store(options_for(path));
  (void)store.insert_batch(fixture_items());

  Database reader(path.string(), Database::Mode::READ_ONLY);
  {
    netspeed::storage::ReadTransaction snapshot(reader);
    if (count_raw(reader) != 4) {
      return fail("test_read_transaction_keeps_one_snapshot", "reader should see the committed rows");
    }
    (void)store.insert_batch({sample_of("eth0", kT0 + 90'000, kT0 + 91'000, 100, 10)});
    if (count_raw(reader) != 4) {
      return fail("test_read_transaction_keeps_one_snapshot", "a commit mid-read must not leak into the snapshot");
    }
  }
  if (count_raw(reader) != 5) {
    return fail("test_read_transaction_keeps_one_snapshot", "the next read should see the new row");
  }

  try {
    Statement missing(reader, "SELECT * FROM no_such_table");
    return fail("test_read_transaction_keeps_one_snapshot", "preparing against a missing table should throw");
  } catch (const netspeed::storage::StoreError& ex) {
    if (ex.code() != SQLITE_ERROR) {
      return fail("test_read_transaction_keeps_one_snapshot", "store error should carry the sqlite result code");
    }
  }

  remove_store_files(path);
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_fresh_store_insert_is_idempotent(); rc != 0) return rc;
  if (int rc = test_rollup_is_additive_and_idempotent(); rc != 0) return rc;
  if (int rc = test_open_bucket_absorbs_rows_and_late_rows_are_not_folded(); rc != 0) return rc;
  if (int rc = test_retention_request_rules(); rc != 0) return rc;
  if (int rc = test_retention_grace_period_protects_rows(); rc != 0) return rc;
  if (int rc = test_v1_store_is_migrated_in_place(); rc != 0) return rc;
  if (int rc = test_unknown_version_is_moved_aside(); rc != 0) return rc;
  if (int rc = test_corrupt_file_is_moved_aside(); rc != 0) return rc;
  if (int rc = test_writer_drains_queue_on_stop(); rc != 0) return rc;
  if (int rc = test_writer_degrades_with_one_notice(); rc != 0) return rc;
  if (int rc = test_pending_shortening_survives_writer_restart(); rc != 0) return rc;
  if (int rc = test_read_transaction_keeps_one_snapshot(); rc != 0) return rc;

  std::cout << "[PASS] storage unit tests\n";
  return 0;
}
