#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model/sample.hpp"
#include "storage/retention.hpp"
#include "storage/sqlite.hpp"

namespace netspeed::storage {

struct StoreOptions {
  std::string path{"netspeed.db"};
  // Extra time a bucket stays open after its end to absorb queue jitter.
  std::chrono::milliseconds finalization_delay{60'000};
  int busy_timeout_ms{5000};
  bool vacuum_after_prune{true};
};

enum class OpenOutcome : std::uint8_t {
  CREATED = 0,
  OPENED = 1,
  MIGRATED = 2,
  RECREATED = 3,
};

struct OpenReport {
  OpenOutcome outcome{OpenOutcome::CREATED};
  int found_version{0};
  // Where the previous file was moved (RECREATED) or copied (MIGRATED).
  std::string backup_path{};
  std::string reason{};
};

struct InsertReport {
  std::size_t samples_inserted{0};
  std::size_t samples_ignored{0};
  std::size_t discontinuities{0};
  std::size_t interface_updates{0};
};

struct RollupReport {
  std::size_t minute_buckets{0};
  std::size_t hour_buckets{0};
  std::int64_t minute_watermark_ms{0};
  std::int64_t hour_watermark_ms{0};
};

struct PruneReport {
  std::size_t raw_rows{0};
  std::size_t minute_rows{0};
  std::size_t hour_rows{0};
  std::size_t discontinuities{0};
  bool vacuumed{false};

  [[nodiscard]] std::size_t total() const noexcept { return raw_rows + minute_rows + hour_rows + discontinuities; }
};

// Single-file SQLite history across raw, minute and hour tiers. Owned by the
// writer thread; every mutation goes through this object.
class TieredStore {
 public:
  static constexpr int kSchemaVersion = 2;

  // Opens, migrates, or moves an unusable file aside and starts fresh.
  // Throws StoreError only when no usable store can be created at all.
  explicit TieredStore(StoreOptions options);

  TieredStore(const TieredStore&) = delete;
  TieredStore& operator=(const TieredStore&) = delete;

  [[nodiscard]] const OpenReport& open_report() const noexcept;

  // One transaction per batch. Samples are keyed by (interface, interval_start)
  // and never overwritten.
  InsertReport insert_batch(const std::vector<model::IngestItem>& items);

  // Upserts every not-yet-finalized minute and hour bucket from its source
  // rows, then advances the watermarks past buckets that are now final.
  RollupReport rollup(std::int64_t now_ms);

  // Deletes rows older than the effective TTLs, never touching rows a
  // non-finalized bucket still needs.
  PruneReport prune(const TierTtls& ttls, std::int64_t now_ms);

  [[nodiscard]] RetentionPolicy load_retention(const TierTtls& defaults, std::chrono::milliseconds grace_period);
  void save_retention(const RetentionPolicy& policy);

  // TTLs the config file asked for when they were last applied.
  [[nodiscard]] std::optional<TierTtls> load_configured_ttls();
  void save_configured_ttls(const TierTtls& ttls);

  [[nodiscard]] int schema_version();
  [[nodiscard]] std::int64_t row_count(model::Tier tier);
  [[nodiscard]] Database& database() noexcept;

 private:
  void open();
  void create_fresh();
  void create_schema();
  void configure_connection();
  void check_integrity();
  [[nodiscard]] int read_version();
  void migrate_v1_to_v2();
  std::string backup_copy(int version);
  std::string move_aside(const std::string& suffix);

  [[nodiscard]] std::int64_t read_meta_int(const std::string& key, std::int64_t fallback);
  [[nodiscard]] bool has_meta(const std::string& key);
  void write_meta(const std::string& key, const std::string& value);
  void delete_meta(const std::string& key);

  StoreOptions options_;
  OpenReport report_{};
  std::unique_ptr<Database> db_{};
};

const char* to_string(OpenOutcome outcome) noexcept;

}  // namespace netspeed::storage
