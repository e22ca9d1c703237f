#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "core/interface_registry.hpp"
#include "core/sampler.hpp"
#include "sensors/counter_source.hpp"

using netspeed::core::InterfacePhase;
using netspeed::core::InterfaceRegistry;
using netspeed::core::Sampler;
using netspeed::core::SamplerOptions;
using netspeed::model::DiscontinuityReason;
using netspeed::model::InterfaceUpdate;
using netspeed::sensors::CounterSnapshot;
using netspeed::sensors::InterfaceCounters;
using netspeed::sensors::SysfsCounterSource;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return static_cast<bool>(out);
}

bool write_interface(const std::filesystem::path& root, const std::string& name, const std::string& rx,
                     const std::string& tx, const std::string& address) {
  const auto base = root / name;
  return write_file(base / "statistics" / "rx_bytes", rx) && write_file(base / "statistics" / "tx_bytes", tx) &&
         write_file(base / "address", address);
}

CounterSnapshot snapshot_of(const std::string& name, std::uint64_t down, std::uint64_t up,
                            const std::string& description = "") {
  CounterSnapshot snapshot;
  snapshot.emplace(name, InterfaceCounters{.bytes_down = down, .bytes_up = up, .description = description});
  return snapshot;
}

int test_sysfs_counter_source_with_injected_tree() {
  const auto root = std::filesystem::temp_directory_path() / ("netspeed_sysfs_" + std::to_string(::getpid()));
  std::filesystem::remove_all(root);

  if (!write_interface(root, "eth0", "123456\n", "6543\n", "aa:bb:cc:dd:ee:ff\n") ||
      !write_interface(root, "lo", "999\n", "999\n", "00:00:00:00:00:00\n") ||
      !write_file(root / "broken" / "statistics" / "rx_bytes", "not-a-number\n")) {
    return fail("test_sysfs_counter_source_with_injected_tree", "failed writing sysfs fixture");
  }

  SysfsCounterSource source(root.string());
  CounterSnapshot snapshot;
  if (!source.poll(snapshot)) {
    return fail("test_sysfs_counter_source_with_injected_tree", "poll should succeed");
  }

  if (snapshot.size() != 1 || snapshot.count("eth0") != 1) {
    return fail("test_sysfs_counter_source_with_injected_tree", "only eth0 should be reported");
  }

  const auto& eth0 = snapshot.at("eth0");
  if (eth0.bytes_down != 123456 || eth0.bytes_up != 6543 || eth0.description != "aa:bb:cc:dd:ee:ff") {
    return fail("test_sysfs_counter_source_with_injected_tree", "eth0 counters or address mismatch");
  }

  SysfsCounterSource with_loopback(root.string(), true);
  if (!with_loopback.poll(snapshot) || snapshot.count("lo") != 1) {
    return fail("test_sysfs_counter_source_with_injected_tree", "loopback should be reported when enabled");
  }

  std::filesystem::remove_all(root);
  SysfsCounterSource missing(root.string());
  if (missing.poll(snapshot)) {
    return fail("test_sysfs_counter_source_with_injected_tree", "poll should fail for a missing root");
  }

  return 0;
}

int test_registry_tracks_identity_changes() {
  InterfaceRegistry registry(std::chrono::milliseconds(0));
  std::vector<InterfaceUpdate> updates;

  if (registry.observe("eth0", "aa:aa", 1000, updates) != "eth0" || updates.size() != 1) {
    return fail("test_registry_tracks_identity_changes", "first observation should create eth0");
  }

  updates.clear();
  if (registry.observe("eth0", "aa:aa", 2000, updates) != "eth0" || !updates.empty()) {
    return fail("test_registry_tracks_identity_changes", "repeat observation should be silent");
  }

  if (registry.observe("eth0", "bb:bb", 3000, updates) != "eth0#2" || updates.size() != 1) {
    return fail("test_registry_tracks_identity_changes", "new hardware under the same name needs a new id");
  }

  if (registry.observe("eth0", "", 4000, updates) != "eth0#2") {
    return fail("test_registry_tracks_identity_changes", "missing description should reuse latest id");
  }

  if (registry.observe("eth0", "aa:aa", 5000, updates) != "eth0") {
    return fail("test_registry_tracks_identity_changes", "original hardware should map back to eth0");
  }

  if (registry.size() != 2) {
    return fail("test_registry_tracks_identity_changes", "expected two records");
  }

  updates.clear();
  const auto inactive = registry.sweep(6000, updates);
  if (inactive.size() != 2 || updates.size() != 2 || updates.front().active) {
    return fail("test_registry_tracks_identity_changes", "sweep should mark unseen records inactive");
  }

  return 0;
}

int test_sampler_baselines_then_emits_delta() {
  Sampler sampler;

  auto first = sampler.tick(snapshot_of("eth0", 1000, 500), 1000);
  if (!first.samples.empty() || first.interface_updates.size() != 1) {
    return fail("test_sampler_baselines_then_emits_delta", "first reading must only baseline");
  }
  if (sampler.phase("eth0") != InterfacePhase::BASELINING) {
    return fail("test_sampler_baselines_then_emits_delta", "interface should be baselining");
  }

  auto second = sampler.tick(snapshot_of("eth0", 6000, 1500), 6000);
  if (second.samples.size() != 1) {
    return fail("test_sampler_baselines_then_emits_delta", "second reading should emit one sample");
  }

  const auto& sample = second.samples.front();
  if (sample.interval_start_ms != 1000 || sample.interval_end_ms != 6000 || sample.bytes_down != 5000 ||
      sample.bytes_up != 1000) {
    return fail("test_sampler_baselines_then_emits_delta", "delta or interval bounds mismatch");
  }
  if (sample.rate_down_bps() != 1000.0 || sample.rate_up_bps() != 200.0) {
    return fail("test_sampler_baselines_then_emits_delta", "rate should be bytes over duration");
  }
  if (sampler.phase("eth0") != InterfacePhase::TRACKING) {
    return fail("test_sampler_baselines_then_emits_delta", "interface should be tracking");
  }

  return 0;
}

int test_sampler_counter_reset_rebaselines() {
  Sampler sampler;
  (void)sampler.tick(snapshot_of("eth0", 10'000, 10'000), 1000);
  (void)sampler.tick(snapshot_of("eth0", 12'000, 11'000), 2000);

  auto reset = sampler.tick(snapshot_of("eth0", 100, 11'500), 3000);
  if (!reset.samples.empty()) {
    return fail("test_sampler_counter_reset_rebaselines", "a decreasing counter must not produce a sample");
  }
  if (reset.discontinuities.size() != 1 || reset.discontinuities.front().reason != DiscontinuityReason::COUNTER_RESET) {
    return fail("test_sampler_counter_reset_rebaselines", "expected one counter_reset marker");
  }

  auto after = sampler.tick(snapshot_of("eth0", 600, 11'700), 4000);
  if (after.samples.size() != 1 || after.samples.front().bytes_down != 500 || after.samples.front().bytes_up != 200) {
    return fail("test_sampler_counter_reset_rebaselines", "delta should resume from the new baseline");
  }

  return 0;
}

int test_sampler_clock_jump_records_gap() {
  Sampler sampler;
  (void)sampler.tick(snapshot_of("eth0", 0, 0), 10'000);

  auto jumped = sampler.tick(snapshot_of("eth0", 100, 100), 9'000);
  if (!jumped.samples.empty() || jumped.discontinuities.size() != 1 ||
      jumped.discontinuities.front().reason != DiscontinuityReason::CLOCK_JUMP) {
    return fail("test_sampler_clock_jump_records_gap", "backwards clock should produce a clock_jump marker");
  }

  auto next = sampler.tick(snapshot_of("eth0", 300, 100), 10'000);
  if (next.samples.size() != 1 || next.samples.front().interval_start_ms != 9'000 ||
      next.samples.front().bytes_down != 200) {
    return fail("test_sampler_clock_jump_records_gap", "sampling should continue from the post-jump reading");
  }

  return 0;
}

int test_sampler_disappearing_interface_starts_over() {
  Sampler sampler;
  (void)sampler.tick(snapshot_of("eth0", 0, 0), 1000);
  (void)sampler.tick(snapshot_of("eth0", 100, 0), 2000);

  auto gone = sampler.tick(CounterSnapshot{}, 3000);
  if (gone.interface_updates.size() != 1 || gone.interface_updates.front().active) {
    return fail("test_sampler_disappearing_interface_starts_over", "vanished interface should be reported inactive");
  }
  if (sampler.phase("eth0").has_value()) {
    return fail("test_sampler_disappearing_interface_starts_over", "baseline should be dropped");
  }

  auto back = sampler.tick(snapshot_of("eth0", 5000, 0), 4000);
  if (!back.samples.empty()) {
    return fail("test_sampler_disappearing_interface_starts_over", "reappearance must baseline first");
  }
  if (back.interface_updates.size() != 1 || !back.interface_updates.front().active) {
    return fail("test_sampler_disappearing_interface_starts_over", "reappearance should mark the interface active");
  }

  return 0;
}

int test_sampler_cadence_backoff_is_bounded() {
  SamplerOptions options{};
  options.min_interval = std::chrono::milliseconds(1000);
  options.max_interval = std::chrono::milliseconds(4000);
  options.idle_ticks_before_backoff = 2;
  Sampler sampler(options);

  std::int64_t now = 1000;
  (void)sampler.tick(snapshot_of("eth0", 0, 0), now);
  const std::vector<std::int64_t> expected{1000, 2000, 4000, 4000};
  for (const auto interval : expected) {
    now += sampler.interval().count();
    (void)sampler.tick(snapshot_of("eth0", 0, 0), now);
    if (sampler.interval().count() != interval) {
      return fail("test_sampler_cadence_backoff_is_bounded", "idle backoff sequence mismatch");
    }
  }

  now += sampler.interval().count();
  (void)sampler.tick(snapshot_of("eth0", 1, 0), now);
  if (sampler.interval().count() != 1000) {
    return fail("test_sampler_cadence_backoff_is_bounded", "activity should snap back to the minimum interval");
  }

  sampler.skip_tick();
  if (sampler.skipped_ticks() != 1 || sampler.interval().count() != 1000) {
    return fail("test_sampler_cadence_backoff_is_bounded", "skipped tick should not touch cadence");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sysfs_counter_source_with_injected_tree(); rc != 0) return rc;
  if (int rc = test_registry_tracks_identity_changes(); rc != 0) return rc;
  if (int rc = test_sampler_baselines_then_emits_delta(); rc != 0) return rc;
  if (int rc = test_sampler_counter_reset_rebaselines(); rc != 0) return rc;
  if (int rc = test_sampler_clock_jump_records_gap(); rc != 0) return rc;
  if (int rc = test_sampler_disappearing_interface_starts_over(); rc != 0) return rc;
  if (int rc = test_sampler_cadence_backoff_is_bounded(); rc != 0) return rc;

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
