#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "model/sample.hpp"

namespace netspeed::core {

struct InterfaceRecord {
  model::InterfaceId id{};
  std::string name{};
  std::string description{};
  std::int64_t first_seen_ms{0};
  std::int64_t last_seen_ms{0};
  bool active{true};
};

// Session-scoped identity table. Records are created on first observation and
// never removed; they only flip between active and inactive.
class InterfaceRegistry {
 public:
  explicit InterfaceRegistry(std::chrono::milliseconds inactive_after = std::chrono::milliseconds{0});

  // Resolves the stable id for an observed adapter. Appends an update when the
  // record is new, reactivated, or its description was learned.
  model::InterfaceId observe(const std::string& name, const std::string& description, std::int64_t now_ms,
                             std::vector<model::InterfaceUpdate>& updates);

  // Marks active records not observed at now_ms as inactive once they have been
  // unseen for the configured span. Returns the ids that went inactive.
  std::vector<model::InterfaceId> sweep(std::int64_t now_ms, std::vector<model::InterfaceUpdate>& updates);

  [[nodiscard]] std::size_t size() const noexcept;

 private:
  model::InterfaceId allocate_id(const std::string& name);
  static model::InterfaceUpdate to_update(const InterfaceRecord& record);

  std::chrono::milliseconds inactive_after_{0};
  std::map<model::InterfaceId, InterfaceRecord> records_{};
  std::map<std::pair<std::string, std::string>, model::InterfaceId> by_identity_{};
  std::map<std::string, model::InterfaceId> latest_by_name_{};
  std::map<std::string, std::uint32_t> name_variants_{};
};

}  // namespace netspeed::core
