#include "core/interface_registry.hpp"

#include <iostream>

namespace netspeed::core {

InterfaceRegistry::InterfaceRegistry(const std::chrono::milliseconds inactive_after) : inactive_after_(inactive_after) {}

model::InterfaceId InterfaceRegistry::observe(const std::string& name, const std::string& description,
                                              const std::int64_t now_ms,
                                              std::vector<model::InterfaceUpdate>& updates) {
  model::InterfaceId id;

  const auto exact = by_identity_.find({name, description});
  if (exact != by_identity_.end()) {
    id = exact->second;
  } else {
    const auto latest = latest_by_name_.find(name);
    if (latest != latest_by_name_.end()) {
      auto& existing = records_.at(latest->second);
      if (description.empty() || existing.description.empty()) {
        // No hardware identity to compare; keep the current record and learn
        // the description if one just appeared.
        id = existing.id;
        if (existing.description.empty() && !description.empty()) {
          existing.description = description;
          updates.push_back(to_update(existing));
        }
      } else {
        id = allocate_id(name);
        std::cerr << "[registry] adapter " << name << " changed identity (" << existing.description << " -> "
                  << description << "); tracking as " << id << '\n';
      }
    } else {
      id = allocate_id(name);
    }
    by_identity_[{name, description}] = id;
  }

  latest_by_name_[name] = id;

  auto [it, inserted] = records_.try_emplace(id);
  InterfaceRecord& record = it->second;
  if (inserted) {
    record.id = id;
    record.name = name;
    record.description = description;
    record.first_seen_ms = now_ms;
    record.last_seen_ms = now_ms;
    record.active = true;
    updates.push_back(to_update(record));
    return id;
  }

  record.last_seen_ms = now_ms;
  if (!record.active) {
    record.active = true;
    updates.push_back(to_update(record));
  }
  return id;
}

std::vector<model::InterfaceId> InterfaceRegistry::sweep(const std::int64_t now_ms,
                                                         std::vector<model::InterfaceUpdate>& updates) {
  std::vector<model::InterfaceId> went_inactive;
  for (auto& [id, record] : records_) {
    if (!record.active || record.last_seen_ms >= now_ms) {
      continue;
    }
    if (now_ms - record.last_seen_ms < inactive_after_.count()) {
      continue;
    }
    record.active = false;
    went_inactive.push_back(id);
    auto update = to_update(record);
    update.seen_at_ms = now_ms;
    updates.push_back(std::move(update));
  }
  return went_inactive;
}

std::size_t InterfaceRegistry::size() const noexcept { return records_.size(); }

model::InterfaceId InterfaceRegistry::allocate_id(const std::string& name) {
  const std::uint32_t variant = ++name_variants_[name];
  if (variant == 1) {
    return name;
  }
  return name + "#" + std::to_string(variant);
}

model::InterfaceUpdate InterfaceRegistry::to_update(const InterfaceRecord& record) {
  return model::InterfaceUpdate{.interface_id = record.id,
                                .name = record.name,
                                .description = record.description,
                                .seen_at_ms = record.last_seen_ms,
                                .active = record.active};
}

}  // namespace netspeed::core
