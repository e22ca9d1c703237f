#include "sensors/counter_source.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

namespace netspeed::sensors {

namespace {

auto file_closer = [](std::FILE* file) {
  if (file != nullptr) {
    std::fclose(file);
  }
};
using file_ptr = std::unique_ptr<std::FILE, decltype(file_closer)>;

}  // namespace

SysfsCounterSource::SysfsCounterSource(std::string root, const bool include_loopback)
    : root_(std::move(root)), include_loopback_(include_loopback) {}

bool SysfsCounterSource::poll(CounterSnapshot& snapshot) noexcept {
  snapshot.clear();

  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    return false;
  }

  try {
    for (const auto& entry : it) {
      const std::string iface = entry.path().filename().string();
      if (iface == "lo" && !include_loopback_) {
        continue;
      }

      const std::string base = root_ + "/" + iface;
      InterfaceCounters counters{};
      // An interface that vanished between listing and reading is simply absent
      // from this snapshot.
      if (!read_u64_file(base + "/statistics/rx_bytes", counters.bytes_down) ||
          !read_u64_file(base + "/statistics/tx_bytes", counters.bytes_up)) {
        continue;
      }
      counters.description = read_first_line(base + "/address");
      snapshot.emplace(iface, std::move(counters));
    }
  } catch (const std::exception&) {
    snapshot.clear();
    return false;
  }

  return true;
}

bool SysfsCounterSource::read_u64_file(const std::string& path, std::uint64_t& value) noexcept {
  file_ptr file(std::fopen(path.c_str(), "r"), file_closer);
  if (file == nullptr) {
    value = 0;
    return false;
  }

  unsigned long long parsed = 0;
  if (std::fscanf(file.get(), "%llu", &parsed) != 1) {
    value = 0;
    return false;
  }

  value = static_cast<std::uint64_t>(parsed);
  return true;
}

std::string SysfsCounterSource::read_first_line(const std::string& path) noexcept {
  file_ptr file(std::fopen(path.c_str(), "r"), file_closer);
  if (file == nullptr) {
    return {};
  }

  char buffer[128] = {};
  if (std::fgets(buffer, sizeof(buffer), file.get()) == nullptr) {
    return {};
  }

  try {
    std::string line(buffer);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
      line.pop_back();
    }
    return line;
  } catch (const std::exception&) {
    return {};
  }
}

}  // namespace netspeed::sensors
