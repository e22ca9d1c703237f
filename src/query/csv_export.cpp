#include "query/csv_export.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace netspeed::query {

namespace {

double to_mbps(const double bytes_per_second) { return bytes_per_second * 8.0 / 1'000'000.0; }

}  // namespace

std::string format_utc(const std::int64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    return {};
  }

  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buffer, written);
}

void write_csv(std::ostream& out, const QueryResponse& response) {
  out << "bucket_start,bucket_end,bytes_down,bytes_up,download_mbps,upload_mbps\n";
  char rates[64];
  for (const auto& point : response.points) {
    std::snprintf(rates, sizeof(rates), "%.3f,%.3f", to_mbps(point.mean_rate_down_bps()),
                  to_mbps(point.mean_rate_up_bps()));
    out << format_utc(point.bucket_start_ms) << ',' << format_utc(point.bucket_end_ms) << ',' << point.bytes_down << ','
        << point.bytes_up << ',' << rates << '\n';
  }
}

void export_csv(const std::string& path, const QueryResponse& response) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("unable to open export file: " + path);
  }
  write_csv(out, response);
  out.flush();
  if (!out) {
    throw std::runtime_error("failed writing export file: " + path);
  }
}

}  // namespace netspeed::query
