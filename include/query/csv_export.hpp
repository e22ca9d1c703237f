#pragma once

#include <ostream>
#include <string>

#include "query/query_engine.hpp"

namespace netspeed::query {

// One row per point: bucket_start,bucket_end,bytes_down,bytes_up,download_mbps,upload_mbps.
// Timestamps are ISO-8601 UTC.
void write_csv(std::ostream& out, const QueryResponse& response);

// Throws std::runtime_error when the file cannot be written.
void export_csv(const std::string& path, const QueryResponse& response);

[[nodiscard]] std::string format_utc(std::int64_t unix_ms);

}  // namespace netspeed::query
