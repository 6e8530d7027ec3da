#pragma once

#include <string>
#include <cstdint>

// Format an uptime in seconds as the two largest units, e.g. "3d4h", "2h15m",
// "42m". Under a minute shows seconds ("45s"). Returns "-" for <= 0.
std::string format_uptime(double seconds);

// Format a millisecond epoch timestamp as local "YYYY-MM-DD HH:MM:SS".
// Returns "-" for <= 0.
std::string format_epoch_ms(int64_t epoch_ms);

// Format a byte count as gigabytes with two decimals ("3.50 GB").
// Non-positive values render as "0.00 GB".
std::string format_gb(double bytes);

// Format a 0.0-1.0 fraction as a percentage with two decimals.
// Out-of-range input is rendered as-is ("140.00%").
std::string format_percent(double fraction);
