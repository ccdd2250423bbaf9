#pragma once

#include <string>
#include <ctime>
#include <cstdint>

// Format epoch seconds as a local ISO 8601 timestamp. Returns "-" for 0.
std::string format_epoch(std::uint64_t epoch_secs);

// Human-readable byte count: "512 B", "1.5 KiB", "70.0 MiB"
std::string format_bytes(std::uint64_t bytes);

