#pragma once
#include <string>
#include <cstdint>

namespace querycache {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Local calendar date (YYYY-MM-DD) for an epoch-millisecond timestamp
std::string local_date(uint64_t epoch_ms);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// True if `s` begins with `prefix`
bool starts_with(const std::string& s, const std::string& prefix);

// Lowercase hex encoding of raw bytes
std::string hex_encode(const unsigned char* data, size_t len);

// Human-readable byte count ("512B", "12.30KB", "1.50MB")
std::string format_bytes(uint64_t bytes);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace querycache
