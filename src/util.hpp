#pragma once
#include <string>
#include <cstdint>

namespace convtrack {

// Unix epoch seconds
int64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Lowercase hex encoding of a byte buffer
std::string hex_encode(const unsigned char* data, size_t len);

// Parse a non-negative decimal integer. Returns false on any non-digit,
// empty input or overflow.
bool parse_int64(const std::string& s, int64_t& out);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never observe a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace convtrack
