#pragma once
#include <string>
#include <map>
#include <cstdint>

namespace hookrelay {

// ISO 8601 timestamp, UTC, millisecond precision ("2024-01-02T03:04:05.678Z")
std::string timestamp_now();

// Format an epoch-milliseconds value the same way as timestamp_now()
std::string format_iso8601(uint64_t epoch_ms);

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Replace the first occurrence of `from` (no-op when absent)
std::string replace_first(const std::string& str, const std::string& from, const std::string& to);

// Percent-decoding; '+' becomes a space (form/query encoding)
std::string url_decode(const std::string& s);

// Decode "a=1&b=2" into a map. Later duplicates win.
std::map<std::string, std::string> parse_form_urlencoded(const std::string& qs);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace hookrelay
