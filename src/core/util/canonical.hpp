#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lift::util {

std::int64_t unix_timestamp_now();

std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string join_csv(const std::vector<std::string>& values);
std::vector<std::string> split_csv(std::string_view csv);

// Keeps the first occurrence of each value, in order.
std::vector<std::string> unique_values(std::vector<std::string> values);

// Shortest text form that parses back to the same double.
std::string format_double(double value);

// Rejects nan and inf along with malformed text.
std::optional<double> parse_double(std::string_view text);
std::optional<std::int64_t> parse_int64(std::string_view text);
std::optional<std::uint64_t> parse_uint64(std::string_view text);

std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

}  // namespace lift::util
