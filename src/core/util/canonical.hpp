#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tokenvest::util {

std::int64_t unix_timestamp_now();

std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::optional<std::uint64_t> parse_uint64(std::string_view text);
std::optional<std::int64_t> parse_int64(std::string_view text);

// Identities and token addresses travel inside tab-separated journal lines and
// key=value files, so whitespace and control bytes are never allowed.
bool is_valid_identity(std::string_view value);

}  // namespace tokenvest::util
