#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

using Bytes = std::vector<std::uint8_t>;

std::string encode_base64(const std::uint8_t* data, std::size_t size);
std::string encode_base64(const Bytes& data);

/**
 * Decodes standard or URL-safe base64. Whitespace is ignored and padding is
 * optional. Returns std::nullopt on any other character or a truncated
 * final quantum.
 */
std::optional<Bytes> decode_base64(std::string_view text);

bool is_http_url(std::string_view value);

std::uint64_t current_timestamp_millis();

/**
 * Millisecond timestamp with a per-process sequence suffix, so two ids made
 * in the same millisecond still differ.
 */
std::string make_timestamp_id();

std::string trim_trailing_slashes(std::string value);
std::string to_lower_copy(std::string_view value);
std::string trim_copy(std::string_view value);

} // namespace Utils

#endif
