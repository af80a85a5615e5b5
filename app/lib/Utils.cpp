#include "Utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>

namespace {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_base64_char(char c)
{
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

namespace Utils {

std::string encode_base64(const std::uint8_t* data, std::size_t size)
{
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < size; i += 3) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
    }

    const std::size_t remaining = size - i;
    if (remaining == 1) {
        const std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string encode_base64(const Bytes& data)
{
    return encode_base64(data.data(), data.size());
}

std::optional<Bytes> decode_base64(std::string_view text)
{
    Bytes out;
    out.reserve(text.size() / 4 * 3 + 3);

    std::uint32_t buffer = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;

    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        const int value = decode_base64_char(c);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = ((buffer << 6) | static_cast<std::uint32_t>(value)) & 0xFFFFFFu;
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFu));
        }
    }

    if (symbols % 4 == 1 || padding > 2) {
        return std::nullopt;
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        return std::nullopt;
    }
    return out;
}

bool is_http_url(std::string_view value)
{
    const std::string lowered = to_lower_copy(value.substr(0, 8));
    return lowered.starts_with("http://") || lowered.starts_with("https://");
}

std::uint64_t current_timestamp_millis()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string make_timestamp_id()
{
    static std::atomic<std::uint64_t> sequence{0};
    const std::uint64_t seq = sequence.fetch_add(1, std::memory_order_relaxed);
    return std::to_string(current_timestamp_millis()) + "-" + std::to_string(seq);
}

std::string trim_trailing_slashes(std::string value)
{
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string to_lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim_copy(std::string_view value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

} // namespace Utils
