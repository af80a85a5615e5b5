#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"

#include <set>
#include <string>

TEST_CASE("encode_base64 matches the RFC 4648 vectors") {
    auto encode = [](const std::string& text) {
        return Utils::encode_base64(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    };
    REQUIRE(encode("") == "");
    REQUIRE(encode("f") == "Zg==");
    REQUIRE(encode("fo") == "Zm8=");
    REQUIRE(encode("foo") == "Zm9v");
    REQUIRE(encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("decode_base64 restores arbitrary bytes") {
    Utils::Bytes bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<std::uint8_t>(i));
    }
    const auto decoded = Utils::decode_base64(Utils::encode_base64(bytes));
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == bytes);
}

TEST_CASE("decode_base64 tolerates whitespace, missing padding and the URL-safe alphabet") {
    const auto wrapped = Utils::decode_base64("Zm9v\nYmFy\r\n");
    REQUIRE(wrapped.has_value());
    REQUIRE(std::string(wrapped->begin(), wrapped->end()) == "foobar");

    const auto unpadded = Utils::decode_base64("Zm8");
    REQUIRE(unpadded.has_value());
    REQUIRE(std::string(unpadded->begin(), unpadded->end()) == "fo");

    const auto url_safe = Utils::decode_base64("-_8=");
    REQUIRE(url_safe.has_value());
    REQUIRE(*url_safe == Utils::Bytes{0xFB, 0xFF});
}

TEST_CASE("decode_base64 rejects foreign characters") {
    REQUIRE_FALSE(Utils::decode_base64("not base64!").has_value());
    REQUIRE_FALSE(Utils::decode_base64("Zm9v*YmFy").has_value());
}

TEST_CASE("is_http_url accepts only http and https schemes") {
    REQUIRE(Utils::is_http_url("http://example.com/a.png"));
    REQUIRE(Utils::is_http_url("HTTPS://example.com/a.png"));
    REQUIRE_FALSE(Utils::is_http_url("ftp://example.com/a.png"));
    REQUIRE_FALSE(Utils::is_http_url("/tmp/http://x"));
    REQUIRE_FALSE(Utils::is_http_url("data:image/png;base64,AAAA"));
}

TEST_CASE("make_timestamp_id never repeats within a process") {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(Utils::make_timestamp_id());
    }
    REQUIRE(ids.size() == 1000);
}

TEST_CASE("string helpers") {
    REQUIRE(Utils::trim_trailing_slashes("https://api.example.com/v1//") == "https://api.example.com/v1");
    REQUIRE(Utils::to_lower_copy("Image/PNG") == "image/png");
    REQUIRE(Utils::trim_copy("  gemini \t") == "gemini");
}
