#include <catch2/catch_test_macros.hpp>
#include "ImageUtils.hpp"
#include "LLMErrors.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>

TEST_CASE("detect_mime_type sniffs PNG content regardless of extension") {
    TempDir dir;
    const auto misnamed = dir.path() / "picture.jpg";
    write_bytes(misnamed, tiny_png_bytes());

    REQUIRE(ImageUtils::detect_mime_type(misnamed) == "image/png");
    REQUIRE(ImageUtils::detect_mime_type(tiny_png_bytes()) == "image/png");
}

TEST_CASE("detect_mime_type falls back to the extension, then octet-stream") {
    const Utils::Bytes opaque{'h', 'e', 'l', 'l', 'o'};
    REQUIRE(ImageUtils::detect_mime_type(opaque, "https://cdn.example.com/a.webp?w=10") == "image/webp");
    REQUIRE(ImageUtils::detect_mime_type(opaque, "notes") == ImageUtils::kFallbackMimeType);
    REQUIRE(ImageUtils::detect_mime_type(opaque) == ImageUtils::kFallbackMimeType);
}

TEST_CASE("detect_mime_type on a missing file does not throw") {
    TempDir dir;
    REQUIRE(ImageUtils::detect_mime_type(dir.path() / "absent.gif") == "image/gif");
}

TEST_CASE("encode_image_to_base64 round-trips a file") {
    TempDir dir;
    const auto path = dir.path() / "pixel.png";
    write_bytes(path, tiny_png_bytes());

    const auto encoded = ImageUtils::encode_image_to_base64(path.string());
    REQUIRE(encoded.mime_type == "image/png");
    const auto decoded = Utils::decode_base64(encoded.data_b64);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == tiny_png_bytes());
}

TEST_CASE("read_file_bytes reports missing files and directories as IOFailure") {
    TempDir dir;
    try {
        ImageUtils::read_file_bytes(dir.path() / "missing.png");
        FAIL("expected IOFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::IOFailure);
    }
    try {
        ImageUtils::read_file_bytes(dir.path());
        FAIL("expected IOFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::IOFailure);
    }
}

TEST_CASE("load_image_source downloads http URLs") {
    HttpProbeGuard probe;
    const auto png = tiny_png_bytes();
    probe.respond(200, std::string(png.begin(), png.end()));

    const auto image = ImageUtils::load_image_source("https://images.example.com/cat");
    REQUIRE(image.bytes == png);
    REQUIRE(image.mime_type == "image/png");
    REQUIRE(probe.request_count() == 1);
    REQUIRE(probe.last_request().method == "GET");
    REQUIRE(probe.last_request().url == "https://images.example.com/cat");
}

TEST_CASE("download_image turns a non-2xx status into IOFailure") {
    HttpProbeGuard probe;
    probe.respond(404, "not found");
    try {
        ImageUtils::download_image("https://images.example.com/missing.png");
        FAIL("expected IOFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::IOFailure);
    }
}

TEST_CASE("save_images_to_output_dir numbers files from 000 with sniffed extensions") {
    TempDir dir;
    const auto out_dir = dir.path() / "nested" / "out";
    const std::vector<Utils::Bytes> images{tiny_png_bytes(), Utils::Bytes{1, 2, 3}};

    const auto saved = ImageUtils::save_images_to_output_dir(images, out_dir);
    REQUIRE(saved.size() == 2);
    REQUIRE(saved[0].filename() == "image_000.png");
    REQUIRE(saved[1].filename() == "image_001.bin");
    REQUIRE(ImageUtils::read_file_bytes(saved[0]) == tiny_png_bytes());

    SECTION("a second call restarts numbering and overwrites") {
        const auto again = ImageUtils::save_images_to_output_dir({Utils::Bytes{9}}, out_dir);
        REQUIRE(again.size() == 1);
        REQUIRE(again[0].filename() == "image_000.bin");
        REQUIRE(ImageUtils::read_file_bytes(again[0]) == Utils::Bytes{9});
    }
}
