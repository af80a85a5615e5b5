#ifndef IMAGE_UTILS_HPP
#define IMAGE_UTILS_HPP

#include "Utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ImageUtils {

inline constexpr const char* kFallbackMimeType = "application/octet-stream";

struct LoadedImage {
    Utils::Bytes bytes;
    std::string mime_type;
};

struct EncodedImage {
    std::string data_b64;
    std::string mime_type;
};

/// Recognizes PNG, JPEG, GIF, WebP, BMP, TIFF, HEIC/AVIF and PDF signatures.
std::optional<std::string> sniff_mime_type(const Utils::Bytes& bytes);

std::optional<std::string> mime_type_from_extension(const std::string& filename);

/**
 * Content sniffing first, then the extension of `filename_hint`, then
 * application/octet-stream. Never throws.
 */
std::string detect_mime_type(const Utils::Bytes& bytes, const std::string& filename_hint = "");

/// Reads the file header when the file is readable; never throws.
std::string detect_mime_type(const std::filesystem::path& file);

std::string extension_for_mime_type(const std::string& mime_type);

/// Throws LlmError(IOFailure) when the file cannot be read completely.
Utils::Bytes read_file_bytes(const std::filesystem::path& file);

/**
 * GET the URL and return the whole body. Transport errors throw
 * NetworkFailure, a non-2xx status throws IOFailure.
 */
Utils::Bytes download_image(const std::string& url, long timeout_seconds = 60);

/// Reads a local path or downloads an http(s) URL.
LoadedImage load_image_source(const std::string& source);

EncodedImage encode_image_to_base64(const std::string& source);

/**
 * Writes image_000.<ext>, image_001.<ext>, ... into `output_dir` (created
 * when missing). Numbering restarts at 000 on every call; existing files
 * with the same name are overwritten.
 */
std::vector<std::filesystem::path> save_images_to_output_dir(
    const std::vector<Utils::Bytes>& images,
    const std::filesystem::path& output_dir);

} // namespace ImageUtils

#endif
