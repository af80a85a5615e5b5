#include "ImageUtils.hpp"
#include "HttpClient.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>

namespace {

constexpr std::size_t kSniffLength = 32;

bool starts_with_bytes(const Utils::Bytes& bytes, std::size_t offset, const char* signature)
{
    const std::size_t length = std::strlen(signature);
    if (bytes.size() < offset + length) {
        return false;
    }
    return std::memcmp(bytes.data() + offset, signature, length) == 0;
}

const std::map<std::string, std::string>& extension_table()
{
    static const std::map<std::string, std::string> table = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".jpe", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".heic", "image/heic"},
        {".heif", "image/heif"},
        {".avif", "image/avif"},
        {".svg", "image/svg+xml"},
        {".ico", "image/x-icon"},
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".json", "application/json"},
    };
    return table;
}

} // namespace

namespace ImageUtils {

std::optional<std::string> sniff_mime_type(const Utils::Bytes& bytes)
{
    if (starts_with_bytes(bytes, 0, "\x89PNG\r\n\x1a\n")) {
        return "image/png";
    }
    if (starts_with_bytes(bytes, 0, "\xFF\xD8\xFF")) {
        return "image/jpeg";
    }
    if (starts_with_bytes(bytes, 0, "GIF87a") || starts_with_bytes(bytes, 0, "GIF89a")) {
        return "image/gif";
    }
    if (starts_with_bytes(bytes, 0, "RIFF") && starts_with_bytes(bytes, 8, "WEBP")) {
        return "image/webp";
    }
    if (starts_with_bytes(bytes, 0, "BM") && bytes.size() >= 14) {
        return "image/bmp";
    }
    if (bytes.size() >= 4 &&
        ((bytes[0] == 'I' && bytes[1] == 'I' && bytes[2] == 0x2A && bytes[3] == 0x00) ||
         (bytes[0] == 'M' && bytes[1] == 'M' && bytes[2] == 0x00 && bytes[3] == 0x2A))) {
        return "image/tiff";
    }
    if (starts_with_bytes(bytes, 4, "ftyp")) {
        if (starts_with_bytes(bytes, 8, "avif")) {
            return "image/avif";
        }
        if (starts_with_bytes(bytes, 8, "heic") || starts_with_bytes(bytes, 8, "heix") ||
            starts_with_bytes(bytes, 8, "mif1")) {
            return "image/heic";
        }
    }
    if (starts_with_bytes(bytes, 0, "%PDF-")) {
        return "application/pdf";
    }
    return std::nullopt;
}

std::optional<std::string> mime_type_from_extension(const std::string& filename)
{
    // Query strings on URLs ("photo.png?size=2") must not hide the extension.
    const std::string path_part = filename.substr(0, filename.find_first_of("?#"));
    const std::string ext =
        Utils::to_lower_copy(std::filesystem::path(path_part).extension().string());
    if (ext.empty()) {
        return std::nullopt;
    }
    const auto& table = extension_table();
    const auto it = table.find(ext);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string detect_mime_type(const Utils::Bytes& bytes, const std::string& filename_hint)
{
    if (auto sniffed = sniff_mime_type(bytes)) {
        return *sniffed;
    }
    if (!filename_hint.empty()) {
        if (auto guessed = mime_type_from_extension(filename_hint)) {
            return *guessed;
        }
    }
    return kFallbackMimeType;
}

std::string detect_mime_type(const std::filesystem::path& file)
{
    Utils::Bytes header;
    std::ifstream in(file, std::ios::binary);
    if (in) {
        header.resize(kSniffLength);
        in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
        header.resize(static_cast<std::size_t>(in.gcount()));
    }
    return detect_mime_type(header, file.string());
}

std::string extension_for_mime_type(const std::string& mime_type)
{
    static const std::map<std::string, std::string> table = {
        {"image/png", ".png"},
        {"image/jpeg", ".jpg"},
        {"image/gif", ".gif"},
        {"image/webp", ".webp"},
        {"image/bmp", ".bmp"},
        {"image/tiff", ".tiff"},
        {"image/heic", ".heic"},
        {"image/avif", ".avif"},
        {"application/pdf", ".pdf"},
    };
    const auto it = table.find(mime_type);
    return it != table.end() ? it->second : ".bin";
}

Utils::Bytes read_file_bytes(const std::filesystem::path& file)
{
    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) {
        throw LlmError(LlmErrorKind::IOFailure, "Image path is a directory: " + file.string());
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw LlmError(LlmErrorKind::IOFailure, "Failed to open image file: " + file.string());
    }
    Utils::Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw LlmError(LlmErrorKind::IOFailure, "Failed to read image file: " + file.string());
    }
    return bytes;
}

Utils::Bytes download_image(const std::string& url, long timeout_seconds)
{
    const HttpResponse response = HttpClient::get(url, timeout_seconds);
    if (!response.is_success()) {
        throw LlmError(LlmErrorKind::IOFailure,
                       fmt::format("Image download from {} returned HTTP {}", url,
                                   response.status_code));
    }
    return Utils::Bytes(response.body.begin(), response.body.end());
}

LoadedImage load_image_source(const std::string& source)
{
    LoadedImage image;
    if (Utils::is_http_url(source)) {
        image.bytes = download_image(source);
    } else {
        image.bytes = read_file_bytes(source);
    }
    image.mime_type = detect_mime_type(image.bytes, source);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Loaded image {} ({} bytes, {})", source, image.bytes.size(), image.mime_type);
    }
    return image;
}

EncodedImage encode_image_to_base64(const std::string& source)
{
    LoadedImage image = load_image_source(source);
    return EncodedImage{Utils::encode_base64(image.bytes), std::move(image.mime_type)};
}

std::vector<std::filesystem::path> save_images_to_output_dir(
    const std::vector<Utils::Bytes>& images,
    const std::filesystem::path& output_dir)
{
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw LlmError(LlmErrorKind::IOFailure,
                       "Failed to create output directory " + output_dir.string() + ": " + ec.message());
    }

    std::vector<std::filesystem::path> saved;
    saved.reserve(images.size());
    for (std::size_t index = 0; index < images.size(); ++index) {
        const auto& bytes = images[index];
        const std::string extension = extension_for_mime_type(detect_mime_type(bytes));
        const auto path = output_dir / fmt::format("image_{:03}{}", index, extension);

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            throw LlmError(LlmErrorKind::IOFailure, "Failed to write image file " + path.string());
        }
        saved.push_back(path);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Saved {} image(s) to {}", saved.size(), output_dir.string());
    }
    return saved;
}

} // namespace ImageUtils
