#include "LLMMessage.hpp"
#include "ImageUtils.hpp"
#include "LLMErrors.hpp"

#include <filesystem>
#include <system_error>

namespace {

constexpr std::size_t kMaxPathLength = 4096;

bool is_existing_path(const std::string& source)
{
    if (source.size() > kMaxPathLength || source.find('\n') != std::string::npos) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(source, ec) && !ec;
}

ImageData decode_data_uri(const std::string& source)
{
    const auto comma = source.find(',');
    if (comma == std::string::npos) {
        throw LlmError(LlmErrorKind::InvalidInput, "Malformed data URI image source");
    }
    const std::string header = source.substr(5, comma - 5); // after "data:"
    const auto semicolon = header.find(';');
    std::string mime = header.substr(0, semicolon);
    if (header.find(";base64") == std::string::npos) {
        throw LlmError(LlmErrorKind::InvalidInput, "Only base64 data URIs are supported");
    }

    auto bytes = Utils::decode_base64(std::string_view(source).substr(comma + 1));
    if (!bytes) {
        throw LlmError(LlmErrorKind::InvalidInput, "Data URI image payload is not valid base64");
    }
    if (mime.empty()) {
        mime = ImageUtils::detect_mime_type(*bytes);
    }
    return ImageData{std::move(*bytes), std::move(mime)};
}

} // namespace


LLMMessageType::LLMMessageType(std::variant<std::string, ImageData> value)
    : value_(std::move(value))
{
}

LLMMessageType LLMMessageType::text(std::string value)
{
    return LLMMessageType(std::move(value));
}

LLMMessageType LLMMessageType::image(const std::string& source)
{
    if (Utils::trim_copy(source).empty()) {
        throw LlmError(LlmErrorKind::InvalidInput, "Image source is empty");
    }

    if (Utils::to_lower_copy(source.substr(0, 5)) == "data:") {
        return LLMMessageType(decode_data_uri(source));
    }

    if (Utils::is_http_url(source) || is_existing_path(source)) {
        ImageUtils::LoadedImage loaded = ImageUtils::load_image_source(source);
        return LLMMessageType(ImageData{std::move(loaded.bytes), std::move(loaded.mime_type)});
    }

    return image_from_base64(source);
}

LLMMessageType LLMMessageType::image_from_bytes(Utils::Bytes bytes, std::string mime_type)
{
    if (mime_type.empty()) {
        mime_type = ImageUtils::detect_mime_type(bytes);
    }
    return LLMMessageType(ImageData{std::move(bytes), std::move(mime_type)});
}

LLMMessageType LLMMessageType::image_from_base64(const std::string& data_b64, std::string mime_type)
{
    auto bytes = Utils::decode_base64(data_b64);
    if (!bytes || bytes->empty()) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Image source is not a URL, an existing file or base64 data");
    }
    return image_from_bytes(std::move(*bytes), std::move(mime_type));
}

LLMMessageType::Kind LLMMessageType::kind() const
{
    return std::holds_alternative<std::string>(value_) ? Kind::Text : Kind::Image;
}

const std::string& LLMMessageType::as_text() const
{
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return *text;
    }
    throw LlmError(LlmErrorKind::InvalidInput, "Message part is an image, not text");
}

const ImageData& LLMMessageType::as_image() const
{
    if (const auto* image = std::get_if<ImageData>(&value_)) {
        return *image;
    }
    throw LlmError(LlmErrorKind::InvalidInput, "Message part is text, not an image");
}

std::string LLMMessageType::image_base64() const
{
    return Utils::encode_base64(as_image().bytes);
}

std::string LLMMessageType::image_data_uri() const
{
    return "data:" + as_image().mime_type + ";base64," + image_base64();
}


std::optional<MessageRole> normalize_role(const std::string& role)
{
    const std::string key = Utils::to_lower_copy(Utils::trim_copy(role));
    if (key == "user" || key == "human") {
        return MessageRole::User;
    }
    if (key == "assistant" || key == "ai" || key == "model") {
        return MessageRole::Assistant;
    }
    if (key == "system") {
        return MessageRole::System;
    }
    return std::nullopt;
}


LLMMessage::LLMMessage(std::optional<std::string> id,
                       std::string role,
                       std::vector<LLMMessageType> parts)
    : id_(id.has_value() ? std::move(*id) : Utils::make_timestamp_id())
    , role_(std::move(role))
    , parts_(std::move(parts))
    , created_at_(static_cast<std::int64_t>(Utils::current_timestamp_millis()))
{
}

std::string LLMMessage::joined_text() const
{
    std::string joined;
    bool first = true;
    for (const auto& part : parts_) {
        if (!part.is_text()) {
            continue;
        }
        if (!first) {
            joined += '\n';
        }
        joined += part.as_text();
        first = false;
    }
    return joined;
}


void validate_messages(const std::vector<LLMMessage>& messages, const std::string& provider)
{
    if (messages.empty()) {
        throw LlmError(LlmErrorKind::InvalidInput, provider + " chat requires at least one message");
    }
    for (const auto& message : messages) {
        if (message.parts().empty()) {
            throw LlmError(LlmErrorKind::InvalidInput,
                           provider + " chat: message '" + message.id() + "' has no parts");
        }
    }
}
