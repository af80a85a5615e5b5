#ifndef LLM_MESSAGE_HPP
#define LLM_MESSAGE_HPP

#include "Utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct ImageData {
    Utils::Bytes bytes;
    std::string mime_type;

    bool operator==(const ImageData&) const = default;
};

/**
 * One part of a message: text, or a decoded image with its MIME type.
 * Whatever the image came from (file, URL, base64), the stored form is the
 * same, so adapters never look at provenance.
 */
class LLMMessageType {
public:
    enum class Kind { Text, Image };

    static LLMMessageType text(std::string value);

    /**
     * Builds an image part from `source`, resolved in this order:
     *   1. data:<mime>;base64,...   -> decoded
     *   2. http:// or https:// URL  -> downloaded
     *   3. existing filesystem path -> read from disk
     *   4. anything else            -> decoded as base64
     * Throws LlmError: IOFailure/NetworkFailure for 2 and 3, InvalidInput
     * when the text is empty or not valid base64.
     */
    static LLMMessageType image(const std::string& source);

    /// An empty `mime_type` is detected from the bytes.
    static LLMMessageType image_from_bytes(Utils::Bytes bytes, std::string mime_type = "");
    static LLMMessageType image_from_base64(const std::string& data_b64, std::string mime_type = "");

    Kind kind() const;
    bool is_text() const { return kind() == Kind::Text; }
    bool is_image() const { return kind() == Kind::Image; }

    /// Throws LlmError(InvalidInput) when the part is not of that kind.
    const std::string& as_text() const;
    const ImageData& as_image() const;

    std::string image_base64() const;
    std::string image_data_uri() const;

    bool operator==(const LLMMessageType&) const = default;

private:
    explicit LLMMessageType(std::variant<std::string, ImageData> value);

    std::variant<std::string, ImageData> value_;
};

enum class MessageRole {
    System,
    User,
    Assistant,
};

/**
 * Maps the free-form role vocabulary onto the three turn kinds:
 * user/human, assistant/ai/model, system. Case-insensitive.
 */
std::optional<MessageRole> normalize_role(const std::string& role);

class LLMMessage {
public:
    /// A missing id is derived from the current timestamp.
    LLMMessage(std::optional<std::string> id,
               std::string role,
               std::vector<LLMMessageType> parts);

    const std::string& id() const { return id_; }
    const std::string& role() const { return role_; }
    const std::vector<LLMMessageType>& parts() const { return parts_; }
    std::int64_t created_at() const { return created_at_; }

    /// Text parts joined with '\n'; image parts are skipped.
    std::string joined_text() const;

private:
    std::string id_;
    std::string role_;
    std::vector<LLMMessageType> parts_;
    std::int64_t created_at_{0};
};

/**
 * Throws LlmError(InvalidInput) when `messages` is empty or any message has
 * no parts. `provider` names the caller in the error text.
 */
void validate_messages(const std::vector<LLMMessage>& messages, const std::string& provider);

#endif // LLM_MESSAGE_HPP
