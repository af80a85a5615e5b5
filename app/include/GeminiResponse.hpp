#ifndef GEMINI_RESPONSE_HPP
#define GEMINI_RESPONSE_HPP

#include "Utils.hpp"

#include <optional>
#include <string>
#include <vector>

struct GeminiInlineData {
    std::string mime_type;
    std::string data; ///< base64 exactly as received
};

struct GeminiPart {
    std::optional<std::string> text;
    std::optional<GeminiInlineData> inline_data;
};

struct GeminiCandidate {
    std::string role;
    std::string finish_reason;
    std::vector<GeminiPart> parts;
};

struct GeminiUsage {
    int prompt_tokens{0};
    int candidate_tokens{0};
    int total_tokens{0};
};

/**
 * Parsed generateContent reply. The response_to_* functions below are pure
 * projections of it: they can be called in any order, any number of times.
 */
struct GeminiResponse {
    std::vector<GeminiCandidate> candidates;
    std::optional<std::string> response_id;
    std::optional<std::string> model_version;
    std::optional<std::string> block_reason;
    GeminiUsage usage;

    /// Throws LlmError(DecodeFailure) unless `body` has a `candidates` array.
    static GeminiResponse parse(const std::string& body);
};

/// Inline image data of every candidate, in order, still base64-encoded.
std::vector<std::string> response_to_base64_images(const GeminiResponse& response);

/// Same images decoded. Undecodable data throws LlmError(DecodeFailure).
std::vector<Utils::Bytes> response_to_image_data(const GeminiResponse& response);

/// MIME types matching response_to_base64_images() index by index.
std::vector<std::string> response_to_image_mime_types(const GeminiResponse& response);

/**
 * Concatenated text parts of the first candidate. Throws
 * LlmError(DecodeFailure) when there is no candidate.
 */
std::string response_to_text_data(const GeminiResponse& response);

#endif // GEMINI_RESPONSE_HPP
