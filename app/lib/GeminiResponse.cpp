#include "GeminiResponse.hpp"
#include "JsonSupport.hpp"
#include "LLMErrors.hpp"

namespace {

GeminiPart parse_part(const Json::Value& value)
{
    if (!value.isObject()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Gemini part is not an object");
    }
    GeminiPart part;
    if (value.isMember("text")) {
        if (!value["text"].isString()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "Gemini part text is not a string");
        }
        part.text = value["text"].asString();
    }
    // The REST API answers in camelCase; proto-style snake_case shows up behind some proxies.
    const char* inline_key = value.isMember("inlineData") ? "inlineData" : "inline_data";
    if (value.isMember(inline_key)) {
        const Json::Value& inline_value = value[inline_key];
        if (!inline_value.isObject() || !inline_value["data"].isString()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "Gemini inlineData has no base64 data");
        }
        GeminiInlineData data;
        data.data = inline_value["data"].asString();
        data.mime_type = JsonSupport::optional_string(inline_value, "mimeType");
        if (data.mime_type.empty()) {
            data.mime_type = JsonSupport::optional_string(inline_value, "mime_type");
        }
        part.inline_data = std::move(data);
    }
    return part;
}

GeminiCandidate parse_candidate(const Json::Value& value)
{
    if (!value.isObject()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Gemini candidate is not an object");
    }
    GeminiCandidate candidate;
    candidate.finish_reason = JsonSupport::optional_string(value, "finishReason");

    const Json::Value& content = value["content"];
    if (content.isNull()) {
        // Candidates stopped by safety filters come back without content.
        return candidate;
    }
    if (!content.isObject()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Gemini candidate content is not an object");
    }
    candidate.role = JsonSupport::optional_string(content, "role");
    const Json::Value& parts = content["parts"];
    if (!parts.isNull() && !parts.isArray()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Gemini content parts is not an array");
    }
    for (const auto& part : parts) {
        candidate.parts.push_back(parse_part(part));
    }
    return candidate;
}

int token_count(const Json::Value& usage, const char* key)
{
    const Json::Value& value = usage[key];
    if (value.isNull()) {
        return 0;
    }
    if (!value.isInt()) {
        throw LlmError(LlmErrorKind::DecodeFailure,
                       std::string("Gemini usageMetadata.") + key + " is not an integer token count");
    }
    return value.asInt();
}

std::optional<std::string> optional_member(const Json::Value& root, const char* key)
{
    if (root[key].isString()) {
        return root[key].asString();
    }
    return std::nullopt;
}

} // namespace


GeminiResponse GeminiResponse::parse(const std::string& body)
{
    const Json::Value root = JsonSupport::parse_or_throw(body, "Gemini response");
    if (!root.isObject()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Gemini response is not a JSON object");
    }

    GeminiResponse response;
    response.response_id = optional_member(root, "responseId");
    response.model_version = optional_member(root, "modelVersion");
    if (root["promptFeedback"].isObject()) {
        response.block_reason = optional_member(root["promptFeedback"], "blockReason");
    }

    const Json::Value& candidates = root["candidates"];
    if (!candidates.isArray()) {
        std::string message = "Gemini response has no candidates";
        if (response.block_reason) {
            message += " (prompt blocked: " + *response.block_reason + ")";
        }
        throw LlmError(LlmErrorKind::DecodeFailure, message);
    }
    for (const auto& candidate : candidates) {
        response.candidates.push_back(parse_candidate(candidate));
    }

    const Json::Value& usage = root["usageMetadata"];
    if (usage.isObject()) {
        response.usage.prompt_tokens = token_count(usage, "promptTokenCount");
        response.usage.candidate_tokens = token_count(usage, "candidatesTokenCount");
        response.usage.total_tokens = token_count(usage, "totalTokenCount");
    }
    return response;
}


std::vector<std::string> response_to_base64_images(const GeminiResponse& response)
{
    std::vector<std::string> images;
    for (const auto& candidate : response.candidates) {
        for (const auto& part : candidate.parts) {
            if (part.inline_data && !part.inline_data->data.empty()) {
                images.push_back(part.inline_data->data);
            }
        }
    }
    return images;
}

std::vector<std::string> response_to_image_mime_types(const GeminiResponse& response)
{
    std::vector<std::string> types;
    for (const auto& candidate : response.candidates) {
        for (const auto& part : candidate.parts) {
            if (part.inline_data && !part.inline_data->data.empty()) {
                types.push_back(part.inline_data->mime_type);
            }
        }
    }
    return types;
}

std::vector<Utils::Bytes> response_to_image_data(const GeminiResponse& response)
{
    std::vector<Utils::Bytes> images;
    for (const auto& encoded : response_to_base64_images(response)) {
        auto bytes = Utils::decode_base64(encoded);
        if (!bytes) {
            throw LlmError(LlmErrorKind::DecodeFailure, "Gemini inline image is not valid base64");
        }
        images.push_back(std::move(*bytes));
    }
    return images;
}

std::string response_to_text_data(const GeminiResponse& response)
{
    if (response.candidates.empty()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "No candidates found in Gemini response");
    }
    std::string text;
    for (const auto& part : response.candidates.front().parts) {
        if (part.text) {
            text += *part.text;
        }
    }
    return text;
}
