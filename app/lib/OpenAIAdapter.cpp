#include "OpenAIAdapter.hpp"
#include "AdapterSupport.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace {

const char* role_name(MessageRole role)
{
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

AdapterSupport::HeaderList auth_headers(const LLMClient& client)
{
    return {{"Authorization", "Bearer " + client.api_key()}};
}

std::string data_url_payload(const std::string& url)
{
    if (url.rfind("data:", 0) != 0) {
        return {};
    }
    const auto comma = url.find(',');
    return comma == std::string::npos ? std::string() : url.substr(comma + 1);
}

std::string data_url_mime(const std::string& url)
{
    const auto end = url.find_first_of(";,");
    return end == std::string::npos ? std::string() : url.substr(5, end - 5);
}

} // namespace


Json::Value OpenAIAdapter::convert_message(const LLMMessage& message)
{
    const auto role = normalize_role(message.role());
    if (!role) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "OpenAI does not accept message role '" + message.role() + "'");
    }

    Json::Value entry(Json::objectValue);
    entry["role"] = role_name(*role);

    bool only_text = true;
    for (const auto& part : message.parts()) {
        only_text = only_text && part.is_text();
    }
    if (only_text) {
        entry["content"] = message.joined_text();
        return entry;
    }

    Json::Value content(Json::arrayValue);
    for (const auto& part : message.parts()) {
        Json::Value item(Json::objectValue);
        if (part.is_text()) {
            item["type"] = "text";
            item["text"] = part.as_text();
        } else {
            item["type"] = "image_url";
            item["image_url"]["url"] = part.image_data_uri();
        }
        content.append(item);
    }
    entry["content"] = content;
    return entry;
}

Json::Value OpenAIAdapter::make_chat_payload(const LLMClient& client,
                                             const std::vector<LLMMessage>& messages)
{
    Json::Value payload(Json::objectValue);
    payload["model"] = client.model();
    payload["max_tokens"] = kMaxTokens;
    Json::Value converted(Json::arrayValue);
    for (const auto& message : messages) {
        converted.append(convert_message(message));
    }
    payload["messages"] = converted;
    return payload;
}

std::vector<LLMMessageType> OpenAIAdapter::convert_content_items(const Json::Value& items)
{
    std::vector<LLMMessageType> results;
    for (const auto& item : items) {
        if (!item.isObject()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI content item is not an object");
        }
        const std::string kind = JsonSupport::optional_string(item, "type");

        if (kind == "text" || kind == "output_text") {
            results.push_back(LLMMessageType::text(JsonSupport::optional_string(item, "text")));
            continue;
        }

        if (kind == "output_image" || kind == "image_url" || kind == "input_image") {
            const std::string inline_b64 = JsonSupport::optional_string(item, "image_base64");
            if (!inline_b64.empty()) {
                results.push_back(AdapterSupport::image_part_from_response(inline_b64, "", "OpenAI"));
                continue;
            }
            const Json::Value& image_url = item["image_url"];
            const std::string url = image_url.isString()
                ? image_url.asString()
                : JsonSupport::optional_string(image_url, "url");
            const std::string payload = data_url_payload(url);
            if (!payload.empty()) {
                results.push_back(
                    AdapterSupport::image_part_from_response(payload, data_url_mime(url), "OpenAI"));
            } else if (!url.empty()) {
                // Hosted images are passed on as their URL.
                results.push_back(LLMMessageType::text(url));
            } else {
                throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI image item carries no image data");
            }
            continue;
        }

        const std::string text = JsonSupport::optional_string(item, "text");
        results.push_back(LLMMessageType::text(
            !text.empty() ? text : "Unsupported OpenAI content type: " + kind));
    }
    return results;
}

std::vector<LLMMessageType> OpenAIAdapter::parse_chat_response(const std::string& body)
{
    const Json::Value root = JsonSupport::parse_or_throw(body, "OpenAI chat response");
    if (!root.isObject() || !root["choices"].isArray() || root["choices"].empty()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI response has no choices");
    }
    const Json::Value& choice = root["choices"][0];
    if (!choice.isObject() || !choice["message"].isObject()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI choice has no message object");
    }
    const Json::Value& message = choice["message"];

    std::vector<LLMMessageType> contents;
    const Json::Value& content = message["content"];
    if (content.isString()) {
        contents.push_back(LLMMessageType::text(content.asString()));
    } else if (content.isArray()) {
        contents = convert_content_items(content);
    } else if (!content.isNull()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI message content has an unexpected type");
    }

    if (contents.empty()) {
        contents.push_back(LLMMessageType::text(""));
    }
    return contents;
}

std::vector<LLMMessageType> OpenAIAdapter::chat(const LLMClient& client,
                                                const std::vector<LLMMessage>& messages) const
{
    validate_messages(messages, "OpenAI");
    const Json::Value payload = make_chat_payload(client, messages);
    const std::string url = client.endpoint() + "/chat/completions";

    const auto start = std::chrono::steady_clock::now();
    const HttpResponse response =
        AdapterSupport::post_json(client, url, auth_headers(client), payload, "OpenAI chat");
    auto contents = parse_chat_response(response.body);

    if (auto logger = Logger::get_logger("core_logger")) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        logger->info("OpenAI chat ({}) returned {} part(s) in {}ms",
                     client.model(), contents.size(), elapsed.count());
    }
    return contents;
}

std::vector<std::vector<float>> OpenAIAdapter::parse_embedding_response(const std::string& body)
{
    const Json::Value root = JsonSupport::parse_or_throw(body, "OpenAI embeddings response");
    if (!root.isObject() || !root["data"].isArray()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI embeddings response has no data array");
    }
    std::vector<std::vector<float>> vectors;
    vectors.reserve(root["data"].size());
    // Vendor contract: data[i] belongs to input[i].
    for (const auto& item : root["data"]) {
        if (!item.isObject()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "OpenAI embedding entry is not an object");
        }
        vectors.push_back(AdapterSupport::to_float_vector(item["embedding"], "OpenAI embeddings"));
    }
    return vectors;
}

std::vector<std::vector<float>> OpenAIAdapter::embed(const LLMClient& client,
                                                     const std::vector<std::string>& inputs) const
{
    if (inputs.empty()) {
        return {};
    }

    Json::Value payload(Json::objectValue);
    payload["model"] = client.model();
    Json::Value input(Json::arrayValue);
    for (const auto& text : inputs) {
        input.append(text);
    }
    payload["input"] = input;

    const HttpResponse response = AdapterSupport::post_json(
        client, client.endpoint() + "/embeddings", auth_headers(client), payload, "OpenAI embeddings");
    auto vectors = parse_embedding_response(response.body);
    if (vectors.size() != inputs.size()) {
        throw LlmError(LlmErrorKind::DecodeFailure,
                       "OpenAI returned " + std::to_string(vectors.size()) + " embeddings for " +
                       std::to_string(inputs.size()) + " inputs");
    }
    return vectors;
}
