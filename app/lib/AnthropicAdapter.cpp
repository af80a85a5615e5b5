#include "AnthropicAdapter.hpp"
#include "AdapterSupport.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace {

Json::Value convert_parts(const std::vector<LLMMessageType>& parts)
{
    Json::Value blocks(Json::arrayValue);
    for (const auto& part : parts) {
        Json::Value block(Json::objectValue);
        if (part.is_text()) {
            block["type"] = "text";
            block["text"] = part.as_text();
        } else {
            block["type"] = "image";
            block["source"]["type"] = "base64";
            block["source"]["media_type"] = part.as_image().mime_type;
            block["source"]["data"] = part.image_base64();
        }
        blocks.append(block);
    }
    return blocks;
}

} // namespace


Json::Value AnthropicAdapter::make_chat_payload(const LLMClient& client,
                                                const std::vector<LLMMessage>& messages)
{
    std::string system_prompt;
    bool has_system = false;
    Json::Value turns(Json::arrayValue);
    std::string last_role;

    for (const auto& message : messages) {
        const auto role = normalize_role(message.role());
        if (!role) {
            throw LlmError(LlmErrorKind::InvalidInput,
                           "Anthropic does not accept message role '" + message.role() + "'");
        }

        if (*role == MessageRole::System) {
            for (const auto& part : message.parts()) {
                if (part.is_image()) {
                    throw LlmError(LlmErrorKind::InvalidInput,
                                   "Anthropic system messages accept text only");
                }
            }
            const std::string text = message.joined_text();
            if (text.empty()) {
                continue;
            }
            if (has_system) {
                system_prompt += '\n';
            }
            system_prompt += text;
            has_system = true;
            continue;
        }

        const std::string role_name = (*role == MessageRole::User) ? "user" : "assistant";
        Json::Value blocks = convert_parts(message.parts());
        if (!turns.empty() && last_role == role_name) {
            Json::Value& previous = turns[turns.size() - 1]["content"];
            for (const auto& block : blocks) {
                previous.append(block);
            }
            continue;
        }

        Json::Value turn(Json::objectValue);
        turn["role"] = role_name;
        turn["content"] = blocks;
        turns.append(turn);
        last_role = role_name;
    }

    if (turns.empty()) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Anthropic chat requires at least one user or assistant message");
    }

    Json::Value payload(Json::objectValue);
    payload["model"] = client.model();
    payload["max_tokens"] = kMaxTokens;
    payload["messages"] = turns;
    if (has_system) {
        payload["system"] = system_prompt;
    }
    return payload;
}

std::vector<LLMMessageType> AnthropicAdapter::parse_chat_response(const std::string& body)
{
    const Json::Value root = JsonSupport::parse_or_throw(body, "Anthropic response");
    if (!root.isObject() || !root["content"].isArray()) {
        throw LlmError(LlmErrorKind::DecodeFailure, "Anthropic response has no content array");
    }

    std::vector<LLMMessageType> result;
    for (const auto& block : root["content"]) {
        if (!block.isObject()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "Anthropic content block is not an object");
        }
        const std::string kind = JsonSupport::optional_string(block, "type");
        if (kind == "text") {
            result.push_back(LLMMessageType::text(JsonSupport::optional_string(block, "text")));
        } else if (kind == "image") {
            const Json::Value& source = block["source"];
            const std::string data = JsonSupport::optional_string(source, "data");
            if (data.empty()) {
                throw LlmError(LlmErrorKind::DecodeFailure, "Anthropic image block has no base64 data");
            }
            result.push_back(AdapterSupport::image_part_from_response(
                data, JsonSupport::optional_string(source, "media_type"), "Anthropic"));
        } else {
            // tool_use, thinking, ...: keep the raw block visible to the caller.
            result.push_back(LLMMessageType::text(JsonSupport::to_compact_string(block)));
        }
    }

    if (result.empty()) {
        result.push_back(LLMMessageType::text(""));
    }
    return result;
}

std::vector<LLMMessageType> AnthropicAdapter::chat(const LLMClient& client,
                                                   const std::vector<LLMMessage>& messages) const
{
    validate_messages(messages, "Anthropic");
    const Json::Value payload = make_chat_payload(client, messages);

    AdapterSupport::HeaderList headers = {
        {"x-api-key", client.api_key()},
        {"anthropic-version", kApiVersion},
        {"accept", "application/json"},
    };

    const auto start = std::chrono::steady_clock::now();
    const HttpResponse response = AdapterSupport::post_json(
        client, client.endpoint() + "/messages", std::move(headers), payload, "Anthropic chat");
    auto contents = parse_chat_response(response.body);

    if (auto logger = Logger::get_logger("core_logger")) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        logger->info("Anthropic chat ({}) returned {} part(s) in {}ms",
                     client.model(), contents.size(), elapsed.count());
    }
    return contents;
}

std::vector<std::vector<float>> AnthropicAdapter::embed(const LLMClient& client,
                                                        const std::vector<std::string>& inputs) const
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Anthropic ({}) has no embedding endpoint; returning no vectors for {} input(s)",
                      client.model(), inputs.size());
    }
    return {};
}
