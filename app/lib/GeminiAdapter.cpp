#include "GeminiAdapter.hpp"
#include "AdapterSupport.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace {

constexpr const char* kModelsPrefix = "models/";

AdapterSupport::HeaderList auth_headers(const LLMClient& client)
{
    return {{"x-goog-api-key", client.api_key()}};
}

Json::Value convert_parts(const std::vector<LLMMessageType>& parts)
{
    Json::Value converted(Json::arrayValue);
    for (const auto& part : parts) {
        Json::Value item(Json::objectValue);
        if (part.is_text()) {
            item["text"] = part.as_text();
        } else {
            item["inlineData"]["mimeType"] = part.as_image().mime_type;
            item["inlineData"]["data"] = part.image_base64();
        }
        converted.append(item);
    }
    return converted;
}

Json::Value text_content(const std::string& text)
{
    Json::Value part(Json::objectValue);
    part["text"] = text;
    Json::Value content(Json::objectValue);
    content["parts"].append(part);
    return content;
}

} // namespace


std::string GeminiAdapter::model_url(const LLMClient& client, const std::string& method)
{
    std::string model = client.model();
    if (model.rfind(kModelsPrefix, 0) == 0) {
        model = model.substr(std::char_traits<char>::length(kModelsPrefix));
    }
    std::string base = client.endpoint();
    const std::string suffix = "/models";
    if (base.size() < suffix.size() ||
        base.compare(base.size() - suffix.size(), suffix.size(), suffix) != 0) {
        base += suffix;
    }
    return base + "/" + model + ":" + method;
}

std::string GeminiAdapter::qualified_model(const LLMClient& client)
{
    const std::string& model = client.model();
    return model.rfind(kModelsPrefix, 0) == 0 ? model : kModelsPrefix + model;
}

Json::Value GeminiAdapter::make_generate_payload(const std::vector<LLMMessage>& messages)
{
    Json::Value contents(Json::arrayValue);
    Json::Value system_parts(Json::arrayValue);

    for (const auto& message : messages) {
        const auto role = normalize_role(message.role());
        if (!role) {
            throw LlmError(LlmErrorKind::InvalidInput,
                           "Gemini does not accept message role '" + message.role() + "'");
        }
        if (*role == MessageRole::System) {
            // contents[] only takes "user" and "model"; system text goes to systemInstruction.
            for (const auto& part : convert_parts(message.parts())) {
                system_parts.append(part);
            }
            continue;
        }
        Json::Value content(Json::objectValue);
        content["role"] = (*role == MessageRole::User) ? "user" : "model";
        content["parts"] = convert_parts(message.parts());
        contents.append(content);
    }

    if (contents.empty()) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Gemini chat requires at least one user or model message");
    }

    Json::Value payload(Json::objectValue);
    payload["contents"] = contents;
    if (!system_parts.empty()) {
        payload["systemInstruction"]["parts"] = system_parts;
    }
    return payload;
}

GeminiResponse GeminiAdapter::generate(const LLMClient& client,
                                       const std::vector<LLMMessage>& messages) const
{
    validate_messages(messages, "Gemini");
    const Json::Value payload = make_generate_payload(messages);

    const auto start = std::chrono::steady_clock::now();
    const HttpResponse response = AdapterSupport::post_json(
        client, model_url(client, "generateContent"), auth_headers(client), payload,
        "Gemini generateContent");
    GeminiResponse parsed = GeminiResponse::parse(response.body);

    if (auto logger = Logger::get_logger("core_logger")) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        logger->info("Gemini generateContent ({}) returned {} candidate(s) in {}ms, {} tokens",
                     client.model(), parsed.candidates.size(), elapsed.count(),
                     parsed.usage.total_tokens);
    }
    return parsed;
}

std::vector<LLMMessageType> GeminiAdapter::to_message_parts(const GeminiResponse& response)
{
    std::vector<LLMMessageType> parts;
    const auto images = response_to_image_data(response);
    const auto mime_types = response_to_image_mime_types(response);
    for (std::size_t i = 0; i < images.size(); ++i) {
        parts.push_back(LLMMessageType::image_from_bytes(images[i], mime_types[i]));
    }
    parts.push_back(LLMMessageType::text(response_to_text_data(response)));
    return parts;
}

std::vector<LLMMessageType> GeminiAdapter::chat(const LLMClient& client,
                                                const std::vector<LLMMessage>& messages) const
{
    return to_message_parts(generate(client, messages));
}

std::vector<std::vector<float>> GeminiAdapter::embed(const LLMClient& client,
                                                     const std::vector<std::string>& inputs) const
{
    if (inputs.empty()) {
        return {};
    }

    const std::string model = qualified_model(client);

    if (inputs.size() == 1) {
        Json::Value payload(Json::objectValue);
        payload["model"] = model;
        payload["content"] = text_content(inputs.front());

        const HttpResponse response = AdapterSupport::post_json(
            client, model_url(client, "embedContent"), auth_headers(client), payload,
            "Gemini embedContent");
        const Json::Value root = JsonSupport::parse_or_throw(response.body, "Gemini embedContent");
        if (!root.isObject() || !root["embedding"].isObject()) {
            throw LlmError(LlmErrorKind::DecodeFailure,
                           "Gemini embedContent returned no embedding (usage metadata only)");
        }
        return {AdapterSupport::to_float_vector(root["embedding"]["values"], "Gemini embedContent")};
    }

    Json::Value requests(Json::arrayValue);
    for (const auto& input : inputs) {
        Json::Value request(Json::objectValue);
        request["model"] = model;
        request["content"] = text_content(input);
        requests.append(request);
    }
    Json::Value payload(Json::objectValue);
    payload["requests"] = requests;

    const HttpResponse response = AdapterSupport::post_json(
        client, model_url(client, "batchEmbedContents"), auth_headers(client), payload,
        "Gemini batchEmbedContents");
    const Json::Value root = JsonSupport::parse_or_throw(response.body, "Gemini batchEmbedContents");
    if (!root.isObject() || !root["embeddings"].isArray()) {
        throw LlmError(LlmErrorKind::DecodeFailure,
                       "Gemini batchEmbedContents returned no embeddings (usage metadata only)");
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(root["embeddings"].size());
    for (const auto& embedding : root["embeddings"]) {
        if (!embedding.isObject()) {
            throw LlmError(LlmErrorKind::DecodeFailure, "Gemini embedding entry is not an object");
        }
        vectors.push_back(AdapterSupport::to_float_vector(embedding["values"], "Gemini batchEmbedContents"));
    }
    if (vectors.size() != inputs.size()) {
        throw LlmError(LlmErrorKind::DecodeFailure,
                       "Gemini returned " + std::to_string(vectors.size()) + " embeddings for " +
                       std::to_string(inputs.size()) + " inputs");
    }
    return vectors;
}
