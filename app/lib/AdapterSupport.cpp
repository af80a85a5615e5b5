#include "AdapterSupport.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <sstream>

namespace AdapterSupport {

HttpResponse post_json(const LLMClient& client,
                       const std::string& url,
                       HeaderList headers,
                       const Json::Value& payload,
                       const std::string& operation)
{
    const std::string body = JsonSupport::to_compact_string(payload);
    client.notify_request(url, body);

    HttpResponse response = HttpClient::post_json(url, std::move(headers), body,
                                                  client.timeout_seconds());
    if (response.is_success()) {
        return response;
    }

    const std::string vendor_message = extract_vendor_message(response.body);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("{} failed with HTTP {}: {}", operation, response.status_code, vendor_message);
    }
    throw LlmError(LlmErrorKind::ProviderError,
                   fmt::format("{} failed with HTTP {}: {}", operation,
                               response.status_code, vendor_message),
                   response.status_code,
                   response.body);
}

std::string extract_vendor_message(const std::string& body)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(body);
    if (Json::parseFromStream(builder, stream, &root, &errors) && root.isObject()) {
        const Json::Value& error = root["error"];
        if (error.isObject() && error["message"].isString()) {
            return error["message"].asString();
        }
        if (error.isString()) {
            return error.asString();
        }
    }
    return body;
}

std::vector<float> to_float_vector(const Json::Value& value, const std::string& context)
{
    if (!value.isArray()) {
        throw LlmError(LlmErrorKind::DecodeFailure, context + ": embedding is not an array");
    }
    std::vector<float> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.isNumeric()) {
            throw LlmError(LlmErrorKind::DecodeFailure, context + ": embedding holds a non-number");
        }
        out.push_back(item.asFloat());
    }
    return out;
}

LLMMessageType image_part_from_response(const std::string& data_b64,
                                        const std::string& mime_type,
                                        const std::string& context)
{
    auto bytes = Utils::decode_base64(data_b64);
    if (!bytes) {
        throw LlmError(LlmErrorKind::DecodeFailure, context + ": image data is not valid base64");
    }
    return LLMMessageType::image_from_bytes(std::move(*bytes), mime_type);
}

} // namespace AdapterSupport
