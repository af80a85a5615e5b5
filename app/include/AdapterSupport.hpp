#ifndef ADAPTER_SUPPORT_HPP
#define ADAPTER_SUPPORT_HPP

#include "HttpClient.hpp"
#include "JsonSupport.hpp"
#include "LLMClient.hpp"
#include "LLMMessage.hpp"

#include <string>
#include <utility>
#include <vector>

namespace AdapterSupport {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Serializes `payload`, passes it to the client's request hook, POSTs it and
 * returns the 2xx response. A non-2xx status throws LlmError(ProviderError)
 * with the vendor body kept verbatim. No retry is attempted.
 */
HttpResponse post_json(const LLMClient& client,
                       const std::string& url,
                       HeaderList headers,
                       const Json::Value& payload,
                       const std::string& operation);

/// Pulls error.message (OpenAI, Anthropic and Gemini share this shape).
std::string extract_vendor_message(const std::string& body);

/// Throws LlmError(DecodeFailure) unless `value` is an array of numbers.
std::vector<float> to_float_vector(const Json::Value& value, const std::string& context);

/**
 * Image part from base64 found in a vendor response. Invalid base64 is a
 * DecodeFailure; an empty `mime_type` is sniffed from the bytes.
 */
LLMMessageType image_part_from_response(const std::string& data_b64,
                                        const std::string& mime_type,
                                        const std::string& context);

} // namespace AdapterSupport

#endif
