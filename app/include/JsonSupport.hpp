#ifndef JSON_SUPPORT_HPP
#define JSON_SUPPORT_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <string>

namespace JsonSupport {

/**
 * Parses a response body. Throws LlmError(DecodeFailure) naming `context`
 * when the text is not valid JSON.
 */
Json::Value parse_or_throw(const std::string& text, const std::string& context);

std::string to_compact_string(const Json::Value& value);
std::string to_pretty_string(const Json::Value& value);

/// Returns value[key] as a string when present and a string, else "".
std::string optional_string(const Json::Value& value, const char* key);

} // namespace JsonSupport

#endif
