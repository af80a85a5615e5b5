#include "JsonSupport.hpp"
#include "LLMErrors.hpp"

#include <memory>

namespace JsonSupport {

Json::Value parse_or_throw(const std::string& text, const std::string& context)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw LlmError(LlmErrorKind::DecodeFailure,
                       "Failed to parse " + context + " JSON: " + errors);
    }
    return root;
}

std::string to_compact_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string to_pretty_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string optional_string(const Json::Value& value, const char* key)
{
    if (!value.isObject()) {
        return {};
    }
    const Json::Value& member = value[key];
    return member.isString() ? member.asString() : std::string();
}

} // namespace JsonSupport
