#include "LLMClient.hpp"
#include "Utils.hpp"

LLMClient::LLMClient(LLMProvider provider,
                     std::string api_key,
                     std::string endpoint,
                     std::string model,
                     LLMType llm_type)
    : provider_(provider)
    , api_key_(std::move(api_key))
    , endpoint_(Utils::trim_trailing_slashes(Utils::trim_copy(endpoint)))
    , model_(Utils::trim_copy(model))
    , llm_type_(llm_type)
{
    if (endpoint_.empty()) {
        endpoint_ = default_endpoint(provider_);
    }
}

LLMClient LLMClient::with_timeout(long seconds) const
{
    LLMClient copy(*this);
    copy.timeout_seconds_ = seconds > 0 ? seconds : kDefaultTimeoutSeconds;
    return copy;
}

LLMClient LLMClient::with_request_hook(RequestHook hook) const
{
    LLMClient copy(*this);
    copy.request_hook_ = std::move(hook);
    return copy;
}

void LLMClient::notify_request(const std::string& url, const std::string& json_body) const
{
    if (request_hook_) {
        request_hook_(url, json_body);
    }
}
