#ifndef LLMCLIENT_HPP
#define LLMCLIENT_HPP

#include "ProviderTypes.hpp"

#include <functional>
#include <string>

/**
 * Connection configuration for one provider/model pair.
 *
 * A plain value: copying is cheap and no network resource is cached, so a
 * client can be captured by any number of concurrent calls. The API key is
 * never logged.
 */
class LLMClient {
public:
    /// Receives the URL and serialized JSON body right before it is sent.
    using RequestHook = std::function<void(const std::string& url, const std::string& json_body)>;

    static constexpr long kDefaultTimeoutSeconds = 120;

    /// An empty endpoint selects default_endpoint(provider).
    LLMClient(LLMProvider provider,
              std::string api_key,
              std::string endpoint,
              std::string model,
              LLMType llm_type);

    LLMProvider provider() const { return provider_; }
    const std::string& api_key() const { return api_key_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& model() const { return model_; }
    LLMType llm_type() const { return llm_type_; }
    long timeout_seconds() const { return timeout_seconds_; }
    bool has_request_hook() const { return static_cast<bool>(request_hook_); }

    LLMClient with_timeout(long seconds) const;
    LLMClient with_request_hook(RequestHook hook) const;

    void notify_request(const std::string& url, const std::string& json_body) const;

private:
    LLMProvider provider_;
    std::string api_key_;
    std::string endpoint_;
    std::string model_;
    LLMType llm_type_;
    long timeout_seconds_{kDefaultTimeoutSeconds};
    RequestHook request_hook_;
};

#endif
