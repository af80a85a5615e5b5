#ifndef LLM_ERRORS_HPP
#define LLM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

enum class LlmErrorKind {
    InvalidInput,         ///< Empty parts, unknown role, wrong call family
    IOFailure,            ///< Local file read or remote image fetch failed
    NetworkFailure,       ///< Transport error (DNS, TLS, timeout, ...)
    ProviderError,        ///< Vendor answered with a non-2xx status
    UnsupportedOperation, ///< Provider lacks the requested capability
    DecodeFailure         ///< Response did not match the expected schema
};

inline const char* to_string(LlmErrorKind kind)
{
    switch (kind) {
        case LlmErrorKind::InvalidInput: return "InvalidInput";
        case LlmErrorKind::IOFailure: return "IOFailure";
        case LlmErrorKind::NetworkFailure: return "NetworkFailure";
        case LlmErrorKind::ProviderError: return "ProviderError";
        case LlmErrorKind::UnsupportedOperation: return "UnsupportedOperation";
        case LlmErrorKind::DecodeFailure: return "DecodeFailure";
    }
    return "Unknown";
}

class LlmError : public std::runtime_error {
public:
    LlmError(LlmErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    /**
     * ProviderError constructor: keeps the HTTP status and the vendor body
     * exactly as received.
     */
    LlmError(LlmErrorKind kind, const std::string& message,
             long http_status, std::string provider_body)
        : std::runtime_error(message),
          kind_(kind),
          http_status_(http_status),
          provider_body_(std::move(provider_body)) {}

    LlmErrorKind kind() const noexcept { return kind_; }
    long http_status() const noexcept { return http_status_; }
    const std::string& provider_body() const noexcept { return provider_body_; }

private:
    LlmErrorKind kind_;
    long http_status_{0};
    std::string provider_body_;
};

#endif // LLM_ERRORS_HPP
