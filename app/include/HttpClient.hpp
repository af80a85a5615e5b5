#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method{"POST"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    long timeout_seconds{120};

    /// Case-insensitive header lookup.
    std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse {
    long status_code{0};
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Blocking HTTP on a fresh libcurl easy handle per call. Transport errors
 * throw LlmError(NetworkFailure); every HTTP status, including 4xx/5xx, is
 * returned to the caller.
 */
class HttpClient {
public:
    static HttpResponse perform(const HttpRequest& request);

    static HttpResponse post_json(const std::string& url,
                                  std::vector<std::pair<std::string, std::string>> headers,
                                  std::string body,
                                  long timeout_seconds);

    static HttpResponse get(const std::string& url, long timeout_seconds);
};

#endif // HTTP_CLIENT_HPP
