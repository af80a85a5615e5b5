#include "HttpClient.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response)
{
    const size_t total = size * nmemb;
    response->append(static_cast<const char*>(contents), total);
    return total;
}

} // namespace


std::optional<std::string> HttpRequest::header(const std::string& name) const
{
    const std::string wanted = Utils::to_lower_copy(name);
    for (const auto& [key, value] : headers) {
        if (Utils::to_lower_copy(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}


HttpResponse HttpClient::perform(const HttpRequest& request)
{
    auto logger = Logger::get_logger("core_logger");

    if (auto probe = TestHooks::http_request_probe()) {
        return probe(request);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw LlmError(LlmErrorKind::NetworkFailure, "Failed to initialize cURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    std::vector<std::string> header_lines;
    header_lines.reserve(request.headers.size());
    for (const auto& [name, value] : request.headers) {
        header_lines.push_back(name + ": " + value);
        headers = curl_slist_append(headers, header_lines.back().c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (logger) {
        logger->debug("{} {} ({} bytes)", request.method, request.url, request.body.size());
    }

    const auto start = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        const std::string reason = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        if (logger) {
            logger->warn("{} {} failed: {}", request.method, request.url, reason);
        }
        throw LlmError(LlmErrorKind::NetworkFailure,
                       "HTTP request to " + request.url + " failed: " + reason);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    curl_easy_cleanup(curl);

    if (logger) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        logger->debug("{} {} returned HTTP {} in {}ms ({} bytes)",
                      request.method, request.url, response.status_code,
                      elapsed.count(), response.body.size());
    }
    return response;
}


HttpResponse HttpClient::post_json(const std::string& url,
                                   std::vector<std::pair<std::string, std::string>> headers,
                                   std::string body,
                                   long timeout_seconds)
{
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers = std::move(headers);
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = std::move(body);
    request.timeout_seconds = timeout_seconds;
    return perform(request);
}


HttpResponse HttpClient::get(const std::string& url, long timeout_seconds)
{
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.timeout_seconds = timeout_seconds;
    return perform(request);
}
