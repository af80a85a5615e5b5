#pragma once

#include <functional>

#include "HttpClient.hpp"

namespace TestHooks {

/**
 * When set, HttpClient::perform() hands every request to the probe instead
 * of the network. Process-wide; tests must reset it when done.
 */
using HttpRequestProbe = std::function<HttpResponse(const HttpRequest& request)>;
void set_http_request_probe(HttpRequestProbe probe);
void reset_http_request_probe();
HttpRequestProbe http_request_probe();

} // namespace TestHooks
