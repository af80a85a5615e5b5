#include "TestHooks.hpp"

#include <mutex>

namespace {

std::mutex& probe_mutex()
{
    static std::mutex mutex;
    return mutex;
}

TestHooks::HttpRequestProbe& probe_storage()
{
    static TestHooks::HttpRequestProbe probe;
    return probe;
}

} // namespace

namespace TestHooks {

void set_http_request_probe(HttpRequestProbe probe)
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    probe_storage() = std::move(probe);
}

void reset_http_request_probe()
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    probe_storage() = nullptr;
}

HttpRequestProbe http_request_probe()
{
    std::lock_guard<std::mutex> lock(probe_mutex());
    return probe_storage();
}

} // namespace TestHooks
