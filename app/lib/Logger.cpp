#include "Logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum resolve_log_level()
{
    const char* value = std::getenv("LLM_BRIDGE_LOG_LEVEL");
    if (!value || *value == '\0') {
        return spdlog::level::info;
    }
    std::string name(value);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "warning") {
        name = "warn";
    }
    const auto level = spdlog::level::from_str(name);
    // from_str() maps unknown names to "off"; only honor an explicit "off".
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace


std::string Logger::get_cache_directory()
{
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "llm-bridge").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".cache" / "llm-bridge").string();
    }
    return (std::filesystem::temp_directory_path() / "llm-bridge").string();
}


std::string Logger::get_log_directory()
{
    if (const char* dir = std::getenv("LLM_BRIDGE_LOG_DIR"); dir && *dir) {
        return dir;
    }
    return (std::filesystem::path(get_cache_directory()) / "logs").string();
}


void Logger::setup_loggers()
{
    const std::filesystem::path log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    const auto level = resolve_log_level();
    const std::vector<std::string> names = {"core_logger", "cli_logger"};

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / "llm-bridge.log").string(), kMaxLogFileSize, kMaxLogFiles);

    for (const auto& name : names) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
