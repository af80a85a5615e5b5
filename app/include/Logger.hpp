#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

namespace spdlog { class logger; }

class Logger {
public:
    /**
     * Creates the "core_logger" and "cli_logger" loggers. Each writes to the
     * console and to a rotating file under get_log_directory().
     * Throws spdlog::spdlog_ex if the file sink cannot be created.
     */
    static void setup_loggers();

    /**
     * Returns the registered logger with the given name, or nullptr when
     * setup_loggers() was never called (library use without logging).
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static std::string get_cache_directory();
};

#endif
