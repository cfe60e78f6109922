/*
 * Named spdlog loggers shared by the library and the CLI
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

class Logger {
public:
    /**
     * Create core_logger and net_logger with a console sink and a rotating
     * file sink in the configuration directory.
     * @param log_dir Directory for the log file; empty disables the file sink
     * @param level Initial level (e.g. "info", "debug")
     */
    static void setup_loggers(const std::string& log_dir = "",
                              const std::string& level = "info");

    /**
     * Look up a logger by name.
     * @return The logger, or nullptr if setup_loggers() has not run
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void set_level(const std::string& level);

    static constexpr const char* kCoreLogger = "core_logger";
    static constexpr const char* kNetLogger = "net_logger";
};

#endif // LOGGER_HPP
