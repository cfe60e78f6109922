/*
 * Logger implementation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            const std::vector<spdlog::sink_ptr>& sinks)
{
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Logger::setup_loggers(const std::string& log_dir, const std::string& level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir);
        const auto log_file = (std::filesystem::path(log_dir) / "inference-hub.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, kMaxLogFileSize, kMaxLogFiles));
    }

    make_logger(kCoreLogger, sinks);
    make_logger(kNetLogger, sinks);
    set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

void Logger::set_level(const std::string& level)
{
    const auto parsed = spdlog::level::from_str(level);
    for (const char* name : {kCoreLogger, kNetLogger}) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(parsed);
        }
    }
}
