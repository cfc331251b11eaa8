/*
 * logger.cpp - Diagnostic log setup implementation
 */

#include "logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

bool init_logging(const std::string& filepath, const std::string& level, std::string& error) {
    try {
        auto logger = spdlog::basic_logger_mt("emu", filepath);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
        logger->set_level(spdlog::level::from_str(level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        error = ex.what();
        spdlog::set_level(spdlog::level::off);
        return false;
    }
    return true;
}

void shutdown_logging() {
    spdlog::shutdown();
}
