/*
 * logger.hpp - Diagnostic log setup
 *
 * ncurses owns the terminal, so diagnostics go to a file in the config
 * directory through spdlog's default logger.
 */

#pragma once

#include <string>

// Installs a file logger as spdlog's default. Returns false (leaving
// logging disabled) if the file cannot be opened.
bool init_logging(const std::string& filepath, const std::string& level, std::string& error);

void shutdown_logging();
