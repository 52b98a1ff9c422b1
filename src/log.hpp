#pragma once
/*
 * Log
 *
 * Purpose: build the "tuibridge" spdlog logger from explicit settings.
 * Note: no path means a null sink; nothing is ever read from the environment.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Falls back to a null sink and fills `err` when the file cannot be opened.
std::shared_ptr<spdlog::logger> make_logger(const std::string& path, bool append, bool trace, std::string& err);
