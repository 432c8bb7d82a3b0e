#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Shared "glossary" logger. Falls back to a console logger until
// init_logging() installs the configured sinks.
std::shared_ptr<spdlog::logger> glossary_log();

// level is one of trace, debug, info, warn, error, critical, off.
// An empty file means console only.
void init_logging(const std::string& level, const std::string& file = "");

bool is_valid_log_level(const std::string& level);
