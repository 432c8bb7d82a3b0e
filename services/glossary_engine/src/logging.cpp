#include "logging.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

const char* kLoggerName = "glossary";
const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Installed logger; read with atomic_load so queries never wait on a lock
// once it exists. log_mutex() only serialises creation and replacement.
std::shared_ptr<spdlog::logger> g_logger;

std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

spdlog::level::level_enum parse_level(const std::string& level) {
    auto lv = spdlog::level::from_str(level);
    if (lv == spdlog::level::off && level != "off")
        throw std::invalid_argument("unknown log level: " + level);
    return lv;
}

}  // namespace

bool is_valid_log_level(const std::string& level) {
    try {
        parse_level(level);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::shared_ptr<spdlog::logger> glossary_log() {
    if (auto lg = std::atomic_load(&g_logger)) return lg;

    std::lock_guard<std::mutex> lock(log_mutex());
    auto lg = std::atomic_load(&g_logger);
    if (lg) return lg;
    lg = spdlog::get(kLoggerName);
    if (!lg) {
        lg = spdlog::stdout_color_mt(kLoggerName);
        lg->set_pattern(kPattern);
    }
    std::atomic_store(&g_logger, lg);
    return lg;
}

void init_logging(const std::string& level, const std::string& file) {
    auto lv = parse_level(level);
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));

    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    lg->set_pattern(kPattern);
    lg->set_level(lv);
    lg->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(log_mutex());
    spdlog::drop(kLoggerName);
    spdlog::register_logger(lg);
    std::atomic_store(&g_logger, lg);
}
