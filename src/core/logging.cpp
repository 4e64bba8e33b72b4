#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <map>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxFiles = 3;

struct LoggerRegistry {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum level = spdlog::level::info;
};

LoggerRegistry& registry() {
    static LoggerRegistry reg;
    return reg;
}

// Caller holds reg.mutex
void ensure_default_sinks(LoggerRegistry& reg) {
    if (!reg.sinks.empty()) return;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kPattern);
    reg.sinks.push_back(console);
}

} // namespace

void init_logging(const LogSettings& settings) {
    auto& reg = registry();
    std::string file_error;

    {
        std::lock_guard<std::mutex> lock(reg.mutex);

        reg.sinks.clear();
        ensure_default_sinks(reg);

        if (!settings.file.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    settings.file, kMaxFileSize, kMaxFiles);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                reg.sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        reg.level = parse_log_level(settings.level).value_or(spdlog::level::info);

        for (auto& [name, logger] : reg.loggers) {
            logger->sinks() = reg.sinks;
            logger->set_level(reg.level);
        }
    }

    // Console sink is in place even when the file sink failed
    if (!file_error.empty()) {
        get_logger("logging")->warn("Cannot open log file {}: {}", settings.file, file_error);
    }
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    ensure_default_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(reg.level);
    reg.loggers[name] = logger;
    return logger;
}

std::shared_ptr<spdlog::logger> supervisor_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("supervisor");
    return logger;
}

std::shared_ptr<spdlog::logger> worker_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("worker");
    return logger;
}

std::shared_ptr<spdlog::logger> daemon_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("daemon");
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}
