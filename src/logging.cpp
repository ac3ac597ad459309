#include "sentinel/logging.hpp"
#include "sentinel/errors.hpp"

#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sentinel {

namespace {

std::mutex sinks_mutex;
std::vector<spdlog::sink_ptr> extra_sinks;
spdlog::level::level_enum default_level = spdlog::level::info;

} // namespace

std::shared_ptr<spdlog::logger> make_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(sinks_mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(name);
    for (const auto& sink : extra_sinks) {
        logger->sinks().push_back(sink);
    }
    logger->set_level(default_level);
    return logger;
}

void configure_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(sinks_mutex);

    spdlog::sink_ptr file_sink;
    if (!config.file.empty()) {
        try {
            file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size_mb * 1024 * 1024, config.max_files);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("logging.file: " + std::string(e.what()));
        }
    }

    default_level = spdlog::level::from_str(config.level);
    if (file_sink) {
        extra_sinks.push_back(file_sink);
        spdlog::apply_all([&](std::shared_ptr<spdlog::logger> logger) {
            logger->sinks().push_back(file_sink);
        });
    }

    spdlog::set_level(default_level);
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace sentinel
