#include "order_voice/logging.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "order_voice/utils/text.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace order_voice::logging {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> active_logger;

spdlog::level::level_enum level_from_name(const std::string& name) {
    const auto value = utils::to_lower(name);
    if (value == "trace") return spdlog::level::trace;
    if (value == "debug") return spdlog::level::debug;
    if (value == "warn" || value == "warning") return spdlog::level::warn;
    if (value == "error") return spdlog::level::err;
    if (value == "critical") return spdlog::level::critical;
    if (value == "off") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" ,=\"\n") != std::string::npos;
}

std::shared_ptr<spdlog::logger> current() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (active_logger) {
        return active_logger;
    }
    return spdlog::default_logger();
}

}

std::string render(const std::string& message, Fields fields) {
    if (fields.size() == 0) {
        return message;
    }
    std::string out = message + " [";
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += field.key + "=";
        out += needs_quotes(field.value) ? "\"" + field.value + "\"" : field.value;
    }
    out += "]";
    return out;
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};

    if (config.log_filename) {
        const std::filesystem::path path(*config.log_filename);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e | %^%-8l%$ | %t | %v");
    logger->set_level(level_from_name(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    std::lock_guard<std::mutex> lock(logger_mutex);
    active_logger = logger;
}

void shutdown() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (active_logger) {
            active_logger->flush();
        }
        active_logger.reset();
    }
    spdlog::shutdown();
}

void write(spdlog::level::level_enum level, const std::string& message, Fields fields) {
    auto logger = current();
    if (logger && logger->should_log(level)) {
        logger->log(level, render(message, fields));
    }
}

}
