#include "LogUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <memory>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF"
        };
        auto lvl = static_cast<size_t>(msg.level);
        if (lvl < sizeof(level_names) / sizeof(level_names[0])) {
            dest.append(level_names[lvl], level_names[lvl] + std::strlen(level_names[lvl]));
        } else {
            dest.append("INFO", "INFO" + 4);
        }
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

static std::unique_ptr<spdlog::formatter> make_formatter(const std::string& pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFullNameFormatter>('X');
    formatter->set_pattern(pattern);
    return formatter;
}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    if (logger) {
        shutdown();
    }

    // Synchronous sinks: log lines must not trail the report printed on stdout
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_formatter(make_formatter("%X %v"));

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty()) {
        std::filesystem::path log_path(log_file);
        std::filesystem::path parent_dir = log_path.parent_path();

        if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
            std::filesystem::create_directories(parent_dir);
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);
        file_sink->set_formatter(make_formatter("%Y-%m-%d %H:%M:%S.%f %t %X %v"));
        sinks.push_back(file_sink);
    }

    logger = std::make_shared<spdlog::logger>("arsync_logger", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    spdlog::shutdown();
    logger.reset();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

void debug(const std::string& msg) {
    if (logger) {
        logger->debug(msg);
    } else {
        std::cerr << "[DEBUG] " << msg << std::endl;
    }
}

void info(const std::string& msg) {
    if (logger) {
        logger->info(msg);
    } else {
        std::cerr << "[INFO] " << msg << std::endl;
    }
}

void warn(const std::string& msg) {
    if (logger) {
        logger->warn(msg);
    } else {
        std::cerr << "[WARN] " << msg << std::endl;
    }
}

void error(const std::string& msg) {
    if (logger) {
        logger->error(msg);
    } else {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}

void fatal(const std::string& msg) {
    if (logger) {
        logger->critical(msg);
    } else {
        std::cerr << "[FATAL] " << msg << std::endl;
    }
}

}
