/**
 * @file logger.h
 * @brief spdlog setup for the SAML service provider
 *
 * One default logger per process: colored console output, plus a
 * rotating file when a path is configured. Verification code logs
 * through spdlog's default logger and never configures sinks itself.
 *
 * @date 2026-10-19
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace common {

/**
 * @brief Logging options resolved from the service configuration
 */
struct LogSettings {
    std::string serviceName = "sso-service";
    std::string level = "info";
    std::string file;                            ///< Empty disables file logging
    std::size_t maxFileBytes = 10 * 1024 * 1024;
    std::size_t maxFiles = 3;
};

class Logger {
public:
    /**
     * @brief Install the process-wide default logger
     *
     * A file sink that cannot be opened does not stop the service: the
     * console sink is kept and the failure is reported as a warning.
     * An unknown level name falls back to info, also with a warning.
     *
     * @return false if the file sink could not be created
     */
    static bool initialize(const LogSettings& settings) {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(consoleSink);

        std::string fileError;
        if (!settings.file.empty()) {
            try {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    settings.file, settings.maxFileBytes, settings.maxFiles);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            } catch (const spdlog::spdlog_ex& ex) {
                fileError = ex.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>(settings.serviceName, sinks.begin(), sinks.end());
        auto level = parseLevel(settings.level);
        logger->set_level(level.value_or(spdlog::level::info));

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        if (!level) {
            spdlog::warn("Unknown LOG_LEVEL '{}', using info", settings.level);
        }
        if (!fileError.empty()) {
            spdlog::warn("Cannot open log file {}: {}", settings.file, fileError);
            return false;
        }

        spdlog::info("Logger initialized: service={}, level={}, file={}",
                     settings.serviceName, spdlog::level::to_string_view(logger->level()),
                     settings.file.empty() ? "none" : settings.file);
        return true;
    }

    /**
     * @brief Map a LOG_LEVEL name to an spdlog level
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return std::nullopt;
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
