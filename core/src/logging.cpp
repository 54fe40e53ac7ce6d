#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace core {
namespace logging {

    namespace {

        constexpr const char* kLoggerName = "SignalLogger";
        constexpr const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxFileBytes = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        std::shared_ptr<spdlog::logger> global_logger;

        // Falls back to the working directory when the requested one cannot be created
        std::string ensureDirectory(const std::string& requested) {
            std::error_code ec;
            std::filesystem::create_directories(requested, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << requested
                          << "': " << ec.message() << ". Using '.'" << std::endl;
                return ".";
            }
            return requested;
        }

        std::string utcFileStamp() {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            return fmt::format("{:04}{:02}{:02}_{:02}{:02}{:02}Z",
                               utc_tm.tm_year + 1900, utc_tm.tm_mon + 1, utc_tm.tm_mday,
                               utc_tm.tm_hour, utc_tm.tm_min, utc_tm.tm_sec);
        }

    } // end anonymous namespace

    void initialize(const LogSettings& requested) {
        LogSettings settings = requested;

        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            settings.console_level = level_from_string(env_level);
            settings.file_level = settings.console_level;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(settings.console_level);
            console_sink->set_pattern(kUtcPattern);
            sinks.push_back(console_sink);

            std::string log_file_path = "(disabled)";
            if (settings.file_output) {
                std::string dir = ensureDirectory(settings.directory);
                log_file_path = fmt::format("{}/{}_{}.log", dir, settings.base_filename, utcFileStamp());
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file_path, kMaxFileBytes, kMaxFiles, true);
                file_sink->set_level(settings.file_level);
                file_sink->set_pattern(kUtcPattern);
                sinks.push_back(file_sink);
            }

            spdlog::drop(kLoggerName);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);

            auto effective = settings.file_output ? std::min(settings.console_level, settings.file_level)
                                                  : settings.console_level;
            global_logger->set_level(effective);
            spdlog::flush_on(spdlog::level::err);

            #ifdef NDEBUG
                const char* build_type_str = "Release";
            #else
                const char* build_type_str = "Debug";
            #endif

            global_logger->info("Logging initialized ({} build). Console: {}, File: {} -> {}",
                                build_type_str,
                                spdlog::level::to_string_view(settings.console_level),
                                spdlog::level::to_string_view(settings.file_level),
                                log_file_path);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "warning") lower = "warn";
        if (lower == "error") lower = "err";
        if (lower == "crit") lower = "critical";

        auto level = spdlog::level::from_str(lower);
        if (level == spdlog::level::off && lower != "off") {
            std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using info" << std::endl;
            return spdlog::level::info;
        }
        return level;
    }

} // namespace logging
} // namespace core
