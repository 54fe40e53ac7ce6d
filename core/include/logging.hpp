#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LogSettings {
        std::string base_filename = "signal_generator";
        std::string directory = "logs";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        bool file_output = true;
    };

    // Sets up the shared "SignalLogger" with a colour console sink and a
    // rotating UTC-stamped file sink. SPDLOG_LEVEL overrides both levels.
    // Safe to call more than once; the previous logger is replaced.
    void initialize(const LogSettings& settings = LogSettings{});

    std::shared_ptr<spdlog::logger>& getLogger();

    // Unknown names map to info.
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
