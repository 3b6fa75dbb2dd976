#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Sets up the shared "SizingLogger": colour console sink plus a rotating
    // file "<base>_<UTC timestamp>.log" under $POSITION_SIZING_LOG_DIR (or
    // ./logs). SPDLOG_LEVEL, when set, overrides both levels. Calling it
    // again replaces the existing logger.
    void initialize(const std::string& base_log_filename = "position_sizing.log",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Throws std::runtime_error before initialize() has run
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace" .. "off", case-insensitive; unknown strings map to info
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
