#pragma once
/**
 * @file logging.hpp
 * @brief spdlog bootstrap for the gateway process.
 * @details Components log through spdlog's default logger
 *          (spdlog::info/warn/error/debug); access records go to the
 *          dedicated "access" logger owned by the log reporter.
 */

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "gatehouse/config/constants.hpp"

namespace gatehouse::log {

    /** @struct LoggingConfig
     *  @brief Level and pattern applied to every registered logger.
     */
    struct LoggingConfig {
        std::string level{config::constants::LOG_LEVEL_DEFAULT};     ///< trace|debug|info|warn|error|critical|off
        std::string pattern{config::constants::LOG_PATTERN_DEFAULT}; ///< spdlog pattern for the default logger
    };

    /// Parse an spdlog level name ("warning" and "err" accepted). std::nullopt if unknown.
    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

    /// Apply @p cfg to the default logger and the global level. Unknown levels fall back to info.
    void init(const LoggingConfig& cfg);

} // namespace gatehouse::log
