#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden by an INI file.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * Recognized layout:
 *
 *     [logging]      level, pattern
 *     [reactor]      response_time_header
 *     [api:<id>]     name, version, enabled, context_path, virtual_host
 */

#include <string>
#include <vector>

#include "gatehouse/api/api.hpp"
#include "gatehouse/compat/expected.hpp"
#include "gatehouse/log/logging.hpp"
#include "gatehouse/reactor/reactor.hpp"

namespace gatehouse::config {

    /** @struct GatewayConfig
     *  @brief Aggregate of sub-configs required by the gateway process.
     */
    struct GatewayConfig {
        log::LoggingConfig      logging; ///< Level/pattern
        reactor::ReactorConfig  reactor; ///< Instrumentation switches
        std::vector<api::Api>   apis;    ///< APIs deployed at startup, in file order
    };

    /// Result codes for configuration loading.
    enum class ConfigErr {
        Unreadable,  ///< File missing or not readable.
        Malformed,   ///< INI syntax error.
        InvalidValue ///< Unknown level, bad boolean, API without context_path...
    };

    struct ConfigError {
        ConfigErr   code;
        std::string message;
    };

    using ConfigResult = gatehouse_detail::expected<GatewayConfig, ConfigError>;

    /** @class Loader
     *  @brief Source of gateway configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Configuration used when no file is given.
        static GatewayConfig defaults();

        /**
         * @brief Load configuration from an INI file.
         * @param path File path.
         * @return GatewayConfig with defaults for every omitted key, or a ConfigError.
         */
        static ConfigResult load_from_file(const std::string& path);

        /// Same as load_from_file() for in-memory INI text.
        static ConfigResult load_from_string(const std::string& text);
    };

} // namespace gatehouse::config
