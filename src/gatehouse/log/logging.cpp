#include "gatehouse/log/logging.hpp"

#include <spdlog/spdlog.h>

namespace gatehouse::log {

    std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
        if (name == "off") return spdlog::level::off;
        // from_str() maps unknown names to off, hence the check above.
        const auto lvl = spdlog::level::from_str(std::string(name));
        if (lvl == spdlog::level::off) return std::nullopt;
        return lvl;
    }

    void init(const LoggingConfig& cfg) {
        auto lvl = parse_level(cfg.level);
        spdlog::set_level(lvl.value_or(spdlog::level::info));
        spdlog::default_logger()->set_pattern(cfg.pattern);
        if (!lvl) spdlog::warn("Unknown log level '{}', using info", cfg.level);
    }

} // namespace gatehouse::log
