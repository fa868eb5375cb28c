/**
 * @file config_loader.cpp
 * @brief INI loader built on Boost.PropertyTree; missing keys keep named defaults.
 */
#include "gatehouse/config/config_loader.hpp"

#include <fstream>
#include <istream>
#include <sstream>
#include <string_view>
#include <utility>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace gatehouse::config {
    namespace pt = boost::property_tree;
    using gatehouse_detail::unexpected;

    namespace {

    constexpr std::string_view API_SECTION_PREFIX = "api:";

    unexpected<ConfigError> fail(ConfigErr code, std::string message) {
        return unexpected<ConfigError>(ConfigError{code, std::move(message)});
    }

    // get<T>(key, default) swallows conversion errors; a present key must convert.
    bool get_bool(const pt::ptree& node, const std::string& key, bool fallback) {
        if (node.count(key) == 0) return fallback;
        return node.get<bool>(key);
    }

    ConfigResult parse(std::istream& in, const std::string& origin) {
        pt::ptree tree;
        try {
            pt::read_ini(in, tree);
        } catch (const pt::ini_parser_error& e) {
            return fail(ConfigErr::Malformed, origin + ": " + e.what());
        }

        GatewayConfig cfg = Loader::defaults();
        try {
            if (auto logging = tree.get_child_optional("logging")) {
                cfg.logging.level   = logging->get<std::string>("level", cfg.logging.level);
                cfg.logging.pattern = logging->get<std::string>("pattern", cfg.logging.pattern);
                if (!log::parse_level(cfg.logging.level)) {
                    return fail(ConfigErr::InvalidValue, origin + ": unknown log level '" + cfg.logging.level + "'");
                }
            }

            if (auto reactor = tree.get_child_optional("reactor")) {
                cfg.reactor.chain.response_time_header =
                    get_bool(*reactor, "response_time_header", cfg.reactor.chain.response_time_header);
            }

            for (const auto& [section, body] : tree) {
                std::string_view name{section};
                if (!name.starts_with(API_SECTION_PREFIX)) continue;

                api::Api api;
                api.id = std::string(name.substr(API_SECTION_PREFIX.size()));
                if (api.id.empty()) {
                    return fail(ConfigErr::InvalidValue, origin + ": API section without id");
                }
                api.name         = body.get<std::string>("name", api.id);
                api.version      = body.get<std::string>("version", "");
                api.enabled      = get_bool(body, "enabled", true);
                api.context_path = body.get<std::string>("context_path", "");
                if (api.context_path.empty()) {
                    return fail(ConfigErr::InvalidValue, origin + ": API " + api.id + " has no context_path");
                }
                if (auto vhost = body.get_optional<std::string>("virtual_host"); vhost && !vhost->empty()) {
                    api.virtual_host = *vhost;
                }
                cfg.apis.push_back(std::move(api));
            }
        } catch (const pt::ptree_error& e) {
            return fail(ConfigErr::InvalidValue, origin + ": " + e.what());
        }
        return cfg;
    }

    } // namespace

    GatewayConfig Loader::defaults() {
        GatewayConfig gc;
        gc.logging = log::LoggingConfig{};      // level/pattern from constants
        gc.reactor = reactor::ReactorConfig{};  // response-time header from constants
        return gc;
    }

    ConfigResult Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return fail(ConfigErr::Unreadable, "cannot open " + path);
        return parse(in, path);
    }

    ConfigResult Loader::load_from_string(const std::string& text) {
        std::istringstream in(text);
        return parse(in, "<string>");
    }

} // namespace gatehouse::config
