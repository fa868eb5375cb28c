/**
 * @file main.cpp
 * @brief gatehouse_app: wire config → event manager → reactor, then dispatch probe URIs.
 *
 * **Bootstrap**
 * - Parse CLI, load the INI config, initialize logging.
 * - Construct EventManager, Reactor (static handler per API, access log
 *   behind a counting ReporterService).
 *
 * **Deployment**
 * - start() the reactor, publish Deploy for every configured API.
 *
 * **Probes**
 * - Each positional URI becomes a request (Host taken from the URI); the
 *   resulting status and body are printed.
 *
 * **Shutdown**
 * - stop() unsubscribes and stops every handler; reactor and access
 *   counters are logged.
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "gatehouse/config/config_loader.hpp"
#include "gatehouse/event/event_manager.hpp"
#include "gatehouse/handler/not_found_handler.hpp"
#include "gatehouse/log/logging.hpp"
#include "gatehouse/obs/reporter.hpp"
#include "gatehouse/reactor/reactor.hpp"
#include "gatehouse/version.hpp"

namespace po = boost::program_options;

namespace {

/// Answers every request with a fixed body naming the API that served it.
class StaticHandler final : public gatehouse::handler::ContextHandler {
public:
    explicit StaticHandler(const gatehouse::api::Api& api)
        : ContextHandler(api.context_path, api.virtual_host),
          body_(api.name + " " + api.version) {}

    void handle(gatehouse::http::RequestPtr, gatehouse::http::ResponsePtr response,
                gatehouse::http::ResponseHandler done) override {
        response->status = gatehouse::config::constants::HTTP_OK_200;
        response->headers.insert_or_assign(gatehouse::config::constants::HEADER_CONTENT_TYPE, "text/plain");
        response->body = body_;
        done(std::move(response));
    }

protected:
    void doStart() override { spdlog::debug("Static handler on {} started", contextPath()); }
    void doStop() override { spdlog::debug("Static handler on {} stopped", contextPath()); }

private:
    std::string body_;
};

/// Path component of an absolute or origin-form URI, without query or fragment.
std::string path_of(std::string_view uri) {
    if (auto scheme = uri.find("://"); scheme != std::string_view::npos) {
        uri.remove_prefix(scheme + 3);
        const auto slash = uri.find('/');
        if (slash == std::string_view::npos) return "/";
        uri.remove_prefix(slash);
    }
    if (auto q = uri.find_first_of("?#"); q != std::string_view::npos) uri = uri.substr(0, q);
    return uri.empty() ? std::string("/") : std::string(uri);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string log_level;
    std::vector<std::string> probes;

    po::options_description desc("gatehouse - API gateway request dispatcher");
    desc.add_options()
        ("help,h", "Show help message")
        ("version,v", "Show version")
        ("config,c", po::value<std::string>(&config_path),
            "INI configuration file")
        ("log-level,l", po::value<std::string>(&log_level),
            "Override [logging] level (trace|debug|info|warn|error|critical|off)")
        ("probe", po::value<std::vector<std::string>>(&probes),
            "Request URI to dispatch after deployment")
    ;
    po::positional_options_description positional;
    positional.add("probe", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        std::cout << "Usage: gatehouse_app --config FILE [--log-level LEVEL] [probe-uri...]\n\n"
                  << desc << "\n";
        return EXIT_SUCCESS;
    }
    if (vm.count("version")) {
        std::cout << "gatehouse " << gatehouse::version_string << "\n";
        return EXIT_SUCCESS;
    }

    auto loaded = config_path.empty() ? gatehouse::config::ConfigResult(gatehouse::config::Loader::defaults())
                                      : gatehouse::config::Loader::load_from_file(config_path);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().message << "\n";
        return EXIT_FAILURE;
    }
    auto cfg = std::move(*loaded);
    if (!log_level.empty()) {
        if (!gatehouse::log::parse_level(log_level)) {
            std::cerr << "Error: unknown log level '" << log_level << "'\n";
            return EXIT_FAILURE;
        }
        cfg.logging.level = log_level;
    }
    gatehouse::log::init(cfg.logging);

    auto reporting = std::make_shared<gatehouse::obs::ReporterService>();
    reporting->add(gatehouse::obs::make_log_reporter());

    gatehouse::event::EventManager events;
    gatehouse::reactor::Reactor reactor(
        events,
        [](const gatehouse::api::Api& api) { return std::make_shared<StaticHandler>(api); },
        std::make_shared<gatehouse::handler::NotFoundHandler>(),
        reporting,
        cfg.reactor);

    reactor.start();
    for (const auto& api : cfg.apis) {
        events.publish(gatehouse::event::ApiEvent{gatehouse::event::ApiEventType::Deploy, api});
    }

    std::cout << "Routes:\n";
    for (const auto& r : reactor.routes()) {
        std::cout << "  " << std::left << std::setw(16) << r.api_id
                  << std::setw(24) << r.virtual_host.value_or("*")
                  << r.context_path << "\n";
    }

    for (std::size_t i = 0; i < probes.size(); ++i) {
        const auto& uri = probes[i];
        auto request = std::make_shared<gatehouse::http::Request>();
        request->id   = "probe-" + std::to_string(i);
        request->uri  = uri;
        request->path = path_of(uri);

        reactor.process(request, std::make_shared<gatehouse::http::Response>(),
                        [&uri](gatehouse::http::ResponsePtr response) {
                            std::cout << uri << " -> " << response->status;
                            if (!response->body.empty()) std::cout << " (" << response->body << ")";
                            std::cout << "\n";
                        });
    }

    const auto stats = reactor.stats();
    reactor.stop();
    const auto access = reporting->snapshot();
    spdlog::info("Dispatched {} requests ({} not found), {} APIs deployed, {} failed",
                 stats.dispatched, stats.not_found, stats.deployed, stats.deploy_failures);
    spdlog::info("Access log: {} records, {} not found, {} server errors",
                 access.records, access.not_found, access.server_errors);
    return EXIT_SUCCESS;
}
