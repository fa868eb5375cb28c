#pragma once
/**
 * @file reactor.hpp
 * @brief Request dispatch and handler lifecycle orchestration.
 *
 * **Traffic** (any thread, concurrent):
 * - process(): routing-table lookup → instrumentation chain → handler.handle().
 *
 * **Deployment events** (serialized by the event manager, concurrent with traffic):
 * - Deploy:   factory → start → add; failures leave the API unserved.
 * - Update:   remove + stop the current handler (if any), then Deploy.
 * - Undeploy: remove + stop; a second Undeploy is a no-op.
 *
 * **Lifecycle**
 * - start(): subscribe to the event manager.
 * - stop():  unsubscribe, then stop and drop every handler.
 *
 * **Invariants**
 * - Only Started handlers are ever published; a handler is removed from the
 *   table before stop() is called on it.
 * - Nothing thrown by collaborators escapes onEvent().
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "gatehouse/api/api.hpp"
#include "gatehouse/chain/instrumentation.hpp"
#include "gatehouse/event/event_manager.hpp"
#include "gatehouse/handler/handler.hpp"
#include "gatehouse/handler/handler_factory.hpp"
#include "gatehouse/http/message.hpp"
#include "gatehouse/obs/reporter.hpp"
#include "gatehouse/routing/routing_table.hpp"

namespace gatehouse::reactor {

/** @struct ReactorConfig
 *  @brief Reactor-level options (see [reactor] in the INI config).
 */
struct ReactorConfig {
    chain::ChainOptions chain{}; ///< Instrumentation switches
};

/** @struct ReactorStats
 *  @brief Cumulative counters since construction.
 */
struct ReactorStats {
    uint64_t dispatched{0};      ///< process() calls
    uint64_t not_found{0};       ///< Dispatches to the fallback handler
    uint64_t deployed{0};        ///< Handlers published
    uint64_t deploy_failures{0}; ///< Factory/start failures and rejected registrations
    uint64_t undeployed{0};      ///< Handlers removed (undeploy, update, clear)
    uint64_t stop_failures{0};   ///< Handler stop() errors (swallowed)
};

/**
 * @class Reactor
 * @brief Selects the handler for each request and keeps the handler population
 *        in sync with deployment events.
 */
class Reactor {
public:
    /**
     * @param events   Deployment source subscribed to by start().
     * @param factory  Builds one handler per API definition.
     * @param fallback Not-found handler for unmatched requests.
     * @param reporter Reporting collaborator (may be null to disable reporting).
     * @param cfg      Reactor options.
     */
    Reactor(event::EventManager& events,
            handler::HandlerFactory factory,
            handler::HandlerPtr fallback,
            std::shared_ptr<obs::Reporter> reporter,
            ReactorConfig cfg = {});
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;
    Reactor(Reactor&&) = delete;
    Reactor& operator=(Reactor&&) = delete;

    // --------------------------- Transport side ------------------------------
    /// Dispatch one request. Returns once the handler has accepted it.
    /// A null request is answered with a 500 without reaching any handler.
    void process(http::RequestPtr request, http::ResponsePtr response, http::ResponseHandler done);

    /// Handler that process() would select for @p request.
    [[nodiscard]] handler::HandlerPtr bestHandler(const http::Request& request) const;

    void start();
    /// Unsubscribe, waiting out an in-flight event delivery, then clear every handler.
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    // --------------------------- Deployment side -----------------------------
    /// Apply one lifecycle event. Never throws.
    void onEvent(const event::ApiEvent& event) noexcept;

    void deploy(const api::Api& api);
    void update(const api::Api& api);
    void undeploy(const api::Api& api);

    /// Stop and remove every handler. Best effort; never throws.
    void clearAll() noexcept;

    // --------------------------- Introspection -------------------------------
    [[nodiscard]] std::vector<routing::RouteInfo> routes() const { return table_.listRoutes(); }
    [[nodiscard]] const routing::RoutingTable& table() const noexcept { return table_; }
    [[nodiscard]] ReactorStats stats() const noexcept;

private:
    /// Stop a handler that is no longer (or never was) published.
    void stopHandler(const handler::ContextHandlerPtr& handler, std::string_view api_id) noexcept;

    event::EventManager&           events_;
    handler::HandlerFactory        factory_;
    std::shared_ptr<obs::Reporter> reporter_;
    ReactorConfig                  cfg_;
    routing::RoutingTable          table_;

    std::mutex                             lifecycle_mu_; ///< Guards start()/stop()
    std::optional<event::SubscriptionId>   subscription_;
    std::atomic<bool>                      running_{false};

    std::atomic<uint64_t> dispatched_{0}, not_found_{0}, deployed_{0},
                          deploy_failures_{0}, undeployed_{0}, stop_failures_{0};
};

} // namespace gatehouse::reactor
