#pragma once
/**
 * @file instrumentation.hpp
 * @brief Decorators composed around the transport's terminal response callback.
 *
 * The composed chain, outermost first:
 *
 *     once → response_time → reporting → terminal
 *
 * response_time stamps the elapsed time before reporting and terminal run and
 * logs the total after they return, so its measurement brackets both.
 * Composition happens once per request on the dispatching thread; the result
 * may be invoked from any thread.
 */

#include <memory>
#include <string>

#include "gatehouse/config/constants.hpp"
#include "gatehouse/http/message.hpp"
#include "gatehouse/obs/reporter.hpp"

namespace gatehouse::chain {

/** @struct ChainOptions
 *  @brief Per-reactor switches for the decorators.
 */
struct ChainOptions {
    bool response_time_header{config::constants::REACTOR_RESPONSE_TIME_HEADER}; ///< Set HEADER_RESPONSE_TIME
};

/** @struct DispatchInfo
 *  @brief What the reactor knows about a request once the handler is chosen.
 */
struct DispatchInfo {
    http::RequestPtr request;
    std::string      host;          ///< Resolved host used for routing
    std::string      context_path;  ///< Selected handler's context path; empty for fallback
};

/// Record `now - request.received_at` into the response, then call @p next.
http::ResponseHandler response_time(http::RequestPtr request, http::ResponseHandler next,
                                    bool set_header);

/// Emit an AccessRecord to @p reporter (failures logged), then call @p next.
http::ResponseHandler reporting(std::shared_ptr<obs::Reporter> reporter, DispatchInfo info,
                                http::ResponseHandler next);

/// Forward the first invocation only; later ones are logged and dropped.
http::ResponseHandler once(std::string request_id, http::ResponseHandler next);

/// Build the full chain around @p terminal.
http::ResponseHandler build(DispatchInfo info,
                            std::shared_ptr<obs::Reporter> reporter,
                            http::ResponseHandler terminal,
                            const ChainOptions& opts = {});

} // namespace gatehouse::chain
