#pragma once
/**
 * @file handler_factory.hpp
 * @brief Builds the ContextHandler serving one API definition.
 */

#include <functional>

#include "gatehouse/api/api.hpp"
#include "gatehouse/handler/handler.hpp"

namespace gatehouse::handler {

/// Performs all per-API wiring. May throw on construction failure; the
/// reactor catches, logs and leaves the API unserved. A null result is
/// treated the same way.
using HandlerFactory = std::function<ContextHandlerPtr(const api::Api&)>;

} // namespace gatehouse::handler
