/**
 * @file reactor.cpp
 * @brief Reactor dispatch path and deployment event handling.
 */
#include "gatehouse/reactor/reactor.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace gatehouse::reactor {

using handler::ContextHandlerPtr;
using namespace gatehouse::config::constants;

Reactor::Reactor(event::EventManager& events,
                 handler::HandlerFactory factory,
                 handler::HandlerPtr fallback,
                 std::shared_ptr<obs::Reporter> reporter,
                 ReactorConfig cfg)
    : events_(events),
      factory_(std::move(factory)),
      reporter_(std::move(reporter)),
      cfg_(cfg),
      table_(std::move(fallback)) {
    if (!factory_) throw std::invalid_argument("Reactor requires a handler factory");
}

Reactor::~Reactor() {
    try {
        stop();
        clearAll(); // handlers deployed while not subscribed
    } catch (const std::exception& e) {
        spdlog::error("Reactor shutdown failed: {}", e.what());
    } catch (...) {
        spdlog::error("Reactor shutdown failed: unknown error");
    }
}

//------------------------------- Traffic --------------------------------------

handler::HandlerPtr Reactor::bestHandler(const http::Request& request) const {
    return table_.lookup(request.path, http::resolve_host(request));
}

void Reactor::process(http::RequestPtr request, http::ResponsePtr response, http::ResponseHandler done) {
    dispatched_.fetch_add(1, std::memory_order_relaxed);
    if (!response) response = std::make_shared<http::Response>();

    if (!request) {
        spdlog::error("Rejecting dispatch without a request");
        response->status = HTTP_INTERNAL_ERROR_500;
        if (done) done(std::move(response));
        return;
    }
    spdlog::debug("Receiving a request {} for path {}", request->id, request->path);

    chain::DispatchInfo info{request, http::resolve_host(*request), {}};
    handler::HandlerPtr selected;
    if (auto matched = table_.match(request->path, info.host)) {
        info.context_path = matched->contextPath();
        selected = std::move(matched);
    } else {
        not_found_.fetch_add(1, std::memory_order_relaxed);
        selected = table_.fallback();
    }

    // Prepare the handler chain.
    auto wrapped = chain::build(std::move(info), reporter_, std::move(done), cfg_.chain);

    try {
        selected->handle(std::move(request), std::move(response), wrapped);
    } catch (const std::exception& e) {
        // The chain drops this if the handler already completed the request.
        spdlog::error("Handler failed to dispatch request: {}", e.what());
        auto failed = std::make_shared<http::Response>();
        failed->status = HTTP_INTERNAL_ERROR_500;
        wrapped(std::move(failed));
    } catch (...) {
        spdlog::error("Handler failed to dispatch request: unknown error");
        auto failed = std::make_shared<http::Response>();
        failed->status = HTTP_INTERNAL_ERROR_500;
        wrapped(std::move(failed));
    }
}

//------------------------------- Lifecycle ------------------------------------

void Reactor::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load(std::memory_order_relaxed)) return;

    subscription_ = events_.subscribe([this](const event::ApiEvent& e) { onEvent(e); });
    running_.store(true, std::memory_order_release);
    spdlog::info("Reactor started");
}

void Reactor::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!running_.load(std::memory_order_relaxed)) return;

    if (subscription_) {
        events_.unsubscribe(*subscription_);
        subscription_.reset();
    }
    clearAll();
    running_.store(false, std::memory_order_release);
    spdlog::info("Reactor stopped");
}

//------------------------------- Events ---------------------------------------

void Reactor::onEvent(const event::ApiEvent& event) noexcept {
    try {
        switch (event.type) {
            case event::ApiEventType::Deploy:
                deploy(event.api);
                break;
            case event::ApiEventType::Update:
                update(event.api);
                break;
            case event::ApiEventType::Undeploy:
                undeploy(event.api);
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Unable to apply {} event for API {}: {}",
                      event::to_string(event.type), event.api.id, e.what());
    } catch (...) {
        spdlog::error("Unable to apply {} event for API {}: unknown error",
                      event::to_string(event.type), event.api.id);
    }
}

void Reactor::deploy(const api::Api& api) {
    if (!api.enabled) {
        spdlog::warn("API {} is disabled, not deploying", api.id);
        return;
    }

    ContextHandlerPtr handler;
    try {
        handler = factory_(api);
    } catch (const std::exception& e) {
        deploy_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Unable to create handler for API {}: {}", api.id, e.what());
        return;
    } catch (...) {
        deploy_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Unable to create handler for API {}: unknown error", api.id);
        return;
    }
    if (!handler) {
        deploy_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Handler factory returned no handler for API {}", api.id);
        return;
    }

    if (auto started = handler->start(); !started) {
        deploy_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Unable to deploy handler for API {}: {}", api.id, started.error().message);
        return;
    }

    if (const auto err = table_.add(api.id, handler); err != routing::RouteErr::Ok) {
        deploy_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("API {} not published on {} ({}), discarding handler",
                     api.id, handler->contextPath(), routing::to_string(err));
        stopHandler(handler, api.id);
        return;
    }

    deployed_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("API {} has been deployed in reactor on {}{}", api.id,
                 handler->virtualHost().value_or(""), handler->contextPath());
}

void Reactor::update(const api::Api& api) {
    if (!table_.contextPathOf(api.id)) {
        spdlog::debug("API {} is not deployed yet, deploying", api.id);
        deploy(api);
        return;
    }
    // Remove-then-deploy: the path is unserved between the two steps.
    undeploy(api);
    deploy(api);
}

void Reactor::undeploy(const api::Api& api) {
    auto removed = table_.removeByApi(api.id);
    if (!removed) {
        spdlog::debug("API {} is not deployed, nothing to remove", api.id);
        return;
    }
    undeployed_.fetch_add(1, std::memory_order_relaxed);
    stopHandler(removed, api.id);
    spdlog::info("API {} has been removed from reactor", api.id);
}

void Reactor::clearAll() noexcept {
    try {
        auto routes = table_.clear();
        for (const auto& route : routes) {
            undeployed_.fetch_add(1, std::memory_order_relaxed);
            stopHandler(route.handler, route.api_id);
        }
        if (!routes.empty()) spdlog::info("Removed {} handlers from reactor", routes.size());
    } catch (const std::exception& e) {
        spdlog::error("Unable to clear reactor handlers: {}", e.what());
    } catch (...) {
        spdlog::error("Unable to clear reactor handlers: unknown error");
    }
}

void Reactor::stopHandler(const ContextHandlerPtr& handler, std::string_view api_id) noexcept {
    if (auto stopped = handler->stop(); !stopped) {
        stop_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Unable to stop handler for API {}: {}", api_id, stopped.error().message);
    }
}

ReactorStats Reactor::stats() const noexcept {
    return ReactorStats{dispatched_.load(std::memory_order_relaxed),
                        not_found_.load(std::memory_order_relaxed),
                        deployed_.load(std::memory_order_relaxed),
                        deploy_failures_.load(std::memory_order_relaxed),
                        undeployed_.load(std::memory_order_relaxed),
                        stop_failures_.load(std::memory_order_relaxed)};
}

} // namespace gatehouse::reactor
