/**
 * @file handler.cpp
 * @brief ContextHandler lifecycle transitions.
 */
#include "gatehouse/handler/handler.hpp"

#include <exception>
#include <utility>

namespace gatehouse::handler {

using gatehouse_detail::unexpected;

const char* to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::Created:       return "created";
        case LifecycleState::Started:       return "started";
        case LifecycleState::Stopped:       return "stopped";
        case LifecycleState::FailedToStart: return "failed_to_start";
    }
    return "unknown";
}

std::string normalize_context_path(std::string_view path) {
    if (path.empty()) return {};
    std::string out;
    out.reserve(path.size() + 2);
    if (path.front() != '/') out.push_back('/');
    out.append(path);
    if (out.back() != '/') out.push_back('/');
    return out;
}

ContextHandler::ContextHandler(std::string_view context_path,
                               std::optional<std::string> virtual_host)
    : context_path_(normalize_context_path(context_path)) {
    if (virtual_host && !virtual_host->empty()) {
        virtual_host_ = http::to_lower(*virtual_host);
    }
}

LifecycleResult ContextHandler::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    const auto cur = state_.load(std::memory_order_relaxed);
    if (cur != LifecycleState::Created) {
        return unexpected<LifecycleError>(LifecycleError{
            LifecycleErr::InvalidTransition,
            std::string("cannot start handler in state ") + to_string(cur)});
    }

    try {
        doStart();
    } catch (const std::exception& e) {
        state_.store(LifecycleState::FailedToStart, std::memory_order_release);
        return unexpected<LifecycleError>(LifecycleError{LifecycleErr::StartFailed, e.what()});
    } catch (...) {
        state_.store(LifecycleState::FailedToStart, std::memory_order_release);
        return unexpected<LifecycleError>(LifecycleError{LifecycleErr::StartFailed, "unknown error"});
    }

    // RELEASE: a reader that sees Started also sees everything doStart() wrote.
    state_.store(LifecycleState::Started, std::memory_order_release);
    return {};
}

LifecycleResult ContextHandler::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    const auto cur = state_.load(std::memory_order_relaxed);
    if (cur != LifecycleState::Started) {
        return unexpected<LifecycleError>(LifecycleError{
            LifecycleErr::InvalidTransition,
            std::string("cannot stop handler in state ") + to_string(cur)});
    }

    // Leave the routable state first so concurrent lookups skip us.
    state_.store(LifecycleState::Stopped, std::memory_order_release);
    try {
        doStop();
    } catch (const std::exception& e) {
        return unexpected<LifecycleError>(LifecycleError{LifecycleErr::StopFailed, e.what()});
    } catch (...) {
        return unexpected<LifecycleError>(LifecycleError{LifecycleErr::StopFailed, "unknown error"});
    }
    return {};
}

} // namespace gatehouse::handler
