#pragma once
/**
 * @file handler.hpp
 * @brief Handler capability interface and the per-API context handler state machine.
 *
 * Lifecycle of a ContextHandler:
 *
 *     Created --start()--> Started --stop()--> Stopped
 *        \
 *         +--start() fails--> FailedToStart
 *
 * Stopped and FailedToStart are terminal. An update never revives a handler;
 * the reactor always builds a fresh one.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "gatehouse/compat/expected.hpp"
#include "gatehouse/http/message.hpp"

namespace gatehouse::handler {

/// Anything able to fully serve a request.
class Handler {
public:
    virtual ~Handler() = default;

    /**
     * @brief Serve @p request, filling @p response, then invoke @p done exactly once.
     * @note May return before completion; @p done can run on any thread.
     */
    virtual void handle(http::RequestPtr request,
                        http::ResponsePtr response,
                        http::ResponseHandler done) = 0;
};

/// Lifecycle states of a ContextHandler.
enum class LifecycleState : std::uint8_t {
    Created = 0,
    Started,
    Stopped,
    FailedToStart
};

[[nodiscard]] const char* to_string(LifecycleState s) noexcept;

/// Result codes for lifecycle transitions.
enum class LifecycleErr {
    InvalidTransition, ///< start()/stop() called from a state that does not allow it.
    StartFailed,       ///< doStart() threw; handler is now FailedToStart.
    StopFailed         ///< doStop() threw; handler is Stopped regardless.
};

struct LifecycleError {
    LifecycleErr code;
    std::string  message;
};

using LifecycleResult = gatehouse_detail::expected<void, LifecycleError>;

/// Normalize a context path: ensure a leading and a trailing '/'. Empty stays empty.
[[nodiscard]] std::string normalize_context_path(std::string_view path);

/**
 * @class ContextHandler
 * @brief Handler bound to a context path and optionally a virtual host.
 *
 * Subclasses implement handle() plus the optional doStart()/doStop() hooks.
 * The hooks may throw; start()/stop() convert the exception into a
 * LifecycleError and apply the transition.
 *
 * Thread-safety: state() is lock-free; start()/stop() serialize on an
 * internal mutex.
 */
class ContextHandler : public Handler {
public:
    explicit ContextHandler(std::string_view context_path,
                            std::optional<std::string> virtual_host = std::nullopt);
    ~ContextHandler() override = default;

    ContextHandler(const ContextHandler&) = delete;
    ContextHandler& operator=(const ContextHandler&) = delete;

    /// Normalized context path ("/teams/").
    [[nodiscard]] const std::string& contextPath() const noexcept { return context_path_; }

    /// Lower-cased virtual host, if bound.
    [[nodiscard]] const std::optional<std::string>& virtualHost() const noexcept { return virtual_host_; }
    [[nodiscard]] bool hasVirtualHost() const noexcept { return virtual_host_.has_value(); }

    [[nodiscard]] LifecycleState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool isStarted() const noexcept { return state() == LifecycleState::Started; }

    /// Created -> Started, or Created -> FailedToStart when doStart() throws.
    LifecycleResult start();

    /// Started -> Stopped. A throwing doStop() still ends in Stopped.
    LifecycleResult stop();

protected:
    virtual void doStart() {}
    virtual void doStop() {}

private:
    std::string                context_path_;
    std::optional<std::string> virtual_host_;
    std::atomic<LifecycleState> state_{LifecycleState::Created};
    std::mutex                 lifecycle_mu_;
};

using HandlerPtr        = std::shared_ptr<Handler>;
using ContextHandlerPtr = std::shared_ptr<ContextHandler>;

} // namespace gatehouse::handler
