#pragma once
/**
 * @file event_manager.hpp
 * @brief In-process deployment source: subscription and serialized delivery of API events.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "gatehouse/event/api_event.hpp"

namespace gatehouse::event {

using Listener       = std::function<void(const ApiEvent&)>;
using SubscriptionId = std::uint64_t;

/**
 * @class EventManager
 * @brief Delivers each published event to every subscriber, one event at a time.
 *
 * publish() may be called from any thread; deliveries never overlap, so
 * listeners observe events in a single total order. A listener that throws
 * is logged and the remaining listeners still run.
 *
 * unsubscribe() returns only once no delivery can reach the listener any more:
 * it is skipped by deliveries in progress and the call waits for the current
 * delivery to finish. Called from inside a listener (the delivering thread) it
 * does not wait, so a listener may unsubscribe itself or its owner.
 *
 * @note Listeners must not call publish() re-entrantly (delivery lock is held),
 *       nor block on a thread that is inside unsubscribe().
 */
class EventManager {
public:
    /// Register @p listener; returns the id to pass to unsubscribe().
    SubscriptionId subscribe(Listener listener);

    /// Remove a subscription. Returns false when the id is unknown.
    bool unsubscribe(SubscriptionId id);

    /// Deliver @p event synchronously to every current subscriber.
    void publish(const ApiEvent& event);

    [[nodiscard]] std::size_t subscribers() const;

private:
    struct Subscription {
        SubscriptionId                     id;
        std::shared_ptr<Listener>          listener;
        std::shared_ptr<std::atomic<bool>> active; ///< Cleared by unsubscribe()
    };

    mutable std::mutex           subs_mu_;     ///< Guards subs_ and next_id_
    std::mutex                   delivery_mu_; ///< Serializes deliveries
    std::atomic<std::thread::id> delivering_{}; ///< Thread inside publish(), if any
    std::vector<Subscription>    subs_;
    SubscriptionId               next_id_{1};
};

} // namespace gatehouse::event
