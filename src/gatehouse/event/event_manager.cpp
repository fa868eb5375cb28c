/**
 * @file event_manager.cpp
 * @brief EventManager subscription bookkeeping and delivery.
 */
#include "gatehouse/event/event_manager.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace gatehouse::event {

SubscriptionId EventManager::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lk(subs_mu_);
    const auto id = next_id_++;
    subs_.push_back(Subscription{id,
                                 std::make_shared<Listener>(std::move(listener)),
                                 std::make_shared<std::atomic<bool>>(true)});
    return id;
}

bool EventManager::unsubscribe(SubscriptionId id) {
    {
        std::lock_guard<std::mutex> lk(subs_mu_);
        auto it = std::find_if(subs_.begin(), subs_.end(),
                               [id](const Subscription& s) { return s.id == id; });
        if (it == subs_.end()) return false;
        it->active->store(false, std::memory_order_release);
        subs_.erase(it);
    }

    // Wait out a delivery that may already be running the listener, unless
    // we are that delivery.
    if (delivering_.load(std::memory_order_acquire) != std::this_thread::get_id()) {
        std::lock_guard<std::mutex> wait(delivery_mu_);
    }
    return true;
}

std::size_t EventManager::subscribers() const {
    std::lock_guard<std::mutex> lk(subs_mu_);
    return subs_.size();
}

void EventManager::publish(const ApiEvent& event) {
    std::lock_guard<std::mutex> delivery(delivery_mu_);
    delivering_.store(std::this_thread::get_id(), std::memory_order_release);

    // Copy so listeners may (un)subscribe while being notified.
    std::vector<Subscription> subs;
    {
        std::lock_guard<std::mutex> lk(subs_mu_);
        subs = subs_;
    }

    spdlog::debug("Publishing {} event for API {} to {} listeners",
                  to_string(event.type), event.api.id, subs.size());

    for (const auto& s : subs) {
        if (!s.active->load(std::memory_order_acquire)) continue; // unsubscribed meanwhile
        try {
            (*s.listener)(event);
        } catch (const std::exception& e) {
            spdlog::error("Listener {} failed on {} event for API {}: {}",
                          s.id, to_string(event.type), event.api.id, e.what());
        } catch (...) {
            spdlog::error("Listener {} failed on {} event for API {}: unknown error",
                          s.id, to_string(event.type), event.api.id);
        }
    }

    delivering_.store(std::thread::id{}, std::memory_order_release);
}

} // namespace gatehouse::event
