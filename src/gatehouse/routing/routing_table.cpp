// RoutingTable: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock writer_mu_, copy current snapshot, mutate, atomic_store (RELEASE).
// Serializing writers makes check-then-insert atomic, which is what gives add()
// its single-winner guarantee. The shared_ptr reference count provides the
// grace period: a snapshot stays alive until the last reader drops it.

#include "gatehouse/routing/routing_table.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "gatehouse/config/constants.hpp"

namespace gatehouse::routing {

using handler::ContextHandlerPtr;
using handler::HandlerPtr;
using namespace gatehouse::config::constants;

const char* to_string(RouteErr e) noexcept {
    switch (e) {
        case RouteErr::Ok:        return "ok";
        case RouteErr::PathTaken: return "path_taken";
        case RouteErr::ApiTaken:  return "api_taken";
        case RouteErr::Invalid:   return "invalid";
    }
    return "unknown";
}

RoutingTable::RoutingTable(HandlerPtr fallback) : fallback_(std::move(fallback)) {
    if (!fallback_) throw std::invalid_argument("RoutingTable requires a fallback handler");
}

//------------------------------- Validation -----------------------------------

bool RoutingTable::validateApiId(std::string_view id) noexcept {
    return !id.empty() && id.size() <= ROUTING_MAX_API_ID_LEN;
}

bool RoutingTable::validateContextPath(std::string_view path) noexcept {
    if (path.empty() || path.size() > ROUTING_MAX_CONTEXT_PATH_LEN) return false;
    return path.front() == '/' && path.back() == '/';
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const RoutingTable::Snapshot>
RoutingTable::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed snapshot published with RELEASE in writer path.
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

HandlerPtr RoutingTable::lookup(std::string_view path, std::string_view host) const {
    if (auto h = match(path, host)) return h;
    return fallback_;
}

ContextHandlerPtr RoutingTable::match(std::string_view path, std::string_view host) const {
    auto snap = snapshot();
    if (!snap || snap->by_path.empty()) return nullptr;

    // "/api" must match "/api/" but "/apix" must not.
    std::string normalized(path);
    if (normalized.empty() || normalized.back() != '/') normalized.push_back('/');
    const std::string_view target{normalized};

    const ContextHandlerPtr* first_hostless = nullptr;
    std::size_t candidates = 0;
    for (const auto& [context_path, route] : snap->by_path) {
        if (!target.starts_with(context_path)) continue;
        const auto& h = route.handler;
        if (!h->isStarted()) continue;
        ++candidates;

        if (h->hasVirtualHost()) {
            // Host-bound candidates take precedence, so the first exact match wins.
            if (*h->virtualHost() == host) {
                spdlog::debug("Found {} handlers for path {}, returning virtual host {} on {}",
                              candidates, normalized, host, context_path);
                return h;
            }
        } else if (!first_hostless) {
            first_hostless = &h;
        }
    }

    spdlog::debug("Found {} handlers for path {}", candidates, normalized);
    if (first_hostless) return *first_hostless;
    return nullptr;
}

std::optional<std::string> RoutingTable::contextPathOf(std::string_view api_id) const {
    auto snap = snapshot();
    auto it = snap->by_api.find(api_id);
    if (it == snap->by_api.end()) return std::nullopt;
    return it->second;
}

ContextHandlerPtr RoutingTable::findByApi(std::string_view api_id) const {
    auto snap = snapshot();
    auto idx = snap->by_api.find(api_id);
    if (idx == snap->by_api.end()) return nullptr;
    auto it = snap->by_path.find(idx->second);
    if (it == snap->by_path.end() || it->second.api_id != api_id) return nullptr;
    return it->second.handler;
}

std::size_t RoutingTable::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->by_path.size() : 0;
}

std::vector<RouteInfo> RoutingTable::listRoutes() const {
    std::vector<RouteInfo> out;
    auto snap = snapshot();
    out.reserve(snap->by_path.size());
    for (const auto& [path, route] : snap->by_path) {
        out.push_back(RouteInfo{route.api_id, path, route.handler->virtualHost()});
    }
    return out;
}

RoutingTable::Stats RoutingTable::stats() const noexcept {
    return Stats{adds_.load(std::memory_order_relaxed),
                 removes_.load(std::memory_order_relaxed),
                 rejections_.load(std::memory_order_relaxed),
                 clears_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutations ------------------------------------

void RoutingTable::publish(std::shared_ptr<Snapshot> next) noexcept {
    // RCU update: RELEASE pairs with reader ACQUIRE so that all prior writes
    // to *next are visible to readers that load it.
    std::shared_ptr<const Snapshot> cnext = std::move(next); // convert to const
    std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RouteErr RoutingTable::add(std::string_view api_id, ContextHandlerPtr handler) {
    if (!handler || !validateApiId(api_id) || !validateContextPath(handler->contextPath()) ||
        !handler->isStarted()) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return RouteErr::Invalid;
    }

    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();

    if (snap->by_path.find(handler->contextPath()) != snap->by_path.end()) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return RouteErr::PathTaken;
    }
    if (snap->by_api.find(api_id) != snap->by_api.end()) {
        rejections_.fetch_add(1, std::memory_order_relaxed);
        return RouteErr::ApiTaken;
    }

    auto next = std::make_shared<Snapshot>(*snap); // copy-on-write
    const std::string path = handler->contextPath();
    next->by_path.emplace(path, Route{std::string(api_id), std::move(handler)});
    next->by_api.emplace(std::string(api_id), path);
    publish(std::move(next));
    adds_.fetch_add(1, std::memory_order_relaxed);
    return RouteErr::Ok;
}

ContextHandlerPtr RoutingTable::removeByApi(std::string_view api_id) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();

    auto idx = snap->by_api.find(api_id);
    if (idx == snap->by_api.end()) return nullptr;

    auto next = std::make_shared<Snapshot>(*snap);
    const std::string path = idx->second;
    next->by_api.erase(std::string(api_id));

    ContextHandlerPtr removed;
    auto it = next->by_path.find(path);
    if (it != next->by_path.end() && it->second.api_id == api_id) {
        removed = std::move(it->second.handler);
        next->by_path.erase(it);
        removes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        // Dangling index entry: the path is gone or belongs to another API.
        spdlog::warn("Dropping stale route index for API {} (path {})", api_id, path);
    }

    publish(std::move(next));
    return removed;
}

std::vector<RoutingTable::Route> RoutingTable::clear() {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();

    std::vector<Route> out;
    out.reserve(snap->by_path.size());
    for (const auto& [path, route] : snap->by_path) out.push_back(route);

    publish(std::make_shared<Snapshot>());
    clears_.fetch_add(1, std::memory_order_relaxed);
    return out;
}

} // namespace gatehouse::routing
