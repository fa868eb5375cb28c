#pragma once
// Gatehouse: RoutingTable
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: every request does a lookup, deployments are rare.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics and never block.
//   • Writers are serialized by a mutex, copy the snapshot, mutate and publish with RELEASE.
//   • The primary map and the API index live in the same snapshot, so they change together.
//   • Removed handlers stay alive until the last snapshot or in-flight request drops them.


#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gatehouse/handler/handler.hpp"

namespace gatehouse::routing {

// -----------------------------------------------------------------------------
// Error codes returned by table mutations. Never throw exceptions in hot path.
// -----------------------------------------------------------------------------
/// Result codes for RoutingTable::add.
enum class RouteErr {
    Ok,         ///< Route published.
    PathTaken,  ///< Another handler already serves this context path.
    ApiTaken,   ///< The API already owns a route.
    Invalid     ///< Null handler, bad API id or context path, handler not Started.
};

[[nodiscard]] const char* to_string(RouteErr e) noexcept;

/// Read-only description of a published route.
struct RouteInfo {
    std::string api_id;
    std::string context_path;
    std::optional<std::string> virtual_host;
};

// -----------------------------------------------------------------------------
// RoutingTable class
// -----------------------------------------------------------------------------
///
/// Maintains: context path → {API id, handler}, plus API id → context path.
/// - lookup() is total: unmatched requests get the fallback handler.
/// - add() is atomic-if-absent on both the path and the API id.
/// - removeByApi() and clear() hand the removed handlers back for stopping;
///   the table never calls start()/stop() itself.
///
/// Thread-safety:
///   - Reads are lock-free (one atomic shared_ptr load).
///   - Writes are serialized by writer_mu_, may allocate.
///   - Readers may see slightly stale data, but always consistent.
//
class RoutingTable final {
public:
    // --------------------------- Keying model --------------------------------
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    struct Route {
        std::string                api_id;
        handler::ContextHandlerPtr handler;
    };

    using PathMap = std::unordered_map<std::string, Route, SKeyHash, SKeyEq>;
    using ApiMap  = std::unordered_map<std::string, std::string, SKeyHash, SKeyEq>;

    /// Immutable once published.
    struct Snapshot {
        PathMap by_path; ///< normalized context path → route
        ApiMap  by_api;  ///< API id → normalized context path
    };

    /// @param fallback Handler returned when nothing matches. Must not be null.
    explicit RoutingTable(handler::HandlerPtr fallback);

    RoutingTable(const RoutingTable&) = delete;
    RoutingTable& operator=(const RoutingTable&) = delete;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of both indexes.
    std::shared_ptr<const Snapshot> snapshot() const noexcept;

    // --------------------------- Lookup --------------------------------------
    /**
     * @brief Select the handler for a request.
     * @param path Request path (decoded, no query).
     * @param host Resolved target host, lower-case without port (may be empty).
     * @return Best match, or the fallback handler. Never null.
     *
     * Candidates are the Started handlers whose context path prefixes
     * `path` (with a '/' appended when missing). Host-bound candidates are
     * tried first and win only on an exact host match; otherwise the first
     * host-less candidate wins. Order within a group follows the snapshot.
     */
    [[nodiscard]] handler::HandlerPtr lookup(std::string_view path, std::string_view host) const;

    /// Same selection as lookup(), but nullptr instead of the fallback.
    [[nodiscard]] handler::ContextHandlerPtr match(std::string_view path, std::string_view host) const;

    /// The injected fallback handler.
    [[nodiscard]] const handler::HandlerPtr& fallback() const noexcept { return fallback_; }

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] std::optional<std::string> contextPathOf(std::string_view api_id) const;
    [[nodiscard]] handler::ContextHandlerPtr findByApi(std::string_view api_id) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<RouteInfo> listRoutes() const;

    /// Monotonic version counter. Increments on every published snapshot.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Publish a route for @p api_id keyed by the handler's context path.
    RouteErr add(std::string_view api_id, handler::ContextHandlerPtr handler);

    /// Remove the API's route. Returns the removed handler, or nullptr when the
    /// API has no route (including a dangling index entry, which is dropped).
    handler::ContextHandlerPtr removeByApi(std::string_view api_id);

    /// Remove every route and return them, API id included.
    std::vector<Route> clear();

    // --------------------------- Observability -------------------------------
    /// Stats counters (atomic, cumulative since construction).
    struct Stats {
        uint64_t adds{0}, removes{0}, rejections{0}, clears{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    handler::HandlerPtr fallback_;

    // Current snapshot (shared_ptr for RCU semantics).
    std::shared_ptr<const Snapshot> snap_{std::make_shared<Snapshot>()};
    std::atomic<uint64_t> version_{0};
    std::mutex writer_mu_;

    // Counters for observability.
    std::atomic<uint64_t> adds_{0}, removes_{0}, rejections_{0}, clears_{0};

    static bool validateApiId(std::string_view id) noexcept;
    static bool validateContextPath(std::string_view path) noexcept;

    void publish(std::shared_ptr<Snapshot> next) noexcept;
};

} // namespace gatehouse::routing
