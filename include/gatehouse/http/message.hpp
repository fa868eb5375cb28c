#pragma once
/**
 * @file message.hpp
 * @brief In-process request/response model handed over by the transport layer.
 *
 * The transport owns parsing and serialization; the reactor only needs the
 * request target, the headers and a mutable response. Both objects cross
 * threads (a handler may complete on its own executor), so they travel as
 * shared_ptr.
 */

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "gatehouse/config/constants.hpp"

namespace gatehouse::http {

/// ASCII case-insensitive ordering for header names. Transparent so that
/// lookups with std::string_view do not allocate.
struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Return the header value, or std::nullopt when absent.
[[nodiscard]] std::optional<std::string_view> header(const Headers& headers, std::string_view name);

/**
 * @brief Inbound request as seen by the reactor.
 *
 * `path` is the decoded path component only (no query). `uri` is the request
 * target as received; it may be absolute (`http://host:port/path`) when the
 * client talks to the gateway as a proxy.
 */
struct Request {
    std::string id;
    std::string method{"GET"};
    std::string path{"/"};
    std::string uri;
    Headers     headers;

    /// Monotonic receipt time; origin of the response-time measurement.
    std::chrono::steady_clock::time_point received_at{std::chrono::steady_clock::now()};
    /// Wall-clock receipt time reported in access records.
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Outbound response filled in by the selected handler.
struct Response {
    int         status{config::constants::HTTP_OK_200};
    Headers     headers;
    std::string body;

    /// Elapsed time between request receipt and callback invocation.
    std::chrono::nanoseconds response_time{0};
};

using RequestPtr  = std::shared_ptr<const Request>;
using ResponsePtr = std::shared_ptr<Response>;

/// Completion callback. Invoked at most once, from any thread.
using ResponseHandler = std::function<void(ResponsePtr)>;

// --------------------------- Host resolution -------------------------------

/// Strip an optional `:port` suffix; IPv6 literals keep their brackets.
[[nodiscard]] std::string_view strip_port(std::string_view hostport) noexcept;

/// Extract the host of an absolute URI (`scheme://[userinfo@]host[:port]/...`).
/// Returns an empty string for relative targets.
[[nodiscard]] std::string host_from_uri(std::string_view uri);

/// Host the request targets: the Host header when present and non-empty,
/// otherwise the host of the absolute URI. Lower-cased, without port.
[[nodiscard]] std::string resolve_host(const Request& request);

/// ASCII lower-case copy.
[[nodiscard]] std::string to_lower(std::string_view s);

} // namespace gatehouse::http
