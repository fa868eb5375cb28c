#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the dispatch reactor and its ambient stack.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (INI) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace gatehouse::config::constants {

// =====================
// HTTP status codes used by the core (the transport owns the rest)
// =====================
inline constexpr int HTTP_OK_200        = 200;
inline constexpr int HTTP_NOT_FOUND_404 = 404;
inline constexpr int HTTP_INTERNAL_ERROR_500 = 500;

// =====================
// Header names
// =====================
/// Virtual-host resolution prefers this request header.
inline constexpr const char* HEADER_HOST          = "Host";
inline constexpr const char* HEADER_CONTENT_TYPE  = "Content-Type";
/// Elapsed proxy time in milliseconds, set by the response-time layer.
inline constexpr const char* HEADER_RESPONSE_TIME = "X-Gatehouse-Response-Time";

// =====================
// Fallback (not-found) handler
// =====================
inline constexpr const char* NOT_FOUND_CONTENT_TYPE = "text/plain";
inline constexpr const char* NOT_FOUND_BODY         = "No context-path matches the request URI.";

// =====================
// Reactor defaults
// =====================
inline constexpr bool REACTOR_RESPONSE_TIME_HEADER = true; ///< Emit HEADER_RESPONSE_TIME

// =====================
// Routing table limits (bounded memory, validation)
// =====================
inline constexpr std::size_t ROUTING_MAX_API_ID_LEN       = 128;
inline constexpr std::size_t ROUTING_MAX_CONTEXT_PATH_LEN = 1024;

// =====================
// Logging defaults
// =====================
inline constexpr const char* LOG_LEVEL_DEFAULT   = "info";
inline constexpr const char* LOG_PATTERN_DEFAULT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
/// Named spdlog logger receiving one line per access record.
inline constexpr const char* LOG_ACCESS_LOGGER   = "access";

// =====================
// Lookup benchmark defaults
// =====================
inline constexpr std::size_t BENCH_ROUTES          = 64;      ///< Static routes preloaded
inline constexpr std::size_t BENCH_READERS         = 4;       ///< Concurrent lookup threads
inline constexpr std::uint64_t BENCH_LOOKUPS_PER_READER = 2'000'000;

} // namespace gatehouse::config::constants
