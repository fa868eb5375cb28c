/**
 * @file api.hpp
 * @brief Deployed API definition as carried by lifecycle events.
 *
 * Only the fields the reactor routes on live here; everything else an API
 * definition holds (endpoints, policies, plugins) is the handler factory's
 * business.
 */
#pragma once

#include <optional>
#include <string>

namespace gatehouse::api {

/**
 * @brief Minimal API descriptor.
 *
 * `id` is the identity used by Update/Undeploy events to find the route
 * again; it must stay stable across redeployments of the same API.
 */
struct Api final {
  /// Stable identity, e.g. "teams".
  std::string id;

  /// Display name.
  std::string name;

  /// Definition version label.
  std::string version;

  /// Disabled APIs are never deployed.
  bool enabled{true};

  /// URL path prefix served by the API, e.g. "/teams".
  std::string context_path;

  /// Optional hostname binding, e.g. "a.example.com".
  std::optional<std::string> virtual_host;

  /// Structural equality (compares all fields).
  bool operator==(const Api&) const = default;
};

} // namespace gatehouse::api
