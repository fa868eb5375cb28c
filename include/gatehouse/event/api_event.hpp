#pragma once
/**
 * @file api_event.hpp
 * @brief API lifecycle event emitted by the deployment subsystem.
 */

#include <cstdint>

#include "gatehouse/api/api.hpp"

namespace gatehouse::event {

/**
 * @enum ApiEventType
 * @brief What happened to the API.
 *
 * Start/Stop are the older start/stop source model; they alias Deploy and
 * Undeploy.
 */
enum class ApiEventType : std::uint8_t {
    Deploy = 0,
    Update,
    Undeploy,
    Start = Deploy,
    Stop  = Undeploy
};

[[nodiscard]] const char* to_string(ApiEventType t) noexcept;

/// Consumed once; not persisted.
struct ApiEvent {
    ApiEventType type{ApiEventType::Deploy};
    api::Api     api;
};

} // namespace gatehouse::event
