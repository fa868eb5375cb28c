#include "gatehouse/event/api_event.hpp"

namespace gatehouse::event {

const char* to_string(ApiEventType t) noexcept {
    switch (t) {
        case ApiEventType::Deploy:   return "deploy";
        case ApiEventType::Update:   return "update";
        case ApiEventType::Undeploy: return "undeploy";
    }
    return "unknown";
}

} // namespace gatehouse::event
