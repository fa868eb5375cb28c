#pragma once
/**
 * @file not_found_handler.hpp
 * @brief Fallback handler answering 404 for requests no deployed API claims.
 */

#include "gatehouse/handler/handler.hpp"

namespace gatehouse::handler {

/// Stateless; one instance is shared by the whole process.
class NotFoundHandler final : public Handler {
public:
    void handle(http::RequestPtr request,
                http::ResponsePtr response,
                http::ResponseHandler done) override;
};

} // namespace gatehouse::handler
