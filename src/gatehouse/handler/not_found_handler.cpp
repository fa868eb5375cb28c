#include "gatehouse/handler/not_found_handler.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace gatehouse::handler {

using namespace gatehouse::config::constants;

void NotFoundHandler::handle(http::RequestPtr request,
                             http::ResponsePtr response,
                             http::ResponseHandler done) {
    spdlog::debug("No handler for request {} on path {}", request->id, request->path);

    response->status = HTTP_NOT_FOUND_404;
    response->headers.insert_or_assign(HEADER_CONTENT_TYPE, NOT_FOUND_CONTENT_TYPE);
    response->body = NOT_FOUND_BODY;
    done(std::move(response));
}

} // namespace gatehouse::handler
