/**
 * @file instrumentation.cpp
 * @brief Response-time, reporting and at-most-once decorators.
 */
#include "gatehouse/chain/instrumentation.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace gatehouse::chain {

using namespace gatehouse::config::constants;
using steady = std::chrono::steady_clock;

http::ResponseHandler response_time(http::RequestPtr request, http::ResponseHandler next,
                                    bool set_header) {
    return [request = std::move(request), next = std::move(next), set_header](http::ResponsePtr response) {
        const auto invoked_at = steady::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(invoked_at - request->received_at);
        response->response_time = elapsed;
        if (set_header) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            response->headers.insert_or_assign(HEADER_RESPONSE_TIME, std::to_string(ms));
        }

        next(std::move(response));

        const auto total = std::chrono::duration_cast<std::chrono::microseconds>(steady::now() - request->received_at);
        spdlog::debug("Request {} completed in {}us", request->id, total.count());
    };
}

http::ResponseHandler reporting(std::shared_ptr<obs::Reporter> reporter, DispatchInfo info,
                                http::ResponseHandler next) {
    return [reporter = std::move(reporter), info = std::move(info), next = std::move(next)](http::ResponsePtr response) {
        if (reporter) {
            const auto& req = *info.request;
            obs::AccessRecord record{
                .request_id    = req.id,
                .method        = req.method,
                .path          = req.path,
                .host          = info.host,
                .context_path  = info.context_path,
                .status        = response->status,
                .timestamp     = req.timestamp,
                .response_time = response->response_time,
            };
            try {
                reporter->report(record);
            } catch (const std::exception& e) {
                spdlog::error("Unable to report request {}: {}", req.id, e.what());
            } catch (...) {
                spdlog::error("Unable to report request {}: unknown error", req.id);
            }
        }
        next(std::move(response));
    };
}

http::ResponseHandler once(std::string request_id, http::ResponseHandler next) {
    auto fired = std::make_shared<std::atomic<bool>>(false);
    return [fired, request_id = std::move(request_id), next = std::move(next)](http::ResponsePtr response) {
        if (fired->exchange(true, std::memory_order_acq_rel)) {
            spdlog::warn("Response callback for request {} invoked more than once, ignoring", request_id);
            return;
        }
        if (!response) {
            spdlog::error("Handler completed request {} without a response", request_id);
            response = std::make_shared<http::Response>();
            response->status = HTTP_INTERNAL_ERROR_500;
        }
        next(std::move(response));
    };
}

http::ResponseHandler build(DispatchInfo info,
                            std::shared_ptr<obs::Reporter> reporter,
                            http::ResponseHandler terminal,
                            const ChainOptions& opts) {
    auto request = info.request;
    std::string id = request->id;
    auto chain = reporting(std::move(reporter), std::move(info), std::move(terminal));
    chain = response_time(std::move(request), std::move(chain), opts.response_time_header);
    return once(std::move(id), std::move(chain));
}

} // namespace gatehouse::chain
