/**
 * @file reporter.cpp
 * @brief ReporterService fan-out and the spdlog-backed access reporter.
 */
#include "gatehouse/obs/reporter.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "gatehouse/config/constants.hpp"

namespace gatehouse::obs {

    using namespace gatehouse::config::constants;

    void ReporterService::add(std::shared_ptr<Reporter> reporter) {
        if (!reporter) return;
        std::lock_guard<std::mutex> lk(mu_);
        reporters_.push_back(std::move(reporter));
    }

    void ReporterService::report(const AccessRecord& r) {
        std::vector<std::shared_ptr<Reporter>> sinks;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.records++;
            if (r.status == HTTP_NOT_FOUND_404 && r.context_path.empty()) ctr_.not_found++;
            if (r.status >= 500) ctr_.server_errors++;
            sinks = reporters_;
        }
        // Sinks run outside the lock so a slow one cannot stall the others' callers.
        for (const auto& sink : sinks) {
            try {
                sink->report(r);
            } catch (const std::exception& e) {
                spdlog::error("Reporter failed for request {}: {}", r.request_id, e.what());
            } catch (...) {
                spdlog::error("Reporter failed for request {}: unknown error", r.request_id);
            }
        }
    }

    Counters ReporterService::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    std::size_t ReporterService::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return reporters_.size();
    }

    std::string format_record(const AccessRecord& r) {
        using namespace std::chrono;
        const auto ts_ms = duration_cast<milliseconds>(r.timestamp.time_since_epoch()).count();
        const double rt_ms = duration<double, std::milli>(r.response_time).count();
        return fmt::format(
            R"({{"id":"{}","ts":{},"method":"{}","host":"{}","path":"{}","context":"{}","status":{},"response_time_ms":{:.3f}}})",
            r.request_id, ts_ms, r.method, r.host, r.path, r.context_path, r.status, rt_ms);
    }

    namespace {

    class LogReporter final : public Reporter {
    public:
        explicit LogReporter(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

        void report(const AccessRecord& r) override {
            logger_->info(format_record(r));
        }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    } // namespace

    std::shared_ptr<Reporter> make_log_reporter() {
        auto logger = spdlog::get(LOG_ACCESS_LOGGER);
        if (!logger) {
            try {
                logger = spdlog::stdout_color_mt(LOG_ACCESS_LOGGER);
                logger->set_pattern("%v");
            } catch (const spdlog::spdlog_ex&) {
                // Registered concurrently by another caller.
                logger = spdlog::get(LOG_ACCESS_LOGGER);
            }
        }
        return std::make_shared<LogReporter>(std::move(logger));
    }

} // namespace gatehouse::obs
