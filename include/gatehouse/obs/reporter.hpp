#pragma once
/**
 * @file reporter.hpp
 * @brief Reporting facade: access records, reporter sinks and process counters.
 * @details The core only emits records; where they end up (log, metrics backend,
 *          analytics) is decided by the Reporter implementations plugged in.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gatehouse::obs {

    /** @struct AccessRecord
     *  @brief Payload describing a single served request.
     */
    struct AccessRecord {
        std::string request_id;    ///< Transport-assigned request id
        std::string method;        ///< HTTP method
        std::string path;          ///< Request path
        std::string host;          ///< Resolved target host (may be empty)
        std::string context_path;  ///< Serving handler's context path; empty for not-found
        int         status{0};     ///< Response status code
        std::chrono::system_clock::time_point timestamp{}; ///< Request receipt (wall clock)
        std::chrono::nanoseconds  response_time{0};        ///< Receipt → callback invocation
    };

    /** @struct Counters
     *  @brief Process-level counters derived from reported records.
     */
    struct Counters {
        uint64_t records{0};      ///< Total records reported
        uint64_t not_found{0};    ///< Records answered by the fallback handler
        uint64_t server_errors{0};///< Records with a 5xx status
    };

    /** @class Reporter
     *  @brief Reporting sink interface. report() is fire-and-forget and must not
     *         block the request path; it may throw, callers contain it.
     */
    class Reporter {
    public:
        virtual ~Reporter() = default;
        /// Record a single access.
        virtual void report(const AccessRecord& r) = 0;
    };

    /** @class ReporterService
     *  @brief Fans a record out to every registered reporter and keeps counters.
     *  @details A reporter that throws is logged and skipped; the others still run.
     */
    class ReporterService final : public Reporter {
    public:
        void add(std::shared_ptr<Reporter> reporter);
        void report(const AccessRecord& r) override;
        [[nodiscard]] Counters snapshot() const;
        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex mu_;
        std::vector<std::shared_ptr<Reporter>> reporters_;
        Counters ctr_;
    };

    /// Reporter writing one JSON-ish line per record to the "access" spdlog logger.
    std::shared_ptr<Reporter> make_log_reporter();

    /// Render @p r as the single-line form used by the log reporter.
    std::string format_record(const AccessRecord& r);

} // namespace gatehouse::obs
