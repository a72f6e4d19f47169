#pragma once

#include "capture/query_capture.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "correlator/origin_resolver.hpp"
#include "grouping/query_grouper.hpp"
#include "report/report.hpp"
#include "tracker/field_access_tracker.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ormcost {

/**
 * @brief Instrumentation state of one bounded operation (one request)
 *
 * Owned by one execution context and never shared between threads while
 * active, so nothing in here is synchronized.
 */
class UnitOfWork {
public:
    UnitOfWork(ContextId context,
               const EngineConfig& config,
               std::shared_ptr<IClock> clock,
               std::shared_ptr<const OriginResolver> resolver);

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    // ---- Hooks -------------------------------------------------------------

    /// Capture, attribute and group a query at its forcing point
    [[nodiscard]] QueryToken on_query_start(std::string_view statement,
                                            const std::vector<std::string>& params);

    /// Complete a query and register the records it produced
    std::optional<QueryEvent> on_query_end(QueryToken token, const ResultShape& result);

    Result<GroupId> begin_relationship(std::string name, std::optional<GroupId> source);
    void end_relationship();

    bool on_field_read(const RecordIdentity& identity, std::string_view field);

    // ---- Lifecycle ---------------------------------------------------------

    void add_warning(ErrorCategory category, std::string message);

    /**
     * @brief A nested begin on this context was rejected; its end is still owed
     * @return Ticket the rejected guard hands back if that end never comes
     */
    uint64_t note_rejected_begin();

    /// @return true if this end pairs with a rejected nested begin (innermost first)
    bool consume_rejected_end();

    /// Drop a rejected begin whose scope exited without ending; no-op once consumed
    void cancel_rejected_begin(uint64_t ticket);

    /// Stop tracking: closes all groups and stamps the end time
    void close();

    // ---- Accessors ---------------------------------------------------------

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const ContextId& context() const { return context_; }
    [[nodiscard]] bool is_closed() const { return closed_; }

    [[nodiscard]] std::chrono::system_clock::time_point started_at() const { return started_at_; }
    [[nodiscard]] std::chrono::system_clock::time_point ended_at() const { return ended_at_; }
    [[nodiscard]] std::chrono::microseconds execution_time() const;

    [[nodiscard]] const QueryCapture& capture() const { return capture_; }
    [[nodiscard]] const QueryGrouper& grouper() const { return grouper_; }
    [[nodiscard]] const FieldAccessTracker& tracker() const { return tracker_; }
    [[nodiscard]] const std::vector<ScopeWarning>& warnings() const { return warnings_; }

private:
    std::string id_;
    ContextId context_;
    std::chrono::system_clock::time_point started_at_;
    std::chrono::system_clock::time_point ended_at_;
    std::chrono::steady_clock::time_point started_steady_;
    std::chrono::steady_clock::time_point ended_steady_;

    std::shared_ptr<const OriginResolver> resolver_;
    QueryCapture capture_;
    QueryGrouper grouper_;
    FieldAccessTracker tracker_;

    std::vector<ScopeWarning> warnings_;
    std::vector<uint64_t> rejected_begins_;
    uint64_t next_rejected_ticket_ = 1;
    bool closed_ = false;
};

} // namespace ormcost
