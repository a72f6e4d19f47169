#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace ormcost {

/**
 * @brief Fetched vs consumed fields for one record shape within a group
 */
struct ShapeFieldUsage {
    std::string shape;
    OptionalFieldSet fetched;           // nullopt = unknown
    FieldSet consumed;
    OptionalFieldSet over_fetched;      // fetched - consumed, nullopt when fetched is unknown
    size_t records = 0;                 // records materialized
};

/**
 * @brief One query group of a finished unit of work
 */
struct GroupReport {
    GroupId id = 0;
    std::string label;
    Origin origin;
    QueryEvent primary;
    std::vector<QueryEvent> dependents;

    // fetched and consumed are unions over shapes; over_fetched is
    // fetched - consumed on those unions, so a column unread on one shape but
    // read on another appears only in `shapes`. fetched/over_fetched are
    // unknown as soon as one contributing query has an unknown column set.
    OptionalFieldSet fetched;
    FieldSet consumed;
    OptionalFieldSet over_fetched;
    std::vector<ShapeFieldUsage> shapes;

    std::chrono::microseconds db_time{0};

    [[nodiscard]] size_t query_count() const { return 1 + dependents.size(); }

    [[nodiscard]] bool has_over_fetch() const {
        return over_fetched.has_value() && !over_fetched->empty();
    }
};

struct DuplicateQuery {
    std::string normalized_sql;
    size_t count = 0;
};

struct ScopeWarning {
    ErrorCategory category = ErrorCategory::SCOPE_VIOLATION;
    std::string message;
};

/**
 * @brief Read-only projection of a finished unit of work
 *
 * Tree: unit of work -> groups -> {primary, dependents, fetched, consumed,
 * over-fetched}. Presentation is left to the host.
 */
struct Report {
    std::string unit_of_work_id;
    ContextId context;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point ended_at;
    std::chrono::microseconds total_execution_time{0};
    std::chrono::microseconds total_db_time{0};     // sum of known durations

    size_t total_queries = 0;
    size_t untimed_queries = 0;
    size_t dropped_queries = 0;                     // over the per-unit event limit
    uint64_t unattributed_reads = 0;                // reads on records never materialized

    std::vector<GroupReport> groups;                // ordered by primary start
    std::vector<DuplicateQuery> duplicates;         // issue order of first occurrence
    std::vector<ScopeWarning> warnings;

    // Set when the report stands for no finished unit of work
    // (end without begin, or the end of a rejected nested unit)
    bool orphaned = false;

    [[nodiscard]] const GroupReport* find_group(GroupId id) const {
        for (const auto& g : groups) {
            if (g.id == id) return &g;
        }
        return nullptr;
    }
};

} // namespace ormcost
