#pragma once

#include "report/report.hpp"

#include <string>

namespace ormcost {

class UnitOfWork;

/**
 * @brief Builds the Report of a unit of work at its end
 */
class ReportAggregator {
public:
    /**
     * @brief Assemble groups, field usage, totals and warnings
     *
     * Runs once, after the unit of work is closed. A unit with no queries
     * yields a report with zero groups.
     */
    [[nodiscard]] static Report finalize(const UnitOfWork& unit);

    /// Report for an end that matched no finished unit of work
    [[nodiscard]] static Report orphaned(const ContextId& context, std::string message,
                                         ErrorCategory category = ErrorCategory::SCOPE_VIOLATION);
};

} // namespace ormcost
