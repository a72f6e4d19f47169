#include "report/report_aggregator.hpp"
#include "engine/unit_of_work.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace ormcost {

namespace {

/**
 * @brief Per-shape accumulator; fetched stays "known" until one contributing
 *        query lacks a declared column set.
 */
struct ShapeAccumulator {
    ShapeFieldUsage usage;
    bool fetched_known = true;
    bool has_query = false;
};

class GroupBuilder {
public:
    ShapeAccumulator& shape(const std::string& name) {
        const auto [it, inserted] = index_.try_emplace(name, shapes_.size());
        if (inserted) {
            shapes_.emplace_back();
            shapes_.back().usage.shape = name;
            shapes_.back().usage.fetched = FieldSet{};
        }
        return shapes_[it->second];
    }

    void add_event(const QueryEvent& event) {
        auto& acc = shape(event.shape);
        acc.has_query = true;
        if (!event.completed || !event.columns) {
            acc.fetched_known = false;
            return;
        }
        acc.usage.fetched->insert(event.columns->begin(), event.columns->end());
    }

    void add_record(const FieldAccessRecord& record) {
        auto& acc = shape(record.identity.shape);
        ++acc.usage.records;
        acc.usage.consumed.insert(record.fields.begin(), record.fields.end());
    }

    void finish(GroupReport& group) {
        bool all_known = true;
        FieldSet fetched;

        for (auto& acc : shapes_) {
            auto& usage = acc.usage;
            // Records of a shape no query declared: nothing is known about its columns
            if (!acc.has_query || !acc.fetched_known) {
                usage.fetched.reset();
            }

            if (usage.fetched) {
                FieldSet over;
                std::set_difference(usage.fetched->begin(), usage.fetched->end(),
                                    usage.consumed.begin(), usage.consumed.end(),
                                    std::inserter(over, over.end()));
                usage.over_fetched = std::move(over);
                fetched.insert(usage.fetched->begin(), usage.fetched->end());
            } else {
                all_known = false;
            }

            group.consumed.insert(usage.consumed.begin(), usage.consumed.end());
            group.shapes.push_back(std::move(usage));
        }

        if (all_known) {
            // Group level is fetched - consumed over the unions; a field read
            // on any shape is never listed here
            FieldSet over;
            std::set_difference(fetched.begin(), fetched.end(),
                                group.consumed.begin(), group.consumed.end(),
                                std::inserter(over, over.end()));
            group.fetched = std::move(fetched);
            group.over_fetched = std::move(over);
        }
    }

private:
    std::vector<ShapeAccumulator> shapes_;
    std::unordered_map<std::string, size_t> index_;
};

void add_timing(Report& report, GroupReport& group, const QueryEvent& event) {
    if (event.duration) {
        group.db_time += *event.duration;
        report.total_db_time += *event.duration;
    } else {
        ++report.untimed_queries;
    }
}

} // anonymous namespace

Report ReportAggregator::finalize(const UnitOfWork& unit) {
    Report report;
    report.unit_of_work_id = unit.id();
    report.context = unit.context();
    report.started_at = unit.started_at();
    report.ended_at = unit.ended_at();
    report.total_execution_time = unit.execution_time();
    report.dropped_queries = unit.capture().dropped_events();
    report.unattributed_reads = unit.tracker().unattributed_reads();
    report.warnings = unit.warnings();

    const auto& capture = unit.capture();
    const auto& tracker = unit.tracker();
    report.total_queries = capture.events().size();

    // Groups are created in primary issue order, which is primary start order
    report.groups.reserve(unit.grouper().groups().size());
    for (const auto& group : unit.grouper().groups()) {
        GroupReport gr;
        gr.id = group.id;
        gr.label = group.label();
        gr.origin = group.origin;

        GroupBuilder builder;
        if (const auto* primary = capture.find(QueryToken{group.primary})) {
            gr.primary = *primary;
            builder.add_event(*primary);
            add_timing(report, gr, *primary);
        }
        gr.dependents.reserve(group.dependents.size());
        for (const uint64_t seq : group.dependents) {
            if (const auto* dep = capture.find(QueryToken{seq})) {
                gr.dependents.push_back(*dep);
                builder.add_event(*dep);
                add_timing(report, gr, *dep);
            }
        }
        for (const auto* record : tracker.records_for_group(group.id)) {
            builder.add_record(*record);
        }
        builder.finish(gr);

        report.groups.push_back(std::move(gr));
    }

    // Duplicate statements, compared after whitespace normalization
    std::vector<DuplicateQuery> seen;
    std::unordered_map<std::string, size_t> seen_index;
    for (const auto& event : capture.events()) {
        auto normalized = utils::normalize_sql(event.statement);
        const auto [it, inserted] = seen_index.try_emplace(normalized, seen.size());
        if (inserted) {
            seen.push_back(DuplicateQuery{std::move(normalized), 0});
        }
        ++seen[it->second].count;
    }
    for (auto& dup : seen) {
        if (dup.count > 1) report.duplicates.push_back(std::move(dup));
    }

    return report;
}

Report ReportAggregator::orphaned(const ContextId& context, std::string message,
                                  ErrorCategory category) {
    Report report;
    report.context = context;
    report.started_at = utils::now();
    report.ended_at = report.started_at;
    report.orphaned = true;
    report.warnings.push_back(ScopeWarning{category, std::move(message)});
    return report;
}

} // namespace ormcost
