#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ormcost {

/**
 * @brief Fields read on one materialized record
 */
struct FieldAccessRecord {
    GroupId group = 0;
    RecordIdentity identity;
    FieldSet fields;
    std::unordered_map<std::string, uint32_t> read_counts;  // empty unless retained
};

/**
 * @brief Accumulates field reads per (group, record) for one unit of work
 *
 * Records become known only when the query that produced them ends, so a
 * read can never be attributed to a group whose query is still in flight.
 */
class FieldAccessTracker {
public:
    FieldAccessTracker() : FieldAccessTracker(TrackerConfig{}) {}
    explicit FieldAccessTracker(TrackerConfig config);

    /**
     * @brief Register a record produced by a group's query
     *
     * A record seen again later is re-attributed to the newer group.
     */
    void on_record_materialized(GroupId group, const RecordIdentity& identity);

    /**
     * @brief Record a field read
     * @return true if attributed; false if the record was never materialized
     *         in this unit of work (counted, otherwise dropped)
     */
    bool on_field_read(const RecordIdentity& identity, std::string_view field);

    /// Records attributed to a group, ordered by identity key
    [[nodiscard]] std::vector<const FieldAccessRecord*> records_for_group(GroupId group) const;

    [[nodiscard]] size_t total_records() const { return records_.size(); }
    [[nodiscard]] uint64_t unattributed_reads() const { return unattributed_reads_; }

private:
    using RecordKey = std::pair<GroupId, std::string>;

    TrackerConfig config_;
    std::map<RecordKey, FieldAccessRecord> records_;
    std::unordered_map<std::string, GroupId> owner_;    // identity key -> latest group
    uint64_t unattributed_reads_ = 0;
};

} // namespace ormcost
