#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ormcost {

/**
 * @brief One logical data-access operation: a primary query and its dependents
 *
 * Identity is the primary's origin plus the group sequence number, so the
 * same source line forced in a loop yields one group per iteration.
 */
struct QueryGroup {
    GroupId id = 0;
    Origin origin;
    uint64_t primary = 0;                   // event sequence
    std::vector<uint64_t> dependents;       // event sequences, issue order
    bool closed = false;

    /// "file:line#id"
    [[nodiscard]] std::string label() const {
        return origin.to_string() + "#" + std::to_string(id);
    }
};

/**
 * @brief Clusters the query events of one unit of work into groups
 *
 * Classification is driven by relationship scopes that the ORM integration
 * opens while it resolves a relationship on records it already produced:
 * - no scope open: the event is the primary of a new group, and every
 *   earlier group closes
 * - scope open: the event is a dependent of the group the innermost scope
 *   is bound to
 *
 * An outermost scope binds to the most recently opened still-open group (or
 * to an explicit source group). A nested scope binds to its enclosing
 * scope's group, so prefetch-of-a-prefetch stays in the enclosing group.
 */
class QueryGrouper {
public:
    /**
     * @brief Place an event and stamp group_id / role / relationship on it
     */
    QueryGroup& assign_group(QueryEvent& event);

    /**
     * @brief Open a relationship scope
     *
     * The scope is opened either way; the result is an error when it could
     * not be bound to an open group, in which case queries issued inside it
     * become primaries.
     */
    Result<GroupId> begin_relationship(std::string name,
                                       std::optional<GroupId> source = std::nullopt);

    /// @return false when no scope was open
    bool end_relationship();

    /// Close every group (unit-of-work end)
    void close_all();

    [[nodiscard]] const std::vector<QueryGroup>& groups() const { return groups_; }
    [[nodiscard]] const QueryGroup* find(GroupId id) const;
    [[nodiscard]] size_t open_scopes() const { return scopes_.size(); }

private:
    struct RelationshipScope {
        std::string path;                   // "books.reviews"
        std::optional<GroupId> group;
    };

    [[nodiscard]] std::optional<GroupId> latest_open_group() const;
    [[nodiscard]] bool is_open(GroupId id) const;

    std::vector<QueryGroup> groups_;
    std::vector<RelationshipScope> scopes_;
};

} // namespace ormcost
