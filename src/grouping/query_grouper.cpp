#include "grouping/query_grouper.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormcost {

QueryGroup& QueryGrouper::assign_group(QueryEvent& event) {
    if (!scopes_.empty()) {
        const auto& scope = scopes_.back();
        if (scope.group && is_open(*scope.group)) {
            auto& group = groups_[*scope.group - 1];
            group.dependents.push_back(event.sequence);
            event.group_id = group.id;
            event.role = QueryRole::DEPENDENT;
            event.relationship = scope.path;
            event.relationship_depth = static_cast<uint32_t>(scopes_.size());
            return group;
        }
    }

    for (auto& g : groups_) {
        g.closed = true;
    }

    QueryGroup group;
    group.id = groups_.size() + 1;
    group.origin = event.origin;
    group.primary = event.sequence;
    groups_.push_back(std::move(group));

    event.group_id = groups_.back().id;
    event.role = QueryRole::PRIMARY;
    event.relationship.clear();
    event.relationship_depth = 0;
    return groups_.back();
}

Result<GroupId> QueryGrouper::begin_relationship(std::string name,
                                                 std::optional<GroupId> source) {
    RelationshipScope scope;
    scope.path = scopes_.empty() ? name : scopes_.back().path + "." + name;

    if (!scopes_.empty() && scopes_.back().group) {
        // Nested resolution stays with the enclosing group
        scope.group = scopes_.back().group;
    } else if (source) {
        if (is_open(*source)) {
            scope.group = source;
        }
    } else {
        scope.group = latest_open_group();
    }

    const auto bound = scope.group;
    scopes_.push_back(std::move(scope));

    if (!bound) {
        return Result<GroupId>::error(ErrorCategory::SCOPE_VIOLATION, std::format(
            "relationship '{}' resolved with no open query group", scopes_.back().path));
    }
    return Result<GroupId>::ok(*bound);
}

bool QueryGrouper::end_relationship() {
    if (scopes_.empty()) return false;
    scopes_.pop_back();
    return true;
}

void QueryGrouper::close_all() {
    for (auto& g : groups_) {
        g.closed = true;
    }
    if (!scopes_.empty()) {
        utils::log::debug(std::format(
            "Query grouper: {} relationship scope(s) still open at close", scopes_.size()));
        scopes_.clear();
    }
}

const QueryGroup* QueryGrouper::find(GroupId id) const {
    if (id == 0 || id > groups_.size()) return nullptr;
    return &groups_[id - 1];
}

std::optional<GroupId> QueryGrouper::latest_open_group() const {
    for (auto it = groups_.rbegin(); it != groups_.rend(); ++it) {
        if (!it->closed) return it->id;
    }
    return std::nullopt;
}

bool QueryGrouper::is_open(GroupId id) const {
    const auto* group = find(id);
    return group && !group->closed;
}

} // namespace ormcost
