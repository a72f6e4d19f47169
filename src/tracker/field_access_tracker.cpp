#include "tracker/field_access_tracker.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormcost {

FieldAccessTracker::FieldAccessTracker(TrackerConfig config)
    : config_(std::move(config)) {}

void FieldAccessTracker::on_record_materialized(GroupId group, const RecordIdentity& identity) {
    std::string key = identity.key();
    owner_.insert_or_assign(key, group);

    auto [it, inserted] = records_.try_emplace(RecordKey{group, std::move(key)});
    if (inserted) {
        it->second.group = group;
        it->second.identity = identity;
    }
}

bool FieldAccessTracker::on_field_read(const RecordIdentity& identity, std::string_view field) {
    std::string key = identity.key();
    const auto owner = owner_.find(key);
    if (owner == owner_.end()) {
        ++unattributed_reads_;
        utils::log::debug(std::format(
            "Field tracker: read of '{}' on unknown record {}", field, key));
        return false;
    }

    auto& record = records_.at(RecordKey{owner->second, std::move(key)});
    record.fields.emplace(field);
    if (config_.retain_read_counts) {
        ++record.read_counts[std::string(field)];
    }
    return true;
}

std::vector<const FieldAccessRecord*> FieldAccessTracker::records_for_group(GroupId group) const {
    std::vector<const FieldAccessRecord*> result;
    for (auto it = records_.lower_bound(RecordKey{group, std::string()});
         it != records_.end() && it->first.first == group; ++it) {
        result.push_back(&it->second);
    }
    return result;
}

} // namespace ormcost
