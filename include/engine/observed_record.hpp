#pragma once

#include "core/types.hpp"
#include "engine/engine.hpp"

#include <string_view>
#include <utility>

namespace ormcost {

/**
 * @brief Record handed out by the record layer during an active unit of work
 *
 * Every read through read() is reported to the engine as a field access on
 * this record's identity. Reads after the unit of work ended are dropped
 * by the engine, so the wrapper stays usable afterwards.
 *
 * Usage:
 *   ObservedRecord<User> user(engine, ctx, RecordIdentity::keyed("users", "7"), row);
 *   const auto& name = user.read("name", &User::name);
 */
template<typename Record>
class ObservedRecord {
public:
    ObservedRecord(Engine& engine, ContextId context, RecordIdentity identity, Record record)
        : engine_(&engine),
          context_(std::move(context)),
          identity_(std::move(identity)),
          record_(std::move(record)) {}

    template<typename Value>
    const Value& read(std::string_view field, Value Record::*member) const {
        engine_->on_field_read(context_, identity_, field);
        return record_.*member;
    }

    /// Read through an accessor instead of a data member
    template<typename Getter>
    decltype(auto) read_with(std::string_view field, Getter&& getter) const {
        engine_->on_field_read(context_, identity_, field);
        return std::forward<Getter>(getter)(record_);
    }

    /// Access that is not reported (serialization by the ORM itself, debugging)
    [[nodiscard]] const Record& unobserved() const { return record_; }

    [[nodiscard]] const RecordIdentity& identity() const { return identity_; }

private:
    Engine* engine_;
    ContextId context_;
    RecordIdentity identity_;
    Record record_;
};

} // namespace ormcost
