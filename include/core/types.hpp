#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ormcost {

// ============================================================================
// Identifiers
// ============================================================================

/// Caller-supplied key of one logical execution context (request, task, ...)
using ContextId = std::string;

/// Per-unit-of-work group sequence number (1-based)
using GroupId = uint64_t;

/// Ordered so reports come out deterministic
using FieldSet = std::set<std::string>;

/// std::nullopt means "unknown", which is distinct from an empty set
using OptionalFieldSet = std::optional<FieldSet>;

/**
 * @brief Handle returned by on_query_start, redeemed by on_query_end
 *
 * sequence 0 is the invalid token (no active unit of work, or the event
 * limit was reached).
 */
struct QueryToken {
    uint64_t sequence = 0;

    [[nodiscard]] bool valid() const { return sequence != 0; }
};

// ============================================================================
// Origin
// ============================================================================

/**
 * @brief Application source location that forced a deferred query
 */
struct Origin {
    std::string file;
    uint32_t line = 0;
    std::string function;
    bool attributed = false;

    [[nodiscard]] static Origin unattributed() { return Origin{}; }

    [[nodiscard]] static Origin at(std::string file, uint32_t line, std::string function = "") {
        Origin o;
        o.file = std::move(file);
        o.line = line;
        o.function = std::move(function);
        o.attributed = true;
        return o;
    }

    /// "file:line", or "<unattributed>"
    [[nodiscard]] std::string to_string() const {
        if (!attributed) return "<unattributed>";
        return file + ":" + std::to_string(line);
    }

    bool operator==(const Origin&) const = default;
};

// ============================================================================
// Record identity
// ============================================================================

/**
 * @brief Identity of one materialized record
 *
 * Table/shape + primary key when the record layer knows the key, otherwise
 * the object address of the materialized record.
 */
struct RecordIdentity {
    std::string shape;
    std::optional<std::string> primary_key;
    uintptr_t object_address = 0;

    RecordIdentity() = default;

    [[nodiscard]] static RecordIdentity keyed(std::string shape, std::string primary_key) {
        RecordIdentity id;
        id.shape = std::move(shape);
        id.primary_key = std::move(primary_key);
        return id;
    }

    [[nodiscard]] static RecordIdentity by_address(std::string shape, const void* object) {
        RecordIdentity id;
        id.shape = std::move(shape);
        id.object_address = reinterpret_cast<uintptr_t>(object);
        return id;
    }

    /// "shape#pk" or "shape@<address>"
    [[nodiscard]] std::string key() const {
        if (primary_key) return shape + "#" + *primary_key;
        return shape + "@" + std::to_string(object_address);
    }

    bool operator==(const RecordIdentity&) const = default;
};

// ============================================================================
// Query events
// ============================================================================

enum class QueryRole {
    PRIMARY,
    DEPENDENT
};

inline const char* query_role_to_string(QueryRole role) {
    switch (role) {
        case QueryRole::PRIMARY:   return "primary";
        case QueryRole::DEPENDENT: return "dependent";
        default:                   return "unknown";
    }
}

/**
 * @brief What the ORM integration knows about a finished round-trip
 */
struct ResultShape {
    std::string shape;                                  // table/model name
    std::optional<std::vector<std::string>> columns;    // declared output columns, nullopt = unknown
    std::vector<RecordIdentity> records;                // records materialized from the result

    ResultShape() = default;
    ResultShape(std::string s, std::vector<std::string> cols)
        : shape(std::move(s)), columns(std::move(cols)) {}
};

/**
 * @brief One database round-trip
 */
struct QueryEvent {
    uint64_t sequence;                                  // 1-based, issue order within the unit
    std::string statement;
    std::vector<std::string> parameters;                // only kept when configured
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::microseconds> duration;  // nullopt when timing failed
    Origin origin;

    // Filled from ResultShape on completion
    std::string shape;
    std::optional<std::vector<std::string>> columns;
    size_t record_count;
    bool completed;

    // Grouping
    GroupId group_id;
    QueryRole role;
    std::string relationship;                           // "books.reviews" for nested dependents
    uint32_t relationship_depth;

    QueryEvent()
        : sequence(0),
          started_at(std::chrono::system_clock::now()),
          record_count(0),
          completed(false),
          group_id(0),
          role(QueryRole::PRIMARY),
          relationship_depth(0) {}
};

} // namespace ormcost
