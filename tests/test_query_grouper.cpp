#include <catch2/catch_test_macros.hpp>
#include "grouping/query_grouper.hpp"

#include <deque>

using namespace ormcost;

namespace {

// deque keeps references to earlier events valid
struct EventLog {
    std::deque<QueryEvent> events;

    QueryEvent& issue(QueryGrouper& grouper, const std::string& file, uint32_t line) {
        QueryEvent event;
        event.sequence = events.size() + 1;
        event.origin = Origin::at(file, line);
        events.push_back(std::move(event));
        grouper.assign_group(events.back());
        return events.back();
    }
};

} // anonymous namespace

// ============================================================================
// Primary / dependent classification
// ============================================================================

TEST_CASE("QueryGrouper: query outside any relationship starts a group", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    const auto& event = log.issue(grouper, "app/views/authors.cpp", 12);

    REQUIRE(grouper.groups().size() == 1);
    const auto& group = grouper.groups()[0];
    CHECK(group.id == 1);
    CHECK(group.primary == 1);
    CHECK(group.dependents.empty());
    CHECK_FALSE(group.closed);
    CHECK(group.label() == "app/views/authors.cpp:12#1");
    CHECK(event.group_id == 1);
    CHECK(event.role == QueryRole::PRIMARY);
}

TEST_CASE("QueryGrouper: prefetch inside a relationship is a dependent", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    log.issue(grouper, "app/views/authors.cpp", 12);
    auto bound = grouper.begin_relationship("books");
    REQUIRE(bound.is_ok());
    CHECK(bound.value() == 1);

    const auto& dep = log.issue(grouper, "app/views/authors.cpp", 12);
    CHECK(grouper.end_relationship());

    CHECK(grouper.groups().size() == 1);
    CHECK(grouper.groups()[0].dependents == std::vector<uint64_t>{2});
    CHECK(dep.role == QueryRole::DEPENDENT);
    CHECK(dep.group_id == 1);
    CHECK(dep.relationship == "books");
    CHECK(dep.relationship_depth == 1);
}

TEST_CASE("QueryGrouper: nested relationships stay in the enclosing group", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    log.issue(grouper, "app/views/authors.cpp", 12);
    REQUIRE(grouper.begin_relationship("books").is_ok());
    log.issue(grouper, "app/views/authors.cpp", 12);
    REQUIRE(grouper.begin_relationship("reviews").is_ok());
    const auto& nested = log.issue(grouper, "app/views/authors.cpp", 12);
    CHECK(grouper.open_scopes() == 2);
    grouper.end_relationship();
    grouper.end_relationship();

    REQUIRE(grouper.groups().size() == 1);
    CHECK(grouper.groups()[0].dependents.size() == 2);
    CHECK(nested.group_id == 1);
    CHECK(nested.relationship == "books.reviews");
    CHECK(nested.relationship_depth == 2);
}

TEST_CASE("QueryGrouper: relationship with no open group is a scope violation", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    auto bound = grouper.begin_relationship("books");
    CHECK(bound.is_error());
    CHECK(bound.error_category() == ErrorCategory::SCOPE_VIOLATION);
    CHECK(grouper.open_scopes() == 1);

    // Queries inside an unbound scope fall back to primaries
    const auto& event = log.issue(grouper, "app/views/books.cpp", 5);
    CHECK(event.role == QueryRole::PRIMARY);
    CHECK(grouper.groups().size() == 1);
}

TEST_CASE("QueryGrouper: explicit source group must still be open", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    log.issue(grouper, "app/views/a.cpp", 1);
    log.issue(grouper, "app/views/b.cpp", 2);

    // Group 1 closed when group 2 started
    auto stale = grouper.begin_relationship("books", GroupId{1});
    CHECK(stale.is_error());
    grouper.end_relationship();

    auto fresh = grouper.begin_relationship("books", GroupId{2});
    REQUIRE(fresh.is_ok());
    CHECK(fresh.value() == 2);
    grouper.end_relationship();
}

TEST_CASE("QueryGrouper: end without begin reports false", "[grouping]") {
    QueryGrouper grouper;
    CHECK_FALSE(grouper.end_relationship());
}

// ============================================================================
// Group identity and closure
// ============================================================================

TEST_CASE("QueryGrouper: same origin in a loop yields one group per iteration", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    for (int i = 0; i < 3; ++i) {
        log.issue(grouper, "app/views/orders.cpp", 30);
    }

    REQUIRE(grouper.groups().size() == 3);
    CHECK(grouper.groups()[0].origin == grouper.groups()[2].origin);
    CHECK(grouper.groups()[0].label() == "app/views/orders.cpp:30#1");
    CHECK(grouper.groups()[2].label() == "app/views/orders.cpp:30#3");
    CHECK(grouper.groups()[0].closed);
    CHECK(grouper.groups()[1].closed);
    CHECK_FALSE(grouper.groups()[2].closed);
}

TEST_CASE("QueryGrouper: close_all closes groups and drops open scopes", "[grouping]") {
    QueryGrouper grouper;
    EventLog log;

    log.issue(grouper, "app/views/a.cpp", 1);
    REQUIRE(grouper.begin_relationship("books").is_ok());
    grouper.close_all();

    CHECK(grouper.groups()[0].closed);
    CHECK(grouper.open_scopes() == 0);
    CHECK(grouper.find(1) != nullptr);
    CHECK(grouper.find(2) == nullptr);
    CHECK(grouper.find(0) == nullptr);
}

TEST_CASE("QueryGrouper: unattributed primaries still group", "[grouping]") {
    QueryGrouper grouper;
    QueryEvent event;
    event.sequence = 1;

    const auto& group = grouper.assign_group(event);
    CHECK(group.label() == "<unattributed>#1");
    CHECK_FALSE(group.origin.attributed);
}
