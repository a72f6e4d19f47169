#include <catch2/catch_test_macros.hpp>
#include "capture/query_capture.hpp"
#include "mocks/mock_clock.hpp"

using namespace ormcost;
using namespace std::chrono_literals;

static ResultShape users_shape() {
    ResultShape shape("users", {"id", "name", "email"});
    shape.records = {RecordIdentity::keyed("users", "1"), RecordIdentity::keyed("users", "2")};
    return shape;
}

// ============================================================================
// Timing
// ============================================================================

TEST_CASE("QueryCapture: measures duration with the monotonic clock", "[capture]") {
    auto clock = std::make_shared<testing::MockClock>();
    QueryCapture capture(CaptureConfig{}, clock);

    const auto token = capture.on_query_start("SELECT id, name, email FROM users");
    REQUIRE(token.valid());
    capture.start_timing(token);
    clock->advance(1500us);

    const auto* event = capture.on_query_end(token, users_shape());
    REQUIRE(event != nullptr);
    CHECK(event->completed);
    REQUIRE(event->duration.has_value());
    CHECK(*event->duration == 1500us);
    CHECK(event->statement == "SELECT id, name, email FROM users");
    CHECK(event->shape == "users");
    CHECK(event->record_count == 2);
    REQUIRE(event->columns.has_value());
    CHECK(event->columns->size() == 3);
}

TEST_CASE("QueryCapture: unavailable clock records the query without timing", "[capture]") {
    auto clock = std::make_shared<testing::MockClock>();
    clock->set_unavailable(true);
    QueryCapture capture(CaptureConfig{}, clock);

    const auto token = capture.on_query_start("SELECT 1");
    REQUIRE(token.valid());
    capture.start_timing(token);
    const auto* event = capture.on_query_end(token, ResultShape{});
    REQUIRE(event != nullptr);
    CHECK(event->completed);
    CHECK_FALSE(event->duration.has_value());
}

TEST_CASE("QueryCapture: clock failing only at end still keeps the event", "[capture]") {
    auto clock = std::make_shared<testing::MockClock>();
    QueryCapture capture(CaptureConfig{}, clock);

    const auto token = capture.on_query_start("SELECT 1");
    capture.start_timing(token);
    clock->set_unavailable(true);
    const auto* event = capture.on_query_end(token, ResultShape{});
    REQUIRE(event != nullptr);
    CHECK_FALSE(event->duration.has_value());
    CHECK(capture.events().size() == 1);
}

TEST_CASE("QueryCapture: recording does not start the clock", "[capture]") {
    auto clock = std::make_shared<testing::MockClock>();
    QueryCapture capture(CaptureConfig{}, clock);

    const auto token = capture.on_query_start("SELECT 1");
    // Work done between recording and the round-trip is not timed
    clock->advance(5ms);
    capture.start_timing(token);
    clock->advance(200us);
    capture.start_timing(token);
    clock->advance(100us);

    const auto* event = capture.on_query_end(token, ResultShape{});
    REQUIRE(event != nullptr);
    REQUIRE(event->duration.has_value());
    CHECK(*event->duration == 300us);
}

TEST_CASE("QueryCapture: query never started on the clock has no duration", "[capture]") {
    auto clock = std::make_shared<testing::MockClock>();
    QueryCapture capture(CaptureConfig{}, clock);

    const auto token = capture.on_query_start("SELECT 1");
    clock->advance(100us);
    const auto* event = capture.on_query_end(token, ResultShape{});
    REQUIRE(event != nullptr);
    CHECK(event->completed);
    CHECK_FALSE(event->duration.has_value());
}

// ============================================================================
// Sequencing and tokens
// ============================================================================

TEST_CASE("QueryCapture: events keep issue order", "[capture]") {
    QueryCapture capture(CaptureConfig{}, std::make_shared<SteadyClock>());

    const auto t1 = capture.on_query_start("SELECT 1");
    const auto t2 = capture.on_query_start("SELECT 2");
    // Ends may arrive out of order
    capture.on_query_end(t2, ResultShape{});
    capture.on_query_end(t1, ResultShape{});

    REQUIRE(capture.events().size() == 2);
    CHECK(capture.events()[0].sequence == 1);
    CHECK(capture.events()[0].statement == "SELECT 1");
    CHECK(capture.events()[1].sequence == 2);
}

TEST_CASE("QueryCapture: unknown and repeated tokens are rejected", "[capture]") {
    QueryCapture capture(CaptureConfig{}, std::make_shared<SteadyClock>());

    CHECK(capture.on_query_end(QueryToken{}, ResultShape{}) == nullptr);
    CHECK(capture.on_query_end(QueryToken{42}, ResultShape{}) == nullptr);

    const auto token = capture.on_query_start("SELECT 1");
    CHECK(capture.on_query_end(token, ResultShape{}) != nullptr);
    CHECK(capture.on_query_end(token, ResultShape{}) == nullptr);
}

TEST_CASE("QueryCapture: unknown column set stays unknown", "[capture]") {
    QueryCapture capture(CaptureConfig{}, std::make_shared<SteadyClock>());

    const auto token = capture.on_query_start("SELECT * FROM audit_log");
    ResultShape shape;
    shape.shape = "audit_log";
    const auto* event = capture.on_query_end(token, shape);
    REQUIRE(event != nullptr);
    CHECK_FALSE(event->columns.has_value());
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE("QueryCapture: parameters kept only when configured", "[capture][config]") {
    const std::vector<std::string> params = {"42", "alice"};

    QueryCapture plain(CaptureConfig{}, std::make_shared<SteadyClock>());
    const auto t1 = plain.on_query_start("SELECT * FROM users WHERE id = ?", params);
    CHECK(plain.find(t1)->parameters.empty());

    CaptureConfig cfg;
    cfg.record_parameters = true;
    QueryCapture with_params(cfg, std::make_shared<SteadyClock>());
    const auto t2 = with_params.on_query_start("SELECT * FROM users WHERE id = ?", params);
    CHECK(with_params.find(t2)->parameters == params);
}

TEST_CASE("QueryCapture: long statements truncated in the recorded copy", "[capture][config]") {
    CaptureConfig cfg;
    cfg.max_statement_length = 8;
    QueryCapture capture(cfg, std::make_shared<SteadyClock>());

    const auto token = capture.on_query_start("SELECT id FROM users");
    CHECK(capture.find(token)->statement == "SELECT i");
}

TEST_CASE("QueryCapture: events over the per-unit limit are counted, not kept", "[capture][config]") {
    CaptureConfig cfg;
    cfg.max_events_per_unit = 3;
    QueryCapture capture(cfg, std::make_shared<SteadyClock>());

    for (int i = 0; i < 5; ++i) {
        const auto token = capture.on_query_start("SELECT " + std::to_string(i));
        if (i < 3) {
            CHECK(token.valid());
        } else {
            CHECK_FALSE(token.valid());
        }
    }
    CHECK(capture.events().size() == 3);
    CHECK(capture.dropped_events() == 2);
}
