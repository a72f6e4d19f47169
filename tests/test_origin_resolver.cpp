#include <catch2/catch_test_macros.hpp>
#include "correlator/internal_path_filter.hpp"
#include "correlator/origin_resolver.hpp"
#include "mocks/mock_frame_source.hpp"

#include <thread>

using namespace ormcost;

static std::shared_ptr<const InternalPathFilter> orm_filter() {
    return std::make_shared<const InternalPathFilter>(
        std::vector<std::string>{"orm/", "ormcost/"});
}

// ============================================================================
// InternalPathFilter
// ============================================================================

TEST_CASE("InternalPathFilter: matches prefixes at start and after a separator", "[correlator]") {
    InternalPathFilter filter({"orm/", "vendor/db"});

    CHECK(filter.is_internal("orm/queryset.cpp"));
    CHECK(filter.is_internal("/home/build/app/orm/queryset.cpp"));
    CHECK(filter.is_internal("src/vendor/db/driver.cpp"));
    CHECK(filter.is_internal("C:\\work\\orm\\queryset.cpp"));

    CHECK_FALSE(filter.is_internal("app/views/orders.cpp"));
    CHECK_FALSE(filter.is_internal("app/storm/handler.cpp"));
}

TEST_CASE("InternalPathFilter: empty prefixes are ignored", "[correlator]") {
    InternalPathFilter filter({"", "orm/"});
    CHECK(filter.prefixes().size() == 1);
    CHECK_FALSE(filter.is_internal("app/views/orders.cpp"));
}

TEST_CASE("InternalPathFilter: no prefixes means nothing is internal", "[correlator]") {
    InternalPathFilter filter;
    CHECK_FALSE(filter.is_internal("orm/queryset.cpp"));
}

// ============================================================================
// OriginResolver
// ============================================================================

TEST_CASE("OriginResolver: skips internal frames and picks the nearest app frame", "[correlator]") {
    auto frames = std::make_shared<testing::MockFrameSource>(std::vector<CallFrame>{
        {"ormcost/engine.cpp", 120, "on_query_start"},
        {"orm/queryset.cpp", 88, "QuerySet::fetch"},
        {"app/views/orders.cpp", 42, "OrderView::render"},
        {"app/main.cpp", 10, "main"},
    });
    OriginResolver resolver(orm_filter(), frames);

    const auto origin = resolver.resolve_origin();
    CHECK(origin.attributed);
    CHECK(origin.file == "app/views/orders.cpp");
    CHECK(origin.line == 42);
    CHECK(origin.function == "OrderView::render");
    CHECK(origin.to_string() == "app/views/orders.cpp:42");
    CHECK(frames->capture_count() == 1);
}

TEST_CASE("OriginResolver: all-internal stack is unattributed", "[correlator]") {
    auto frames = std::make_shared<testing::MockFrameSource>(std::vector<CallFrame>{
        {"orm/queryset.cpp", 88, "QuerySet::fetch"},
        {"orm/signals.cpp", 12, "post_init"},
    });
    OriginResolver resolver(orm_filter(), frames);

    const auto origin = resolver.resolve_origin();
    CHECK_FALSE(origin.attributed);
    CHECK(origin == Origin::unattributed());
    CHECK(origin.to_string() == "<unattributed>");
}

TEST_CASE("OriginResolver: unreadable stack is unattributed, not an error", "[correlator]") {
    auto frames = std::make_shared<testing::MockFrameSource>();
    frames->set_should_fail(true);
    OriginResolver resolver(orm_filter(), frames);

    Origin origin;
    REQUIRE_NOTHROW(origin = resolver.resolve_origin());
    CHECK_FALSE(origin.attributed);
}

TEST_CASE("OriginResolver: frames without a file are skipped", "[correlator]") {
    OriginResolver resolver(orm_filter(), std::make_shared<testing::MockFrameSource>());

    const auto origin = resolver.select({{"", 0, "??"}, {"app/jobs/nightly.cpp", 7}});
    CHECK(origin.file == "app/jobs/nightly.cpp");
    CHECK(origin.line == 7);
}

// ============================================================================
// Shadow stack
// ============================================================================

namespace {

Origin resolve_from_orm_layer(const OriginResolver& resolver) {
    ScopedFrame frame(CallFrame{"orm/queryset.cpp", 88, "QuerySet::fetch"});
    return resolver.resolve_origin();
}

} // anonymous namespace

TEST_CASE("ShadowStackFrameSource: ScopedFrame marks are innermost first", "[correlator]") {
    ShadowStackFrameSource source;
    const auto base = ShadowStackFrameSource::depth();
    {
        ScopedFrame outer(CallFrame{"app/views/orders.cpp", 40, "render"});
        ScopedFrame inner(CallFrame{"orm/queryset.cpp", 88, "fetch"});
        CHECK(ShadowStackFrameSource::depth() == base + 2);

        const auto frames = source.capture();
        REQUIRE(frames.size() == base + 2);
        CHECK(frames[0].file == "orm/queryset.cpp");
        CHECK(frames[1].file == "app/views/orders.cpp");
    }
    CHECK(ShadowStackFrameSource::depth() == base);
}

TEST_CASE("ShadowStackFrameSource: ORMCOST_FRAME records the calling line", "[correlator]") {
    OriginResolver resolver(orm_filter(), std::make_shared<ShadowStackFrameSource>());

    ORMCOST_FRAME(); const uint32_t marked_line = __LINE__;
    const auto origin = resolve_from_orm_layer(resolver);

    CHECK(origin.attributed);
    CHECK(origin.line == marked_line);
    CHECK(origin.file.find("test_origin_resolver.cpp") != std::string::npos);
}

TEST_CASE("ShadowStackFrameSource: stacks are per thread", "[correlator]") {
    ScopedFrame mark(CallFrame{"app/main.cpp", 1, "main"});
    const auto here = ShadowStackFrameSource::depth();

    size_t other = 99;
    std::thread worker([&other]() { other = ShadowStackFrameSource::depth(); });
    worker.join();

    CHECK(here >= 1);
    CHECK(other == 0);
}
