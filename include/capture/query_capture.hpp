#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ormcost {

/**
 * @brief Monotonic clock used to time round-trips
 *
 * Implementations may throw when the clock is unavailable; capture then
 * records the event without timing.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::steady_clock::time_point now() = 0;
};

class SteadyClock : public IClock {
public:
    [[nodiscard]] std::chrono::steady_clock::time_point now() override {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Records every round-trip of one unit of work
 *
 * Pure observer: never touches the statement that is executed, only keeps
 * a copy. Not thread-safe; a unit of work is driven by one context.
 */
class QueryCapture {
public:
    QueryCapture(CaptureConfig config, std::shared_ptr<IClock> clock);

    /**
     * @brief Record a round-trip that is about to be issued
     *
     * Does not read the clock: call start_timing() once the caller's own
     * bookkeeping for the query is done, right before the round-trip.
     *
     * @return Valid token, or an invalid one when the per-unit limit is hit
     */
    [[nodiscard]] QueryToken on_query_start(std::string_view statement,
                                            const std::vector<std::string>& params = {});

    /// Take the start tick of a recorded query; ignored once a tick is held
    void start_timing(QueryToken token);

    /**
     * @brief Finish a round-trip started with on_query_start
     * @return Pointer to the completed event; nullptr for unknown or
     *         already-finished tokens
     */
    QueryEvent* on_query_end(QueryToken token, const ResultShape& result);

    [[nodiscard]] QueryEvent* find(QueryToken token);
    [[nodiscard]] const QueryEvent* find(QueryToken token) const;

    /// All recorded events in issue order
    [[nodiscard]] const std::vector<QueryEvent>& events() const { return events_; }

    [[nodiscard]] size_t dropped_events() const { return dropped_; }

private:
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> read_clock();

    CaptureConfig config_;
    std::shared_ptr<IClock> clock_;
    std::vector<QueryEvent> events_;
    std::vector<std::optional<std::chrono::steady_clock::time_point>> start_ticks_;
    size_t dropped_ = 0;
};

} // namespace ormcost
