#include "capture/query_capture.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormcost {

QueryCapture::QueryCapture(CaptureConfig config, std::shared_ptr<IClock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

std::optional<std::chrono::steady_clock::time_point> QueryCapture::read_clock() {
    if (!clock_) return std::nullopt;
    try {
        return clock_->now();
    } catch (const std::exception& e) {
        utils::log::warn(std::format(
            "Query capture: clock unavailable, recording without timing: {}", e.what()));
        return std::nullopt;
    }
}

QueryToken QueryCapture::on_query_start(std::string_view statement,
                                        const std::vector<std::string>& params) {
    if (events_.size() >= config_.max_events_per_unit) {
        if (dropped_++ == 0) {
            utils::log::warn(std::format(
                "Query capture: event limit {} reached, further queries are counted only",
                config_.max_events_per_unit));
        }
        return {};
    }

    QueryEvent event;
    event.sequence = events_.size() + 1;
    event.started_at = utils::now();

    if (config_.max_statement_length > 0 && statement.size() > config_.max_statement_length) {
        event.statement = std::string(statement.substr(0, config_.max_statement_length));
    } else {
        event.statement = std::string(statement);
    }
    if (config_.record_parameters) {
        event.parameters = params;
    }

    events_.push_back(std::move(event));
    start_ticks_.emplace_back();
    return QueryToken{events_.back().sequence};
}

void QueryCapture::start_timing(QueryToken token) {
    const QueryEvent* event = find(token);
    if (!event || event->completed) return;

    auto& start = start_ticks_[token.sequence - 1];
    if (!start) start = read_clock();
}

QueryEvent* QueryCapture::on_query_end(QueryToken token, const ResultShape& result) {
    QueryEvent* event = find(token);
    if (!event) {
        utils::log::warn(std::format(
            "Query capture: end for unknown query token {}", token.sequence));
        return nullptr;
    }
    if (event->completed) {
        utils::log::warn(std::format(
            "Query capture: query {} already ended", token.sequence));
        return nullptr;
    }

    const auto& start = start_ticks_[token.sequence - 1];
    if (start) {
        if (const auto end = read_clock()) {
            event->duration = std::chrono::duration_cast<std::chrono::microseconds>(*end - *start);
        }
    }

    event->shape = result.shape;
    event->columns = result.columns;
    event->record_count = result.records.size();
    event->completed = true;
    return event;
}

QueryEvent* QueryCapture::find(QueryToken token) {
    if (!token.valid() || token.sequence > events_.size()) return nullptr;
    return &events_[token.sequence - 1];
}

const QueryEvent* QueryCapture::find(QueryToken token) const {
    if (!token.valid() || token.sequence > events_.size()) return nullptr;
    return &events_[token.sequence - 1];
}

} // namespace ormcost
