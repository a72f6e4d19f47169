#include "engine/unit_of_work.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormcost {

UnitOfWork::UnitOfWork(ContextId context,
                       const EngineConfig& config,
                       std::shared_ptr<IClock> clock,
                       std::shared_ptr<const OriginResolver> resolver)
    : id_(utils::generate_uuid()),
      context_(std::move(context)),
      started_at_(utils::now()),
      ended_at_(started_at_),
      started_steady_(std::chrono::steady_clock::now()),
      ended_steady_(started_steady_),
      resolver_(std::move(resolver)),
      capture_(config.capture, std::move(clock)),
      tracker_(config.tracker) {}

QueryToken UnitOfWork::on_query_start(std::string_view statement,
                                      const std::vector<std::string>& params) {
    if (closed_) return {};

    const QueryToken token = capture_.on_query_start(statement, params);
    QueryEvent* event = capture_.find(token);
    if (!event) return token;

    // Forcing point: the stack still shows who triggered the query
    event->origin = resolver_ ? resolver_->resolve_origin() : Origin::unattributed();
    const auto& group = grouper_.assign_group(*event);
    utils::log::debug(std::format("Unit of work {}: query {} is {} of group {}",
        id_, event->sequence, query_role_to_string(event->role), group.label()));

    // Clock last, so the stack walk and grouping stay out of the duration
    capture_.start_timing(token);
    return token;
}

std::optional<QueryEvent> UnitOfWork::on_query_end(QueryToken token, const ResultShape& result) {
    if (closed_ || !token.valid()) return std::nullopt;

    const QueryEvent* event = capture_.on_query_end(token, result);
    if (!event) return std::nullopt;

    for (const auto& identity : result.records) {
        tracker_.on_record_materialized(event->group_id, identity);
    }
    return *event;
}

Result<GroupId> UnitOfWork::begin_relationship(std::string name, std::optional<GroupId> source) {
    auto bound = grouper_.begin_relationship(std::move(name), source);
    if (bound.is_error()) {
        add_warning(bound.error_category(), bound.error_message());
    }
    return bound;
}

void UnitOfWork::end_relationship() {
    if (!grouper_.end_relationship()) {
        add_warning(ErrorCategory::SCOPE_VIOLATION,
                    "end_relationship called with no open relationship");
    }
}

bool UnitOfWork::on_field_read(const RecordIdentity& identity, std::string_view field) {
    if (closed_) return false;
    return tracker_.on_field_read(identity, field);
}

void UnitOfWork::add_warning(ErrorCategory category, std::string message) {
    utils::log::warn(std::format("Unit of work {} ({}): {}: {}",
        id_, context_, error_category_to_string(category), message));
    warnings_.push_back(ScopeWarning{category, std::move(message)});
}

uint64_t UnitOfWork::note_rejected_begin() {
    const uint64_t ticket = next_rejected_ticket_++;
    rejected_begins_.push_back(ticket);
    return ticket;
}

bool UnitOfWork::consume_rejected_end() {
    if (rejected_begins_.empty()) return false;
    rejected_begins_.pop_back();
    return true;
}

void UnitOfWork::cancel_rejected_begin(uint64_t ticket) {
    std::erase(rejected_begins_, ticket);
}

void UnitOfWork::close() {
    if (closed_) return;
    grouper_.close_all();
    ended_at_ = utils::now();
    ended_steady_ = std::chrono::steady_clock::now();
    closed_ = true;
}

std::chrono::microseconds UnitOfWork::execution_time() const {
    const auto end = closed_ ? ended_steady_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - started_steady_);
}

} // namespace ormcost
