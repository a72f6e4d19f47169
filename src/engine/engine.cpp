#include "engine/engine.hpp"
#include "engine/unit_of_work.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "report/report_aggregator.hpp"

#include <format>
#include <utility>

namespace ormcost {

// ============================================================================
// UnitOfWorkGuard
// ============================================================================

UnitOfWorkGuard::UnitOfWorkGuard(std::shared_ptr<UnitOfWorkRegistry> registry,
                                 ContextId context,
                                 std::weak_ptr<UnitOfWork> unit)
    : registry_(std::move(registry)),
      context_(std::move(context)),
      unit_(std::move(unit)) {}

UnitOfWorkGuard UnitOfWorkGuard::rejected(std::weak_ptr<UnitOfWork> active, uint64_t ticket) {
    UnitOfWorkGuard guard;
    guard.unit_ = std::move(active);
    guard.rejected_ticket_ = ticket;
    return guard;
}

UnitOfWorkGuard::~UnitOfWorkGuard() {
    try {
        release();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Unit of work guard ({}): release failed: {}",
                                      context_, e.what()));
    }
}

UnitOfWorkGuard::UnitOfWorkGuard(UnitOfWorkGuard&& other) noexcept
    : registry_(std::move(other.registry_)),
      context_(std::move(other.context_)),
      unit_(std::move(other.unit_)),
      rejected_ticket_(std::exchange(other.rejected_ticket_, 0)) {}

UnitOfWorkGuard& UnitOfWorkGuard::operator=(UnitOfWorkGuard&& other) noexcept {
    if (this != &other) {
        try {
            release();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Unit of work guard ({}): release failed: {}",
                                          context_, e.what()));
        }
        registry_ = std::move(other.registry_);
        context_ = std::move(other.context_);
        unit_ = std::move(other.unit_);
        rejected_ticket_ = std::exchange(other.rejected_ticket_, 0);
    }
    return *this;
}

void UnitOfWorkGuard::release() {
    if (rejected_ticket_ != 0) {
        // Nested scope left without its end (it threw): the outer end must not pair with it
        if (const auto active = unit_.lock()) {
            active->cancel_rejected_begin(rejected_ticket_);
        }
        rejected_ticket_ = 0;
        unit_.reset();
        return;
    }
    if (!registry_) return;

    if (const auto unit = unit_.lock()) {
        if (const auto detached = registry_->release(context_, unit.get())) {
            detached->close();
            utils::log::warn(std::format(
                "Unit of work {} ({}) ended without end_unit_of_work; released after {} queries",
                detached->id(), context_, detached->capture().events().size()));
        }
    }
    registry_.reset();
    unit_.reset();
}

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(EngineConfig config,
               std::shared_ptr<const IFrameSource> frames,
               std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      registry_(std::make_shared<UnitOfWorkRegistry>()) {
    auto errors = ConfigLoader::validate_config(config_);
    if (!frames) errors.emplace_back("frame source hook is required");
    if (!clock_) errors.emplace_back("clock hook is required");

    if (!errors.empty()) {
        std::string combined = "Engine configuration invalid:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        utils::log::error(combined);
        throw ConfigurationError(combined);
    }

    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    }

    auto filter = std::make_shared<const InternalPathFilter>(config_.correlator.internal_prefixes);
    resolver_ = std::make_shared<const OriginResolver>(std::move(filter), std::move(frames));

    utils::log::info(std::format("Engine ready: {} internal prefix(es), event limit {}",
        config_.correlator.internal_prefixes.size(), config_.capture.max_events_per_unit));
}

UnitOfWorkGuard Engine::begin_unit_of_work(const ContextId& context) {
    try {
        auto unit = std::make_shared<UnitOfWork>(context, config_, clock_, resolver_);
        if (!registry_->insert(context, unit)) {
            if (const auto active = registry_->find(context)) {
                const uint64_t ticket = active->note_rejected_begin();
                active->add_warning(ErrorCategory::SCOPE_VIOLATION,
                    "begin_unit_of_work on a context that already has an active unit of work; "
                    "nested unit not started");
                return UnitOfWorkGuard::rejected(active, ticket);
            }
            return {};
        }
        utils::log::debug(std::format("Unit of work {} started ({})", unit->id(), context));
        return UnitOfWorkGuard(registry_, context, unit);
    } catch (const std::exception& e) {
        utils::log::error(std::format("begin_unit_of_work ({}) failed: {}", context, e.what()));
        return {};
    }
}

Report Engine::end_unit_of_work(const ContextId& context) {
    try {
        const auto unit = registry_->find(context);
        if (!unit) {
            utils::log::warn(std::format(
                "end_unit_of_work ({}) without matching begin_unit_of_work", context));
            return ReportAggregator::orphaned(
                context, "end_unit_of_work without matching begin_unit_of_work");
        }
        if (unit->consume_rejected_end()) {
            return ReportAggregator::orphaned(
                context, "end of a rejected nested unit of work; outer unit remains active");
        }

        registry_->release(context, unit.get());
        unit->close();
        auto report = ReportAggregator::finalize(*unit);
        utils::log::debug(std::format("Unit of work {} ended ({}): {} queries in {} groups",
            report.unit_of_work_id, context, report.total_queries, report.groups.size()));
        return report;
    } catch (const std::exception& e) {
        utils::log::error(std::format("end_unit_of_work ({}) failed: {}", context, e.what()));
        return ReportAggregator::orphaned(
            context, std::format("report could not be produced: {}", e.what()),
            ErrorCategory::INTERNAL_ERROR);
    }
}

QueryToken Engine::on_query_start(const ContextId& context,
                                  std::string_view statement,
                                  const std::vector<std::string>& params) {
    try {
        const auto unit = registry_->find(context);
        if (!unit) return {};
        return unit->on_query_start(statement, params);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("on_query_start ({}) failed: {}", context, e.what()));
        return {};
    }
}

std::optional<QueryEvent> Engine::on_query_end(const ContextId& context,
                                               QueryToken token,
                                               const ResultShape& result) {
    if (!token.valid()) return std::nullopt;
    try {
        const auto unit = registry_->find(context);
        if (!unit) return std::nullopt;
        return unit->on_query_end(token, result);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("on_query_end ({}) failed: {}", context, e.what()));
        return std::nullopt;
    }
}

bool Engine::begin_relationship(const ContextId& context, std::string name,
                                std::optional<GroupId> source) {
    try {
        const auto unit = registry_->find(context);
        if (!unit) return false;
        return unit->begin_relationship(std::move(name), source).is_ok();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("begin_relationship ({}) failed: {}", context, e.what()));
        return false;
    }
}

void Engine::end_relationship(const ContextId& context) {
    try {
        if (const auto unit = registry_->find(context)) {
            unit->end_relationship();
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("end_relationship ({}) failed: {}", context, e.what()));
    }
}

void Engine::on_field_read(const ContextId& context, const RecordIdentity& identity,
                           std::string_view field) {
    try {
        // Reads after the unit of work ended find nothing and are dropped
        if (const auto unit = registry_->find(context)) {
            unit->on_field_read(identity, field);
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("on_field_read ({}) failed: {}", context, e.what()));
    }
}

Origin Engine::resolve_origin() const {
    return resolver_->resolve_origin();
}

bool Engine::is_active(const ContextId& context) const {
    return registry_->find(context) != nullptr;
}

size_t Engine::active_units() const {
    return registry_->size();
}

// ============================================================================
// RelationshipScope / ScopedQuery
// ============================================================================

RelationshipScope::RelationshipScope(Engine& engine, ContextId context, std::string name,
                                     std::optional<GroupId> source)
    : engine_(engine), context_(std::move(context)) {
    bound_ = engine_.begin_relationship(context_, std::move(name), source);
}

RelationshipScope::~RelationshipScope() {
    engine_.end_relationship(context_);
}

ScopedQuery::ScopedQuery(Engine& engine, ContextId context, std::string_view statement,
                         const std::vector<std::string>& params)
    : engine_(engine), context_(std::move(context)) {
    token_ = engine_.on_query_start(context_, statement, params);
}

ScopedQuery::~ScopedQuery() {
    if (!finished_) {
        engine_.on_query_end(context_, token_);
    }
}

std::optional<QueryEvent> ScopedQuery::finish(const ResultShape& result) {
    if (finished_) return std::nullopt;
    finished_ = true;
    return engine_.on_query_end(context_, token_, result);
}

} // namespace ormcost
