#pragma once

#include "capture/query_capture.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "correlator/frame_source.hpp"
#include "correlator/internal_path_filter.hpp"
#include "correlator/origin_resolver.hpp"
#include "engine/unit_of_work_registry.hpp"
#include "report/report.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ormcost {

class UnitOfWork;

/**
 * @brief Releases a unit of work whose end hook never ran
 *
 * Returned by Engine::begin_unit_of_work. If the guard is destroyed while
 * its unit is still registered (the host failed before end_unit_of_work),
 * the registry entry is released and the unit is discarded with a warning.
 * A guard from a rejected nested begin owns nothing; if it is destroyed
 * before the nested end, the outer unit stops waiting for that end.
 */
class UnitOfWorkGuard {
public:
    UnitOfWorkGuard() = default;
    UnitOfWorkGuard(std::shared_ptr<UnitOfWorkRegistry> registry,
                    ContextId context,
                    std::weak_ptr<UnitOfWork> unit);
    ~UnitOfWorkGuard();

    /// Guard for a nested begin rejected by the `active` unit
    static UnitOfWorkGuard rejected(std::weak_ptr<UnitOfWork> active, uint64_t ticket);

    UnitOfWorkGuard(UnitOfWorkGuard&& other) noexcept;
    UnitOfWorkGuard& operator=(UnitOfWorkGuard&& other) noexcept;

    UnitOfWorkGuard(const UnitOfWorkGuard&) = delete;
    UnitOfWorkGuard& operator=(const UnitOfWorkGuard&) = delete;

    /// True for the guard of a unit that was actually started
    [[nodiscard]] bool owns() const { return registry_ != nullptr; }

    [[nodiscard]] const ContextId& context() const { return context_; }

    /// Abandon now if still registered; idempotent
    void release();

private:
    std::shared_ptr<UnitOfWorkRegistry> registry_;
    ContextId context_;
    std::weak_ptr<UnitOfWork> unit_;
    uint64_t rejected_ticket_ = 0;
};

/**
 * @brief Collaborator-facing entry points of the instrumentation engine
 *
 * Every hook takes the caller's execution-context id. Hooks never throw
 * and never change the observed operation: failures are logged and the
 * affected data is recorded degraded. Only the constructor throws
 * (ConfigurationError).
 */
class Engine {
public:
    explicit Engine(EngineConfig config = {},
                    std::shared_ptr<const IFrameSource> frames =
                        std::make_shared<ShadowStackFrameSource>(),
                    std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>());

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ---- Unit of work lifecycle --------------------------------------------

    /**
     * @brief Start instrumenting the operation bound to `context`
     *
     * A second begin for an already active context is a scope violation:
     * it is recorded as a warning on the active unit and the returned guard
     * owns nothing.
     */
    [[nodiscard]] UnitOfWorkGuard begin_unit_of_work(const ContextId& context);

    /**
     * @brief Finalize and detach the context's unit of work
     *
     * Without a matching begin, returns an orphaned report carrying the
     * warning instead of raising.
     */
    Report end_unit_of_work(const ContextId& context);

    // ---- Query-execution hook ----------------------------------------------

    /// Call when a deferred query is forced, right before the round-trip
    [[nodiscard]] QueryToken on_query_start(const ContextId& context,
                                            std::string_view statement,
                                            const std::vector<std::string>& params = {});

    /// Call after the round-trip with the declared columns and produced records
    std::optional<QueryEvent> on_query_end(const ContextId& context,
                                           QueryToken token,
                                           const ResultShape& result = {});

    // ---- Relationship-resolution hook --------------------------------------

    /**
     * @brief The ORM is about to resolve relationship `name` on records it produced
     * @param source Group that produced the records, when the ORM knows it
     * @return true if the scope is bound to an open group
     */
    bool begin_relationship(const ContextId& context, std::string name,
                            std::optional<GroupId> source = std::nullopt);

    void end_relationship(const ContextId& context);

    // ---- Field-access hook -------------------------------------------------

    void on_field_read(const ContextId& context, const RecordIdentity& identity,
                       std::string_view field);

    // ---- Introspection -----------------------------------------------------

    /// Origin of the current stack, as it would be stamped on a query forced here
    [[nodiscard]] Origin resolve_origin() const;

    [[nodiscard]] bool is_active(const ContextId& context) const;
    [[nodiscard]] size_t active_units() const;
    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<const OriginResolver> resolver_;
    std::shared_ptr<UnitOfWorkRegistry> registry_;
};

/**
 * @brief RAII relationship-resolution notification
 *
 * Usage (ORM integration, prefetching author.books):
 *   RelationshipScope scope(engine, ctx, "books");
 *   run_prefetch_query(...);   // grouped as a dependent
 */
class RelationshipScope {
public:
    RelationshipScope(Engine& engine, ContextId context, std::string name,
                      std::optional<GroupId> source = std::nullopt);
    ~RelationshipScope();

    RelationshipScope(const RelationshipScope&) = delete;
    RelationshipScope& operator=(const RelationshipScope&) = delete;

    [[nodiscard]] bool bound() const { return bound_; }

private:
    Engine& engine_;
    ContextId context_;
    bool bound_;
};

/**
 * @brief RAII query-execution notification
 *
 * Starts the query on construction. finish() supplies the result shape;
 * if the scope is left without finish() (the driver threw), the query is
 * ended with an unknown column set.
 */
class ScopedQuery {
public:
    ScopedQuery(Engine& engine, ContextId context, std::string_view statement,
                const std::vector<std::string>& params = {});
    ~ScopedQuery();

    ScopedQuery(const ScopedQuery&) = delete;
    ScopedQuery& operator=(const ScopedQuery&) = delete;

    std::optional<QueryEvent> finish(const ResultShape& result);

    [[nodiscard]] QueryToken token() const { return token_; }

private:
    Engine& engine_;
    ContextId context_;
    QueryToken token_;
    bool finished_ = false;
};

} // namespace ormcost
