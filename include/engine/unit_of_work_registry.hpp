#pragma once

#include "core/types.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace ormcost {

class UnitOfWork;

/**
 * @brief Process-wide map execution context -> active unit of work
 *
 * The only synchronized structure of the engine: contexts are scheduled
 * across worker threads. Thread-safe via shared_mutex.
 */
class UnitOfWorkRegistry {
public:
    /// @return false (and leaves the map unchanged) if the context is already active
    bool insert(const ContextId& context, std::shared_ptr<UnitOfWork> unit);

    [[nodiscard]] std::shared_ptr<UnitOfWork> find(const ContextId& context) const;

    /**
     * @brief Detach the context's unit, but only if it is still `expected`
     * @return The detached unit, or nullptr if the context maps elsewhere
     */
    std::shared_ptr<UnitOfWork> release(const ContextId& context, const UnitOfWork* expected);

    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<ContextId, std::shared_ptr<UnitOfWork>> active_;
    mutable std::shared_mutex mutex_;
};

} // namespace ormcost
