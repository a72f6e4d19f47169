#include "engine/unit_of_work_registry.hpp"
#include "engine/unit_of_work.hpp"

#include <mutex>

namespace ormcost {

bool UnitOfWorkRegistry::insert(const ContextId& context, std::shared_ptr<UnitOfWork> unit) {
    std::unique_lock lock(mutex_);
    return active_.try_emplace(context, std::move(unit)).second;
}

std::shared_ptr<UnitOfWork> UnitOfWorkRegistry::find(const ContextId& context) const {
    std::shared_lock lock(mutex_);
    const auto it = active_.find(context);
    if (it == active_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<UnitOfWork> UnitOfWorkRegistry::release(const ContextId& context,
                                                        const UnitOfWork* expected) {
    std::unique_lock lock(mutex_);
    const auto it = active_.find(context);
    if (it == active_.end() || it->second.get() != expected) return nullptr;
    auto unit = std::move(it->second);
    active_.erase(it);
    return unit;
}

size_t UnitOfWorkRegistry::size() const {
    std::shared_lock lock(mutex_);
    return active_.size();
}

} // namespace ormcost
