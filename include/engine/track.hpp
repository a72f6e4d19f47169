#pragma once

#include "engine/engine.hpp"
#include "report/report.hpp"

#include <type_traits>
#include <utility>

namespace ormcost {

template<typename T>
struct Tracked {
    T value;
    Report report;
};

/**
 * @brief Run `fn` inside its own unit of work
 *
 * Returns the callable's result together with the Report (just the Report
 * for void callables). If `fn` throws, the unit of work is released by its
 * guard and the exception propagates unchanged.
 */
template<typename Fn>
auto track(Engine& engine, const ContextId& context, Fn&& fn) {
    using R = std::invoke_result_t<Fn>;

    UnitOfWorkGuard guard = engine.begin_unit_of_work(context);
    if constexpr (std::is_void_v<R>) {
        std::forward<Fn>(fn)();
        return engine.end_unit_of_work(context);
    } else {
        R value = std::forward<Fn>(fn)();
        Report report = engine.end_unit_of_work(context);
        return Tracked<R>{std::move(value), std::move(report)};
    }
}

} // namespace ormcost
