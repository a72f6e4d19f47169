#include "correlator/origin_resolver.hpp"
#include "core/utils.hpp"

#include <format>

namespace ormcost {

OriginResolver::OriginResolver(std::shared_ptr<const InternalPathFilter> filter,
                               std::shared_ptr<const IFrameSource> frames)
    : filter_(std::move(filter)), frames_(std::move(frames)) {}

Origin OriginResolver::resolve_origin() const {
    if (!frames_) return Origin::unattributed();

    std::vector<CallFrame> stack;
    try {
        stack = frames_->capture();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Origin resolver: stack unreadable: {}", e.what()));
        return Origin::unattributed();
    }
    return select(stack);
}

Origin OriginResolver::select(const std::vector<CallFrame>& frames) const {
    for (const auto& frame : frames) {
        if (frame.file.empty()) continue;
        if (filter_ && filter_->is_internal(frame.file)) continue;
        return Origin::at(frame.file, frame.line, frame.function);
    }
    return Origin::unattributed();
}

} // namespace ormcost
