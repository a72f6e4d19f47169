#include "correlator/frame_source.hpp"

namespace ormcost {

namespace {

std::vector<CallFrame>& shadow_stack() {
    static thread_local std::vector<CallFrame> stack;
    return stack;
}

} // anonymous namespace

std::vector<CallFrame> ShadowStackFrameSource::capture() const {
    const auto& stack = shadow_stack();
    return {stack.rbegin(), stack.rend()};
}

size_t ShadowStackFrameSource::depth() {
    return shadow_stack().size();
}

ScopedFrame::ScopedFrame(std::source_location loc) {
    shadow_stack().emplace_back(loc.file_name(), loc.line(), loc.function_name());
}

ScopedFrame::ScopedFrame(CallFrame frame) {
    shadow_stack().push_back(std::move(frame));
}

ScopedFrame::~ScopedFrame() {
    auto& stack = shadow_stack();
    if (!stack.empty()) stack.pop_back();
}

} // namespace ormcost
