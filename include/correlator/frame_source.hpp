#pragma once

#include <cstdint>
#include <source_location>
#include <string>
#include <vector>

namespace ormcost {

/**
 * @brief One entry of an execution frame stack
 */
struct CallFrame {
    std::string file;
    uint32_t line = 0;
    std::string function;

    CallFrame() = default;
    CallFrame(std::string f, uint32_t l, std::string fn = "")
        : file(std::move(f)), line(l), function(std::move(fn)) {}
};

/**
 * @brief Supplies the current call stack at the point a query is forced
 *
 * capture() returns frames innermost first. It must be callable from the
 * thread that forces the query; it may throw when the stack is unreadable.
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    [[nodiscard]] virtual std::vector<CallFrame> capture() const = 0;
};

/**
 * @brief Frame source backed by a per-thread shadow stack
 *
 * Application and ORM code mark their frames with ScopedFrame (or the
 * ORMCOST_FRAME() macro); capture() returns the marks of the calling
 * thread, innermost first.
 */
class ShadowStackFrameSource : public IFrameSource {
public:
    [[nodiscard]] std::vector<CallFrame> capture() const override;

    /// Depth of the calling thread's shadow stack
    [[nodiscard]] static size_t depth();
};

/**
 * @brief RAII shadow-stack mark - pushes a frame on construction, pops on destruction
 *
 * Usage:
 *   void OrderView::render() {
 *       ORMCOST_FRAME();
 *       auto orders = Order::objects().filter(...);   // forced below
 *       for (auto& o : orders) { ... }
 *   }
 */
class ScopedFrame {
public:
    explicit ScopedFrame(std::source_location loc = std::source_location::current());
    explicit ScopedFrame(CallFrame frame);
    ~ScopedFrame();

    ScopedFrame(const ScopedFrame&) = delete;
    ScopedFrame& operator=(const ScopedFrame&) = delete;
};

} // namespace ormcost

#define ORMCOST_CONCAT_INNER(a, b) a##b
#define ORMCOST_CONCAT(a, b) ORMCOST_CONCAT_INNER(a, b)
#define ORMCOST_FRAME() ::ormcost::ScopedFrame ORMCOST_CONCAT(_ormcost_frame_, __LINE__)
