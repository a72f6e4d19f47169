#pragma once

#include "core/types.hpp"
#include "correlator/frame_source.hpp"
#include "correlator/internal_path_filter.hpp"

#include <memory>

namespace ormcost {

/**
 * @brief Maps the stack at a forcing point to the application frame that caused it
 *
 * Must run synchronously while the deferred query is being forced; by the
 * time the unit of work ends the stack that matters is gone.
 */
class OriginResolver {
public:
    OriginResolver(std::shared_ptr<const InternalPathFilter> filter,
                   std::shared_ptr<const IFrameSource> frames);

    /**
     * @brief Nearest non-internal frame of the current stack
     *
     * Never throws: an unreadable stack or an all-internal stack yields
     * Origin::unattributed().
     */
    [[nodiscard]] Origin resolve_origin() const;

    /// Same selection applied to an already captured stack (innermost first)
    [[nodiscard]] Origin select(const std::vector<CallFrame>& frames) const;

private:
    std::shared_ptr<const InternalPathFilter> filter_;
    std::shared_ptr<const IFrameSource> frames_;
};

} // namespace ormcost
