#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ormcost {

/**
 * @brief Decides which frames belong to engine/ORM internals
 *
 * A path is internal when it starts with one of the prefixes, or when the
 * prefix appears right after a '/' (so "orm/" also matches
 * "/home/build/app/orm/queryset.cpp"). Immutable after construction and
 * safe to share across threads.
 */
class InternalPathFilter {
public:
    InternalPathFilter() = default;
    explicit InternalPathFilter(std::vector<std::string> prefixes);

    [[nodiscard]] bool is_internal(std::string_view file) const;

    [[nodiscard]] const std::vector<std::string>& prefixes() const { return prefixes_; }

private:
    std::vector<std::string> prefixes_;
};

} // namespace ormcost
