#include "correlator/internal_path_filter.hpp"

#include <algorithm>

namespace ormcost {

namespace {

// Backslashes compare equal to '/' so Windows paths match the same prefixes
bool path_char_equal(char a, char b) {
    if (a == '\\') a = '/';
    if (b == '\\') b = '/';
    return a == b;
}

bool matches_at(std::string_view file, size_t pos, std::string_view prefix) {
    if (file.size() - pos < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), file.begin() + static_cast<std::ptrdiff_t>(pos),
                      path_char_equal);
}

} // anonymous namespace

InternalPathFilter::InternalPathFilter(std::vector<std::string> prefixes)
    : prefixes_(std::move(prefixes)) {
    // Empty prefixes would match everything
    std::erase_if(prefixes_, [](const std::string& p) { return p.empty(); });
}

bool InternalPathFilter::is_internal(std::string_view file) const {
    for (const auto& prefix : prefixes_) {
        if (matches_at(file, 0, prefix)) return true;
        for (size_t i = 0; i < file.size(); ++i) {
            if ((file[i] == '/' || file[i] == '\\') && matches_at(file, i + 1, prefix)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace ormcost
