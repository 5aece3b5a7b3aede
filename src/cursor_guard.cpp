#include "cursor_guard.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace mcp_pager {

std::optional<std::string> normalizeCursor(const std::optional<std::string>& raw) {
    if (!raw.has_value() || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

CursorGuard::CursorGuard(std::size_t maxPages)
    : mMaxPages(maxPages)
{
    if (mMaxPages == 0) {
        throw std::invalid_argument("maxPages must be at least 1");
    }
}

void CursorGuard::admit(const std::string& cursor) {
    ++mPages;
    if (mPages > mMaxPages) {
        throw PageLimitExceededError(mMaxPages);
    }

    if (!mSeen.insert(cursor).second) {
        throw DuplicateCursorError(cursor);
    }
}

} // namespace mcp_pager
