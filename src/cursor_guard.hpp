#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>

namespace mcp_pager {

/// Default upper bound on pages fetched in one traversal.
inline constexpr std::size_t kDefaultMaxPages = 10000;

/// Canonical form of a next-cursor: absent and "" both mean "no more pages".
std::optional<std::string> normalizeCursor(const std::optional<std::string>& raw);

/// Per-traversal record of admitted cursors and the page count.
/// Create one per listAll()/enumerate() call; never share it.
class CursorGuard {
public:
    /// @throws std::invalid_argument if @p maxPages is zero.
    explicit CursorGuard(std::size_t maxPages = kDefaultMaxPages);

    /// Accept @p cursor as the continuation for the next page.
    /// The page limit is checked before the seen-set.
    /// @throws PageLimitExceededError, DuplicateCursorError
    void admit(const std::string& cursor);

    std::size_t pagesAdmitted() const { return mPages; }
    std::size_t maxPages()      const { return mMaxPages; }

private:
    std::size_t                     mMaxPages;
    std::size_t                     mPages = 0;
    std::unordered_set<std::string> mSeen;
};

} // namespace mcp_pager
