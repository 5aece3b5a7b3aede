#pragma once

#include "cursor_guard.hpp"
#include "errors.hpp"
#include "models.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mcp_pager {

/// Fetches one page for the given cursor (nullopt on the first request).
/// Transport failures are thrown and pass through the paginator unchanged.
template <typename T>
using FetchPage = std::function<Page<T>(const std::optional<std::string>&)>;

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken()
        : mFlag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()              { mFlag->store(true); }
    bool isCancelled() const   { return mFlag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> mFlag;
};

struct PaginatorOptions {
    std::size_t       maxPages = kDefaultMaxPages;
    CancellationToken cancellation;
    bool              verbose  = false;
    std::string       label    = "list";   // used in diagnostics only
};

namespace detail {

/// The fetch -> validate -> continue state machine for one traversal.
/// Owns the traversal's CursorGuard, so each instance is fully isolated.
template <typename T>
class Traversal {
public:
    enum class State { Fetching, Terminated, Failed };

    Traversal(FetchPage<T> fetch, PaginatorOptions options)
        : mFetch(std::move(fetch))
        , mOptions(std::move(options))
        , mGuard(mOptions.maxPages) {}

    State state() const { return mState; }
    std::size_t pagesFetched() const { return mPagesFetched; }

    /// Fetch the page for the current cursor and validate its next cursor.
    /// Returns the page's items. A cancellation or fetch failure is thrown
    /// immediately; a cursor violation is held back (see raisePending) so
    /// the items of the offending page can still be delivered.
    std::vector<T> advance() {
        if (mOptions.cancellation.isCancelled()) {
            mState = State::Failed;
            if (mOptions.verbose) {
                std::cerr << "[Paginator] " << mOptions.label
                          << ": cancelled before page " << (mPagesFetched + 1)
                          << "\n";
            }
            throw OperationCancelledError();
        }

        if (mOptions.verbose) {
            std::cerr << "[Paginator] " << mOptions.label << ": fetching page "
                      << (mPagesFetched + 1);
            if (mCursor) std::cerr << ", cursor=" << *mCursor;
            std::cerr << "\n";
        }

        Page<T> page;
        try {
            page = mFetch(mCursor);
        } catch (const std::exception& e) {
            mState = State::Failed;
            if (mOptions.verbose) {
                std::cerr << "[Paginator] " << mOptions.label
                          << ": fetch failed: " << e.what() << "\n";
            }
            throw;
        }
        ++mPagesFetched;

        mCursor = normalizeCursor(page.nextCursor);
        if (!mCursor) {
            mState = State::Terminated;
            if (mOptions.verbose) {
                std::cerr << "[Paginator] " << mOptions.label
                          << ": no more pages (" << mPagesFetched
                          << " fetched)\n";
            }
            return std::move(page.items);
        }

        try {
            mGuard.admit(*mCursor);
        } catch (const ProtocolError& e) {
            mState   = State::Failed;
            mPending = std::current_exception();
            if (mOptions.verbose) {
                std::cerr << "[Paginator] " << mOptions.label
                          << ": " << e.what() << "\n";
            }
        }
        return std::move(page.items);
    }

    /// Rethrow a cursor violation recorded by advance(), once.
    void raisePending() {
        if (mPending) {
            std::exception_ptr e = mPending;
            mPending = nullptr;
            std::rethrow_exception(e);
        }
    }

private:
    FetchPage<T>               mFetch;
    PaginatorOptions           mOptions;
    CursorGuard                mGuard;
    std::optional<std::string> mCursor;
    std::exception_ptr         mPending;
    State                      mState        = State::Fetching;
    std::size_t                mPagesFetched = 0;
};

} // namespace detail

/// Lazy, finite, non-restartable sequence over a paginated collection.
/// The next page is fetched only when the caller asks for an item after the
/// current page's items are exhausted.
template <typename T>
class PageEnumerator {
public:
    PageEnumerator(FetchPage<T> fetch, PaginatorOptions options)
        : mTraversal(std::move(fetch), std::move(options)) {}

    PageEnumerator(const PageEnumerator&)            = delete;
    PageEnumerator& operator=(const PageEnumerator&) = delete;
    PageEnumerator(PageEnumerator&&)                 = default;
    PageEnumerator& operator=(PageEnumerator&&)      = default;

    /// Next item, or nullopt once the collection is exhausted.
    /// A failed traversal throws here, after every item of the pages
    /// already fetched has been returned; later calls return nullopt.
    std::optional<T> next() {
        for (;;) {
            if (mPos < mBuffer.size()) {
                return std::move(mBuffer[mPos++]);
            }
            mBuffer.clear();
            mPos = 0;

            mTraversal.raisePending();
            if (mTraversal.state() != detail::Traversal<T>::State::Fetching) {
                return std::nullopt;
            }
            mBuffer = mTraversal.advance();
        }
    }

    std::size_t pagesFetched() const { return mTraversal.pagesFetched(); }

    /// Single-pass input iterator so the sequence works with range-for.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        iterator() = default;
        explicit iterator(PageEnumerator* owner)
            : mOwner(owner) { ++(*this); }

        reference operator*()  const { return *mCurrent; }
        pointer   operator->() const { return &*mCurrent; }

        iterator& operator++() {
            mCurrent = mOwner->next();
            if (!mCurrent) mOwner = nullptr;
            return *this;
        }

        bool operator==(const iterator& other) const { return mOwner == other.mOwner; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        PageEnumerator*  mOwner = nullptr;
        std::optional<T> mCurrent;
    };

    iterator begin() { return iterator(this); }
    iterator end()   { return iterator(); }

private:
    detail::Traversal<T> mTraversal;
    std::vector<T>       mBuffer;
    std::size_t          mPos = 0;
};

/// Drives cursor-based pagination over a FetchPage collaborator.
/// Every listAll()/enumerate() call starts a fresh traversal with its own
/// cursor state, so one Paginator may serve concurrent callers.
template <typename T>
class Paginator {
public:
    /// @throws std::invalid_argument if options.maxPages is zero.
    explicit Paginator(FetchPage<T> fetch, PaginatorOptions options = {})
        : mFetch(std::move(fetch))
        , mOptions(std::move(options))
    {
        if (mOptions.maxPages == 0) {
            throw std::invalid_argument("maxPages must be at least 1");
        }
    }

    /// Collect every item of the collection.
    /// @throws TransportError (or whatever the fetcher throws), ProtocolError,
    ///         OperationCancelledError. Nothing is returned on failure.
    std::vector<T> listAll() const {
        detail::Traversal<T> traversal(mFetch, mOptions);

        // Not reserved from the first page: later pages may differ in size.
        std::vector<T> all;
        while (traversal.state() == detail::Traversal<T>::State::Fetching) {
            std::vector<T> items = traversal.advance();
            traversal.raisePending();
            all.insert(all.end(),
                       std::make_move_iterator(items.begin()),
                       std::make_move_iterator(items.end()));
        }
        return all;
    }

    PageEnumerator<T> enumerate() const {
        return PageEnumerator<T>(mFetch, mOptions);
    }

    const PaginatorOptions& options() const { return mOptions; }

private:
    FetchPage<T>     mFetch;
    PaginatorOptions mOptions;
};

} // namespace mcp_pager
