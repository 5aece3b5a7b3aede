#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mcp_pager {

/// Network, HTTP or framing failure, or a response that cannot be decoded.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what)
        : std::runtime_error(what) {}
};

/// The peer could not be reached or the exchange was cut off.
/// The only transport failure the retry layer treats as transient.
class ConnectionError : public TransportError {
public:
    explicit ConnectionError(const std::string& what)
        : TransportError(what) {}
};

/// The peer answered with a JSON-RPC error object.
class RpcError : public TransportError {
public:
    RpcError(int code, const std::string& message)
        : TransportError("JSON-RPC error " + std::to_string(code) + ": " + message)
        , mCode(code) {}

    int code() const { return mCode; }

private:
    int mCode;
};

/// The peer broke the pagination contract.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what)
        : std::runtime_error(what) {}
};

class DuplicateCursorError : public ProtocolError {
public:
    explicit DuplicateCursorError(const std::string& cursor)
        : ProtocolError("Peer repeated pagination cursor '" + cursor + "'")
        , mCursor(cursor) {}

    const std::string& cursor() const { return mCursor; }

private:
    std::string mCursor;
};

class PageLimitExceededError : public ProtocolError {
public:
    explicit PageLimitExceededError(std::size_t maxPages)
        : ProtocolError("Pagination exceeded the limit of " +
                        std::to_string(maxPages) + " pages")
        , mMaxPages(maxPages) {}

    std::size_t maxPages() const { return mMaxPages; }

private:
    std::size_t mMaxPages;
};

/// Cancellation was requested before the next page was fetched.
class OperationCancelledError : public std::runtime_error {
public:
    OperationCancelledError()
        : std::runtime_error("Pagination cancelled") {}
};

} // namespace mcp_pager
