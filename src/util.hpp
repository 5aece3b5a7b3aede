#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mcp_pager {

/// Endpoint URL split into what the HTTP layer needs.
struct UrlParts {
    std::string scheme;   // "http" or "https", lower-cased
    std::string host;     // IPv6 literals without brackets
    std::string port;     // explicit, or the scheme default
    std::string target;   // path plus query, e.g. "/mcp?session=1"
};

/// Parse an http(s) endpoint URL. A "#fragment" is dropped.
/// @throws std::invalid_argument on malformed input or another scheme.
UrlParts parseUrl(const std::string& url);

/// Parse a decimal count of at least 1 (e.g. a command-line limit).
/// @throws std::invalid_argument on signs, junk, zero or overflow.
std::size_t parsePositiveCount(const std::string& text);

/// Retry delay for a 0-based attempt: baseMs * 2^attempt capped at maxMs,
/// plus up to 100 ms of random jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

} // namespace mcp_pager
