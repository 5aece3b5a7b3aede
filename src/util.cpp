#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <random>
#include <stdexcept>

namespace mcp_pager {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme '" + parts.scheme +
                                    "': " + url);
    }

    // Drop the fragment; it is never sent to the server.
    std::string rest = url.substr(schemeEnd + 3);
    rest = rest.substr(0, rest.find('#'));

    auto pathStart = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathStart);
    if (pathStart == std::string::npos) {
        parts.target = "/";
    } else if (rest[pathStart] == '?') {
        parts.target = "/" + rest.substr(pathStart);
    } else {
        parts.target = rest.substr(pathStart);
    }

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal, e.g. [::1]:3001
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid URL (unterminated IPv6 host): " + url);
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Invalid URL (garbage after host): " + url);
            }
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        parts.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portText = authority.substr(colon + 1);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }

    if (portText.empty()) {
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        if (!std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
        parts.port = portText;
    }
    return parts;
}

std::size_t parsePositiveCount(const std::string& text) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Expected a positive number, got '" + text + "'");
    }

    std::size_t value = 0;
    for (char c : text) {
        const std::size_t digit = static_cast<std::size_t>(c - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            throw std::invalid_argument("Number out of range: " + text);
        }
        value = value * 10 + digit;
    }

    if (value == 0) {
        throw std::invalid_argument("Expected a positive number, got '" + text + "'");
    }
    return value;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // Beyond 2^30 the cap has long been reached; keeps the shift defined.
    const int shift = std::clamp(attempt, 0, 30);
    int64_t backoff = std::min(baseMs * (int64_t{1} << shift), maxMs);

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng);

    return std::chrono::milliseconds(backoff);
}

} // namespace mcp_pager
