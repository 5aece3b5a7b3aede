#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_pager {

/// Low-level JSON-RPC 2.0 over HTTP client built on Boost.Beast.
/// Posts one message per request and returns the decoded reply.
class RpcClient {
public:
    struct Response {
        unsigned int   httpStatus = 0;
        nlohmann::json body;        // null for an empty reply or a non-JSON error page
        std::string    sessionId;   // Mcp-Session-Id header, if any
    };

    /// @param endpoint                Full URL, e.g. "http://localhost:3001/mcp"
    /// @param timeoutMs               Per-operation timeout in milliseconds
    /// @param omitContentTypeCharset  Send "application/json" without the
    ///                                charset parameter, for servers that
    ///                                reject "application/json; charset=utf-8"
    /// @throws std::invalid_argument on a malformed endpoint.
    RpcClient(const std::string& endpoint,
              int timeoutMs = 5000,
              bool omitContentTypeCharset = false);

    /// Send a request (with a fresh id) and return the reply.
    /// @throws ConnectionError on network / timeout errors,
    ///         TransportError when the reply body cannot be decoded.
    Response call(const std::string& method,
                  const nlohmann::json& params = nlohmann::json::object());

    /// Send a notification (no id, no reply expected beyond the HTTP status).
    Response notify(const std::string& method,
                    const nlohmann::json& params = nlohmann::json::object());

    /// Session id echoed on every request once set. Set it before sharing
    /// the client between threads.
    void setSessionId(const std::string& id) { mSessionId = id; }
    const std::string& sessionId() const { return mSessionId; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mTarget;
    std::string mSessionId;
    int         mTimeoutMs;
    bool        mOmitCharset;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    std::atomic<std::int64_t> mNextId{1};

    Response send(const nlohmann::json& message);
    Response doHttpRequest(const std::string& requestBody);
    Response doHttpsRequest(const std::string& requestBody);
};

/// Pull the JSON payload out of a text/event-stream body (last "data:" event).
/// Returns an empty string when the stream carries no data.
std::string extractEventStreamData(const std::string& body);

} // namespace mcp_pager
