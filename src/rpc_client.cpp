#include "rpc_client.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef MCP_PAGER_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace mcp_pager {

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

RpcClient::RpcClient(const std::string& endpoint,
                     int timeoutMs,
                     bool omitContentTypeCharset)
    : mTimeoutMs(timeoutMs)
    , mOmitCharset(omitContentTypeCharset)
{
    auto parts = parseUrl(endpoint);
    mHost   = parts.host;
    mPort   = parts.port;
    mTarget = parts.target;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef MCP_PAGER_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

RpcClient::Response
RpcClient::call(const std::string& method, const nlohmann::json& params)
{
    nlohmann::json message;
    message["jsonrpc"] = "2.0";
    message["id"]      = mNextId.fetch_add(1);
    message["method"]  = method;
    if (!params.empty()) {
        message["params"] = params;
    }
    return send(message);
}

RpcClient::Response
RpcClient::notify(const std::string& method, const nlohmann::json& params)
{
    nlohmann::json message;
    message["jsonrpc"] = "2.0";
    message["method"]  = method;
    if (!params.empty()) {
        message["params"] = params;
    }
    return send(message);
}

RpcClient::Response RpcClient::send(const nlohmann::json& message)
{
    std::string body = message.dump();

    if (mVerbose) {
        std::cerr << "[RpcClient] POST " << mHost << ":" << mPort
                  << mTarget << "\n";
        if (body.size() <= 300) {
            std::cerr << "[RpcClient] Body: " << body << "\n";
        } else {
            std::cerr << "[RpcClient] Body: " << body.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    try {
        return mUseSsl ? doHttpsRequest(body) : doHttpRequest(body);
    } catch (const beast::system_error& e) {
        throw ConnectionError(std::string("HTTP exchange with ") + mHost +
                              ":" + mPort + " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Shared request / response handling
// ---------------------------------------------------------------------------

namespace {

http::request<http::string_body>
buildRequest(const std::string& host,
             const std::string& target,
             const std::string& sessionId,
             bool omitCharset,
             const std::string& requestBody)
{
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type,
            omitCharset ? "application/json" : "application/json; charset=utf-8");
    req.set(http::field::accept, "application/json, text/event-stream");
    req.set(http::field::user_agent, "mcp_pager/1.0");
    if (!sessionId.empty()) {
        req.set(kSessionHeader, sessionId);
    }
    req.body() = requestBody;
    req.prepare_payload();
    return req;
}

RpcClient::Response decodeResponse(const http::response<http::string_body>& res)
{
    RpcClient::Response response;
    response.httpStatus = res.result_int();

    auto session = res.find(kSessionHeader);
    if (session != res.end()) {
        const auto value   = session->value();
        response.sessionId = std::string(value.data(), value.size());
    }

    std::string payload = res.body();
    auto contentType = res.find(http::field::content_type);
    if (contentType != res.end() &&
        startsWith(std::string(contentType->value().data(),
                               contentType->value().size()),
                   "text/event-stream")) {
        payload = extractEventStreamData(payload);
    }

    if (payload.find_first_not_of(" \t\r\n") == std::string::npos) {
        return response;  // e.g. 202 Accepted for a notification
    }

    try {
        response.body = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        // Error pages from proxies are often HTML or plain text; the status
        // alone decides what happens to them.
        if (response.httpStatus < 200 || response.httpStatus >= 300) {
            return response;
        }
        throw TransportError(
            std::string("Failed to parse JSON response: ") + e.what());
    }
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

RpcClient::Response
RpcClient::doHttpRequest(const std::string& requestBody)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(mHost, mTarget, mSessionId, mOmitCharset, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = decodeResponse(res);

    if (mVerbose) {
        std::cerr << "[RpcClient] HTTP " << response.httpStatus << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

RpcClient::Response
RpcClient::doHttpsRequest(const std::string& requestBody)
{
#ifdef MCP_PAGER_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw ConnectionError("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(mHost, mTarget, mSessionId, mOmitCharset, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    Response response = decodeResponse(res);

    if (mVerbose) {
        std::cerr << "[RpcClient] HTTPS " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)requestBody;
    throw TransportError("HTTPS not supported: built without OpenSSL");
#endif
}

// ---------------------------------------------------------------------------
// Server-sent events
// ---------------------------------------------------------------------------

std::string extractEventStreamData(const std::string& body)
{
    std::istringstream in(body);
    std::string line;
    std::string current;
    std::string last;
    bool        inEvent = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            // Blank line dispatches the event.
            if (inEvent) last = current;
            current.clear();
            inEvent = false;
            continue;
        }

        if (startsWith(line, "data:")) {
            std::string value = line.substr(5);
            if (!value.empty() && value.front() == ' ') value.erase(0, 1);
            if (inEvent) current += '\n';
            current += value;
            inEvent = true;
        }
        // "event:", "id:", "retry:" and ":" comments carry nothing we need.
    }

    if (inEvent) last = current;
    return last;
}

} // namespace mcp_pager
