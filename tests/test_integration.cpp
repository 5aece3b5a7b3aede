/// @file test_integration.cpp
/// End-to-end tests: McpClient -> RpcClient -> HTTP -> a scripted peer.
///
/// The peer is a small synchronous Boost.Beast server bound to an ephemeral
/// port on 127.0.0.1 and run on its own thread for the duration of a test.
/// Each scenario scripts the peer's replies, including broken pagination.

#include "errors.hpp"
#include "mcp_client.hpp"
#include "models.hpp"
#include "rpc_client.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_pager;
using json = nlohmann::json;

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

// ---------------------------------------------------------------------------
// Scripted peer
// ---------------------------------------------------------------------------

struct Reply {
    unsigned int status      = 200;
    json         body;                          // dumped unless null
    std::string  rawBody;                       // sent verbatim when set
    std::string  contentType = "application/json";
    std::string  sessionId;
};

struct Received {
    json        message;
    std::string contentType;
    std::string sessionId;
};

class LoopbackPeer {
public:
    using Handler = std::function<Reply(const json& message)>;

    explicit LoopbackPeer(Handler handler)
        : mHandler(std::move(handler))
        , mAcceptor(mIoc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        mPort   = mAcceptor.local_endpoint().port();
        mThread = std::thread([this] { serve(); });
    }

    ~LoopbackPeer() {
        mStopping = true;
        // Unblock accept() with a throwaway connection.
        net::io_context ioc;
        tcp::socket     wake(ioc);
        beast::error_code ec;
        wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), mPort), ec);
        mThread.join();
    }

    std::string endpoint() const {
        return "http://127.0.0.1:" + std::to_string(mPort) + "/mcp";
    }

    std::vector<Received> received() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mReceived;
    }

    std::size_t countMethod(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mMutex);
        std::size_t n = 0;
        for (const auto& r : mReceived) {
            if (r.message.value("method", "") == method) ++n;
        }
        return n;
    }

private:
    Handler                 mHandler;
    net::io_context         mIoc;
    tcp::acceptor           mAcceptor;
    unsigned short          mPort = 0;
    std::atomic<bool>       mStopping{false};
    std::thread             mThread;
    mutable std::mutex      mMutex;
    std::vector<Received>   mReceived;

    static std::string headerOf(const http::request<http::string_body>& req,
                                beast::string_view name) {
        auto it = req.find(name);
        if (it == req.end()) return "";
        return std::string(it->value().data(), it->value().size());
    }

    void serve() {
        while (!mStopping) {
            tcp::socket socket(mIoc);
            beast::error_code ec;
            mAcceptor.accept(socket, ec);
            if (ec) break;
            if (mStopping) break;
            handle(socket);
        }
    }

    void handle(tcp::socket& socket) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) return;

        Received rec;
        rec.message     = json::parse(req.body(), nullptr, /*allow_exceptions=*/false);
        rec.contentType = headerOf(req, "Content-Type");
        rec.sessionId   = headerOf(req, "Mcp-Session-Id");
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mReceived.push_back(rec);
        }

        Reply reply = mHandler(rec.message);

        http::response<http::string_body> res{
            static_cast<http::status>(reply.status), req.version()};
        res.set(http::field::content_type, reply.contentType);
        if (!reply.sessionId.empty()) {
            res.set("Mcp-Session-Id", reply.sessionId);
        }
        res.keep_alive(false);
        if (!reply.rawBody.empty()) {
            res.body() = reply.rawBody;
        } else if (!reply.body.is_null()) {
            res.body() = reply.body.dump();
        }
        res.prepare_payload();

        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ---------------------------------------------------------------------------
// Reply helpers
// ---------------------------------------------------------------------------

static Reply resultFor(const json& request, const json& result) {
    Reply r;
    r.body = {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}};
    return r;
}

static Reply errorFor(const json& request, int code, const std::string& message) {
    Reply r;
    r.body = {
        {"jsonrpc", "2.0"},
        {"id", request.value("id", json())},
        {"error", {{"code", code}, {"message", message}}}
    };
    return r;
}

static std::string cursorOf(const json& request) {
    if (request.contains("params") && request["params"].contains("cursor")) {
        return request["params"]["cursor"].get<std::string>();
    }
    return "";
}

static json toolEntry(const std::string& name) {
    return {{"name", name}, {"inputSchema", {{"type", "object"}}}};
}

// ============================================================================
// Well-behaved peer
// ============================================================================

TEST(Integration, ListsToolsAcrossPages) {
    LoopbackPeer peer([](const json& req) {
        if (req.value("method", "") != "tools/list") {
            return errorFor(req, -32601, "Method not found");
        }
        if (cursorOf(req).empty()) {
            return resultFor(req, {{"tools", json::array({toolEntry("alpha"), toolEntry("beta")})},
                                   {"nextCursor", "page-2"}});
        }
        return resultFor(req, {{"tools", json::array({toolEntry("gamma")})}, {"nextCursor", ""}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto tools = client.listTools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "alpha");
    EXPECT_EQ(tools[1].name, "beta");
    EXPECT_EQ(tools[2].name, "gamma");

    auto received = peer.received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_FALSE(received[0].message.contains("params"));
    EXPECT_EQ(received[1].message["params"]["cursor"], "page-2");

    auto stats = client.getStats();
    EXPECT_EQ(stats.totalPages, 2);
    EXPECT_EQ(stats.totalItems, 3);
    EXPECT_EQ(stats.totalRequests, 2);
    EXPECT_EQ(stats.totalRetries, 0);
}

TEST(Integration, InitializeHandshakeCarriesSessionId) {
    LoopbackPeer peer([](const json& req) {
        const std::string method = req.value("method", "");
        if (method == "initialize") {
            Reply r = resultFor(req, {
                {"protocolVersion", "2025-06-18"},
                {"capabilities", {{"prompts", json::object()}}},
                {"serverInfo", {{"name", "loopback"}, {"version", "9.9"}}}
            });
            r.sessionId = "sess-42";
            return r;
        }
        if (method == "notifications/initialized") {
            Reply r;
            r.status = 202;
            return r;
        }
        return resultFor(req, {{"prompts", json::array({{{"name", "greet"}}})}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto info = client.initialize();
    EXPECT_EQ(info.name, "loopback");
    EXPECT_EQ(info.version, "9.9");
    EXPECT_EQ(info.protocolVersion, "2025-06-18");
    EXPECT_EQ(rpc.sessionId(), "sess-42");

    auto prompts = client.listPrompts();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].name, "greet");

    auto received = peer.received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].message["params"]["protocolVersion"], "2025-06-18");
    EXPECT_EQ(received[0].sessionId, "");
    EXPECT_FALSE(received[1].message.contains("id"));
    EXPECT_EQ(received[1].sessionId, "sess-42");
    EXPECT_EQ(received[2].sessionId, "sess-42");
}

TEST(Integration, LazyEnumerationStopsWithoutFetchingMore) {
    LoopbackPeer peer([](const json& req) {
        const std::string cursor = cursorOf(req);
        json entry = {{"uri", "file:///" + (cursor.empty() ? std::string("0") : cursor)}};
        return resultFor(req, {{"resources", json::array({entry, entry})},
                               {"nextCursor", cursor + "x"}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto resources = client.enumerateResources();
    auto first = resources.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->uri, "file:///0");

    EXPECT_EQ(peer.countMethod("resources/list"), 1u);
    EXPECT_EQ(resources.pagesFetched(), 1u);
}

TEST(Integration, EventStreamRepliesAreDecoded) {
    LoopbackPeer peer([](const json& req) {
        json envelope = {
            {"jsonrpc", "2.0"},
            {"id", req["id"]},
            {"result", {{"resourceTemplates",
                         json::array({{{"uriTemplate", "db://{table}/{id}"}}})}}}
        };
        Reply r;
        r.contentType = "text/event-stream";
        r.rawBody = "event: message\ndata: " + envelope.dump() + "\n\n";
        return r;
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto templates = client.listResourceTemplates();
    ASSERT_EQ(templates.size(), 1u);
    EXPECT_EQ(templates[0].uriTemplate, "db://{table}/{id}");
}

TEST(Integration, ContentTypeCharsetCanBeOmitted) {
    LoopbackPeer peer([](const json& req) {
        return resultFor(req, {{"tools", json::array()}});
    });

    RpcClient withCharset(peer.endpoint(), 2000);
    withCharset.call("tools/list");

    RpcClient withoutCharset(peer.endpoint(), 2000, /*omitContentTypeCharset=*/true);
    withoutCharset.call("tools/list");

    auto received = peer.received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].contentType, "application/json; charset=utf-8");
    EXPECT_EQ(received[1].contentType, "application/json");
}

// ============================================================================
// Broken peers
// ============================================================================

TEST(Integration, RepeatedCursorIsReportedAsProtocolError) {
    LoopbackPeer peer([](const json& req) {
        return resultFor(req, {{"prompts", json::array({{{"name", "p"}}})},
                               {"nextCursor", "same"}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    try {
        client.listPrompts();
        FAIL() << "Expected DuplicateCursorError";
    } catch (const DuplicateCursorError& e) {
        EXPECT_EQ(e.cursor(), "same");
    }
    EXPECT_EQ(peer.countMethod("prompts/list"), 2u);
}

TEST(Integration, EndlessPeerHitsConfiguredPageLimit) {
    std::atomic<int> served{0};
    LoopbackPeer peer([&served](const json& req) {
        int n = ++served;
        return resultFor(req, {{"tools", json::array({toolEntry("t" + std::to_string(n))})},
                               {"nextCursor", "c" + std::to_string(n)}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    PaginatorOptions options;
    options.maxPages = 5;
    McpClient client(rpc, options);

    EXPECT_THROW(client.listTools(), PageLimitExceededError);
    EXPECT_EQ(peer.countMethod("tools/list"), 6u);
}

TEST(Integration, RpcErrorIsSurfacedUnchanged) {
    LoopbackPeer peer([](const json& req) {
        return errorFor(req, -32601, "Method not found");
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    try {
        client.listResourceTemplates();
        FAIL() << "Expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.code(), -32601);
    }
    EXPECT_EQ(client.getStats().totalRetries, 0);
}

TEST(Integration, NonJsonErrorPageIsTransportError) {
    LoopbackPeer peer([](const json&) {
        Reply r;
        r.status      = 404;
        r.contentType = "text/html";
        r.rawBody     = "<html>not found</html>";
        return r;
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    EXPECT_THROW(client.listTools(), TransportError);
}

TEST(Integration, TransientUnavailabilityIsRetriedBelowThePaginator) {
    std::atomic<int> calls{0};
    LoopbackPeer peer([&calls](const json& req) {
        if (++calls == 1) {
            Reply r;
            r.status = 503;
            return r;
        }
        return resultFor(req, {{"tools", json::array({toolEntry("only")})}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto tools = client.listTools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "only");

    auto stats = client.getStats();
    EXPECT_EQ(stats.totalRetries, 1);
    EXPECT_EQ(stats.totalRequests, 2);
    EXPECT_EQ(stats.totalPages, 1);
}

TEST(Integration, PlainTextBusyPageIsRetried) {
    std::atomic<int> calls{0};
    LoopbackPeer peer([&calls](const json& req) {
        if (++calls == 1) {
            Reply r;
            r.status      = 503;
            r.contentType = "text/plain";
            r.rawBody     = "busy";
            return r;
        }
        return resultFor(req, {{"tools", json::array({toolEntry("after-busy")})}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    auto tools = client.listTools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "after-busy");
    EXPECT_EQ(client.getStats().totalRetries, 1);
    EXPECT_EQ(peer.countMethod("tools/list"), 2u);
}

TEST(Integration, NonJsonErrorPageLeavesBodyEmpty) {
    LoopbackPeer peer([](const json&) {
        Reply r;
        r.status      = 502;
        r.contentType = "text/html";
        r.rawBody     = "<html>bad gateway</html>";
        return r;
    });

    RpcClient rpc(peer.endpoint(), 2000);
    auto resp = rpc.call("tools/list");
    EXPECT_EQ(resp.httpStatus, 502u);
    EXPECT_TRUE(resp.body.is_null());
}

TEST(Integration, MalformedSuccessBodyIsTransportError) {
    LoopbackPeer peer([](const json&) {
        Reply r;
        r.contentType = "text/plain";
        r.rawBody     = "not json";
        return r;
    });

    RpcClient rpc(peer.endpoint(), 2000);
    EXPECT_THROW(rpc.call("tools/list"), TransportError);
}

TEST(Integration, CancellationInterruptsRetryBackoff) {
    LoopbackPeer peer([](const json&) {
        Reply r;
        r.status = 503;
        return r;
    });

    PaginatorOptions options;
    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc, options);

    std::thread canceller([token = options.cancellation]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.listTools(), OperationCancelledError);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_LE(peer.countMethod("tools/list"), 3u);
}

TEST(Integration, CancelledTokenStopsBeforeAnyRequest) {
    LoopbackPeer peer([](const json& req) {
        return resultFor(req, {{"tools", json::array()}});
    });

    PaginatorOptions options;
    options.cancellation.cancel();
    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc, options);

    EXPECT_THROW(client.enumerateTools().next(), OperationCancelledError);
    EXPECT_EQ(peer.countMethod("tools/list"), 0u);
}

TEST(Integration, UnreachableEndpointIsConnectionError) {
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor listener(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = listener.local_endpoint().port();
    }

    RpcClient rpc("http://127.0.0.1:" + std::to_string(port) + "/mcp", 1000);
    EXPECT_THROW(rpc.call("tools/list"), ConnectionError);
}

TEST(Integration, ExhaustedNetworkRetriesStayConnectionError) {
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor listener(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = listener.local_endpoint().port();
    }

    RpcClient rpc("http://127.0.0.1:" + std::to_string(port) + "/mcp", 1000);
    McpClient client(rpc);

    // Runs through the full backoff schedule (a few seconds).
    try {
        client.listTools();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("Max retries exceeded"),
                  std::string::npos);
    }
    EXPECT_EQ(client.getStats().totalRequests, 6);
}

TEST(Integration, ConcurrentListingsDoNotInterfere) {
    LoopbackPeer peer([](const json& req) {
        const std::string method = req.value("method", "");
        const std::string cursor = cursorOf(req);
        const std::string next   = cursor.empty() ? "1" : (cursor == "1" ? "2" : "");
        if (method == "tools/list") {
            return resultFor(req, {{"tools", json::array({toolEntry("tool" + cursor)})},
                                   {"nextCursor", next}});
        }
        return resultFor(req, {{"prompts", json::array({{{"name", "prompt" + cursor}}})},
                               {"nextCursor", next}});
    });

    RpcClient rpc(peer.endpoint(), 2000);
    McpClient client(rpc);

    std::vector<Tool>   tools;
    std::vector<Prompt> prompts;
    std::thread a([&] { tools   = client.listTools(); });
    std::thread b([&] { prompts = client.listPrompts(); });
    a.join();
    b.join();

    ASSERT_EQ(tools.size(), 3u);
    ASSERT_EQ(prompts.size(), 3u);
    EXPECT_EQ(tools[2].name, "tool2");
    EXPECT_EQ(prompts[0].name, "prompt");
    EXPECT_EQ(client.getStats().totalPages, 6);
}
