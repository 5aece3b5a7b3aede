#pragma once

#include "models.hpp"
#include "pagination.hpp"
#include "rpc_client.hpp"

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcp_pager {

/// MCP client facade: binds the paginator to the list methods of a peer and
/// retries transient transport failures below it.
///
/// The enumerate*() sequences call back into this client, so it must outlive
/// them. Independent traversals may run on separate threads.
class McpClient {
public:
    struct Stats {
        int totalRequests = 0;
        int totalRetries  = 0;
        int totalPages    = 0;
        int totalItems    = 0;
    };

    /// @param options  Paginator settings applied to every traversal; the
    ///                 label is replaced by the method name.
    McpClient(RpcClient& client,
              PaginatorOptions options = {},
              bool verbose = false);

    /// Run the initialize handshake and remember the session id, if any.
    ServerInfo initialize();

    std::vector<Tool>             listTools() const;
    std::vector<Prompt>           listPrompts() const;
    std::vector<Resource>         listResources() const;
    std::vector<ResourceTemplate> listResourceTemplates() const;

    PageEnumerator<Tool>             enumerateTools() const;
    PageEnumerator<Prompt>           enumeratePrompts() const;
    PageEnumerator<Resource>         enumerateResources() const;
    PageEnumerator<ResourceTemplate> enumerateResourceTemplates() const;

    Stats getStats() const;

private:
    static constexpr int kMaxAttempts = 6;

    RpcClient&       mClient;
    PaginatorOptions mOptions;
    bool             mVerbose;

    mutable std::atomic<int> mRequests{0};
    mutable std::atomic<int> mRetries{0};
    mutable std::atomic<int> mPages{0};
    mutable std::atomic<int> mItems{0};

    template <typename T>
    Paginator<T> paginatorFor(const std::string& method,
                              const std::string& itemsField,
                              T (*parseItem)(const nlohmann::json&)) const;

    /// Issue a request with exponential-backoff retry on transient failures.
    /// @throws OperationCancelledError once @p cancellation is set, checked
    ///         before every attempt and before every backoff sleep.
    nlohmann::json executeWithRetry(const std::string& method,
                                    const nlohmann::json& params,
                                    const CancellationToken& cancellation) const;

    /// Backoff sleep that wakes early and throws OperationCancelledError
    /// when @p cancellation is set.
    static void sleepUnlessCancelled(std::chrono::milliseconds delay,
                                     const CancellationToken& cancellation);

    static bool isRetryableStatus(unsigned int status);
};

} // namespace mcp_pager
