#include "mcp_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "methods.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>
#include <utility>

namespace mcp_pager {

McpClient::McpClient(RpcClient& client,
                     PaginatorOptions options,
                     bool verbose)
    : mClient(client)
    , mOptions(std::move(options))
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: handshake
// ---------------------------------------------------------------------------

ServerInfo McpClient::initialize()
{
    nlohmann::json params;
    params["protocolVersion"] = methods::kProtocolVersion;
    params["capabilities"]    = nlohmann::json::object();
    params["clientInfo"]      = {{"name", "mcp_pager"}, {"version", "1.0"}};

    ++mRequests;
    auto resp = mClient.call(methods::kInitialize, params);
    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        if (!resp.body.is_object() || !resp.body.contains("error")) {
            throw TransportError("initialize failed with HTTP " +
                                 std::to_string(resp.httpStatus));
        }
    }

    ServerInfo info = parseInitializeResult(extractResult(resp.body));
    if (!resp.sessionId.empty()) {
        mClient.setSessionId(resp.sessionId);
    }

    if (mVerbose) {
        std::cerr << "[McpClient] Connected to " << info.name << " "
                  << info.version << " (protocol " << info.protocolVersion
                  << ")";
        if (!resp.sessionId.empty()) std::cerr << ", session " << resp.sessionId;
        std::cerr << "\n";
    }

    ++mRequests;
    auto ack = mClient.notify(methods::kInitialized);
    if (ack.httpStatus < 200 || ack.httpStatus >= 300) {
        throw TransportError("initialized notification rejected with HTTP " +
                             std::to_string(ack.httpStatus));
    }
    return info;
}

// ---------------------------------------------------------------------------
// Private: page fetcher
// ---------------------------------------------------------------------------

template <typename T>
Paginator<T> McpClient::paginatorFor(const std::string& method,
                                     const std::string& itemsField,
                                     T (*parseItem)(const nlohmann::json&)) const
{
    PaginatorOptions options = mOptions;
    options.label = method;

    CancellationToken cancellation = options.cancellation;
    FetchPage<T> fetch =
        [this, method, itemsField, parseItem, cancellation](
            const std::optional<std::string>& cursor) {
            nlohmann::json params = nlohmann::json::object();
            if (cursor.has_value()) {
                params["cursor"] = *cursor;
            }

            Page<T> page = parseListPage<T>(executeWithRetry(method, params, cancellation),
                                            itemsField, parseItem);
            ++mPages;
            mItems += static_cast<int>(page.items.size());

            if (mVerbose) {
                std::cerr << "[McpClient] " << method << ": got "
                          << page.items.size() << " items";
                if (page.nextCursor) std::cerr << ", nextCursor=\"" << *page.nextCursor << "\"";
                std::cerr << "\n";
            }
            return page;
        };

    return Paginator<T>(std::move(fetch), std::move(options));
}

// ---------------------------------------------------------------------------
// Public: list operations
// ---------------------------------------------------------------------------

std::vector<Tool> McpClient::listTools() const {
    return paginatorFor<Tool>(methods::kToolsList, methods::kToolsField,
                              &parseTool).listAll();
}

std::vector<Prompt> McpClient::listPrompts() const {
    return paginatorFor<Prompt>(methods::kPromptsList, methods::kPromptsField,
                                &parsePrompt).listAll();
}

std::vector<Resource> McpClient::listResources() const {
    return paginatorFor<Resource>(methods::kResourcesList,
                                  methods::kResourcesField,
                                  &parseResource).listAll();
}

std::vector<ResourceTemplate> McpClient::listResourceTemplates() const {
    return paginatorFor<ResourceTemplate>(methods::kResourceTemplatesList,
                                          methods::kResourceTemplatesField,
                                          &parseResourceTemplate).listAll();
}

PageEnumerator<Tool> McpClient::enumerateTools() const {
    return paginatorFor<Tool>(methods::kToolsList, methods::kToolsField,
                              &parseTool).enumerate();
}

PageEnumerator<Prompt> McpClient::enumeratePrompts() const {
    return paginatorFor<Prompt>(methods::kPromptsList, methods::kPromptsField,
                                &parsePrompt).enumerate();
}

PageEnumerator<Resource> McpClient::enumerateResources() const {
    return paginatorFor<Resource>(methods::kResourcesList,
                                  methods::kResourcesField,
                                  &parseResource).enumerate();
}

PageEnumerator<ResourceTemplate> McpClient::enumerateResourceTemplates() const {
    return paginatorFor<ResourceTemplate>(methods::kResourceTemplatesList,
                                          methods::kResourceTemplatesField,
                                          &parseResourceTemplate).enumerate();
}

McpClient::Stats McpClient::getStats() const {
    Stats s;
    s.totalRequests = mRequests.load();
    s.totalRetries  = mRetries.load();
    s.totalPages    = mPages.load();
    s.totalItems    = mItems.load();
    return s;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

nlohmann::json McpClient::executeWithRetry(const std::string& method,
                                           const nlohmann::json& params,
                                           const CancellationToken& cancellation) const
{
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (cancellation.isCancelled()) {
            throw OperationCancelledError();
        }

        try {
            ++mRequests;
            const auto resp = mClient.call(method, params);

            if (isRetryableStatus(resp.httpStatus)) {
                ++mRetries;
                auto backoff = computeBackoffMs(attempt);

                if (mVerbose) {
                    std::cerr << "[Retry] HTTP " << resp.httpStatus
                              << " - attempt " << (attempt + 1) << "/"
                              << kMaxAttempts << ", backoff "
                              << backoff.count() << " ms\n";
                }

                if (attempt == kMaxAttempts - 1) {
                    throw TransportError(
                        "Max retries exceeded.  Last HTTP status: " +
                        std::to_string(resp.httpStatus));
                }

                sleepUnlessCancelled(backoff, cancellation);
                continue;
            }

            if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
                // A JSON-RPC error object is reported as such by the mapper.
                if (resp.body.is_object() && resp.body.contains("error")) {
                    return resp.body;
                }
                throw TransportError(method + " failed with HTTP " +
                                     std::to_string(resp.httpStatus));
            }

            return resp.body;

        } catch (const ConnectionError& e) {
            ++mRetries;

            if (mVerbose) {
                std::cerr << "[Retry] Network error: " << e.what()
                          << " - attempt " << (attempt + 1) << "/"
                          << kMaxAttempts << "\n";
            }

            if (attempt == kMaxAttempts - 1) {
                throw ConnectionError(
                    std::string("Max retries exceeded.  Last error: ") +
                    e.what());
            }

            sleepUnlessCancelled(computeBackoffMs(attempt), cancellation);
        }
    }

    throw TransportError("Max retries exceeded (unreachable)");
}

void McpClient::sleepUnlessCancelled(std::chrono::milliseconds delay,
                                     const CancellationToken& cancellation)
{
    constexpr std::chrono::milliseconds kSlice{20};

    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (cancellation.isCancelled()) {
            throw OperationCancelledError();
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
    }
}

bool McpClient::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

} // namespace mcp_pager
