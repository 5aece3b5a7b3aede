#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcp_pager {

/// One batch of a paginated collection as returned by the peer.
/// nextCursor is the raw value: nullopt when absent or null, possibly "".
template <typename T>
struct Page {
    std::vector<T>             items;
    std::optional<std::string> nextCursor;
};

// ---- MCP list items (subset of fields used by the client) ----

struct Tool {
    std::string    name;
    std::string    title;
    std::string    description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool        required = false;
};

struct Prompt {
    std::string                 name;
    std::string                 title;
    std::string                 description;
    std::vector<PromptArgument> arguments;
};

struct Resource {
    std::string uri;           // e.g. "file:///project/README.md"
    std::string name;
    std::string title;
    std::string description;
    std::string mimeType;
};

struct ResourceTemplate {
    std::string uriTemplate;   // RFC 6570, e.g. "file:///{path}"
    std::string name;
    std::string title;
    std::string description;
    std::string mimeType;
};

/// Identity reported by the server in its initialize result.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocolVersion;
};

} // namespace mcp_pager
