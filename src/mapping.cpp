#include "mapping.hpp"

namespace mcp_pager {

const nlohmann::json& extractResult(const nlohmann::json& envelope) {
    if (!envelope.is_object()) {
        throw TransportError("JSON-RPC response is not an object");
    }

    if (envelope.contains("error") && envelope["error"].is_object()) {
        const auto& err = envelope["error"];
        int code = err.contains("code") && err["code"].is_number_integer()
                       ? err["code"].get<int>()
                       : 0;
        std::string message = err.contains("message") && err["message"].is_string()
                                  ? err["message"].get<std::string>()
                                  : "Unknown JSON-RPC error";
        throw RpcError(code, message);
    }

    if (!envelope.contains("result")) {
        throw TransportError("JSON-RPC response missing 'result' field");
    }
    return envelope["result"];
}

std::optional<std::string> parseNextCursor(const nlohmann::json& result) {
    if (!result.contains("nextCursor") || result["nextCursor"].is_null()) {
        return std::nullopt;
    }
    if (!result["nextCursor"].is_string()) {
        throw TransportError("'nextCursor' is not a string");
    }
    return result["nextCursor"].get<std::string>();
}

Tool parseTool(const nlohmann::json& node) {
    Tool t;
    t.name        = node.value("name", "");
    t.title       = node.value("title", "");
    t.description = node.value("description", "");
    if (node.contains("inputSchema")) {
        t.inputSchema = node["inputSchema"];
    }
    return t;
}

Prompt parsePrompt(const nlohmann::json& node) {
    Prompt p;
    p.name        = node.value("name", "");
    p.title       = node.value("title", "");
    p.description = node.value("description", "");

    if (node.contains("arguments") && node["arguments"].is_array()) {
        for (const auto& arg : node["arguments"]) {
            PromptArgument a;
            a.name        = arg.value("name", "");
            a.description = arg.value("description", "");
            a.required    = arg.value("required", false);
            p.arguments.push_back(a);
        }
    }
    return p;
}

Resource parseResource(const nlohmann::json& node) {
    Resource r;
    r.uri         = node.value("uri", "");
    r.name        = node.value("name", "");
    r.title       = node.value("title", "");
    r.description = node.value("description", "");
    r.mimeType    = node.value("mimeType", "");
    return r;
}

ResourceTemplate parseResourceTemplate(const nlohmann::json& node) {
    ResourceTemplate r;
    r.uriTemplate = node.value("uriTemplate", "");
    r.name        = node.value("name", "");
    r.title       = node.value("title", "");
    r.description = node.value("description", "");
    r.mimeType    = node.value("mimeType", "");
    return r;
}

ServerInfo parseInitializeResult(const nlohmann::json& result) {
    if (!result.is_object()) {
        throw TransportError("Initialize result is not an object");
    }

    ServerInfo info;
    try {
        info.protocolVersion = result.value("protocolVersion", "");
        if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
            info.name    = result["serverInfo"].value("name", "");
            info.version = result["serverInfo"].value("version", "");
        }
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(std::string("Malformed initialize result: ") + e.what());
    }
    return info;
}

} // namespace mcp_pager
