#pragma once

#include "errors.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcp_pager {

/// Return the "result" member of a JSON-RPC response envelope.
/// @throws RpcError if the envelope carries an "error" object,
///         TransportError if it carries neither.
const nlohmann::json& extractResult(const nlohmann::json& envelope);

/// Raw next cursor of a list result: nullopt when absent or null.
/// @throws TransportError if present with a non-string value.
std::optional<std::string> parseNextCursor(const nlohmann::json& result);

// ---- single item mappers (missing fields default to empty) ----
Tool             parseTool(const nlohmann::json& node);
Prompt           parsePrompt(const nlohmann::json& node);
Resource         parseResource(const nlohmann::json& node);
ResourceTemplate parseResourceTemplate(const nlohmann::json& node);

/// Map an initialize result into the server's identity.
ServerInfo parseInitializeResult(const nlohmann::json& result);

/// Parse one page of a list response: items from @p itemsField, plus the
/// raw next cursor.
/// @throws RpcError, TransportError if the expected shape is missing.
template <typename T>
Page<T> parseListPage(const nlohmann::json& envelope,
                      const std::string& itemsField,
                      T (*parseItem)(const nlohmann::json&))
{
    const auto& result = extractResult(envelope);
    if (!result.is_object()) {
        throw TransportError("List result is not an object");
    }
    if (!result.contains(itemsField) || !result[itemsField].is_array()) {
        throw TransportError("List result missing '" + itemsField + "' array");
    }

    Page<T> page;
    try {
        for (const auto& node : result[itemsField]) {
            if (!node.is_object()) {
                throw TransportError("Entry in '" + itemsField + "' is not an object");
            }
            page.items.push_back(parseItem(node));
        }
    } catch (const nlohmann::json::exception& e) {
        throw TransportError("Malformed entry in '" + itemsField + "': " + e.what());
    }

    page.nextCursor = parseNextCursor(result);
    return page;
}

} // namespace mcp_pager
