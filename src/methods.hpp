#pragma once

namespace mcp_pager {
namespace methods {

/// MCP revision announced in the initialize request.
inline constexpr const char* kProtocolVersion = "2025-06-18";

inline constexpr const char* kInitialize  = "initialize";
inline constexpr const char* kInitialized = "notifications/initialized";

/// Paginated list methods. Params: {"cursor": String} (omitted on page one).
/// Result: {"<items field>": [...], "nextCursor": String?}
inline constexpr const char* kToolsList             = "tools/list";
inline constexpr const char* kPromptsList           = "prompts/list";
inline constexpr const char* kResourcesList         = "resources/list";
inline constexpr const char* kResourceTemplatesList = "resources/templates/list";

inline constexpr const char* kToolsField             = "tools";
inline constexpr const char* kPromptsField           = "prompts";
inline constexpr const char* kResourcesField         = "resources";
inline constexpr const char* kResourceTemplatesField = "resourceTemplates";

} // namespace methods
} // namespace mcp_pager
