//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and result parsing consumed by the client
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace mcplink {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version announced in initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging/setLevel and notifications/message are supported
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
    std::unordered_map<std::string, JSONValue> experimental;
};

struct ClientCapabilities {
    std::unordered_map<std::string, JSONValue> experimental;
};

//==========================================================================================================
// InitializeResult
// Purpose: Negotiated session parameters returned by the server's initialize reply.
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    ServerCapabilities capabilities;
    Implementation serverInfo;
    std::optional<std::string> instructions;
    JSONValue raw; // full result object as received
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;          // JSON Schema for tool parameters, passed through untouched
    std::optional<JSONValue> annotations;
    std::optional<JSONValue> meta;  // serialized as _meta in tools/list

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    JSONValue raw;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct Prompt {
    std::string name;
    std::string description;
    std::optional<JSONValue> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description,
           std::optional<JSONValue> arguments = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          arguments(std::move(arguments)) {}
};

/////////////////////////////////////// Paged list results /////////////////////////////////////////
struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

struct ResourcesListResult {
    std::vector<Resource> resources;
    std::optional<std::string> nextCursor;
};

struct PromptsListResult {
    std::vector<Prompt> prompts;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* SetLogLevel = "logging/setLevel";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

////////////////////////////////////////// Builders / parsers //////////////////////////////////////////
// initialize params: { protocolVersion, capabilities, clientInfo }
JSONValue BuildInitializeParams(const Implementation& clientInfo, const ClientCapabilities& caps);

// Parse an initialize result; throws std::runtime_error when protocolVersion/serverInfo are missing.
InitializeResult ParseInitializeResult(const JSONValue& result);

// Parse tools/list, resources/list and prompts/list pages. Entries lacking a name are skipped.
ToolsListResult ParseToolsList(const JSONValue& result);
ResourcesListResult ParseResourcesList(const JSONValue& result);
PromptsListResult ParsePromptsList(const JSONValue& result);

// Parse a tools/call result. Missing content yields an empty vector.
CallToolResult ParseCallToolResult(const JSONValue& result);

// Serialize a Tool back into its tools/list wire shape.
JSONValue ToolToJSON(const Tool& tool);

} // namespace mcplink
