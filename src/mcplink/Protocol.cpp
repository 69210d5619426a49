//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Builders and parsers for MCP handshake, listing and tool-call payloads
//==========================================================================================================

#include "mcplink/Protocol.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace mcplink {

namespace {
std::optional<std::string> cursorOf(const JSONValue& result) {
    const JSONValue* cur = result.Find("nextCursor");
    if (!cur) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&cur->value)) {
        if (s->empty()) return std::nullopt;
        return *s;
    }
    if (const auto* n = std::get_if<int64_t>(&cur->value)) return std::to_string(*n);
    return std::nullopt;
}

const JSONValue::Array* arrayOf(const JSONValue& result, const char* key) {
    const JSONValue* v = result.Find(key);
    if (!v) return nullptr;
    return std::get_if<JSONValue::Array>(&v->value);
}

ServerCapabilities parseServerCapabilities(const JSONValue& capsVal) {
    ServerCapabilities caps;
    if (!capsVal.IsObject()) {
        return caps;
    }
    if (const JSONValue* t = capsVal.Find("tools")) {
        caps.tools = ToolsCapability{GetBool(*t, "listChanged").value_or(false)};
    }
    if (const JSONValue* r = capsVal.Find("resources")) {
        caps.resources = ResourcesCapability{GetBool(*r, "subscribe").value_or(false),
                                             GetBool(*r, "listChanged").value_or(false)};
    }
    if (const JSONValue* p = capsVal.Find("prompts")) {
        caps.prompts = PromptsCapability{GetBool(*p, "listChanged").value_or(false)};
    }
    if (capsVal.Find("logging")) {
        caps.logging = LoggingCapability{};
    }
    if (const JSONValue* exp = capsVal.Find("experimental")) {
        if (const auto* o = std::get_if<JSONValue::Object>(&exp->value)) {
            for (const auto& [k, v] : *o) {
                if (v) caps.experimental[k] = *v;
            }
        }
    }
    return caps;
}
} // namespace

JSONValue BuildInitializeParams(const Implementation& clientInfo, const ClientCapabilities& caps) {
    JSONValue::Object capsObj;
    if (!caps.experimental.empty()) {
        JSONValue::Object expObj;
        for (const auto& [k, v] : caps.experimental) {
            expObj[k] = std::make_shared<JSONValue>(v);
        }
        capsObj["experimental"] = std::make_shared<JSONValue>(std::move(expObj));
    }

    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(clientInfo.name);
    info["version"] = std::make_shared<JSONValue>(clientInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    params["capabilities"] = std::make_shared<JSONValue>(std::move(capsObj));
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));
    return JSONValue{std::move(params)};
}

InitializeResult ParseInitializeResult(const JSONValue& result) {
    if (!result.IsObject()) {
        throw std::runtime_error("initialize result is not an object");
    }
    InitializeResult out;
    auto version = GetString(result, "protocolVersion");
    if (!version) {
        throw std::runtime_error("initialize result lacks protocolVersion");
    }
    out.protocolVersion = *version;
    if (const JSONValue* caps = result.Find("capabilities")) {
        out.capabilities = parseServerCapabilities(*caps);
    }
    if (const JSONValue* info = result.Find("serverInfo")) {
        out.serverInfo.name = GetString(*info, "name").value_or("");
        out.serverInfo.version = GetString(*info, "version").value_or("");
    }
    out.instructions = GetString(result, "instructions");
    out.raw = result;
    if (out.protocolVersion != PROTOCOL_VERSION) {
        LOG_INFO("Server negotiated protocol version {} (client offered {})", out.protocolVersion, PROTOCOL_VERSION);
    }
    return out;
}

ToolsListResult ParseToolsList(const JSONValue& result) {
    ToolsListResult out;
    if (const auto* arr = arrayOf(result, "tools")) {
        for (const auto& itemPtr : *arr) {
            if (!itemPtr || !itemPtr->IsObject()) continue;
            auto name = GetString(*itemPtr, "name");
            if (!name) {
                LOG_WARN("Skipping tools/list entry without a name");
                continue;
            }
            Tool tool;
            tool.name = *name;
            tool.description = GetString(*itemPtr, "description").value_or("");
            if (const JSONValue* schema = itemPtr->Find("inputSchema")) tool.inputSchema = *schema;
            if (const JSONValue* ann = itemPtr->Find("annotations")) tool.annotations = *ann;
            if (const JSONValue* meta = itemPtr->Find("_meta")) tool.meta = *meta;
            out.tools.push_back(std::move(tool));
        }
    }
    out.nextCursor = cursorOf(result);
    return out;
}

ResourcesListResult ParseResourcesList(const JSONValue& result) {
    ResourcesListResult out;
    if (const auto* arr = arrayOf(result, "resources")) {
        for (const auto& itemPtr : *arr) {
            if (!itemPtr || !itemPtr->IsObject()) continue;
            auto uri = GetString(*itemPtr, "uri");
            if (!uri) continue;
            out.resources.emplace_back(*uri, GetString(*itemPtr, "name").value_or(""),
                                       GetString(*itemPtr, "description"),
                                       GetString(*itemPtr, "mimeType"));
        }
    }
    out.nextCursor = cursorOf(result);
    return out;
}

PromptsListResult ParsePromptsList(const JSONValue& result) {
    PromptsListResult out;
    if (const auto* arr = arrayOf(result, "prompts")) {
        for (const auto& itemPtr : *arr) {
            if (!itemPtr || !itemPtr->IsObject()) continue;
            auto name = GetString(*itemPtr, "name");
            if (!name) continue;
            std::optional<JSONValue> args;
            if (const JSONValue* a = itemPtr->Find("arguments")) args = *a;
            out.prompts.emplace_back(*name, GetString(*itemPtr, "description").value_or(""), std::move(args));
        }
    }
    out.nextCursor = cursorOf(result);
    return out;
}

CallToolResult ParseCallToolResult(const JSONValue& result) {
    CallToolResult out;
    if (const auto* arr = arrayOf(result, "content")) {
        for (const auto& itemPtr : *arr) {
            if (itemPtr) out.content.push_back(*itemPtr);
        }
    }
    out.isError = GetBool(result, "isError").value_or(false);
    out.raw = result;
    return out;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    if (tool.annotations.has_value()) {
        obj["annotations"] = std::make_shared<JSONValue>(tool.annotations.value());
    }
    if (tool.meta.has_value()) {
        obj["_meta"] = std::make_shared<JSONValue>(tool.meta.value());
    }
    return JSONValue{std::move(obj)};
}

} // namespace mcplink
