//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcCodec.cpp
// Purpose: Default implementation for JSON-RPC frame decoding
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcplink/JsonRpcCodec.h"

namespace mcplink {

namespace {
std::optional<JSONRPCId> idOf(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) return JSONRPCId{*s};
    if (const auto* n = std::get_if<int64_t>(&v.value)) return JSONRPCId{*n};
    if (v.IsNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

DecodedMessage invalid(std::string why) {
    DecodedMessage out;
    out.kind = MessageKind::Invalid;
    out.error = std::move(why);
    return out;
}
} // namespace

const char* ToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Response: return "response";
        case MessageKind::Request: return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Invalid: return "invalid";
    }
    return "invalid";
}

DecodedMessage DecodeMessage(const std::string& raw) {
    FUNC_SCOPE();
    JSONValue root;
    try {
        root = ParseJSON(raw);
    } catch (const std::exception& e) {
        return invalid(std::string("Parse error: ") + e.what());
    }
    if (!root.IsObject()) {
        return invalid("JSON-RPC message is not an object");
    }

    const JSONValue* idVal = root.Find("id");
    const JSONValue* methodVal = root.Find("method");
    const JSONValue* resultVal = root.Find("result");
    const JSONValue* errorVal = root.Find("error");

    // Response fast-path: id plus result or error
    if (idVal && (resultVal || errorVal)) {
        auto id = idOf(*idVal);
        if (!id) {
            return invalid("Response id has unsupported type");
        }
        DecodedMessage out;
        out.kind = MessageKind::Response;
        JSONRPCResponse resp;
        resp.id = std::move(*id);
        if (errorVal) {
            resp.error = *errorVal;
        } else {
            resp.result = *resultVal;
        }
        out.response = std::move(resp);
        return out;
    }

    if (methodVal) {
        const auto* method = std::get_if<std::string>(&methodVal->value);
        if (!method || method->empty()) {
            return invalid("method must be a non-empty string");
        }
        std::optional<JSONValue> params;
        if (const JSONValue* p = root.Find("params")) {
            params = *p;
        }
        if (idVal) {
            auto id = idOf(*idVal);
            if (!id) {
                return invalid("Request id has unsupported type");
            }
            DecodedMessage out;
            out.kind = MessageKind::Request;
            out.request = JSONRPCRequest(std::move(*id), *method, std::move(params));
            return out;
        }
        DecodedMessage out;
        out.kind = MessageKind::Notification;
        out.notification = JSONRPCNotification(*method, std::move(params));
        return out;
    }

    return invalid("Message has neither method nor result/error");
}

} // namespace mcplink
