//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Endpoint.cpp
// Purpose: URL splitting and TLS client context setup shared by the network transports
//==========================================================================================================

#include <cctype>
#include <stdexcept>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "logging/Logger.h"
#include "mcplink/transports/Endpoint.hpp"

namespace mcplink::transports {

namespace {
std::string defaultPort(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") {
        return "443";
    }
    return "80";
}
} // namespace

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("URL requires a scheme: " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parts.scheme != "http" && parts.scheme != "https" && parts.scheme != "ws" && parts.scheme != "wss") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }
    parts.secure = (parts.scheme == "https" || parts.scheme == "wss");

    const std::size_t pos = schemeEnd + 3;
    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target[0] == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // Drop userinfo; credentials travel through the auth provider.
    const std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort[0] == '[') {
        const std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 literal in URL: " + url);
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            parts.port = hostPort.substr(close + 2);
        }
    } else {
        const std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("URL requires a host: " + url);
    }
    if (parts.port.empty()) {
        parts.port = defaultPort(parts.scheme);
    }
    return parts;
}

UrlParts ResolveReference(const UrlParts& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return ParseUrl(reference);
    }
    UrlParts out = base;
    if (reference.empty()) {
        return out;
    }
    if (reference[0] == '/') {
        out.target = reference;
        return out;
    }
    std::string dir = base.target;
    const std::size_t q = dir.find('?');
    if (q != std::string::npos) {
        dir.erase(q);
    }
    const std::size_t lastSlash = dir.rfind('/');
    dir = (lastSlash == std::string::npos) ? std::string("/") : dir.substr(0, lastSlash + 1);
    out.target = dir + reference;
    return out;
}

std::string HostHeader(const UrlParts& url) {
    const bool ipv6 = url.host.find(':') != std::string::npos;
    std::string host = ipv6 ? "[" + url.host + "]" : url.host;
    if (url.port != defaultPort(url.scheme)) {
        host += ":" + url.port;
    }
    return host;
}

std::unique_ptr<boost::asio::ssl::context> MakeClientTlsContext(const std::string& caFile, const std::string& caPath) {
    namespace ssl = boost::asio::ssl;
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION);
    ::ERR_clear_error();
    if (!caFile.empty() || !caPath.empty()) {
        if (!caFile.empty()) {
            ctx->load_verify_file(caFile);
        }
        if (!caPath.empty()) {
            ctx->add_verify_path(caPath);
        }
    } else {
        boost::system::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            LOG_WARN("TLS: set_default_verify_paths failed: {}", ec.message());
        }
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

} // namespace mcplink::transports
