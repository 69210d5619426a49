//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Endpoint.hpp
// Purpose: URL splitting and TLS client context setup shared by the network transports
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>

namespace mcplink::transports {

//==========================================================================================================
// UrlParts
// Purpose: Pieces of an http(s)/ws(s) URL needed to open a connection and address a request.
//==========================================================================================================
struct UrlParts {
    std::string scheme;     // lower-case: http, https, ws, wss
    std::string host;
    std::string port;
    std::string target{"/"}; // path + query
    bool secure{false};
};

//==========================================================================================================
// ParseUrl
// Purpose: Splits scheme://host[:port]/target. The port defaults from the scheme; IPv6 literals in brackets
//          are accepted.
// Throws:
//   std::invalid_argument when the scheme is missing or unsupported, or the host is empty.
//==========================================================================================================
UrlParts ParseUrl(const std::string& url);

// Resolves a reference (absolute URL, absolute path or relative path) against a base URL.
UrlParts ResolveReference(const UrlParts& base, const std::string& reference);

// Host header value: host plus the port when it differs from the scheme default.
std::string HostHeader(const UrlParts& url);

//==========================================================================================================
// MakeClientTlsContext
// Purpose: TLS client context (TLS 1.2 minimum) that verifies the peer against the user CA file/path or the
//          system default verify paths.
// Throws:
//   boost::system::system_error when a user-provided CA file/path cannot be loaded.
//==========================================================================================================
std::unique_ptr<boost::asio::ssl::context> MakeClientTlsContext(const std::string& caFile, const std::string& caPath);

} // namespace mcplink::transports
