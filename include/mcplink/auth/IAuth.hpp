//==========================================================================================================
// SPDX-License-Identifier: MIT 
// Copyright (c) 2025 Vinny Parla
// File: include/mcplink/auth/IAuth.hpp
// Purpose: Credential provider interface consulted by transports for every outgoing request
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mcplink::auth {

struct HeaderKV {
    std::string name;
    std::string value;
};

class IAuth {
public:
    virtual ~IAuth() = default;

    // Return headers to apply to an outgoing request. Called once per submitted message.
    virtual std::vector<HeaderKV> headers() const = 0;

    // Optional diagnostic sink
    virtual void setErrorHandler(std::function<void(const std::string&)> fn) = 0;
};

using IAuthPtr = std::shared_ptr<IAuth>;

} // namespace mcplink::auth
