//==========================================================================================================
// SPDX-License-Identifier: MIT 
// File: include/mcplink/auth/BearerAuth.hpp
// Purpose: Static token auth implementing IAuth ("<tokenType> <token>" Authorization header)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <functional>

#include "mcplink/auth/IAuth.hpp"
#include "mcplink/ServerDescriptor.h"

namespace mcplink::auth {

class BearerAuth final : public IAuth {
public:
    explicit BearerAuth(std::string token, std::string tokenType = "Bearer")
        : token(std::move(token)), tokenType(std::move(tokenType)) {}

    std::vector<HeaderKV> headers() const override {
        if (token.empty()) return {};
        const std::string scheme = tokenType.empty() ? std::string("Bearer") : tokenType;
        return { HeaderKV{ "Authorization", scheme + " " + token } };
    }

    void setErrorHandler(std::function<void(const std::string&)> fn) override {
        (void)fn; // no-op for static tokens
    }

private:
    std::string token;
    std::string tokenType;
};

using BearerAuthPtr = std::shared_ptr<BearerAuth>;

// Provider for a descriptor's auth block: nullptr for AuthMode::None, a BearerAuth otherwise (OAuth2 tokens
// are obtained by the caller and presented as-is).
inline IAuthPtr MakeAuthProvider(const AuthConfig& cfg) {
    if (cfg.mode == AuthMode::None || cfg.accessToken.empty()) {
        return nullptr;
    }
    return std::make_shared<BearerAuth>(cfg.accessToken, cfg.tokenType);
}

} // namespace mcplink::auth
