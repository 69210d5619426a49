//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Default transport factory mapping descriptor transport kinds onto concrete transports
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcplink/Transport.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/auth/BearerAuth.hpp"
#include "mcplink/transports/ProcessTransport.hpp"
#include "mcplink/transports/SseTransport.hpp"
#include "mcplink/transports/WebSocketTransport.hpp"

namespace mcplink {

std::unique_ptr<ITransport> DefaultTransportFactory::CreateTransport(const ServerDescriptor& desc) {
    FUNC_SCOPE();
    LOG_DEBUG("Creating {} transport for server {}", ToString(desc.transport), desc.id);
    switch (desc.transport) {
        case TransportKind::PushStream:
            return std::make_unique<SseTransport>(desc, auth::MakeAuthProvider(desc.auth));
        case TransportKind::Socket:
            return std::make_unique<WebSocketTransport>(desc, auth::MakeAuthProvider(desc.auth));
        case TransportKind::Command:
            if (desc.auth.mode != AuthMode::None) {
                LOG_WARN("Server {}: auth settings are ignored by the command transport", desc.id);
            }
            return std::make_unique<ProcessTransport>(desc);
        case TransportKind::InMemory:
            break;
    }
    throw std::invalid_argument("Transport kind '" + std::string(ToString(desc.transport)) +
                                "' is not supported by DefaultTransportFactory");
}

} // namespace mcplink
