//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Command transport - spawns an MCP server process and speaks newline-delimited JSON over its stdio
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "mcplink/Transport.h"
#include "mcplink/ServerDescriptor.h"

namespace mcplink {

//==========================================================================================================
// ProcessTransport
// Purpose: Runs desc.command with desc.args (PATH lookup) and desc.env layered over the current environment.
// Notes:
//   - The child's stdin is the request channel; each Submit() writes one JSON document plus '\n'.
//   - Each line the child writes to stdout is a pushed message. stderr is inherited.
//   - OpenPushChannel() completes immediately once started.
//   - The child exiting (stdout EOF) is reported through the close handler with its exit status.
//   - Close() closes stdin, then sends SIGTERM and escalates to SIGKILL after the grace period.
//   - POSIX only.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(const ServerDescriptor& desc);
    virtual ~ProcessTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> OpenPushChannel() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<std::optional<std::string>> Submit(const std::string& payload) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Child process id while running, -1 otherwise.
    int GetProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink
