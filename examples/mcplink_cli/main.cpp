//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcplink command-line client: connect to one server, list its tools and optionally call one
//==========================================================================================================

#include "logging/Logger.h"
#include "mcplink/ConnectionRegistry.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/version.h"
#include <chrono>
#include <iostream>

using namespace mcplink;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << getUserAgent() << "\n"
              << "Usage: mcplink_cli --server=\"id=s1; transport=sse; endpoint=https://host/sse\" [options]\n"
              << "  --tool=NAME         call a tool after listing\n"
              << "  --args=JSON         tool arguments (default {})\n"
              << "  --timeout-ms=N      wait for connect and calls (default 30000)\n"
              << "  --logs              print the protocol log ring before exiting\n"
              << "Descriptor keys are those accepted by ParseServerDescriptor (transport sse|ws|command).\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnv();

    auto serverCfg = getArgValue(argc, argv, "--server");
    if (!serverCfg || hasFlag(argc, argv, "--help")) {
        printUsage();
        return serverCfg ? 0 : 2;
    }

    ServerDescriptor desc;
    JSONValue arguments{JSONValue::Object{}};
    std::chrono::milliseconds timeout{30000};
    try {
        desc = ParseServerDescriptor(*serverCfg);
        if (auto raw = getArgValue(argc, argv, "--args")) {
            arguments = ParseJSON(*raw);
        }
        if (auto t = getArgValue(argc, argv, "--timeout-ms")) {
            timeout = std::chrono::milliseconds(std::stoll(*t));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid arguments: {}", e.what());
        return 2;
    }

    ConnectionRegistry registry;
    registry.Events().Subscribe([](const RegistryEvent& ev) {
        if (ev.kind == RegistryEventKind::ServerStateChanged && ev.status) {
            LOG_INFO("[{}] {}", ev.serverId, ToString(ev.status->state));
        }
    });

    int rc = 0;
    try {
        registry.AddServer(desc);
        auto connected = registry.ConnectServer(desc.id);
        if (connected.wait_for(timeout) != std::future_status::ready) {
            LOG_ERROR("Timed out connecting to {}", desc.Label());
            return 1;
        }
        connected.get();

        auto status = registry.GetServerStatus(desc.id);
        if (status.initializeResult) {
            LOG_INFO("Connected to {} {} (protocol {})", status.initializeResult->serverInfo.name,
                     status.initializeResult->serverInfo.version, status.initializeResult->protocolVersion);
        }

        auto tools = registry.ListTools(desc.id).get();
        for (const auto& t : tools) {
            std::cout << t.name << "\t" << t.description << "\n";
        }

        if (auto toolName = getArgValue(argc, argv, "--tool")) {
            auto exec = registry.ExecuteTool(desc.id, *toolName, arguments).get();
            std::cout << "execution " << exec.id << ": " << ToString(exec.status);
            if (exec.durationMs) {
                std::cout << " in " << *exec.durationMs << " ms";
            }
            std::cout << "\n";
            if (exec.result) {
                std::cout << SerializeJSON(*exec.result) << "\n";
            }
            if (exec.error) {
                std::cout << errors::ToString(exec.error->kind) << ": " << exec.error->message << "\n";
                rc = 1;
            }
        }
    } catch (const errors::ClientError& e) {
        LOG_ERROR("{}: {}", errors::ToString(e.kind()), e.what());
        rc = 1;
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        rc = 1;
    }

    if (hasFlag(argc, argv, "--logs")) {
        for (const auto& entry : registry.GetLogs(desc.id)) {
            std::cout << "#" << entry.id << " [" << ToString(entry.level) << "]";
            if (entry.direction) {
                std::cout << " (" << ToString(*entry.direction) << ")";
            }
            std::cout << " " << entry.message << "\n";
        }
    }

    (void)registry.DisconnectServer(desc.id).wait_for(std::chrono::seconds(2));
    return rc;
}
