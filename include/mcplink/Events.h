//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Events.h
// Purpose: Typed publish/subscribe used by Connection, ConnectionRegistry and ConnectionStore
//==========================================================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "logging/Logger.h"

namespace mcplink {

using SubscriptionId = uint64_t;

//==========================================================================================================
// EventEmitter
// Purpose: Fan-out of one event type to any number of subscribers.
// Notes:
//   - Handlers are invoked in subscription order on the publishing thread, outside the internal lock, so a
//     handler may subscribe, unsubscribe or publish again.
//   - A handler that throws is logged and skipped; remaining handlers still run.
//==========================================================================================================
template <typename TEvent>
class EventEmitter {
public:
    using Handler = std::function<void(const TEvent&)>;

    SubscriptionId Subscribe(Handler handler) {
        std::lock_guard<std::mutex> lk(mutex);
        const SubscriptionId id = ++lastId;
        handlers.emplace(id, std::move(handler));
        return id;
    }

    // Returns false when id was not subscribed.
    bool Unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lk(mutex);
        return handlers.erase(id) > 0;
    }

    void Publish(const TEvent& event) const {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lk(mutex);
            snapshot.reserve(handlers.size());
            for (const auto& [id, h] : handlers) {
                snapshot.push_back(h);
            }
        }
        for (const auto& h : snapshot) {
            try {
                h(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Event handler threw: {}", e.what());
            }
        }
    }

    std::size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lk(mutex);
        return handlers.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lk(mutex);
        handlers.clear();
    }

private:
    mutable std::mutex mutex;
    std::map<SubscriptionId, Handler> handlers;
    SubscriptionId lastId{0};
};

} // namespace mcplink
