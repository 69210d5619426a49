//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.cpp
// Purpose: ws/wss client transport using Boost.Beast websocket (TLS via OpenSSL)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/transports/Endpoint.hpp"
#include "mcplink/transports/WebSocketTransport.hpp"
#include "mcplink/version.h"

namespace mcplink {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

class WebSocketTransport::Impl : public std::enable_shared_from_this<WebSocketTransport::Impl> {
public:
    using PlainWs = websocket::stream<beast::tcp_stream>;
    using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    struct Outgoing {
        std::string payload;
        std::promise<std::optional<std::string>> done;
    };

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx;
    std::unique_ptr<PlainWs> plain;
    std::unique_ptr<TlsWs> tls;

    ServerDescriptor desc;
    auth::IAuthPtr auth;
    transports::UrlParts url;
    std::string sessionId;

    std::atomic<bool> started{false};
    std::atomic<bool> open{false};
    std::atomic<bool> closed{false};

    // io thread only
    std::deque<Outgoing> outbox;
    bool writing{false};

    std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::CloseHandler closeHandler;
    ITransport::ErrorHandler errorHandler;

    Impl(const ServerDescriptor& d, auth::IAuthPtr a) : desc(d), auth(std::move(a)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "ws-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stopIo();
    }

    bool stopIo() {
        if (workGuard) {
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
                return false;
            }
            ioThread.join();
        }
        return true;
    }

    void reportError(const std::string& msg) {
        LOG_WARN("WebSocketTransport[{}]: {}", sessionId, msg);
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(msg);
        }
    }

    void deliver(const std::string& raw) {
        if (closed) {
            return;
        }
        ITransport::MessageHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = messageHandler;
        }
        if (h) {
            h(raw);
        }
    }

    void notifyClosed(const std::string& reason) {
        open = false;
        if (closed) {
            return;
        }
        LOG_WARN("WebSocketTransport[{}]: connection lost: {}", sessionId, reason);
        ITransport::CloseHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = closeHandler;
        }
        if (h) {
            h(reason);
        }
    }

    template <class Ws>
    void decorate(Ws& ws) {
        std::vector<auth::HeaderKV> extra;
        for (const auto& [name, value] : desc.headers) {
            extra.push_back(auth::HeaderKV{name, value});
        }
        if (auth) {
            for (auto& h : auth->headers()) {
                extra.push_back(std::move(h));
            }
        }
        ws.set_option(websocket::stream_base::decorator(
            [extra = std::move(extra)](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, getUserAgent());
                for (const auto& h : extra) {
                    req.set(h.name, h.value);
                }
            }));
    }

    template <class Ws>
    net::awaitable<void> coUpgrade(Ws& ws) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        decorate(ws);
        ws.text(true);

        websocket::response_type res;
        boost::system::error_code ec;
        co_await ws.async_handshake(res, transports::HostHeader(url), url.target,
                                    net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            const unsigned status = res.result_int();
            if (status == 401 || status == 403) {
                throw errors::ClientError(errors::ErrorKind::Unauthorized,
                                          "WebSocket upgrade rejected with HTTP " + std::to_string(status));
            }
            throw errors::ClientError(errors::ErrorKind::TransportLost,
                                      "WebSocket upgrade failed: " + ec.message());
        }
    }

    net::awaitable<void> coConnect() {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
        const auto connectTimeout = desc.handshakeTimeout.count() > 0 ? desc.handshakeTimeout
                                                                       : std::chrono::milliseconds(30000);
        if (url.secure) {
            tls = std::make_unique<TlsWs>(ioc, *sslCtx);
            if (!::SSL_set_tlsext_host_name(tls->next_layer().native_handle(), url.host.c_str())) {
                reportError("WSS: failed to set SNI hostname");
            }
            (void)::SSL_set1_host(tls->next_layer().native_handle(), url.host.c_str());
            beast::get_lowest_layer(*tls).expires_after(connectTimeout);
            co_await beast::get_lowest_layer(*tls).async_connect(results, net::use_awaitable);
            co_await tls->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await coUpgrade(*tls);
        } else {
            plain = std::make_unique<PlainWs>(ioc);
            beast::get_lowest_layer(*plain).expires_after(connectTimeout);
            co_await beast::get_lowest_layer(*plain).async_connect(results, net::use_awaitable);
            co_await coUpgrade(*plain);
        }
        open = true;
        LOG_INFO("WebSocketTransport[{}]: connected to {}:{}{}", sessionId, url.host, url.port, url.target);
    }

    template <class Ws>
    net::awaitable<void> coReadLoop(Ws& ws) {
        std::string reason = "websocket closed by server";
        try {
            beast::flat_buffer buffer;
            while (!closed) {
                co_await ws.async_read(buffer, net::use_awaitable);
                deliver(beast::buffers_to_string(buffer.data()));
                buffer.consume(buffer.size());
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() != websocket::error::closed) {
                reason = e.code().message();
            }
        }
        notifyClosed(reason);
    }

    void startReading() {
        std::weak_ptr<Impl> weak = weak_from_this();
        auto onDone = [weak](std::exception_ptr eptr) {
            if (!eptr) {
                return;
            }
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                if (auto impl = weak.lock()) {
                    impl->notifyClosed(e.what());
                }
            }
        };
        if (tls) {
            net::co_spawn(ioc, coReadLoop(*tls), std::move(onDone));
        } else {
            net::co_spawn(ioc, coReadLoop(*plain), std::move(onDone));
        }
    }

    net::awaitable<void> coWriteAll() {
        while (!outbox.empty() && !closed) {
            Outgoing item = std::move(outbox.front());
            outbox.pop_front();
            boost::system::error_code ec;
            if (tls) {
                co_await tls->async_write(net::buffer(item.payload), net::redirect_error(net::use_awaitable, ec));
            } else {
                co_await plain->async_write(net::buffer(item.payload), net::redirect_error(net::use_awaitable, ec));
            }
            if (ec) {
                item.done.set_exception(std::make_exception_ptr(errors::ClientError(
                    errors::ErrorKind::TransportLost, "WebSocket write failed: " + ec.message())));
            } else {
                item.done.set_value(std::nullopt);
            }
        }
        writing = false;
    }

    void enqueue(Outgoing item) {
        if (!open || closed) {
            item.done.set_exception(std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::NotConnected, "WebSocket not open")));
            return;
        }
        outbox.push_back(std::move(item));
        if (writing) {
            return;
        }
        writing = true;
        net::co_spawn(ioc, coWriteAll(), net::detached);
    }

    net::awaitable<void> coGracefulClose() {
        boost::system::error_code ec;
        if (tls) {
            co_await tls->async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
        } else if (plain) {
            co_await plain->async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
        }
        if (ec) {
            LOG_DEBUG("WebSocketTransport[{}]: close handshake: {}", sessionId, ec.message());
        }
    }

    void failOutbox() {
        for (auto& item : outbox) {
            item.done.set_exception(std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::ConnectionClosed, "WebSocket transport closed")));
        }
        outbox.clear();
    }
};

WebSocketTransport::WebSocketTransport(const ServerDescriptor& desc, auth::IAuthPtr auth)
    : pImpl(std::make_shared<Impl>(desc, std::move(auth))) {
    FUNC_SCOPE();
}

WebSocketTransport::~WebSocketTransport() {
    FUNC_SCOPE();
    (void)Close();
}

std::future<void> WebSocketTransport::Start() {
    FUNC_SCOPE();
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->started.exchange(true) || pImpl->closed) {
        ready->set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, "WebSocketTransport cannot be restarted")));
        return fut;
    }
    try {
        pImpl->url = transports::ParseUrl(pImpl->desc.endpoint);
        if (pImpl->url.scheme != "ws" && pImpl->url.scheme != "wss") {
            throw std::invalid_argument("WebSocket endpoint must be ws or wss: " + pImpl->desc.endpoint);
        }
        if (pImpl->url.secure) {
            pImpl->sslCtx = transports::MakeClientTlsContext(pImpl->desc.caFile, pImpl->desc.caPath);
        }
    } catch (const std::exception& e) {
        ready->set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, std::string("WebSocket start failed: ") + e.what())));
        return fut;
    }

    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([self = pImpl]() {
        self->ioc.run();
    });

    std::weak_ptr<Impl> weak = pImpl;
    net::co_spawn(pImpl->ioc, pImpl->coConnect(),
        [weak, ready](std::exception_ptr eptr) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const errors::ClientError&) {
                    ready->set_exception(std::current_exception());
                } catch (const std::exception& e) {
                    ready->set_exception(std::make_exception_ptr(errors::ClientError(
                        errors::ErrorKind::TransportLost, std::string("WebSocket connect failed: ") + e.what())));
                }
                return;
            }
            if (auto impl = weak.lock()) {
                impl->startReading();
            }
            ready->set_value();
        });
    return fut;
}

std::future<void> WebSocketTransport::OpenPushChannel() {
    FUNC_SCOPE();
    std::promise<void> p;
    auto fut = p.get_future();
    if (pImpl->open && !pImpl->closed) {
        p.set_value();
    } else {
        p.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::ChannelOpenFailed, "WebSocket not open")));
    }
    return fut;
}

std::future<void> WebSocketTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->closed.exchange(true)) {
        done.set_value();
        return fut;
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
        pImpl->messageHandler = nullptr;
        pImpl->closeHandler = nullptr;
        pImpl->errorHandler = nullptr;
    }
    const bool onIoThread = pImpl->ioThread.joinable() && pImpl->ioThread.get_id() == std::this_thread::get_id();
    if (pImpl->open && !onIoThread) {
        auto closing = net::co_spawn(pImpl->ioc, pImpl->coGracefulClose(), net::use_future);
        if (closing.wait_for(std::chrono::seconds(1)) != std::future_status::ready) {
            LOG_DEBUG("WebSocketTransport[{}]: close handshake timed out", pImpl->sessionId);
        }
    }
    pImpl->open = false;
    if (pImpl->stopIo()) {
        pImpl->failOutbox();
    }
    LOG_DEBUG("WebSocketTransport[{}]: closed", pImpl->sessionId);
    done.set_value();
    return fut;
}

bool WebSocketTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->open && !pImpl->closed;
}

std::string WebSocketTransport::GetSessionId() const {
    FUNC_SCOPE();
    return pImpl->sessionId;
}

std::future<std::optional<std::string>> WebSocketTransport::Submit(const std::string& payload) {
    FUNC_SCOPE();
    Impl::Outgoing item;
    item.payload = payload;
    auto fut = item.done.get_future();
    if (!pImpl->open || pImpl->closed) {
        item.done.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::NotConnected, "WebSocket not open")));
        return fut;
    }
    std::weak_ptr<Impl> weak = pImpl;
    net::post(pImpl->ioc, [weak, item = std::move(item)]() mutable {
        if (auto impl = weak.lock()) {
            impl->enqueue(std::move(item));
        }
    });
    return fut;
}

void WebSocketTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void WebSocketTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closeHandler = std::move(handler);
}

void WebSocketTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcplink
