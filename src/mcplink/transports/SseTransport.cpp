//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseTransport.cpp
// Purpose: HTTP(S) Server-Sent Events client transport using Boost.Beast (TLS via OpenSSL)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/transports/Endpoint.hpp"
#include "mcplink/transports/SseTransport.hpp"
#include "mcplink/version.h"

namespace mcplink {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

////////////////////////////////////////// SseEventParser //////////////////////////////////////////

std::vector<SseEvent> SseEventParser::Feed(std::string_view chunk) {
    std::vector<SseEvent> out;
    buffer.append(chunk.data(), chunk.size());
    std::size_t start = 0;
    for (;;) {
        const std::size_t nl = buffer.find_first_of("\r\n", start);
        if (nl == std::string::npos) {
            break;
        }
        // A lone trailing '\r' may be the first half of "\r\n"; wait for the next chunk.
        if (buffer[nl] == '\r' && nl + 1 == buffer.size()) {
            break;
        }
        processLine(std::string_view(buffer).substr(start, nl - start), out);
        start = nl + 1;
        if (buffer[nl] == '\r' && buffer[start] == '\n') {
            ++start;
        }
    }
    buffer.erase(0, start);
    return out;
}

void SseEventParser::Reset() {
    buffer.clear();
    eventName.clear();
    data.clear();
    lastId.clear();
    haveData = false;
}

void SseEventParser::processLine(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        if (haveData) {
            SseEvent ev;
            if (!eventName.empty()) {
                ev.event = eventName;
            }
            ev.data = std::move(data);
            ev.id = lastId;
            out.push_back(std::move(ev));
        }
        eventName.clear();
        data.clear();
        haveData = false;
        return;
    }
    if (line.front() == ':') {
        return; // comment / keep-alive
    }
    std::string_view field = line;
    std::string_view value;
    const std::size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }
    if (field == "event") {
        eventName.assign(value.data(), value.size());
    } else if (field == "data") {
        if (haveData) {
            data.push_back('\n');
        }
        data.append(value.data(), value.size());
        haveData = true;
    } else if (field == "id") {
        lastId.assign(value.data(), value.size());
    }
    // "retry" and unknown fields are ignored
}

SseEventRoute RouteSseEvent(const SseEvent& ev) {
    if (ev.event == "endpoint") {
        return SseEventRoute::Endpoint;
    }
    if (ev.event == "message" || ev.event == "notification") {
        return SseEventRoute::Deliver;
    }
    return SseEventRoute::Ignore;
}

std::optional<std::string> SettlePostReply(const SsePostReply& reply, std::vector<SseEvent>& streamed) {
    if (reply.status == 401 || reply.status == 403) {
        throw errors::ClientError(errors::ErrorKind::Unauthorized,
                                  "POST rejected with HTTP " + std::to_string(reply.status));
    }
    if (reply.status >= 500) {
        throw errors::ClientError(errors::ErrorKind::TransportLost,
                                  "POST failed with HTTP " + std::to_string(reply.status));
    }
    if (reply.status >= 400) {
        throw errors::ClientError(errors::ErrorKind::InvalidMessage,
                                  "POST rejected with HTTP " + std::to_string(reply.status));
    }
    if (reply.body.empty() || reply.status == 202 || reply.status == 204) {
        return std::nullopt;
    }
    if (reply.contentType.find("text/event-stream") != std::string::npos) {
        SseEventParser local;
        auto events = local.Feed(reply.body);
        auto tail = local.Feed("\n\n");
        streamed.insert(streamed.end(), events.begin(), events.end());
        streamed.insert(streamed.end(), tail.begin(), tail.end());
        return std::nullopt;
    }
    return reply.body;
}

////////////////////////////////////////// Transport //////////////////////////////////////////

class SseTransport::Impl : public std::enable_shared_from_this<SseTransport::Impl> {
public:
    using PostReply = SsePostReply;

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx;

    ServerDescriptor desc;
    auth::IAuthPtr auth;
    transports::UrlParts streamUrl;
    std::string diagId;

    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> streamOpen{false};

    mutable std::mutex stateMutex;
    transports::UrlParts postUrl;
    std::string mcpSessionId;

    std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::CloseHandler closeHandler;
    ITransport::ErrorHandler errorHandler;

    SseEventParser streamParser; // io thread only

    Impl(const ServerDescriptor& d, auth::IAuthPtr a) : desc(d), auth(std::move(a)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        diagId = "sse-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stopIo();
    }

    void start() {
        streamUrl = transports::ParseUrl(desc.endpoint);
        if (streamUrl.scheme != "http" && streamUrl.scheme != "https") {
            throw std::invalid_argument("SSE endpoint must be http or https: " + desc.endpoint);
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            postUrl = streamUrl;
        }
        if (streamUrl.secure) {
            sslCtx = transports::MakeClientTlsContext(desc.caFile, desc.caPath);
        }
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([self = shared_from_this()]() {
            self->ioc.run();
        });
        started = true;
        LOG_INFO("SseTransport[{}]: started for {}:{}{}", diagId, streamUrl.host, streamUrl.port, streamUrl.target);
    }

    void stopIo() {
        if (workGuard) {
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }

    void reportError(const std::string& msg) {
        LOG_WARN("SseTransport[{}]: {}", diagId, msg);
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
        if (closed) {
            return;
        }
        LOG_WARN("SseTransport[{}]: event stream lost: {}", diagId, reason);
        ITransport::CloseHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = closeHandler;
        }
        if (h) {
            h(reason);
        }
    }

    void dispatchEvents(const std::vector<SseEvent>& events) {
        for (const auto& ev : events) {
            const SseEventRoute route = RouteSseEvent(ev);
            if (route == SseEventRoute::Endpoint) {
                std::string ref = ev.data;
                while (!ref.empty() && (ref.back() == ' ' || ref.back() == '\n')) {
                    ref.pop_back();
                }
                try {
                    auto resolved = transports::ResolveReference(streamUrl, ref);
                    std::lock_guard<std::mutex> lk(stateMutex);
                    postUrl = std::move(resolved);
                    LOG_INFO("SseTransport[{}]: message endpoint {}", diagId, postUrl.target);
                } catch (const std::invalid_argument& e) {
                    reportError(std::string("ignoring malformed endpoint event: ") + e.what());
                }
            } else if (route == SseEventRoute::Deliver) {
                deliver(ev.data);
            } else {
                LOG_DEBUG("SseTransport[{}]: ignoring event '{}'", diagId, ev.event);
            }
        }
    }

    template <class Message>
    void applyHeaders(Message& msg) {
        msg.set(http::field::user_agent, getUserAgent());
        for (const auto& [name, value] : desc.headers) {
            msg.set(name, value);
        }
        if (auth) {
            for (const auto& h : auth->headers()) {
                msg.set(h.name, h.value);
            }
        }
        std::lock_guard<std::mutex> lk(stateMutex);
        if (!mcpSessionId.empty()) {
            msg.set("Mcp-Session-Id", mcpSessionId);
        }
    }

    template <class Fields>
    void captureSessionId(const Fields& fields) {
        auto it = fields.find("Mcp-Session-Id");
        if (it != fields.end()) {
            std::lock_guard<std::mutex> lk(stateMutex);
            mcpSessionId = std::string(it->value());
        }
    }

    static void applyExpiry(beast::tcp_stream& s, std::chrono::milliseconds ms) {
        if (ms.count() > 0) {
            s.expires_after(ms);
        } else {
            s.expires_never();
        }
    }

    template <class Stream>
    void setServerName(Stream& stream, const transports::UrlParts& url) {
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            reportError("HTTPS: failed to set SNI hostname");
        }
        (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
    }

    ////////////////////////////////////////// Event stream //////////////////////////////////////////

    template <class Stream>
    net::awaitable<void> coReadEvents(Stream& stream, beast::tcp_stream& lowest,
                                      std::shared_ptr<std::promise<void>> opened, bool& reportedOpen) {
        http::request<http::empty_body> req{http::verb::get, streamUrl.target, 11};
        req.set(http::field::host, transports::HostHeader(streamUrl));
        req.set(http::field::accept, "text/event-stream");
        req.set(http::field::cache_control, "no-cache");
        applyHeaders(req);

        applyExpiry(lowest, desc.channelOpenTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);

        const unsigned status = parser.get().result_int();
        if (status == 401 || status == 403) {
            throw errors::ClientError(errors::ErrorKind::Unauthorized,
                                      "SSE stream rejected with HTTP " + std::to_string(status));
        }
        if (status < 200 || status >= 300) {
            throw errors::ClientError(errors::ErrorKind::ChannelOpenFailed,
                                      "SSE stream open failed with HTTP " + std::to_string(status));
        }
        captureSessionId(parser.get());
        lowest.expires_never();
        streamOpen = true;
        reportedOpen = true;
        opened->set_value();
        LOG_INFO("SseTransport[{}]: event stream open", diagId);

        while (!closed) {
            boost::system::error_code ec;
            co_await http::async_read_some(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            std::string& body = parser.get().body();
            if (!body.empty()) {
                dispatchEvents(streamParser.Feed(body));
                body.clear();
            }
            if (ec == http::error::need_buffer) {
                continue;
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            if (parser.is_done()) {
                co_return;
            }
        }
    }

    net::awaitable<void> coOpenStream(std::shared_ptr<std::promise<void>> opened) {
        bool reportedOpen = false;
        std::string endReason = "event stream ended by server";
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(streamUrl.host, streamUrl.port, net::use_awaitable);
            if (streamUrl.secure) {
                beast::ssl_stream<beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
                setServerName(stream, streamUrl);
                applyExpiry(stream.next_layer(), desc.channelOpenTimeout);
                co_await stream.next_layer().async_connect(results, net::use_awaitable);
                co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
                co_await coReadEvents(stream, stream.next_layer(), opened, reportedOpen);
            } else {
                beast::tcp_stream stream(co_await net::this_coro::executor);
                applyExpiry(stream, desc.channelOpenTimeout);
                co_await stream.async_connect(results, net::use_awaitable);
                co_await coReadEvents(stream, stream, opened, reportedOpen);
            }
        } catch (const errors::ClientError& e) {
            if (!reportedOpen) {
                opened->set_exception(std::current_exception());
            } else {
                endReason = e.what();
            }
        } catch (const std::exception& e) {
            if (!reportedOpen) {
                opened->set_exception(std::make_exception_ptr(errors::ClientError(
                    errors::ErrorKind::ChannelOpenFailed, std::string("SSE stream open failed: ") + e.what())));
            } else {
                endReason = e.what();
            }
        }
        streamOpen = false;
        if (reportedOpen) {
            notifyClosed(endReason);
        }
    }

    ////////////////////////////////////////// Submission //////////////////////////////////////////

    template <class Stream>
    net::awaitable<PostReply> coExchange(Stream& stream, http::request<http::string_body>& req) {
        co_await http::async_write(stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        captureSessionId(res);
        PostReply reply;
        reply.status = res.result_int();
        reply.contentType = std::string(res[http::field::content_type]);
        reply.body = std::move(res.body());
        co_return reply;
    }

    net::awaitable<PostReply> coPost(transports::UrlParts url, std::string payload) {
        http::request<http::string_body> req{http::verb::post, url.target, 11};
        req.set(http::field::host, transports::HostHeader(url));
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::connection, "close");
        applyHeaders(req);
        req.body() = std::move(payload);
        req.prepare_payload();

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
        if (url.secure) {
            if (!sslCtx) {
                sslCtx = transports::MakeClientTlsContext(desc.caFile, desc.caPath);
            }
            beast::ssl_stream<beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            setServerName(stream, url);
            applyExpiry(stream.next_layer(), desc.requestTimeout);
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            PostReply reply = co_await coExchange(stream, req);
            boost::system::error_code ec;
            stream.shutdown(ec);
            co_return reply;
        }
        beast::tcp_stream stream(co_await net::this_coro::executor);
        applyExpiry(stream, desc.requestTimeout);
        co_await stream.async_connect(results, net::use_awaitable);
        PostReply reply = co_await coExchange(stream, req);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return reply;
    }

    std::optional<std::string> settleReply(const PostReply& reply) {
        std::vector<SseEvent> streamed;
        auto ack = SettlePostReply(reply, streamed);
        dispatchEvents(streamed);
        return ack;
    }
};

SseTransport::SseTransport(const ServerDescriptor& desc, auth::IAuthPtr auth)
    : pImpl(std::make_shared<Impl>(desc, std::move(auth))) {
    FUNC_SCOPE();
}

SseTransport::~SseTransport() {
    FUNC_SCOPE();
    (void)Close();
}

std::future<void> SseTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started || pImpl->closed) {
        ready.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, "SseTransport cannot be restarted")));
        return fut;
    }
    try {
        pImpl->start();
        ready.set_value();
    } catch (const std::exception& e) {
        ready.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, std::string("SSE start failed: ") + e.what())));
    }
    return fut;
}

std::future<void> SseTransport::OpenPushChannel() {
    FUNC_SCOPE();
    auto opened = std::make_shared<std::promise<void>>();
    auto fut = opened->get_future();
    if (!pImpl->started || pImpl->closed) {
        opened->set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::NotConnected, "SseTransport not started")));
        return fut;
    }
    // Completion handlers hold the Impl weakly; the io_context they are queued on belongs to it.
    std::weak_ptr<Impl> weak = pImpl;
    net::co_spawn(pImpl->ioc, pImpl->coOpenStream(opened),
        [weak](std::exception_ptr eptr) {
            if (!eptr) {
                return;
            }
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                if (auto impl = weak.lock()) {
                    impl->reportError(std::string("event stream coroutine failed: ") + e.what());
                } else {
                    LOG_DEBUG("SseTransport: event stream coroutine failed after release: {}", e.what());
                }
            }
        });
    return fut;
}

std::future<void> SseTransport::Close() {
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
    pImpl->stopIo();
    LOG_DEBUG("SseTransport[{}]: closed", pImpl->diagId);
    done.set_value();
    return fut;
}

bool SseTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->started && !pImpl->closed;
}

std::string SseTransport::GetSessionId() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->mcpSessionId.empty() ? pImpl->diagId : pImpl->mcpSessionId;
}

std::future<std::optional<std::string>> SseTransport::Submit(const std::string& payload) {
    FUNC_SCOPE();
    std::promise<std::optional<std::string>> ack;
    auto fut = ack.get_future();
    if (!pImpl->started || pImpl->closed) {
        ack.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::NotConnected, "SseTransport not connected")));
        return fut;
    }
    transports::UrlParts target;
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        target = pImpl->postUrl;
    }
    std::weak_ptr<Impl> weak = pImpl;
    net::co_spawn(pImpl->ioc, pImpl->coPost(std::move(target), payload),
        [weak, pr = std::move(ack)](std::exception_ptr eptr, Impl::PostReply reply) mutable {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const errors::ClientError&) {
                    pr.set_exception(std::current_exception());
                } catch (const std::exception& e) {
                    pr.set_exception(std::make_exception_ptr(errors::ClientError(
                        errors::ErrorKind::TransportLost, std::string("POST failed: ") + e.what())));
                }
                return;
            }
            auto impl = weak.lock();
            if (!impl) {
                pr.set_exception(std::make_exception_ptr(
                    errors::ClientError(errors::ErrorKind::ConnectionClosed, "SseTransport released")));
                return;
            }
            try {
                pr.set_value(impl->settleReply(reply));
            } catch (const errors::ClientError&) {
                pr.set_exception(std::current_exception());
            }
        });
    return fut;
}

void SseTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void SseTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closeHandler = std::move(handler);
}

void SseTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcplink
