//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport over POSIX pipes (fork/execvp, poll-driven stdout reader)
//==========================================================================================================

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>
#include <optional>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/transports/ProcessTransport.hpp"

extern char** environ;

namespace mcplink {

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a pipe whose reader has exited must surface as EPIPE, not terminate the client.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction current{};
        if (::sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL) {
            ::signal(SIGPIPE, SIG_IGN);
        }
    });
}

std::string describeStatus(int status) {
    if (WIFEXITED(status)) {
        return "process exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "process killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "process terminated";
}
} // namespace

class ProcessTransport::Impl {
public:
    ServerDescriptor desc;
    std::atomic<int> pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int wakePipe[2]{-1, -1};
    std::thread readerThread;
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> started{false};

    std::mutex writeMutex;
    std::mutex reapMutex;
    std::optional<int> exitStatus;

    std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::CloseHandler closeHandler;
    ITransport::ErrorHandler errorHandler;

    std::size_t maxLineBytes;
    std::chrono::milliseconds termGrace;

    explicit Impl(const ServerDescriptor& d) : desc(d) {
        maxLineBytes = static_cast<std::size_t>(GetEnvUInt64OrDefault("MCPLINK_PROCESS_MAX_LINE_BYTES", 16u * 1024u * 1024u));
        termGrace = std::chrono::milliseconds(GetEnvUInt64OrDefault("MCPLINK_PROCESS_TERM_GRACE_MS", 2000));
    }

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(wakePipe[0]);
        closeFd(wakePipe[1]);
    }

    std::string label() const {
        return desc.command + "[" + std::to_string(pid.load()) + "]";
    }

    void reportError(const std::string& msg) {
        LOG_WARN("ProcessTransport {}: {}", label(), msg);
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(msg);
        }
    }

    void deliver(const std::string& line) {
        if (closed) {
            return;
        }
        ITransport::MessageHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = messageHandler;
        }
        if (h) {
            h(line);
        }
    }

    ////////////////////////////////////////// Spawn //////////////////////////////////////////
    void spawn() {
        ignoreSigpipeOnce();

        // Everything the child touches is prepared before fork().
        std::vector<std::string> argvStore;
        argvStore.push_back(desc.command);
        for (const auto& a : desc.args) {
            argvStore.push_back(a);
        }
        std::vector<char*> argv;
        for (auto& a : argvStore) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        std::vector<std::string> envStore;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string entry(*e);
            const std::string name = entry.substr(0, entry.find('='));
            if (desc.env.find(name) == desc.env.end()) {
                envStore.push_back(std::move(entry));
            }
        }
        for (const auto& [name, value] : desc.env) {
            envStore.push_back(name + "=" + value);
        }
        std::vector<char*> envp;
        for (auto& e : envStore) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int statusPipe[2]{-1, -1};
        auto closeAll = [&]() {
            closeFd(inPipe[0]); closeFd(inPipe[1]);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            const int err = errno;
            closeAll();
            throw errors::ClientError(errors::ErrorKind::TransportLost,
                                      std::string("pipe creation failed: ") + ::strerror(err));
        }

        const pid_t child = ::fork();
        if (child < 0) {
            const int err = errno;
            closeAll();
            throw errors::ClientError(errors::ErrorKind::TransportLost, std::string("fork failed: ") + ::strerror(err));
        }
        if (child == 0) {
            // dup2 clears FD_CLOEXEC on the targets; the originals close on exec.
            if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0) {
                const int err = errno;
                (void)!::write(statusPipe[1], &err, sizeof(err));
                ::_exit(127);
            }
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            const int err = errno;
            (void)!::write(statusPipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(statusPipe[1]);

        // The status pipe closes on a successful exec; otherwise it carries the child's errno.
        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int status = 0;
            (void)::waitpid(child, &status, 0);
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            throw errors::ClientError(errors::ErrorKind::TransportLost,
                                      "failed to execute '" + desc.command + "': " + ::strerror(childErr));
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        const int fl = ::fcntl(stdoutFd, F_GETFL, 0);
        if (fl >= 0) {
            (void)::fcntl(stdoutFd, F_SETFL, fl | O_NONBLOCK);
        }
        if (::pipe2(wakePipe, O_CLOEXEC | O_NONBLOCK) != 0) {
            LOG_ERROR("ProcessTransport: failed to create wake pipe (errno={} msg={})", errno, ::strerror(errno));
        }
        LOG_INFO("ProcessTransport: started {} with {} argument(s)", label(), desc.args.size());
    }

    ////////////////////////////////////////// Reader //////////////////////////////////////////
    void readerLoop() {
        std::string pending;
        std::vector<char> chunk(64 * 1024);
        std::string reason = "process closed stdout";
        bool stopRequested = false;
        for (;;) {
            pollfd pfds[2];
            nfds_t nfds = 1;
            pfds[0].fd = stdoutFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            if (wakePipe[0] >= 0) {
                pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0;
                nfds = 2;
            }
            const int rc = ::poll(pfds, nfds, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                reason = std::string("poll failed: ") + ::strerror(errno);
                break;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                stopRequested = true;
                break;
            }
            if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t n = ::read(stdoutFd, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                reason = std::string("read failed: ") + ::strerror(errno);
                break;
            }
            if (n == 0) {
                break; // EOF
            }
            pending.append(chunk.data(), static_cast<std::size_t>(n));
            std::size_t start = 0;
            for (;;) {
                const std::size_t nl = pending.find('\n', start);
                if (nl == std::string::npos) {
                    break;
                }
                std::string line = pending.substr(start, nl - start);
                start = nl + 1;
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    deliver(line);
                }
            }
            pending.erase(0, start);
            if (pending.size() > maxLineBytes) {
                reportError("stdout line exceeds " + std::to_string(maxLineBytes) + " bytes; discarding");
                pending.clear();
            }
        }
        connected = false;
        if (stopRequested || closed) {
            return;
        }
        if (auto status = reap(std::chrono::milliseconds(200))) {
            reason = describeStatus(*status);
        }
        LOG_WARN("ProcessTransport {}: {}", label(), reason);
        ITransport::CloseHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = closeHandler;
        }
        if (h && !closed) {
            h(reason);
        }
    }

    // Waits up to `wait` for the child to exit. Returns its status once reaped.
    std::optional<int> reap(std::chrono::milliseconds wait) {
        std::lock_guard<std::mutex> lk(reapMutex);
        if (exitStatus) {
            return exitStatus;
        }
        const int child = pid.load();
        if (child <= 0) {
            return std::nullopt;
        }
        const auto deadline = std::chrono::steady_clock::now() + wait;
        for (;;) {
            int status = 0;
            const pid_t r = ::waitpid(child, &status, WNOHANG);
            if (r == child) {
                exitStatus = status;
                return exitStatus;
            }
            if (r < 0 && errno != EINTR) {
                return std::nullopt;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    void terminateChild() {
        const int child = pid.load();
        if (child <= 0 || reap(std::chrono::milliseconds(0))) {
            return;
        }
        LOG_DEBUG("ProcessTransport {}: sending SIGTERM", label());
        ::kill(child, SIGTERM);
        if (reap(termGrace)) {
            return;
        }
        LOG_WARN("ProcessTransport {}: did not exit after SIGTERM, sending SIGKILL", label());
        ::kill(child, SIGKILL);
        int status = 0;
        if (::waitpid(child, &status, 0) == child) {
            std::lock_guard<std::mutex> lk(reapMutex);
            exitStatus = status;
        }
    }

    void wakeReader() {
        if (wakePipe[1] >= 0) {
            const char b = 'x';
            ssize_t wr;
            do {
                wr = ::write(wakePipe[1], &b, 1);
            } while (wr < 0 && errno == EINTR);
        }
    }
};

ProcessTransport::ProcessTransport(const ServerDescriptor& desc) : pImpl(std::make_unique<Impl>(desc)) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    (void)Close();
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started.exchange(true) || pImpl->closed) {
        ready.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, "ProcessTransport cannot be restarted")));
        return fut;
    }
    try {
        pImpl->spawn();
    } catch (const errors::ClientError& e) {
        LOG_ERROR("ProcessTransport: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->connected = true;
    pImpl->readerThread = std::thread([impl = pImpl.get()]() { impl->readerLoop(); });
    ready.set_value();
    return fut;
}

std::future<void> ProcessTransport::OpenPushChannel() {
    FUNC_SCOPE();
    std::promise<void> p;
    auto fut = p.get_future();
    if (pImpl->connected && !pImpl->closed) {
        p.set_value();
    } else {
        p.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::ChannelOpenFailed, "process is not running")));
    }
    return fut;
}

std::future<void> ProcessTransport::Close() {
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
    pImpl->connected = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        closeFd(pImpl->stdinFd);
    }
    pImpl->wakeReader();
    if (pImpl->readerThread.joinable()) {
        if (pImpl->readerThread.get_id() == std::this_thread::get_id()) {
            pImpl->readerThread.detach();
        } else {
            pImpl->readerThread.join();
        }
    }
    pImpl->terminateChild();
    LOG_DEBUG("ProcessTransport {}: closed", pImpl->label());
    pImpl->pid = -1;
    done.set_value();
    return fut;
}

bool ProcessTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->connected && !pImpl->closed;
}

std::string ProcessTransport::GetSessionId() const {
    FUNC_SCOPE();
    return "process-" + std::to_string(pImpl->pid.load());
}

int ProcessTransport::GetProcessId() const {
    return pImpl->pid.load();
}

std::future<std::optional<std::string>> ProcessTransport::Submit(const std::string& payload) {
    FUNC_SCOPE();
    std::promise<std::optional<std::string>> ack;
    auto fut = ack.get_future();
    if (!pImpl->connected || pImpl->closed) {
        ack.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::NotConnected, "process is not running")));
        return fut;
    }
    std::string frame = payload;
    frame.push_back('\n');
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    std::size_t off = 0;
    while (off < frame.size()) {
        if (pImpl->stdinFd < 0) {
            ack.set_exception(std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::ConnectionClosed, "process stdin closed")));
            return fut;
        }
        const ssize_t n = ::write(pImpl->stdinFd, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            pImpl->reportError(std::string("stdin write failed: ") + ::strerror(err));
            ack.set_exception(std::make_exception_ptr(errors::ClientError(
                errors::ErrorKind::TransportLost, std::string("process stdin write failed: ") + ::strerror(err))));
            return fut;
        }
        off += static_cast<std::size_t>(n);
    }
    ack.set_value(std::nullopt);
    return fut;
}

void ProcessTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void ProcessTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closeHandler = std::move(handler);
}

void ProcessTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace mcplink
