//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessChannel.cpp
// Purpose: Child-process line channel implementation (fork/exec, epoll reader, queued writer)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cstring>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/ProcessChannel.hpp"
#include "toolhost/WireCodec.h"
#include "toolhost/errors/Errors.h"

extern char** environ;

namespace toolhost {

namespace {

using steady = std::chrono::steady_clock;

std::once_flag gSigpipeOnce;

void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        // Writes to a provider that already exited must fail with EPIPE instead of killing the host
        ::signal(SIGPIPE, SIG_IGN);
        LOG_DEBUG("ProcessChannel: SIGPIPE ignored for this process");
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

} // namespace

class ProcessChannel::Impl {
public:
    ChannelSpec spec;
    std::atomic<bool> open{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> stopReading{false};
    std::atomic<bool> childGone{false};
    steady::time_point closeStarted{};
    std::once_flag closeOnce;

    // Child process; pid/reaped guarded by pidMutex so signals are never sent to a reaped pid
    std::mutex pidMutex;
    pid_t pid{-1};
    bool reaped{false};

    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    // Close() callers other than the reader are serialized here; only they join the threads
    std::mutex closeMutex;
    std::thread readerThread;
    std::thread writerThread;
    std::atomic<std::thread::id> readerId{};

    std::mutex handlerMutex;
    ILineChannel::LineHandler lineHandler;
    ILineChannel::DiagnosticHandler diagnosticHandler;
    ILineChannel::ExitHandler exitHandler;

    // Write queue/backpressure
    std::mutex writeMutex;
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
    bool writerStop{false};
    steady::time_point drainDeadline{};

    std::mutex exitMutex;
    std::condition_variable cvExit;
    bool exited{false};

    LineBuffer outBuffer;
    LineBuffer errBuffer{64 * 1024};

    explicit Impl(ChannelSpec s) : spec(std::move(s)) {
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessChannel[{}]: failed to create eventfd (errno={} msg={})", spec.label, errno, ::strerror(errno));
        }
    }

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            LOG_WARN("ProcessChannel[{}]: eventfd write failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
            break;
        }
    }

    void signalChild(int sig) {
        std::lock_guard<std::mutex> lk(pidMutex);
        if (pid > 0 && !reaped) {
            LOG_DEBUG("ProcessChannel[{}]: sending signal {} to pid {}", spec.label, sig, pid);
            (void)::kill(pid, sig);
        }
    }

    bool waitExited(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(exitMutex);
        return cvExit.wait_for(lk, d, [this]() { return exited; });
    }

    void spawn() {
        ignoreSigpipe();
        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};
        int errPipe[2] = {-1, -1};
        int statusPipe[2] = {-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            const int e = errno;
            closeAll();
            throw errors::ToolHostError(errors::ErrorCategory::SpawnError,
                std::format("{}: failed to create pipes: {}", spec.label, ::strerror(e)));
        }

        // Everything the child needs is prepared before fork; only async-signal-safe calls follow it
        std::vector<std::string> envStrings = mergedEnvironment(spec.env);
        std::vector<char*> envp;
        envp.reserve(envStrings.size() + 1);
        for (auto& s : envStrings) envp.push_back(s.data());
        envp.push_back(nullptr);

        std::vector<std::string> argStrings;
        argStrings.reserve(spec.args.size() + 1);
        argStrings.push_back(spec.command);
        for (const auto& a : spec.args) argStrings.push_back(a);
        std::vector<char*> argv;
        argv.reserve(argStrings.size() + 1);
        for (auto& s : argStrings) argv.push_back(s.data());
        argv.push_back(nullptr);

        const pid_t child = ::fork();
        if (child < 0) {
            const int e = errno;
            closeAll();
            throw errors::ToolHostError(errors::ErrorCategory::SpawnError,
                std::format("{}: fork failed: {}", spec.label, ::strerror(e)));
        }
        if (child == 0) {
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);
            ::execvpe(argv[0], argv.data(), envp.data());
            int e = errno;
            ssize_t ignored = ::write(statusPipe[1], &e, sizeof(e));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);

        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
            closeAll();
            throw errors::ToolHostError(errors::ErrorCategory::SpawnError,
                std::format("{}: failed to start '{}': {}", spec.label, spec.command, ::strerror(childErrno)));
        }

        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        setNonBlocking(stdinFd);
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        {
            std::lock_guard<std::mutex> lk(pidMutex);
            pid = child;
            reaped = false;
        }
        LOG_INFO("ProcessChannel[{}]: started '{}' (pid {})", spec.label, spec.command, child);
    }

    void dispatchLine(std::string&& line) {
        ILineChannel::LineHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = lineHandler;
        }
        if (!handler) {
            LOG_DEBUG("ProcessChannel[{}]: no line handler; dropping line", spec.label);
            return;
        }
        try {
            handler(std::move(line));
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel[{}]: line handler threw: {}", spec.label, e.what());
        }
    }

    void dispatchDiagnostic(std::string&& line) {
        ILineChannel::DiagnosticHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = diagnosticHandler;
        }
        if (!handler) {
            LOG_INFO("[{} stderr] {}", spec.label, line);
            return;
        }
        try {
            handler(line);
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessChannel[{}]: diagnostic handler threw: {}", spec.label, e.what());
        }
    }

    // Reads what is currently available; returns false once the stream hit EOF or failed.
    bool drainFd(int fd, bool isOut) {
        std::array<char, 4096> tmp{};
        for (;;) {
            ssize_t n = ::read(fd, tmp.data(), tmp.size());
            if (n > 0) {
                std::string_view chunk(tmp.data(), static_cast<std::size_t>(n));
                if (isOut) {
                    outBuffer.Append(chunk, [this](std::string&& l) { dispatchLine(std::move(l)); });
                } else {
                    errBuffer.Append(chunk, [this](std::string&& l) { dispatchDiagnostic(std::move(l)); });
                }
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            LOG_WARN("ProcessChannel[{}]: read failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
            return false;
        }
    }

    void readerLoop() {
        readerId = std::this_thread::get_id();
        bool outEof = false;
        bool errEof = false;
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ProcessChannel[{}]: epoll_create1 failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
            outEof = errEof = true;
        } else {
            for (int fd : {stdoutFd, stderrFd, wakeEventFd}) {
                if (fd < 0) continue;
                epoll_event ev{};
                ev.events = EPOLLIN | EPOLLRDHUP;
                ev.data.fd = fd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev);
            }
        }

        constexpr int waitTimeoutMs = 100;
        while (!(outEof && errEof) && !stopReading.load()) {
            epoll_event events[3];
            int rc = ::epoll_wait(ep, events, 3, waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("ProcessChannel[{}]: epoll_wait failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc; ++i) {
                const int fd = events[i].data.fd;
                if (fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do {
                        r = ::read(wakeEventFd, &v, sizeof(v));
                    } while (r < 0 && errno == EINTR);
                    continue;
                }
                const bool isOut = (fd == stdoutFd);
                if (!drainFd(fd, isOut)) {
                    (void)::epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                    if (isOut) outEof = true; else errEof = true;
                }
            }
        }
        if (ep >= 0) ::close(ep);

        outBuffer.Flush([this](std::string&& l) { dispatchLine(std::move(l)); });
        errBuffer.Flush([this](std::string&& l) { dispatchDiagnostic(std::move(l)); });

        ExitInfo info = reap();
        closeFd(stdoutFd);
        closeFd(stderrFd);
        open = false;
        childGone = true;
        cvWrite.notify_all();
        info.requested = closing.load();
        LOG_INFO("ProcessChannel[{}]: provider exited ({}{})", spec.label, info.describe(), info.requested ? ", requested" : "");

        ILineChannel::ExitHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = exitHandler;
        }
        if (handler) {
            try {
                handler(info);
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessChannel[{}]: exit handler threw: {}", spec.label, e.what());
            }
        }
        {
            std::lock_guard<std::mutex> lk(exitMutex);
            exited = true;
        }
        cvExit.notify_all();
    }

    // Polls for the child's exit. While closing, escalates to SIGKILL once the grace period is spent.
    ExitInfo reap() {
        ExitInfo info;
        bool killed = false;
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(pidMutex);
                if (pid <= 0 || reaped) return info;
                int status = 0;
                pid_t r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) {
                    reaped = true;
                    if (WIFEXITED(status)) info.exitCode = WEXITSTATUS(status);
                    else if (WIFSIGNALED(status)) info.signal = WTERMSIG(status);
                    return info;
                }
                if (r < 0 && errno != EINTR) {
                    LOG_WARN("ProcessChannel[{}]: waitpid failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
                    reaped = true;
                    return info;
                }
                if (!killed && closing.load() && steady::now() - closeStarted > 3 * spec.stopGrace) {
                    LOG_WARN("ProcessChannel[{}]: pid {} still alive; sending SIGKILL", spec.label, pid);
                    (void)::kill(pid, SIGKILL);
                    killed = true;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    // Writes one line fully. Fails on a broken pipe, once the child is gone, or past the drain deadline.
    bool writeAll(const std::string& data) {
        std::size_t total = 0;
        while (total < data.size()) {
            ssize_t w = ::write(stdinFd, data.data() + total, data.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) continue;
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (childGone.load()) return false;
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    if (writerStop && steady::now() >= drainDeadline) return false;
                }
                pollfd pfd{};
                pfd.fd = stdinFd;
                pfd.events = POLLOUT;
                (void)::poll(&pfd, 1, 50);
                continue;
            }
            LOG_DEBUG("ProcessChannel[{}]: write failed (errno={} msg={})", spec.label, errno, ::strerror(errno));
            return false;
        }
        return true;
    }

    void writerLoop() {
        for (;;) {
            std::string item;
            {
                std::unique_lock<std::mutex> lk(writeMutex);
                cvWrite.wait_for(lk, std::chrono::milliseconds(100), [this]() { return writerStop || !writeQueue.empty() || childGone.load(); });
                if (writeQueue.empty()) {
                    if (writerStop || childGone.load()) break;
                    continue;
                }
                item = std::move(writeQueue.front());
                writeQueue.pop_front();
            }
            const bool ok = writeAll(item);
            std::lock_guard<std::mutex> lk(writeMutex);
            queuedBytes = (queuedBytes >= item.size()) ? queuedBytes - item.size() : 0;
            if (!ok) {
                if (!writeQueue.empty()) {
                    LOG_WARN("ProcessChannel[{}]: dropping {} queued line(s) after write failure", spec.label, writeQueue.size());
                }
                writeQueue.clear();
                queuedBytes = 0;
                break;
            }
        }
        std::lock_guard<std::mutex> lk(writeMutex);
        writerStop = true;
        closeFd(stdinFd);
    }
};

ProcessChannel::ProcessChannel(ChannelSpec spec) : pImpl(std::make_unique<Impl>(std::move(spec))) { FUNC_SCOPE(); }

ProcessChannel::~ProcessChannel() {
    FUNC_SCOPE();
    if (pImpl->readerThread.joinable() || pImpl->writerThread.joinable()) {
        Close().get();
    }
}

std::future<void> ProcessChannel::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (pImpl->open.load()) {
        promise.set_value();
        return fut;
    }
    try {
        pImpl->spawn();
    } catch (const errors::ToolHostError& e) {
        LOG_ERROR("ProcessChannel: {}", e.what());
        promise.set_exception(std::current_exception());
        return fut;
    }
    pImpl->open = true;
    pImpl->readerThread = std::thread([impl = pImpl.get()]() { impl->readerLoop(); });
    pImpl->writerThread = std::thread([impl = pImpl.get()]() { impl->writerLoop(); });
    promise.set_value();
    return fut;
}

std::future<void> ProcessChannel::Close() {
    FUNC_SCOPE();
    auto& impl = *pImpl;
    std::promise<void> promise;
    auto fut = promise.get_future();
    std::call_once(impl.closeOnce, [&impl]() {
        impl.closeStarted = steady::now();
        impl.closing = true;
        LOG_DEBUG("ProcessChannel[{}]: closing", impl.spec.label);
    });

    // Flush queued lines (bounded), then close stdin so a well-behaved provider exits on EOF
    {
        std::lock_guard<std::mutex> lk(impl.writeMutex);
        if (!impl.writerStop) {
            impl.writerStop = true;
            impl.drainDeadline = steady::now() + impl.spec.stopGrace;
        }
    }
    impl.cvWrite.notify_all();

    if (impl.readerId.load() == std::this_thread::get_id()) {
        // Called from one of our own handlers: the reader reaps (and escalates) once it returns,
        // and the threads are joined by the next Close() or the destructor
        impl.signalChild(SIGTERM);
        impl.stopReading = true;
        promise.set_value();
        return fut;
    }

    std::lock_guard<std::mutex> closeLock(impl.closeMutex);
    if (impl.writerThread.joinable()) {
        impl.writerThread.join();
    }
    if (impl.readerThread.joinable()) {
        if (!impl.waitExited(impl.spec.stopGrace)) {
            impl.signalChild(SIGTERM);
            if (!impl.waitExited(impl.spec.stopGrace)) {
                impl.signalChild(SIGKILL);
            }
        }
        // Grandchildren may still hold the pipes open; stop reading so the reader can reap
        impl.stopReading = true;
        impl.wake();
        impl.readerThread.join();
    }
    impl.open = false;
    promise.set_value();
    return fut;
}

bool ProcessChannel::IsOpen() const { return pImpl->open.load() && !pImpl->closing.load(); }

std::string ProcessChannel::Describe() const {
    return std::format("{} (pid {}, '{}')", pImpl->spec.label, Pid(), pImpl->spec.command);
}

bool ProcessChannel::WriteLine(std::string line) {
    if (!IsOpen()) {
        LOG_DEBUG("ProcessChannel[{}]: WriteLine while not open; dropping", pImpl->spec.label);
        return false;
    }
    if (line.empty() || line.back() != '\n') line.push_back('\n');
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        if (pImpl->writerStop) return false;
        if (pImpl->queuedBytes + line.size() > pImpl->writeQueueMaxBytes) {
            LOG_ERROR("ProcessChannel[{}]: write queue overflow (queued={} add={} max={})",
                      pImpl->spec.label, pImpl->queuedBytes, line.size(), pImpl->writeQueueMaxBytes);
            return false;
        }
        pImpl->queuedBytes += line.size();
        pImpl->writeQueue.emplace_back(std::move(line));
    }
    pImpl->cvWrite.notify_one();
    return true;
}

void ProcessChannel::SetLineHandler(LineHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->lineHandler = std::move(handler);
}

void ProcessChannel::SetDiagnosticHandler(DiagnosticHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->diagnosticHandler = std::move(handler);
}

void ProcessChannel::SetExitHandler(ExitHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->exitHandler = std::move(handler);
}

void ProcessChannel::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes == 0 ? 1 : maxBytes;
}

int ProcessChannel::Pid() const {
    std::lock_guard<std::mutex> lk(pImpl->pidMutex);
    return (pImpl->pid > 0 && !pImpl->reaped) ? static_cast<int>(pImpl->pid) : -1;
}

std::unique_ptr<ILineChannel> ProcessChannelFactory::CreateChannel(const ChannelSpec& spec) {
    return std::make_unique<ProcessChannel>(spec);
}

} // namespace toolhost
