#include <Console/ProcessExecutor.hpp>
#include <Console/ConsoleConfig.hpp>
#include <Util/Pipe.hpp>
#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace InkWell {

namespace {

using Clock = std::chrono::steady_clock;

// Owns a spawned process group. Whatever path leaves execute(), the group is
// killed and the leader reaped.
class ChildProcess
{
public:
    explicit ChildProcess(pid_t pid) : m_pid(pid) {}
    ~ChildProcess()
    {
        if (m_reaped)
            return;
        signalGroup(SIGKILL);
        int status = 0;
        while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {}
    }

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    void signalGroup(int sig) const
    {
        if (::kill(-m_pid, sig) != 0 && errno == ESRCH && !m_reaped)
            ::kill(m_pid, sig);
    }

    bool tryReap(int &status)
    {
        if (m_reaped)
            return true;
        pid_t r = ::waitpid(m_pid, &status, WNOHANG);
        if (r == m_pid)
            m_reaped = true;
        return m_reaped;
    }

    pid_t pid() const { return m_pid; }

private:
    pid_t m_pid;
    bool m_reaped = false;
};

// Writing to a pipe whose reader has exited raises SIGPIPE. Keep it blocked
// on this thread so write() reports EPIPE instead.
class SigpipeBlock
{
public:
    SigpipeBlock()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &set, &m_old);
    }
    ~SigpipeBlock()
    {
        if (!sigismember(&m_old, SIGPIPE))
        {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGPIPE);
            struct timespec zero = {0, 0};
            while (sigtimedwait(&set, nullptr, &zero) == SIGPIPE) {}
        }
        pthread_sigmask(SIG_SETMASK, &m_old, nullptr);
    }

    SigpipeBlock(const SigpipeBlock &) = delete;
    SigpipeBlock &operator=(const SigpipeBlock &) = delete;

private:
    sigset_t m_old;
};

// Reads everything currently available. Returns false once the writer side
// has closed.
bool drainFd(int fd, std::string &out)
{
    char buf[4096];
    for (;;)
    {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;
        PLOGW << "ProcessExecutor: read failed: " << std::strerror(errno);
        return false;
    }
}

void appendTail(std::string &tail, const std::string &data, std::size_t limit)
{
    tail += data;
    if (tail.size() > limit)
        tail.erase(0, tail.size() - limit);
}

std::string trimTrailingNewlines(std::string s)
{
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
        s.pop_back();
    return s;
}

// Parses the JSON report an interpreter may leave on fd 3. Returns true when
// the report describes a script failure.
bool parseFailureReport(const std::string &report, std::string &error)
{
    if (report.empty())
        return false;
    try
    {
        auto j = nlohmann::json::parse(report);
        if (!j.is_object() || j.value("status", std::string()) != "error")
            return false;
        error = j.value("message", std::string("script error"));
        std::string traceback = j.value("traceback", std::string());
        if (!traceback.empty())
            error += "\n" + traceback;
        return true;
    }
    catch (const nlohmann::json::exception &e)
    {
        PLOGW << "ProcessExecutor: ignoring malformed report: " << e.what();
        return false;
    }
}

} // namespace

ProcessExecutor::ProcessExecutor(std::vector<std::string> argv, std::chrono::milliseconds gracePeriod)
    : m_argv(std::move(argv)), m_gracePeriod(gracePeriod)
{
    if (m_argv.empty() || m_argv.front().empty())
        throw std::invalid_argument("ProcessExecutor: interpreter command is empty");
    if (m_gracePeriod.count() < 0 || m_gracePeriod > ConsoleConfig::kMaxGracePeriod)
        throw std::invalid_argument("ProcessExecutor: grace period out of range");
}

ExecutionOutcome ProcessExecutor::execute(const std::string &source, const ChunkSink &sink, const CancelToken &cancel)
{
    Pipe in, out, err, report;
    try
    {
        in = makePipe();
        out = makePipe();
        err = makePipe();
        report = makePipe();
    }
    catch (const std::system_error &e)
    {
        return ExecutionOutcome::failed(std::string("failed to create pipes: ") + e.what());
    }

    // Everything the child touches between fork and exec is prepared here.
    std::vector<char *> argv;
    argv.reserve(m_argv.size() + 1);
    for (const auto &a : m_argv)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);

    SigpipeBlock sigpipeGuard;

    pid_t pid = ::fork();
    if (pid < 0)
        return ExecutionOutcome::failed(std::string("failed to start interpreter: ") + std::strerror(errno));
    if (pid == 0)
    {
        ::setpgid(0, 0);
        ::sigprocmask(SIG_SETMASK, &emptyMask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::dup2(in.readEnd.get(), STDIN_FILENO);
        ::dup2(out.writeEnd.get(), STDOUT_FILENO);
        ::dup2(err.writeEnd.get(), STDERR_FILENO);
        if (report.writeEnd.get() == 3)
            ::fcntl(3, F_SETFD, 0);
        else
            ::dup2(report.writeEnd.get(), 3);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    // Also set from the parent so the group exists before the first signal.
    ::setpgid(pid, pid);
    ChildProcess child(pid);
    PLOGD << "ProcessExecutor: started '" << m_argv.front() << "' pid=" << pid;

    in.readEnd.reset();
    out.writeEnd.reset();
    err.writeEnd.reset();
    report.writeEnd.reset();

    UniqueFd stdinFd = std::move(in.writeEnd);
    UniqueFd stdoutFd = std::move(out.readEnd);
    UniqueFd stderrFd = std::move(err.readEnd);
    UniqueFd reportFd = std::move(report.readEnd);
    setNonBlocking(stdinFd.get());
    setNonBlocking(stdoutFd.get());
    setNonBlocking(stderrFd.get());
    setNonBlocking(reportFd.get());

    std::size_t written = 0;
    if (source.empty())
        stdinFd.reset();

    std::string reportText;
    std::string stderrTail;
    bool termSent = false;
    bool killSent = false;
    bool exited = false;
    int status = 0;
    Clock::time_point killDeadline;
    Clock::time_point drainDeadline;

    // Forwards whatever is readable on one of the output pipes; closes it at EOF.
    auto consume = [&](UniqueFd &fd) {
        std::string data;
        bool open = drainFd(fd.get(), data);
        if (&fd == &reportFd)
        {
            reportText += data;
        }
        else if (!data.empty())
        {
            OutputStream stream = &fd == &stdoutFd ? OutputStream::Stdout : OutputStream::Stderr;
            if (stream == OutputStream::Stderr)
                appendTail(stderrTail, data, kStderrTailBytes);
            sink(stream, data);
        }
        if (!open)
            fd.reset();
    };

    for (;;)
    {
        if (!termSent && cancel.isCancelRequested())
        {
            PLOGD << "ProcessExecutor: cancelling pid=" << pid;
            child.signalGroup(SIGTERM);
            termSent = true;
            killDeadline = Clock::now() + m_gracePeriod;
        }
        if (termSent && !killSent && Clock::now() >= killDeadline)
        {
            PLOGW << "ProcessExecutor: pid=" << pid << " ignored SIGTERM for " << m_gracePeriod.count()
                  << "ms, sending SIGKILL";
            child.signalGroup(SIGKILL);
            killSent = true;
        }
        if (!exited && child.tryReap(status))
        {
            exited = true;
            // Nothing the script started may outlive it.
            child.signalGroup(SIGKILL);
            stdinFd.reset();
            drainDeadline = Clock::now() + std::max(m_gracePeriod, std::chrono::milliseconds(kMinDrainMs));
        }
        if (exited && !stdoutFd.valid() && !stderrFd.valid() && !reportFd.valid())
            break;
        // A descendant that left the group (setsid) can hold the pipes open
        // indefinitely. Stop reading once the leader is gone and either the
        // job was cancelled or the drain period has run out.
        if (exited && (cancel.isCancelRequested() || Clock::now() >= drainDeadline))
        {
            for (UniqueFd *fd : {&stdoutFd, &stderrFd, &reportFd})
            {
                if (fd->valid())
                    consume(*fd);
            }
            if (stdoutFd.valid() || stderrFd.valid() || reportFd.valid())
                PLOGW << "ProcessExecutor: pid=" << pid << " exited but its pipes are still held open, closing them";
            stdoutFd.reset();
            stderrFd.reset();
            reportFd.reset();
            break;
        }

        struct pollfd fds[4];
        UniqueFd *owners[4];
        nfds_t count = 0;
        if (stdinFd.valid())
        {
            fds[count] = {stdinFd.get(), POLLOUT, 0};
            owners[count++] = &stdinFd;
        }
        for (UniqueFd *fd : {&stdoutFd, &stderrFd, &reportFd})
        {
            if (fd->valid())
            {
                fds[count] = {fd->get(), POLLIN, 0};
                owners[count++] = fd;
            }
        }

        int n = ::poll(fds, count, kPollIntervalMs);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (n == 0)
            continue;

        for (nfds_t i = 0; i < count; ++i)
        {
            if (fds[i].revents == 0)
                continue;
            UniqueFd *owner = owners[i];

            if (owner == &stdinFd)
            {
                if (fds[i].revents & (POLLERR | POLLHUP))
                {
                    stdinFd.reset();
                    continue;
                }
                ssize_t w = ::write(stdinFd.get(), source.data() + written, source.size() - written);
                if (w > 0)
                    written += static_cast<std::size_t>(w);
                else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    stdinFd.reset(); // EPIPE: the interpreter stopped reading
                if (written >= source.size())
                    stdinFd.reset();
                continue;
            }

            consume(*owner);
        }
    }

    if (cancel.isCancelRequested())
        return ExecutionOutcome::cancelled();

    std::string error;
    if (parseFailureReport(reportText, error))
        return ExecutionOutcome::failed(error);

    std::string tail = trimTrailingNewlines(stderrTail);
    if (WIFEXITED(status))
    {
        int code = WEXITSTATUS(status);
        PLOGD << "ProcessExecutor: pid=" << pid << " exited with status " << code;
        if (code == 0)
            return ExecutionOutcome::completed();
        if (code == 127 && tail.empty())
            return ExecutionOutcome::failed("failed to launch interpreter '" + m_argv.front() + "'");
        error = "interpreter exited with status " + std::to_string(code);
    }
    else if (WIFSIGNALED(status))
    {
        error = "interpreter terminated by signal " + std::to_string(WTERMSIG(status));
    }
    else
    {
        error = "interpreter ended abnormally";
    }
    if (!tail.empty())
        error += ":\n" + tail;
    return ExecutionOutcome::failed(error);
}

} // namespace InkWell
