// inkwell-lua-worker: runs one console script read from stdin.
//
// stdout/stderr belong to the script. The outcome is written as a single
// JSON object to fd 3 when the parent provides it.
#include "LuaEngine.hpp"
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace {

constexpr int kReportFd = 3;
constexpr int kExitFailed = 1;
constexpr int kExitCancelled = 128 + SIGTERM;
constexpr int kExitUsage = 2;

void onTerminate(int)
{
    InkWell::LuaEngine::requestCancel();
}

void writeReport(const nlohmann::json &report)
{
    if (::fcntl(kReportFd, F_GETFD) == -1)
        return;
    std::string text = report.dump();
    size_t off = 0;
    while (off < text.size())
    {
        ssize_t n = ::write(kReportFd, text.data() + off, text.size() - off);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            PLOGW << "worker: failed to write report: " << std::strerror(errno);
            return;
        }
        off += static_cast<size_t>(n);
    }
}

void usage()
{
    std::fprintf(stderr, "usage: inkwell-lua-worker [--no-sandbox] [--log-file PATH] < script.lua\n");
}

} // namespace

int main(int argc, char **argv)
{
    bool sandbox = true;
    std::string logFile;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--no-sandbox")
            sandbox = false;
        else if (arg == "--log-file" && i + 1 < argc)
            logFile = argv[++i];
        else
        {
            usage();
            return kExitUsage;
        }
    }

    // stderr is the script's; worker diagnostics only go to a file
    if (!logFile.empty())
    {
        static plog::RollingFileAppender<plog::TxtFormatter> fileAppender(logFile.c_str());
        plog::init(plog::debug, &fileAppender);
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &onTerminate;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);

    std::string code((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    PLOGD << "worker: read " << code.size() << " bytes, sandbox=" << sandbox;

    InkWell::LuaEngine engine(sandbox);
    bool ok = engine.runScript(code);
    std::fflush(stdout);
    std::fflush(stderr);

    if (ok)
    {
        writeReport({{"status", "ok"}});
        return 0;
    }
    if (engine.wasCancelled())
    {
        writeReport({{"status", "cancelled"}});
        return kExitCancelled;
    }
    const auto &failure = engine.lastFailure();
    writeReport({{"status", "error"}, {"message", failure.message}, {"traceback", failure.traceback}});
    return kExitFailed;
}
