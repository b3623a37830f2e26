#include <Config/AppConfig.hpp>
#include <Console/ConsoleError.hpp>
#include <Console/ProcessExecutor.hpp>
#include <Console/ScriptConsole.hpp>
#include <Util/Logging.hpp>
#include <plog/Log.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace InkWell;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;
constexpr auto kPumpInterval = std::chrono::milliseconds(50);

volatile std::sig_atomic_t g_interrupts = 0;

void onInterrupt(int)
{
    g_interrupts = g_interrupts + 1;
}

struct Options {
    std::string configPath = AppConfig::kDefaultFileName;
    bool noQueue = false;
    bool noSandbox = false;
    long long graceMs = -1;
    std::vector<std::string> interpreter;
    std::vector<std::string> scripts;
};

void usage()
{
    std::fprintf(stderr,
                 "usage: inkwell-console [--config FILE] [--no-queue] [--no-sandbox] [--grace-ms N]\n"
                 "                       [--interpreter ARG]... SCRIPT...\n"
                 "  SCRIPT is a file path, or - for stdin. Ctrl-C cancels the running script,\n"
                 "  a second Ctrl-C cancels everything.\n");
}

bool parseArgs(int argc, char **argv, Options &opts)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto needValue = [&](const char *name) -> const char * {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "%s requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config")
        {
            const char *v = needValue("--config");
            if (!v) return false;
            opts.configPath = v;
        }
        else if (arg == "--grace-ms")
        {
            const char *v = needValue("--grace-ms");
            if (!v) return false;
            try
            {
                opts.graceMs = std::stoll(v);
            }
            catch (const std::exception &)
            {
                std::fprintf(stderr, "--grace-ms expects a number, got '%s'\n", v);
                return false;
            }
            if (opts.graceMs < 0 || opts.graceMs > ConsoleConfig::kMaxGracePeriod.count())
            {
                std::fprintf(stderr, "--grace-ms must be between 0 and %lld\n",
                             static_cast<long long>(ConsoleConfig::kMaxGracePeriod.count()));
                return false;
            }
        }
        else if (arg == "--interpreter")
        {
            const char *v = needValue("--interpreter");
            if (!v) return false;
            opts.interpreter.push_back(v);
        }
        else if (arg == "--no-queue")
            opts.noQueue = true;
        else if (arg == "--no-sandbox")
            opts.noSandbox = true;
        else if (arg == "-h" || arg == "--help")
            return false;
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-")
        {
            std::fprintf(stderr, "unknown option %s\n", arg.c_str());
            return false;
        }
        else
            opts.scripts.push_back(arg);
    }
    return !opts.scripts.empty();
}

bool readScript(const std::string &path, std::string &out)
{
    if (path == "-")
    {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

std::string executableDir(const char *argv0)
{
    std::filesystem::path p(argv0);
    if (!p.has_parent_path())
        return std::string(); // found through PATH; so is the worker
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    return ec ? p.parent_path().string() : abs.parent_path().string();
}

} // namespace

int main(int argc, char **argv)
{
    Options opts;
    if (!parseArgs(argc, argv, opts))
    {
        usage();
        return kExitUsage;
    }

    initLogging(resolveSeverity("warning"));
    AppConfig appConfig = AppConfig::load(opts.configPath);
    initLogging(resolveSeverity(appConfig.logLevel));

    ConsoleConfig consoleConfig = appConfig.console;
    if (opts.noQueue)
        consoleConfig.queueEnabled = false;
    if (opts.noSandbox)
        consoleConfig.sandbox = false;
    if (opts.graceMs >= 0)
        consoleConfig.gracePeriod = std::chrono::milliseconds(opts.graceMs);
    if (!opts.interpreter.empty())
        consoleConfig.interpreter = opts.interpreter;

    std::vector<std::string> sources(opts.scripts.size());
    for (size_t i = 0; i < opts.scripts.size(); ++i)
    {
        if (!readScript(opts.scripts[i], sources[i]))
        {
            std::fprintf(stderr, "cannot read %s: %s\n", opts.scripts[i].c_str(), std::strerror(errno));
            return kExitUsage;
        }
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &onInterrupt;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    auto argvForWorker = consoleConfig.resolveInterpreter(executableDir(argv[0]));
    PLOGD << "inkwell-console: interpreter " << argvForWorker.front();

    ScriptConsole console(consoleConfig, std::make_unique<ProcessExecutor>(argvForWorker, consoleConfig.gracePeriod));

    std::map<JobId, std::string> names;
    std::map<JobId, JobState> finished;

    console.onOutput([](JobId, const OutputChunk &chunk) {
        std::FILE *f = chunk.stream == OutputStream::Stdout ? stdout : stderr;
        std::fwrite(chunk.text.data(), 1, chunk.text.size(), f);
        std::fflush(f);
    });
    console.onStateChanged([&](JobId id, JobState state, const std::string &error) {
        if (state == JobState::Running)
            std::fprintf(stderr, ">>> Running %s...\n", names[id].c_str());
        if (!isTerminal(state))
            return;
        finished[id] = state;
        if (state == JobState::Failed)
        {
            std::fprintf(stderr, "Error:\n%s\n", error.c_str());
        }
        else if (state == JobState::Cancelled)
        {
            std::fprintf(stderr, ">>> %s cancelled\n", names[id].c_str());
        }
    });

    size_t next = 0;
    bool stopSubmitting = false;
    bool inputError = false;
    int handledInterrupts = 0;
    for (;;)
    {
        int interrupts = g_interrupts;
        if (interrupts > handledInterrupts)
        {
            if (handledInterrupts == 0 && interrupts == 1)
            {
                if (auto running = console.runningJob())
                    console.cancel(*running);
            }
            else
            {
                stopSubmitting = true;
                console.cancelAll();
            }
            handledInterrupts = interrupts;
        }

        if (!stopSubmitting && next < sources.size())
        {
            try
            {
                JobId id = console.submit(sources[next]);
                names[id] = opts.scripts[next];
                if (opts.scripts[next] != "-" && !appConfig.addRecent(opts.scripts[next]))
                    PLOGD << "inkwell-console: recent files not updated";
                ++next;
            }
            catch (const ConsoleError &e)
            {
                if (e.kind() != ErrorKind::Busy)
                {
                    std::fprintf(stderr, "%s: %s\n", opts.scripts[next].c_str(), e.toString().c_str());
                    inputError = true;
                    stopSubmitting = true;
                    console.cancelAll();
                }
                // Busy: retry once the running script is done
            }
        }

        console.dispatchPending();
        bool submittedAll = stopSubmitting || next == sources.size();
        if (submittedAll && finished.size() == names.size())
            break;
        std::this_thread::sleep_for(kPumpInterval);
    }
    console.dispatchPending();

    bool anyFailed = false;
    bool anyCancelled = false;
    for (const auto &entry : finished)
    {
        anyFailed = anyFailed || entry.second == JobState::Failed;
        anyCancelled = anyCancelled || entry.second == JobState::Cancelled;
    }
    if (anyFailed)
        return kExitFailed;
    if (inputError)
        return kExitUsage;
    if (anyCancelled)
        return kExitCancelled;
    return kExitOk;
}
