#pragma once
#include <chrono>
#include <string>
#include <vector>

#include <Console/ScriptExecutor.hpp>

namespace InkWell {

// Runs each script in a child process of its own process group.
//   fd 0  script text, closed once fully written
//   fd 1  stdout pipe, streamed to the sink
//   fd 2  stderr pipe, streamed to the sink
//   fd 3  report pipe; an interpreter may write one JSON failure report
// Cancellation sends SIGTERM to the group, then SIGKILL once the grace
// period has passed. Once the interpreter has exited, its pipes are read
// for at most one more grace period.
class ProcessExecutor : public ScriptExecutor {
public:
    ProcessExecutor(std::vector<std::string> argv, std::chrono::milliseconds gracePeriod);

    ExecutionOutcome execute(const std::string &source, const ChunkSink &sink, const CancelToken &cancel) override;

    const std::vector<std::string> &argv() const { return m_argv; }
    std::chrono::milliseconds gracePeriod() const { return m_gracePeriod; }

    static constexpr int kPollIntervalMs = 20;
    static constexpr int kMinDrainMs = 200;
    static constexpr std::size_t kStderrTailBytes = 4096;

private:
    std::vector<std::string> m_argv;
    std::chrono::milliseconds m_gracePeriod;
};

} // namespace InkWell
