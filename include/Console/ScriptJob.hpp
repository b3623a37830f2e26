#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace InkWell {

using JobId = std::uint64_t;

enum class JobState { Pending, Running, Completed, Failed, Cancelled };

enum class OutputStream { Stdout, Stderr };

inline bool isTerminal(JobState state)
{
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

const char *toString(JobState state);
const char *toString(OutputStream stream);

struct OutputChunk {
    OutputStream stream = OutputStream::Stdout;
    std::string text;
};

// Snapshot of one submitted script. Values handed out by ScriptConsole are
// copies; the console keeps the only mutable record.
struct ScriptJob {
    JobId id = 0;
    std::string sourceText;
    JobState state = JobState::Pending;
    std::vector<OutputChunk> outputLog;
    std::optional<std::string> error; // set only when state == Failed

    std::chrono::system_clock::time_point submittedAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;

    // Concatenated text of every chunk, optionally restricted to one stream.
    std::string outputText() const;
    std::string outputText(OutputStream stream) const;
};

} // namespace InkWell
