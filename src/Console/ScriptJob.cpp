#include <Console/ScriptJob.hpp>

namespace InkWell {

const char *toString(JobState state)
{
    switch (state)
    {
    case JobState::Pending: return "Pending";
    case JobState::Running: return "Running";
    case JobState::Completed: return "Completed";
    case JobState::Failed: return "Failed";
    case JobState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char *toString(OutputStream stream)
{
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

std::string ScriptJob::outputText() const
{
    std::string out;
    for (const auto &chunk : outputLog)
        out += chunk.text;
    return out;
}

std::string ScriptJob::outputText(OutputStream stream) const
{
    std::string out;
    for (const auto &chunk : outputLog)
    {
        if (chunk.stream == stream)
            out += chunk.text;
    }
    return out;
}

} // namespace InkWell
