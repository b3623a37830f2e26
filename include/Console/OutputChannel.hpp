#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <Console/ScriptJob.hpp>

namespace InkWell {

struct ConsoleEvent {
    enum class Type { OutputAppended, StateChanged };
    Type type = Type::OutputAppended;
    JobId jobId = 0;
    OutputChunk chunk;              // OutputAppended
    JobState state = JobState::Pending; // StateChanged
    std::string error;                  // StateChanged to Failed
};

// Ordered hand-off from the console worker to the UI thread. The worker
// pushes, the UI drains from its event loop.
class OutputChannel {
public:
    void push(ConsoleEvent event);
    std::vector<ConsoleEvent> drain();
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::deque<ConsoleEvent> m_events;
};

} // namespace InkWell
