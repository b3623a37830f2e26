#pragma once
#include <atomic>
#include <functional>
#include <string>

#include <Console/ScriptJob.hpp>

namespace InkWell {

class CancelToken {
public:
    void requestCancel() noexcept { m_requested.store(true); }
    bool isCancelRequested() const noexcept { return m_requested.load(); }

private:
    std::atomic<bool> m_requested{false};
};

struct ExecutionOutcome {
    enum class Kind { Completed, Failed, Cancelled };
    Kind kind = Kind::Completed;
    std::string error; // Failed only

    static ExecutionOutcome completed() { return {Kind::Completed, {}}; }
    static ExecutionOutcome failed(std::string msg) { return {Kind::Failed, std::move(msg)}; }
    static ExecutionOutcome cancelled() { return {Kind::Cancelled, {}}; }
};

using ChunkSink = std::function<void(OutputStream, const std::string &)>;

// Runs one script to completion on the calling thread. Implementations must
// stream output through `sink` as it is produced and must return within a
// bounded time once `cancel` is set.
class ScriptExecutor {
public:
    virtual ~ScriptExecutor() = default;

    virtual ExecutionOutcome execute(const std::string &source, const ChunkSink &sink, const CancelToken &cancel) = 0;
};

} // namespace InkWell
