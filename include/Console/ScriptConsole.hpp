#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <Console/ConsoleConfig.hpp>
#include <Console/OutputChannel.hpp>
#include <Console/ScriptExecutor.hpp>
#include <Console/ScriptJob.hpp>

namespace InkWell {

// Runs submitted scripts one at a time on a dedicated worker thread.
//
// All public calls are safe from the UI thread and never wait on a script.
// Progress reaches the UI through dispatchPending(), which replays the
// output and state events produced since the last call, in order.
class ScriptConsole {
public:
    using OutputListener = std::function<void(JobId, const OutputChunk &)>;
    // `error` is the failure message when the state is Failed, empty otherwise.
    using StateListener = std::function<void(JobId, JobState, const std::string &error)>;

    ScriptConsole(ConsoleConfig config, std::unique_ptr<ScriptExecutor> executor);
    ~ScriptConsole();

    ScriptConsole(const ScriptConsole &) = delete;
    ScriptConsole &operator=(const ScriptConsole &) = delete;

    // Throws ConsoleError (InvalidInput, or Busy when queueing is disabled).
    JobId submit(const std::string &sourceText);

    // Returns false when the job is unknown or already finished.
    bool cancel(JobId id);
    void cancelAll();

    std::optional<ScriptJob> poll(JobId id) const;
    std::vector<ScriptJob> jobs() const;
    std::optional<JobId> runningJob() const;
    std::size_t pendingCount() const;

    // Blocks the caller; meant for tools and tests, not for a UI loop.
    bool waitForTerminal(JobId id, std::chrono::milliseconds timeout) const;

    void onOutput(OutputListener listener);
    void onStateChanged(StateListener listener);

    // Delivers queued events to the listeners on the calling thread.
    // Returns the number of events delivered.
    std::size_t dispatchPending();

    const ConsoleConfig &config() const { return m_config; }

private:
    struct JobRecord {
        ScriptJob job;
        std::shared_ptr<CancelToken> cancel;
    };

    void workerLoop();
    void runJob(JobId id, const std::string &source, const std::shared_ptr<CancelToken> &token);
    void appendOutput(JobId id, OutputStream stream, const std::string &text);
    void finishJob(JobId id, const ExecutionOutcome &outcome, bool cancelRequested);

    // The following require m_mutex to be held.
    void setStateLocked(JobRecord &rec, JobState state);
    bool cancelPendingLocked(JobId id);
    void pruneFinishedLocked();

    ConsoleConfig m_config;
    std::unique_ptr<ScriptExecutor> m_executor;
    OutputChannel m_channel;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_changed;
    std::map<JobId, JobRecord> m_jobs;
    std::deque<JobId> m_pending;
    std::optional<JobId> m_running;
    JobId m_nextId = 1;
    bool m_shutdown = false;

    std::mutex m_listenerMutex;
    std::vector<OutputListener> m_outputListeners;
    std::vector<StateListener> m_stateListeners;

    std::thread m_worker;
};

} // namespace InkWell
