#include <Console/ScriptConsole.hpp>
#include <Console/ConsoleError.hpp>
#include <plog/Log.h>
#include <algorithm>
#include <cctype>

namespace InkWell {

namespace {

bool isBlank(const std::string &text)
{
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

// A throwing listener is logged and skipped; the others still run.
template <typename Fn>
void invokeListener(JobId id, Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const std::exception &e)
    {
        PLOGW << "ScriptConsole: listener failed for job " << id << ": " << e.what();
    }
    catch (...)
    {
        PLOGW << "ScriptConsole: listener failed for job " << id << " with a non-standard exception";
    }
}

} // namespace

ScriptConsole::ScriptConsole(ConsoleConfig config, std::unique_ptr<ScriptExecutor> executor)
    : m_config(std::move(config)), m_executor(std::move(executor))
{
    if (!m_executor)
        throw std::invalid_argument("ScriptConsole requires an executor");
    m_worker = std::thread(&ScriptConsole::workerLoop, this);
}

ScriptConsole::~ScriptConsole()
{
    {
        std::lock_guard<std::mutex> l(m_mutex);
        m_shutdown = true;
        while (!m_pending.empty())
            cancelPendingLocked(m_pending.front());
        if (m_running)
            m_jobs.at(*m_running).cancel->requestCancel();
    }
    m_changed.notify_all();
    if (m_worker.joinable())
        m_worker.join();
}

JobId ScriptConsole::submit(const std::string &sourceText)
{
    if (sourceText.empty() || isBlank(sourceText))
        throw ConsoleError(ErrorKind::InvalidInput, "script is empty");
    if (sourceText.size() > m_config.maxScriptBytes)
        throw ConsoleError(ErrorKind::InvalidInput, "script is " + std::to_string(sourceText.size()) +
                                                        " bytes, limit is " + std::to_string(m_config.maxScriptBytes));

    JobId id = 0;
    {
        std::lock_guard<std::mutex> l(m_mutex);
        if (!m_config.queueEnabled && (m_running || !m_pending.empty()))
            throw ConsoleError(ErrorKind::Busy, "a script is already running");

        id = m_nextId++;
        JobRecord rec;
        rec.job.id = id;
        rec.job.sourceText = sourceText;
        rec.job.submittedAt = std::chrono::system_clock::now();
        rec.cancel = std::make_shared<CancelToken>();
        auto &stored = m_jobs.emplace(id, std::move(rec)).first->second;
        setStateLocked(stored, JobState::Pending);
        m_pending.push_back(id);
    }
    m_changed.notify_all();
    PLOGI << "ScriptConsole: job " << id << " submitted (" << sourceText.size() << " bytes)";
    return id;
}

bool ScriptConsole::cancel(JobId id)
{
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> l(m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || isTerminal(it->second.job.state))
            return false;

        if (it->second.job.state == JobState::Pending)
        {
            cancelled = cancelPendingLocked(id);
        }
        else
        {
            it->second.cancel->requestCancel();
            cancelled = true;
        }
    }
    m_changed.notify_all();
    PLOGI << "ScriptConsole: cancel requested for job " << id;
    return cancelled;
}

void ScriptConsole::cancelAll()
{
    {
        std::lock_guard<std::mutex> l(m_mutex);
        while (!m_pending.empty())
            cancelPendingLocked(m_pending.front());
        if (m_running)
            m_jobs.at(*m_running).cancel->requestCancel();
    }
    m_changed.notify_all();
}

std::optional<ScriptJob> ScriptConsole::poll(JobId id) const
{
    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end())
        return std::nullopt;
    return it->second.job;
}

std::vector<ScriptJob> ScriptConsole::jobs() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    std::vector<ScriptJob> out;
    out.reserve(m_jobs.size());
    for (const auto &entry : m_jobs)
        out.push_back(entry.second.job);
    return out;
}

std::optional<JobId> ScriptConsole::runningJob() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_running;
}

std::size_t ScriptConsole::pendingCount() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_pending.size();
}

bool ScriptConsole::waitForTerminal(JobId id, std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> l(m_mutex);
    if (m_jobs.find(id) == m_jobs.end())
        return false;
    return m_changed.wait_for(l, timeout, [&] {
        auto it = m_jobs.find(id);
        return it == m_jobs.end() || isTerminal(it->second.job.state);
    });
}

void ScriptConsole::onOutput(OutputListener listener)
{
    std::lock_guard<std::mutex> l(m_listenerMutex);
    m_outputListeners.push_back(std::move(listener));
}

void ScriptConsole::onStateChanged(StateListener listener)
{
    std::lock_guard<std::mutex> l(m_listenerMutex);
    m_stateListeners.push_back(std::move(listener));
}

std::size_t ScriptConsole::dispatchPending()
{
    auto events = m_channel.drain();
    if (events.empty())
        return 0;

    std::vector<OutputListener> outputListeners;
    std::vector<StateListener> stateListeners;
    {
        std::lock_guard<std::mutex> l(m_listenerMutex);
        outputListeners = m_outputListeners;
        stateListeners = m_stateListeners;
    }

    for (const auto &ev : events)
    {
        if (ev.type == ConsoleEvent::Type::OutputAppended)
        {
            for (auto &cb : outputListeners)
                invokeListener(ev.jobId, [&] { cb(ev.jobId, ev.chunk); });
        }
        else
        {
            for (auto &cb : stateListeners)
                invokeListener(ev.jobId, [&] { cb(ev.jobId, ev.state, ev.error); });
        }
    }
    return events.size();
}

void ScriptConsole::workerLoop()
{
    PLOGD << "ScriptConsole: worker started";
    for (;;)
    {
        JobId id = 0;
        std::string source;
        std::shared_ptr<CancelToken> token;
        {
            std::unique_lock<std::mutex> l(m_mutex);
            m_changed.wait(l, [this] { return m_shutdown || !m_pending.empty(); });
            if (m_shutdown)
                break;

            id = m_pending.front();
            m_pending.pop_front();
            auto &rec = m_jobs.at(id);
            rec.job.startedAt = std::chrono::system_clock::now();
            setStateLocked(rec, JobState::Running);
            m_running = id;
            source = rec.job.sourceText;
            token = rec.cancel;
        }
        m_changed.notify_all();
        PLOGI << "ScriptConsole: job " << id << " running";
        runJob(id, source, token);
    }
    PLOGD << "ScriptConsole: worker stopped";
}

void ScriptConsole::runJob(JobId id, const std::string &source, const std::shared_ptr<CancelToken> &token)
{
    ExecutionOutcome outcome;
    try
    {
        outcome = m_executor->execute(
            source,
            [this, id](OutputStream stream, const std::string &text) { appendOutput(id, stream, text); },
            *token);
    }
    catch (const std::exception &e)
    {
        PLOGE << "ScriptConsole: executor error in job " << id << ": " << e.what();
        outcome = ExecutionOutcome::failed(std::string("internal error: ") + e.what());
    }
    catch (...)
    {
        PLOGE << "ScriptConsole: unknown executor error in job " << id;
        outcome = ExecutionOutcome::failed("internal error: unknown exception");
    }
    finishJob(id, outcome, token->isCancelRequested());
}

void ScriptConsole::appendOutput(JobId id, OutputStream stream, const std::string &text)
{
    if (text.empty())
        return;
    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it->second.job.state != JobState::Running)
        return;

    OutputChunk chunk{stream, text};
    it->second.job.outputLog.push_back(chunk);

    ConsoleEvent ev;
    ev.type = ConsoleEvent::Type::OutputAppended;
    ev.jobId = id;
    ev.chunk = std::move(chunk);
    m_channel.push(std::move(ev));
}

void ScriptConsole::finishJob(JobId id, const ExecutionOutcome &outcome, bool cancelRequested)
{
    JobState finalState = JobState::Completed;
    if (cancelRequested || outcome.kind == ExecutionOutcome::Kind::Cancelled)
        finalState = JobState::Cancelled;
    else if (outcome.kind == ExecutionOutcome::Kind::Failed)
        finalState = JobState::Failed;

    {
        std::lock_guard<std::mutex> l(m_mutex);
        auto &rec = m_jobs.at(id);
        if (finalState == JobState::Failed)
            rec.job.error = outcome.error.empty() ? std::string("script failed") : outcome.error;
        rec.job.finishedAt = std::chrono::system_clock::now();
        setStateLocked(rec, finalState);
        m_running.reset();
        pruneFinishedLocked();
    }
    m_changed.notify_all();

    if (finalState == JobState::Failed)
        PLOGW << "ScriptConsole: job " << id << " failed: " << outcome.error;
    else
        PLOGI << "ScriptConsole: job " << id << " " << toString(finalState);
}

void ScriptConsole::setStateLocked(JobRecord &rec, JobState state)
{
    rec.job.state = state;

    ConsoleEvent ev;
    ev.type = ConsoleEvent::Type::StateChanged;
    ev.jobId = rec.job.id;
    ev.state = state;
    if (state == JobState::Failed && rec.job.error)
        ev.error = *rec.job.error;
    m_channel.push(std::move(ev));
}

bool ScriptConsole::cancelPendingLocked(JobId id)
{
    auto pos = std::find(m_pending.begin(), m_pending.end(), id);
    if (pos == m_pending.end())
        return false;
    m_pending.erase(pos);

    auto &rec = m_jobs.at(id);
    rec.cancel->requestCancel();
    rec.job.finishedAt = std::chrono::system_clock::now();
    setStateLocked(rec, JobState::Cancelled);
    pruneFinishedLocked();
    return true;
}

void ScriptConsole::pruneFinishedLocked()
{
    if (m_config.retainedJobs == 0)
        return;

    std::size_t finished = 0;
    for (const auto &entry : m_jobs)
    {
        if (isTerminal(entry.second.job.state))
            ++finished;
    }
    for (auto it = m_jobs.begin(); it != m_jobs.end() && finished > m_config.retainedJobs;)
    {
        if (isTerminal(it->second.job.state))
        {
            it = m_jobs.erase(it);
            --finished;
        }
        else
        {
            ++it;
        }
    }
}

} // namespace InkWell
