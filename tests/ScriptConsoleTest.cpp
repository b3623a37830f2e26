#include <gtest/gtest.h>
#include "ConsoleTestUtil.hpp"

#include <Console/ConsoleError.hpp>
#include <Console/ScriptConsole.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace InkWell;
using namespace InkWell::test;

namespace {

// Writes the script text back as output.
ExecutionOutcome echoBody(const std::string &source, const ChunkSink &sink, const CancelToken &)
{
    sink(OutputStream::Stdout, source);
    return ExecutionOutcome::completed();
}

// Runs until cancelled.
ExecutionOutcome spinBody(const std::string &, const ChunkSink &, const CancelToken &cancel)
{
    while (!cancel.isCancelRequested())
        std::this_thread::sleep_for(2ms);
    return ExecutionOutcome::cancelled();
}

std::unique_ptr<ScriptConsole> makeConsole(FakeExecutor::Body body, ConsoleConfig config = ConsoleConfig{})
{
    return std::make_unique<ScriptConsole>(config, std::make_unique<FakeExecutor>(std::move(body)));
}

} // namespace

class ScriptConsoleTest : public ::testing::Test {
protected:
    static constexpr auto kTimeout = 3000ms;

    bool isRunning(ScriptConsole &console, JobId id)
    {
        auto running = console.runningJob();
        return running && *running == id;
    }
};

TEST_F(ScriptConsoleTest, RejectsEmptyAndBlankScripts) {
    auto console = makeConsole(echoBody);

    for (const std::string text : {"", "   ", "\n\t  \n"})
    {
        try
        {
            console->submit(text);
            FAIL() << "expected InvalidInput for '" << text << "'";
        }
        catch (const ConsoleError &e)
        {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
        }
    }
    EXPECT_TRUE(console->jobs().empty());
}

TEST_F(ScriptConsoleTest, RejectsOversizedScript) {
    ConsoleConfig config;
    config.maxScriptBytes = 10;
    auto console = makeConsole(echoBody, config);

    try
    {
        console->submit(std::string(11, 'x'));
        FAIL() << "expected InvalidInput";
    }
    catch (const ConsoleError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
    }

    JobId id = console->submit(std::string(10, 'x'));
    EXPECT_TRUE(console->waitForTerminal(id, kTimeout));
}

TEST_F(ScriptConsoleTest, CompletedJobKeepsOutput) {
    auto console = makeConsole(echoBody);

    JobId id = console->submit("print('hi')\n");
    EXPECT_EQ(id, 1u);
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));

    auto job = console->poll(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Completed);
    EXPECT_EQ(job->sourceText, "print('hi')\n");
    EXPECT_EQ(job->outputText(), "print('hi')\n");
    EXPECT_FALSE(job->error.has_value());
    EXPECT_TRUE(job->startedAt.has_value());
    EXPECT_TRUE(job->finishedAt.has_value());
    EXPECT_FALSE(console->runningJob().has_value());
}

TEST_F(ScriptConsoleTest, RunsJobsOneAtATimeInSubmissionOrder) {
    std::mutex mutex;
    std::vector<std::string> seen;
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};

    auto console = makeConsole([&](const std::string &source, const ChunkSink &, const CancelToken &) {
        int now = ++active;
        int prev = maxActive.load();
        while (now > prev && !maxActive.compare_exchange_weak(prev, now)) {}
        {
            std::lock_guard<std::mutex> l(mutex);
            seen.push_back(source);
        }
        std::this_thread::sleep_for(5ms);
        --active;
        return ExecutionOutcome::completed();
    });

    JobId a = console->submit("a");
    JobId b = console->submit("b");
    JobId c = console->submit("c");
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    ASSERT_TRUE(console->waitForTerminal(c, kTimeout));
    ASSERT_TRUE(console->waitForTerminal(a, kTimeout));
    ASSERT_TRUE(console->waitForTerminal(b, kTimeout));

    std::lock_guard<std::mutex> l(mutex);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(maxActive.load(), 1);
}

TEST_F(ScriptConsoleTest, BusyWhenQueueingDisabled) {
    Gate gate;
    ConsoleConfig config;
    config.queueEnabled = false;
    auto console = makeConsole([&](const std::string &, const ChunkSink &, const CancelToken &cancel) {
        gate.wait(cancel);
        return ExecutionOutcome::completed();
    }, config);

    JobId first = console->submit("first");
    try
    {
        console->submit("second");
        FAIL() << "expected Busy";
    }
    catch (const ConsoleError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Busy);
    }
    EXPECT_EQ(console->jobs().size(), 1u);

    gate.open();
    ASSERT_TRUE(console->waitForTerminal(first, kTimeout));
    JobId second = console->submit("second");
    EXPECT_TRUE(console->waitForTerminal(second, kTimeout));
}

TEST_F(ScriptConsoleTest, CancelPendingJobNeverRuns) {
    Gate gate;
    std::mutex mutex;
    std::vector<std::string> seen;
    auto console = makeConsole([&](const std::string &source, const ChunkSink &, const CancelToken &cancel) {
        {
            std::lock_guard<std::mutex> l(mutex);
            seen.push_back(source);
        }
        gate.wait(cancel);
        return ExecutionOutcome::completed();
    });

    JobId first = console->submit("first");
    JobId second = console->submit("second");
    ASSERT_TRUE(waitUntil([&] { return isRunning(*console, first); }));

    EXPECT_TRUE(console->cancel(second));
    auto job = console->poll(second);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Cancelled);
    EXPECT_TRUE(job->outputLog.empty());
    EXPECT_EQ(console->pendingCount(), 0u);

    gate.open();
    ASSERT_TRUE(console->waitForTerminal(first, kTimeout));
    EXPECT_EQ(console->poll(first)->state, JobState::Completed);

    std::lock_guard<std::mutex> l(mutex);
    EXPECT_EQ(seen, std::vector<std::string>{"first"});
}

TEST_F(ScriptConsoleTest, CancelRunningJob) {
    auto console = makeConsole(spinBody);

    JobId id = console->submit("loop");
    ASSERT_TRUE(waitUntil([&] { return isRunning(*console, id); }));

    EXPECT_TRUE(console->cancel(id));
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    auto job = console->poll(id);
    EXPECT_EQ(job->state, JobState::Cancelled);
    EXPECT_FALSE(job->error.has_value());
    EXPECT_FALSE(console->runningJob().has_value());
}

TEST_F(ScriptConsoleTest, CancelledJobStaysCancelledEvenIfScriptFinishes) {
    auto console = makeConsole([](const std::string &, const ChunkSink &, const CancelToken &cancel) {
        while (!cancel.isCancelRequested())
            std::this_thread::sleep_for(2ms);
        return ExecutionOutcome::completed();
    });

    JobId id = console->submit("x");
    ASSERT_TRUE(waitUntil([&] { return isRunning(*console, id); }));
    console->cancel(id);
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    EXPECT_EQ(console->poll(id)->state, JobState::Cancelled);
}

TEST_F(ScriptConsoleTest, CancelIsIdempotentOnFinishedOrUnknownJobs) {
    auto console = makeConsole(echoBody);

    JobId id = console->submit("done");
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));

    EXPECT_FALSE(console->cancel(id));
    EXPECT_FALSE(console->cancel(id + 100));
    EXPECT_EQ(console->poll(id)->state, JobState::Completed);
    EXPECT_FALSE(console->waitForTerminal(id + 100, 10ms));
}

TEST_F(ScriptConsoleTest, CancelAllStopsRunningAndPending) {
    auto console = makeConsole(spinBody);

    JobId a = console->submit("a");
    JobId b = console->submit("b");
    JobId c = console->submit("c");
    ASSERT_TRUE(waitUntil([&] { return isRunning(*console, a); }));

    console->cancelAll();
    EXPECT_EQ(console->pendingCount(), 0u);
    for (JobId id : {a, b, c})
    {
        ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
        EXPECT_EQ(console->poll(id)->state, JobState::Cancelled) << "job " << id;
    }
}

TEST_F(ScriptConsoleTest, FailureKeepsOutputAndMessage) {
    auto console = makeConsole([](const std::string &, const ChunkSink &sink, const CancelToken &) {
        sink(OutputStream::Stdout, "partial\n");
        return ExecutionOutcome::failed("ValueError: x");
    });

    JobId id = console->submit("boom");
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    auto job = console->poll(id);
    EXPECT_EQ(job->state, JobState::Failed);
    ASSERT_TRUE(job->error.has_value());
    EXPECT_EQ(*job->error, "ValueError: x");
    EXPECT_EQ(job->outputText(), "partial\n");
}

TEST_F(ScriptConsoleTest, ExecutorExceptionFailsOnlyThatJob) {
    std::atomic<int> calls{0};
    auto console = makeConsole([&](const std::string &source, const ChunkSink &sink, const CancelToken &) {
        if (calls++ == 0)
            throw std::runtime_error("boom");
        sink(OutputStream::Stdout, source);
        return ExecutionOutcome::completed();
    });

    JobId bad = console->submit("bad");
    JobId good = console->submit("good");
    ASSERT_TRUE(console->waitForTerminal(good, kTimeout));

    auto failed = console->poll(bad);
    EXPECT_EQ(failed->state, JobState::Failed);
    ASSERT_TRUE(failed->error.has_value());
    EXPECT_NE(failed->error->find("boom"), std::string::npos);
    EXPECT_EQ(console->poll(good)->state, JobState::Completed);
}

TEST_F(ScriptConsoleTest, PollSnapshotsArePrefixesOfFinalOutput) {
    Gate gate;
    auto console = makeConsole([&](const std::string &, const ChunkSink &sink, const CancelToken &cancel) {
        sink(OutputStream::Stdout, "1\n");
        sink(OutputStream::Stderr, "warn\n");
        gate.wait(cancel);
        sink(OutputStream::Stdout, "2\n");
        return ExecutionOutcome::completed();
    });

    JobId id = console->submit("x");
    ASSERT_TRUE(waitUntil([&] {
        auto job = console->poll(id);
        return job && job->outputLog.size() == 2;
    }));
    auto midway = console->poll(id);
    EXPECT_EQ(midway->state, JobState::Running);

    gate.open();
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    auto done = console->poll(id);
    ASSERT_GE(done->outputLog.size(), midway->outputLog.size());
    for (size_t i = 0; i < midway->outputLog.size(); ++i)
    {
        EXPECT_EQ(done->outputLog[i].stream, midway->outputLog[i].stream);
        EXPECT_EQ(done->outputLog[i].text, midway->outputLog[i].text);
    }
    EXPECT_EQ(done->outputText(OutputStream::Stdout), "1\n2\n");
    EXPECT_EQ(done->outputText(OutputStream::Stderr), "warn\n");
}

TEST_F(ScriptConsoleTest, ListenersRunOnlyInDispatchAndInOrder) {
    auto console = makeConsole([](const std::string &, const ChunkSink &sink, const CancelToken &) {
        sink(OutputStream::Stdout, "a");
        sink(OutputStream::Stderr, "b");
        return ExecutionOutcome::completed();
    });

    std::vector<std::string> events;
    console->onOutput([&](JobId id, const OutputChunk &chunk) {
        events.push_back("out:" + std::to_string(id) + ":" + toString(chunk.stream) + ":" + chunk.text);
    });
    console->onStateChanged([&](JobId id, JobState state, const std::string &) {
        events.push_back("state:" + std::to_string(id) + ":" + toString(state));
    });

    JobId id = console->submit("x");
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    EXPECT_TRUE(events.empty());

    EXPECT_EQ(console->dispatchPending(), 5u);
    EXPECT_EQ(events, (std::vector<std::string>{
                          "state:1:Pending",
                          "state:1:Running",
                          "out:1:stdout:a",
                          "out:1:stderr:b",
                          "state:1:Completed",
                      }));
    EXPECT_EQ(console->dispatchPending(), 0u);
}

TEST_F(ScriptConsoleTest, ThrowingListenerDoesNotStopDispatch) {
    auto console = makeConsole(echoBody);

    std::vector<JobState> states;
    console->onStateChanged([](JobId, JobState, const std::string &) { throw std::runtime_error("listener bug"); });
    console->onStateChanged([&](JobId, JobState state, const std::string &) { states.push_back(state); });

    JobId id = console->submit("x");
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    EXPECT_NO_THROW(console->dispatchPending());
    EXPECT_EQ(states, (std::vector<JobState>{JobState::Pending, JobState::Running, JobState::Completed}));
}

TEST_F(ScriptConsoleTest, NonStandardListenerExceptionIsContained) {
    auto console = makeConsole(echoBody);

    std::vector<JobState> states;
    std::string output;
    console->onStateChanged([](JobId, JobState, const std::string &) { throw 42; });
    console->onStateChanged([&](JobId, JobState state, const std::string &) { states.push_back(state); });
    console->onOutput([&](JobId, const OutputChunk &chunk) { output += chunk.text; });

    JobId id = console->submit("x");
    ASSERT_TRUE(console->waitForTerminal(id, kTimeout));
    EXPECT_NO_THROW(console->dispatchPending());
    EXPECT_EQ(states, (std::vector<JobState>{JobState::Pending, JobState::Running, JobState::Completed}));
    EXPECT_EQ(output, "x");
}

TEST_F(ScriptConsoleTest, FailureMessageSurvivesRetention) {
    ConsoleConfig config;
    config.retainedJobs = 1;
    auto console = makeConsole([](const std::string &source, const ChunkSink &, const CancelToken &) {
        if (source == "bad")
            return ExecutionOutcome::failed("ValueError: x");
        return ExecutionOutcome::completed();
    }, config);

    std::map<JobId, std::string> errors;
    console->onStateChanged([&](JobId id, JobState state, const std::string &error) {
        if (state == JobState::Failed)
            errors[id] = error;
        else
            EXPECT_TRUE(error.empty());
    });

    JobId bad = console->submit("bad");
    JobId good = console->submit("good");
    ASSERT_TRUE(console->waitForTerminal(good, kTimeout));
    ASSERT_FALSE(console->poll(bad).has_value());

    console->dispatchPending();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[bad], "ValueError: x");
}

TEST_F(ScriptConsoleTest, RetentionDropsOldestFinishedJobs) {
    ConsoleConfig config;
    config.retainedJobs = 2;
    auto console = makeConsole(echoBody, config);

    std::vector<JobId> ids;
    for (const char *text : {"one", "two", "three"})
    {
        ids.push_back(console->submit(text));
        ASSERT_TRUE(console->waitForTerminal(ids.back(), kTimeout));
    }

    EXPECT_FALSE(console->poll(ids[0]).has_value());
    EXPECT_TRUE(console->poll(ids[1]).has_value());
    EXPECT_TRUE(console->poll(ids[2]).has_value());
    EXPECT_EQ(console->jobs().size(), 2u);
}

TEST_F(ScriptConsoleTest, RetentionZeroKeepsEverything) {
    ConsoleConfig config;
    config.retainedJobs = 0;
    auto console = makeConsole(echoBody, config);

    JobId last = 0;
    for (int i = 0; i < 5; ++i)
    {
        last = console->submit("job " + std::to_string(i));
        ASSERT_TRUE(console->waitForTerminal(last, kTimeout));
    }
    EXPECT_EQ(console->jobs().size(), 5u);
    EXPECT_TRUE(console->poll(1).has_value());
}

TEST_F(ScriptConsoleTest, DestructorCancelsRunningScript) {
    std::atomic<bool> sawCancel{false};
    {
        auto console = makeConsole([&](const std::string &, const ChunkSink &, const CancelToken &cancel) {
            while (!cancel.isCancelRequested())
                std::this_thread::sleep_for(2ms);
            sawCancel = true;
            return ExecutionOutcome::cancelled();
        });
        JobId id = console->submit("forever");
        console->submit("never");
        ASSERT_TRUE(waitUntil([&] { return isRunning(*console, id); }));
    }
    EXPECT_TRUE(sawCancel.load());
}

TEST_F(ScriptConsoleTest, RejectsMissingExecutor) {
    EXPECT_THROW({ ScriptConsole console(ConsoleConfig{}, nullptr); }, std::invalid_argument);
}
