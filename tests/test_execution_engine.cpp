#include <gtest/gtest.h>
#include "fakes.hpp"
#include <cli/output_formatter.hpp>
#include <exec/execution_engine.hpp>
#include <ssh/session_manager.hpp>
#include <chrono>
#include <sstream>

class ExecutionEngineTest : public ::testing::Test {
protected:
    FakeTransport transport;
    std::ostringstream out;
    int prompts = 0;

    PasswordPrompt prompt() {
        return [this](const std::string&) {
            ++prompts;
            return std::string("s3cret");
        };
    }

    // Connects a pool over the given hosts.
    std::unique_ptr<SessionManager> pool(const std::vector<std::string>& hosts,
                                         ErrorPolicy policy = ErrorPolicy::kSkip,
                                         int concurrency = 0) {
        auto sessions = std::make_unique<SessionManager>(transport, prompt());
        SessionOptions opts;
        opts.on_error = policy;
        opts.concurrency = concurrency;
        sessions->configure(targets(hosts), opts);
        sessions->connect();
        return sessions;
    }

    FakeHost& host(SessionManager& sessions, const std::string& name) {
        return *dynamic_cast<FakeHost*>(sessions.find(name));
    }
};

TEST_F(ExecutionEngineTest, LabelsAlignAcrossHosts) {
    for (const char* h : {"a", "bb", "ccc"}) transport.scripts[h] = {{"hi\n"}, 0};
    auto sessions = pool({"a", "bb", "ccc"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_EQ(engine.run("echo hi"), 0);
    EXPECT_EQ(out.str(), "a   hi\nbb  hi\nccc hi\n");
}

TEST_F(ExecutionEngineTest, ExitStatusIsMaximum) {
    transport.scripts["h1"] = {{}, 0};
    transport.scripts["h2"] = {{}, 3};
    transport.scripts["h3"] = {{}, 1};
    auto sessions = pool({"h1", "h2", "h3"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_EQ(engine.run("false"), 3);
    EXPECT_EQ(engine.last_result().exit_status, 3);
}

TEST_F(ExecutionEngineTest, NoHostsMeansZero) {
    auto sessions = pool({"h1"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());
    EXPECT_EQ(engine.run("true", {}), 0);
}

TEST_F(ExecutionEngineTest, ChunksSplitAcrossReads) {
    transport.scripts["web"] = {{"par", "tial\nnext", " line\n"}, 0};
    auto sessions = pool({"web"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("cat");
    EXPECT_EQ(out.str(), "web partial\nweb next line\n");
}

TEST_F(ExecutionEngineTest, UnterminatedOutputIsNotFlushed) {
    transport.scripts["web"] = {{"line\nno newline"}, 0};
    auto sessions = pool({"web"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("printf");
    EXPECT_EQ(out.str(), "web line\n");
    EXPECT_EQ(fmt.pending("web"), "no newline");
}

// ── sudo ────────────────────────────────────────────────────

TEST_F(ExecutionEngineTest, SudoCommandIsRewritten) {
    auto sessions = pool({"h1"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("sudo whoami");
    ASSERT_EQ(host(*sessions, "h1").commands.size(), 1u);
    EXPECT_EQ(host(*sessions, "h1").commands[0],
              "sudo -p 'fleetsh sudo password: ' whoami");
}

TEST_F(ExecutionEngineTest, SudoPromptAnsweredOnThatHostOnly) {
    transport.scripts["a"] = {{"fleetsh sudo password: ", "root\n"}, 0};
    transport.scripts["b"] = {{"other\n"}, 0};
    auto sessions = pool({"a", "b"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_EQ(engine.run("sudo whoami"), 0);

    ASSERT_EQ(host(*sessions, "a").writes().size(), 1u);
    EXPECT_EQ(host(*sessions, "a").writes()[0], "s3cret\n");
    EXPECT_TRUE(host(*sessions, "b").writes().empty());
    EXPECT_EQ(prompts, 1);
    EXPECT_EQ(out.str(), "a fleetsh sudo password: \nb other\na root\n");
}

TEST_F(ExecutionEngineTest, SudoPasswordIsCachedAcrossHosts) {
    transport.scripts["a"] = {{"fleetsh sudo password: "}, 0};
    transport.scripts["b"] = {{"fleetsh sudo password: "}, 0};
    auto sessions = pool({"a", "b"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("sudo true");
    EXPECT_EQ(prompts, 1);
    EXPECT_EQ(host(*sessions, "a").writes().size(), 1u);
    EXPECT_EQ(host(*sessions, "b").writes().size(), 1u);
}

TEST_F(ExecutionEngineTest, SudoMarkerSplitAcrossChunks) {
    transport.scripts["a"] = {{"fleetsh sudo ", "password: "}, 0};
    auto sessions = pool({"a"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("sudo true");
    EXPECT_EQ(host(*sessions, "a").writes().size(), 1u);
}

TEST_F(ExecutionEngineTest, SudoMarkerAfterPartialLine) {
    transport.scripts["a"] = {{"[sudo] ", "fleetsh sudo password: ", "ok\n"}, 0};
    auto sessions = pool({"a"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("sudo true");
    ASSERT_EQ(host(*sessions, "a").writes().size(), 1u);
    EXPECT_EQ(host(*sessions, "a").writes()[0], "s3cret\n");
}

// ── channel start ───────────────────────────────────────────

TEST_F(ExecutionEngineTest, SlowExecDoesNotHoldUpOtherHosts) {
    std::vector<std::string> names = {"h1", "h2", "h3", "h4"};
    for (const auto& h : names) {
        transport.scripts[h] = {{"hi\n"}, 0};
        transport.scripts[h].exec_delay_ms = 300;
    }
    auto sessions = pool(names);
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(engine.run("echo hi"), 0);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);

    EXPECT_EQ(transport.exec_gauge->peak.load(), 4);
    EXPECT_LT(elapsed.count(), 900);
    for (const auto& h : names) {
        EXPECT_NE(out.str().find(h + " hi\n"), std::string::npos);
    }
}

TEST_F(ExecutionEngineTest, ConcurrencyLimitDoesNotSerializeChannelStart) {
    std::vector<std::string> names = {"h1", "h2", "h3"};
    for (const auto& h : names) transport.scripts[h].exec_delay_ms = 200;
    auto sessions = pool(names, ErrorPolicy::kSkip, 1);
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("true");
    EXPECT_EQ(transport.exec_gauge->peak.load(), 3);
    for (const auto& h : names) EXPECT_EQ(host(*sessions, h).commands.size(), 1u);
}

// ── subsets and failures ────────────────────────────────────

TEST_F(ExecutionEngineTest, SubsetRunsOnNamedHostsOnly) {
    auto sessions = pool({"h1", "h2", "h3"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    engine.run("uptime", {sessions->find("h1"), sessions->find("h3")});
    EXPECT_EQ(host(*sessions, "h1").commands.size(), 1u);
    EXPECT_TRUE(host(*sessions, "h2").commands.empty());
    EXPECT_EQ(host(*sessions, "h3").commands.size(), 1u);
}

TEST_F(ExecutionEngineTest, RefusedExecIsFatal) {
    transport.scripts["h2"].refuse_exec = true;
    auto sessions = pool({"h1", "h2"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_THROW(engine.run("uptime"), ExecutionError);
}

TEST_F(ExecutionEngineTest, ReadFailureSkippedUnderSkipPolicy) {
    transport.scripts["h1"] = {{"ok\n"}, 2};
    transport.scripts["h2"].fail_read = true;
    auto sessions = pool({"h1", "h2"});
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_EQ(engine.run("uptime"), 2);
    ASSERT_EQ(engine.last_result().errors.size(), 1u);
    EXPECT_NE(engine.last_result().errors[0].find("h2"), std::string::npos);
}

TEST_F(ExecutionEngineTest, ReadFailureRaisedUnderRaisePolicy) {
    transport.scripts["h2"].fail_read = true;
    auto sessions = pool({"h1", "h2"}, ErrorPolicy::kRaise);
    OutputFormatter fmt(out, sessions->longest_label(), false);
    ExecutionEngine engine(*sessions, fmt, prompt());

    EXPECT_THROW(engine.run("uptime"), ConnectionError);
}
