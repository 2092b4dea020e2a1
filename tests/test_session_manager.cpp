#include <gtest/gtest.h>
#include "fakes.hpp"
#include <ssh/session_manager.hpp>

class SessionManagerTest : public ::testing::Test {
protected:
    FakeTransport transport;
    int prompts = 0;

    std::unique_ptr<SessionManager> make() {
        return std::make_unique<SessionManager>(transport, [this](const std::string&) {
            ++prompts;
            return std::string("pw");
        });
    }
};

// ── configure ───────────────────────────────────────────────

TEST_F(SessionManagerTest, NoTargetsNoMatches) {
    auto sessions = make();
    ResolvedTargets none;
    try {
        sessions->configure(none, SessionOptions{});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(), "No nodes returned from search!");
    }
}

TEST_F(SessionManagerTest, MatchesWithoutAttribute) {
    auto sessions = make();
    ResolvedTargets resolved;
    resolved.matched = 3;
    try {
        sessions->configure(resolved, SessionOptions{});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        std::string msg = e.what();
        EXPECT_EQ(msg.rfind("3 nodes found, but does not have the required attribute", 0), 0u);
        EXPECT_NE(msg.find("--attribute"), std::string::npos);
    }
}

TEST_F(SessionManagerTest, SingleMatchWithoutAttribute) {
    auto sessions = make();
    ResolvedTargets resolved;
    resolved.matched = 1;
    try {
        sessions->configure(resolved, SessionOptions{});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("1 node found,", 0), 0u);
    }
}

TEST_F(SessionManagerTest, LongestLabelTracksTargets) {
    auto sessions = make();
    sessions->configure(targets({"a", "ccc", "bb"}), SessionOptions{});
    EXPECT_EQ(sessions->longest_label(), 3u);

    sessions->add("web-frontend-01", SessionOptions{});
    EXPECT_EQ(sessions->longest_label(), 15u);
    EXPECT_EQ(sessions->specs().size(), 4u);
}

TEST_F(SessionManagerTest, OptionsApplyToEverySpec) {
    auto sessions = make();
    SessionOptions opts;
    opts.user = "deploy";
    opts.port = 2222;
    opts.forward_agent = true;
    opts.verify_host_key = false;
    sessions->configure(targets({"h1", "h2"}), opts);

    for (const auto& spec : sessions->specs()) {
        EXPECT_EQ(spec.user, "deploy");
        EXPECT_EQ(spec.port, 2222);
        EXPECT_TRUE(spec.forward_agent);
        EXPECT_FALSE(spec.verify_host_key);
    }
    EXPECT_EQ(sessions->specs()[0].display(), "deploy@h1");
}

// ── connect ─────────────────────────────────────────────────

TEST_F(SessionManagerTest, ConnectKeepsOrderAndIndexesHosts) {
    auto sessions = make();
    sessions->configure(targets({"h1", "h2", "h3", "h4"}), SessionOptions{});
    sessions->connect();

    auto hosts = sessions->hosts();
    ASSERT_EQ(hosts.size(), 4u);
    EXPECT_EQ(hosts[0]->host(), "h1");
    EXPECT_EQ(hosts[3]->host(), "h4");
    EXPECT_EQ(sessions->find("h2"), hosts[1]);
    EXPECT_EQ(sessions->find("nope"), nullptr);
}

TEST_F(SessionManagerTest, ConcurrencyLimitStillConnectsAll) {
    auto sessions = make();
    SessionOptions opts;
    opts.concurrency = 2;
    sessions->configure(targets({"h1", "h2", "h3", "h4", "h5"}), opts);
    sessions->connect();
    EXPECT_EQ(sessions->hosts().size(), 5u);
    EXPECT_EQ(transport.connected.size(), 5u);
}

TEST_F(SessionManagerTest, SkipPolicyDropsFailedHosts) {
    transport.unreachable = {"h2"};
    transport.bad_credentials = {"h3"};
    auto sessions = make();
    sessions->configure(targets({"h1", "h2", "h3", "h4"}), SessionOptions{});
    sessions->connect();

    auto hosts = sessions->hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0]->host(), "h1");
    EXPECT_EQ(hosts[1]->host(), "h4");
    EXPECT_EQ(sessions->find("h2"), nullptr);
}

TEST_F(SessionManagerTest, RaisePolicyAbortsSetup) {
    transport.unreachable = {"h2"};
    auto sessions = make();
    SessionOptions opts;
    opts.on_error = ErrorPolicy::kRaise;
    opts.concurrency = 1;
    sessions->configure(targets({"h1", "h2", "h3"}), opts);

    EXPECT_THROW(sessions->connect(), ConnectionError);
    EXPECT_TRUE(sessions->hosts().empty());
    // One worker: h3 is never attempted after h2 fails
    EXPECT_EQ(transport.connected.size(), 2u);
}

TEST_F(SessionManagerTest, CloseIsIdempotent) {
    auto sessions = make();
    sessions->configure(targets({"h1"}), SessionOptions{});
    sessions->connect();
    ASSERT_NE(sessions->find("h1"), nullptr);

    sessions->close();
    sessions->close();
    EXPECT_TRUE(sessions->hosts().empty());
    EXPECT_TRUE(transport.closed);
}
