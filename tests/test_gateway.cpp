#include <gtest/gtest.h>
#include "fakes.hpp"
#include <platform/platform.hpp>
#include <ssh/gateway.hpp>
#include <ssh/session_manager.hpp>

// ── parse ───────────────────────────────────────────────────

TEST(GatewayParse, HostOnly) {
    auto gw = GatewayConfigurator::parse("bastion.example.com");
    EXPECT_EQ(gw.host, "bastion.example.com");
    EXPECT_FALSE(gw.user.has_value());
    EXPECT_FALSE(gw.port.has_value());
}

TEST(GatewayParse, UserHostPort) {
    auto gw = GatewayConfigurator::parse("ops@bastion:2222");
    EXPECT_EQ(gw.host, "bastion");
    EXPECT_EQ(gw.user.value_or(""), "ops");
    EXPECT_EQ(gw.port.value_or(0), 2222);
}

TEST(GatewayParse, Rejects) {
    EXPECT_THROW(GatewayConfigurator::parse(""), ConfigurationError);
    EXPECT_THROW(GatewayConfigurator::parse("ops@"), ConfigurationError);
    EXPECT_THROW(GatewayConfigurator::parse("bastion:ssh"), ConfigurationError);
    EXPECT_THROW(GatewayConfigurator::parse("bastion:70000"), ConfigurationError);
}

// ── configure / retry ───────────────────────────────────────

class GatewayTest : public ::testing::Test {
protected:
    FakeTransport transport;
    std::vector<std::string> prompts;

    std::unique_ptr<SessionManager> make() {
        return std::make_unique<SessionManager>(transport, [this](const std::string& p) {
            prompts.push_back(p);
            return std::string("gw-pass");
        });
    }
};

TEST_F(GatewayTest, UserDefaultsToSshUser) {
    auto sessions = make();
    SessionOptions opts;
    opts.user = "deploy";
    GatewayConfigurator::configure(*sessions, "bastion", opts);

    ASSERT_EQ(transport.gateway_attempts.size(), 1u);
    EXPECT_EQ(transport.gateway_attempts[0].user, "deploy");
    EXPECT_EQ(transport.gateway_attempts[0].port, 22);
    EXPECT_TRUE(prompts.empty());
}

TEST_F(GatewayTest, PortComesFromGatewaySpecOnly) {
    auto sessions = make();
    SessionOptions opts;
    opts.port = 2200;
    GatewayConfigurator::configure(*sessions, "ops@bastion:2022", opts);
    EXPECT_EQ(transport.gateway_attempts[0].user, "ops");
    EXPECT_EQ(transport.gateway_attempts[0].port, 2022);

    GatewayConfigurator::configure(*sessions, "ops@bastion", opts);
    EXPECT_EQ(transport.gateway_attempts[1].port, 22);
}

TEST_F(GatewayTest, FirstAuthFailurePromptsOnce) {
    transport.gateway_auth_failures = 1;
    auto sessions = make();
    SessionOptions opts;
    opts.user = "deploy";
    GatewayConfigurator::configure(*sessions, "bastion", opts);

    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0], "Enter the password for deploy@bastion: ");
    ASSERT_EQ(transport.gateway_attempts.size(), 2u);
    EXPECT_FALSE(transport.gateway_attempts[0].password.has_value());
    EXPECT_EQ(transport.gateway_attempts[1].password.value_or(""), "gw-pass");
}

TEST_F(GatewayTest, EmptyUserPromptsForLocalUser) {
    transport.gateway_auth_failures = 1;
    auto sessions = make();
    GatewayConfigurator::configure(*sessions, "bastion", SessionOptions{});

    const std::string local = platform::user_name();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0], "Enter the password for " + local + "@bastion: ");
    EXPECT_EQ(transport.gateway_attempts[0].user, local);
}

TEST_F(GatewayTest, SecondAuthFailurePropagates) {
    transport.gateway_auth_failures = 2;
    auto sessions = make();
    SessionOptions opts;
    opts.user = "deploy";

    EXPECT_THROW(GatewayConfigurator::configure(*sessions, "bastion", opts),
                 AuthenticationError);
    EXPECT_EQ(prompts.size(), 1u);
    EXPECT_EQ(transport.gateway_attempts.size(), 2u);
}
