#include <gtest/gtest.h>
#include <core/config.hpp>

TEST(Config, EmptyYieldsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_FALSE(c.ssh_user().has_value());
    EXPECT_FALSE(c.on_error().has_value());
    EXPECT_EQ(c.tmux().pane_layout, "tiled");
    EXPECT_FALSE(c.tmux().use_panes);
    EXPECT_TRUE(c.tmux().sync_panes);
    EXPECT_EQ(c.tmux().sync_panes_key, "s");
}

TEST(Config, MissingFileYieldsDefaults) {
    auto r = Config::load_from("/nonexistent/fleetsh/config.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.ssh_gateway().has_value());
}

TEST(Config, AllKeys) {
    auto r = Config::parse(R"(
ssh_user: " deploy "
ssh_attribute: ipaddress
ssh_port: 2222
ssh_gateway: ops@bastion:22
identity_file: ~/.ssh/fleet
host_key_verify: false
concurrency: 8
on_error: raise
inventory: /etc/fleetsh/nodes.yaml
tmux:
  pane_layout: even-vertical
  use_panes: true
  sync_panes: false
  sync_panes_key: y
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.ssh_user().value_or(""), "deploy");
    EXPECT_EQ(c.ssh_attribute().value_or(""), "ipaddress");
    EXPECT_EQ(c.ssh_port().value_or(0), 2222);
    EXPECT_EQ(c.ssh_gateway().value_or(""), "ops@bastion:22");
    EXPECT_EQ(c.identity_file().value_or(""), "~/.ssh/fleet");
    EXPECT_EQ(c.host_key_verify().value_or(true), false);
    EXPECT_EQ(c.concurrency().value_or(0), 8);
    EXPECT_EQ(c.on_error().value_or(ErrorPolicy::kSkip), ErrorPolicy::kRaise);
    EXPECT_EQ(c.inventory().value_or(""), "/etc/fleetsh/nodes.yaml");
    EXPECT_EQ(c.tmux().pane_layout, "even-vertical");
    EXPECT_TRUE(c.tmux().use_panes);
    EXPECT_FALSE(c.tmux().sync_panes);
    EXPECT_EQ(c.tmux().sync_panes_key, "y");
}

TEST(Config, LegacyKeyNames) {
    auto r = Config::parse("ssh_identity_file: /k\nssh_tmux:\n  use_panes: true\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.identity_file().value_or(""), "/k");
    EXPECT_TRUE(r.value.tmux().use_panes);
}

TEST(Config, InvalidErrorPolicy) {
    auto r = Config::parse("on_error: ignore\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("on_error"), std::string::npos);
}

TEST(Config, NotAMap) {
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
    EXPECT_TRUE(Config::parse("ssh_port: [1, 2]\n").is_err());
}

TEST(Config, ParseErrorPolicy) {
    EXPECT_TRUE(parse_error_policy("skip") == ErrorPolicy::kSkip);
    EXPECT_TRUE(parse_error_policy("raise") == ErrorPolicy::kRaise);
    EXPECT_FALSE(parse_error_policy("Skip").has_value());
}
