#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <inventory/host_resolver.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* kInventory = R"(
- name: web1
  fqdn: web1.example.com
  ipaddress: 10.0.0.1
  roles: [web, base]
  env: prod
- name: web2
  fqdn: web2.example.com
  ipaddress: 10.0.0.2
  roles: [web]
  env: staging
  cloud:
    public_hostname: ec2-2.compute.amazonaws.com
- name: db1
  ipaddress: 10.0.1.1
  roles: [db]
  env: prod
  network:
    private: db1.internal
)";

class HostResolverTest : public ::testing::Test {
protected:
    HostResolver resolver{YAML::Load(kInventory)};
    AttributeSelection fqdn = select_attribute(std::nullopt, std::nullopt);
};

// ── manual ──────────────────────────────────────────────────

TEST(HostResolverManual, SplitsOnWhitespace) {
    auto r = HostResolver::manual("  a.example.com b.example.com\tc ");
    ASSERT_EQ(r.targets.size(), 3u);
    EXPECT_EQ(r.targets[0], "a.example.com");
    EXPECT_EQ(r.targets[2], "c");
    EXPECT_EQ(r.matched, 3u);
}

TEST(HostResolverManual, EmptyList) {
    auto r = HostResolver::manual("   ");
    EXPECT_TRUE(r.targets.empty());
    EXPECT_EQ(r.matched, 0u);
}

// ── attribute selection ─────────────────────────────────────

TEST(AttributeSelection, DefaultIsFqdnWithoutOverride) {
    auto a = select_attribute(std::nullopt, std::nullopt);
    EXPECT_EQ(a.attribute, "fqdn");
    EXPECT_FALSE(a.override_attribute.has_value());
}

TEST(AttributeSelection, CommandLineSetsOverride) {
    auto a = select_attribute(std::string("ipaddress"), std::nullopt);
    EXPECT_EQ(a.override_attribute.value_or(""), "ipaddress");
    EXPECT_EQ(a.attribute, "ipaddress");
}

TEST(AttributeSelection, ConfigWinsForAttribute) {
    auto a = select_attribute(std::string("ipaddress"), std::string(" hostname "));
    EXPECT_EQ(a.override_attribute.value_or(""), "ipaddress");
    EXPECT_EQ(a.attribute, "hostname");
}

// ── search ──────────────────────────────────────────────────

TEST_F(HostResolverTest, MatchAll) {
    auto r = resolver.search("*:*", fqdn);
    EXPECT_EQ(r.matched, 3u);
    // db1 has no fqdn; web2 prefers its cloud hostname
    ASSERT_EQ(r.targets.size(), 2u);
    EXPECT_EQ(r.targets[0], "web1.example.com");
    EXPECT_EQ(r.targets[1], "ec2-2.compute.amazonaws.com");
}

TEST_F(HostResolverTest, SequenceMembership) {
    auto nodes = resolver.query("roles:web");
    EXPECT_EQ(nodes.size(), 2u);
}

TEST_F(HostResolverTest, GlobAndConjunction) {
    EXPECT_EQ(resolver.query("name:web*").size(), 2u);
    EXPECT_EQ(resolver.query("name:web* AND env:prod").size(), 1u);
    EXPECT_EQ(resolver.query("roles:db AND env:staging").size(), 0u);
}

TEST_F(HostResolverTest, NestedPathInQuery) {
    auto nodes = resolver.query("network.private:*.internal");
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(HostResolver::extract_nested_value(nodes[0], "name").value_or(""), "db1");
}

TEST_F(HostResolverTest, OverrideBeatsCloudHostname) {
    auto attrs = select_attribute(std::string("ipaddress"), std::nullopt);
    auto r = resolver.search("roles:web", attrs);
    ASSERT_EQ(r.targets.size(), 2u);
    EXPECT_EQ(r.targets[1], "10.0.0.2");
}

TEST_F(HostResolverTest, NestedOverride) {
    auto attrs = select_attribute(std::string("network.private"), std::nullopt);
    auto r = resolver.search("roles:db", attrs);
    ASSERT_EQ(r.targets.size(), 1u);
    EXPECT_EQ(r.targets[0], "db1.internal");
}

TEST_F(HostResolverTest, MatchedButMissingAttribute) {
    auto r = resolver.search("roles:db", fqdn);
    EXPECT_EQ(r.matched, 1u);
    EXPECT_TRUE(r.targets.empty());
}

TEST_F(HostResolverTest, NothingMatched) {
    auto r = resolver.search("roles:cache", fqdn);
    EXPECT_EQ(r.matched, 0u);
    EXPECT_TRUE(r.targets.empty());
}

TEST_F(HostResolverTest, BadQuery) {
    EXPECT_THROW(resolver.query("web"), ConfigurationError);
    EXPECT_THROW(resolver.query(""), ConfigurationError);
}

TEST(HostResolverExtract, MissingAndNonScalar) {
    auto node = YAML::Load("{a: {b: 1}, list: [x]}");
    EXPECT_EQ(HostResolver::extract_nested_value(node, "a.b").value_or(""), "1");
    EXPECT_FALSE(HostResolver::extract_nested_value(node, "a").has_value());
    EXPECT_FALSE(HostResolver::extract_nested_value(node, "a.c").has_value());
    EXPECT_FALSE(HostResolver::extract_nested_value(node, "list.x").has_value());
}

// ── load ────────────────────────────────────────────────────

TEST(HostResolverLoad, MissingFile) {
    EXPECT_THROW(HostResolver::load("/nonexistent/fleetsh/inventory.yaml"), ConfigurationError);
}

TEST(HostResolverLoad, MapWithNodesKey) {
    auto path = fs::temp_directory_path() / "fleetsh_test_inventory.yaml";
    {
        std::ofstream f(path);
        f << "nodes:\n  - name: a\n    fqdn: a.example.com\n  - ~\n";
    }
    auto resolver = HostResolver::load(path);
    EXPECT_EQ(resolver.size(), 1u);
    fs::remove(path);
}

TEST(HostResolverLoad, NotAList) {
    EXPECT_THROW(HostResolver(YAML::Load("just a string")), ConfigurationError);
}
