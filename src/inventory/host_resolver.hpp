#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// Which node attribute supplies the connect address.
//
// override is set when an attribute was asked for explicitly (command
// line or config); it then beats cloud.public_hostname. attribute is the
// fallback when neither is present.
struct AttributeSelection {
    std::optional<std::string> override_attribute;
    std::string attribute;
};

// Build the selection from the command-line and config values. The config
// value wins for `attribute`; either one sets the override.
AttributeSelection select_attribute(const std::optional<std::string>& cli_attribute,
                                    const std::optional<std::string>& config_attribute);

// HostResolver: turns a query into the ordered list of connect targets.
//
// Manual mode splits a space-separated host list. Search mode matches the
// query against a YAML inventory, a list of node maps:
//
//   - name: web1
//     fqdn: web1.example.com
//     roles: [web]
//     cloud: { public_hostname: ec2-1.compute.amazonaws.com }
//
// Queries are "*:*" or "path:glob" terms joined by " AND ". Paths use "."
// for nesting; a sequence matches when any element does.
class HostResolver {
public:
    explicit HostResolver(YAML::Node root);

    // Throws ConfigurationError if the file is missing or malformed.
    static HostResolver load(const fs::path& inventory);

    // Space-separated list, in order.
    static ResolvedTargets manual(const std::string& list);

    // Matching nodes and their connect addresses. Nodes without the
    // selected attribute count toward `matched` but add no target.
    ResolvedTargets search(const std::string& query, const AttributeSelection& attrs) const;

    // Nodes matching the query, in inventory order.
    std::vector<YAML::Node> query(const std::string& query) const;

    // Scalar at a dotted path ("cloud.public_hostname"), or nullopt.
    static std::optional<std::string> extract_nested_value(const YAML::Node& node,
                                                           const std::string& path);

    std::size_t size() const { return nodes_.size(); }

private:
    std::vector<YAML::Node> nodes_;

    static std::optional<std::string> connect_address(const YAML::Node& node,
                                                      const AttributeSelection& attrs);
};
