#include "host_resolver.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fnmatch.h>

namespace {

struct Term {
    std::string path;
    std::string pattern;
};

std::vector<Term> parse_query(const std::string& query) {
    std::vector<Term> terms;
    for (auto part : split_on(query, " AND ")) {
        trim(part);
        if (part.empty()) continue;
        auto colon = part.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == part.size()) {
            throw ConfigurationError(fmt::format(
                "Invalid search term '{}'. Use attribute:pattern, e.g. roles:web", part));
        }
        terms.push_back({part.substr(0, colon), part.substr(colon + 1)});
    }
    if (terms.empty()) {
        throw ConfigurationError("Empty search query. Use '*:*' to match every node");
    }
    return terms;
}

// Node::operator= writes through to the tree; walk with reset() instead.
YAML::Node walk(const YAML::Node& node, const std::string& path) {
    YAML::Node cur;
    cur.reset(node);
    for (const auto& key : split_on(path, ".")) {
        if (!cur || !cur.IsMap()) return YAML::Node();
        const YAML::Node& parent = cur;
        YAML::Node child = parent[key];
        if (!child) return YAML::Node();
        cur.reset(child);
    }
    return cur;
}

bool glob_match(const std::string& pattern, const std::string& value) {
    return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

bool value_matches(const YAML::Node& value, const std::string& pattern) {
    if (!value) return false;
    if (value.IsScalar()) return glob_match(pattern, value.Scalar());
    if (value.IsSequence()) {
        for (const auto& item : value) {
            if (item.IsScalar() && glob_match(pattern, item.Scalar())) return true;
        }
    }
    return false;
}

bool node_matches(const YAML::Node& node, const std::vector<Term>& terms) {
    for (const auto& term : terms) {
        if (term.path == "*" && term.pattern == "*") continue;
        if (!value_matches(walk(node, term.path), term.pattern)) return false;
    }
    return true;
}

} // namespace

AttributeSelection select_attribute(const std::optional<std::string>& cli_attribute,
                                    const std::optional<std::string>& config_attribute) {
    AttributeSelection out;
    out.override_attribute = cli_attribute ? cli_attribute : config_attribute;
    std::string attribute = config_attribute.value_or(cli_attribute.value_or(DEFAULT_SSH_ATTRIBUTE));
    trim(attribute);
    out.attribute = attribute;
    return out;
}

HostResolver::HostResolver(YAML::Node root) {
    YAML::Node nodes;
    nodes.reset(root);
    if (root.IsMap() && root["nodes"]) {
        const YAML::Node& map = root;
        nodes.reset(map["nodes"]);
    }
    if (!nodes || nodes.IsNull()) return;
    if (!nodes.IsSequence()) {
        throw ConfigurationError("Inventory must be a list of nodes (or a map with a 'nodes' list)");
    }
    for (const auto& node : nodes) {
        // Null entries are skipped like any other unusable record
        if (node && node.IsMap()) nodes_.push_back(node);
    }
}

HostResolver HostResolver::load(const fs::path& inventory) {
    if (!fs::exists(inventory)) {
        throw ConfigurationError(fmt::format(
            "Inventory {} not found. Pass --inventory FILE or use --manual-list",
            inventory.string()));
    }
    try {
        return HostResolver(YAML::LoadFile(inventory.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(fmt::format("Failed to parse inventory {}: {}",
                                             inventory.string(), e.what()));
    }
}

ResolvedTargets HostResolver::manual(const std::string& list) {
    ResolvedTargets out;
    out.targets = split_whitespace(list);
    out.matched = out.targets.size();
    return out;
}

std::vector<YAML::Node> HostResolver::query(const std::string& query) const {
    auto terms = parse_query(query);
    std::vector<YAML::Node> out;
    for (const auto& node : nodes_) {
        if (node_matches(node, terms)) out.push_back(node);
    }
    return out;
}

std::optional<std::string> HostResolver::extract_nested_value(const YAML::Node& node,
                                                              const std::string& path) {
    YAML::Node value = walk(node, path);
    if (!value || !value.IsScalar()) return std::nullopt;
    std::string out = value.Scalar();
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<std::string> HostResolver::connect_address(const YAML::Node& node,
                                                         const AttributeSelection& attrs) {
    if (attrs.override_attribute) {
        return extract_nested_value(node, *attrs.override_attribute);
    }
    if (auto cloud = extract_nested_value(node, CLOUD_HOSTNAME_ATTRIBUTE)) {
        return cloud;
    }
    return extract_nested_value(node, attrs.attribute);
}

ResolvedTargets HostResolver::search(const std::string& query,
                                     const AttributeSelection& attrs) const {
    ResolvedTargets out;
    auto matches = this->query(query);
    out.matched = matches.size();
    for (const auto& node : matches) {
        auto address = connect_address(node, attrs);
        if (!address) {
            log_debug(fmt::format("Skipping {}: no connect attribute",
                                  extract_nested_value(node, "name").value_or("<unnamed>")));
            continue;
        }
        out.targets.push_back(*address);
    }
    log_debug(fmt::format("Search '{}' matched {} node(s), {} target(s)",
                          query, out.matched, out.targets.size()));
    return out;
}
