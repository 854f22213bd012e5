#include "adapters/secondary/core/RoutingConfigLoader.hpp"

#include "domain/Errors.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <map>
#include <vector>

namespace eda::adapters::secondary {

using domain::ConfigurationError;
using domain::OutputDestination;
using domain::routing::FilterPtr;
using domain::routing::RoutingRule;
using domain::routing::RoutingTable;

namespace {

std::map<std::string, std::string> parseAttributes(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw ConfigurationError(where + ": expected a map of attribute: value");
    }
    std::map<std::string, std::string> attributes;
    for (auto it : node) {
        if (!it.second.IsScalar()) {
            throw ConfigurationError(where + ": attribute value must be a scalar");
        }
        attributes[it.first.as<std::string>()] = it.second.as<std::string>();
    }
    return attributes;
}

} // namespace

RoutingTable RoutingConfigLoader::loadFile(const std::string& path,
                                           const OutputDestination& fallbackDefault) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("routing config not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
        return parse(root, fallbackDefault);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("YAML error in " + path + ": " + e.what());
    }
}

RoutingTable RoutingConfigLoader::loadString(const std::string& yaml,
                                             const OutputDestination& fallbackDefault) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
        return parse(root, fallbackDefault);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("YAML error: ") + e.what());
    }
}

RoutingTable RoutingConfigLoader::parse(const YAML::Node& root,
                                        const OutputDestination& fallbackDefault) {
    if (!root || !root.IsMap() || !root["routing"]) {
        throw ConfigurationError("routing config must contain a top-level 'routing' section");
    }

    const YAML::Node routing = root["routing"];
    if (!routing.IsMap()) {
        throw ConfigurationError("'routing' must be a map");
    }

    OutputDestination defaultDestination = fallbackDefault;
    if (routing["default"]) {
        defaultDestination = parseDestination(routing["default"], "routing.default");
    }

    std::vector<RoutingRule> rules;
    if (const YAML::Node rulesNode = routing["rules"]) {
        if (!rulesNode.IsSequence()) {
            throw ConfigurationError("routing.rules must be a sequence");
        }

        for (std::size_t i = 0; i < rulesNode.size(); ++i) {
            const YAML::Node ruleNode = rulesNode[i];
            std::string where = "routing.rules[" + std::to_string(i) + "]";
            if (!ruleNode.IsMap()) {
                throw ConfigurationError(where + " must be a map");
            }

            RoutingRule rule;
            rule.name = ruleNode["name"] ? ruleNode["name"].as<std::string>() : where;

            if (ruleNode["filter"]) {
                rule.filter = parseFilter(ruleNode["filter"], where + ".filter");
            } else {
                rule.filter = std::make_shared<domain::routing::MatchAllFilter>();
            }

            if (!ruleNode["destination"]) {
                throw ConfigurationError(where + ": destination is required");
            }
            rule.destination = parseDestination(ruleNode["destination"], where + ".destination");
            rules.push_back(std::move(rule));
        }
    }

    return RoutingTable(std::move(defaultDestination), std::move(rules));
}

OutputDestination RoutingConfigLoader::parseDestination(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw ConfigurationError(where + " must be a map");
    }
    if (!node["type"]) {
        throw ConfigurationError(where + ": type is required");
    }

    domain::DestinationType type;
    try {
        type = domain::parseDestinationType(node["type"].as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(where + ": " + e.what());
    }

    std::string target = node["target"] ? node["target"].as<std::string>() : "";
    if (target.empty() && type != domain::DestinationType::DISCARD) {
        throw ConfigurationError(where + ": target is required for " + domain::toString(type));
    }

    std::optional<std::string> cluster;
    if (node["cluster"] && !node["cluster"].IsNull()) {
        cluster = node["cluster"].as<std::string>();
    }
    return OutputDestination(type, std::move(target), std::move(cluster));
}

FilterPtr RoutingConfigLoader::parseFilter(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap() || node.size() != 1) {
        throw ConfigurationError(where + " must be a map with exactly one dialect");
    }

    auto entry = *node.begin();
    const std::string dialect = entry.first.as<std::string>();
    const YAML::Node body = entry.second;
    const std::string nested = where + "." + dialect;

    try {
        if (dialect == "exact") {
            return std::make_shared<domain::routing::ExactFilter>(parseAttributes(body, nested));
        }
        if (dialect == "prefix") {
            return std::make_shared<domain::routing::PrefixFilter>(parseAttributes(body, nested));
        }
        if (dialect == "suffix") {
            return std::make_shared<domain::routing::SuffixFilter>(parseAttributes(body, nested));
        }
        if (dialect == "all" || dialect == "any") {
            if (!body.IsSequence()) {
                throw ConfigurationError(nested + " must be a sequence of filters");
            }
            std::vector<FilterPtr> filters;
            for (std::size_t i = 0; i < body.size(); ++i) {
                filters.push_back(parseFilter(body[i], nested + "[" + std::to_string(i) + "]"));
            }
            if (dialect == "all") {
                return std::make_shared<domain::routing::AllFilter>(std::move(filters));
            }
            return std::make_shared<domain::routing::AnyFilter>(std::move(filters));
        }
        if (dialect == "not") {
            return std::make_shared<domain::routing::NotFilter>(parseFilter(body, nested));
        }
        if (dialect == "sql") {
            if (!body.IsScalar()) {
                throw ConfigurationError(nested + " must be a string expression");
            }
            return std::make_shared<domain::routing::SqlFilter>(body.as<std::string>());
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(nested + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(nested + ": " + e.what());
    }

    throw ConfigurationError(where + ": unknown filter dialect '" + dialect + "'");
}

} // namespace eda::adapters::secondary
