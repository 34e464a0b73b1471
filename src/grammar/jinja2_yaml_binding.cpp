module;

#include <jinja2cpp/value.h>
#include <yaml-cpp/yaml.h>

export module jinja2_yaml_binding;

import std;

export namespace grammar {

// Converts a YAML document into the value tree Jinja2C++ templates are rendered from. Scalars
// stay strings; templates only splice them into source text.
// NOLINTNEXTLINE(misc-no-recursion)
auto reflect(const YAML::Node & node) -> jinja2::Value
{
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null: return {};
    case YAML::NodeType::Scalar: return node.Scalar();
    case YAML::NodeType::Sequence: {
        jinja2::ValuesList list;
        list.reserve(node.size());
        for (const auto & item : node) {
            list.push_back(reflect(item));
        }
        return list;
    }
    case YAML::NodeType::Map: {
        jinja2::ValuesMap map;
        for (const auto & item : node) {
            map.emplace(item.first.as<std::string>(), reflect(item.second));
        }
        return map;
    }
    }
    return {};
}

} // namespace grammar
