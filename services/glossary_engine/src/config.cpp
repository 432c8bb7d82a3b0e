#include "config.hpp"
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "logging.hpp"

namespace {

template <typename T>
void read(const YAML::Node& parent, const char* key, T& out) {
    if (parent[key]) out = parent[key].as<T>();
}

Config from_yaml(const YAML::Node& yaml) {
    Config c;
    if (yaml.IsNull()) return c;
    if (!yaml.IsMap()) throw ConfigError("configuration root must be a mapping");

    if (auto s = yaml["server"]) {
        read(s, "host", c.server.host);
        read(s, "port", c.server.port);
    }
    if (auto d = yaml["data"]) {
        read(d, "terms_file", c.data.terms_file);
        read(d, "links_file", c.data.links_file);
    }
    if (auto e = yaml["engine"]) {
        read(e, "default_relations_depth", c.engine.default_relations_depth);
        read(e, "default_path_depth", c.engine.default_path_depth);
        read(e, "max_depth_ceiling", c.engine.max_depth_ceiling);
        if (e["max_visited_nodes"]) {
            auto n = e["max_visited_nodes"].as<long long>();
            if (n <= 0) throw ConfigError("engine.max_visited_nodes must be positive");
            c.engine.max_visited_nodes = static_cast<size_t>(n);
        }
        if (e["path_traversal"]) c.engine.path_traversal = parse_traversal_mode(e["path_traversal"].as<std::string>());
    }
    if (auto l = yaml["logging"]) {
        read(l, "level", c.logging.level);
        read(l, "file", c.logging.file);
    }

    if (c.engine.default_relations_depth < 1) throw ConfigError("engine.default_relations_depth must be positive");
    if (c.engine.default_path_depth < 1) throw ConfigError("engine.default_path_depth must be positive");
    if (c.engine.max_depth_ceiling < 1) throw ConfigError("engine.max_depth_ceiling must be positive");
    if (!is_valid_log_level(c.logging.level)) throw ConfigError("unknown logging.level: " + c.logging.level);
    return c;
}

}  // namespace

TraversalMode parse_traversal_mode(const std::string& s) {
    if (s == "undirected") return TraversalMode::Undirected;
    if (s == "directed") return TraversalMode::Directed;
    throw ConfigError("unknown engine.path_traversal: " + s);
}

Config parse_config(const std::string& yaml_text) {
    try {
        return from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

Config load_config(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) return Config();
    try {
        return from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
}
