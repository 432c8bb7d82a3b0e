#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include "engine.hpp"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 50052;
    std::string address() const { return host + ":" + std::to_string(port); }
};

struct DataConfig {
    std::string terms_file = "terms.csv";
    std::string links_file = "links.csv";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    ServerConfig server;
    DataConfig data;
    EngineOptions engine;
    LoggingConfig logging;
};

// A missing file yields the defaults; malformed YAML or invalid values throw
// ConfigError.
Config load_config(const std::string& path = "glossary.yaml");
Config parse_config(const std::string& yaml_text);

TraversalMode parse_traversal_mode(const std::string& s);
