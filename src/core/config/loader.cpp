#include <egress/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const T& fallback, const std::string& section) {
    const YAML::Node node = parent[key];
    if (!node) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Invalid type for field '" + section + key + "'");
    }
}

std::chrono::milliseconds readMillis(const YAML::Node& parent, const char* key,
                                     std::chrono::milliseconds fallback, const std::string& section,
                                     bool allow_zero) {
    long long v = readOptional<long long>(parent, key, fallback.count(), section);
    if (v < 0 || (!allow_zero && v == 0)) {
        throw std::runtime_error("Invalid value for field '" + section + key + "'");
    }
    return std::chrono::milliseconds(v);
}

double readCost(const YAML::Node& parent, const char* key, double fallback) {
    double v = readOptional<double>(parent, key, fallback, "cpu_cost.");
    if (!(v > 0.0)) {
        throw std::runtime_error(std::string("Invalid value for field 'cpu_cost.") + key + "': must be positive");
    }
    return v;
}

AppConfig::AppConfiguration parse(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Configuration root must be a map");
    }

    AppConfig::AppConfiguration config;

    if (!root["node_id"]) {
        throw std::runtime_error("Missing required field 'node_id'");
    }
    config.node_id = readOptional<std::string>(root, "node_id", "", "");
    if (config.node_id.empty()) {
        throw std::runtime_error("Invalid value for field 'node_id': must not be empty");
    }

    config.log_level = readOptional<std::string>(root, "log_level", config.log_level, "");
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        throw std::runtime_error("Invalid value for field 'log_level': " + config.log_level);
    }

    config.health_port = readOptional<int>(root, "health_port", config.health_port, "");
    if (config.health_port < 0 || config.health_port > 65535) {
        throw std::runtime_error("Invalid value for field 'health_port'");
    }

    if (const YAML::Node cost = root["cpu_cost"]) {
        config.cpu_cost.room_composite_cpu_cost =
            readCost(cost, "room_composite_cpu_cost", config.cpu_cost.room_composite_cpu_cost);
        config.cpu_cost.web_cpu_cost =
            readCost(cost, "web_cpu_cost", config.cpu_cost.web_cpu_cost);
        config.cpu_cost.track_composite_cpu_cost =
            readCost(cost, "track_composite_cpu_cost", config.cpu_cost.track_composite_cpu_cost);
        config.cpu_cost.track_cpu_cost =
            readCost(cost, "track_cpu_cost", config.cpu_cost.track_cpu_cost);
    }

    if (const YAML::Node bus = root["bus"]) {
        config.bus.request_topic = readOptional<std::string>(bus, "request_topic", config.bus.request_topic, "bus.");
        config.bus.update_topic = readOptional<std::string>(bus, "update_topic", config.bus.update_topic, "bus.");
        config.bus.handler_threads = readOptional<int>(bus, "handler_threads", config.bus.handler_threads, "bus.");
        if (config.bus.request_topic.empty() || config.bus.update_topic.empty()) {
            throw std::runtime_error("Invalid value for field 'bus': topics must not be empty");
        }
        if (config.bus.handler_threads < 1) {
            throw std::runtime_error("Invalid value for field 'bus.handler_threads'");
        }
    }

    if (const YAML::Node lc = root["lifecycle"]) {
        config.lifecycle.shutdown_timeout =
            readMillis(lc, "shutdown_timeout_ms", config.lifecycle.shutdown_timeout, "lifecycle.", false);
        config.lifecycle.terminal_retention =
            readMillis(lc, "terminal_retention_ms", config.lifecycle.terminal_retention, "lifecycle.", true);
        config.lifecycle.report_interval =
            readMillis(lc, "report_interval_ms", config.lifecycle.report_interval, "lifecycle.", false);
    }

    if (const YAML::Node pl = root["pipeline"]) {
        config.pipeline.startup_delay =
            readMillis(pl, "startup_delay_ms", config.pipeline.startup_delay, "pipeline.", true);
        config.pipeline.shutdown_delay =
            readMillis(pl, "shutdown_delay_ms", config.pipeline.shutdown_delay, "pipeline.", true);
    }

    return config;
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::Load(file);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + filepath + ": " + e.what());
    }
    return parse(root);
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse configuration: ") + e.what());
    }
    return parse(root);
}
