#include "Config.hpp"
#include <spdlog/spdlog.h>

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    listen_port_ = 7000;
    listen_address_ = "0.0.0.0";
    num_threads_ = 4;
    worker_threads_ = 4;
    upstream_host_ = "127.0.0.1";
    upstream_port_ = 7001;
    upstream_timeout_ms_ = 2000;
    log_level_ = "info";
    log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    valid_ = true;
    error_message_.clear();
}

bool Config::loadFromFile(const std::string& config_path) {
    try {
        YAML::Node config_node = YAML::LoadFile(config_path);
        return parseYaml(config_node);
    } catch (const YAML::BadFile& e) {
        spdlog::warn("Config file '{}' not found, using defaults", config_path);
        setDefaults();
        return true;
    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse config: {}", error_message_);
        valid_ = false;
        return false;
    }
}

bool Config::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node config_node = YAML::Load(yaml_content);
        return parseYaml(config_node);
    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse config: {}", error_message_);
        valid_ = false;
        return false;
    }
}

bool Config::parseYaml(const YAML::Node& config) {
    // Keys missing from this document fall back to defaults, not to whatever
    // an earlier load set.
    setDefaults();

    try {
        if (config["server"]) {
            const auto& server = config["server"];
            if (server["listen_port"]) {
                listen_port_ = server["listen_port"].as<unsigned short>();
            }
            if (server["listen_address"]) {
                listen_address_ = server["listen_address"].as<std::string>();
            }
            if (server["num_threads"]) {
                num_threads_ = server["num_threads"].as<unsigned int>();
            }
        }

        if (config["singleflight"]) {
            const auto& singleflight = config["singleflight"];
            if (singleflight["worker_threads"]) {
                worker_threads_ = singleflight["worker_threads"].as<size_t>();
            }
        }

        if (config["upstream"]) {
            const auto& upstream = config["upstream"];
            if (upstream["host"]) {
                upstream_host_ = upstream["host"].as<std::string>();
            }
            if (upstream["port"]) {
                upstream_port_ = upstream["port"].as<unsigned short>();
            }
            if (upstream["timeout_ms"]) {
                upstream_timeout_ms_ = upstream["timeout_ms"].as<int>();
            }
        }

        if (config["logging"]) {
            const auto& logging = config["logging"];
            if (logging["level"]) {
                log_level_ = logging["level"].as<std::string>();
            }
            if (logging["pattern"]) {
                log_pattern_ = logging["pattern"].as<std::string>();
            }
        }

        if (num_threads_ == 0 || worker_threads_ == 0) {
            error_message_ = "Config error: thread counts must be positive";
            spdlog::error("Failed to load config: {}", error_message_);
            valid_ = false;
            return false;
        }

        valid_ = true;
        error_message_.clear();

        spdlog::info("Configuration loaded successfully from YAML");
        return true;

    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse YAML config: {}", error_message_);
        valid_ = false;
        return false;
    } catch (const std::exception& e) {
        error_message_ = "Config error: " + std::string(e.what());
        spdlog::error("Failed to load config: {}", error_message_);
        valid_ = false;
        return false;
    }
}
