#pragma once

#include <cstddef>
#include <string>
#include <yaml-cpp/yaml.h>

class Config {
public:
    static Config& getInstance();

    Config();

    bool loadFromFile(const std::string& config_path = "config.yaml");
    bool loadFromString(const std::string& yaml_content);

    unsigned short getListenPort() const { return listen_port_; }
    std::string getListenAddress() const { return listen_address_; }
    unsigned int getNumThreads() const { return num_threads_; }

    size_t getWorkerThreads() const { return worker_threads_; }

    std::string getUpstreamHost() const { return upstream_host_; }
    unsigned short getUpstreamPort() const { return upstream_port_; }
    int getUpstreamTimeout() const { return upstream_timeout_ms_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogPattern() const { return log_pattern_; }

    bool isValid() const { return valid_; }
    std::string getError() const { return error_message_; }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

private:
    void setDefaults();
    bool parseYaml(const YAML::Node& config);

    unsigned short listen_port_ = 7000;
    std::string listen_address_ = "0.0.0.0";
    unsigned int num_threads_ = 4;

    size_t worker_threads_ = 4;

    std::string upstream_host_ = "127.0.0.1";
    unsigned short upstream_port_ = 7001;
    int upstream_timeout_ms_ = 2000;

    std::string log_level_ = "info";
    std::string log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    bool valid_ = false;
    std::string error_message_;
};
