#pragma once

#include <string>
#include <vector>

namespace scriptbox::config {

struct SandboxConfig {
    bool enabled = true;
    std::string temp_root;
    int default_timeout_s = 30;
    int max_timeout_s = 300;
    int memory_limit_mb = 2048;
    long long max_output_bytes = 16LL * 1024 * 1024;
    bool isolate_network = true;
    std::vector<std::string> env_allow_list = {
        "PATH",
        "LANG",
        "LC_ALL",
        "LC_CTYPE",
        "TZ",
        "R_HOME",
        "SCIHOME"
    };
};

struct InterpretersConfig {
    std::string python = "python3";
    std::string rscript = "Rscript";
    std::string scilab = "scilab";
    std::string git = "git";
};

struct RegistryConfig {
    std::string catalog_path;
    std::string base_dir;
    int remote_timeout_s = 300;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5203;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    InterpretersConfig interpreters;
    RegistryConfig registry;
    ServerConfig server;
    LoggingConfig logging;
};

}  // namespace scriptbox::config
