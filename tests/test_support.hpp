#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/interpreter_command.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"

namespace scriptbox::test {

inline bool HasExecutable(const std::string& name) {
    return !sandbox::SandboxExecutor::ResolveExecutable(name).empty();
}

// True when python3 can import every module in `modules` (space separated).
inline bool PythonHasModules(const std::string& modules) {
    if (!HasExecutable("python3")) {
        return false;
    }
    std::string command = "python3 -c \"";
    std::string module;
    for (char c : modules + " ") {
        if (c == ' ') {
            if (!module.empty()) {
                command += "import " + module + ";";
                module.clear();
            }
        } else {
            module.push_back(c);
        }
    }
    command += "\" >/dev/null 2>&1";
    return std::system(command.c_str()) == 0;
}

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("scriptbox_test_" + utils::RandomHex(12))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path Write(const std::string& relative, const std::string& content) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        output << content;
        return target;
    }

private:
    std::filesystem::path path_;
};

// Switches the process working directory for the lifetime of the object.
class ScopedCurrentPath {
public:
    explicit ScopedCurrentPath(const std::filesystem::path& path)
        : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(path);
    }
    ~ScopedCurrentPath() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }
    ScopedCurrentPath(const ScopedCurrentPath&) = delete;
    ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
    std::filesystem::path previous_;
};

inline config::Config MakeTestConfig(const std::filesystem::path& root) {
    config::Config config{};
    config.sandbox.temp_root = (root / "sandbox").string();
    config.sandbox.default_timeout_s = 20;
    config.sandbox.max_timeout_s = 60;
    config.sandbox.memory_limit_mb = 4096;
    config.sandbox.isolate_network = false;
    config.registry.base_dir = root.string();
    config.registry.remote_timeout_s = 10;
    return config;
}

inline sandbox::InterpreterCommand ShellCommand() {
    sandbox::InterpreterCommand command{};
    command.language = "sh";
    command.executable = "/bin/sh";
    command.file_extension = ".sh";
    command.display_name = "Shell";
    command.install_hint = "Install a POSIX shell.";
    return command;
}

inline bool DirectoryIsEmpty(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }
    return std::filesystem::is_empty(path, ec);
}

}  // namespace scriptbox::test
