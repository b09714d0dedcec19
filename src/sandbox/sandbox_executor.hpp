#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/interpreter_command.hpp"

namespace scriptbox::sandbox {

struct SandboxOptions {
    bool sandbox_enabled = true;
    std::filesystem::path temp_root;
    int memory_limit_mb = 2048;
    long long max_output_bytes = 16LL * 1024 * 1024;
    bool isolate_network = true;
    std::vector<std::string> env_allow_list;
    std::chrono::milliseconds poll_interval{20};
    std::chrono::seconds kill_grace{2};
};

SandboxOptions MakeSandboxOptions(const config::SandboxConfig& config);

// Runs one script per call in its own Workspace. Holds no per-call state,
// so a single instance may serve concurrent callers.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options);

    // Always returns exactly one result; the script file is gone afterwards.
    ExecutionResult Execute(const std::string& script_text,
                            const InterpreterCommand& command,
                            std::chrono::seconds timeout,
                            std::string script_id = {}) const;

    // Absolute path of the interpreter, or empty when it cannot be found.
    static std::string ResolveExecutable(const std::string& executable);

    const SandboxOptions& Options() const { return options_; }

private:
    SandboxOptions options_;
};

}  // namespace scriptbox::sandbox
