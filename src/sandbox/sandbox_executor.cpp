#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/search_path.hpp>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sched.h>
#include <signal.h>
#include <sstream>
#include <sys/resource.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

#include "sandbox/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace bp = boost::process;

namespace {

bool WriteProcFile(const char* path, const std::string& content) {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const auto written = ::write(fd, content.data(), content.size());
    ::close(fd);
    return written == static_cast<ssize_t>(content.size());
}

// Applied in the forked child right before exec. Everything it touches is
// prepared in the parent; the child only makes system calls.
struct ChildConfinement : bp::extend::handler {
    rlim_t cpu_seconds = 0;
    rlim_t address_space_bytes = 0;
    rlim_t file_size_bytes = 0;
    bool isolate_network = false;
    std::string uid_map;
    std::string gid_map;

    template <class Executor>
    void on_exec_setup(Executor&) const {
        // own session: the whole process tree can be signalled on timeout
        ::setsid();

        struct rlimit core_limit {0, 0};
        ::setrlimit(RLIMIT_CORE, &core_limit);
        if (cpu_seconds > 0) {
            struct rlimit limit {cpu_seconds, cpu_seconds + 1};
            ::setrlimit(RLIMIT_CPU, &limit);
        }
        if (address_space_bytes > 0) {
            struct rlimit limit {address_space_bytes, address_space_bytes};
            ::setrlimit(RLIMIT_AS, &limit);
        }
        if (file_size_bytes > 0) {
            struct rlimit limit {file_size_bytes, file_size_bytes};
            ::setrlimit(RLIMIT_FSIZE, &limit);
        }

        if (isolate_network && ::unshare(CLONE_NEWNET) != 0) {
            // unprivileged: a user namespace grants the right to create one
            if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
                WriteProcFile("/proc/self/setgroups", "deny");
                WriteProcFile("/proc/self/uid_map", uid_map);
                WriteProcFile("/proc/self/gid_map", gid_map);
            }
        }
    }
};

std::string ReadCapped(const std::filesystem::path& path, long long max_bytes) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto content = buffer.str();
    if (max_bytes > 0 && static_cast<long long>(content.size()) > max_bytes) {
        content.resize(static_cast<std::size_t>(max_bytes));
        content += "\n...(output truncated)...\n";
    }
    return content;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Reports exit without reaping: the zombie leader keeps its process group
// id reserved until the group has been signalled.
bool ChildExited(pid_t pid, std::error_code& ec) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno != EINTR) {
            ec = std::error_code(errno, std::system_category());
        }
        return false;
    }
    return info.si_pid != 0;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

SandboxOptions MakeSandboxOptions(const config::SandboxConfig& config) {
    SandboxOptions options{};
    options.sandbox_enabled = config.enabled;
    options.temp_root = config.temp_root;
    options.memory_limit_mb = config.memory_limit_mb;
    options.max_output_bytes = config.max_output_bytes;
    options.isolate_network = config.isolate_network;
    options.env_allow_list = config.env_allow_list;
    return options;
}

SandboxExecutor::SandboxExecutor(SandboxOptions options)
    : options_(std::move(options)) {
    if (options_.temp_root.empty()) {
        std::error_code ec;
        options_.temp_root = std::filesystem::temp_directory_path(ec) / "scriptbox";
    }
    // children start inside their workspace, so every path handed to them is absolute
    std::error_code ec;
    auto absolute_root = std::filesystem::absolute(options_.temp_root, ec);
    if (!ec) {
        options_.temp_root = absolute_root.lexically_normal();
    }
}

std::string SandboxExecutor::ResolveExecutable(const std::string& executable) {
    if (executable.empty()) {
        return {};
    }
    if (executable.find('/') != std::string::npos) {
        if (::access(executable.c_str(), X_OK) != 0) {
            return {};
        }
        std::error_code ec;
        const auto absolute_path = std::filesystem::absolute(executable, ec);
        return ec ? executable : absolute_path.lexically_normal().string();
    }
    return bp::search_path(executable).string();
}

ExecutionResult SandboxExecutor::Execute(const std::string& script_text,
                                         const InterpreterCommand& command,
                                         std::chrono::seconds timeout,
                                         std::string script_id) const {
    const auto started = std::chrono::steady_clock::now();
    if (script_id.empty()) {
        script_id = utils::RandomHex(8);
    }
    if (timeout.count() <= 0) {
        timeout = std::chrono::seconds(1);
    }

    ExecutionResult result{};
    result.script_id = script_id;
    result.language = command.language;
    result.state = ExecutionState::kCreated;

    const auto executable = ResolveExecutable(command.executable);
    if (executable.empty()) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "interpreter not found",
                   {{"script_id", script_id}, {"executable", command.executable}});
        result = MakeFailure(ErrorKind::kInterpreterNotFound, command.NotFoundMessage(),
                             script_id, command.language);
        result.duration_s = SecondsSince(started);
        return result;
    }

    try {
        auto workspace = Workspace::Create(options_.temp_root, "run");
        const auto script_path = workspace.WriteScript("script_" + script_id + command.file_extension,
                                                       script_text);
        const auto stdout_path = workspace.PathFor("stdout_" + script_id + ".log");
        const auto stderr_path = workspace.PathFor("stderr_" + script_id + ".log");

        bp::environment env;
        for (const auto& key : options_.env_allow_list) {
            if (const char* value = std::getenv(key.c_str())) {
                env[key] = value;
            }
        }
        env["HOME"] = workspace.Path().string();
        env["TMPDIR"] = workspace.Path().string();
        env["SCRIPTBOX_SANDBOX_MODE"] = options_.sandbox_enabled ? "true" : "false";
        env["SCRIPTBOX_TEMP_DIR"] = workspace.Path().string();

        ChildConfinement confinement{};
        confinement.cpu_seconds = static_cast<rlim_t>(timeout.count() + 1);
        if (options_.memory_limit_mb > 0) {
            confinement.address_space_bytes = static_cast<rlim_t>(options_.memory_limit_mb) * 1024 * 1024;
        }
        if (options_.max_output_bytes > 0) {
            confinement.file_size_bytes = static_cast<rlim_t>(options_.max_output_bytes);
        }
        confinement.isolate_network = options_.isolate_network;
        confinement.uid_map = std::to_string(::getuid()) + " " + std::to_string(::getuid()) + " 1";
        confinement.gid_map = std::to_string(::getgid()) + " " + std::to_string(::getgid()) + " 1";

        auto args = command.args;
        args.push_back(script_path.string());

        utils::Log(utils::LogLevel::kInfo, "sandbox", "start",
                   {{"script_id", script_id},
                    {"language", command.language},
                    {"timeout_s", std::to_string(timeout.count())}});

        std::error_code launch_error;
        bp::child child(
            executable,
            bp::args(args),
            env,
            bp::start_dir = workspace.Path().string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            confinement,
            launch_error);
        if (launch_error) {
            const auto kind = launch_error == std::errc::no_such_file_or_directory
                                  ? ErrorKind::kInterpreterNotFound
                                  : ErrorKind::kInternal;
            const auto message = kind == ErrorKind::kInterpreterNotFound
                                     ? command.NotFoundMessage()
                                     : "Failed to launch " + command.display_name + ": " +
                                           launch_error.message();
            result = MakeFailure(kind, message, script_id, command.language);
            result.duration_s = SecondsSince(started);
            workspace.Dispose();
            return result;
        }
        result.state = ExecutionState::kRunning;

        const pid_t pid = child.id();
        const auto deadline = started + timeout;
        bool finished = false;
        std::error_code wait_error;
        while (std::chrono::steady_clock::now() < deadline) {
            if (ChildExited(pid, wait_error)) {
                finished = true;
                break;
            }
            if (wait_error) {
                break;
            }
            std::this_thread::sleep_for(options_.poll_interval);
        }

        bool timed_out = false;
        if (!finished && !wait_error) {
            timed_out = true;
            ::kill(-pid, SIGTERM);
            const auto grace_deadline = std::chrono::steady_clock::now() + options_.kill_grace;
            while (std::chrono::steady_clock::now() < grace_deadline) {
                if (ChildExited(pid, wait_error) || wait_error) {
                    break;
                }
                std::this_thread::sleep_for(options_.poll_interval);
            }
        }
        // leader is not reaped yet, so the group id still belongs to this run;
        // this also takes out stragglers the script left in its session
        ::kill(-pid, SIGKILL);
        std::error_code reap_error;
        child.wait(reap_error);
        if (!wait_error) {
            wait_error = reap_error;
        }

        result.stdout_text = ReadCapped(stdout_path, options_.max_output_bytes);
        result.stderr_text = ReadCapped(stderr_path, options_.max_output_bytes);

        if (timed_out) {
            result.state = ExecutionState::kTimedOut;
            result.success = false;
            result.error_kind = ErrorKind::kExecutionTimeout;
            result.error = "Script execution timed out after " + std::to_string(timeout.count()) +
                           " seconds";
        } else if (wait_error) {
            result.state = ExecutionState::kFailed;
            result.success = false;
            result.error_kind = ErrorKind::kInternal;
            result.error = "Lost track of " + command.display_name + " process: " + wait_error.message();
        } else {
            result.exit_code = DecodeStatus(child.native_exit_code());
            result.success = (*result.exit_code == 0);
            result.state = result.success ? ExecutionState::kCompleted : ExecutionState::kFailed;
            if (!result.success) {
                result.error_kind = ErrorKind::kRuntimeFailure;
            }
        }
        workspace.Dispose();
    } catch (const bp::process_error& ex) {
        result = MakeFailure(ErrorKind::kInternal,
                             "Failed to launch " + command.display_name + ": " + ex.what(),
                             script_id, command.language);
    } catch (const std::filesystem::filesystem_error& ex) {
        result = MakeFailure(ErrorKind::kInternal,
                             std::string("Workspace error: ") + ex.what(),
                             script_id, command.language);
    } catch (const std::exception& ex) {
        result = MakeFailure(ErrorKind::kInternal, ex.what(), script_id, command.language);
    }

    result.duration_s = SecondsSince(started);
    utils::Log(utils::LogLevel::kInfo, "sandbox", "end",
               {{"script_id", script_id},
                {"state", ToString(result.state)},
                {"exit_code", result.exit_code ? std::to_string(*result.exit_code) : "none"},
                {"duration_s", std::to_string(result.duration_s)}});
    return result;
}

}  // namespace scriptbox::sandbox
