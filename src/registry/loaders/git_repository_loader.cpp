#include "registry/loaders/git_repository_loader.hpp"

#include <boost/process.hpp>
#include <fstream>
#include <sstream>
#include <utility>

#include "sandbox/sandbox_executor.hpp"
#include "sandbox/workspace.hpp"
#include "utils/logging.hpp"

namespace scriptbox::registry {
namespace bp = boost::process;

namespace {

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

}  // namespace

GitRepositoryLoader::GitRepositoryLoader(const ModuleRunner& runner,
                                         std::string git_executable,
                                         std::filesystem::path temp_root,
                                         std::chrono::seconds clone_timeout)
    : runner_(runner)
    , git_executable_(std::move(git_executable))
    , temp_root_(std::move(temp_root))
    , clone_timeout_(clone_timeout) {}

std::string GitRepositoryLoader::Clone(const std::string& repository,
                                       const std::filesystem::path& target,
                                       const std::filesystem::path& log_path) const {
    const auto git = sandbox::SandboxExecutor::ResolveExecutable(git_executable_);
    if (git.empty()) {
        return git_executable_ + " not found";
    }

    bp::environment env = boost::this_process::environment();
    env["GIT_TERMINAL_PROMPT"] = "0";

    std::error_code ec;
    bp::child child(
        git,
        bp::args({"clone", "--depth", "1", "--quiet", "--", repository, target.string()}),
        env,
        bp::std_in < bp::null,
        bp::std_out > bp::null,
        bp::std_err > log_path.string(),
        ec);
    if (ec) {
        return "failed to start " + git + ": " + ec.message();
    }

    if (!child.wait_for(clone_timeout_, ec)) {
        child.terminate(ec);
        return "timed out after " + std::to_string(clone_timeout_.count()) + " seconds";
    }
    if (ec) {
        return ec.message();
    }
    if (child.exit_code() != 0) {
        auto diagnostic = Trim(ReadAll(log_path));
        if (diagnostic.empty()) {
            diagnostic = "git exited with code " + std::to_string(child.exit_code());
        }
        return diagnostic;
    }
    return {};
}

ScriptOutcome GitRepositoryLoader::LoadAndRun(const ScriptRegistryEntry& entry,
                                              const nlohmann::json& input_data) const {
    const auto& repository = entry.source_location;
    if (repository.empty()) {
        return MakeErrorOutcome(sandbox::ErrorKind::kValidation, "No repository provided", entry.id);
    }

    auto workspace = sandbox::Workspace::Create(temp_root_, "git");
    const auto clone_dir = workspace.PathFor("repo");
    const auto log_path = workspace.PathFor("clone.log");

    utils::Log(utils::LogLevel::kInfo, "registry", "git clone",
               {{"script_id", entry.id}, {"repository", repository}});
    const auto clone_error = Clone(repository, clone_dir, log_path);
    if (!clone_error.empty()) {
        utils::Log(utils::LogLevel::kWarn, "registry", "git clone failed",
                   {{"script_id", entry.id}, {"reason", clone_error}});
        auto outcome = MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                        "Git clone failed: " + clone_error, entry.id);
        outcome.execution_metadata["git_repository"] = repository;
        return outcome;
    }

    std::error_code root_ec;
    std::error_code path_ec;
    const auto root = std::filesystem::weakly_canonical(clone_dir, root_ec);
    const auto script_path = std::filesystem::weakly_canonical(clone_dir / entry.source_path, path_ec);
    if (entry.source_path.empty() || root_ec || path_ec || !IsWithin(root, script_path) ||
        !std::filesystem::is_regular_file(script_path, path_ec)) {
        auto outcome = MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                        "Script not found in repository: " + entry.source_path, entry.id);
        outcome.execution_metadata["git_repository"] = repository;
        return outcome;
    }

    auto outcome = runner_.RunFile(script_path, entry, input_data);
    outcome.execution_metadata["git_repository"] = repository;
    if (outcome.success) {
        outcome.result["git_repository"] = repository;
    }
    return outcome;
}

}  // namespace scriptbox::registry
