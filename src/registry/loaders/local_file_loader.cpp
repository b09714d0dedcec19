#include "registry/loaders/local_file_loader.hpp"

#include <system_error>
#include <utility>

#include "utils/logging.hpp"

namespace scriptbox::registry {

LocalFileLoader::LocalFileLoader(const ModuleRunner& runner, std::filesystem::path base_dir)
    : runner_(runner)
    , base_dir_(std::move(base_dir)) {
    // the module runs with its workspace as working directory
    std::error_code ec;
    auto absolute_dir = std::filesystem::absolute(base_dir_, ec);
    if (!ec) {
        base_dir_ = std::move(absolute_dir);
    }
}

std::filesystem::path LocalFileLoader::Resolve(const std::string& location) const {
    std::filesystem::path path(location);
    if (path.is_relative()) {
        path = base_dir_ / path;
    }
    std::error_code ec;
    auto absolute_path = std::filesystem::absolute(path, ec);
    return (ec ? path : absolute_path).lexically_normal();
}

ScriptOutcome LocalFileLoader::LoadAndRun(const ScriptRegistryEntry& entry,
                                          const nlohmann::json& input_data) const {
    if (entry.source_location.empty()) {
        return MakeErrorOutcome(sandbox::ErrorKind::kValidation, "No script location provided", entry.id);
    }
    const auto path = Resolve(entry.source_location);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        utils::Log(utils::LogLevel::kWarn, "registry", "script file missing",
                   {{"script_id", entry.id}, {"path", path.string()}});
        return MakeErrorOutcome(sandbox::ErrorKind::kSourceFetch,
                                "Script file not found: " + path.string(), entry.id);
    }
    return runner_.RunFile(path, entry, input_data);
}

}  // namespace scriptbox::registry
