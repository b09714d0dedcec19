#include "sandbox/workspace.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {

Workspace Workspace::Create(const std::filesystem::path& root, const std::string& prefix) {
    std::filesystem::create_directories(root);
    for (int attempt = 0; attempt < 8; ++attempt) {
        auto candidate = root / (prefix + "_" + utils::RandomHex(16));
        // create_directory reports false when the name is already taken
        if (std::filesystem::create_directory(candidate)) {
            std::filesystem::permissions(candidate, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace);
            return Workspace(std::move(candidate));
        }
    }
    throw std::filesystem::filesystem_error(
        "unable to allocate a unique workspace directory",
        root,
        std::make_error_code(std::errc::file_exists));
}

Workspace::Workspace(std::filesystem::path path)
    : path_(std::move(path)) {}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_))
    , files_(std::move(other.files_))
    , disposed_(other.disposed_) {
    other.disposed_ = true;
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        Dispose();
        path_ = std::move(other.path_);
        files_ = std::move(other.files_);
        disposed_ = other.disposed_;
        other.disposed_ = true;
    }
    return *this;
}

Workspace::~Workspace() {
    Dispose();
}

std::filesystem::path Workspace::PathFor(const std::string& name) const {
    return path_ / std::filesystem::path(name).filename();
}

std::filesystem::path Workspace::WriteScript(const std::string& name, const std::string& content) {
    if (disposed_) {
        throw std::filesystem::filesystem_error(
            "workspace already disposed",
            path_,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }
    const auto target = PathFor(name);
    std::ofstream output(target, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!output.is_open()) {
        throw std::filesystem::filesystem_error(
            "failed to open script file for writing",
            target,
            std::make_error_code(std::errc::io_error));
    }
    output << content;
    output.close();
    if (!output) {
        throw std::filesystem::filesystem_error(
            "failed to write script file",
            target,
            std::make_error_code(std::errc::io_error));
    }
    files_.push_back(target);
    return target;
}

bool Workspace::RemoveFile(const std::string& name) {
    std::error_code ec;
    return std::filesystem::remove(PathFor(name), ec);
}

void Workspace::Dispose() noexcept {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    std::error_code ec;
    for (const auto& file : files_) {
        std::filesystem::remove(file, ec);
    }
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "workspace", "cleanup incomplete",
                   {{"path", path_.string()}, {"error", ec.message()}});
    }
}

}  // namespace scriptbox::sandbox
