#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace scriptbox::sandbox {

// Ephemeral directory owning every file of one execution. Removed on
// Dispose() or destruction, whichever comes first.
class Workspace {
public:
    // Creates <root>/<prefix>_<16 hex> with owner-only permissions.
    // Throws std::filesystem::filesystem_error when the directory cannot be made.
    static Workspace Create(const std::filesystem::path& root, const std::string& prefix = "ws");

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    ~Workspace();

    std::filesystem::path WriteScript(const std::string& name, const std::string& content);
    std::filesystem::path PathFor(const std::string& name) const;
    bool RemoveFile(const std::string& name);

    // Idempotent; tolerates files removed by someone else.
    void Dispose() noexcept;

    const std::filesystem::path& Path() const { return path_; }
    bool Disposed() const { return disposed_; }
    const std::vector<std::filesystem::path>& Files() const { return files_; }

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
    std::vector<std::filesystem::path> files_;
    bool disposed_ = false;
};

}  // namespace scriptbox::sandbox
