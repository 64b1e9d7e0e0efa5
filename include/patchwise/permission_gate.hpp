#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace patchwise {

// Persists the approved-folder list; implemented by the settings layer.
struct FolderStore {
    virtual ~FolderStore() = default;
    virtual void save_folders(const std::vector<std::string>& folders) = 0;
};

// Absolute, lexically normalized form without a trailing separator.
std::filesystem::path normalize_folder(const std::filesystem::path& path);

class PermissionGate {
public:
    PermissionGate() = default;
    explicit PermissionGate(const std::vector<std::string>& folders);

    void set_store(FolderStore* store) noexcept { m_store = store; }

    // True when `path` is an approved folder or lies beneath one.
    bool check(const std::filesystem::path& path) const;

    // Records approval and persists the whole set. Returns the normalized folder.
    std::filesystem::path grant(const std::filesystem::path& path);

    // Removes an exact entry; descendants approved separately stay approved.
    bool revoke(const std::filesystem::path& path);

    std::vector<std::string> folders() const;
    bool empty() const noexcept { return m_folders.empty(); }

private:
    std::set<std::filesystem::path> m_folders;
    FolderStore* m_store = nullptr;

    void persist() const;
};

} // namespace patchwise
