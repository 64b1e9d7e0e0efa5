#include "../include/patchwise/permission_gate.hpp"
#include "../include/patchwise/log.hpp"

#include <system_error>

namespace patchwise {

std::filesystem::path normalize_folder(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path.empty() ? std::filesystem::path(".") : path, ec);
    if (ec) {
        absolute = path;
    }
    std::filesystem::path normal = absolute.lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty filename; drop it so entries compare equal.
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

PermissionGate::PermissionGate(const std::vector<std::string>& folders) {
    for (const auto& folder : folders) {
        if (!folder.empty()) {
            m_folders.insert(normalize_folder(folder));
        }
    }
}

bool PermissionGate::check(const std::filesystem::path& path) const {
    const std::filesystem::path target = normalize_folder(path);
    if (m_folders.count(target) != 0) {
        return true;
    }
    for (const auto& approved : m_folders) {
        const std::filesystem::path relative = target.lexically_relative(approved);
        if (relative.empty()) {
            continue;
        }
        if (*relative.begin() != "..") {
            return true;
        }
    }
    return false;
}

std::filesystem::path PermissionGate::grant(const std::filesystem::path& path) {
    std::filesystem::path folder = normalize_folder(path);
    if (m_folders.insert(folder).second) {
        log_info("permissions", "granted " + folder.string());
        persist();
    }
    return folder;
}

bool PermissionGate::revoke(const std::filesystem::path& path) {
    const std::filesystem::path folder = normalize_folder(path);
    if (m_folders.erase(folder) == 0) {
        return false;
    }
    log_info("permissions", "revoked " + folder.string());
    persist();
    return true;
}

std::vector<std::string> PermissionGate::folders() const {
    std::vector<std::string> out;
    out.reserve(m_folders.size());
    for (const auto& folder : m_folders) {
        out.push_back(folder.string());
    }
    return out;
}

void PermissionGate::persist() const {
    if (!m_store) {
        return;
    }
    try {
        m_store->save_folders(folders());
    } catch (const std::exception& ex) {
        log_warn("permissions", std::string("failed to save folder permissions: ") + ex.what());
    }
}

} // namespace patchwise
