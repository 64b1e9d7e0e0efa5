#include "../include/patchwise/filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace patchwise {

std::optional<std::string> LocalFileSystem::read(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw std::runtime_error(path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }
    if (std::filesystem::is_directory(status)) {
        throw std::runtime_error(path.string() + ": is a directory");
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(path.string() + ": " + std::strerror(errno));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error(path.string() + ": read failed");
    }
    return buffer.str();
}

void LocalFileSystem::write(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(path.string() + ": " + std::strerror(errno));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error(path.string() + ": write failed");
    }
}

std::vector<DirEntry> LocalFileSystem::list(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw std::runtime_error(path.string() + ": " + ec.message());
    }
    std::vector<DirEntry> entries;
    for (const auto& entry : it) {
        std::error_code type_ec;
        entries.push_back(DirEntry{entry.path().filename().string(), entry.is_directory(type_ec)});
    }
    std::sort(entries.begin(), entries.end(), [](const DirEntry& lhs, const DirEntry& rhs) {
        return lhs.name < rhs.name;
    });
    return entries;
}

bool LocalFileSystem::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace patchwise
