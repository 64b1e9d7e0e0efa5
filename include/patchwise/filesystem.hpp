#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchwise {

struct DirEntry {
    std::string name;
    bool is_directory = false;
};

// nullopt from read() means NotFound; every other failure throws std::runtime_error.
struct FileSystem {
    virtual ~FileSystem() = default;
    virtual std::optional<std::string> read(const std::filesystem::path& path) = 0;
    virtual void write(const std::filesystem::path& path, const std::string& bytes) = 0;
    virtual std::vector<DirEntry> list(const std::filesystem::path& path) = 0;
    virtual bool exists(const std::filesystem::path& path) = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    std::optional<std::string> read(const std::filesystem::path& path) override;
    void write(const std::filesystem::path& path, const std::string& bytes) override;
    std::vector<DirEntry> list(const std::filesystem::path& path) override;
    bool exists(const std::filesystem::path& path) override;
};

} // namespace patchwise
