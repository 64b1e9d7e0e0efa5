#pragma once

#include "chat/backend.hpp"
#include "permission_gate.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchwise {

// One entry of the model registry; `endpoint` empty means the backend kind's default.
struct ModelProfile {
    chat::Kind backend = chat::Kind::LMStudio;
    std::string name;
    std::string endpoint;
    std::string api_key;
};

struct Settings {
    chat::Kind backend = chat::Kind::LMStudio;
    std::string endpoint;                 // empty: the backend kind's default endpoint
    std::string model = "qwen3-coder";
    std::string api_key;
    std::vector<std::string> approved_folders;
    std::map<std::string, ModelProfile> models;
    std::string current_model;            // key into `models`; selects backend, model, endpoint and key
    std::chrono::seconds command_timeout{30};
    bool stream = true;
    std::filesystem::path path;
};

// $PATCHWISE_CONFIG, else ~/.patchwise.json, else ./.patchwise.json when HOME is unset.
std::filesystem::path default_settings_path();

// The registry written into a fresh settings file.
std::map<std::string, ModelProfile> default_models();

// Defaults, then the settings file (written with defaults when missing), then environment.
// A malformed file is reported and ignored; it is never overwritten. When the file has a
// model registry, the current profile replaces the top-level backend, model, endpoint and
// api_key; an unknown current_model falls back to the first profile.
Settings load_settings(const std::filesystem::path& path);

void save_settings(const Settings& settings);

// Makes `key` the current model and copies its profile into `settings`. False for unknown keys.
bool select_model(Settings& settings, const std::string& key);

// Rewrites only the current_model key of the settings file.
void save_current_model(const std::filesystem::path& path, const std::string& key);

// "(none)", "***" for keys of four characters or fewer, otherwise "***" plus the last four.
std::string mask_api_key(const std::string& key);

std::optional<std::string> read_env(const char* name);

// Rewrites only the approved_folders key of the settings file.
class JsonFolderStore final : public FolderStore {
public:
    explicit JsonFolderStore(std::filesystem::path path) : m_path(std::move(path)) {}

    void save_folders(const std::vector<std::string>& folders) override;

private:
    std::filesystem::path m_path;
};

} // namespace patchwise
