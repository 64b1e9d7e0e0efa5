#include "../include/patchwise/settings.hpp"
#include "../include/patchwise/json.hpp"
#include "../include/patchwise/log.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace patchwise {

namespace {

std::optional<long> parse_long_env(const char* name) {
    if (auto value = read_env(name)) {
        try {
            return std::stol(*value);
        } catch (const std::exception&) {
            log_warn("settings", std::string("ignoring non-numeric ") + name + "=" + *value);
        }
    }
    return std::nullopt;
}

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<Json> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return Json::parse(buffer.str());
}

void write_json_file(const std::filesystem::path& path, const Json& value) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("unable to open " + path.string() + " for writing");
    }
    out << value.dump_pretty() << '\n';
    if (!out) {
        throw std::runtime_error("failed writing " + path.string());
    }
}

// Replaces one top-level key, keeping whatever else the file holds.
void update_file_key(const std::filesystem::path& path, const std::string& key, Json value) {
    JsonObject obj;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto parsed = read_json_file(path);
        if (parsed && parsed->is_object()) {
            obj = parsed->as_object();
        }
    }
    obj[key] = std::move(value);
    write_json_file(path, Json(obj));
}

std::optional<ModelProfile> parse_profile(const std::string& key, const Json& value) {
    if (!value.is_object()) {
        log_warn("settings", "ignoring model " + key + ": not an object");
        return std::nullopt;
    }
    const auto& obj = value.as_object();
    ModelProfile profile;
    if (auto backend = find_string(obj, "backend")) {
        try {
            profile.backend = chat::parse_kind(*backend);
        } catch (const std::exception& ex) {
            log_warn("settings", "ignoring model " + key + ": " + ex.what());
            return std::nullopt;
        }
    }
    profile.name = find_string(obj, "name").value_or("");
    if (profile.name.empty()) {
        log_warn("settings", "ignoring model " + key + ": no name");
        return std::nullopt;
    }
    profile.endpoint = find_string(obj, "endpoint").value_or("");
    profile.api_key = find_string(obj, "api_key").value_or("");
    return profile;
}

void apply_file(Settings& settings, const JsonObject& obj) {
    if (auto backend = find_string(obj, "backend")) {
        try {
            settings.backend = chat::parse_kind(*backend);
        } catch (const std::exception& ex) {
            log_warn("settings", ex.what());
        }
    }
    if (auto endpoint = find_string(obj, "endpoint")) {
        settings.endpoint = *endpoint;
    }
    if (auto model = find_string(obj, "model")) {
        settings.model = *model;
    }
    if (auto key = find_string(obj, "api_key")) {
        settings.api_key = *key;
    }
    if (const Json* folders = find_member(obj, "approved_folders"); folders && folders->is_array()) {
        settings.approved_folders.clear();
        for (const auto& folder : folders->as_array()) {
            if (folder.is_string()) {
                settings.approved_folders.push_back(folder.as_string());
            }
        }
    }
    if (const Json* models = find_member(obj, "models"); models && models->is_object()) {
        settings.models.clear();
        for (const auto& [key, value] : models->as_object()) {
            if (auto profile = parse_profile(key, value)) {
                settings.models[key] = std::move(*profile);
            }
        }
    }
    if (auto current = find_string(obj, "current_model")) {
        settings.current_model = *current;
    }
}

void apply_current_model(Settings& settings) {
    if (settings.models.empty()) {
        return;
    }
    if (select_model(settings, settings.current_model)) {
        return;
    }
    const std::string fallback = settings.models.begin()->first;
    log_warn("settings", "model '" + settings.current_model + "' is not configured; using '" + fallback + "'");
    select_model(settings, fallback);
}

JsonObject to_json(const Settings& settings) {
    JsonObject obj;
    obj["backend"] = Json(chat::kind_to_string(settings.backend));
    obj["endpoint"] = Json(settings.endpoint);
    obj["model"] = Json(settings.model);
    obj["api_key"] = Json(settings.api_key);
    JsonArray folders;
    for (const auto& folder : settings.approved_folders) {
        folders.emplace_back(Json(folder));
    }
    obj["approved_folders"] = Json(folders);
    if (!settings.models.empty()) {
        JsonObject models;
        for (const auto& [key, profile] : settings.models) {
            JsonObject entry;
            entry["backend"] = Json(chat::kind_to_string(profile.backend));
            entry["name"] = Json(profile.name);
            entry["endpoint"] = Json(profile.endpoint);
            entry["api_key"] = Json(profile.api_key);
            models[key] = Json(entry);
        }
        obj["models"] = Json(models);
        obj["current_model"] = Json(settings.current_model);
    }
    return obj;
}

void apply_environment(Settings& settings) {
    if (auto backend = read_env("PATCHWISE_BACKEND")) {
        try {
            settings.backend = chat::parse_kind(*backend);
        } catch (const std::exception& ex) {
            log_warn("settings", ex.what());
        }
    }
    if (auto endpoint = read_env("PATCHWISE_ENDPOINT")) {
        settings.endpoint = *endpoint;
    }
    if (auto model = read_env("PATCHWISE_MODEL")) {
        settings.model = *model;
    }
    if (auto key = read_env("PATCHWISE_API_KEY")) {
        settings.api_key = *key;
    }
    if (auto seconds = parse_long_env("PATCHWISE_COMMAND_TIMEOUT_S"); seconds && *seconds > 0) {
        settings.command_timeout = std::chrono::seconds(*seconds);
    }
    if (auto no_stream = read_env("PATCHWISE_NO_STREAM")) {
        settings.stream = !is_truthy(*no_stream);
    }
}

} // namespace

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::filesystem::path default_settings_path() {
    if (auto configured = read_env("PATCHWISE_CONFIG"); configured && !configured->empty()) {
        return *configured;
    }
    if (auto home = read_env("HOME"); home && !home->empty()) {
        return std::filesystem::path(*home) / ".patchwise.json";
    }
    return ".patchwise.json";
}

Settings load_settings(const std::filesystem::path& path) {
    Settings settings;
    settings.path = path;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            if (auto parsed = read_json_file(path); parsed && parsed->is_object()) {
                apply_file(settings, parsed->as_object());
            } else {
                log_warn("settings", path.string() + " is not a JSON object; using defaults");
            }
        } catch (const std::exception& ex) {
            log_warn("settings", "failed to read " + path.string() + ": " + ex.what());
        }
    } else {
        settings.models = default_models();
        settings.current_model = "qwen3-coder";
        apply_current_model(settings);
        try {
            save_settings(settings);
            log_info("settings", "created default settings at " + path.string());
        } catch (const std::exception& ex) {
            log_warn("settings", std::string("failed to save default settings: ") + ex.what());
        }
    }

    apply_current_model(settings);
    apply_environment(settings);
    return settings;
}

void save_settings(const Settings& settings) {
    write_json_file(settings.path, Json(to_json(settings)));
}

std::map<std::string, ModelProfile> default_models() {
    const std::string lmstudio = chat::default_endpoint(chat::Kind::LMStudio);
    return {
        {"qwen3-coder", {chat::Kind::LMStudio, "lmstudio-community/qwen3-coder-30b-a3b-instruct-mlx@8bit", lmstudio, ""}},
        {"hermes-3", {chat::Kind::LMStudio, "NousResearch/Hermes-3-Llama-3.1-8B-GGUF", lmstudio, ""}},
        {"llama-3.2", {chat::Kind::LMStudio, "bartowski/Llama-3.2-3B-Instruct-GGUF", lmstudio, ""}},
        {"openai", {chat::Kind::OpenAICompat, "gpt-4", chat::default_endpoint(chat::Kind::OpenAICompat), ""}},
    };
}

bool select_model(Settings& settings, const std::string& key) {
    auto it = settings.models.find(key);
    if (it == settings.models.end()) {
        return false;
    }
    const ModelProfile& profile = it->second;
    settings.current_model = key;
    settings.backend = profile.backend;
    settings.model = profile.name;
    settings.endpoint = profile.endpoint;
    settings.api_key = profile.api_key;
    return true;
}

void save_current_model(const std::filesystem::path& path, const std::string& key) {
    update_file_key(path, "current_model", Json(key));
}

std::string mask_api_key(const std::string& key) {
    if (key.empty()) {
        return "(none)";
    }
    if (key.size() <= 4) {
        return "***";
    }
    return "***" + key.substr(key.size() - 4);
}

void JsonFolderStore::save_folders(const std::vector<std::string>& folders) {
    JsonArray list;
    for (const auto& folder : folders) {
        list.emplace_back(Json(folder));
    }
    update_file_key(m_path, "approved_folders", Json(list));
}

} // namespace patchwise
