#pragma once

#include "filesystem.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace patchwise {

inline constexpr const char* kAgentsFile = "AGENTS.md";

// Contents of AGENTS.md in `directory`, or nullopt when absent or blank.
std::optional<std::string> load_agents_md(FileSystem& files, const std::filesystem::path& directory);

// Base instructions plus the project context block when `agents_md` is set.
std::string build_system_prompt(const std::optional<std::string>& agents_md);

std::string agents_template(const std::string& project_name, const std::string& location, const std::string& timestamp);

// Appends `- instruction` to the "### Permanent Instructions" section, creating it when missing.
std::string add_permanent_instruction(const std::string& agents_md, const std::string& instruction);

// Writes a template AGENTS.md into `directory`; returns false when one exists and `overwrite` is false.
bool initialize_project(FileSystem& files, const std::filesystem::path& directory, bool overwrite);

// Reads (or seeds from the template) AGENTS.md and records `instruction` in it.
void record_permanent_instruction(FileSystem& files, const std::filesystem::path& directory, const std::string& instruction);

} // namespace patchwise
