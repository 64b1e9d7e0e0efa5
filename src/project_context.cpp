#include "../include/patchwise/project_context.hpp"
#include "../include/patchwise/log.hpp"

#include <sstream>
#include <stdexcept>

namespace patchwise {

namespace {

constexpr const char* kBasePrompt =
    "You are a helpful coding agent. You have access to tools that allow you to:\n"
    "- Read and write files\n"
    "- Execute bash commands\n"
    "- List directory contents\n"
    "- Search for code patterns\n"
    "\n"
    "Use these tools to help the user with their coding tasks. Always be clear about what you're doing and why.";

constexpr std::string_view kPermanentHeader = "### Permanent Instructions";
constexpr std::string_view kPlaceholder = "*Use #command";

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::optional<std::string> load_agents_md(FileSystem& files, const std::filesystem::path& directory) {
    std::optional<std::string> content;
    try {
        content = files.read(directory / kAgentsFile);
    } catch (const std::exception& ex) {
        log_warn("project", std::string("could not read AGENTS.md: ") + ex.what());
        return std::nullopt;
    }
    if (!content || is_blank(*content)) {
        return std::nullopt;
    }
    return content;
}

std::string build_system_prompt(const std::optional<std::string>& agents_md) {
    std::string prompt = kBasePrompt;
    if (agents_md) {
        prompt += "\n\n--- PROJECT CONTEXT (AGENTS.md) ---\n";
        prompt += *agents_md;
        prompt += "\n--- END PROJECT CONTEXT ---\n\n"
                  "IMPORTANT: Pay special attention to any 'Permanent Instructions' in the project context above "
                  "and follow them consistently.";
    }
    return prompt;
}

std::string agents_template(const std::string& project_name, const std::string& location, const std::string& timestamp) {
    std::ostringstream out;
    out << "# " << project_name << " - AI Agent Instructions\n"
        << "\n"
        << "## Project Overview\n"
        << "**Project Name:** " << project_name << "  \n"
        << "**Location:** " << location << "  \n"
        << "**Initialized:** " << timestamp << "  \n"
        << "\n"
        << "## Project Structure\n"
        << "*Document your project structure and key files here*\n"
        << "\n"
        << "## Development Guidelines\n"
        << "*Add project-specific coding standards, patterns, and conventions here*\n"
        << "\n"
        << "## AI Agent Instructions\n"
        << "\n"
        << kPermanentHeader << '\n'
        << kPlaceholder << " to add permanent instructions for AI agents working on this project*\n"
        << "\n"
        << "### Project Context\n"
        << "*Key information about this project that AI agents should know*\n";
    return out.str();
}

std::string add_permanent_instruction(const std::string& agents_md, const std::string& instruction) {
    std::string content = agents_md;
    const std::string bullet = "- " + instruction;

    const std::size_t header = content.find(kPermanentHeader);
    if (header == std::string::npos) {
        const std::size_t last_section = content.rfind("\n### ");
        if (last_section == std::string::npos) {
            content += "\n\n## AI Agent Instructions\n\n" + std::string(kPermanentHeader) + "\n" + bullet + "\n";
        } else {
            content.insert(last_section, "\n" + std::string(kPermanentHeader) + "\n" + bullet + "\n");
        }
        return content;
    }

    const std::size_t section_start = header + kPermanentHeader.size();
    std::size_t section_end = content.find("\n### ", section_start);
    if (section_end == std::string::npos) {
        section_end = content.size();
    }
    const std::string section = content.substr(section_start, section_end - section_start);

    if (const std::size_t last_bullet = section.rfind("\n- "); last_bullet != std::string::npos) {
        const std::size_t bullet_start = section_start + last_bullet + 1;
        std::size_t line_end = content.find('\n', bullet_start);
        if (line_end == std::string::npos || line_end > section_end) {
            line_end = section_end;
        }
        content.insert(line_end, "\n" + bullet);
    } else if (const std::size_t placeholder = section.find(kPlaceholder); placeholder != std::string::npos) {
        const std::size_t start = section_start + placeholder;
        std::size_t end = content.find('\n', start);
        if (end == std::string::npos || end > section_end) {
            end = section_end;
        }
        content.replace(start, end - start, bullet);
    } else {
        content.insert(section_start, "\n" + bullet);
    }
    return content;
}

bool initialize_project(FileSystem& files, const std::filesystem::path& directory, bool overwrite) {
    const auto target = directory / kAgentsFile;
    if (!overwrite && files.exists(target)) {
        return false;
    }
    const auto absolute = std::filesystem::absolute(directory).lexically_normal();
    std::string name = absolute.filename().string();
    if (name.empty()) {
        name = absolute.parent_path().filename().string();
    }
    files.write(target, agents_template(name, absolute.string(), timestamp_now().substr(0, 19)));
    log_info("project", "wrote " + target.string());
    return true;
}

void record_permanent_instruction(FileSystem& files, const std::filesystem::path& directory, const std::string& instruction) {
    const auto target = directory / kAgentsFile;
    auto content = files.read(target);
    if (!content) {
        initialize_project(files, directory, true);
        content = files.read(target);
        if (!content) {
            throw std::runtime_error("failed to read newly created " + target.string());
        }
    }
    files.write(target, add_permanent_instruction(*content, instruction));
}

} // namespace patchwise
