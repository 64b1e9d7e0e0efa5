#include "../include/patchwise/tools.hpp"
#include "../include/patchwise/diff_renderer.hpp"
#include "../include/patchwise/log.hpp"

#include <exception>
#include <filesystem>
#include <regex>
#include <sstream>
#include <vector>

namespace {

using patchwise::Json;
using patchwise::JsonArray;
using patchwise::JsonObject;
using patchwise::ToolResult;

constexpr const char* kYellow = "\033[33m";
constexpr const char* kReset = "\033[0m";

// Distinguishes a missing key from a key holding the wrong type.
enum class Param {
    Missing,
    WrongType,
    Present
};

Param string_param(const JsonObject& args, const std::string& key, std::string& out) {
    const Json* value = patchwise::find_member(args, key);
    if (!value) {
        return Param::Missing;
    }
    if (!value->is_string()) {
        return Param::WrongType;
    }
    out = value->as_string();
    return Param::Present;
}

std::string string_or(const JsonObject& args, const std::string& key, std::string fallback) {
    auto value = patchwise::find_string(args, key);
    return value ? *value : std::move(fallback);
}

// Go-style %q quoting, enough for one-line summaries.
std::string quoted(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::string truncate(const std::string& text, std::size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }
    return text.substr(0, max_length - 3) + "...";
}

std::string exit_error(const char* what, int exit_code) {
    return std::string(what) + ": exit status " + std::to_string(exit_code);
}

Json property(const char* type, const char* description) {
    JsonObject prop;
    prop["type"] = Json(type);
    prop["description"] = Json(description);
    return Json(prop);
}

Json function_tool(const char* name, const char* description, JsonObject properties,
                   std::vector<std::string> required) {
    JsonArray required_json;
    for (auto& key : required) {
        required_json.emplace_back(Json(std::move(key)));
    }
    JsonObject parameters;
    parameters["type"] = Json("object");
    parameters["properties"] = Json(std::move(properties));
    parameters["required"] = Json(std::move(required_json));

    JsonObject function;
    function["name"] = Json(name);
    function["description"] = Json(description);
    function["parameters"] = Json(std::move(parameters));

    JsonObject tool;
    tool["type"] = Json("function");
    tool["function"] = Json(std::move(function));
    return Json(std::move(tool));
}

} // namespace

namespace patchwise {

ToolResult ReadFileTool::execute(ToolContext& ctx, const JsonObject& args) const {
    std::string path;
    if (string_param(args, "path", path) != Param::Present) {
        return ToolResult::failure("path parameter is required");
    }
    try {
        auto content = ctx.files.read(path);
        if (!content) {
            return ToolResult::failure("error reading file: " + path + ": no such file or directory");
        }
        return ToolResult::success(std::move(*content));
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("error reading file: ") + ex.what());
    }
}

ToolResult ListFilesTool::execute(ToolContext& ctx, const JsonObject& args) const {
    const std::string path = string_or(args, "path", ".");
    try {
        std::string listing;
        for (const auto& entry : ctx.files.list(path)) {
            if (!listing.empty()) {
                listing.push_back('\n');
            }
            listing += entry.name;
            if (entry.is_directory) {
                listing.push_back('/');
            }
        }
        return ToolResult::success(std::move(listing));
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("error listing directory: ") + ex.what());
    }
}

ToolResult BashCommandTool::execute(ToolContext& ctx, const JsonObject& args) const {
    std::string command;
    if (string_param(args, "command", command) != Param::Present) {
        return ToolResult::failure("command parameter is required");
    }

    ctx.progress << (ctx.color ? kYellow : "") << "Executing: " << command << (ctx.color ? kReset : "") << '\n';
    ctx.progress.flush();

    ProcessResult result;
    try {
        result = ctx.processes.run({"bash", "-c", command}, ctx.command_timeout);
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("failed to start command: ") + ex.what());
    }

    if (result.timed_out) {
        return ToolResult::failure("command timed out after " + std::to_string(ctx.command_timeout.count()) + " seconds",
                                   std::move(result.output));
    }
    if (result.exit_code != 0) {
        return ToolResult::failure(exit_error("command failed", result.exit_code), std::move(result.output));
    }
    return ToolResult::success(std::move(result.output));
}

ToolResult SearchCodeTool::execute(ToolContext& ctx, const JsonObject& args) const {
    std::string pattern;
    if (string_param(args, "pattern", pattern) != Param::Present) {
        return ToolResult::failure("pattern parameter is required");
    }
    const std::string directory = string_or(args, "directory", ".");

    ProcessResult result;
    try {
        result = ctx.processes.run({"grep", "-rn", "--", pattern, directory}, ctx.command_timeout);
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("failed to start search: ") + ex.what());
    }

    if (result.timed_out) {
        return ToolResult::failure("search timed out after " + std::to_string(ctx.command_timeout.count()) + " seconds",
                                   std::move(result.output));
    }
    // grep exits 1 when nothing matched.
    if (result.exit_code == 0 || result.exit_code == 1) {
        return ToolResult::success(std::move(result.output));
    }
    return ToolResult::failure(exit_error("search failed", result.exit_code), std::move(result.output));
}

ToolResult EditFileTool::execute(ToolContext& ctx, const JsonObject& args) const {
    std::string path;
    if (string_param(args, "filePath", path) != Param::Present && string_param(args, "path", path) != Param::Present) {
        return ToolResult::failure("filePath parameter is required");
    }

    std::string old_string;
    std::string new_string;
    std::string content;
    const Param old_param = string_param(args, "oldString", old_string);
    const Param new_param = string_param(args, "newString", new_string);
    const Param content_param = string_param(args, "content", content);
    const bool replace_all = find_bool(args, "replaceAll").value_or(false);

    if (old_param == Param::WrongType) {
        return ToolResult::failure("oldString parameter must be a string");
    }
    if (new_param == Param::WrongType) {
        return ToolResult::failure("newString parameter must be a string");
    }
    if (old_param == Param::Present && new_param != Param::Present) {
        return ToolResult::failure("newString parameter is required when using oldString");
    }

    try {
        if (new_param == Param::Present) {
            std::string original;
            if (!old_string.empty()) {
                std::optional<std::string> existing;
                try {
                    existing = ctx.files.read(path);
                } catch (const std::exception& ex) {
                    return ToolResult::failure(std::string("error reading file: ") + ex.what());
                }
                if (!existing) {
                    return ToolResult::failure("error reading file: " + path + ": no such file or directory");
                }
                original = std::move(*existing);
            }

            ReplaceOutcome outcome;
            try {
                outcome = ctx.engine.replace(original, old_string, new_string, replace_all);
            } catch (const EditError& ex) {
                return ToolResult::failure(std::string("replacement failed: ") + ex.what());
            }

            ctx.files.write(path, outcome.content);
            if (outcome.created) {
                return ToolResult::success("File " + path + " has been created");
            }

            log_debug("tools", "edit of " + path + " matched via " + std::string(strategy_name(outcome.match.strategy)));
            ctx.progress << render_diff(original, outcome.content, path, DiffOptions{ctx.color, kContextLines});

            std::ostringstream summary;
            summary << "Incremental edit applied to: " << path << '\n'
                    << "Changes:\n"
                    << "  - Removed: " << quoted(truncate(old_string, 80)) << '\n'
                    << "  + Added: " << quoted(truncate(new_string, 80)) << '\n'
                    << '\n'
                    << render_diff(original, outcome.content, path);
            return ToolResult::success(summary.str());
        }

        if (content_param == Param::WrongType) {
            return ToolResult::failure("content parameter must be a string");
        }
        if (content_param == Param::Present) {
            std::optional<std::string> previous;
            try {
                previous = ctx.files.read(path);
            } catch (const std::exception& ex) {
                return ToolResult::failure(std::string("error reading file: ") + ex.what());
            }
            ctx.files.write(path, content);
            if (!previous) {
                return ToolResult::success("File " + path + " has been created");
            }
            if (*previous == content) {
                return ToolResult::success("File " + path + " unchanged");
            }
            ctx.progress << render_diff(*previous, content, path, DiffOptions{ctx.color, kContextLines});
            return ToolResult::success("File " + path + " has been modified");
        }
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("error writing file: ") + ex.what());
    }

    return ToolResult::failure(
        "either newString (for new files) or oldString+newString (for edits) or content (for full replacement) must be provided");
}

ToolResult PreviewEditTool::execute(ToolContext& ctx, const JsonObject& args) const {
    std::string path;
    std::string content;
    if (string_param(args, "path", path) != Param::Present) {
        return ToolResult::failure("path parameter is required");
    }
    if (string_param(args, "content", content) != Param::Present) {
        return ToolResult::failure("content parameter is required");
    }

    std::optional<std::string> existing;
    try {
        existing = ctx.files.read(path);
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("error reading file: ") + ex.what());
    }
    const std::string old_content = existing.value_or(std::string());
    if (old_content == content) {
        return ToolResult::success("Preview: No changes would be made to " + path);
    }

    ctx.progress << render_diff(old_content, content, path, DiffOptions{ctx.color, kContextLines});
    if (!existing) {
        return ToolResult::success("Preview: Would create new file " + path);
    }
    return ToolResult::success("Preview: Would modify file " + path);
}

std::optional<Tool> find_tool(std::string_view name) {
    if (name == ReadFileTool::kName) return Tool{ReadFileTool{}};
    if (name == ListFilesTool::kName) return Tool{ListFilesTool{}};
    if (name == BashCommandTool::kName) return Tool{BashCommandTool{}};
    if (name == SearchCodeTool::kName) return Tool{SearchCodeTool{}};
    if (name == EditFileTool::kName) return Tool{EditFileTool{}};
    if (name == PreviewEditTool::kName) return Tool{PreviewEditTool{}};
    return std::nullopt;
}

ToolDispatcher::ToolDispatcher(FileSystem& files, ProcessRunner& processes, std::ostream& progress,
                               std::chrono::seconds command_timeout)
    : m_context{files, processes, progress, command_timeout, true, ReplaceEngine{}} {}

ToolResult ToolDispatcher::dispatch(const std::string& name, const JsonObject& args) {
    auto tool = find_tool(name);
    if (!tool) {
        log_warn("tools", "model requested unknown tool " + name);
        return ToolResult::failure("Unknown tool");
    }
    try {
        return std::visit([&](const auto& impl) { return impl.execute(m_context, args); }, *tool);
    } catch (const std::exception& ex) {
        log_error("tools", name + " raised: " + ex.what());
        return ToolResult::failure(ex.what());
    }
}

ToolResult ToolDispatcher::run_background(const JsonObject& args) {
    std::string command;
    if (string_param(args, "command", command) != Param::Present) {
        return ToolResult::failure("command parameter is required");
    }
    const bool color = m_context.color;
    m_context.progress << (color ? kYellow : "") << "Starting in background: " << command << (color ? kReset : "") << '\n';
    try {
        const long pid = m_context.processes.start_detached({"bash", "-c", command});
        return ToolResult::success("Command started in background with PID " + std::to_string(pid) +
                                   ". Use 'ps aux | grep \"" + command + "\"' to check status.");
    } catch (const std::exception& ex) {
        return ToolResult::failure(std::string("Failed to start command in background: ") + ex.what());
    }
}

Json ToolDispatcher::tool_schema() const {
    JsonArray tools;

    JsonObject read_props;
    read_props["path"] = property("string", "Path to the file to read");
    tools.emplace_back(function_tool("read_file", "Read the contents of a file", std::move(read_props), {"path"}));

    JsonObject list_props;
    list_props["path"] = property("string", "Directory path to list");
    tools.emplace_back(function_tool("list_files", "List files in a directory", std::move(list_props), {"path"}));

    JsonObject bash_props;
    bash_props["command"] = property("string", "Command to execute");
    tools.emplace_back(function_tool("bash_command", "Execute a bash command", std::move(bash_props), {"command"}));

    JsonObject edit_props;
    edit_props["filePath"] = property("string", "The path to the file to modify");
    edit_props["oldString"] = property("string",
        "The text to replace (for editing existing files). Supports fuzzy matching for whitespace differences.");
    edit_props["newString"] = property("string",
        "The replacement text. For new files, provide this without oldString. For edits, use with oldString.");
    edit_props["replaceAll"] = property("boolean",
        "Replace all occurrences of oldString (default: false - only replace if unique match)");
    tools.emplace_back(function_tool("edit_file",
        "Perform incremental edits to a file using find-and-replace. For new files, use newString only. "
        "For edits, use oldString+newString.",
        std::move(edit_props), {"filePath", "newString"}));

    JsonObject search_props;
    search_props["pattern"] = property("string", "Pattern to search for");
    search_props["directory"] = property("string", "Directory to search in");
    tools.emplace_back(function_tool("search_code", "Search for code patterns in files", std::move(search_props), {"pattern"}));

    JsonObject preview_props;
    preview_props["path"] = property("string", "Path to the file that would change");
    preview_props["content"] = property("string", "Proposed full content of the file");
    tools.emplace_back(function_tool("preview_edit", "Show the diff a full rewrite would produce without writing it",
                                     std::move(preview_props), {"path", "content"}));

    return Json(std::move(tools));
}

bool is_long_running(std::string_view command) {
    static const std::regex pattern(
        R"(python|node|npm start|npm run|go run|serve|uvicorn|gunicorn|flask run|php -s|java -jar|\./|watch|tail -f|ping|curl.*-w|sleep|while true)",
        std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(command.begin(), command.end(), pattern);
}

bool is_read_oriented(std::string_view tool) {
    return tool == ReadFileTool::kName || tool == ListFilesTool::kName || tool == PreviewEditTool::kName;
}

std::optional<std::string> folder_for(std::string_view tool, const JsonObject& args) {
    if (tool == ListFilesTool::kName) {
        return string_or(args, "path", ".");
    }
    if (tool == ReadFileTool::kName || tool == PreviewEditTool::kName) {
        auto path = find_string(args, "path");
        if (!path) {
            return std::nullopt;
        }
        const std::string parent = std::filesystem::path(*path).parent_path().string();
        return parent.empty() ? std::string(".") : parent;
    }
    return std::nullopt;
}

std::string describe_call(std::string_view tool, const JsonObject& args) {
    std::string line(tool);
    if (tool == BashCommandTool::kName) {
        if (auto command = find_string(args, "command")) {
            line += " `" + *command + "`";
        }
    } else if (tool == SearchCodeTool::kName) {
        if (auto pattern = find_string(args, "pattern")) {
            line += " \"" + *pattern + "\"";
        }
    } else if (tool == EditFileTool::kName) {
        if (auto path = find_string(args, "filePath")) {
            line += " <" + *path + ">";
        } else if (auto alt = find_string(args, "path")) {
            line += " <" + *alt + ">";
        }
    } else if (auto path = find_string(args, "path")) {
        line += " <" + *path + ">";
    }
    return line;
}

} // namespace patchwise
