#pragma once

#include "filesystem.hpp"
#include "json.hpp"
#include "process.hpp"
#include "replace_engine.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace patchwise {

// `error` set means the call failed; `text` still carries any output gathered before the failure.
struct ToolResult {
    std::string text;
    std::optional<std::string> error;

    bool ok() const noexcept { return !error.has_value(); }

    static ToolResult success(std::string text) { return ToolResult{std::move(text), std::nullopt}; }
    static ToolResult failure(std::string error, std::string text = std::string()) {
        return ToolResult{std::move(text), std::move(error)};
    }
};

struct ToolContext {
    FileSystem& files;
    ProcessRunner& processes;
    std::ostream& progress;          // side channel: diffs and execution notices for the operator
    std::chrono::seconds command_timeout{30};
    bool color = true;
    ReplaceEngine engine;
};

struct ReadFileTool {
    static constexpr std::string_view kName = "read_file";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

struct ListFilesTool {
    static constexpr std::string_view kName = "list_files";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

struct BashCommandTool {
    static constexpr std::string_view kName = "bash_command";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

struct SearchCodeTool {
    static constexpr std::string_view kName = "search_code";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

// oldString+newString patches in place, newString alone creates, content alone rewrites the file.
struct EditFileTool {
    static constexpr std::string_view kName = "edit_file";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

struct PreviewEditTool {
    static constexpr std::string_view kName = "preview_edit";
    ToolResult execute(ToolContext& ctx, const JsonObject& args) const;
};

using Tool = std::variant<ReadFileTool, ListFilesTool, BashCommandTool, SearchCodeTool, EditFileTool, PreviewEditTool>;

std::optional<Tool> find_tool(std::string_view name);

class ToolDispatcher {
public:
    ToolDispatcher(FileSystem& files, ProcessRunner& processes, std::ostream& progress,
                   std::chrono::seconds command_timeout = std::chrono::seconds(30));

    // Never throws for tool-level failures; they come back as ToolResult errors.
    ToolResult dispatch(const std::string& name, const JsonObject& args);

    // Starts args["command"] detached; used when the operator answers `b` to a long-running command.
    ToolResult run_background(const JsonObject& args);

    // OpenAI `tools` array advertised to the model.
    Json tool_schema() const;

    void set_color(bool color) noexcept { m_context.color = color; }

private:
    ToolContext m_context;
};

bool is_long_running(std::string_view command);

// Tools gated by the approved-folder set instead of the confirmation prompt.
bool is_read_oriented(std::string_view tool);

// Folder a read-oriented call touches: the parent of a file path, or the listed directory.
std::optional<std::string> folder_for(std::string_view tool, const JsonObject& args);

// One-line summary such as `read_file <src/main.cpp>` for the progress stream.
std::string describe_call(std::string_view tool, const JsonObject& args);

} // namespace patchwise
