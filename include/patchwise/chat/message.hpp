#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchwise::chat {

enum class Role {
    System,
    User,
    Assistant,
    Tool
};

std::string_view role_name(Role role) noexcept;

// `arguments` is the raw JSON text exactly as the model produced it.
struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments;
};

struct Message {
    Role role = Role::User;
    std::string text;
    std::vector<ToolCall> tool_calls;
    std::string tool_call_id;

    static Message system(std::string text) { return Message{Role::System, std::move(text), {}, {}}; }
    static Message user(std::string text) { return Message{Role::User, std::move(text), {}, {}}; }
    static Message assistant(std::string text, std::vector<ToolCall> calls = {}) {
        return Message{Role::Assistant, std::move(text), std::move(calls), {}};
    }
    static Message tool(std::string call_id, std::string text) {
        return Message{Role::Tool, std::move(text), {}, std::move(call_id)};
    }
};

struct TokenUsage {
    std::size_t prompt_tokens = 0;
    std::size_t completion_tokens = 0;

    std::size_t total() const noexcept { return prompt_tokens + completion_tokens; }
};

} // namespace patchwise::chat
