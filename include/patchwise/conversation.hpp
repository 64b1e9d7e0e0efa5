#pragma once

#include "chat/backend.hpp"
#include "confirm.hpp"
#include "session.hpp"
#include "tools.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace patchwise {

struct LoopSettings {
    std::string model;
    std::size_t high_water_tokens = 25000;   // trim once the last prompt exceeded this
    std::size_t keep_recent = 6;             // non-system messages kept by a trim
    std::size_t context_window = 32000;
    std::size_t safety_buffer = 1000;
    int max_response_tokens = 8000;
    int min_response_tokens = 1000;
    int fallback_response_tokens = 2000;
    bool stream = true;
    bool color = true;
};

// A turn that could not reach a final answer; history appended before the failure is kept.
class TurnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TurnSummary {
    std::size_t model_calls = 0;
    std::size_t tool_results = 0;
    bool degraded = false;
    bool interrupted = false;
    std::string final_text;
};

// System messages plus the last `keep_recent` non-system messages. A cut that lands
// inside a batch of tool results moves back to the assistant message that issued them;
// results whose assistant message is already gone are dropped.
std::vector<chat::Message> trim_history(const std::vector<chat::Message>& history, std::size_t keep_recent);

// Tool-format and context-overflow failures that a simplified request may get past.
bool is_degradable_error(std::string_view message);

int response_budget(const std::optional<chat::TokenUsage>& last_usage, const LoopSettings& settings);

// Four characters per token, never below one.
std::size_t estimate_tokens(std::string_view text);

// Folds one streamed fragment into `calls`, growing it to the fragment's index.
void merge_tool_call_delta(std::vector<chat::ToolCall>& calls, const chat::ToolCallDelta& fragment);

std::string usage_footer(const Session& session);

class ConversationLoop {
public:
    ConversationLoop(chat::Backend& backend, ToolDispatcher& tools, Confirmer& confirmer,
                     std::ostream& out, LoopSettings settings, std::string system_prompt);

    // Drafts, dispatches tool calls and drafts again until the model answers without tool calls.
    TurnSummary run_turn(Session& session, const std::string& user_text);

    // Takes effect the next time a session starts from an empty history.
    void set_system_prompt(std::string prompt) { m_system_prompt = std::move(prompt); }

    // Later requests go to `backend` under `model`. The caller keeps `backend` alive.
    void switch_backend(chat::Backend& backend, std::string model) {
        m_backend = &backend;
        m_settings.model = std::move(model);
    }

    const std::string& model() const { return m_settings.model; }

private:
    struct Draft {
        std::string content;
        std::vector<chat::ToolCall> tool_calls;
        std::optional<chat::TokenUsage> usage;
    };

    chat::Backend* m_backend;
    ToolDispatcher& m_tools;
    Confirmer& m_confirmer;
    std::ostream& m_out;
    LoopSettings m_settings;
    std::string m_system_prompt;
    Json m_schema;

    void trim_if_needed(Session& session);
    Draft request_draft(Session& session, TurnSummary& summary);
    Draft stream_draft(const chat::Request& request, bool& received_delta);
    Draft degraded_draft(Session& session, const std::string& failure);
    void record_usage(Session& session, const Draft& draft);

    // Returns false when an interrupt replaced the rest of the batch with a new instruction.
    bool process_tool_calls(Session& session, const std::vector<chat::ToolCall>& calls, TurnSummary& summary);
    std::string run_tool_call(Session& session, const chat::ToolCall& call, const JsonObject& args, bool& interrupted);
};

} // namespace patchwise
