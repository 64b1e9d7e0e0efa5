#include "../include/patchwise/conversation.hpp"
#include "../include/patchwise/log.hpp"
#include "../include/patchwise/spinner.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace patchwise {

namespace {

using chat::Message;
using chat::Role;
using chat::TokenUsage;
using chat::ToolCall;

constexpr const char* kCyan = "\033[36m";
constexpr const char* kBlue = "\033[34m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kReset = "\033[0m";

constexpr std::string_view kDegradablePatterns[] = {
    "tool call", "failed to parse", "unexpected end", "context", "too long", "maximum",
};

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string format_result(const ToolResult& result) {
    if (result.ok()) {
        return result.text;
    }
    std::string text = "Error: " + *result.error;
    if (!result.text.empty()) {
        text += "\nOutput:\n" + result.text;
    }
    return text;
}

std::size_t estimate_history(const std::vector<Message>& history) {
    std::size_t chars = 0;
    for (const auto& msg : history) {
        chars += msg.text.size();
        for (const auto& call : msg.tool_calls) {
            chars += call.name.size() + call.arguments.size();
        }
    }
    return chars / 4;
}

} // namespace

std::vector<Message> trim_history(const std::vector<Message>& history, std::size_t keep_recent) {
    std::vector<Message> system;
    std::vector<const Message*> others;
    for (const auto& msg : history) {
        if (msg.role == Role::System) {
            system.push_back(msg);
        } else {
            others.push_back(&msg);
        }
    }
    if (others.size() <= keep_recent) {
        return history;
    }

    std::size_t first = others.size() - keep_recent;
    if (others[first]->role == Role::Tool) {
        // Pull the cut back to the assistant message that issued these results.
        std::size_t owner = first;
        while (owner > 0 && others[owner - 1]->role == Role::Tool) {
            --owner;
        }
        if (owner > 0 && others[owner - 1]->role == Role::Assistant && !others[owner - 1]->tool_calls.empty()) {
            first = owner - 1;
        } else {
            while (first < others.size() && others[first]->role == Role::Tool) {
                ++first;
            }
        }
    }
    std::vector<Message> trimmed = std::move(system);
    for (std::size_t i = first; i < others.size(); ++i) {
        trimmed.push_back(*others[i]);
    }
    return trimmed;
}

bool is_degradable_error(std::string_view message) {
    const std::string lowered = lowercase(message);
    return std::any_of(std::begin(kDegradablePatterns), std::end(kDegradablePatterns), [&](std::string_view pattern) {
        return lowered.find(pattern) != std::string::npos;
    });
}

int response_budget(const std::optional<TokenUsage>& last_usage, const LoopSettings& settings) {
    int budget = settings.max_response_tokens;
    if (!last_usage) {
        return budget;
    }
    const long long remaining = static_cast<long long>(settings.context_window) -
                                static_cast<long long>(last_usage->prompt_tokens) -
                                static_cast<long long>(settings.safety_buffer);
    if (remaining < budget) {
        budget = static_cast<int>(std::max<long long>(remaining, settings.min_response_tokens));
    }
    return budget;
}

std::size_t estimate_tokens(std::string_view text) {
    return std::max<std::size_t>(1, text.size() / 4);
}

void merge_tool_call_delta(std::vector<ToolCall>& calls, const chat::ToolCallDelta& fragment) {
    if (calls.size() <= fragment.index) {
        calls.resize(fragment.index + 1);
    }
    ToolCall& call = calls[fragment.index];
    if (call.id.empty() && !fragment.id.empty()) {
        call.id = fragment.id;
    }
    if (call.name.empty() && !fragment.name.empty()) {
        call.name = fragment.name;
    }
    call.arguments += fragment.arguments;
}

std::string usage_footer(const Session& session) {
    std::ostringstream out;
    const std::size_t prompt = session.last_usage ? session.last_usage->prompt_tokens : 0;
    const std::size_t completion = session.last_usage ? session.last_usage->completion_tokens : 0;
    out << "[Context: " << prompt << " tokens | Response: " << completion << " tokens | Session: "
        << session.total_tokens << " tokens]";
    return out.str();
}

ConversationLoop::ConversationLoop(chat::Backend& backend, ToolDispatcher& tools, Confirmer& confirmer,
                                   std::ostream& out, LoopSettings settings, std::string system_prompt)
    : m_backend(&backend),
      m_tools(tools),
      m_confirmer(confirmer),
      m_out(out),
      m_settings(std::move(settings)),
      m_system_prompt(std::move(system_prompt)),
      m_schema(tools.tool_schema()) {}

TurnSummary ConversationLoop::run_turn(Session& session, const std::string& user_text) {
    if (session.history.empty()) {
        session.history.push_back(Message::system(m_system_prompt));
    }
    session.history.push_back(Message::user(user_text));

    TurnSummary summary;
    while (true) {
        trim_if_needed(session);
        Draft draft = request_draft(session, summary);
        record_usage(session, draft);

        const bool has_calls = !draft.tool_calls.empty();
        summary.final_text = draft.content;
        session.history.push_back(Message::assistant(std::move(draft.content), draft.tool_calls));
        if (!has_calls) {
            break;
        }
        if (!process_tool_calls(session, draft.tool_calls, summary)) {
            summary.interrupted = true;
        }
    }

    m_out << '\n';
    if (session.last_usage && session.last_usage->prompt_tokens > 0) {
        m_out << (m_settings.color ? kBlue : "") << usage_footer(session) << (m_settings.color ? kReset : "") << '\n';
    }
    m_out.flush();
    return summary;
}

void ConversationLoop::trim_if_needed(Session& session) {
    if (!session.last_usage || session.last_usage->prompt_tokens <= m_settings.high_water_tokens) {
        return;
    }
    const std::size_t before = session.history.size();
    m_out << (m_settings.color ? kYellow : "") << "Context getting large (" << session.last_usage->prompt_tokens
          << " tokens), trimming older messages..." << (m_settings.color ? kReset : "") << '\n';
    session.history = trim_history(session.history, m_settings.keep_recent);
    m_out << "Context trimmed: " << before << " -> " << session.history.size() << " messages\n";
    log_info("conversation", "trimmed history from " + std::to_string(before) + " to " +
                                 std::to_string(session.history.size()) + " messages");
}

ConversationLoop::Draft ConversationLoop::request_draft(Session& session, TurnSummary& summary) {
    chat::Request request;
    request.model = m_settings.model;
    request.messages = session.history;
    request.tools = m_schema;
    request.max_tokens = response_budget(session.last_usage, m_settings);
    request.stream = m_settings.stream;

    bool received_delta = false;
    ++summary.model_calls;
    try {
        if (m_settings.stream) {
            return stream_draft(request, received_delta);
        }
        chat::Response response = m_backend->complete(request);
        m_out << response.content;
        m_out.flush();
        return Draft{std::move(response.content), std::move(response.tool_calls), response.usage};
    } catch (const std::exception& ex) {
        if (received_delta || !is_degradable_error(ex.what())) {
            throw TurnError(std::string("error calling model: ") + ex.what());
        }
        ++summary.model_calls;
        summary.degraded = true;
        return degraded_draft(session, ex.what());
    }
}

ConversationLoop::Draft ConversationLoop::stream_draft(const chat::Request& request, bool& received_delta) {
    Draft draft;
    Spinner spinner(m_out);
    auto on_delta = [&](const chat::Delta& delta) {
        received_delta = true;
        if (!delta.content.empty()) {
            spinner.stop();
            m_out << delta.content;
            m_out.flush();
            draft.content += delta.content;
        }
        if (!delta.tool_calls.empty()) {
            if (!spinner.running()) {
                m_out << '\n';
                spinner.start();
            }
            for (const auto& fragment : delta.tool_calls) {
                merge_tool_call_delta(draft.tool_calls, fragment);
            }
        }
    };

    draft.usage = m_backend->stream(request, on_delta);
    spinner.stop();
    return draft;
}

ConversationLoop::Draft ConversationLoop::degraded_draft(Session& session, const std::string& failure) {
    m_out << '\n' << (m_settings.color ? kYellow : "") << "Request failed: " << failure
          << (m_settings.color ? kReset : "") << '\n';
    m_out << "Retrying with simplified request...\n";
    log_warn("conversation", "degraded retry after: " + failure);

    std::vector<Message> trimmed = trim_history(session.history, m_settings.keep_recent);
    chat::Request request;
    request.model = m_settings.model;
    request.messages = trimmed;
    request.max_tokens = m_settings.fallback_response_tokens;
    request.stream = false;

    chat::Response response;
    try {
        response = m_backend->complete(request);
    } catch (const std::exception& ex) {
        throw TurnError(std::string("error calling model (even after fallback): ") + ex.what());
    }

    session.history = std::move(trimmed);
    m_out << response.content;
    m_out.flush();
    return Draft{std::move(response.content), std::move(response.tool_calls), response.usage};
}

void ConversationLoop::record_usage(Session& session, const Draft& draft) {
    if (draft.usage) {
        session.last_usage = draft.usage;
        session.total_tokens += draft.usage->total();
        return;
    }
    TokenUsage estimate;
    estimate.prompt_tokens = estimate_history(session.history);
    estimate.completion_tokens = estimate_tokens(draft.content);
    session.last_usage = estimate;
    session.total_tokens += estimate.completion_tokens;
}

bool ConversationLoop::process_tool_calls(Session& session, const std::vector<ToolCall>& calls, TurnSummary& summary) {
    for (const auto& call : calls) {
        Json parsed;
        std::string parse_error;
        try {
            parsed = Json::parse(call.arguments.empty() ? std::string_view("{}") : std::string_view(call.arguments));
            if (!parsed.is_object()) {
                parse_error = "arguments are not a JSON object";
            }
        } catch (const std::exception& ex) {
            parse_error = ex.what();
        }
        if (!parse_error.empty()) {
            log_warn("conversation", "bad arguments for " + call.name + ": " + parse_error);
            m_out << "Error parsing tool parameters: " << parse_error << '\n';
            session.history.push_back(Message::tool(call.id, "Error: failed to parse tool arguments: " + parse_error));
            ++summary.tool_results;
            continue;
        }

        bool interrupted = false;
        std::string result = run_tool_call(session, call, parsed.as_object(), interrupted);
        ++summary.tool_results;
        if (interrupted) {
            return false;
        }
        session.history.push_back(Message::tool(call.id, std::move(result)));
    }
    return true;
}

std::string ConversationLoop::run_tool_call(Session& session, const ToolCall& call, const JsonObject& args,
                                            bool& interrupted) {
    m_out << '\n' << (m_settings.color ? kCyan : "") << describe_call(call.name, args)
          << (m_settings.color ? kReset : "") << '\n';

    bool long_running = false;
    if (call.name == BashCommandTool::kName) {
        if (auto command = find_string(args, "command")) {
            long_running = is_long_running(*command);
        }
    }

    bool approved = false;
    if (is_read_oriented(call.name)) {
        if (auto folder = folder_for(call.name, args)) {
            if (session.gate.check(*folder)) {
                approved = true;
            } else if (m_confirmer.approve_folder(normalize_folder(*folder).string())) {
                session.gate.grant(*folder);
                approved = true;
            } else {
                return "Permission denied for folder access";
            }
        }
    }

    const Decision decision = approved ? Decision::Execute : m_confirmer.confirm_tool(call, long_running);
    switch (decision) {
    case Decision::Execute:
        return format_result(m_tools.dispatch(call.name, args));
    case Decision::Skip:
        return "Tool execution skipped by user";
    case Decision::Deny:
        return "Tool execution denied by user";
    case Decision::Background:
        if (!long_running) {
            m_out << "Background execution only available for long-running commands\n";
            return "Background execution only available for long-running commands";
        }
        return format_result(m_tools.run_background(args));
    case Decision::Interrupt: {
        const std::string instruction = m_confirmer.interrupt_instruction();
        if (instruction.empty()) {
            return "Tool execution interrupted but no alternative instruction provided";
        }
        m_out << "Interrupting with new instruction: " << instruction << '\n';
        session.history.push_back(Message::tool(call.id, "Tool execution interrupted by user. New instruction: " + instruction));
        session.history.push_back(Message::user(instruction));
        interrupted = true;
        return {};
    }
    }
    return "Tool execution denied by user";
}

} // namespace patchwise
