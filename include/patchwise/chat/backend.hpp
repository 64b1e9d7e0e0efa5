#pragma once

#include "../json.hpp"
#include "../net/http.hpp"
#include "message.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace patchwise::chat {

struct Request {
    std::string model;
    std::vector<Message> messages;
    Json tools;               // null when tools are disabled
    int max_tokens = 0;
    bool stream = false;
};

struct Response {
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<TokenUsage> usage;
};

// One streamed fragment of a tool call; fields are empty when the chunk does not carry them.
struct ToolCallDelta {
    std::size_t index = 0;
    std::string id;
    std::string name;
    std::string arguments;
};

struct Delta {
    std::string content;
    std::vector<ToolCallDelta> tool_calls;
};

using DeltaHandler = std::function<void(const Delta&)>;

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message, long status = 0)
        : std::runtime_error(message), m_status(status) {}

    long status() const noexcept { return m_status; }

private:
    long m_status;
};

struct Backend {
    virtual ~Backend() = default;
    virtual Response complete(const Request& request) = 0;
    // Delivers deltas in arrival order and returns usage when the server reported it.
    virtual std::optional<TokenUsage> stream(const Request& request, const DeltaHandler& on_delta) = 0;
};

using BackendPtr = std::unique_ptr<Backend>;

enum class Kind {
    OpenAICompat,
    LMStudio,
    Ollama,
    OpenRouter
};

BackendPtr make_backend(Kind kind, std::string endpoint, std::string model, std::string api_key = std::string());

Kind parse_kind(const std::string& name);
std::string kind_to_string(Kind kind);
std::string default_endpoint(Kind kind);

// Wire helpers for the OpenAI chat-completions format.
Json serialize_messages(const std::vector<Message>& messages);
Json serialize_request(const Request& request, const std::string& fallback_model);
Response parse_completion(const Json& response);

struct StreamEvent {
    bool done = false;
    std::optional<Delta> delta;
    std::optional<TokenUsage> usage;
};

// Parses one server-sent-events line; comments, blank lines and non-data fields yield an empty event.
StreamEvent parse_stream_line(std::string_view line);

} // namespace patchwise::chat
