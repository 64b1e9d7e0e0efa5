#include "../../include/patchwise/chat/backend.hpp"
#include "../../include/patchwise/log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace {

using patchwise::Json;
using patchwise::JsonArray;
using patchwise::JsonObject;
using patchwise::chat::Message;
using patchwise::chat::Role;
using patchwise::chat::TokenUsage;
using patchwise::chat::ToolCall;

std::optional<TokenUsage> parse_usage(const JsonObject& obj) {
    const Json* usage = patchwise::find_member(obj, "usage");
    if (!usage || !usage->is_object()) {
        return std::nullopt;
    }
    TokenUsage result;
    if (auto prompt = patchwise::find_number(usage->as_object(), "prompt_tokens")) {
        result.prompt_tokens = static_cast<std::size_t>(std::max(0.0, *prompt));
    }
    if (auto completion = patchwise::find_number(usage->as_object(), "completion_tokens")) {
        result.completion_tokens = static_cast<std::size_t>(std::max(0.0, *completion));
    }
    return result;
}

// Content arrives either as a string or as an array of typed text parts.
std::string extract_content(const JsonObject& message) {
    const Json* content = patchwise::find_member(message, "content");
    if (!content) {
        return {};
    }
    if (content->is_string()) {
        return content->as_string();
    }
    std::string text;
    if (content->is_array()) {
        for (const auto& part : content->as_array()) {
            if (part.is_object()) {
                if (auto piece = patchwise::find_string(part.as_object(), "text")) {
                    text += *piece;
                }
            }
        }
    }
    return text;
}

void throw_if_error(const JsonObject& obj) {
    const Json* error = patchwise::find_member(obj, "error");
    if (!error || error->is_null()) {
        return;
    }
    if (error->is_string()) {
        throw patchwise::chat::BackendError("model error: " + error->as_string());
    }
    if (error->is_object()) {
        if (auto message = patchwise::find_string(error->as_object(), "message")) {
            throw patchwise::chat::BackendError("model error: " + *message);
        }
    }
    throw patchwise::chat::BackendError("model error: " + error->dump());
}

} // namespace

namespace patchwise::chat {

std::string_view role_name(Role role) noexcept {
    switch (role) {
    case Role::System: return "system";
    case Role::User: return "user";
    case Role::Assistant: return "assistant";
    case Role::Tool: return "tool";
    }
    return "user";
}

Json serialize_messages(const std::vector<Message>& messages) {
    JsonArray array;
    for (const auto& msg : messages) {
        JsonObject entry;
        entry["role"] = Json(std::string(role_name(msg.role)));
        entry["content"] = Json(msg.text);
        if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            JsonArray calls;
            for (const auto& call : msg.tool_calls) {
                JsonObject function;
                function["name"] = Json(call.name);
                function["arguments"] = Json(call.arguments);
                JsonObject wire;
                wire["id"] = Json(call.id);
                wire["type"] = Json("function");
                wire["function"] = Json(function);
                calls.emplace_back(Json(wire));
            }
            entry["tool_calls"] = Json(calls);
        }
        if (msg.role == Role::Tool) {
            entry["tool_call_id"] = Json(msg.tool_call_id);
        }
        array.emplace_back(Json(entry));
    }
    return Json(array);
}

Json serialize_request(const Request& request, const std::string& fallback_model) {
    JsonObject payload;
    payload["model"] = Json(request.model.empty() ? fallback_model : request.model);
    payload["messages"] = serialize_messages(request.messages);
    if (request.max_tokens > 0) {
        payload["max_tokens"] = Json(request.max_tokens);
    }
    if (request.tools.is_array() && !request.tools.as_array().empty()) {
        payload["tools"] = request.tools;
    }
    if (request.stream) {
        payload["stream"] = Json(true);
    }
    return Json(payload);
}

Response parse_completion(const Json& response) {
    if (!response.is_object()) {
        throw BackendError("unexpected completion payload");
    }
    const auto& obj = response.as_object();
    throw_if_error(obj);

    Response result;
    result.usage = parse_usage(obj);
    const Json* choices = find_member(obj, "choices");
    if (!choices || !choices->is_array() || choices->as_array().empty() || !choices->as_array().front().is_object()) {
        throw BackendError("completion carried no choices");
    }
    const auto& choice = choices->as_array().front().as_object();
    if (const Json* message = find_member(choice, "message"); message && message->is_object()) {
        const auto& msg = message->as_object();
        result.content = extract_content(msg);
        if (const Json* calls = find_member(msg, "tool_calls"); calls && calls->is_array()) {
            for (const auto& call : calls->as_array()) {
                if (!call.is_object()) {
                    continue;
                }
                ToolCall parsed;
                parsed.id = find_string(call.as_object(), "id").value_or("");
                if (const Json* function = find_member(call.as_object(), "function"); function && function->is_object()) {
                    parsed.name = find_string(function->as_object(), "name").value_or("");
                    parsed.arguments = find_string(function->as_object(), "arguments").value_or("");
                }
                result.tool_calls.push_back(std::move(parsed));
            }
        }
    } else if (auto text = find_string(choice, "text")) {
        result.content = *text;
    }
    return result;
}

StreamEvent parse_stream_line(std::string_view line) {
    StreamEvent event;
    constexpr std::string_view kPrefix = "data:";
    if (line.substr(0, kPrefix.size()) != kPrefix) {
        return event;
    }
    std::string_view data = line.substr(kPrefix.size());
    while (!data.empty() && std::isspace(static_cast<unsigned char>(data.front()))) {
        data.remove_prefix(1);
    }
    if (data.empty()) {
        return event;
    }
    if (data == "[DONE]") {
        event.done = true;
        return event;
    }

    Json chunk;
    try {
        chunk = Json::parse(data);
    } catch (const std::exception& ex) {
        throw BackendError(std::string("failed to parse stream chunk: ") + ex.what());
    }
    if (!chunk.is_object()) {
        return event;
    }
    const auto& obj = chunk.as_object();
    throw_if_error(obj);
    event.usage = parse_usage(obj);

    const Json* choices = find_member(obj, "choices");
    if (!choices || !choices->is_array() || choices->as_array().empty() || !choices->as_array().front().is_object()) {
        return event;
    }
    const Json* delta_json = find_member(choices->as_array().front().as_object(), "delta");
    if (!delta_json || !delta_json->is_object()) {
        return event;
    }
    const auto& delta_obj = delta_json->as_object();
    Delta delta;
    delta.content = extract_content(delta_obj);
    if (const Json* calls = find_member(delta_obj, "tool_calls"); calls && calls->is_array()) {
        for (const auto& call : calls->as_array()) {
            if (!call.is_object()) {
                continue;
            }
            const auto& call_obj = call.as_object();
            ToolCallDelta fragment;
            fragment.index = static_cast<std::size_t>(std::max(0.0, find_number(call_obj, "index").value_or(0.0)));
            fragment.id = find_string(call_obj, "id").value_or("");
            if (const Json* function = find_member(call_obj, "function"); function && function->is_object()) {
                fragment.name = find_string(function->as_object(), "name").value_or("");
                fragment.arguments = find_string(function->as_object(), "arguments").value_or("");
            }
            delta.tool_calls.push_back(std::move(fragment));
        }
    }
    event.delta = std::move(delta);
    return event;
}

namespace {

class OpenAIBackend final : public Backend {
public:
    OpenAIBackend(std::string endpoint, std::string model, std::string api_key)
        : m_endpoint(std::move(endpoint)),
          m_model(std::move(model)),
          m_api_key(std::move(api_key)) {}

    Response complete(const Request& request) override {
        if (request.messages.empty()) {
            throw BackendError("openai backend requires at least one message");
        }
        Request plain = request;
        plain.stream = false;
        const std::string body = serialize_request(plain, m_model).dump();

        std::string response;
        try {
            response = net::post_json(m_endpoint, body, headers());
        } catch (const net::HttpError& ex) {
            throw BackendError(ex.what(), ex.status());
        }
        try {
            return parse_completion(Json::parse(response));
        } catch (const BackendError&) {
            throw;
        } catch (const std::exception& ex) {
            throw BackendError(std::string("failed to parse completion: ") + ex.what());
        }
    }

    std::optional<TokenUsage> stream(const Request& request, const DeltaHandler& on_delta) override {
        if (request.messages.empty()) {
            throw BackendError("openai backend requires at least one message");
        }
        Request streamed = request;
        streamed.stream = true;
        const std::string body = serialize_request(streamed, m_model).dump();

        std::optional<TokenUsage> usage;
        bool done = false;
        auto on_line = [&](std::string_view line) {
            if (done) {
                return;
            }
            StreamEvent event = parse_stream_line(line);
            if (event.usage) {
                usage = event.usage;
            }
            if (event.delta) {
                on_delta(*event.delta);
            }
            done = event.done;
        };
        try {
            net::post_json_stream(m_endpoint, body, headers(), on_line);
        } catch (const net::HttpError& ex) {
            throw BackendError(ex.what(), ex.status());
        } catch (const BackendError&) {
            throw;
        } catch (const std::runtime_error& ex) {
            throw BackendError(ex.what());
        }
        if (!done) {
            log_debug("backend", "stream ended without [DONE] marker");
        }
        return usage;
    }

private:
    std::string m_endpoint;
    std::string m_model;
    std::string m_api_key;

    net::Headers headers() const {
        net::Headers result;
        if (!m_api_key.empty()) {
            result.emplace_back("Authorization", "Bearer " + m_api_key);
        }
        return result;
    }
};

} // namespace

BackendPtr make_backend(Kind kind, std::string endpoint, std::string model, std::string api_key) {
    if (endpoint.empty()) {
        endpoint = default_endpoint(kind);
    }
    if (model.empty()) {
        throw std::runtime_error(kind_to_string(kind) + " backend requires a model");
    }
    if (kind == Kind::OpenRouter && api_key.empty()) {
        throw std::runtime_error("openrouter backend requires an api key");
    }
    return std::make_unique<OpenAIBackend>(std::move(endpoint), std::move(model), std::move(api_key));
}

Kind parse_kind(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    std::transform(name.begin(), name.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "openai" || lowered == "openai_compat") return Kind::OpenAICompat;
    if (lowered == "lmstudio" || lowered == "lm_studio") return Kind::LMStudio;
    if (lowered == "ollama") return Kind::Ollama;
    if (lowered == "openrouter") return Kind::OpenRouter;
    throw std::runtime_error("unknown chat backend kind: " + name);
}

std::string kind_to_string(Kind kind) {
    switch (kind) {
    case Kind::OpenAICompat: return "openai";
    case Kind::LMStudio: return "lmstudio";
    case Kind::Ollama: return "ollama";
    case Kind::OpenRouter: return "openrouter";
    }
    return "unknown";
}

std::string default_endpoint(Kind kind) {
    switch (kind) {
    case Kind::OpenAICompat: return "https://api.openai.com/v1/chat/completions";
    case Kind::LMStudio: return "http://localhost:1234/v1/chat/completions";
    case Kind::Ollama: return "http://localhost:11434/v1/chat/completions";
    case Kind::OpenRouter: return "https://openrouter.ai/api/v1/chat/completions";
    }
    return "http://localhost:1234/v1/chat/completions";
}

} // namespace patchwise::chat
