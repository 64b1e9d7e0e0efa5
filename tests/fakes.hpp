#pragma once

#include <patchwise/chat/backend.hpp>
#include <patchwise/confirm.hpp>
#include <patchwise/filesystem.hpp>
#include <patchwise/process.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace patchwise::testing {

// Keys are paths exactly as the tools pass them.
class MemoryFileSystem final : public FileSystem {
public:
    std::map<std::string, std::string> files;
    std::map<std::string, std::vector<DirEntry>> directories;
    std::vector<std::string> writes;
    bool fail_writes = false;
    bool fail_reads = false;

    std::optional<std::string> read(const std::filesystem::path& path) override {
        if (fail_reads) {
            throw std::runtime_error(path.string() + ": is a directory");
        }
        auto it = files.find(path.string());
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void write(const std::filesystem::path& path, const std::string& bytes) override {
        if (fail_writes) {
            throw std::runtime_error("disk full");
        }
        files[path.string()] = bytes;
        writes.push_back(path.string());
    }

    std::vector<DirEntry> list(const std::filesystem::path& path) override {
        auto it = directories.find(path.string());
        if (it == directories.end()) {
            throw std::runtime_error(path.string() + ": no such directory");
        }
        auto entries = it->second;
        std::sort(entries.begin(), entries.end(), [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
        return entries;
    }

    bool exists(const std::filesystem::path& path) override {
        return files.count(path.string()) != 0 || directories.count(path.string()) != 0;
    }
};

class RecordingProcessRunner final : public ProcessRunner {
public:
    std::vector<std::vector<std::string>> runs;
    std::vector<std::vector<std::string>> detached;
    std::vector<std::chrono::milliseconds> timeouts;
    ProcessResult next;
    long next_pid = 4242;

    ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override {
        runs.push_back(argv);
        timeouts.push_back(timeout);
        return next;
    }

    long start_detached(const std::vector<std::string>& argv) override {
        detached.push_back(argv);
        return next_pid;
    }
};

// Each call pops the next scripted step; requests are recorded for inspection.
class ScriptedBackend final : public chat::Backend {
public:
    struct Step {
        chat::Response response;
        std::vector<chat::Delta> deltas;   // streamed before `error` fires, if any
        std::string error;
    };

    std::deque<Step> steps;
    std::vector<chat::Request> requests;

    void reply(std::string content, std::optional<chat::TokenUsage> usage = std::nullopt) {
        Step step;
        step.response.content = std::move(content);
        step.response.usage = usage;
        steps.push_back(std::move(step));
    }

    void reply_with_calls(std::vector<chat::ToolCall> calls, std::string content = std::string()) {
        Step step;
        step.response.content = std::move(content);
        step.response.tool_calls = std::move(calls);
        steps.push_back(std::move(step));
    }

    void fail(std::string message, std::vector<chat::Delta> deltas = {}) {
        Step step;
        step.error = std::move(message);
        step.deltas = std::move(deltas);
        steps.push_back(std::move(step));
    }

    chat::Response complete(const chat::Request& request) override {
        Step step = next_step(request);
        if (!step.error.empty()) {
            throw chat::BackendError(step.error, 400);
        }
        return step.response;
    }

    std::optional<chat::TokenUsage> stream(const chat::Request& request, const chat::DeltaHandler& on_delta) override {
        Step step = next_step(request);
        for (const auto& delta : step.deltas) {
            on_delta(delta);
        }
        if (!step.error.empty()) {
            throw chat::BackendError(step.error, 400);
        }
        if (!step.response.content.empty()) {
            chat::Delta text;
            text.content = step.response.content;
            on_delta(text);
        }
        for (std::size_t i = 0; i < step.response.tool_calls.size(); ++i) {
            const auto& call = step.response.tool_calls[i];
            // Split arguments across two fragments the way servers do.
            const std::size_t half = call.arguments.size() / 2;
            chat::Delta head;
            head.tool_calls.push_back({i, call.id, call.name, call.arguments.substr(0, half)});
            on_delta(head);
            chat::Delta tail;
            tail.tool_calls.push_back({i, std::string(), std::string(), call.arguments.substr(half)});
            on_delta(tail);
        }
        return step.response.usage;
    }

private:
    Step next_step(const chat::Request& request) {
        requests.push_back(request);
        if (steps.empty()) {
            throw std::logic_error("backend called more often than scripted");
        }
        Step step = std::move(steps.front());
        steps.pop_front();
        return step;
    }
};

class ScriptedConfirmer final : public Confirmer {
public:
    std::deque<Decision> decisions;
    std::deque<std::string> instructions;
    bool grant_folders = true;
    std::vector<std::string> confirmed;
    std::vector<std::string> folder_requests;
    std::vector<bool> long_running_flags;

    Decision confirm_tool(const chat::ToolCall& call, bool long_running) override {
        confirmed.push_back(call.name);
        long_running_flags.push_back(long_running);
        if (decisions.empty()) {
            return Decision::Deny;
        }
        Decision decision = decisions.front();
        decisions.pop_front();
        return decision;
    }

    std::string interrupt_instruction() override {
        if (instructions.empty()) {
            return {};
        }
        std::string text = instructions.front();
        instructions.pop_front();
        return text;
    }

    bool approve_folder(const std::string& folder) override {
        folder_requests.push_back(folder);
        return grant_folders;
    }
};

inline chat::ToolCall make_call(std::string id, std::string name, std::string arguments) {
    return chat::ToolCall{std::move(id), std::move(name), std::move(arguments)};
}

} // namespace patchwise::testing
