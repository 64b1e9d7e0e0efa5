#include "../include/patchwise/transcript.hpp"
#include "../include/patchwise/log.hpp"

#include <sstream>
#include <stdexcept>

namespace patchwise {

std::string transcript_filename(const std::string& requested) {
    if (requested.empty()) {
        return "context.txt";
    }
    const std::string suffix = ".txt";
    if (requested.size() >= suffix.size() &&
        requested.compare(requested.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return requested;
    }
    return requested + suffix;
}

std::string render_transcript(const Session& session, const std::string& exported_at) {
    std::ostringstream out;
    out << "# patchwise Context Export\n";
    out << "Exported: " << exported_at << '\n';
    if (session.last_usage) {
        out << "Context Tokens: " << session.last_usage->prompt_tokens << '\n';
        out << "Total Session Tokens: " << session.total_tokens << '\n';
    }
    out << '\n' << std::string(80, '=') << "\n\n";

    for (std::size_t i = 0; i < session.history.size(); ++i) {
        const auto& msg = session.history[i];
        if (i > 0) {
            out << '\n' << std::string(40, '-') << "\n\n";
        }
        switch (msg.role) {
        case chat::Role::System:
            out << "SYSTEM MESSAGE:\n" << msg.text << '\n';
            break;
        case chat::Role::User:
            out << "USER:\n" << msg.text << '\n';
            break;
        case chat::Role::Assistant:
            out << "ASSISTANT:\n";
            if (!msg.text.empty()) {
                out << msg.text << '\n';
            }
            for (const auto& call : msg.tool_calls) {
                out << "\nTOOL CALL: " << call.name << '\n';
                out << "Arguments: " << call.arguments << '\n';
            }
            break;
        case chat::Role::Tool:
            out << "TOOL RESULT:\n" << msg.text << '\n';
            break;
        }
    }

    out << '\n' << std::string(80, '=') << '\n';
    out << "End of context export (" << session.history.size() << " messages)\n";
    return out.str();
}

std::size_t export_transcript(FileSystem& files, const Session& session, const std::filesystem::path& target) {
    if (session.history.empty()) {
        throw std::runtime_error("No conversation context to export");
    }
    files.write(target, render_transcript(session, timestamp_now().substr(0, 19)));
    log_info("transcript", "exported " + std::to_string(session.history.size()) + " messages to " + target.string());
    return session.history.size();
}

} // namespace patchwise
