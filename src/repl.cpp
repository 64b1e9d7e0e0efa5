#include "../include/patchwise/repl.hpp"
#include "../include/patchwise/log.hpp"
#include "../include/patchwise/permission_gate.hpp"
#include "../include/patchwise/project_context.hpp"
#include "../include/patchwise/transcript.hpp"

#include <exception>
#include <sstream>

namespace patchwise {

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Everything after the `index`-th word of `line`, trimmed. Inner spacing is kept.
std::string rest_after_word(const std::string& line, const std::vector<std::string>& words, std::size_t index) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i <= index && i < words.size(); ++i) {
        pos = line.find(words[i], pos);
        if (pos == std::string::npos) {
            return {};
        }
        pos += words[i].size();
    }
    return trim(line.substr(pos));
}

void print_help(std::ostream& out) {
    out << "\npatchwise - Help\n"
        << "================\n\n"
        << "Slash Commands:\n"
        << "  /init                      - Create AGENTS.md for this project\n"
        << "  /new                       - Clear conversation context (start fresh)\n"
        << "  /export [file]             - Export conversation context to a text file\n"
        << "  /models                    - List configured models\n"
        << "  /models <name>             - Switch to a configured model\n"
        << "  /permissions               - List approved folders\n"
        << "  /permissions remove <path> - Remove a folder approval\n"
        << "  /exit, /quit               - Exit\n"
        << "  /help                      - Show this help message\n\n"
        << "Tool confirmation answers:\n"
        << "  Y/Enter execute, n deny, s skip, i interrupt with a new instruction,\n"
        << "  b run in background (long-running commands only)\n\n"
        << "Lines starting with # are added to AGENTS.md as permanent instructions.\n"
        << "  Example: #always use python3 instead of python\n\n";
}

} // namespace

chat::BackendPtr backend_for(const Settings& settings) {
    return chat::make_backend(settings.backend, settings.endpoint, settings.model, settings.api_key);
}

Repl::Repl(ConversationLoop& loop, Session& session, FileSystem& files, Settings& settings,
           chat::BackendPtr backend, std::istream& in, std::ostream& out, BackendFactory factory)
    : m_loop(loop),
      m_session(session),
      m_files(files),
      m_settings(settings),
      m_backend(std::move(backend)),
      m_in(in),
      m_out(out),
      m_factory(std::move(factory)) {}

int Repl::run() {
    m_out << "patchwise - type /help for commands\n";
    std::string line;
    while (true) {
        m_out << "\n> " << std::flush;
        if (!std::getline(m_in, line)) {
            m_out << '\n';
            return 0;
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '/') {
            if (handle_command(line)) {
                return 0;
            }
            continue;
        }
        if (line.front() == '#') {
            add_instruction(trim(line.substr(1)));
            continue;
        }
        try {
            m_loop.run_turn(m_session, line);
        } catch (const TurnError& ex) {
            m_out << "\nError: " << ex.what() << '\n';
            log_error("repl", ex.what());
        } catch (const std::exception& ex) {
            m_out << "\nError: " << ex.what() << '\n';
            log_error("repl", std::string("unexpected failure: ") + ex.what());
        }
    }
}

bool Repl::handle_command(const std::string& line) {
    const auto parts = split_words(line);
    if (parts.empty()) {
        return false;
    }
    const std::string& name = parts.front();
    if (name == "/exit" || name == "/quit") {
        m_out << "Goodbye!\n";
        return true;
    }
    if (name == "/help") {
        print_help(m_out);
    } else if (name == "/new") {
        m_session.reset();
        m_out << "Conversation context cleared - starting fresh!\n";
    } else if (name == "/init") {
        init_project();
    } else if (name == "/export") {
        export_context(parts.size() > 1 ? parts[1] : std::string());
    } else if (name == "/models") {
        if (parts.size() == 1) {
            list_models();
        } else {
            switch_model(parts[1]);
        }
    } else if (name == "/permissions") {
        permissions(parts, line);
    } else {
        m_out << "Unknown command: " << name << '\n'
              << "Available commands: /exit, /init, /new, /export, /models, /permissions, /help\n";
    }
    return false;
}

void Repl::refresh_system_prompt() {
    m_loop.set_system_prompt(build_system_prompt(load_agents_md(m_files, ".")));
}

void Repl::init_project() {
    try {
        if (!initialize_project(m_files, ".", false)) {
            m_out << "AGENTS.md already exists. Overwrite? (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(m_in, answer) || trim(answer) != "y") {
                m_out << "Project initialization cancelled\n";
                return;
            }
            initialize_project(m_files, ".", true);
        }
        refresh_system_prompt();
        m_out << "Created AGENTS.md\n";
    } catch (const std::exception& ex) {
        m_out << "Error creating AGENTS.md: " << ex.what() << '\n';
    }
}

void Repl::add_instruction(const std::string& instruction) {
    if (instruction.empty()) {
        m_out << "Usage: #<instruction>\n";
        return;
    }
    try {
        record_permanent_instruction(m_files, ".", instruction);
        refresh_system_prompt();
        m_out << "Added permanent instruction: " << instruction << '\n';
    } catch (const std::exception& ex) {
        m_out << "Failed to add instruction: " << ex.what() << '\n';
    }
}

void Repl::export_context(const std::string& requested) {
    const std::string filename = transcript_filename(requested);
    try {
        const std::size_t count = export_transcript(m_files, m_session, filename);
        m_out << "Context exported to " << filename << " (" << count << " messages)\n";
    } catch (const std::exception& ex) {
        m_out << ex.what() << '\n';
    }
}

void Repl::permissions(const std::vector<std::string>& parts, const std::string& line) {
    if (parts.size() == 1) {
        const auto folders = m_session.gate.folders();
        m_out << "\nApproved Folders\n================\n";
        if (folders.empty()) {
            m_out << "No folders have been approved yet.\n";
            return;
        }
        for (std::size_t i = 0; i < folders.size(); ++i) {
            m_out << i + 1 << ". " << folders[i] << '\n';
        }
        m_out << "\nTotal: " << folders.size() << " folder(s)\n";
        return;
    }
    if (parts.size() >= 3 && parts[1] == "remove") {
        const auto folder = normalize_folder(rest_after_word(line, parts, 1));
        if (m_session.gate.revoke(folder)) {
            m_out << "Removed folder permission: " << folder.string() << '\n';
        } else {
            m_out << "Folder not found in approved list: " << folder.string() << '\n';
        }
        return;
    }
    m_out << "Usage:\n"
          << "  /permissions               - List approved folders\n"
          << "  /permissions remove <path> - Remove folder permission\n";
}

void Repl::list_models() {
    m_out << "\nAvailable Models\n================\n";
    if (m_settings.models.empty()) {
        m_out << "No models configured. Add a \"models\" object to " << m_settings.path.string() << '\n';
        return;
    }
    for (const auto& [key, profile] : m_settings.models) {
        m_out << key;
        if (key == m_settings.current_model) {
            m_out << " (current)";
        }
        m_out << '\n'
              << "   Name: " << profile.name << '\n'
              << "   URL:  " << (profile.endpoint.empty() ? chat::default_endpoint(profile.backend) : profile.endpoint) << '\n'
              << "   API Key: " << mask_api_key(profile.api_key) << "\n\n";
    }
}

void Repl::switch_model(const std::string& key) {
    Settings candidate = m_settings;
    if (!select_model(candidate, key)) {
        m_out << "Model '" << key << "' not found\n"
              << "Available models:\n";
        for (const auto& entry : m_settings.models) {
            m_out << "  - " << entry.first << '\n';
        }
        return;
    }

    chat::BackendPtr backend;
    try {
        backend = m_factory(candidate);
    } catch (const std::exception& ex) {
        m_out << "Error switching to model " << key << ": " << ex.what() << '\n';
        log_error("repl", std::string("backend for ") + key + " failed: " + ex.what());
        return;
    }

    try {
        save_current_model(m_settings.path, key);
    } catch (const std::exception& ex) {
        m_out << "Warning: could not save settings: " << ex.what() << '\n';
        log_warn("repl", std::string("saving current model failed: ") + ex.what());
    }

    m_settings = std::move(candidate);
    m_loop.switch_backend(*backend, m_settings.model);
    m_backend = std::move(backend);
    log_info("repl", "switched to " + key + " (" + m_settings.model + ")");

    const auto& profile = m_settings.models.at(key);
    m_out << "Switched to model: " << key << '\n'
          << "Name: " << profile.name << '\n'
          << "URL:  " << (profile.endpoint.empty() ? chat::default_endpoint(profile.backend) : profile.endpoint) << '\n';
}

} // namespace patchwise
