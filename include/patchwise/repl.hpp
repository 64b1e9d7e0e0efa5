#pragma once

#include "chat/backend.hpp"
#include "conversation.hpp"
#include "filesystem.hpp"
#include "session.hpp"
#include "settings.hpp"

#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace patchwise {

using BackendFactory = std::function<chat::BackendPtr(const Settings&)>;

// make_backend over the settings' backend kind, endpoint, model and key.
chat::BackendPtr backend_for(const Settings& settings);

// The interactive line loop: slash commands, `#` instructions, everything else a turn.
class Repl {
public:
    // `backend` is the one `loop` currently talks to; the REPL owns it from here on.
    Repl(ConversationLoop& loop, Session& session, FileSystem& files, Settings& settings,
         chat::BackendPtr backend, std::istream& in, std::ostream& out,
         BackendFactory factory = backend_for);

    // Returns the process exit code once input ends or /exit is entered.
    int run();

private:
    ConversationLoop& m_loop;
    Session& m_session;
    FileSystem& m_files;
    Settings& m_settings;
    chat::BackendPtr m_backend;
    std::istream& m_in;
    std::ostream& m_out;
    BackendFactory m_factory;

    // Returns true when the REPL should exit.
    bool handle_command(const std::string& line);
    void refresh_system_prompt();
    void init_project();
    void add_instruction(const std::string& instruction);
    void export_context(const std::string& requested);
    void permissions(const std::vector<std::string>& parts, const std::string& line);
    void list_models();
    void switch_model(const std::string& key);
};

} // namespace patchwise
