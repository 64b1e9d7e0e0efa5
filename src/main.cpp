#include "../include/patchwise/chat/backend.hpp"
#include "../include/patchwise/confirm.hpp"
#include "../include/patchwise/conversation.hpp"
#include "../include/patchwise/filesystem.hpp"
#include "../include/patchwise/log.hpp"
#include "../include/patchwise/process.hpp"
#include "../include/patchwise/project_context.hpp"
#include "../include/patchwise/repl.hpp"
#include "../include/patchwise/session.hpp"
#include "../include/patchwise/settings.hpp"
#include "../include/patchwise/tools.hpp"

#include <iostream>

#include <unistd.h>

int main() {
    using namespace patchwise;

    Settings settings;
    chat::BackendPtr backend;
    try {
        settings = load_settings(default_settings_path());
        backend = backend_for(settings);
    } catch (const std::exception& ex) {
        std::cerr << "patchwise: " << ex.what() << '\n';
        return 1;
    }

    const bool color = isatty(STDOUT_FILENO) != 0;

    LocalFileSystem files;
    PosixProcessRunner processes;
    ToolDispatcher tools(files, processes, std::cout, settings.command_timeout);
    tools.set_color(color);
    ConsoleConfirmer confirmer(std::cin, std::cout, color);

    Session session;
    session.gate = PermissionGate(settings.approved_folders);
    JsonFolderStore store(settings.path);
    session.gate.set_store(&store);

    LoopSettings loop_settings;
    loop_settings.model = settings.model;
    loop_settings.stream = settings.stream;
    loop_settings.color = color;

    ConversationLoop loop(*backend, tools, confirmer, std::cout, loop_settings,
                          build_system_prompt(load_agents_md(files, ".")));
    log_info("main", "using " + chat::kind_to_string(settings.backend) + " backend with model " + settings.model);

    Repl repl(loop, session, files, settings, std::move(backend), std::cin, std::cout);
    return repl.run();
}
