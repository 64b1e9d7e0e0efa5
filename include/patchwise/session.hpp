#pragma once

#include "chat/message.hpp"
#include "permission_gate.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace patchwise {

// Everything one interactive session accumulates. Owned by the REPL and passed by reference.
struct Session {
    std::vector<chat::Message> history;
    std::optional<chat::TokenUsage> last_usage;
    std::size_t total_tokens = 0;
    PermissionGate gate;

    // Starts a fresh conversation; the session token total and approvals survive.
    void reset() {
        history.clear();
        last_usage.reset();
    }
};

} // namespace patchwise
