#pragma once

#include "chat/message.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace patchwise {

enum class Decision {
    Execute,
    Skip,
    Deny,
    Background,
    Interrupt
};

// "", y, yes execute; s/skip, b/background, i/interrupt; anything else denies. Case-insensitive.
Decision parse_decision(std::string_view answer);

// Operator collaborator; every call blocks until the operator answers.
struct Confirmer {
    virtual ~Confirmer() = default;
    virtual Decision confirm_tool(const chat::ToolCall& call, bool long_running) = 0;
    virtual std::string interrupt_instruction() = 0;
    virtual bool approve_folder(const std::string& folder) = 0;
};

class ConsoleConfirmer final : public Confirmer {
public:
    ConsoleConfirmer(std::istream& in, std::ostream& out, bool color = true)
        : m_in(in), m_out(out), m_color(color) {}

    Decision confirm_tool(const chat::ToolCall& call, bool long_running) override;
    std::string interrupt_instruction() override;
    bool approve_folder(const std::string& folder) override;

private:
    std::istream& m_in;
    std::ostream& m_out;
    bool m_color;

    // Empty string on end of input.
    std::string read_answer();
};

} // namespace patchwise
