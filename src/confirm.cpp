#include "../include/patchwise/confirm.hpp"
#include "../include/patchwise/log.hpp"

#include <algorithm>
#include <cctype>

namespace patchwise {

namespace {

constexpr const char* kYellow = "\033[33m";
constexpr const char* kReset = "\033[0m";

std::string normalize_answer(std::string_view answer) {
    while (!answer.empty() && std::isspace(static_cast<unsigned char>(answer.front()))) {
        answer.remove_prefix(1);
    }
    while (!answer.empty() && std::isspace(static_cast<unsigned char>(answer.back()))) {
        answer.remove_suffix(1);
    }
    std::string lowered(answer);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

Decision parse_decision(std::string_view answer) {
    const std::string value = normalize_answer(answer);
    if (value.empty() || value == "y" || value == "yes") return Decision::Execute;
    if (value == "s" || value == "skip") return Decision::Skip;
    if (value == "b" || value == "background") return Decision::Background;
    if (value == "i" || value == "interrupt") return Decision::Interrupt;
    return Decision::Deny;
}

std::string ConsoleConfirmer::read_answer() {
    std::string line;
    if (!std::getline(m_in, line)) {
        return {};
    }
    return line;
}

Decision ConsoleConfirmer::confirm_tool(const chat::ToolCall& call, bool long_running) {
    const char* prompt = "Execute this tool? (Y/n/s to skip/i to interrupt): ";
    if (long_running) {
        m_out << (m_color ? kYellow : "") << "This looks like a long-running command!" << (m_color ? kReset : "") << '\n';
        prompt = "Execute this tool? (Y/n/s to skip/i to interrupt/b for background): ";
    }
    m_out << '\a' << '\n' << prompt << std::flush;

    std::string line;
    if (!std::getline(m_in, line)) {
        log_warn("confirm", "input closed; denying " + call.name);
        return Decision::Deny;
    }

    const Decision decision = parse_decision(line);
    switch (decision) {
    case Decision::Skip: m_out << "Tool execution skipped\n"; break;
    case Decision::Deny: m_out << "Tool execution denied\n"; break;
    default: break;
    }
    return decision;
}

std::string ConsoleConfirmer::interrupt_instruction() {
    m_out << "\nWhat would you like me to do instead? " << std::flush;
    std::string line = read_answer();
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        m_out << "No alternative instruction provided\n";
        return {};
    }
    auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

bool ConsoleConfirmer::approve_folder(const std::string& folder) {
    m_out << "Request folder access: " << folder << '\n'
          << "Allow list_files and read_file operations in this folder and all subfolders? (Y/n): "
          << '\a' << std::flush;
    std::string line;
    if (!std::getline(m_in, line)) {
        log_warn("confirm", "input closed; denying folder access to " + folder);
        return false;
    }
    const std::string answer = normalize_answer(line);
    const bool granted = answer.empty() || answer == "y" || answer == "yes";
    m_out << (granted ? "Folder access granted: " : "Folder access denied: ") << folder << '\n';
    return granted;
}

} // namespace patchwise
