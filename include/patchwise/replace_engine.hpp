#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace patchwise {

enum class MatchStrategy {
    Exact = 1,
    LineTrimmed = 2,
    WhitespaceNormalized = 3,
    IndentationFlexible = 4
};

std::string_view strategy_name(MatchStrategy strategy) noexcept;

// A literal slice of the original content chosen for replacement. `literal` may differ
// from the search pattern once whitespace or indentation has been normalized.
struct MatchCandidate {
    MatchStrategy strategy = MatchStrategy::Exact;
    std::string literal;
    std::size_t start = 0;
    std::size_t end = 0;
};

struct ReplaceOutcome {
    std::string content;
    bool created = false;          // empty search text: content is the new text verbatim
    MatchCandidate match;          // meaningful only when !created
    std::size_t replacements = 0;
};

enum class EditErrorKind {
    NoOp,
    NoMatch
};

class EditError : public std::runtime_error {
public:
    EditError(EditErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    EditErrorKind kind() const noexcept { return m_kind; }

private:
    EditErrorKind m_kind;
};

class ReplaceEngine {
public:
    // Strategies run in fixed priority order and the first with a usable candidate wins.
    // Throws EditError when old_text == new_text or when nothing usable is found.
    ReplaceOutcome replace(const std::string& content,
                           const std::string& old_text,
                           const std::string& new_text,
                           bool replace_all) const;

    // Candidates a single strategy proposes, in content order, before the uniqueness filter.
    std::vector<MatchCandidate> find_candidates(MatchStrategy strategy,
                                                const std::string& content,
                                                const std::string& find) const;

    static constexpr MatchStrategy kStrategies[] = {
        MatchStrategy::Exact,
        MatchStrategy::LineTrimmed,
        MatchStrategy::WhitespaceNormalized,
        MatchStrategy::IndentationFlexible,
    };

private:
    std::vector<MatchCandidate> exact(const std::string& content, const std::string& find) const;
    std::vector<MatchCandidate> line_trimmed(const std::string& content, const std::string& find) const;
    std::vector<MatchCandidate> whitespace_normalized(const std::string& content, const std::string& find) const;
    std::vector<MatchCandidate> indentation_flexible(const std::string& content, const std::string& find) const;
};

} // namespace patchwise
