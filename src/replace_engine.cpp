#include "../include/patchwise/replace_engine.hpp"

#include <algorithm>
#include <cctype>

namespace patchwise {

namespace {

struct Line {
    std::size_t offset;
    std::string_view text;
};

std::vector<Line> split_lines(std::string_view text) {
    std::vector<Line> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.push_back({start, text.substr(start)});
            break;
        }
        lines.push_back({start, text.substr(start, newline - start)});
        start = newline + 1;
    }
    return lines;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string collapse_whitespace(std::string_view text) {
    text = trim(text);
    std::string out;
    out.reserve(text.size());
    bool in_run = false;
    for (char c : text) {
        if (is_space(c)) {
            if (!in_run) {
                out.push_back(' ');
                in_run = true;
            }
        } else {
            out.push_back(c);
            in_run = false;
        }
    }
    return out;
}

// Slice of `content` covering lines [first, first + count).
MatchCandidate block_candidate(MatchStrategy strategy, const std::string& content,
                               const std::vector<Line>& lines, std::size_t first, std::size_t count) {
    const Line& last = lines[first + count - 1];
    MatchCandidate candidate;
    candidate.strategy = strategy;
    candidate.start = lines[first].offset;
    candidate.end = last.offset + last.text.size();
    candidate.literal = content.substr(candidate.start, candidate.end - candidate.start);
    return candidate;
}

std::string strip_common_indentation(std::string_view text) {
    const auto lines = split_lines(text);
    std::size_t min_indent = std::string_view::npos;
    for (const auto& line : lines) {
        if (trim(line.text).empty()) {
            continue;
        }
        std::size_t indent = 0;
        while (indent < line.text.size() && (line.text[indent] == ' ' || line.text[indent] == '\t')) {
            ++indent;
        }
        min_indent = std::min(min_indent, indent);
    }
    if (min_indent == std::string_view::npos) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        const std::string_view line = lines[i].text;
        if (!trim(line).empty() && line.size() > min_indent) {
            out.append(line.substr(min_indent));
        } else {
            out.append(line);
        }
    }
    return out;
}

std::size_t count_occurrences(const std::string& content, const std::string& literal) {
    std::size_t count = 0;
    for (std::size_t pos = content.find(literal); pos != std::string::npos;
         pos = content.find(literal, pos + literal.size())) {
        ++count;
    }
    return count;
}

std::string replace_every(const std::string& content, const std::string& literal, const std::string& replacement) {
    std::string out;
    out.reserve(content.size());
    std::size_t cursor = 0;
    for (std::size_t pos = content.find(literal); pos != std::string::npos;
         pos = content.find(literal, cursor)) {
        out.append(content, cursor, pos - cursor);
        out.append(replacement);
        cursor = pos + literal.size();
    }
    out.append(content, cursor, std::string::npos);
    return out;
}

} // namespace

std::string_view strategy_name(MatchStrategy strategy) noexcept {
    switch (strategy) {
    case MatchStrategy::Exact: return "exact";
    case MatchStrategy::LineTrimmed: return "line-trimmed";
    case MatchStrategy::WhitespaceNormalized: return "whitespace-normalized";
    case MatchStrategy::IndentationFlexible: return "indentation-flexible";
    }
    return "unknown";
}

ReplaceOutcome ReplaceEngine::replace(const std::string& content,
                                      const std::string& old_text,
                                      const std::string& new_text,
                                      bool replace_all) const {
    if (old_text == new_text) {
        throw EditError(EditErrorKind::NoOp, "oldString and newString must be different");
    }

    ReplaceOutcome outcome;
    if (old_text.empty()) {
        outcome.content = new_text;
        outcome.created = true;
        return outcome;
    }

    for (MatchStrategy strategy : kStrategies) {
        for (auto& candidate : find_candidates(strategy, content, old_text)) {
            if (candidate.literal.empty()) {
                continue;
            }
            const std::size_t first = content.find(candidate.literal);
            if (first == std::string::npos) {
                continue;
            }
            if (!replace_all && first != content.rfind(candidate.literal)) {
                continue;
            }

            if (replace_all) {
                outcome.replacements = count_occurrences(content, candidate.literal);
                outcome.content = replace_every(content, candidate.literal, new_text);
            } else {
                outcome.replacements = 1;
                outcome.content = content;
                outcome.content.replace(first, candidate.literal.size(), new_text);
                candidate.start = first;
                candidate.end = first + candidate.literal.size();
            }
            outcome.match = std::move(candidate);
            return outcome;
        }
    }

    throw EditError(EditErrorKind::NoMatch, "oldString not found in content or multiple ambiguous matches found");
}

std::vector<MatchCandidate> ReplaceEngine::find_candidates(MatchStrategy strategy,
                                                           const std::string& content,
                                                           const std::string& find) const {
    switch (strategy) {
    case MatchStrategy::Exact: return exact(content, find);
    case MatchStrategy::LineTrimmed: return line_trimmed(content, find);
    case MatchStrategy::WhitespaceNormalized: return whitespace_normalized(content, find);
    case MatchStrategy::IndentationFlexible: return indentation_flexible(content, find);
    }
    return {};
}

std::vector<MatchCandidate> ReplaceEngine::exact(const std::string& content, const std::string& find) const {
    const std::size_t pos = content.find(find);
    if (pos == std::string::npos) {
        return {};
    }
    return {MatchCandidate{MatchStrategy::Exact, find, pos, pos + find.size()}};
}

std::vector<MatchCandidate> ReplaceEngine::line_trimmed(const std::string& content, const std::string& find) const {
    const auto original = split_lines(content);
    auto search = split_lines(find);
    if (!search.empty() && search.back().text.empty()) {
        search.pop_back();
    }
    if (search.empty() || search.size() > original.size()) {
        return {};
    }

    for (std::size_t i = 0; i + search.size() <= original.size(); ++i) {
        bool matches = true;
        for (std::size_t j = 0; j < search.size(); ++j) {
            if (trim(original[i + j].text) != trim(search[j].text)) {
                matches = false;
                break;
            }
        }
        if (matches) {
            return {block_candidate(MatchStrategy::LineTrimmed, content, original, i, search.size())};
        }
    }
    return {};
}

std::vector<MatchCandidate> ReplaceEngine::whitespace_normalized(const std::string& content, const std::string& find) const {
    const std::string normalized_find = collapse_whitespace(find);
    const auto lines = split_lines(content);
    std::vector<MatchCandidate> matches;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (collapse_whitespace(lines[i].text) == normalized_find) {
            matches.push_back(block_candidate(MatchStrategy::WhitespaceNormalized, content, lines, i, 1));
        }
    }

    const std::size_t find_lines = split_lines(find).size();
    if (find_lines > 1) {
        for (std::size_t i = 0; i + find_lines <= lines.size(); ++i) {
            const Line& last = lines[i + find_lines - 1];
            const std::string_view block(content.data() + lines[i].offset,
                                         last.offset + last.text.size() - lines[i].offset);
            if (collapse_whitespace(block) == normalized_find) {
                matches.push_back(block_candidate(MatchStrategy::WhitespaceNormalized, content, lines, i, find_lines));
            }
        }
    }
    return matches;
}

std::vector<MatchCandidate> ReplaceEngine::indentation_flexible(const std::string& content, const std::string& find) const {
    const std::string normalized_find = strip_common_indentation(find);
    const auto lines = split_lines(content);
    const std::size_t find_lines = split_lines(find).size();
    std::vector<MatchCandidate> matches;

    for (std::size_t i = 0; i + find_lines <= lines.size(); ++i) {
        const Line& last = lines[i + find_lines - 1];
        const std::string_view block(content.data() + lines[i].offset,
                                     last.offset + last.text.size() - lines[i].offset);
        if (strip_common_indentation(block) == normalized_find) {
            matches.push_back(block_candidate(MatchStrategy::IndentationFlexible, content, lines, i, find_lines));
        }
    }
    return matches;
}

} // namespace patchwise
