#include "../include/patchwise/diff_renderer.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace patchwise {

namespace {

// Upper bound on LCS table cells; larger middles collapse into one replace span.
constexpr std::size_t kMaxLcsCells = std::size_t{1} << 24;

constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kBlue = "\033[34m";
constexpr const char* kCyan = "\033[36m";
constexpr const char* kReset = "\033[0m";

using MatchPairs = std::vector<std::pair<std::size_t, std::size_t>>;

std::vector<std::uint32_t> intern(const std::vector<std::string>& lines,
                                  std::unordered_map<std::string_view, std::uint32_t>& ids) {
    std::vector<std::uint32_t> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        auto [it, inserted] = ids.emplace(line, static_cast<std::uint32_t>(ids.size()));
        out.push_back(it->second);
    }
    return out;
}

// Appends matched pairs of the middle section using a suffix LCS table.
void lcs_middle(const std::vector<std::uint32_t>& a, std::size_t a_begin, std::size_t a_end,
                const std::vector<std::uint32_t>& b, std::size_t b_begin, std::size_t b_end,
                MatchPairs& pairs) {
    const std::size_t rows = a_end - a_begin;
    const std::size_t cols = b_end - b_begin;
    if (rows == 0 || cols == 0) {
        return;
    }
    if (rows * cols > kMaxLcsCells) {
        return;
    }

    const std::size_t width = cols + 1;
    std::vector<std::uint32_t> table((rows + 1) * width, 0);
    for (std::size_t i = rows; i-- > 0;) {
        for (std::size_t j = cols; j-- > 0;) {
            if (a[a_begin + i] == b[b_begin + j]) {
                table[i * width + j] = table[(i + 1) * width + (j + 1)] + 1;
            } else {
                table[i * width + j] = std::max(table[(i + 1) * width + j], table[i * width + (j + 1)]);
            }
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < rows && j < cols) {
        if (a[a_begin + i] == b[b_begin + j]) {
            pairs.emplace_back(a_begin + i, b_begin + j);
            ++i;
            ++j;
        } else if (table[(i + 1) * width + j] >= table[i * width + (j + 1)]) {
            ++i;
        } else {
            ++j;
        }
    }
}

void push_change(std::vector<DiffOpcode>& ops, std::size_t i1, std::size_t i2, std::size_t j1, std::size_t j2) {
    if (i1 == i2 && j1 == j2) {
        return;
    }
    OpTag tag = OpTag::Replace;
    if (i1 == i2) {
        tag = OpTag::Insert;
    } else if (j1 == j2) {
        tag = OpTag::Delete;
    }
    ops.push_back(DiffOpcode{tag, i1, i2, j1, j2});
}

void write_context(std::ostringstream& out, const std::vector<std::string>& old_lines,
                   const DiffOpcode& op, std::size_t from, std::size_t to) {
    for (std::size_t i = from; i < to; ++i) {
        const std::size_t new_number = op.new_begin + (i - op.old_begin) + 1;
        out << ' ' << std::setw(4) << (i + 1) << ' ' << std::setw(4) << new_number << " │ " << old_lines[i] << '\n';
    }
}

void write_removed(std::ostringstream& out, const std::vector<std::string>& old_lines,
                   std::size_t from, std::size_t to, bool color) {
    for (std::size_t i = from; i < to; ++i) {
        out << (color ? kRed : "") << '-' << std::setw(4) << (i + 1) << "      │ " << old_lines[i]
            << (color ? kReset : "") << '\n';
    }
}

void write_added(std::ostringstream& out, const std::vector<std::string>& new_lines,
                 std::size_t from, std::size_t to, bool color) {
    for (std::size_t j = from; j < to; ++j) {
        out << (color ? kGreen : "") << "+     " << std::setw(4) << (j + 1) << " │ " << new_lines[j]
            << (color ? kReset : "") << '\n';
    }
}

} // namespace

std::vector<std::string> split_diff_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            return lines;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }
}

std::vector<DiffOpcode> compute_opcodes(const std::vector<std::string>& old_lines,
                                        const std::vector<std::string>& new_lines) {
    std::unordered_map<std::string_view, std::uint32_t> ids;
    const auto a = intern(old_lines, ids);
    const auto b = intern(new_lines, ids);
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix && a[n - 1 - suffix] == b[m - 1 - suffix]) {
        ++suffix;
    }

    MatchPairs pairs;
    pairs.reserve(prefix + suffix);
    for (std::size_t k = 0; k < prefix; ++k) {
        pairs.emplace_back(k, k);
    }
    lcs_middle(a, prefix, n - suffix, b, prefix, m - suffix, pairs);
    for (std::size_t k = 0; k < suffix; ++k) {
        pairs.emplace_back(n - suffix + k, m - suffix + k);
    }

    std::vector<DiffOpcode> ops;
    std::size_t oi = 0;
    std::size_t nj = 0;
    for (const auto& [i, j] : pairs) {
        push_change(ops, oi, i, nj, j);
        if (!ops.empty() && ops.back().tag == OpTag::Equal && ops.back().old_end == i && ops.back().new_end == j) {
            ++ops.back().old_end;
            ++ops.back().new_end;
        } else {
            ops.push_back(DiffOpcode{OpTag::Equal, i, i + 1, j, j + 1});
        }
        oi = i + 1;
        nj = j + 1;
    }
    push_change(ops, oi, n, nj, m);
    return ops;
}

std::string render_diff(const std::string& old_content,
                        const std::string& new_content,
                        const std::string& label,
                        const DiffOptions& options) {
    const bool color = options.color;
    const std::size_t context = options.context_lines;
    std::ostringstream out;
    out << (color ? kCyan : "") << "File changes: " << label << (color ? kReset : "") << '\n';
    out << (color ? kBlue : "") << std::string(60, '=') << (color ? kReset : "") << '\n';

    if (old_content == new_content) {
        out << kNoChanges << '\n';
        return out.str();
    }

    const auto old_lines = split_diff_lines(old_content);
    const auto new_lines = split_diff_lines(new_content);
    const auto ops = compute_opcodes(old_lines, new_lines);

    std::size_t first_shown = old_lines.size();
    for (const auto& op : ops) {
        if (op.tag != OpTag::Equal) {
            first_shown = op.old_begin > context ? op.old_begin - context : 0;
            break;
        }
    }
    if (first_shown > 0) {
        out << kEllipsisRow << '\n';
    }

    for (std::size_t idx = 0; idx < ops.size(); ++idx) {
        const DiffOpcode& op = ops[idx];
        switch (op.tag) {
        case OpTag::Equal: {
            const bool has_previous = idx > 0;
            const bool has_next = idx + 1 < ops.size();
            const std::size_t span = op.old_end - op.old_begin;
            if (has_previous && has_next) {
                if (span > context * 2) {
                    write_context(out, old_lines, op, op.old_begin, op.old_begin + context);
                    out << kEllipsisRow << '\n';
                    write_context(out, old_lines, op, op.old_end - context, op.old_end);
                } else {
                    write_context(out, old_lines, op, op.old_begin, op.old_end);
                }
            } else if (has_previous) {
                write_context(out, old_lines, op, op.old_begin, std::min(op.old_begin + context, op.old_end));
            } else if (has_next) {
                write_context(out, old_lines, op, op.old_end - std::min(context, span), op.old_end);
            }
            break;
        }
        case OpTag::Replace:
            write_removed(out, old_lines, op.old_begin, op.old_end, color);
            write_added(out, new_lines, op.new_begin, op.new_end, color);
            break;
        case OpTag::Delete:
            write_removed(out, old_lines, op.old_begin, op.old_end, color);
            break;
        case OpTag::Insert:
            write_added(out, new_lines, op.new_begin, op.new_end, color);
            break;
        }
    }

    // Index one past the last old line shown; the trailing ellipsis marks anything beyond it.
    std::size_t shown_end = 0;
    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        if (it->tag != OpTag::Equal) {
            shown_end = std::min(old_lines.size(), it->old_end + context);
            break;
        }
    }
    if (shown_end < old_lines.size()) {
        out << kEllipsisRow << '\n';
    }

    return out.str();
}

} // namespace patchwise
