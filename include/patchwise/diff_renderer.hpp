#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace patchwise {

enum class OpTag {
    Equal,
    Replace,
    Delete,
    Insert
};

// Half-open line ranges [old_begin, old_end) and [new_begin, new_end).
struct DiffOpcode {
    OpTag tag = OpTag::Equal;
    std::size_t old_begin = 0;
    std::size_t old_end = 0;
    std::size_t new_begin = 0;
    std::size_t new_end = 0;

    bool operator==(const DiffOpcode&) const = default;
};

inline constexpr std::size_t kContextLines = 3;
inline constexpr std::string_view kNoChanges = "No changes";
inline constexpr std::string_view kEllipsisRow = "      ...  │ ";

struct DiffOptions {
    bool color = false;
    std::size_t context_lines = kContextLines;
};

// Splits on '\n' only; "a\n" yields {"a", ""}.
std::vector<std::string> split_diff_lines(std::string_view text);

// LCS-based edit script; opcodes are monotonic, alternate between equal and change
// spans, and together cover every line of both sequences exactly once.
std::vector<DiffOpcode> compute_opcodes(const std::vector<std::string>& old_lines,
                                        const std::vector<std::string>& new_lines);

std::string render_diff(const std::string& old_content,
                        const std::string& new_content,
                        const std::string& label,
                        const DiffOptions& options = DiffOptions{});

} // namespace patchwise
