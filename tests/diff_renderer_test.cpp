// diff_renderer_test.cpp - edit scripts and windowed diff rendering

#include <patchwise/diff_renderer.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using patchwise::DiffOpcode;
using patchwise::OpTag;

namespace {

std::string numbered_lines(int count, int changed = 0, const std::string& replacement = std::string()) {
    std::string text;
    for (int i = 1; i <= count; ++i) {
        if (i > 1) {
            text += '\n';
        }
        text += (i == changed) ? replacement : "line" + std::to_string(i);
    }
    return text;
}

std::vector<std::string> body_rows(const std::string& rendered) {
    std::istringstream in(rendered);
    std::vector<std::string> rows;
    std::string row;
    int index = 0;
    while (std::getline(in, row)) {
        if (index++ >= 2) {
            rows.push_back(row);
        }
    }
    return rows;
}

} // namespace

TEST(DiffOpcodes, cover_both_sequences_in_order) {
    const std::vector<std::string> old_lines{"a", "b", "c", "d"};
    const std::vector<std::string> new_lines{"a", "x", "c", "d", "e"};
    const auto ops = patchwise::compute_opcodes(old_lines, new_lines);
    const std::vector<DiffOpcode> expected{
        {OpTag::Equal, 0, 1, 0, 1},
        {OpTag::Replace, 1, 2, 1, 2},
        {OpTag::Equal, 2, 4, 2, 4},
        {OpTag::Insert, 4, 4, 4, 5},
    };
    EXPECT_EQ(ops, expected);
}

TEST(DiffOpcodes, pure_deletion_and_empty_inputs) {
    const auto deletion = patchwise::compute_opcodes({"a", "b", "c"}, {"a", "c"});
    ASSERT_EQ(deletion.size(), 3u);
    EXPECT_EQ(deletion[1], (DiffOpcode{OpTag::Delete, 1, 2, 1, 1}));

    const auto from_nothing = patchwise::compute_opcodes({}, {"x", "y"});
    ASSERT_EQ(from_nothing.size(), 1u);
    EXPECT_EQ(from_nothing[0], (DiffOpcode{OpTag::Insert, 0, 0, 0, 2}));
}

TEST(DiffSplit, trailing_newline_yields_empty_last_line) {
    EXPECT_EQ(patchwise::split_diff_lines("a\nb\n"), (std::vector<std::string>{"a", "b", ""}));
    EXPECT_EQ(patchwise::split_diff_lines(""), (std::vector<std::string>{""}));
}

TEST(RenderDiff, identical_contents_render_sentinel_only) {
    const std::string rendered = patchwise::render_diff("same\n", "same\n", "notes.txt");
    EXPECT_EQ(rendered, "File changes: notes.txt\n" + std::string(60, '=') + "\nNo changes\n");
}

TEST(RenderDiff, single_change_in_long_file_shows_bounded_window) {
    const std::string before = numbered_lines(100);
    const std::string after = numbered_lines(100, 50, "changed");
    const auto rows = body_rows(patchwise::render_diff(before, after, "big.txt"));

    int context = 0;
    int ellipses = 0;
    int removed = 0;
    int added = 0;
    for (const auto& row : rows) {
        if (row.find("...") != std::string::npos) {
            ++ellipses;
        } else if (row.front() == ' ') {
            ++context;
        } else if (row.front() == '-') {
            ++removed;
        } else if (row.front() == '+') {
            ++added;
        }
    }
    EXPECT_LE(context, 2 * static_cast<int>(patchwise::kContextLines) + 1);
    EXPECT_EQ(context, 6);
    EXPECT_EQ(ellipses, 2);
    EXPECT_EQ(removed, 1);
    EXPECT_EQ(added, 1);
}

TEST(RenderDiff, row_layout_aligns_line_numbers) {
    const auto rows = body_rows(patchwise::render_diff("a\nb\nc", "a\nB\nc", "f"));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0], "    1    1 │ a");
    EXPECT_EQ(rows[1], "-   2      │ b");
    EXPECT_EQ(rows[2], "+        2 │ B");
    EXPECT_EQ(rows[3], "    3    3 │ c");
}

TEST(RenderDiff, long_gap_between_changes_is_elided) {
    const std::string before = numbered_lines(20);
    std::string after = numbered_lines(20, 2, "two");
    after.replace(after.find("line19"), 6, "nineteen");
    const auto rows = body_rows(patchwise::render_diff(before, after, "gap.txt"));

    // line1, change at 2, three lines after, ellipsis, three lines before 19, change at 19, line20.
    int ellipses = 0;
    for (const auto& row : rows) {
        ellipses += row.find("...") != std::string::npos ? 1 : 0;
    }
    EXPECT_EQ(ellipses, 1);
    EXPECT_EQ(rows.front(), "    1    1 │ line1");
    EXPECT_EQ(rows.back(), "   20   20 │ line20");
}

TEST(RenderDiff, colour_is_opt_in) {
    const std::string plain = patchwise::render_diff("a", "b", "f");
    EXPECT_EQ(plain.find('\033'), std::string::npos);

    const std::string coloured = patchwise::render_diff("a", "b", "f", patchwise::DiffOptions{true, 3});
    EXPECT_NE(coloured.find("\033[31m-"), std::string::npos);
    EXPECT_NE(coloured.find("\033[32m+"), std::string::npos);
}

TEST(RenderDiff, inputs_are_left_untouched) {
    const std::string before = "one\ntwo\n";
    const std::string after = "one\n2\n";
    patchwise::render_diff(before, after, "f");
    EXPECT_EQ(before, "one\ntwo\n");
    EXPECT_EQ(after, "one\n2\n");
}
