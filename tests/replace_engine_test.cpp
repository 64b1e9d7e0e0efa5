// replace_engine_test.cpp - locate-and-replace strategies and their precedence

#include <patchwise/replace_engine.hpp>

#include <gtest/gtest.h>

#include <string>

using patchwise::EditError;
using patchwise::EditErrorKind;
using patchwise::MatchStrategy;
using patchwise::ReplaceEngine;

namespace {

EditErrorKind kind_of(const ReplaceEngine& engine, const std::string& content, const std::string& old_text,
                      const std::string& new_text, bool replace_all = false) {
    try {
        engine.replace(content, old_text, new_text, replace_all);
    } catch (const EditError& ex) {
        return ex.kind();
    }
    ADD_FAILURE() << "expected EditError";
    return EditErrorKind::NoOp;
}

} // namespace

TEST(ReplaceEngine, exact_unique_literal_uses_first_strategy) {
    ReplaceEngine engine;
    auto outcome = engine.replace("int a = 1;\nint b = 2;\n", "int b = 2;", "int b = 3;", false);
    EXPECT_EQ(outcome.content, "int a = 1;\nint b = 3;\n");
    EXPECT_EQ(outcome.match.strategy, MatchStrategy::Exact);
    EXPECT_EQ(outcome.match.start, 11u);
    EXPECT_EQ(outcome.replacements, 1u);
    EXPECT_FALSE(outcome.created);
}

TEST(ReplaceEngine, identical_texts_fail_before_searching) {
    ReplaceEngine engine;
    EXPECT_EQ(kind_of(engine, "", "", ""), EditErrorKind::NoOp);
    EXPECT_EQ(kind_of(engine, "abc", "missing", "missing"), EditErrorKind::NoOp);
}

TEST(ReplaceEngine, empty_old_text_creates_without_search) {
    ReplaceEngine engine;
    auto outcome = engine.replace("ignored existing content", "", "fresh file\n", false);
    EXPECT_TRUE(outcome.created);
    EXPECT_EQ(outcome.content, "fresh file\n");
}

TEST(ReplaceEngine, leading_whitespace_difference_is_found_by_line_trimmed) {
    ReplaceEngine engine;
    const std::string content = "def f():\n    if x:\n        return 1\n";
    auto outcome = engine.replace(content, "if x:\n    return 1\n", "if y:\n        return 2", false);
    EXPECT_EQ(outcome.match.strategy, MatchStrategy::LineTrimmed);
    EXPECT_EQ(outcome.match.literal, "    if x:\n        return 1");
    EXPECT_EQ(outcome.content, "def f():\nif y:\n        return 2\n");
}

TEST(ReplaceEngine, collapsed_whitespace_matches_single_line) {
    ReplaceEngine engine;
    const std::string content = "call(a,   b,\tc);\nnext();\n";
    auto outcome = engine.replace(content, "call(a, b, c);", "call(a);", false);
    EXPECT_EQ(outcome.match.strategy, MatchStrategy::WhitespaceNormalized);
    EXPECT_EQ(outcome.content, "call(a);\nnext();\n");
}

TEST(ReplaceEngine, indentation_flexible_matches_shifted_block) {
    ReplaceEngine engine;
    const std::string content = "root\n\t\tchild:\n\t\t\tleaf\nend\n";
    const std::string pattern = "  child:\n    leaf\n  extra";
    // Different structure: the extra line must keep every strategy from matching.
    EXPECT_EQ(kind_of(engine, content, pattern, "x"), EditErrorKind::NoMatch);

    const auto candidates = engine.find_candidates(MatchStrategy::IndentationFlexible,
                                                   "a\n    b\n      c\n", "b\n  c");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates.front().literal, "    b\n      c");
}

TEST(ReplaceEngine, two_occurrences_are_ambiguous_without_replace_all) {
    ReplaceEngine engine;
    const std::string content = "log();\nwork();\nlog();\n";
    EXPECT_EQ(kind_of(engine, content, "log();", "trace();"), EditErrorKind::NoMatch);

    auto outcome = engine.replace(content, "log();", "trace();", true);
    EXPECT_EQ(outcome.content, "trace();\nwork();\ntrace();\n");
    EXPECT_EQ(outcome.replacements, 2u);
}

TEST(ReplaceEngine, missing_text_reports_not_found_or_ambiguous) {
    ReplaceEngine engine;
    try {
        engine.replace("alpha\nbeta\n", "gamma", "delta", false);
        FAIL() << "expected EditError";
    } catch (const EditError& ex) {
        EXPECT_EQ(ex.kind(), EditErrorKind::NoMatch);
        EXPECT_STREQ(ex.what(), "oldString not found in content or multiple ambiguous matches found");
    }
}

TEST(ReplaceEngine, earlier_strategy_wins_even_when_later_one_fits_better) {
    ReplaceEngine engine;
    // Line-trimmed would pick the whole first line, but the exact substring inside line two comes first.
    const std::string content = "value\n  value2\n";
    auto outcome = engine.replace(content, "  value", "X", false);
    EXPECT_EQ(outcome.match.strategy, MatchStrategy::Exact);
    EXPECT_EQ(outcome.content, "value\nX2\n");
}

TEST(ReplaceEngine, trimmed_candidate_that_repeats_falls_through_to_error) {
    ReplaceEngine engine;
    const std::string content = "  item\nother\n  item\n";
    EXPECT_EQ(kind_of(engine, content, "item  \n", "thing"), EditErrorKind::NoMatch);
}
