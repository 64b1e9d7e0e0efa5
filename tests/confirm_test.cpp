// confirm_test.cpp - operator answers and console prompts

#include <patchwise/confirm.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using patchwise::ConsoleConfirmer;
using patchwise::Decision;
using patchwise::parse_decision;
using patchwise::chat::ToolCall;

TEST(ParseDecision, accepts_short_and_long_forms_case_insensitively) {
    EXPECT_EQ(parse_decision(""), Decision::Execute);
    EXPECT_EQ(parse_decision("  \n"), Decision::Execute);
    EXPECT_EQ(parse_decision("Y"), Decision::Execute);
    EXPECT_EQ(parse_decision("yes"), Decision::Execute);
    EXPECT_EQ(parse_decision("s"), Decision::Skip);
    EXPECT_EQ(parse_decision("SKIP"), Decision::Skip);
    EXPECT_EQ(parse_decision("b"), Decision::Background);
    EXPECT_EQ(parse_decision(" background "), Decision::Background);
    EXPECT_EQ(parse_decision("i"), Decision::Interrupt);
    EXPECT_EQ(parse_decision("Interrupt"), Decision::Interrupt);
}

TEST(ParseDecision, anything_else_denies) {
    EXPECT_EQ(parse_decision("n"), Decision::Deny);
    EXPECT_EQ(parse_decision("no"), Decision::Deny);
    EXPECT_EQ(parse_decision("maybe"), Decision::Deny);
    EXPECT_EQ(parse_decision("yess"), Decision::Deny);
}

TEST(ConsoleConfirmer, prompts_and_reports_skip) {
    std::istringstream in("s\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out, false);
    EXPECT_EQ(confirmer.confirm_tool(ToolCall{"1", "bash_command", "{}"}, false), Decision::Skip);
    EXPECT_NE(out.str().find("Execute this tool? (Y/n/s to skip/i to interrupt): "), std::string::npos);
    EXPECT_NE(out.str().find("Tool execution skipped"), std::string::npos);
    EXPECT_EQ(out.str().find("background"), std::string::npos);
}

TEST(ConsoleConfirmer, long_running_commands_offer_background) {
    std::istringstream in("b\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out, false);
    EXPECT_EQ(confirmer.confirm_tool(ToolCall{"1", "bash_command", "{}"}, true), Decision::Background);
    EXPECT_NE(out.str().find("long-running command"), std::string::npos);
    EXPECT_NE(out.str().find("/b for background): "), std::string::npos);
}

TEST(ConsoleConfirmer, closed_input_denies) {
    std::istringstream in("");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out, false);
    EXPECT_EQ(confirmer.confirm_tool(ToolCall{"1", "edit_file", "{}"}, false), Decision::Deny);
    EXPECT_FALSE(confirmer.approve_folder("/tmp"));
}

TEST(ConsoleConfirmer, interrupt_instruction_is_trimmed) {
    std::istringstream in("   run the tests instead  \n\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out, false);
    EXPECT_EQ(confirmer.interrupt_instruction(), "run the tests instead");
    EXPECT_EQ(confirmer.interrupt_instruction(), "");
    EXPECT_NE(out.str().find("No alternative instruction provided"), std::string::npos);
}

TEST(ConsoleConfirmer, folder_approval_defaults_to_yes) {
    std::istringstream in("\nn\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out, false);
    EXPECT_TRUE(confirmer.approve_folder("/srv/app"));
    EXPECT_FALSE(confirmer.approve_folder("/etc"));
    EXPECT_NE(out.str().find("Request folder access: /srv/app"), std::string::npos);
    EXPECT_NE(out.str().find("Folder access granted: /srv/app"), std::string::npos);
    EXPECT_NE(out.str().find("Folder access denied: /etc"), std::string::npos);
}
