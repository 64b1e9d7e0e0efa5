// transcript_test.cpp - conversation export

#include "fakes.hpp"

#include <patchwise/transcript.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace patchwise;
using patchwise::chat::Message;
using patchwise::testing::MemoryFileSystem;

namespace {

Session sample_session() {
    Session session;
    session.history = {
        Message::system("sys"),
        Message::user("list things"),
        Message::assistant("", {chat::ToolCall{"c1", "list_files", "{\"path\":\".\"}"}}),
        Message::tool("c1", "a.txt"),
        Message::assistant("done"),
    };
    session.last_usage = chat::TokenUsage{300, 20};
    session.total_tokens = 900;
    return session;
}

} // namespace

TEST(Transcript, filename_defaults_and_suffix) {
    EXPECT_EQ(transcript_filename(""), "context.txt");
    EXPECT_EQ(transcript_filename("notes"), "notes.txt");
    EXPECT_EQ(transcript_filename("notes.txt"), "notes.txt");
    EXPECT_EQ(transcript_filename("notes.md"), "notes.md.txt");
}

TEST(Transcript, renders_every_message_in_order) {
    const std::string text = render_transcript(sample_session(), "2026-03-04 05:06:07");
    EXPECT_EQ(text.rfind("# patchwise Context Export\nExported: 2026-03-04 05:06:07\n"
                         "Context Tokens: 300\nTotal Session Tokens: 900\n\n" + std::string(80, '=') + "\n\n", 0),
              0u);

    const auto system = text.find("SYSTEM MESSAGE:\nsys\n");
    const auto user = text.find("USER:\nlist things\n");
    const auto call = text.find("ASSISTANT:\n\nTOOL CALL: list_files\nArguments: {\"path\":\".\"}\n");
    const auto result = text.find("TOOL RESULT:\na.txt\n");
    const auto answer = text.find("ASSISTANT:\ndone\n");
    ASSERT_NE(system, std::string::npos);
    ASSERT_NE(user, std::string::npos);
    ASSERT_NE(call, std::string::npos);
    ASSERT_NE(result, std::string::npos);
    ASSERT_NE(answer, std::string::npos);
    EXPECT_LT(system, user);
    EXPECT_LT(user, call);
    EXPECT_LT(call, result);
    EXPECT_LT(result, answer);

    const std::string tail = std::string(80, '=') + "\nEnd of context export (5 messages)\n";
    EXPECT_EQ(text.substr(text.size() - tail.size()), tail);
}

TEST(Transcript, usage_lines_are_omitted_without_usage) {
    Session session;
    session.history = {Message::user("hi")};
    const std::string text = render_transcript(session, "now");
    EXPECT_EQ(text.find("Context Tokens"), std::string::npos);
}

TEST(Transcript, export_writes_file_and_counts_messages) {
    MemoryFileSystem files;
    EXPECT_EQ(export_transcript(files, sample_session(), "out.txt"), 5u);
    ASSERT_EQ(files.writes, std::vector<std::string>{"out.txt"});
    EXPECT_NE(files.files["out.txt"].find("End of context export (5 messages)"), std::string::npos);
}

TEST(Transcript, empty_history_is_refused) {
    MemoryFileSystem files;
    try {
        export_transcript(files, Session{}, "out.txt");
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& ex) {
        EXPECT_EQ(std::string(ex.what()), "No conversation context to export");
    }
    EXPECT_TRUE(files.writes.empty());
}
