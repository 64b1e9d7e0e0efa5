// project_context_test.cpp - AGENTS.md loading, templates and permanent instructions

#include "fakes.hpp"

#include <patchwise/project_context.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace patchwise;
using patchwise::testing::MemoryFileSystem;

TEST(ProjectContext, missing_or_blank_agents_file_is_ignored) {
    MemoryFileSystem files;
    EXPECT_EQ(load_agents_md(files, "/work"), std::nullopt);
    files.files["/work/AGENTS.md"] = "  \n\t\n";
    EXPECT_EQ(load_agents_md(files, "/work"), std::nullopt);
    files.files["/work/AGENTS.md"] = "# Rules\n";
    EXPECT_EQ(load_agents_md(files, "/work"), "# Rules\n");
}

TEST(ProjectContext, system_prompt_embeds_project_context) {
    const std::string base = build_system_prompt(std::nullopt);
    EXPECT_EQ(base.find("PROJECT CONTEXT"), std::string::npos);

    const std::string with = build_system_prompt(std::string("Use tabs."));
    EXPECT_EQ(with.rfind(base, 0), 0u);
    EXPECT_NE(with.find("--- PROJECT CONTEXT (AGENTS.md) ---\nUse tabs.\n--- END PROJECT CONTEXT ---"), std::string::npos);
    EXPECT_NE(with.find("Permanent Instructions"), std::string::npos);
}

TEST(ProjectContext, template_names_the_project) {
    const std::string md = agents_template("demo", "/work/demo", "2026-01-02 03:04:05");
    EXPECT_EQ(md.rfind("# demo - AI Agent Instructions\n", 0), 0u);
    EXPECT_NE(md.find("**Location:** /work/demo"), std::string::npos);
    EXPECT_NE(md.find("**Initialized:** 2026-01-02 03:04:05"), std::string::npos);
    EXPECT_NE(md.find("### Permanent Instructions\n*Use #command"), std::string::npos);
}

TEST(PermanentInstructions, first_instruction_replaces_placeholder) {
    const std::string md = agents_template("demo", "/w", "t");
    const std::string once = add_permanent_instruction(md, "always run tests");
    EXPECT_EQ(once.find("*Use #command"), std::string::npos);
    EXPECT_NE(once.find("### Permanent Instructions\n- always run tests\n\n### Project Context"), std::string::npos);

    const std::string twice = add_permanent_instruction(once, "prefer python3");
    EXPECT_NE(twice.find("### Permanent Instructions\n- always run tests\n- prefer python3\n\n### Project Context"),
              std::string::npos);
}

TEST(PermanentInstructions, missing_section_goes_before_last_subsection) {
    const std::string md = "# T\n\n## A\n\n### B\nstuff\n";
    EXPECT_EQ(add_permanent_instruction(md, "x"), "# T\n\n## A\n\n### Permanent Instructions\n- x\n\n### B\nstuff\n");
}

TEST(PermanentInstructions, file_without_subsections_gets_new_section_appended) {
    EXPECT_EQ(add_permanent_instruction("# T\n", "x"),
              "# T\n\n\n## AI Agent Instructions\n\n### Permanent Instructions\n- x\n");
}

TEST(PermanentInstructions, bare_header_gets_first_bullet) {
    EXPECT_EQ(add_permanent_instruction("### Permanent Instructions\n", "x"), "### Permanent Instructions\n- x\n");
}

TEST(ProjectContext, initialize_refuses_to_overwrite_unless_asked) {
    MemoryFileSystem files;
    EXPECT_TRUE(initialize_project(files, "/work/demo", false));
    ASSERT_EQ(files.files.count("/work/demo/AGENTS.md"), 1u);
    EXPECT_EQ(files.files["/work/demo/AGENTS.md"].rfind("# demo - AI Agent Instructions", 0), 0u);

    files.files["/work/demo/AGENTS.md"] = "custom";
    EXPECT_FALSE(initialize_project(files, "/work/demo", false));
    EXPECT_EQ(files.files["/work/demo/AGENTS.md"], "custom");
    EXPECT_TRUE(initialize_project(files, "/work/demo", true));
    EXPECT_NE(files.files["/work/demo/AGENTS.md"], "custom");
}

TEST(ProjectContext, recording_an_instruction_seeds_missing_file) {
    MemoryFileSystem files;
    record_permanent_instruction(files, "/work/demo", "use C++20");
    const std::string& md = files.files["/work/demo/AGENTS.md"];
    EXPECT_NE(md.find("### Permanent Instructions\n- use C++20\n"), std::string::npos);
    EXPECT_NE(load_agents_md(files, "/work/demo"), std::nullopt);
}
