// permission_gate_test.cpp - folder approval, inheritance and persistence

#include <patchwise/permission_gate.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using patchwise::FolderStore;
using patchwise::PermissionGate;

namespace {

class RecordingStore final : public FolderStore {
public:
    std::vector<std::vector<std::string>> saves;
    bool fail = false;

    void save_folders(const std::vector<std::string>& folders) override {
        if (fail) {
            throw std::runtime_error("read-only settings file");
        }
        saves.push_back(folders);
    }
};

} // namespace

TEST(PermissionGate, approval_covers_folder_and_descendants_only) {
    PermissionGate gate;
    gate.grant("/a/b");
    EXPECT_TRUE(gate.check("/a/b"));
    EXPECT_TRUE(gate.check("/a/b/c"));
    EXPECT_TRUE(gate.check("/a/b/c/d/e"));
    EXPECT_FALSE(gate.check("/a/c"));
    EXPECT_FALSE(gate.check("/a"));
    EXPECT_FALSE(gate.check("/a/bc"));
}

TEST(PermissionGate, paths_are_normalized_before_comparison) {
    PermissionGate gate;
    EXPECT_EQ(gate.grant("/srv/project/"), std::filesystem::path("/srv/project"));
    EXPECT_TRUE(gate.check("/srv/project/./src/../include"));
    EXPECT_FALSE(gate.check("/srv/project/../other"));
}

TEST(PermissionGate, relative_paths_resolve_against_working_directory) {
    PermissionGate gate;
    gate.grant(".");
    EXPECT_TRUE(gate.check("src"));
    EXPECT_TRUE(gate.check(std::filesystem::current_path()));
}

TEST(PermissionGate, empty_gate_denies_everything) {
    PermissionGate gate;
    EXPECT_TRUE(gate.empty());
    EXPECT_FALSE(gate.check("/"));
    EXPECT_FALSE(gate.check("/tmp"));
}

TEST(PermissionGate, preloaded_folders_are_approved) {
    PermissionGate gate(std::vector<std::string>{"/home/dev/repo", ""});
    EXPECT_EQ(gate.folders(), std::vector<std::string>{"/home/dev/repo"});
    EXPECT_TRUE(gate.check("/home/dev/repo/docs"));
}

TEST(PermissionGate, grant_persists_the_whole_set_once_per_new_folder) {
    RecordingStore store;
    PermissionGate gate;
    gate.set_store(&store);

    gate.grant("/x");
    gate.grant("/y");
    gate.grant("/x");

    ASSERT_EQ(store.saves.size(), 2u);
    EXPECT_EQ(store.saves.back(), (std::vector<std::string>{"/x", "/y"}));
}

TEST(PermissionGate, store_failure_keeps_the_grant_for_the_session) {
    RecordingStore store;
    store.fail = true;
    PermissionGate gate;
    gate.set_store(&store);

    EXPECT_NO_THROW(gate.grant("/data"));
    EXPECT_TRUE(gate.check("/data/sub"));
}

TEST(PermissionGate, revoke_removes_exact_entry_only) {
    RecordingStore store;
    PermissionGate gate(std::vector<std::string>{"/a", "/a/b"});
    gate.set_store(&store);

    EXPECT_TRUE(gate.revoke("/a/"));
    EXPECT_FALSE(gate.check("/a/c"));
    EXPECT_TRUE(gate.check("/a/b/c"));
    EXPECT_FALSE(gate.revoke("/a"));
    ASSERT_EQ(store.saves.size(), 1u);
    EXPECT_EQ(store.saves.front(), std::vector<std::string>{"/a/b"});
}
