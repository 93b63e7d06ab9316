#include <gtest/gtest.h>
#include "runtime/Core.hpp"
#include "trash/Manager.hpp"
#include "trash/SystemTrash.hpp"
#include "util/Error.hpp"
#include "TempTree.hpp"

using namespace nx;
using namespace nx::runtime;
using namespace nx::trash;

class CoreTest : public ::testing::Test {
protected:
    TempTree tree{"core"};
    std::unique_ptr<Core> core;

    void SetUp() override {
        config::Config cfg;
        cfg.trash.root = tree.root() / "app-trash";
        cfg.trash.system_trash_dir = tree.root() / "Trash";
        cfg.scan.worker_threads = 2;
        cfg.scan.small_file_bytes = 1024;
        cfg.scan.small_folder_bytes = 1024;
        cfg.scan.default_depth = 1;
        cfg.scan.deep_depth = 4;
        core = std::make_unique<Core>(cfg);
    }

    void TearDown() override { core.reset(); }
};

TEST_F(CoreTest, TrashFacadeReportsSuccessAsBool) {
    const auto src = tree.text("doc.txt", "content");

    EXPECT_TRUE(core->moveToTrash(src));
    EXPECT_FALSE(fs::exists(src));

    const auto items = core->listTrashItems();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].source, model::Source::App);

    EXPECT_TRUE(core->restoreFromTrash(items[0].id));
    EXPECT_EQ(TempTree::read(src), "content");
    EXPECT_TRUE(core->listTrashItems().empty());
}

TEST_F(CoreTest, TrashFacadeReportsFailureAsFalse) {
    EXPECT_FALSE(core->moveToTrash(tree.root() / "missing"));
    EXPECT_FALSE(core->restoreFromTrash("no-such-id"));
    EXPECT_FALSE(core->permanentlyDelete("no-such-id"));
    EXPECT_FALSE(core->permanentlyDelete("system:!!"));
}

TEST_F(CoreTest, RestoreOfSystemItemIsAlwaysFalse) {
    const auto sys = tree.file("Trash/files/thing.bin", 5);
    EXPECT_FALSE(core->restoreFromTrash(SystemTrash::encodeId(sys)));
    EXPECT_TRUE(fs::exists(sys));
}

TEST_F(CoreTest, EmptyTrashRemovesEverything) {
    ASSERT_TRUE(core->moveToTrash(tree.file("one.bin", 5)));
    ASSERT_TRUE(core->moveToTrash(tree.file("two.bin", 5)));
    tree.file("Trash/files/sys.bin", 5);

    EXPECT_TRUE(core->emptyTrash());
    EXPECT_TRUE(core->listTrashItems().empty());
}

TEST_F(CoreTest, PermanentDeleteThroughFacade) {
    ASSERT_TRUE(core->moveToTrash(tree.file("p.bin", 5)));
    const auto items = core->listTrashItems();
    ASSERT_EQ(items.size(), 1u);

    EXPECT_TRUE(core->permanentlyDelete(items[0].id));
    EXPECT_TRUE(core->listTrashItems().empty());
}

TEST_F(CoreTest, ScansUseConfiguredDepths) {
    tree.file("scan/l1/l2/l3/deep.bin", 4096);
    const auto root = tree.root() / "scan";

    auto shallowFuture = core->scanForVisualization(root);
    const auto shallow = scan::awaitTree(shallowFuture);
    ASSERT_TRUE(shallow->children.has_value());
    const auto& l1 = shallow->children->front();
    EXPECT_EQ(l1.id, "l1");
    ASSERT_TRUE(l1.children.has_value());
    EXPECT_EQ(l1.children->front().id, scan::model::OTHER_FOLDERS_BUCKET_ID);

    auto deepFuture = core->scanForVisualizationDeep(root);
    const auto deep = scan::awaitTree(deepFuture);
    const auto* node = &*deep;
    for (const auto* name : {"l1", "l2", "l3", "deep.bin"}) {
        ASSERT_TRUE(node->children.has_value()) << "missing children under " << node->id;
        node = &node->children->front();
        EXPECT_EQ(node->id, name);
    }
    EXPECT_EQ(node->value, 4096u);
}

TEST_F(CoreTest, ExplicitDepthOverridesDefault) {
    tree.file("scan/a/b/file.bin", 4096);

    auto future = core->scanForVisualization(tree.root() / "scan", 0);
    const auto tree0 = scan::awaitTree(future);
    ASSERT_TRUE(tree0->children.has_value());
    ASSERT_EQ(tree0->children->size(), 1u);
    EXPECT_EQ(tree0->children->front().id, scan::model::OTHER_FOLDERS_BUCKET_ID);
    EXPECT_EQ(tree0->value, 4096u);
}

TEST_F(CoreTest, ScanFaultsSurfaceFromFuture) {
    auto future = core->scanForVisualization(tree.root() / "absent");
    EXPECT_THROW((void)scan::awaitTree(future), Error);
}
