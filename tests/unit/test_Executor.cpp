#include <gtest/gtest.h>
#include "scan/Executor.hpp"
#include "util/Error.hpp"
#include "TempTree.hpp"

#include <vector>

using namespace nx;
using namespace nx::scan;
using namespace nx::scan::model;

class ExecutorTest : public ::testing::Test {
protected:
    TempTree tree{"executor"};

    static TreeBuilder::Options options() {
        TreeBuilder::Options o;
        o.small_file_bytes = 1024;
        o.small_folder_bytes = 2048;
        return o;
    }
};

TEST_F(ExecutorTest, DeliversTreeThroughFuture) {
    tree.file("a/data.bin", 4096);
    tree.file("b.txt", 10);

    const Executor executor(options(), 2);
    auto future = executor.submit(tree.root(), 2);
    const auto root = awaitTree(future);

    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->value, 4106u);
    EXPECT_EQ(*root, TreeBuilder(options()).build(tree.root(), 2));
}

TEST_F(ExecutorTest, ConcurrentScansAreIndependent) {
    std::vector<fs::path> roots;
    for (int i = 0; i < 6; ++i) {
        const auto dir = tree.dir("root" + std::to_string(i));
        tree.file(dir / "f.bin", 4096 * static_cast<size_t>(i + 1));
        roots.push_back(dir);
    }

    const Executor executor(options(), 3);
    std::vector<ScanFuture> futures;
    for (const auto& r : roots) futures.push_back(executor.submit(r, 2));

    for (size_t i = 0; i < futures.size(); ++i) {
        const auto node = awaitTree(futures[i]);
        EXPECT_EQ(node->id, roots[i].filename().string());
        EXPECT_EQ(node->value, 4096u * (i + 1));
    }
}

TEST_F(ExecutorTest, MissingRootFaultsTheFuture) {
    const Executor executor(options(), 1);
    auto future = executor.submit(tree.root() / "gone", 2);
    try {
        (void)awaitTree(future);
        FAIL() << "expected nx::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(ExecutorTest, SubmitAfterShutdownThrows) {
    const Executor executor(options(), 1);
    executor.shutdown();
    EXPECT_THROW((void)executor.submit(tree.root(), 1), std::runtime_error);
}
