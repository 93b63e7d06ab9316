#include <gtest/gtest.h>
#include "scan/SizeProbe.hpp"
#include "TempTree.hpp"

using namespace nx::scan;

class SizeProbeTest : public ::testing::Test {
protected:
    TempTree tree{"probe"};
    SizeProbe probe;
};

TEST_F(SizeProbeTest, RegularFileIsItsOwnSize) {
    const auto f = tree.file("a.bin", 1234);
    EXPECT_EQ(probe.compute(f), 1234u);
}

TEST_F(SizeProbeTest, DirectoryIsRecursiveSum) {
    tree.file("a.bin", 100);
    tree.file("sub/b.bin", 200);
    tree.file("sub/deeper/c.bin", 300);
    EXPECT_EQ(probe.compute(tree.root()), 600u);
}

TEST_F(SizeProbeTest, MissingPathIsZero) {
    EXPECT_EQ(probe.compute(tree.root() / "nope"), 0u);
}

TEST_F(SizeProbeTest, SymlinksAreNotFollowed) {
    const auto big = tree.file("outside/big.bin", 10000);
    const auto scanned = tree.dir("scanned");
    tree.file("scanned/small.bin", 10);
    fs::create_symlink(big, scanned / "link-to-file");
    fs::create_directory_symlink(tree.root() / "outside", scanned / "link-to-dir");

    EXPECT_EQ(probe.compute(scanned), 10u);
}

TEST_F(SizeProbeTest, SymlinkLoopTerminates) {
    const auto loop = tree.dir("loop");
    tree.file("loop/f.bin", 50);
    fs::create_directory_symlink(loop, loop / "self");
    fs::create_directory_symlink("..", loop / "parent");

    EXPECT_EQ(probe.compute(loop), 50u);
}

TEST_F(SizeProbeTest, RecursionCeilingStopsDescent) {
    tree.file("l1/a.bin", 10);
    tree.file("l1/l2/b.bin", 20);
    tree.file("l1/l2/l3/c.bin", 40);

    const SizeProbe shallow(2);
    // level 0 = l1, level 1 = l2, l3 sits at the ceiling
    EXPECT_EQ(shallow.compute(tree.root() / "l1"), 30u);
}

TEST_F(SizeProbeTest, IdentityDistinguishesDirectories) {
    const auto a = tree.dir("a");
    const auto b = tree.dir("b");
    const auto idA = identityOf(a);
    const auto idB = identityOf(b);
    ASSERT_TRUE(idA.has_value());
    ASSERT_TRUE(idB.has_value());
    EXPECT_FALSE(*idA == *idB);
    EXPECT_TRUE(*idA == *identityOf(a));
    EXPECT_FALSE(identityOf(tree.root() / "missing").has_value());
}
