#include "callscope/coverage.hpp"
#include "callscope/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace callscope;
using namespace callscope::test_support;

class CoverageTest : public ::testing::Test {
protected:
    void SetUp() override { root = dir.path(); }

    void add(const std::string &name, const std::string &file, uint32_t start, uint32_t end,
             bool has_body = true) {
        FunctionDescriptor fn;
        fn.package = "demo";
        fn.package_path = "example.com/demo";
        fn.name = name;
        fn.file = (root / file).string();
        fn.start_line = start;
        fn.end_line = end;
        fn.has_body = has_body;
        builder.add(std::move(fn));
    }

    std::set<std::string> untested(const std::string &profile_text) {
        std::istringstream in(profile_text);
        CoverageProfile profile = CoverageProfile::parse(in);
        Registry registry = std::move(builder).freeze();
        return untested_identities(analyze_coverage(profile, registry, root));
    }

    TempDir dir;
    fs::path root;
    RegistryBuilder builder{"example.com/demo"};
};

TEST_F(CoverageTest, BlockOutsideSpanDoesNotCover) {
    add("Target", "a.go", 10, 20);
    auto result = untested("mode: set\nexample.com/demo/a.go:25.2,30.3 1 5\n");
    EXPECT_EQ(result, std::set<std::string>{"demo.Target"});
}

TEST_F(CoverageTest, ExecutedOverlappingBlockCovers) {
    add("Target", "a.go", 10, 20);
    add("Other", "a.go", 22, 30);
    auto result = untested("mode: count\n"
                           "example.com/demo/a.go:12.5,14.3 2 0\n"
                           "example.com/demo/a.go:18.2,21.1 1 3\n");
    EXPECT_EQ(result, std::set<std::string>{"demo.Other"});
}

TEST_F(CoverageTest, ZeroCountBlocksDoNotCover) {
    add("Target", "a.go", 10, 20);
    auto result = untested("mode: set\nexample.com/demo/a.go:11.2,19.3 4 0\n");
    EXPECT_EQ(result.count("demo.Target"), 1u);
}

TEST_F(CoverageTest, FileWithoutEntriesIsUntested) {
    add("Covered", "a.go", 1, 5);
    add("Lonely", "b.go", 1, 5);
    auto result = untested("mode: set\nexample.com/demo/a.go:2.1,4.1 1 1\n");
    EXPECT_EQ(result, std::set<std::string>{"demo.Lonely"});
}

TEST_F(CoverageTest, DeclarationWithoutBodyIsUntested) {
    add("asm", "a.go", 3, 3, false);
    auto result = untested("mode: set\nexample.com/demo/a.go:1.1,10.1 1 1\n");
    EXPECT_EQ(result.count("demo.asm"), 1u);
}

TEST_F(CoverageTest, LiteralFilePathsMatchToo) {
    add("Target", "a.go", 10, 20);
    std::string file = (root / "a.go").string();
    auto result = untested("mode: set\n" + file + ":10.1,20.2 3 1\n");
    EXPECT_TRUE(result.empty());
}

TEST_F(CoverageTest, ResultsCountExecutedBlocks) {
    add("Target", "a.go", 10, 20);
    std::istringstream in("example.com/demo/a.go:10.1,12.1 1 1\n"
                          "example.com/demo/a.go:13.1,15.1 1 2\n"
                          "example.com/demo/a.go:16.1,19.1 1 0\n");
    CoverageProfile profile = CoverageProfile::parse(in);
    Registry registry = std::move(builder).freeze();

    auto results = analyze_coverage(profile, registry, root);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].covered);
    EXPECT_EQ(results[0].executed_blocks, 2u);
    EXPECT_EQ(results[0].function, registry.find("demo.Target"));
}

TEST(CoverageProfile, ParsesBothLineForms) {
    std::istringstream in("mode: atomic\n"
                          "\n"
                          "example.com/m/a.go:3.14,5.2 2 7\n"
                          "example.com/m/a.go:8.1,9.2 0\n");
    CoverageProfile profile = CoverageProfile::parse(in);

    EXPECT_EQ(profile.mode(), "atomic");
    EXPECT_EQ(profile.num_blocks(), 2u);
    EXPECT_EQ(profile.malformed_lines(), 0u);

    const auto *blocks = profile.blocks_for("example.com/m/a.go");
    ASSERT_NE(blocks, nullptr);
    ASSERT_EQ(blocks->size(), 2u);
    EXPECT_EQ((*blocks)[0].start_line, 3u);
    EXPECT_EQ((*blocks)[0].start_col, 14u);
    EXPECT_EQ((*blocks)[0].end_line, 5u);
    EXPECT_EQ((*blocks)[0].end_col, 2u);
    EXPECT_EQ((*blocks)[0].count, 7u);
    EXPECT_EQ((*blocks)[1].count, 0u);
}

TEST(CoverageProfile, MalformedLinesAreSkipped) {
    std::istringstream in("mode: set\n"
                          "not a coverage line\n"
                          "example.com/m/a.go:3,5 1 1\n"
                          "example.com/m/a.go:3.1,5.2 one 1\n"
                          "example.com/m/a.go:3.1,5.2 1 x\n"
                          "example.com/m/a.go 1 1\n"
                          "example.com/m/a.go:3.1,5.2 1 1 1\n"
                          "example.com/m/a.go:6.1,7.2 1 1\r\n");
    CoverageProfile profile = CoverageProfile::parse(in);

    EXPECT_EQ(profile.malformed_lines(), 6u);
    EXPECT_EQ(profile.num_blocks(), 1u);
    EXPECT_EQ(profile.blocks_for("example.com/m/b.go"), nullptr);
}

TEST(CoverageProfile, MissingFileThrows) {
    EXPECT_THROW(CoverageProfile::load("/nonexistent/callscope/coverage.out"),
                 CoverageProfileOpenError);
}

TEST(CoverageProfile, LoadFromDisk) {
    TempDir dir;
    fs::path file = dir.write("coverage.out", "mode: set\nexample.com/m/a.go:1.1,2.1 1 1\n");

    CoverageProfile profile = CoverageProfile::load(file.string());
    EXPECT_EQ(profile.num_files(), 1u);
}

TEST(CoverageBlock, Overlap) {
    CoverageBlock block{25, 1, 30, 2, 5};
    EXPECT_FALSE(block.overlaps(10, 20));
    EXPECT_TRUE(block.overlaps(20, 25));
    EXPECT_TRUE(block.overlaps(26, 28));
    EXPECT_TRUE(block.overlaps(30, 40));
    EXPECT_FALSE(block.overlaps(31, 40));
}
