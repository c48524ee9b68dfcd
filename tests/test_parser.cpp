#include "callscope/parser.hpp"
#include <gtest/gtest.h>

using namespace callscope;

class ParserTest : public ::testing::Test {
protected:
    std::vector<FunctionDef> parse(const std::string &source) {
        EXPECT_TRUE(parser.parse(source));
        EXPECT_FALSE(parser.has_errors());
        return parser.extract_functions();
    }

    GoParser parser;
};

TEST_F(ParserTest, PackageName) {
    parse("// Package demo does things.\npackage demo\n");
    EXPECT_EQ(parser.package_name(), "demo");
}

TEST_F(ParserTest, GroupedParameterNames) {
    auto funcs = parse("package p\n\nfunc Add(a, b int, label string) {}\n");
    ASSERT_EQ(funcs.size(), 1u);
    EXPECT_EQ(funcs[0].name, "Add");
    EXPECT_EQ(funcs[0].params,
              (std::vector<Parameter>{{"a", "int"}, {"b", "int"}, {"label", "string"}}));
    EXPECT_TRUE(funcs[0].returns.empty());
}

TEST_F(ParserTest, VariadicParameters) {
    auto funcs = parse("package p\n\nfunc Logf(format string, args ...interface{}) {}\n"
                       "func Join(sep string, parts ...string) string { return \"\" }\n");
    ASSERT_EQ(funcs.size(), 2u);
    EXPECT_EQ(funcs[0].params,
              (std::vector<Parameter>{{"format", "string"}, {"args", "...interface{}"}}));
    EXPECT_EQ(funcs[1].params, (std::vector<Parameter>{{"sep", "string"}, {"parts", "...string"}}));
    EXPECT_EQ(funcs[1].returns, std::vector<std::string>{"string"});
}

TEST_F(ParserTest, ResultLists) {
    auto funcs = parse("package p\n\nfunc Open() (int, error) { return 0, nil }\n"
                       "func Read() (n int, err error) { return }\n");
    ASSERT_EQ(funcs.size(), 2u);
    EXPECT_EQ(funcs[0].returns, (std::vector<std::string>{"int", "error"}));
    EXPECT_EQ(funcs[1].returns, (std::vector<std::string>{"n int", "err error"}));
}

TEST_F(ParserTest, ReceiversAreNormalized) {
    auto funcs = parse("package p\n\n"
                       "func (s *Server) Start() {}\n"
                       "func (s Server) Name() string { return \"\" }\n"
                       "func (l *List[T]) Push(v T) {}\n"
                       "func (Server) Anonymous() {}\n");
    ASSERT_EQ(funcs.size(), 4u);
    EXPECT_EQ(funcs[0].receiver, "Server");
    EXPECT_EQ(funcs[1].receiver, "Server");
    EXPECT_EQ(funcs[2].receiver, "List");
    EXPECT_EQ(funcs[3].receiver, "Server");
}

TEST_F(ParserTest, LinesAndBodies) {
    auto funcs = parse("package p\n"
                       "\n"
                       "func Long() {\n"
                       "\tx := 1\n"
                       "\t_ = x\n"
                       "}\n"
                       "\n"
                       "func linked(x int) int\n");
    ASSERT_EQ(funcs.size(), 2u);
    EXPECT_EQ(funcs[0].start_line, 3u);
    EXPECT_EQ(funcs[0].end_line, 6u);
    EXPECT_TRUE(funcs[0].has_body);
    EXPECT_FALSE(funcs[1].has_body);
    EXPECT_EQ(funcs[1].start_line, 8u);
}

TEST_F(ParserTest, OnlyTopLevelDeclarations) {
    auto funcs = parse("package p\n\nfunc Outer() {\n\tinner := func() {}\n\tinner()\n}\n");
    ASSERT_EQ(funcs.size(), 1u);
    EXPECT_EQ(funcs[0].name, "Outer");
}

TEST_F(ParserTest, ImportSpecs) {
    parse("package p\n\nimport \"fmt\"\n\nimport (\n\tstr \"strings\"\n\t_ \"embed\"\n)\n");
    auto imports = parser.extract_imports();
    ASSERT_EQ(imports.size(), 3u);
    EXPECT_EQ(imports[0].path, "fmt");
    EXPECT_EQ(imports[0].alias, "");
    EXPECT_EQ(imports[0].line, 3u);
    EXPECT_EQ(imports[1].path, "strings");
    EXPECT_EQ(imports[1].alias, "str");
    EXPECT_EQ(imports[2].alias, "_");
}

TEST_F(ParserTest, SyntaxErrorsAreReported) {
    ASSERT_TRUE(parser.parse("package p\n\nfunc ok() {}\n\nfunc broken( {\n"));
    EXPECT_TRUE(parser.has_errors());
    EXPECT_GE(parser.first_error_line(), 5u);
}

TEST_F(ParserTest, NodeTextOfNullNode) {
    parse("package p\n");
    EXPECT_EQ(parser.node_text(TSNode{}), "");
}

TEST(ParserMove, MovedParserKeepsTree) {
    GoParser first;
    ASSERT_TRUE(first.parse("package moved\n"));

    GoParser second(std::move(first));
    EXPECT_EQ(second.package_name(), "moved");
}

TEST(NormalizeReceiver, StripsDecorations) {
    EXPECT_EQ(normalize_receiver("*Server"), "Server");
    EXPECT_EQ(normalize_receiver(" ( *Server ) "), "Server");
    EXPECT_EQ(normalize_receiver("Map[K, V]"), "Map");
    EXPECT_EQ(normalize_receiver("Plain"), "Plain");
    EXPECT_EQ(normalize_receiver("   "), "");
}
