#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace callscope;
using namespace callscope::test_support;

namespace {

const char *MAIN_SOURCE = R"(package main

import (
	"fmt"
	"math"

	"example.com/shop/ghost"
	st "example.com/shop/store"
)

func Foo() {}
func Bar() {}
func GetData() int { return 1 }
func Compute(n int) int { return n * 2 }
func Process(a, b int) int { return a + b }
func Print(v int) {}
func InnerFunc() {}
func Cleanup() {}
func RunTask() {}
func Log(args ...interface{}) {}

func empty() {
	x := 1
	_ = x
}

func simple() {
	Foo()
	Bar()
}

func (s *MyStruct) method() {
	s.DoSomething()
	DoAnotherThing()
}

func nested() {
	result := Process(GetData(), Compute(42))
	Print(result)
}

func withPackages() {
	fmt.Println("Hello")
	math.Abs(-3.14)
}

func (c *Controller) Handle() {
	c.Service.Execute()
}

func anonymous() {
	func() {
		InnerFunc()
	}()
}

func variadic() {
	Log("Error:", "Something went wrong", "Code:", 500)
}

func chained() {
	obj.Method().AnotherMethod().FinalMethod()
}

func concurrency() {
	defer Cleanup()
	go RunTask()
}

func crossModule() {
	st.Save()
	ghost.Vanish()
}

func builtins(items []int) {
	n := len(items)
	items = append(items, Compute(n))
	_ = int64(GetData())
}

func parenthesized() {
	(Foo)()
}
)";

const char *STORE_SOURCE = R"(package store

func Save() {
	flush()
}

func flush() {}
)";

} // namespace

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        project = index_sources("example.com/shop",
                                {{"main.go", "example.com/shop", MAIN_SOURCE},
                                 {"store/store.go", "example.com/shop/store", STORE_SOURCE}});
        resolution = resolve_sources(project);
    }

    const std::vector<CallSite> &sites(const std::string &identity) {
        auto it = resolution.find(identity);
        EXPECT_NE(it, resolution.end()) << identity;
        static const std::vector<CallSite> none;
        return it != resolution.end() ? it->second : none;
    }

    const FunctionDescriptor *fn(const std::string &identity) {
        return project.registry.find(identity);
    }

    MemoryProject project;
    Resolution resolution;
};

TEST_F(ResolverTest, EveryFunctionGetsAnEntry) {
    EXPECT_EQ(resolution.size(), project.registry.size());
}

TEST_F(ResolverTest, FunctionWithoutCallsHasNoSites) {
    EXPECT_TRUE(sites("main.empty").empty());
    EXPECT_TRUE(sites("main.Foo").empty());
}

TEST_F(ResolverTest, BareIdentifierResolvesToLocalFunction) {
    const auto &calls = sites("main.simple");
    ASSERT_EQ(calls.size(), 2u);

    auto first = std::get_if<LocalCall>(&calls[0].target);
    auto second = std::get_if<LocalCall>(&calls[1].target);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(first->function, fn("main.Foo"));
    EXPECT_EQ(second->function, fn("main.Bar"));
    EXPECT_EQ(calls[0].expression, "Foo()");
}

TEST_F(ResolverTest, ReceiverCallIsMethodCall) {
    const auto &calls = sites("main/MyStruct.method");
    ASSERT_EQ(calls.size(), 2u);

    auto method = std::get_if<MethodCall>(&calls[0].target);
    ASSERT_NE(method, nullptr);
    EXPECT_EQ(method->receiver, "s");
    EXPECT_EQ(method->method, "DoSomething");

    auto unknown = std::get_if<ExternalCall>(&calls[1].target);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->name, "DoAnotherThing");
    EXPECT_EQ(unknown->origin, ExternalOrigin::Unknown);
    EXPECT_TRUE(unknown->import_path.empty());
}

TEST_F(ResolverTest, NestedCallsBelongToTheirOuterCall) {
    const auto &calls = sites("main.nested");
    ASSERT_EQ(calls.size(), 2u);

    const CallSite &process = calls[0];
    auto outer = std::get_if<LocalCall>(&process.target);
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(outer->function, fn("main.Process"));
    EXPECT_EQ(process.arguments, (std::vector<std::string>{"GetData()", "Compute(42)"}));

    ASSERT_EQ(process.nested.size(), 2u);
    auto inner1 = std::get_if<LocalCall>(&process.nested[0].target);
    auto inner2 = std::get_if<LocalCall>(&process.nested[1].target);
    ASSERT_NE(inner1, nullptr);
    ASSERT_NE(inner2, nullptr);
    EXPECT_EQ(inner1->function, fn("main.GetData"));
    EXPECT_EQ(inner2->function, fn("main.Compute"));
    EXPECT_TRUE(process.nested[0].arguments.empty());
    EXPECT_EQ(process.nested[1].arguments, std::vector<std::string>{"42"});

    auto print = std::get_if<LocalCall>(&calls[1].target);
    ASSERT_NE(print, nullptr);
    EXPECT_EQ(print->function, fn("main.Print"));
    EXPECT_TRUE(calls[1].nested.empty());
}

TEST_F(ResolverTest, ImportedPackageCallIsExternalNeverMethod) {
    const auto &calls = sites("main.withPackages");
    ASSERT_EQ(calls.size(), 2u);

    auto println = std::get_if<ExternalCall>(&calls[0].target);
    ASSERT_NE(println, nullptr);
    EXPECT_EQ(println->name, "Println");
    EXPECT_EQ(println->alias, "fmt");
    EXPECT_EQ(println->import_path, "fmt");
    EXPECT_EQ(println->origin, ExternalOrigin::Import);

    auto abs = std::get_if<ExternalCall>(&calls[1].target);
    ASSERT_NE(abs, nullptr);
    EXPECT_EQ(abs->name, "Abs");
    EXPECT_EQ(abs->import_path, "math");
}

TEST_F(ResolverTest, FieldChainReceiverKeptAsText) {
    const auto &calls = sites("main/Controller.Handle");
    ASSERT_EQ(calls.size(), 1u);

    auto method = std::get_if<MethodCall>(&calls[0].target);
    ASSERT_NE(method, nullptr);
    EXPECT_EQ(method->receiver, "c.Service");
    EXPECT_EQ(method->method, "Execute");
}

TEST_F(ResolverTest, CallChainRecordedOnce) {
    const auto &calls = sites("main.chained");
    ASSERT_EQ(calls.size(), 1u);

    auto method = std::get_if<MethodCall>(&calls[0].target);
    ASSERT_NE(method, nullptr);
    EXPECT_EQ(method->receiver, "obj.Method().AnotherMethod()");
    EXPECT_EQ(method->method, "FinalMethod");
    EXPECT_TRUE(calls[0].nested.empty());
}

TEST_F(ResolverTest, InvokedLiteralScansItsBody) {
    const auto &calls = sites("main.anonymous");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<LiteralInvocation>(calls[0].target));

    ASSERT_EQ(calls[0].nested.size(), 1u);
    auto inner = std::get_if<LocalCall>(&calls[0].nested[0].target);
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->function, fn("main.InnerFunc"));

    auto callees = internal_callees(calls);
    ASSERT_EQ(callees.size(), 1u);
    EXPECT_EQ(callees[0], fn("main.InnerFunc"));
}

TEST_F(ResolverTest, VariadicArgumentsKeptInOrder) {
    const auto &calls = sites("main.variadic");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].arguments,
              (std::vector<std::string>{"\"Error:\"", "\"Something went wrong\"", "\"Code:\"",
                                        "500"}));
    EXPECT_TRUE(calls[0].nested.empty());
}

TEST_F(ResolverTest, DeferAndGoAreOrdinaryCallSites) {
    const auto *concurrency = fn("main.concurrency");
    ASSERT_NE(concurrency, nullptr);

    const auto &calls = sites("main.concurrency");
    ASSERT_EQ(calls.size(), 2u);

    auto cleanup = std::get_if<LocalCall>(&calls[0].target);
    ASSERT_NE(cleanup, nullptr);
    EXPECT_EQ(cleanup->function, fn("main.Cleanup"));
    EXPECT_EQ(calls[0].mode, InvocationMode::Deferred);
    EXPECT_EQ(calls[0].line, concurrency->start_line + 1);

    auto task = std::get_if<LocalCall>(&calls[1].target);
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->function, fn("main.RunTask"));
    EXPECT_EQ(calls[1].mode, InvocationMode::Goroutine);
    EXPECT_EQ(calls[1].line, concurrency->start_line + 2);
}

TEST_F(ResolverTest, ModuleImportsResolveAcrossPackages) {
    const auto &calls = sites("main.crossModule");
    ASSERT_EQ(calls.size(), 2u);

    auto save = std::get_if<CrossModuleCall>(&calls[0].target);
    ASSERT_NE(save, nullptr);
    EXPECT_EQ(save->function, fn("store.Save"));
    EXPECT_EQ(save->import_path, "example.com/shop/store");

    auto vanish = std::get_if<ExternalCall>(&calls[1].target);
    ASSERT_NE(vanish, nullptr);
    EXPECT_EQ(vanish->origin, ExternalOrigin::Missing);
    EXPECT_EQ(vanish->import_path, "example.com/shop/ghost");
    EXPECT_EQ(vanish->name, "Vanish");
}

TEST_F(ResolverTest, LocalLookupUsesTheCallersPackage) {
    const auto &calls = sites("store.Save");
    ASSERT_EQ(calls.size(), 1u);

    auto flush = std::get_if<LocalCall>(&calls[0].target);
    ASSERT_NE(flush, nullptr);
    EXPECT_EQ(flush->function, fn("store.flush"));
}

TEST_F(ResolverTest, BuiltinsAreNotRecordedButTheirArgumentsAre) {
    const auto &calls = sites("main.builtins");
    ASSERT_EQ(calls.size(), 2u);

    auto compute = std::get_if<LocalCall>(&calls[0].target);
    ASSERT_NE(compute, nullptr);
    EXPECT_EQ(compute->function, fn("main.Compute"));

    auto data = std::get_if<LocalCall>(&calls[1].target);
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->function, fn("main.GetData"));
}

TEST_F(ResolverTest, ParenthesizedCalleeIsUnwrapped) {
    const auto &calls = sites("main.parenthesized");
    ASSERT_EQ(calls.size(), 1u);

    auto foo = std::get_if<LocalCall>(&calls[0].target);
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(foo->function, fn("main.Foo"));
}

TEST_F(ResolverTest, ExternalReferencesAreDeduplicated) {
    std::vector<CallSite> combined = sites("main.withPackages");
    const auto &again = sites("main.withPackages");
    combined.insert(combined.end(), again.begin(), again.end());

    auto externals = external_references(combined);
    ASSERT_EQ(externals.size(), 2u);
    EXPECT_EQ(externals[0].name, "Println");
    EXPECT_EQ(externals[1].name, "Abs");
}

TEST_F(ResolverTest, UnlocatableFunctionsGetEmptySites) {
    CallResolver resolver(project.registry, project.imports, 1);
    Resolution out;

    // Source changed since indexing: no declaration is where the registry expects it
    resolver.resolve_source("store/store.go", "package store\n\n\n\n\n\nfunc other() {}\n", out);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out.at("store.Save").empty());
    EXPECT_TRUE(out.at("store.flush").empty());
    EXPECT_EQ(resolver.stats().functions_skipped.load(), 2u);
}

TEST_F(ResolverTest, SyntaxErrorOnReparseSkipsFile) {
    CallResolver resolver(project.registry, project.imports, 1);
    Resolution out;

    resolver.resolve_source("store/store.go", "package store\n\nfunc Save( {\n", out);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out.at("store.Save").empty());
    EXPECT_EQ(resolver.stats().functions_resolved.load(), 0u);
}

TEST(ResolverHelpers, BuiltinNames) {
    EXPECT_TRUE(is_builtin("len"));
    EXPECT_TRUE(is_builtin("append"));
    EXPECT_TRUE(is_builtin("int64"));
    EXPECT_FALSE(is_builtin("Println"));
    EXPECT_FALSE(is_builtin("Compute"));
}

TEST(ResolverShadowing, PackageFunctionShadowsBuiltin) {
    MemoryProject project = index_sources(
        "example.com/calc", {{"calc/calc.go", "example.com/calc/calc", R"(package calc

func max(a, b int) int {
	if a > b {
		return a
	}
	return b
}

func F() int {
	return max(1, len("ab"))
}
)"},
                             {"other/other.go", "example.com/calc/other", R"(package other

func G() int {
	return max(1, 2)
}
)"}});
    Resolution resolution = resolve_sources(project);

    const auto &calls = resolution.at("calc.F");
    ASSERT_EQ(calls.size(), 1u);
    auto local = std::get_if<LocalCall>(&calls[0].target);
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->function, project.registry.find("calc.max"));
    EXPECT_TRUE(calls[0].nested.empty());

    // Without its own declaration, max stays the predeclared one
    EXPECT_TRUE(resolution.at("other.G").empty());
}
