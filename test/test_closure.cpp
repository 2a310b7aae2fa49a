#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace kestrel;
using namespace kestrel::test;

namespace {

// func make_counter() { let count = 0; return () => { count = count + 1; return count } }
StmtPtr make_counter_decl() {
    return func("make_counter", {}, body(
        let("count", int_lit(0)),
        ret(lambda({}, body(
            set("count", add(ident("count"), int_lit(1))),
            ret(ident("count")))))));
}

} // namespace

// ============================================================================
// Captured state
// ============================================================================

TEST(ClosureTests, CounterKeepsStateBetweenCalls) {
    auto p = program(
        make_counter_decl(),
        let("c", call("make_counter")),
        print(call("c")),
        print(call("c")),
        print(call("c")));
    EXPECT_EQ(run_output(p), "1\n2\n3\n");
}

TEST(ClosureTests, CountersAreIndependent) {
    auto p = program(
        make_counter_decl(),
        let("a", call("make_counter")),
        let("b", call("make_counter")),
        expr_stmt(call("a")),
        expr_stmt(call("a")),
        print(call("a")),
        print(call("b")));
    EXPECT_EQ(run_output(p), "3\n1\n");
}

TEST(ClosureTests, SiblingClosuresShareCapture) {
    auto p = program(
        func("make_cell", {}, body(
            let("n", int_lit(0)),
            ret(record(
                "inc", lambda({}, body(set("n", add(ident("n"), int_lit(1))))),
                "get", lambda({}, body(ret(ident("n")))))))),
        let("cell", call("make_cell")),
        expr_stmt(call(field(ident("cell"), "inc"))),
        expr_stmt(call(field(ident("cell"), "inc"))),
        print(call(field(ident("cell"), "get"))));
    EXPECT_EQ(run_output(p), "2\n");
}

TEST(ClosureTests, CaptureThroughEnclosingClosure) {
    auto p = program(
        func("outer", {}, body(
            let("x", int_lit(10)),
            let("mid", lambda({}, body(
                let("inner", lambda({}, body(ret(ident("x"))))),
                ret(call("inner"))))),
            ret(call("mid")))),
        print(call("outer")));
    EXPECT_EQ(run_output(p), "10\n");
}

TEST(ClosureTests, CapturedParameterOutlivesCall) {
    auto p = program(
        func("adder", {"k"}, body(ret(lambda({"v"}, body(ret(add(ident("v"), ident("k")))))))),
        let("add5", call("adder", int_lit(5))),
        let("add7", call("adder", int_lit(7))),
        print(call("add5", int_lit(1))),
        print(call("add7", int_lit(1))));
    EXPECT_EQ(run_output(p), "6\n8\n");
}

TEST(ClosureTests, EachLoopIterationCapturesItsOwnVariable) {
    auto p = program(
        let("fs", array(nil_lit(), nil_lit(), nil_lit())),
        for_("i", int_lit(0), int_lit(3), block(
            set_index(ident("fs"), ident("i"), lambda({}, body(ret(ident("i"))))))),
        for_("j", int_lit(0), int_lit(3), block(
            print(call(index_of(ident("fs"), ident("j")))))));
    EXPECT_EQ(run_output(p), "0\n1\n2\n");
}

TEST(ClosureTests, LocalFunctionCanRecurse) {
    auto p = program(
        func("main", {}, body(
            func("fact", {"n"}, body(
                if_(less(ident("n"), int_lit(2)), ret(int_lit(1))),
                ret(mul(ident("n"), call("fact", sub(ident("n"), int_lit(1))))))),
            ret(call("fact", int_lit(5))))),
        print(call("main")));
    EXPECT_EQ(run_output(p), "120\n");
}

TEST(ClosureTests, ClosurePrintsItsName) {
    auto p = program(
        func("named", {}, body()),
        print(ident("named")));
    EXPECT_EQ(run_output(p), "<proc named>\n");
}

// ============================================================================
// Interaction with the collector
// ============================================================================

TEST(ClosureTests, CapturedStateSurvivesStressCollection) {
    auto p = program(
        make_counter_decl(),
        let("c", call("make_counter")),
        print(call("c")),
        print(call("c")),
        print(call("c")));
    GcConfig gc;
    gc.stress = true;
    EXPECT_EQ(run_output(p, VMConfig{}, gc), "1\n2\n3\n");
}

TEST(ClosureTests, EscapedClosureKeepsValueAfterError) {
    auto p = program(
        make_counter_decl(),
        let("c", call("make_counter")),
        func("tick", {}, body(ret(call("c")))),
        expr_stmt(call("tick")),
        print(binary(BinaryOp::Divide, int_lit(1), int_lit(0))));
    BytecodeUnit unit = compile_program(p);
    VM vm;
    std::ostringstream out;
    vm.set_output(out);
    EXPECT_FALSE(vm.run(unit).ok());

    // Globals survive the failed run; the counter resumes where it stopped.
    EXPECT_EQ(vm.call("tick", {}).as_int(), 2);
}
