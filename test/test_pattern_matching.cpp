#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace kestrel;
using namespace kestrel::test;

// ============================================================================
// cond on a scrutinee
// ============================================================================

TEST(PatternMatchingTests, LiteralArms) {
    auto p = program(
        func("describe", {"n"}, body(
            cond(ident("n"),
                arm(p_int(0), nullptr, ret(str("zero"))),
                arm(p_int(1), nullptr, ret(str("one"))),
                arm(p_wild(), nullptr, ret(str("many")))))),
        print(call("describe", int_lit(0))),
        print(call("describe", int_lit(1))),
        print(call("describe", int_lit(5))));
    EXPECT_EQ(run_output(p), "zero\none\nmany\n");
}

TEST(PatternMatchingTests, FirstMatchingArmWins) {
    auto p = program(
        cond(int_lit(1),
            arm(p_int(1), nullptr, print(str("first"))),
            arm(p_int(1), nullptr, print(str("second"))),
            arm(p_wild(), nullptr, print(str("third")))));
    EXPECT_EQ(run_output(p), "first\n");
}

TEST(PatternMatchingTests, BindingPatternNamesTheValue) {
    auto p = program(
        cond(int_lit(41),
            arm(p_bind("n"), nullptr, print(add(ident("n"), int_lit(1))))));
    EXPECT_EQ(run_output(p), "42\n");
}

TEST(PatternMatchingTests, GuardsFallThroughToLaterArms) {
    auto p = program(
        func("classify", {"n"}, body(
            cond(ident("n"),
                arm(p_bind("x"), less(ident("x"), int_lit(0)), ret(str("negative"))),
                arm(p_int(0), nullptr, ret(str("zero"))),
                arm(p_wild(), nullptr, ret(str("positive")))))),
        print(call("classify", int_lit(-5))),
        print(call("classify", int_lit(0))),
        print(call("classify", int_lit(7))));
    EXPECT_EQ(run_output(p), "negative\nzero\npositive\n");
}

TEST(PatternMatchingTests, NoArmMatches) {
    auto p = program(
        cond(at(int_lit(3), 4),
            arm(p_int(1), nullptr, print(str("one"))),
            arm(p_int(2), nullptr, print(str("two")))));
    Diagnostic diag = expect_runtime_error(p);
    EXPECT_EQ(diag.kind, ErrorKind::NoMatchingArm);
}

TEST(PatternMatchingTests, GuardOnlyCond) {
    auto p = program(
        let("x", int_lit(5)),
        cond(nullptr,
            arm(nullptr, less(ident("x"), int_lit(3)), print(str("small"))),
            arm(nullptr, less(int_lit(3), ident("x")), print(str("big")))));
    EXPECT_EQ(run_output(p), "big\n");

    auto none = program(
        let("x", int_lit(3)),
        cond(nullptr,
            arm(nullptr, less(ident("x"), int_lit(3)), print(str("small"))),
            arm(nullptr, less(int_lit(3), ident("x")), print(str("big")))));
    EXPECT_EQ(expect_runtime_error(none).kind, ErrorKind::NoMatchingArm);
}

TEST(PatternMatchingTests, GuardOnlyCondWithDefault) {
    auto p = program(
        cond(nullptr,
            arm(nullptr, bool_lit(false), print(str("never"))),
            arm(nullptr, nullptr, print(str("otherwise")))));
    EXPECT_EQ(run_output(p), "otherwise\n");
}

TEST(PatternMatchingTests, RecordDestructuring) {
    auto p = program(
        let("pt", record("x", int_lit(1), "y", int_lit(2))),
        cond(ident("pt"),
            arm(p_record("x", p_int(0), "y", p_bind("y")), nullptr, print(str("on axis"))),
            arm(p_record("y", p_bind("b"), "x", p_bind("a")), nullptr,
                print(add(ident("a"), mul(ident("b"), int_lit(10)))))));
    EXPECT_EQ(run_output(p), "21\n");
}

TEST(PatternMatchingTests, MissingFieldDoesNotMatch) {
    auto p = program(
        cond(record("x", int_lit(1)),
            arm(p_record("z", p_wild()), nullptr, print(str("has z"))),
            arm(p_wild(), nullptr, print(str("other")))));
    EXPECT_EQ(run_output(p), "other\n");
}

TEST(PatternMatchingTests, DestructuringNonRecordDoesNotMatch) {
    auto p = program(
        cond(int_lit(1),
            arm(p_record("x", p_wild()), nullptr, print(str("record"))),
            arm(p_wild(), nullptr, print(str("scalar")))));
    EXPECT_EQ(run_output(p), "scalar\n");
}

TEST(PatternMatchingTests, StringPatterns) {
    auto p = program(
        func("greet", {"s"}, body(
            cond(ident("s"),
                arm(p_str("hi"), nullptr, ret(str("hello"))),
                arm(p_str("bye"), nullptr, ret(str("goodbye"))),
                arm(p_wild(), nullptr, ret(str("?")))))),
        print(call("greet", str("hi"))),
        print(call("greet", str("bye"))),
        print(call("greet", int_lit(1))));
    EXPECT_EQ(run_output(p), "hello\ngoodbye\n?\n");
}

TEST(PatternMatchingTests, ArmBindingCapturedByClosure) {
    auto p = program(
        cond(int_lit(5),
            arm(p_bind("n"), nullptr,
                let("f", lambda({}, body(ret(ident("n"))))),
                print(call("f")))));
    EXPECT_EQ(run_output(p), "5\n");
}

TEST(PatternMatchingTests, BreakFromArmInsideLoop) {
    auto p = program(
        for_("i", int_lit(0), int_lit(10), block(
            cond(ident("i"),
                arm(p_int(3), nullptr, brk()),
                arm(p_wild(), nullptr, print(ident("i")))))),
        print(str("done")));
    EXPECT_EQ(run_output(p), "0\n1\n2\ndone\n");
}

// ============================================================================
// Multi-clause functions
// ============================================================================

TEST(PatternMatchingTests, ClausesDispatchOnLiterals) {
    auto p = program(
        func_clauses("fib",
            clause(params(p_int(0)), body(ret(int_lit(0)))),
            clause(params(p_int(1)), body(ret(int_lit(1)))),
            clause(named({"n"}), body(ret(add(
                call("fib", sub(ident("n"), int_lit(1))),
                call("fib", sub(ident("n"), int_lit(2)))))))),
        print(call("fib", int_lit(10))));
    EXPECT_EQ(run_output(p), "55\n");
}

TEST(PatternMatchingTests, ClausesDispatchOnArity) {
    auto p = program(
        func_clauses("area",
            clause(named({"r"}), body(ret(mul(ident("r"), ident("r"))))),
            clause(named({"w", "h"}), body(ret(mul(ident("w"), ident("h")))))),
        print(call("area", int_lit(3))),
        print(call("area", int_lit(2), int_lit(5))));
    EXPECT_EQ(run_output(p), "9\n10\n");
}

TEST(PatternMatchingTests, NoClauseAccepts) {
    auto p = program(
        func_clauses("area",
            clause(named({"r"}), body(ret(mul(ident("r"), ident("r"))))),
            clause(named({"w", "h"}), body(ret(mul(ident("w"), ident("h")))))),
        print(call("area", int_lit(1), int_lit(2), int_lit(3))));
    Diagnostic diag = expect_runtime_error(p);
    EXPECT_EQ(diag.kind, ErrorKind::NoMatchingOverload);
    EXPECT_EQ(diag.context, "area");
    ASSERT_FALSE(diag.frames.empty());
    EXPECT_EQ(diag.frames[0].function, "area");
}

TEST(PatternMatchingTests, DestructuringParameter) {
    auto p = program(
        func_clauses("sum_xy",
            clause(params(p_record("x", p_bind("a"), "y", p_bind("b"))),
                   body(ret(add(ident("a"), ident("b")))))),
        print(call("sum_xy", record("y", int_lit(4), "x", int_lit(3)))));
    EXPECT_EQ(run_output(p), "7\n");

    auto mismatch = program(
        func_clauses("sum_xy",
            clause(params(p_record("x", p_bind("a"), "y", p_bind("b"))),
                   body(ret(add(ident("a"), ident("b")))))),
        print(call("sum_xy", int_lit(3))));
    EXPECT_EQ(expect_runtime_error(mismatch).kind, ErrorKind::NoMatchingOverload);
}

TEST(PatternMatchingTests, MixedNamedAndPatternParameters) {
    auto p = program(
        func_clauses("scale",
            clause(params(p_int(0), p_bind("v")), body(ret(int_lit(0)))),
            clause(params(p_bind("k"), p_record("v", p_bind("v"))),
                   body(ret(mul(ident("k"), ident("v")))))),
        print(call("scale", int_lit(0), int_lit(99))),
        print(call("scale", int_lit(3), record("v", int_lit(4)))));
    EXPECT_EQ(run_output(p), "0\n12\n");
}
