#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "ks_verifier.hpp"

#include <sstream>

using namespace kestrel;
using namespace kestrel::test;

namespace {

OpCode last_op(const Chunk& chunk, size_t length = 1) {
    return static_cast<OpCode>(chunk.code[chunk.code.size() - length]);
}

BytecodeUnit unit_from(std::shared_ptr<Chunk> chunk, size_t max_slots = 0) {
    auto proto = std::make_shared<FunctionPrototype>();
    proto->name = "<script>";
    proto->chunk = std::move(chunk);
    proto->max_slots = max_slots;
    BytecodeUnit unit;
    unit.script = std::move(proto);
    return unit;
}

ErrorKind verify_kind(const BytecodeUnit& unit) {
    try {
        verify_unit(unit);
    } catch (const RuntimeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "unit was accepted";
    return ErrorKind::TypeError;
}

} // namespace

// ============================================================================
// Compiler
// ============================================================================

TEST(CompilerTests, RejectsUnanalyzedProgram) {
    auto p = program(print(int_lit(1)));
    Compiler compiler;
    EXPECT_THROW(compiler.compile(p), std::logic_error);
}

TEST(CompilerTests, ScriptEndsWithHalt) {
    auto p = program(print(int_lit(1)));
    BytecodeUnit unit = compile_program(p);
    ASSERT_TRUE(unit.script);
    EXPECT_EQ(unit.format_version, kBytecodeFormatVersion);
    EXPECT_EQ(last_op(*unit.script->chunk), OpCode::OP_HALT);
    EXPECT_EQ(unit.script->chunk->locations.size(), unit.script->chunk->code.size());
}

TEST(CompilerTests, GlobalSlotsAndEntryPoints) {
    auto p = program(
        let("counter", int_lit(0)),
        func("bump", {}, body(set("counter", add(ident("counter"), int_lit(1))))),
        let("limit", int_lit(10)));
    BytecodeUnit unit = compile_program(p);

    ASSERT_EQ(unit.global_names.size(), 3u);
    EXPECT_EQ(unit.find_global("counter"), std::optional<uint16_t>(0));
    EXPECT_EQ(unit.find_global("bump"), std::optional<uint16_t>(1));
    EXPECT_EQ(unit.find_global("limit"), std::optional<uint16_t>(2));
    EXPECT_FALSE(unit.find_global("missing").has_value());

    ASSERT_EQ(unit.entry_points.size(), 1u);
    EXPECT_EQ(unit.entry_points.at("bump"), 1);
}

TEST(CompilerTests, FunctionPrototypeLayout) {
    auto p = program(func("add", {"a", "b"}, body(
        let("sum", add(ident("a"), ident("b"))),
        ret(ident("sum")))));
    BytecodeUnit unit = compile_program(p);

    ASSERT_EQ(unit.script->chunk->functions.size(), 1u);
    const FunctionPrototype& proto = *unit.script->chunk->functions[0];
    EXPECT_EQ(proto.name, "add");
    EXPECT_EQ(proto.max_slots, 3u);
    EXPECT_TRUE(proto.upvalues.empty());
    ASSERT_EQ(proto.chunk->clauses.size(), 1u);
    EXPECT_EQ(proto.chunk->clauses[0].params.size(), 2u);
    EXPECT_EQ(static_cast<OpCode>(proto.chunk->code[0]), OpCode::OP_MATCH_ARGS);
    EXPECT_EQ(last_op(*proto.chunk), OpCode::OP_NO_MATCHING_OVERLOAD);
}

TEST(CompilerTests, CapturedParameterBecomesUpvalue) {
    auto p = program(func("make", {"x"}, body(
        ret(lambda({}, body(ret(ident("x"))))))));
    BytecodeUnit unit = compile_program(p);

    const FunctionPrototype& make = *unit.script->chunk->functions[0];
    ASSERT_EQ(make.chunk->functions.size(), 1u);
    const FunctionPrototype& inner = *make.chunk->functions[0];
    ASSERT_EQ(inner.upvalues.size(), 1u);
    EXPECT_TRUE(inner.upvalues[0].is_local);
    EXPECT_EQ(inner.upvalues[0].index, 0);
}

TEST(CompilerTests, StringsAreInterned) {
    auto p = program(
        print(str("hello")),
        print(str("hello")),
        print(str("world")));
    BytecodeUnit unit = compile_program(p);
    EXPECT_EQ(unit.script->chunk->strings.size(), 2u);
}

TEST(CompilerTests, RecordShapesAreShared) {
    auto p = program(
        print(record("x", int_lit(1), "y", int_lit(2))),
        print(record("x", int_lit(3), "y", int_lit(4))));
    BytecodeUnit unit = compile_program(p);
    EXPECT_EQ(unit.script->chunk->record_shapes.size(), 1u);
}

TEST(CompilerTests, BreakOutsideLoop) {
    auto p = program(at(brk(), 7));
    try {
        compile_program(p);
        FAIL() << "expected CompileError";
    } catch (const CompileError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BreakOutsideLoop);
        EXPECT_EQ(e.diagnostic().location.line, 7u);
    }
}

TEST(CompilerTests, ContinueOutsideLoop) {
    auto p = program(func("f", {}, body(cont())));
    try {
        compile_program(p);
        FAIL() << "expected CompileError";
    } catch (const CompileError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BreakOutsideLoop);
    }
}

TEST(CompilerTests, BreakInsideFunctionInsideLoopIsRejected) {
    auto p = program(
        forever(block(
            let("f", lambda({}, body(brk()))),
            brk())));
    EXPECT_THROW(compile_program(p), CompileError);
}

TEST(CompilerTests, NestingLimit) {
    ExprPtr e = int_lit(1);
    for (int i = 0; i < 400; ++i) {
        e = unary(UnaryOp::Negate, std::move(e));
    }
    auto p = program(print(std::move(e)));
    try {
        compile_program(p);
        FAIL() << "expected CompileError";
    } catch (const CompileError& err) {
        EXPECT_EQ(err.kind(), ErrorKind::LimitExceeded);
    }
}

TEST(CompilerTests, DisassemblyListsNestedFunctions) {
    auto p = program(func("twice", {"n"}, body(ret(mul(ident("n"), int_lit(2))))));
    BytecodeUnit unit = compile_program(p);

    std::ostringstream out;
    unit.script->chunk->disassemble("script", out);
    std::string listing = out.str();
    EXPECT_NE(listing.find("== script =="), std::string::npos);
    EXPECT_NE(listing.find("== twice =="), std::string::npos);
    EXPECT_NE(listing.find("HALT"), std::string::npos);
    EXPECT_NE(listing.find("MULTIPLY"), std::string::npos);
}

// ============================================================================
// Verifier
// ============================================================================

TEST(VerifierTests, AcceptsCompiledUnits) {
    auto p = program(
        let("xs", array(int_lit(1), int_lit(2))),
        for_("i", int_lit(0), int_lit(2), block(print(index_of(ident("xs"), ident("i"))))),
        func("f", {"a"}, body(
            cond(ident("a"),
                arm(p_int(0), nullptr, ret(str("zero"))),
                arm(p_bind("n"), nullptr, ret(lambda({}, body(ret(ident("n"))))))))));
    BytecodeUnit unit = compile_program(p);
    EXPECT_NO_THROW(verify_unit(unit));
}

TEST(VerifierTests, RejectsUnknownFormatVersion) {
    auto p = program(print(int_lit(1)));
    BytecodeUnit unit = compile_program(p);
    unit.format_version = kBytecodeFormatVersion + 1;
    EXPECT_EQ(verify_kind(unit), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsMissingScript) {
    BytecodeUnit unit;
    EXPECT_EQ(verify_kind(unit), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsUnknownOpcode) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write(0xF0, {});
    chunk->write_op(OpCode::OP_HALT, {});
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsTruncatedInstruction) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_NIL, {});
    chunk->write_op(OpCode::OP_CONSTANT, {});
    chunk->write(0, {});
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsFallingOffTheEnd) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_NIL, {});
    chunk->write_op(OpCode::OP_POP, {});
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsConstantOutOfRange) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_CONSTANT, {});
    chunk->write_short(3, {});
    chunk->write_op(OpCode::OP_HALT, {});
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsLocalOutsideFrame) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_GET_LOCAL, {});
    chunk->write_short(2, {});
    chunk->write_op(OpCode::OP_HALT, {});
    EXPECT_EQ(verify_kind(unit_from(chunk, 2)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsJumpIntoInstruction) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_JUMP, {});
    chunk->write_short(1, {});
    chunk->write_op(OpCode::OP_CONSTANT, {});
    chunk->write_short(0, {});
    chunk->write_op(OpCode::OP_HALT, {});
    chunk->add_constant(Value::from_int(1));
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsJumpPastTheEnd) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_JUMP, {});
    chunk->write_short(100, {});
    chunk->write_op(OpCode::OP_HALT, {});
    EXPECT_EQ(verify_kind(unit_from(chunk)), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, RejectsEntryPointWithoutGlobal) {
    auto p = program(print(int_lit(1)));
    BytecodeUnit unit = compile_program(p);
    unit.entry_points["ghost"] = 5;
    EXPECT_EQ(verify_kind(unit), ErrorKind::MalformedBytecode);
}

TEST(VerifierTests, VmRefusesMalformedUnit) {
    auto chunk = std::make_shared<Chunk>();
    chunk->write_op(OpCode::OP_NIL, {});
    VM vm;
    ExecutionResult result = vm.run(unit_from(chunk));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::MalformedBytecode);
}
