#pragma once

#include "ks_analyzer.hpp"
#include "ks_ast.hpp"
#include "ks_compiler.hpp"
#include "ks_runner.hpp"
#include "ks_vm.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace kestrel {
namespace test {

// ============================================================================
// AST builders. The parser is external, so tests assemble trees directly.
// ============================================================================

// Attach a source location to any node.
template<typename Node>
Node at(Node node, uint32_t line, uint32_t column = 1) {
    node->loc = SourceLocation{line, column};
    return node;
}

template<typename T, typename... Args>
std::vector<std::unique_ptr<T>> list(Args&&... args) {
    std::vector<std::unique_ptr<T>> items;
    items.reserve(sizeof...(args));
    (items.push_back(std::forward<Args>(args)), ...);
    return items;
}

template<typename... Args>
std::vector<StmtPtr> body(Args&&... stmts) {
    return list<Stmt>(std::forward<Args>(stmts)...);
}

// ---- Expressions ----

inline ExprPtr int_lit(Int v) { return std::make_unique<LiteralExpr>(Value::from_int(v)); }
inline ExprPtr float_lit(Float v) { return std::make_unique<LiteralExpr>(Value::from_float(v)); }
inline ExprPtr bool_lit(bool v) { return std::make_unique<LiteralExpr>(Value::from_bool(v)); }
inline ExprPtr nil_lit() { return std::make_unique<LiteralExpr>(Value::nil()); }
inline ExprPtr str(std::string s) { return std::make_unique<LiteralExpr>(std::move(s)); }

inline ExprPtr ident(std::string name) {
    return std::make_unique<IdentifierExpr>(std::move(name));
}

inline ExprPtr unary(UnaryOp op, ExprPtr operand) {
    return std::make_unique<UnaryExpr>(op, std::move(operand));
}

inline ExprPtr binary(BinaryOp op, ExprPtr left, ExprPtr right) {
    return std::make_unique<BinaryExpr>(op, std::move(left), std::move(right));
}

inline ExprPtr add(ExprPtr l, ExprPtr r) { return binary(BinaryOp::Add, std::move(l), std::move(r)); }
inline ExprPtr sub(ExprPtr l, ExprPtr r) { return binary(BinaryOp::Subtract, std::move(l), std::move(r)); }
inline ExprPtr mul(ExprPtr l, ExprPtr r) { return binary(BinaryOp::Multiply, std::move(l), std::move(r)); }
inline ExprPtr less(ExprPtr l, ExprPtr r) { return binary(BinaryOp::Less, std::move(l), std::move(r)); }
inline ExprPtr eq(ExprPtr l, ExprPtr r) { return binary(BinaryOp::Equal, std::move(l), std::move(r)); }

template<typename... Args>
ExprPtr call(ExprPtr callee, Args&&... args) {
    auto expr = std::make_unique<CallExpr>();
    expr->callee = std::move(callee);
    expr->arguments = list<Expr>(std::forward<Args>(args)...);
    return expr;
}

template<typename... Args>
ExprPtr call(const char* name, Args&&... args) {
    return call(ident(name), std::forward<Args>(args)...);
}

inline ExprPtr field(ExprPtr object, std::string name) {
    return std::make_unique<FieldExpr>(std::move(object), std::move(name));
}

inline ExprPtr index_of(ExprPtr object, ExprPtr idx) {
    return std::make_unique<IndexExpr>(std::move(object), std::move(idx));
}

inline void add_fields(RecordExpr&) {}

template<typename... Rest>
void add_fields(RecordExpr& record, std::string name, ExprPtr value, Rest&&... rest) {
    record.fields.emplace_back(std::move(name), std::move(value));
    add_fields(record, std::forward<Rest>(rest)...);
}

// record("x", int_lit(1), "y", int_lit(2))
template<typename... Args>
ExprPtr record(Args&&... fields) {
    auto expr = std::make_unique<RecordExpr>();
    add_fields(*expr, std::forward<Args>(fields)...);
    return expr;
}

template<typename... Args>
ExprPtr array(Args&&... elements) {
    auto expr = std::make_unique<ArrayExpr>();
    expr->elements = list<Expr>(std::forward<Args>(elements)...);
    return expr;
}

inline ExprPtr borrow(std::string name) {
    return std::make_unique<BorrowExpr>(ident(std::move(name)), false);
}

inline ExprPtr borrow_mut(std::string name) {
    return std::make_unique<BorrowExpr>(ident(std::move(name)), true);
}

inline ExprPtr move_of(std::string name) {
    return std::make_unique<MoveExpr>(std::make_unique<IdentifierExpr>(std::move(name)));
}

inline ExprPtr deref(ExprPtr operand) {
    return std::make_unique<DerefExpr>(std::move(operand));
}

// ---- Patterns ----

inline PatternPtr p_wild() {
    return std::make_unique<Pattern>();
}

inline PatternPtr p_bind(std::string name) {
    auto p = std::make_unique<Pattern>();
    p->kind = PatternKind::Binding;
    p->name = std::move(name);
    return p;
}

inline PatternPtr p_lit(Value v) {
    auto p = std::make_unique<Pattern>();
    p->kind = PatternKind::Literal;
    p->literal = v;
    return p;
}

inline PatternPtr p_int(Int v) { return p_lit(Value::from_int(v)); }

inline PatternPtr p_str(std::string s) {
    auto p = std::make_unique<Pattern>();
    p->kind = PatternKind::Literal;
    p->string_literal = std::move(s);
    return p;
}

inline void add_field_patterns(Pattern&) {}

template<typename... Rest>
void add_field_patterns(Pattern& pattern, std::string name, PatternPtr sub, Rest&&... rest) {
    pattern.fields.push_back(FieldPattern{std::move(name), std::move(sub)});
    add_field_patterns(pattern, std::forward<Rest>(rest)...);
}

// p_record("x", p_bind("a"), "y", p_int(0))
template<typename... Args>
PatternPtr p_record(Args&&... fields) {
    auto p = std::make_unique<Pattern>();
    p->kind = PatternKind::Destructure;
    add_field_patterns(*p, std::forward<Args>(fields)...);
    return p;
}

template<typename... Args>
std::vector<PatternPtr> params(Args&&... patterns) {
    return list<Pattern>(std::forward<Args>(patterns)...);
}

// ---- Functions ----

inline FunctionClause clause(std::vector<PatternPtr> parameters, std::vector<StmtPtr> stmts) {
    FunctionClause c;
    c.params = std::move(parameters);
    c.body = std::move(stmts);
    return c;
}

inline std::vector<PatternPtr> named(const std::vector<std::string>& names) {
    std::vector<PatternPtr> result;
    for (const auto& n : names) {
        result.push_back(p_bind(n));
    }
    return result;
}

inline void add_clauses(FunctionDecl&) {}

template<typename... Rest>
void add_clauses(FunctionDecl& decl, FunctionClause c, Rest&&... rest) {
    decl.clauses.push_back(std::move(c));
    add_clauses(decl, std::forward<Rest>(rest)...);
}

// Multi-clause function declaration.
template<typename... Clauses>
StmtPtr func_clauses(std::string name, Clauses&&... clauses) {
    auto stmt = std::make_unique<FuncDeclStmt>();
    stmt->function.name = std::move(name);
    add_clauses(stmt->function, std::forward<Clauses>(clauses)...);
    return stmt;
}

// Single clause, plain named parameters.
inline StmtPtr func(std::string name, const std::vector<std::string>& param_names, std::vector<StmtPtr> stmts) {
    return func_clauses(std::move(name), clause(named(param_names), std::move(stmts)));
}

inline ExprPtr lambda(const std::vector<std::string>& param_names, std::vector<StmtPtr> stmts) {
    auto expr = std::make_unique<LambdaExpr>();
    expr->function.clauses.push_back(clause(named(param_names), std::move(stmts)));
    return expr;
}

// ---- Statements ----

inline StmtPtr let(std::string name, ExprPtr init = nullptr) {
    auto stmt = std::make_unique<LetStmt>();
    stmt->name = std::move(name);
    stmt->initializer = std::move(init);
    return stmt;
}

inline StmtPtr set(std::string name, ExprPtr value) {
    auto stmt = std::make_unique<SetStmt>();
    stmt->name = std::move(name);
    stmt->value = std::move(value);
    return stmt;
}

inline StmtPtr set_field(ExprPtr object, std::string name, ExprPtr value) {
    auto stmt = std::make_unique<SetFieldStmt>();
    stmt->object = std::move(object);
    stmt->field = std::move(name);
    stmt->value = std::move(value);
    return stmt;
}

inline StmtPtr set_index(ExprPtr object, ExprPtr idx, ExprPtr value) {
    auto stmt = std::make_unique<SetIndexStmt>();
    stmt->object = std::move(object);
    stmt->index = std::move(idx);
    stmt->value = std::move(value);
    return stmt;
}

inline StmtPtr expr_stmt(ExprPtr e) { return std::make_unique<ExprStmt>(std::move(e)); }
inline StmtPtr print(ExprPtr e) { return std::make_unique<PrintStmt>(std::move(e)); }

template<typename... Args>
std::unique_ptr<BlockStmt> make_block(Args&&... stmts) {
    auto block = std::make_unique<BlockStmt>();
    block->statements = body(std::forward<Args>(stmts)...);
    return block;
}

template<typename... Args>
StmtPtr block(Args&&... stmts) {
    return make_block(std::forward<Args>(stmts)...);
}

inline StmtPtr if_(ExprPtr condition, StmtPtr then_branch, StmtPtr else_branch = nullptr) {
    auto stmt = std::make_unique<IfStmt>();
    stmt->condition = std::move(condition);
    stmt->then_branch = std::move(then_branch);
    stmt->else_branch = std::move(else_branch);
    return stmt;
}

inline StmtPtr while_(ExprPtr condition, StmtPtr loop_body) {
    auto stmt = std::make_unique<WhileStmt>();
    stmt->condition = std::move(condition);
    stmt->body = std::move(loop_body);
    return stmt;
}

inline StmtPtr for_(std::string variable, ExprPtr start, ExprPtr end, StmtPtr loop_body) {
    auto stmt = std::make_unique<ForStmt>();
    stmt->variable = std::move(variable);
    stmt->start = std::move(start);
    stmt->end = std::move(end);
    stmt->body = std::move(loop_body);
    return stmt;
}

inline StmtPtr forever(StmtPtr loop_body) {
    auto stmt = std::make_unique<ForeverStmt>();
    stmt->body = std::move(loop_body);
    return stmt;
}

inline StmtPtr brk() { return std::make_unique<BreakStmt>(); }
inline StmtPtr cont() { return std::make_unique<ContinueStmt>(); }

inline StmtPtr ret(ExprPtr value = nullptr) {
    auto stmt = std::make_unique<ReturnStmt>();
    stmt->value = std::move(value);
    return stmt;
}

inline StmtPtr disown(std::string name) {
    auto stmt = std::make_unique<DisownStmt>();
    stmt->name = std::move(name);
    return stmt;
}

template<typename... Args>
CondArm arm(PatternPtr pattern, ExprPtr guard, Args&&... stmts) {
    CondArm a;
    a.pattern = std::move(pattern);
    a.guard = std::move(guard);
    a.body = make_block(std::forward<Args>(stmts)...);
    return a;
}

inline void add_arms(CondStmt&) {}

template<typename... Rest>
void add_arms(CondStmt& cond_stmt, CondArm a, Rest&&... rest) {
    cond_stmt.arms.push_back(std::move(a));
    add_arms(cond_stmt, std::forward<Rest>(rest)...);
}

// cond(scrutinee, arm(...), ...). A null scrutinee makes a guard-only cond.
template<typename... Arms>
StmtPtr cond(ExprPtr scrutinee, Arms&&... arms) {
    auto stmt = std::make_unique<CondStmt>();
    stmt->scrutinee = std::move(scrutinee);
    add_arms(*stmt, std::forward<Arms>(arms)...);
    return stmt;
}

template<typename... Args>
Program program(Args&&... stmts) {
    Program p;
    p.statements = body(std::forward<Args>(stmts)...);
    return p;
}

// ============================================================================
// Pipeline helpers
// ============================================================================

inline BytecodeUnit compile_program(Program& p) {
    return Build(p);
}

// Runs the script and returns everything it printed. Errors propagate.
inline std::string run_output(Program& p, VMConfig config = VMConfig{}, GcConfig gc = GcConfig{}) {
    BytecodeUnit unit = Build(p);
    VM vm(config, gc);
    std::ostringstream out;
    vm.set_output(out);
    vm.execute(unit);
    return out.str();
}

// Expects analysis to fail and returns the error.
inline AnalysisError expect_analysis_error(Program& p) {
    try {
        StaticAnalyzer analyzer;
        analyzer.analyze(p);
    } catch (const AnalysisError& e) {
        return e;
    }
    return AnalysisError(std::vector<Diagnostic>{});
}

// Runs the script and returns the runtime diagnostic it ended with.
inline Diagnostic expect_runtime_error(Program& p, VMConfig config = VMConfig{}, GcConfig gc = GcConfig{}) {
    BytecodeUnit unit = Build(p);
    VM vm(config, gc);
    std::ostringstream out;
    vm.set_output(out);
    ExecutionResult result = vm.run(unit);
    if (result.ok()) {
        return Diagnostic{ErrorKind::TypeError, {}, "expected a runtime error", {}, {}};
    }
    return *result.error;
}

} // namespace test
} // namespace kestrel
