#pragma once

#include "ks_diagnostics.hpp"
#include "ks_value.hpp"
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kestrel {

// Identity of one declaration, assigned by the StaticAnalyzer.
using BindingId = uint32_t;
inline constexpr BindingId kUnresolved = std::numeric_limits<BindingId>::max();

struct Resolution {
    BindingId binding{kUnresolved};
    bool is_global{false};

    bool resolved() const { return binding != kUnresolved; }
};

// ---- Forward declarations ----
struct Expr;
struct Stmt;
struct Pattern;
struct BlockStmt;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using PatternPtr = std::unique_ptr<Pattern>;

// ============================================================
//  Patterns
// ============================================================

enum class PatternKind {
    Literal,      // 1, "text", true, nil
    Wildcard,     // _
    Binding,      // name
    Destructure,  // {field: pattern, ...}
};

struct FieldPattern {
    std::string field;
    PatternPtr pattern;
};

struct Pattern {
    PatternKind kind{PatternKind::Wildcard};
    SourceLocation loc;
    Value literal;                             // Literal (scalars)
    std::optional<std::string> string_literal; // Literal (strings)
    std::string name;                          // Binding
    BindingId binding{kUnresolved};            // Binding, set by the analyzer
    std::vector<FieldPattern> fields;          // Destructure

    // Matches every value without testing it.
    bool is_irrefutable() const {
        return kind == PatternKind::Wildcard || kind == PatternKind::Binding;
    }
};

// ============================================================
//  Functions
// ============================================================

// One parameter-pattern alternative of a function declaration.
struct FunctionClause {
    std::vector<PatternPtr> params;
    std::vector<StmtPtr> body;
    SourceLocation loc;
};

struct FunctionDecl {
    std::string name;
    bool is_proc{true};
    std::vector<FunctionClause> clauses;
};

// ============================================================
//  Expressions
// ============================================================

enum class ExprKind {
    Literal,
    Identifier,
    Unary,
    Binary,
    Call,
    Field,
    Index,
    Record,
    Array,
    Lambda,
    Borrow,  // &x, &mut x
    Move,    // move x
    Deref,   // *x
};

enum class UnaryOp {
    Negate,
    Not,
    BitwiseNot,
};

enum class BinaryOp {
    Add,
    Subtract,
    Multiply,
    Divide,
    Modulo,
    BitwiseAnd,
    BitwiseOr,
    BitwiseXor,
    ShiftLeft,
    ShiftRight,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    LogicAnd,
    LogicOr,
};

struct Expr {
    ExprKind kind;
    SourceLocation loc;
    virtual ~Expr() = default;
protected:
    explicit Expr(ExprKind k) : kind(k) {}
};

struct LiteralExpr : Expr {
    Value value;
    std::optional<std::string> string_value;
    LiteralExpr() : Expr(ExprKind::Literal) {}
    explicit LiteralExpr(Value v) : Expr(ExprKind::Literal), value(v) {}
    explicit LiteralExpr(std::string s)
        : Expr(ExprKind::Literal), value(Value::nil()), string_value(std::move(s)) {}
};

struct IdentifierExpr : Expr {
    std::string name;
    Resolution resolved;
    IdentifierExpr() : Expr(ExprKind::Identifier) {}
    explicit IdentifierExpr(std::string n) : Expr(ExprKind::Identifier), name(std::move(n)) {}
};

struct UnaryExpr : Expr {
    UnaryOp op;
    ExprPtr operand;
    UnaryExpr(UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary), op(o), operand(std::move(e)) {}
};

struct BinaryExpr : Expr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
    BinaryExpr(BinaryOp o, ExprPtr l, ExprPtr r)
        : Expr(ExprKind::Binary), op(o), left(std::move(l)), right(std::move(r)) {}
};

struct CallExpr : Expr {
    ExprPtr callee;
    std::vector<ExprPtr> arguments;
    CallExpr() : Expr(ExprKind::Call) {}
};

struct FieldExpr : Expr {
    ExprPtr object;
    std::string field;
    FieldExpr(ExprPtr obj, std::string f)
        : Expr(ExprKind::Field), object(std::move(obj)), field(std::move(f)) {}
};

struct IndexExpr : Expr {
    ExprPtr object;
    ExprPtr index;
    IndexExpr(ExprPtr obj, ExprPtr idx)
        : Expr(ExprKind::Index), object(std::move(obj)), index(std::move(idx)) {}
};

struct RecordExpr : Expr {
    std::vector<std::pair<std::string, ExprPtr>> fields;
    RecordExpr() : Expr(ExprKind::Record) {}
};

struct ArrayExpr : Expr {
    std::vector<ExprPtr> elements;
    ArrayExpr() : Expr(ExprKind::Array) {}
};

struct LambdaExpr : Expr {
    FunctionDecl function;
    LambdaExpr() : Expr(ExprKind::Lambda) {}
};

struct BorrowExpr : Expr {
    ExprPtr target;
    bool exclusive{false};
    BorrowExpr(ExprPtr t, bool excl)
        : Expr(ExprKind::Borrow), target(std::move(t)), exclusive(excl) {}
};

// Ownership transfer out of a binding. The binding is Moved afterwards.
struct MoveExpr : Expr {
    std::unique_ptr<IdentifierExpr> target;
    explicit MoveExpr(std::unique_ptr<IdentifierExpr> t)
        : Expr(ExprKind::Move), target(std::move(t)) {}
};

struct DerefExpr : Expr {
    ExprPtr operand;
    explicit DerefExpr(ExprPtr e) : Expr(ExprKind::Deref), operand(std::move(e)) {}
};

// ============================================================
//  Statements
// ============================================================

enum class StmtKind {
    Let,
    Set,
    SetField,
    SetIndex,
    Expression,
    Print,
    Block,
    If,
    Cond,
    While,
    For,
    Forever,
    Break,
    Continue,
    Return,
    Disown,
    FuncDecl,
};

struct Stmt {
    StmtKind kind;
    SourceLocation loc;
    virtual ~Stmt() = default;
protected:
    explicit Stmt(StmtKind k) : kind(k) {}
};

// let name [= initializer]
struct LetStmt : Stmt {
    std::string name;
    ExprPtr initializer;  // nullptr: declared but uninitialized
    BindingId binding{kUnresolved};
    bool is_global{false};
    LetStmt() : Stmt(StmtKind::Let) {}
};

// set name = value
struct SetStmt : Stmt {
    std::string name;
    ExprPtr value;
    Resolution resolved;
    SetStmt() : Stmt(StmtKind::Set) {}
};

struct SetFieldStmt : Stmt {
    ExprPtr object;
    std::string field;
    ExprPtr value;
    SetFieldStmt() : Stmt(StmtKind::SetField) {}
};

struct SetIndexStmt : Stmt {
    ExprPtr object;
    ExprPtr index;
    ExprPtr value;
    SetIndexStmt() : Stmt(StmtKind::SetIndex) {}
};

struct ExprStmt : Stmt {
    ExprPtr expression;
    ExprStmt() : Stmt(StmtKind::Expression) {}
    explicit ExprStmt(ExprPtr e) : Stmt(StmtKind::Expression), expression(std::move(e)) {}
};

struct PrintStmt : Stmt {
    ExprPtr expression;
    PrintStmt() : Stmt(StmtKind::Print) {}
    explicit PrintStmt(ExprPtr e) : Stmt(StmtKind::Print), expression(std::move(e)) {}
};

struct BlockStmt : Stmt {
    std::vector<StmtPtr> statements;
    BlockStmt() : Stmt(StmtKind::Block) {}
};

struct IfStmt : Stmt {
    ExprPtr condition;
    StmtPtr then_branch;
    StmtPtr else_branch;  // nullptr if absent
    IfStmt() : Stmt(StmtKind::If) {}
};

// pattern [if guard] => body. A guard-only arm has no pattern.
struct CondArm {
    PatternPtr pattern;
    ExprPtr guard;
    std::unique_ptr<BlockStmt> body;
    SourceLocation loc;

    bool is_irrefutable() const {
        return guard == nullptr && (pattern == nullptr || pattern->is_irrefutable());
    }
};

// cond [scrutinee]: arms tested in order, first match wins.
struct CondStmt : Stmt {
    ExprPtr scrutinee;  // nullptr: guard-only cond
    std::vector<CondArm> arms;
    CondStmt() : Stmt(StmtKind::Cond) {}
};

struct WhileStmt : Stmt {
    ExprPtr condition;
    StmtPtr body;
    WhileStmt() : Stmt(StmtKind::While) {}
};

// for variable in start..end (half-open, integers)
struct ForStmt : Stmt {
    std::string variable;
    BindingId binding{kUnresolved};
    ExprPtr start;
    ExprPtr end;
    StmtPtr body;
    ForStmt() : Stmt(StmtKind::For) {}
};

struct ForeverStmt : Stmt {
    StmtPtr body;
    ForeverStmt() : Stmt(StmtKind::Forever) {}
};

struct BreakStmt : Stmt {
    BreakStmt() : Stmt(StmtKind::Break) {}
};

struct ContinueStmt : Stmt {
    ContinueStmt() : Stmt(StmtKind::Continue) {}
};

struct ReturnStmt : Stmt {
    ExprPtr value;  // nullptr: returns nil
    ReturnStmt() : Stmt(StmtKind::Return) {}
};

// disown name: releases ownership; the binding becomes Moved.
struct DisownStmt : Stmt {
    std::string name;
    Resolution resolved;
    DisownStmt() : Stmt(StmtKind::Disown) {}
};

struct FuncDeclStmt : Stmt {
    FunctionDecl function;
    BindingId binding{kUnresolved};
    bool is_global{false};
    FuncDeclStmt() : Stmt(StmtKind::FuncDecl) {}
};

// Root of one compilation unit as delivered by the parser.
struct Program {
    std::vector<StmtPtr> statements;
    bool analyzed{false};        // set by StaticAnalyzer::analyze only
    uint32_t binding_count{0};   // number of BindingIds handed out
};

} // namespace kestrel
