#pragma once

#include "ks_ast.hpp"
#include "ks_chunk.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel {

// Lowers an analyzed Program to a BytecodeUnit. Throws CompileError for
// control-flow misuse and encoding limits, std::logic_error when handed a
// Program that StaticAnalyzer::analyze has not accepted.
class Compiler {
public:
    BytecodeUnit compile(const Program& program);

private:
    // Global slot assignment shared by the script and every nested function.
    struct GlobalTable {
        std::unordered_map<BindingId, uint16_t> slots;
        std::vector<std::string> names;
        std::unordered_map<std::string, uint16_t> entry_points;
    };

    struct Local {
        std::string name;
        BindingId binding;  // kUnresolved for compiler temporaries
        int depth;
        bool is_captured{false};
    };

    struct Upvalue {
        uint16_t index;
        bool is_local;
    };

    struct LoopContext {
        std::vector<size_t> break_jumps;
        std::vector<size_t> continue_jumps;
        int scope_depth_at_start;
    };

    enum class Access {
        Get,
        Set,
        Move,
    };

    std::shared_ptr<Chunk> chunk_;
    std::vector<Local> locals_;
    std::vector<Upvalue> upvalues_;
    std::vector<LoopContext> loop_stack_;
    GlobalTable* globals_{nullptr};
    Compiler* enclosing_{nullptr};
    int scope_depth_{0};
    int recursion_depth_{0};
    size_t max_locals_{0};

    static constexpr int MAX_RECURSION_DEPTH = 256;
    static constexpr size_t MAX_LOCALS = kMaxOperand;
    static constexpr size_t MAX_UPVALUES = kMaxOperand;

    void assign_global_slots(const std::vector<StmtPtr>& statements);
    uint16_t global_slot(BindingId binding, SourceLocation loc) const;
    void emit_hoisted_functions(const std::vector<StmtPtr>& statements);

    void compile_stmt(Stmt* stmt);
    void compile_expr(Expr* expr);

    void visit(LetStmt* stmt);
    void visit(SetStmt* stmt);
    void visit(SetFieldStmt* stmt);
    void visit(SetIndexStmt* stmt);
    void visit(BlockStmt* stmt);
    void visit(IfStmt* stmt);
    void visit(CondStmt* stmt);
    void visit(WhileStmt* stmt);
    void visit(ForStmt* stmt);
    void visit(ForeverStmt* stmt);
    void visit(BreakStmt* stmt);
    void visit(ContinueStmt* stmt);
    void visit(ReturnStmt* stmt);
    void visit(DisownStmt* stmt);
    void visit(FuncDeclStmt* stmt);

    void visit(LiteralExpr* expr);
    void visit(UnaryExpr* expr);
    void visit(BinaryExpr* expr);
    void visit(CallExpr* expr);
    void visit(RecordExpr* expr);
    void visit(ArrayExpr* expr);

    void compile_guarded_arms(CondStmt* stmt);
    void compile_pattern_arms(CondStmt* stmt);

    std::shared_ptr<FunctionPrototype> compile_function(const FunctionDecl& decl, SourceLocation loc);
    void compile_clause(const FunctionClause& clause, SourceLocation loc);
    void emit_closure(const FunctionDecl& decl, SourceLocation loc);

    CompiledPattern compile_pattern(const Pattern& pattern);
    static void collect_bindings(const Pattern& pattern, std::vector<const Pattern*>& out);

    // Scopes and variables
    void begin_scope();
    void end_scope();
    void declare_local(const std::string& name, BindingId binding, SourceLocation loc);
    int resolve_local(BindingId binding) const;
    int resolve_upvalue(BindingId binding);
    int add_upvalue(uint16_t index, bool is_local, SourceLocation loc);
    void emit_variable(const Resolution& resolution, Access access, SourceLocation loc);
    void emit_scope_exit(int target_depth, SourceLocation loc);

    // Emission
    void emit_op(OpCode op, SourceLocation loc);
    void emit_short(uint16_t value, SourceLocation loc);
    void emit_op_index(OpCode op, size_t index, SourceLocation loc, const char* what);
    void emit_constant(Value value, SourceLocation loc);
    void emit_string(const std::string& str, SourceLocation loc);
    size_t emit_jump(OpCode op, SourceLocation loc);
    void emit_loop(size_t loop_start, SourceLocation loc);
    void patch_jump(size_t offset, SourceLocation loc);

    [[noreturn]] static void limit_error(const std::string& message, SourceLocation loc);

    class RecursionGuard {
    public:
        RecursionGuard(Compiler& compiler, SourceLocation loc) : compiler_(compiler) {
            if (++compiler_.recursion_depth_ > MAX_RECURSION_DEPTH) {
                --compiler_.recursion_depth_;
                limit_error("maximum nesting depth exceeded", loc);
            }
        }
        ~RecursionGuard() {
            --compiler_.recursion_depth_;
        }
        RecursionGuard(const RecursionGuard&) = delete;
        RecursionGuard& operator=(const RecursionGuard&) = delete;
    private:
        Compiler& compiler_;
    };
};

} // namespace kestrel
