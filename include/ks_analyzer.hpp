#pragma once

#include "ks_ast.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel {

// Single forward pass over a Program. Rejects redeclarations, reads of
// uninitialized or moved bindings and conflicting borrows. On success the
// AST is annotated with binding ids and Program::analyzed is set; on failure
// an AnalysisError carrying every diagnostic found is thrown.
class StaticAnalyzer {
public:
    void analyze(Program& program);

    const std::vector<Diagnostic>& diagnostics() const { return errors_; }

private:
    enum class InitState : uint8_t {
        Moved,
        Uninitialized,
        Initialized,
    };

    struct Symbol {
        std::string name;
        SourceLocation declared_at;
        size_t scope_token{0};     // scope instance the symbol lives in
        size_t function_depth{0};  // nesting of function bodies at declaration
        bool is_global{false};
        bool hoisted{false};       // global function, callable before its declaration
        bool captured{false};      // read from a nested function body
    };

    struct Scope {
        std::unordered_map<std::string, BindingId> names;
        size_t token{0};
    };

    // Definite-initialization lattice state on one control path.
    struct FlowState {
        bool reachable{true};
        std::vector<InitState> states;  // indexed by BindingId

        bool operator==(const FlowState&) const = default;
    };

    struct Borrow {
        BindingId target{kUnresolved};
        BindingId holder{kUnresolved};  // binding the borrow is stored in, if any
        bool exclusive{false};
        size_t extent{0};               // released when this extent ends
        SourceLocation loc;
    };

    // Globals a hoisted function reads and the hoisted functions it refers to.
    struct FunctionSummary {
        std::vector<BindingId> reads;
        std::vector<BindingId> calls;
    };

    // A hoisted function named where it may run before its declaration
    // point. Checked against the function's summary once every body is seen.
    struct PendingReference {
        BindingId function{kUnresolved};
        FlowState state;
        SourceLocation loc;
    };

    struct LoopContext {
        std::vector<FlowState> break_states;
        std::vector<FlowState> continue_states;
    };

    std::vector<Symbol> symbols_;
    std::vector<Scope> scopes_;
    FlowState state_;
    std::vector<Borrow> borrows_;
    std::vector<LoopContext> loops_;
    std::vector<Diagnostic> errors_;
    std::unordered_map<BindingId, FunctionSummary> summaries_;
    std::vector<PendingReference> pending_references_;
    BindingId current_global_function_{kUnresolved};
    size_t function_depth_{0};
    size_t next_extent_{1};
    int suppress_depth_{0};

    // Scopes and symbols
    void enter_scope();
    void exit_scope();
    BindingId declare_symbol(const std::string& name, SourceLocation loc, InitState initial);
    BindingId lookup_symbol(const std::string& name) const;
    bool at_global_scope() const { return scopes_.size() == 1; }
    void hoist_functions(const std::vector<StmtPtr>& statements);

    // Flow state
    InitState state_of(BindingId id) const;
    void set_state(BindingId id, InitState state);
    static FlowState meet(const FlowState& a, const FlowState& b);
    static void truncate(FlowState& state, size_t symbol_count);

    // Accesses
    void use_binding(BindingId id, const std::string& name, SourceLocation loc);
    void move_binding(BindingId id, const std::string& name, SourceLocation loc);
    void assign_binding(BindingId id, const std::string& name, SourceLocation loc);
    void begin_borrow(BindingId target, const std::string& name, bool exclusive,
                      size_t extent, BindingId holder, SourceLocation loc);
    void release_extent(size_t extent);
    void release_held_by(BindingId holder);
    bool is_borrowed(BindingId id) const;
    void note_reference(BindingId id, SourceLocation loc);
    std::vector<BindingId> global_reads_of(BindingId function) const;
    void check_pending_references();
    size_t new_extent() { return next_extent_++; }

    // Statements
    void check_stmt(Stmt* stmt);
    void check_block(BlockStmt* stmt);
    void check_statements(std::vector<StmtPtr>& statements);
    void check_let(LetStmt* stmt);
    void check_set(SetStmt* stmt);
    void check_if(IfStmt* stmt);
    void check_cond(CondStmt* stmt);
    void check_while(WhileStmt* stmt);
    void check_for(ForStmt* stmt);
    void check_forever(ForeverStmt* stmt);
    void check_disown(DisownStmt* stmt);
    void check_func_decl(FuncDeclStmt* stmt);
    void check_function_body(FunctionDecl& function);
    void declare_pattern(Pattern* pattern);

    // Loop fixed point. body_pass analyzes one iteration starting at state_
    // and stores the state of the path leaving through the loop test, if any.
    template<typename BodyPass>
    FlowState analyze_loop(BodyPass&& body_pass);

    // Expressions
    void check_expr(Expr* expr);
    BindingId resolve(IdentifierExpr* expr);
    void check_identifier(IdentifierExpr* expr);
    void check_call(CallExpr* expr);
    std::optional<size_t> check_borrow(BorrowExpr* expr, size_t extent, BindingId holder);
    void check_move(MoveExpr* expr);
    // Value stored into a binding. A direct borrow stays live for extent.
    std::optional<size_t> check_bound_value(Expr* value, size_t extent);

    void error(ErrorKind kind, const std::string& message, SourceLocation loc,
               const std::string& context = {});
    void throw_if_errors();
};

} // namespace kestrel
