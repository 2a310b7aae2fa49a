#include "ks_analyzer.hpp"

#include <algorithm>
#include <unordered_set>

namespace kestrel {

void StaticAnalyzer::analyze(Program& program) {
    symbols_.clear();
    scopes_.clear();
    state_ = FlowState{};
    borrows_.clear();
    loops_.clear();
    errors_.clear();
    summaries_.clear();
    pending_references_.clear();
    current_global_function_ = kUnresolved;
    function_depth_ = 0;
    suppress_depth_ = 0;

    enter_scope();
    hoist_functions(program.statements);
    check_statements(program.statements);
    exit_scope();
    check_pending_references();

    program.binding_count = static_cast<uint32_t>(symbols_.size());
    throw_if_errors();
    program.analyzed = true;
}

// ---- Scopes and symbols ----

void StaticAnalyzer::enter_scope() {
    scopes_.push_back(Scope{{}, new_extent()});
}

void StaticAnalyzer::exit_scope() {
    if (scopes_.empty()) {
        return;
    }
    release_extent(scopes_.back().token);
    scopes_.pop_back();
}

BindingId StaticAnalyzer::declare_symbol(const std::string& name, SourceLocation loc,
                                         InitState initial) {
    Scope& scope = scopes_.back();
    auto existing = scope.names.find(name);
    if (existing != scope.names.end()) {
        error(ErrorKind::DuplicateBinding,
              "'" + name + "' is already declared in this scope", loc, name);
        return existing->second;
    }

    const auto id = static_cast<BindingId>(symbols_.size());
    symbols_.push_back(Symbol{name, loc, scope.token, function_depth_, at_global_scope()});
    scope.names.emplace(name, id);
    set_state(id, initial);
    return id;
}

BindingId StaticAnalyzer::lookup_symbol(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->names.find(name);
        if (found != it->names.end()) {
            return found->second;
        }
    }
    return kUnresolved;
}

// Global functions are visible (and callable) from the start of the program.
void StaticAnalyzer::hoist_functions(const std::vector<StmtPtr>& statements) {
    for (const auto& stmt : statements) {
        if (!stmt || stmt->kind != StmtKind::FuncDecl) {
            continue;
        }
        auto* decl = static_cast<FuncDeclStmt*>(stmt.get());
        decl->binding = declare_symbol(decl->function.name, decl->loc, InitState::Initialized);
        decl->is_global = true;
        symbols_[decl->binding].hoisted = true;
    }
}

// ---- Flow state ----

StaticAnalyzer::InitState StaticAnalyzer::state_of(BindingId id) const {
    if (id >= state_.states.size()) {
        return InitState::Uninitialized;
    }
    return state_.states[id];
}

void StaticAnalyzer::set_state(BindingId id, InitState state) {
    if (id >= state_.states.size()) {
        state_.states.resize(static_cast<size_t>(id) + 1, InitState::Uninitialized);
    }
    state_.states[id] = state;
}

// Moved dominates Uninitialized dominates Initialized. Unreachable paths
// contribute nothing.
StaticAnalyzer::FlowState StaticAnalyzer::meet(const FlowState& a, const FlowState& b) {
    if (!a.reachable) return b;
    if (!b.reachable) return a;

    FlowState result;
    result.reachable = true;
    const size_t n = std::max(a.states.size(), b.states.size());
    result.states.resize(n, InitState::Uninitialized);
    for (size_t i = 0; i < n; ++i) {
        InitState sa = i < a.states.size() ? a.states[i] : InitState::Uninitialized;
        InitState sb = i < b.states.size() ? b.states[i] : InitState::Uninitialized;
        result.states[i] = std::min(sa, sb);
    }
    return result;
}

void StaticAnalyzer::truncate(FlowState& state, size_t symbol_count) {
    if (state.states.size() > symbol_count) {
        state.states.resize(symbol_count);
    }
}

// ---- Accesses ----

void StaticAnalyzer::use_binding(BindingId id, const std::string& name, SourceLocation loc) {
    if (id == kUnresolved || !state_.reachable) {
        return;
    }
    switch (state_of(id)) {
        case InitState::Initialized:
            return;
        case InitState::Uninitialized:
            error(ErrorKind::UseOfUninitialized,
                  "'" + name + "' may be read before it is initialized", loc, name);
            break;
        case InitState::Moved:
            error(ErrorKind::UseAfterMove,
                  "'" + name + "' is used after its value was moved", loc, name);
            break;
    }
    // Report each path once.
    set_state(id, InitState::Initialized);
}

void StaticAnalyzer::move_binding(BindingId id, const std::string& name, SourceLocation loc) {
    if (id == kUnresolved) {
        return;
    }
    use_binding(id, name, loc);

    const Symbol& symbol = symbols_[id];
    if (symbol.function_depth < function_depth_) {
        error(ErrorKind::UseAfterMove,
              "cannot move '" + name + "' out of an enclosing function", loc, name);
    } else if (symbol.captured) {
        // A function that read the binding may still run and read it again.
        error(ErrorKind::UseAfterMove,
              "cannot move '" + name + "' after a function has captured it", loc, name);
    }
    if (is_borrowed(id)) {
        error(ErrorKind::ConflictingBorrow,
              "cannot move '" + name + "' while it is borrowed", loc, name);
    }
    release_held_by(id);
    set_state(id, InitState::Moved);
}

void StaticAnalyzer::assign_binding(BindingId id, const std::string& name, SourceLocation loc) {
    if (id == kUnresolved) {
        return;
    }
    if (is_borrowed(id)) {
        error(ErrorKind::ConflictingBorrow,
              "cannot assign to '" + name + "' while it is borrowed", loc, name);
    }
    set_state(id, InitState::Initialized);
}

void StaticAnalyzer::begin_borrow(BindingId target, const std::string& name, bool exclusive,
                                  size_t extent, BindingId holder, SourceLocation loc) {
    for (const Borrow& live : borrows_) {
        if (live.target != target || !(exclusive || live.exclusive)) {
            continue;
        }
        error(ErrorKind::ConflictingBorrow,
              std::string(exclusive ? "exclusive" : "shared") + " borrow of '" + name +
                  "' conflicts with a live " + (live.exclusive ? "exclusive" : "shared") + " borrow",
              loc, name);
        break;
    }
    borrows_.push_back(Borrow{target, holder, exclusive, extent, loc});
}

void StaticAnalyzer::release_extent(size_t extent) {
    std::erase_if(borrows_, [extent](const Borrow& b) { return b.extent == extent; });
}

void StaticAnalyzer::release_held_by(BindingId holder) {
    std::erase_if(borrows_, [holder](const Borrow& b) { return b.holder == holder; });
}

bool StaticAnalyzer::is_borrowed(BindingId id) const {
    return std::any_of(borrows_.begin(), borrows_.end(),
        [id](const Borrow& b) { return b.target == id; });
}

// Records what a reference means for code that runs later: captures of
// enclosing bindings, and the globals reachable through hoisted functions.
void StaticAnalyzer::note_reference(BindingId id, SourceLocation loc) {
    Symbol& symbol = symbols_[id];
    if (symbol.function_depth < function_depth_) {
        symbol.captured = true;
    }
    if (!symbol.is_global) {
        return;
    }
    if (current_global_function_ != kUnresolved) {
        FunctionSummary& summary = summaries_[current_global_function_];
        (symbol.hoisted ? summary.calls : summary.reads).push_back(id);
    } else if (symbol.hoisted && suppress_depth_ == 0 && state_.reachable) {
        pending_references_.push_back(PendingReference{id, state_, loc});
    }
}

std::vector<BindingId> StaticAnalyzer::global_reads_of(BindingId function) const {
    std::vector<BindingId> reads;
    std::unordered_set<BindingId> seen_reads;
    std::unordered_set<BindingId> visited{function};
    std::vector<BindingId> work{function};
    while (!work.empty()) {
        BindingId current = work.back();
        work.pop_back();
        auto found = summaries_.find(current);
        if (found == summaries_.end()) {
            continue;
        }
        for (BindingId global : found->second.reads) {
            if (seen_reads.insert(global).second) {
                reads.push_back(global);
            }
        }
        for (BindingId callee : found->second.calls) {
            if (visited.insert(callee).second) {
                work.push_back(callee);
            }
        }
    }
    std::sort(reads.begin(), reads.end());
    return reads;
}

void StaticAnalyzer::check_pending_references() {
    for (const PendingReference& ref : pending_references_) {
        const std::string& function = symbols_[ref.function].name;
        for (BindingId global : global_reads_of(ref.function)) {
            InitState state = global < ref.state.states.size()
                ? ref.state.states[global] : InitState::Uninitialized;
            const std::string& name = symbols_[global].name;
            if (state == InitState::Uninitialized) {
                error(ErrorKind::UseOfUninitialized,
                      "'" + function + "' may read '" + name + "' before it is initialized",
                      ref.loc, name);
            } else if (state == InitState::Moved) {
                error(ErrorKind::UseAfterMove,
                      "'" + function + "' reads '" + name + "' after its value was moved",
                      ref.loc, name);
            }
        }
    }
}

// ---- Statements ----

void StaticAnalyzer::check_statements(std::vector<StmtPtr>& statements) {
    for (auto& stmt : statements) {
        check_stmt(stmt.get());
    }
}

void StaticAnalyzer::check_block(BlockStmt* stmt) {
    enter_scope();
    check_statements(stmt->statements);
    exit_scope();
}

void StaticAnalyzer::check_stmt(Stmt* stmt) {
    if (!stmt) {
        return;
    }
    switch (stmt->kind) {
        case StmtKind::Let:
            check_let(static_cast<LetStmt*>(stmt));
            break;
        case StmtKind::Set:
            check_set(static_cast<SetStmt*>(stmt));
            break;
        case StmtKind::SetField: {
            auto* set = static_cast<SetFieldStmt*>(stmt);
            check_expr(set->object.get());
            check_expr(set->value.get());
            break;
        }
        case StmtKind::SetIndex: {
            auto* set = static_cast<SetIndexStmt*>(stmt);
            check_expr(set->object.get());
            check_expr(set->index.get());
            check_expr(set->value.get());
            break;
        }
        case StmtKind::Expression:
            check_expr(static_cast<ExprStmt*>(stmt)->expression.get());
            break;
        case StmtKind::Print:
            check_expr(static_cast<PrintStmt*>(stmt)->expression.get());
            break;
        case StmtKind::Block:
            check_block(static_cast<BlockStmt*>(stmt));
            break;
        case StmtKind::If:
            check_if(static_cast<IfStmt*>(stmt));
            break;
        case StmtKind::Cond:
            check_cond(static_cast<CondStmt*>(stmt));
            break;
        case StmtKind::While:
            check_while(static_cast<WhileStmt*>(stmt));
            break;
        case StmtKind::For:
            check_for(static_cast<ForStmt*>(stmt));
            break;
        case StmtKind::Forever:
            check_forever(static_cast<ForeverStmt*>(stmt));
            break;
        case StmtKind::Break:
            if (!loops_.empty()) {
                loops_.back().break_states.push_back(state_);
            }
            state_.reachable = false;
            break;
        case StmtKind::Continue:
            if (!loops_.empty()) {
                loops_.back().continue_states.push_back(state_);
            }
            state_.reachable = false;
            break;
        case StmtKind::Return:
            check_expr(static_cast<ReturnStmt*>(stmt)->value.get());
            state_.reachable = false;
            break;
        case StmtKind::Disown:
            check_disown(static_cast<DisownStmt*>(stmt));
            break;
        case StmtKind::FuncDecl:
            check_func_decl(static_cast<FuncDeclStmt*>(stmt));
            break;
    }
}

void StaticAnalyzer::check_let(LetStmt* stmt) {
    // The initializer sees the enclosing binding of the same name, if any.
    std::optional<size_t> borrow;
    if (stmt->initializer) {
        borrow = check_bound_value(stmt->initializer.get(), scopes_.back().token);
    }

    InitState initial = stmt->initializer ? InitState::Initialized : InitState::Uninitialized;
    stmt->binding = declare_symbol(stmt->name, stmt->loc, initial);
    stmt->is_global = symbols_[stmt->binding].is_global;
    if (borrow) {
        borrows_[*borrow].holder = stmt->binding;
    }
}

void StaticAnalyzer::check_set(SetStmt* stmt) {
    BindingId id = lookup_symbol(stmt->name);
    if (id == kUnresolved) {
        check_expr(stmt->value.get());
        error(ErrorKind::UndefinedName, "assignment to undeclared name '" + stmt->name + "'",
              stmt->loc, stmt->name);
        return;
    }
    stmt->resolved = Resolution{id, symbols_[id].is_global};

    // The previous borrow held by the target ends with the assignment.
    if (stmt->value && stmt->value->kind == ExprKind::Borrow) {
        release_held_by(id);
        std::optional<size_t> borrow = check_bound_value(stmt->value.get(), symbols_[id].scope_token);
        assign_binding(id, stmt->name, stmt->loc);
        if (borrow) {
            borrows_[*borrow].holder = id;
        }
        return;
    }
    check_expr(stmt->value.get());
    release_held_by(id);
    assign_binding(id, stmt->name, stmt->loc);
}

void StaticAnalyzer::check_if(IfStmt* stmt) {
    check_expr(stmt->condition.get());
    FlowState base = state_;

    check_stmt(stmt->then_branch.get());
    FlowState then_state = state_;

    state_ = base;
    check_stmt(stmt->else_branch.get());
    state_ = meet(then_state, state_);
}

void StaticAnalyzer::check_cond(CondStmt* stmt) {
    check_expr(stmt->scrutinee.get());

    // Arm i runs after the tests of arms 0..i-1 have failed.
    FlowState test_state = state_;
    FlowState result;
    result.reachable = false;
    const size_t outer_symbols = symbols_.size();

    for (CondArm& arm : stmt->arms) {
        state_ = test_state;
        enter_scope();
        declare_pattern(arm.pattern.get());
        check_expr(arm.guard.get());
        test_state = state_;
        truncate(test_state, outer_symbols);

        if (arm.body) {
            check_statements(arm.body->statements);
        }
        exit_scope();
        FlowState arm_end = state_;
        truncate(arm_end, outer_symbols);
        result = meet(result, arm_end);
    }

    // Without an irrefutable arm the fallthrough path traps, so only arm
    // bodies continue past the cond.
    state_ = result;
}

template<typename BodyPass>
StaticAnalyzer::FlowState StaticAnalyzer::analyze_loop(BodyPass&& body_pass) {
    const size_t outer_symbols = symbols_.size();
    const FlowState pre = state_;
    FlowState entry = pre;

    // Each pass gets a fresh scope so declarations in the body are new.
    auto run_pass = [&](std::optional<FlowState>& test_exit) {
        state_ = entry;
        loops_.push_back(LoopContext{});
        enter_scope();
        body_pass(test_exit);
        exit_scope();
        LoopContext context = std::move(loops_.back());
        loops_.pop_back();
        return context;
    };

    // Iterate to a fixed point without reporting; states only move down a
    // finite lattice.
    suppress_depth_++;
    const size_t max_passes = outer_symbols * 2 + 3;
    for (size_t pass = 0; pass < max_passes; ++pass) {
        std::optional<FlowState> test_exit;
        LoopContext context = run_pass(test_exit);

        FlowState back_edge = state_;
        for (const FlowState& s : context.continue_states) {
            back_edge = meet(back_edge, s);
        }
        FlowState next = meet(pre, back_edge);
        truncate(next, outer_symbols);
        if (next == entry) {
            break;
        }
        entry = std::move(next);
    }
    suppress_depth_--;

    // Reporting pass from the stable entry state.
    std::optional<FlowState> test_exit;
    LoopContext context = run_pass(test_exit);

    FlowState exit;
    exit.reachable = false;
    if (test_exit) {
        exit = *test_exit;
    }
    for (const FlowState& s : context.break_states) {
        exit = meet(exit, s);
    }
    truncate(exit, outer_symbols);
    return exit;
}

void StaticAnalyzer::check_while(WhileStmt* stmt) {
    state_ = analyze_loop([&](std::optional<FlowState>& test_exit) {
        check_expr(stmt->condition.get());
        test_exit = state_;
        check_stmt(stmt->body.get());
    });
}

void StaticAnalyzer::check_for(ForStmt* stmt) {
    check_expr(stmt->start.get());
    check_expr(stmt->end.get());

    state_ = analyze_loop([&](std::optional<FlowState>& test_exit) {
        test_exit = state_;
        enter_scope();
        stmt->binding = declare_symbol(stmt->variable, stmt->loc, InitState::Initialized);
        check_stmt(stmt->body.get());
        exit_scope();
    });
}

void StaticAnalyzer::check_forever(ForeverStmt* stmt) {
    state_ = analyze_loop([&](std::optional<FlowState>&) {
        check_stmt(stmt->body.get());
    });
}

void StaticAnalyzer::check_disown(DisownStmt* stmt) {
    BindingId id = lookup_symbol(stmt->name);
    if (id == kUnresolved) {
        error(ErrorKind::UndefinedName, "cannot disown undeclared name '" + stmt->name + "'",
              stmt->loc, stmt->name);
        return;
    }
    stmt->resolved = Resolution{id, symbols_[id].is_global};
    move_binding(id, stmt->name, stmt->loc);
}

void StaticAnalyzer::check_func_decl(FuncDeclStmt* stmt) {
    // Global functions were hoisted. Nested ones are visible in their own
    // bodies so they can recurse.
    if (!stmt->is_global || stmt->binding == kUnresolved) {
        stmt->binding = declare_symbol(stmt->function.name, stmt->loc, InitState::Initialized);
        stmt->is_global = symbols_[stmt->binding].is_global;
    }
    if (!symbols_[stmt->binding].hoisted) {
        check_function_body(stmt->function);
        return;
    }

    const BindingId enclosing = current_global_function_;
    current_global_function_ = stmt->binding;
    summaries_[stmt->binding];
    check_function_body(stmt->function);
    current_global_function_ = enclosing;
}

// Each clause is analyzed from the state at the declaration point. Nothing
// that happens inside the body changes the state of the enclosing code.
void StaticAnalyzer::check_function_body(FunctionDecl& function) {
    const FlowState saved_state = state_;
    std::vector<LoopContext> saved_loops = std::move(loops_);
    loops_.clear();
    function_depth_++;

    for (FunctionClause& clause : function.clauses) {
        state_ = saved_state;
        state_.reachable = true;

        // Parameters and top-level body declarations share one scope.
        enter_scope();
        for (auto& param : clause.params) {
            declare_pattern(param.get());
        }
        check_statements(clause.body);
        exit_scope();
    }

    function_depth_--;
    loops_ = std::move(saved_loops);
    state_ = saved_state;
}

void StaticAnalyzer::declare_pattern(Pattern* pattern) {
    if (!pattern) {
        return;
    }
    switch (pattern->kind) {
        case PatternKind::Binding:
            pattern->binding = declare_symbol(pattern->name, pattern->loc, InitState::Initialized);
            break;
        case PatternKind::Destructure:
            for (auto& field : pattern->fields) {
                declare_pattern(field.pattern.get());
            }
            break;
        case PatternKind::Literal:
        case PatternKind::Wildcard:
            break;
    }
}

// ---- Expressions ----

BindingId StaticAnalyzer::resolve(IdentifierExpr* expr) {
    BindingId id = lookup_symbol(expr->name);
    if (id == kUnresolved) {
        error(ErrorKind::UndefinedName, "undefined name '" + expr->name + "'", expr->loc, expr->name);
        return kUnresolved;
    }
    expr->resolved = Resolution{id, symbols_[id].is_global};
    note_reference(id, expr->loc);
    return id;
}

void StaticAnalyzer::check_identifier(IdentifierExpr* expr) {
    BindingId id = resolve(expr);
    use_binding(id, expr->name, expr->loc);
}

void StaticAnalyzer::check_expr(Expr* expr) {
    if (!expr) {
        return;
    }
    switch (expr->kind) {
        case ExprKind::Literal:
            break;
        case ExprKind::Identifier:
            check_identifier(static_cast<IdentifierExpr*>(expr));
            break;
        case ExprKind::Unary:
            check_expr(static_cast<UnaryExpr*>(expr)->operand.get());
            break;
        case ExprKind::Binary: {
            auto* binary = static_cast<BinaryExpr*>(expr);
            check_expr(binary->left.get());
            if (binary->op == BinaryOp::LogicAnd || binary->op == BinaryOp::LogicOr) {
                // The right operand may not run.
                FlowState after_left = state_;
                check_expr(binary->right.get());
                state_ = meet(after_left, state_);
            } else {
                check_expr(binary->right.get());
            }
            break;
        }
        case ExprKind::Call:
            check_call(static_cast<CallExpr*>(expr));
            break;
        case ExprKind::Field:
            check_expr(static_cast<FieldExpr*>(expr)->object.get());
            break;
        case ExprKind::Index: {
            auto* index = static_cast<IndexExpr*>(expr);
            check_expr(index->object.get());
            check_expr(index->index.get());
            break;
        }
        case ExprKind::Record:
            for (auto& [name, value] : static_cast<RecordExpr*>(expr)->fields) {
                check_expr(value.get());
            }
            break;
        case ExprKind::Array:
            for (auto& element : static_cast<ArrayExpr*>(expr)->elements) {
                check_expr(element.get());
            }
            break;
        case ExprKind::Lambda:
            check_function_body(static_cast<LambdaExpr*>(expr)->function);
            break;
        case ExprKind::Borrow: {
            // A borrow that is not stored or passed ends with the expression.
            size_t temporary = new_extent();
            check_borrow(static_cast<BorrowExpr*>(expr), temporary, kUnresolved);
            release_extent(temporary);
            break;
        }
        case ExprKind::Move:
            check_move(static_cast<MoveExpr*>(expr));
            break;
        case ExprKind::Deref:
            check_expr(static_cast<DerefExpr*>(expr)->operand.get());
            break;
    }
}

void StaticAnalyzer::check_call(CallExpr* expr) {
    check_expr(expr->callee.get());

    // Borrows passed as arguments stay live until the call is made.
    size_t extent = new_extent();
    for (auto& arg : expr->arguments) {
        if (arg && arg->kind == ExprKind::Borrow) {
            check_borrow(static_cast<BorrowExpr*>(arg.get()), extent, kUnresolved);
        } else {
            check_expr(arg.get());
        }
    }
    release_extent(extent);
}

std::optional<size_t> StaticAnalyzer::check_borrow(BorrowExpr* expr, size_t extent, BindingId holder) {
    // Borrowing a field or element borrows the binding it is reached from.
    Expr* root = expr->target.get();
    while (root && (root->kind == ExprKind::Field || root->kind == ExprKind::Index)) {
        if (root->kind == ExprKind::Field) {
            root = static_cast<FieldExpr*>(root)->object.get();
        } else {
            auto* index = static_cast<IndexExpr*>(root);
            check_expr(index->index.get());
            root = index->object.get();
        }
    }
    if (!root || root->kind != ExprKind::Identifier) {
        check_expr(expr->target.get());
        return std::nullopt;
    }

    auto* ident = static_cast<IdentifierExpr*>(root);
    BindingId target = resolve(ident);
    if (target == kUnresolved) {
        return std::nullopt;
    }
    use_binding(target, ident->name, ident->loc);
    begin_borrow(target, ident->name, expr->exclusive, extent, holder, expr->loc);
    return borrows_.size() - 1;
}

void StaticAnalyzer::check_move(MoveExpr* expr) {
    if (!expr->target) {
        return;
    }
    BindingId id = resolve(expr->target.get());
    move_binding(id, expr->target->name, expr->loc);
}

std::optional<size_t> StaticAnalyzer::check_bound_value(Expr* value, size_t extent) {
    if (value && value->kind == ExprKind::Borrow) {
        return check_borrow(static_cast<BorrowExpr*>(value), extent, kUnresolved);
    }
    check_expr(value);
    return std::nullopt;
}

void StaticAnalyzer::error(ErrorKind kind, const std::string& message, SourceLocation loc,
                           const std::string& context) {
    if (suppress_depth_ > 0) {
        return;
    }
    errors_.push_back(Diagnostic{kind, loc, message, context, {}});
}

void StaticAnalyzer::throw_if_errors() {
    if (!errors_.empty()) {
        throw AnalysisError(errors_);
    }
}

} // namespace kestrel
