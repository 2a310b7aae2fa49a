#include "ks_compiler.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace kestrel {

BytecodeUnit Compiler::compile(const Program& program) {
    if (!program.analyzed) {
        throw std::logic_error("Compiler::compile requires a program accepted by StaticAnalyzer");
    }

    GlobalTable globals;
    globals_ = &globals;
    chunk_ = std::make_shared<Chunk>();
    locals_.clear();
    upvalues_.clear();
    loop_stack_.clear();
    enclosing_ = nullptr;
    scope_depth_ = 0;
    recursion_depth_ = 0;
    max_locals_ = 0;

    assign_global_slots(program.statements);
    emit_hoisted_functions(program.statements);

    for (const auto& stmt : program.statements) {
        compile_stmt(stmt.get());
    }
    emit_op(OpCode::OP_HALT, SourceLocation{});

    auto script = std::make_shared<FunctionPrototype>();
    script->name = "<script>";
    script->is_proc = true;
    script->chunk = chunk_;
    script->max_slots = max_locals_;

    BytecodeUnit unit;
    unit.script = std::move(script);
    unit.global_names = std::move(globals.names);
    unit.entry_points = std::move(globals.entry_points);
    globals_ = nullptr;
    return unit;
}

void Compiler::assign_global_slots(const std::vector<StmtPtr>& statements) {
    auto assign = [this](BindingId binding, const std::string& name, SourceLocation loc) {
        if (globals_->slots.contains(binding)) {
            return;
        }
        if (globals_->names.size() > kMaxOperand) {
            limit_error("too many global bindings", loc);
        }
        globals_->slots.emplace(binding, static_cast<uint16_t>(globals_->names.size()));
        globals_->names.push_back(name);
    };

    for (const auto& stmt : statements) {
        if (!stmt) {
            continue;
        }
        if (stmt->kind == StmtKind::Let) {
            auto* let = static_cast<const LetStmt*>(stmt.get());
            if (let->is_global) {
                assign(let->binding, let->name, let->loc);
            }
        } else if (stmt->kind == StmtKind::FuncDecl) {
            auto* decl = static_cast<const FuncDeclStmt*>(stmt.get());
            if (decl->is_global) {
                assign(decl->binding, decl->function.name, decl->loc);
                globals_->entry_points[decl->function.name] = globals_->slots.at(decl->binding);
            }
        }
    }
}

uint16_t Compiler::global_slot(BindingId binding, SourceLocation loc) const {
    auto it = globals_->slots.find(binding);
    if (it == globals_->slots.end()) {
        throw std::logic_error("no global slot for binding at line " + std::to_string(loc.line));
    }
    return it->second;
}

// Global functions exist before the first statement runs.
void Compiler::emit_hoisted_functions(const std::vector<StmtPtr>& statements) {
    for (const auto& stmt : statements) {
        if (!stmt || stmt->kind != StmtKind::FuncDecl) {
            continue;
        }
        auto* decl = static_cast<const FuncDeclStmt*>(stmt.get());
        if (!decl->is_global) {
            continue;
        }
        emit_closure(decl->function, decl->loc);
        emit_op(OpCode::OP_SET_GLOBAL, decl->loc);
        emit_short(global_slot(decl->binding, decl->loc), decl->loc);
        emit_op(OpCode::OP_POP, decl->loc);
    }
}

// ---- Statements ----

void Compiler::compile_stmt(Stmt* stmt) {
    if (!stmt) {
        return;
    }
    RecursionGuard guard(*this, stmt->loc);

    switch (stmt->kind) {
        case StmtKind::Let:
            visit(static_cast<LetStmt*>(stmt));
            break;
        case StmtKind::Set:
            visit(static_cast<SetStmt*>(stmt));
            break;
        case StmtKind::SetField:
            visit(static_cast<SetFieldStmt*>(stmt));
            break;
        case StmtKind::SetIndex:
            visit(static_cast<SetIndexStmt*>(stmt));
            break;
        case StmtKind::Expression:
            compile_expr(static_cast<ExprStmt*>(stmt)->expression.get());
            emit_op(OpCode::OP_POP, stmt->loc);
            break;
        case StmtKind::Print:
            compile_expr(static_cast<PrintStmt*>(stmt)->expression.get());
            emit_op(OpCode::OP_PRINT, stmt->loc);
            break;
        case StmtKind::Block:
            visit(static_cast<BlockStmt*>(stmt));
            break;
        case StmtKind::If:
            visit(static_cast<IfStmt*>(stmt));
            break;
        case StmtKind::Cond:
            visit(static_cast<CondStmt*>(stmt));
            break;
        case StmtKind::While:
            visit(static_cast<WhileStmt*>(stmt));
            break;
        case StmtKind::For:
            visit(static_cast<ForStmt*>(stmt));
            break;
        case StmtKind::Forever:
            visit(static_cast<ForeverStmt*>(stmt));
            break;
        case StmtKind::Break:
            visit(static_cast<BreakStmt*>(stmt));
            break;
        case StmtKind::Continue:
            visit(static_cast<ContinueStmt*>(stmt));
            break;
        case StmtKind::Return:
            visit(static_cast<ReturnStmt*>(stmt));
            break;
        case StmtKind::Disown:
            visit(static_cast<DisownStmt*>(stmt));
            break;
        case StmtKind::FuncDecl:
            visit(static_cast<FuncDeclStmt*>(stmt));
            break;
    }
}

void Compiler::visit(LetStmt* stmt) {
    if (stmt->is_global) {
        // An uninitialized global stays undefined until its first set.
        if (stmt->initializer) {
            compile_expr(stmt->initializer.get());
            emit_op(OpCode::OP_SET_GLOBAL, stmt->loc);
            emit_short(global_slot(stmt->binding, stmt->loc), stmt->loc);
            emit_op(OpCode::OP_POP, stmt->loc);
        }
        return;
    }

    if (stmt->initializer) {
        compile_expr(stmt->initializer.get());
    } else {
        emit_op(OpCode::OP_NIL, stmt->loc);
    }
    declare_local(stmt->name, stmt->binding, stmt->loc);
}

void Compiler::visit(SetStmt* stmt) {
    compile_expr(stmt->value.get());
    emit_variable(stmt->resolved, Access::Set, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
}

void Compiler::visit(SetFieldStmt* stmt) {
    compile_expr(stmt->object.get());
    compile_expr(stmt->value.get());
    size_t name = chunk_->add_string(stmt->field);
    emit_op_index(OpCode::OP_SET_FIELD, name, stmt->loc, "string constants");
    emit_op(OpCode::OP_POP, stmt->loc);
}

void Compiler::visit(SetIndexStmt* stmt) {
    compile_expr(stmt->object.get());
    compile_expr(stmt->index.get());
    compile_expr(stmt->value.get());
    emit_op(OpCode::OP_SET_INDEX, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
}

void Compiler::visit(BlockStmt* stmt) {
    begin_scope();
    for (const auto& s : stmt->statements) {
        compile_stmt(s.get());
    }
    end_scope();
}

void Compiler::visit(IfStmt* stmt) {
    compile_expr(stmt->condition.get());
    size_t else_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
    compile_stmt(stmt->then_branch.get());

    size_t end_jump = emit_jump(OpCode::OP_JUMP, stmt->loc);
    patch_jump(else_jump, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
    compile_stmt(stmt->else_branch.get());
    patch_jump(end_jump, stmt->loc);
}

void Compiler::visit(CondStmt* stmt) {
    if (stmt->scrutinee) {
        compile_pattern_arms(stmt);
    } else {
        compile_guarded_arms(stmt);
    }
}

// cond without a scrutinee: each arm is a guard, first truthy guard wins.
void Compiler::compile_guarded_arms(CondStmt* stmt) {
    std::vector<size_t> end_jumps;
    bool exhaustive = false;

    for (CondArm& arm : stmt->arms) {
        std::optional<size_t> fail_jump;
        if (arm.guard) {
            compile_expr(arm.guard.get());
            fail_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, arm.loc);
            emit_op(OpCode::OP_POP, arm.loc);
        }

        begin_scope();
        if (arm.body) {
            for (const auto& s : arm.body->statements) {
                compile_stmt(s.get());
            }
        }
        end_scope();
        end_jumps.push_back(emit_jump(OpCode::OP_JUMP, arm.loc));

        if (!fail_jump) {
            exhaustive = true;
            break;
        }
        patch_jump(*fail_jump, arm.loc);
        emit_op(OpCode::OP_POP, arm.loc);
    }

    if (!exhaustive) {
        emit_op(OpCode::OP_NO_MATCHING_ARM, stmt->loc);
    }
    for (size_t jump : end_jumps) {
        patch_jump(jump, stmt->loc);
    }
}

// cond on a scrutinee. The scrutinee lives in a hidden local that MATCH
// reads; a successful match leaves the arm's bindings on the stack as locals.
void Compiler::compile_pattern_arms(CondStmt* stmt) {
    begin_scope();
    compile_expr(stmt->scrutinee.get());
    declare_local("$cond", kUnresolved, stmt->loc);
    const size_t scrutinee_slot = locals_.size() - 1;

    std::vector<size_t> end_jumps;
    bool exhaustive = false;

    for (CondArm& arm : stmt->arms) {
        CompiledPattern compiled;
        std::vector<const Pattern*> bindings;
        if (arm.pattern) {
            compiled = compile_pattern(*arm.pattern);
            collect_bindings(*arm.pattern, bindings);
        }
        size_t pattern_index = chunk_->add_pattern(std::move(compiled));
        emit_op_index(OpCode::OP_MATCH, pattern_index, arm.loc, "patterns");
        emit_short(static_cast<uint16_t>(scrutinee_slot), arm.loc);

        size_t fail_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, arm.loc);
        emit_op(OpCode::OP_POP, arm.loc);

        begin_scope();
        const size_t arm_base = locals_.size();
        for (const Pattern* binding : bindings) {
            declare_local(binding->name, binding->binding, binding->loc);
        }

        std::optional<size_t> guard_jump;
        if (arm.guard) {
            compile_expr(arm.guard.get());
            guard_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, arm.loc);
            emit_op(OpCode::OP_POP, arm.loc);
        }

        if (arm.body) {
            for (const auto& s : arm.body->statements) {
                compile_stmt(s.get());
            }
        }

        std::vector<bool> binding_captured;
        for (size_t i = arm_base; i < arm_base + bindings.size(); ++i) {
            binding_captured.push_back(locals_[i].is_captured);
        }
        end_scope();
        end_jumps.push_back(emit_jump(OpCode::OP_JUMP, arm.loc));

        std::optional<size_t> next_jump;
        if (guard_jump) {
            // Guard failed after a successful match: drop the bindings.
            patch_jump(*guard_jump, arm.loc);
            emit_op(OpCode::OP_POP, arm.loc);
            for (auto it = binding_captured.rbegin(); it != binding_captured.rend(); ++it) {
                emit_op(*it ? OpCode::OP_CLOSE_UPVALUE : OpCode::OP_POP, arm.loc);
            }
            next_jump = emit_jump(OpCode::OP_JUMP, arm.loc);
        }

        patch_jump(fail_jump, arm.loc);
        emit_op(OpCode::OP_POP, arm.loc);
        if (next_jump) {
            patch_jump(*next_jump, arm.loc);
        }

        if (arm.is_irrefutable()) {
            exhaustive = true;
            break;
        }
    }

    if (!exhaustive) {
        emit_op(OpCode::OP_NO_MATCHING_ARM, stmt->loc);
    }
    for (size_t jump : end_jumps) {
        patch_jump(jump, stmt->loc);
    }
    end_scope();
}

void Compiler::visit(WhileStmt* stmt) {
    loop_stack_.push_back({{}, {}, scope_depth_});
    size_t loop_start = chunk_->code.size();

    compile_expr(stmt->condition.get());
    size_t exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);

    begin_scope();
    compile_stmt(stmt->body.get());
    end_scope();

    for (size_t jump : loop_stack_.back().continue_jumps) {
        patch_jump(jump, stmt->loc);
    }
    emit_loop(loop_start, stmt->loc);

    patch_jump(exit_jump, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);

    for (size_t jump : loop_stack_.back().break_jumps) {
        patch_jump(jump, stmt->loc);
    }
    loop_stack_.pop_back();
}

// for v in start..end: hidden counter and bound, v rebound each iteration.
void Compiler::visit(ForStmt* stmt) {
    begin_scope();
    compile_expr(stmt->start.get());
    declare_local("$next", kUnresolved, stmt->loc);
    const auto next_slot = static_cast<uint16_t>(locals_.size() - 1);
    compile_expr(stmt->end.get());
    declare_local("$end", kUnresolved, stmt->loc);
    const auto end_slot = static_cast<uint16_t>(locals_.size() - 1);

    loop_stack_.push_back({{}, {}, scope_depth_});
    size_t loop_start = chunk_->code.size();

    emit_op(OpCode::OP_GET_LOCAL, stmt->loc);
    emit_short(next_slot, stmt->loc);
    emit_op(OpCode::OP_GET_LOCAL, stmt->loc);
    emit_short(end_slot, stmt->loc);
    emit_op(OpCode::OP_LESS, stmt->loc);
    size_t exit_jump = emit_jump(OpCode::OP_JUMP_IF_FALSE, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);

    begin_scope();
    emit_op(OpCode::OP_GET_LOCAL, stmt->loc);
    emit_short(next_slot, stmt->loc);
    declare_local(stmt->variable, stmt->binding, stmt->loc);
    compile_stmt(stmt->body.get());
    end_scope();

    for (size_t jump : loop_stack_.back().continue_jumps) {
        patch_jump(jump, stmt->loc);
    }
    emit_op(OpCode::OP_GET_LOCAL, stmt->loc);
    emit_short(next_slot, stmt->loc);
    emit_constant(Value::from_int(1), stmt->loc);
    emit_op(OpCode::OP_ADD, stmt->loc);
    emit_op(OpCode::OP_SET_LOCAL, stmt->loc);
    emit_short(next_slot, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
    emit_loop(loop_start, stmt->loc);

    patch_jump(exit_jump, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);

    for (size_t jump : loop_stack_.back().break_jumps) {
        patch_jump(jump, stmt->loc);
    }
    loop_stack_.pop_back();
    end_scope();
}

void Compiler::visit(ForeverStmt* stmt) {
    loop_stack_.push_back({{}, {}, scope_depth_});
    size_t loop_start = chunk_->code.size();

    begin_scope();
    compile_stmt(stmt->body.get());
    end_scope();

    for (size_t jump : loop_stack_.back().continue_jumps) {
        patch_jump(jump, stmt->loc);
    }
    emit_loop(loop_start, stmt->loc);

    for (size_t jump : loop_stack_.back().break_jumps) {
        patch_jump(jump, stmt->loc);
    }
    loop_stack_.pop_back();
}

void Compiler::visit(BreakStmt* stmt) {
    if (loop_stack_.empty()) {
        throw CompileError(Diagnostic{ErrorKind::BreakOutsideLoop, stmt->loc,
                                      "'break' outside of loop", "break", {}});
    }
    emit_scope_exit(loop_stack_.back().scope_depth_at_start, stmt->loc);
    size_t jump = emit_jump(OpCode::OP_JUMP, stmt->loc);
    loop_stack_.back().break_jumps.push_back(jump);
}

void Compiler::visit(ContinueStmt* stmt) {
    if (loop_stack_.empty()) {
        throw CompileError(Diagnostic{ErrorKind::BreakOutsideLoop, stmt->loc,
                                      "'continue' outside of loop", "continue", {}});
    }
    emit_scope_exit(loop_stack_.back().scope_depth_at_start, stmt->loc);
    size_t jump = emit_jump(OpCode::OP_JUMP, stmt->loc);
    loop_stack_.back().continue_jumps.push_back(jump);
}

void Compiler::visit(ReturnStmt* stmt) {
    if (stmt->value) {
        compile_expr(stmt->value.get());
    } else {
        emit_op(OpCode::OP_NIL, stmt->loc);
    }
    emit_op(OpCode::OP_RETURN, stmt->loc);
}

void Compiler::visit(DisownStmt* stmt) {
    emit_variable(stmt->resolved, Access::Move, stmt->loc);
    emit_op(OpCode::OP_POP, stmt->loc);
}

void Compiler::visit(FuncDeclStmt* stmt) {
    if (stmt->is_global) {
        return;  // emitted with the hoisted functions
    }
    // Declared first so the body can capture itself.
    declare_local(stmt->function.name, stmt->binding, stmt->loc);
    emit_closure(stmt->function, stmt->loc);
}

// ---- Expressions ----

void Compiler::compile_expr(Expr* expr) {
    if (!expr) {
        return;
    }
    RecursionGuard guard(*this, expr->loc);

    switch (expr->kind) {
        case ExprKind::Literal:
            visit(static_cast<LiteralExpr*>(expr));
            break;
        case ExprKind::Identifier: {
            auto* ident = static_cast<IdentifierExpr*>(expr);
            emit_variable(ident->resolved, Access::Get, ident->loc);
            break;
        }
        case ExprKind::Unary:
            visit(static_cast<UnaryExpr*>(expr));
            break;
        case ExprKind::Binary:
            visit(static_cast<BinaryExpr*>(expr));
            break;
        case ExprKind::Call:
            visit(static_cast<CallExpr*>(expr));
            break;
        case ExprKind::Field: {
            auto* field = static_cast<FieldExpr*>(expr);
            compile_expr(field->object.get());
            size_t name = chunk_->add_string(field->field);
            emit_op_index(OpCode::OP_GET_FIELD, name, field->loc, "string constants");
            break;
        }
        case ExprKind::Index: {
            auto* index = static_cast<IndexExpr*>(expr);
            compile_expr(index->object.get());
            compile_expr(index->index.get());
            emit_op(OpCode::OP_GET_INDEX, index->loc);
            break;
        }
        case ExprKind::Record:
            visit(static_cast<RecordExpr*>(expr));
            break;
        case ExprKind::Array:
            visit(static_cast<ArrayExpr*>(expr));
            break;
        case ExprKind::Lambda:
            emit_closure(static_cast<LambdaExpr*>(expr)->function, expr->loc);
            break;
        case ExprKind::Borrow:
            // A borrow evaluates to the borrowed value.
            compile_expr(static_cast<BorrowExpr*>(expr)->target.get());
            break;
        case ExprKind::Move: {
            auto* move = static_cast<MoveExpr*>(expr);
            emit_variable(move->target->resolved, Access::Move, move->loc);
            break;
        }
        case ExprKind::Deref:
            compile_expr(static_cast<DerefExpr*>(expr)->operand.get());
            break;
    }
}

void Compiler::visit(LiteralExpr* expr) {
    if (expr->string_value) {
        emit_string(*expr->string_value, expr->loc);
        return;
    }
    const Value& v = expr->value;
    if (v.is_nil()) {
        emit_op(OpCode::OP_NIL, expr->loc);
    } else if (v.is_bool()) {
        emit_op(v.as_bool() ? OpCode::OP_TRUE : OpCode::OP_FALSE, expr->loc);
    } else {
        emit_constant(v, expr->loc);
    }
}

void Compiler::visit(UnaryExpr* expr) {
    compile_expr(expr->operand.get());
    switch (expr->op) {
        case UnaryOp::Negate:     emit_op(OpCode::OP_NEGATE, expr->loc); break;
        case UnaryOp::Not:        emit_op(OpCode::OP_NOT, expr->loc); break;
        case UnaryOp::BitwiseNot: emit_op(OpCode::OP_BITWISE_NOT, expr->loc); break;
    }
}

void Compiler::visit(BinaryExpr* expr) {
    if (expr->op == BinaryOp::LogicAnd || expr->op == BinaryOp::LogicOr) {
        compile_expr(expr->left.get());
        OpCode skip = expr->op == BinaryOp::LogicAnd ? OpCode::OP_JUMP_IF_FALSE : OpCode::OP_JUMP_IF_TRUE;
        size_t end_jump = emit_jump(skip, expr->loc);
        emit_op(OpCode::OP_POP, expr->loc);
        compile_expr(expr->right.get());
        patch_jump(end_jump, expr->loc);
        return;
    }

    compile_expr(expr->left.get());
    compile_expr(expr->right.get());

    switch (expr->op) {
        case BinaryOp::Add:          emit_op(OpCode::OP_ADD, expr->loc); break;
        case BinaryOp::Subtract:     emit_op(OpCode::OP_SUBTRACT, expr->loc); break;
        case BinaryOp::Multiply:     emit_op(OpCode::OP_MULTIPLY, expr->loc); break;
        case BinaryOp::Divide:       emit_op(OpCode::OP_DIVIDE, expr->loc); break;
        case BinaryOp::Modulo:       emit_op(OpCode::OP_MODULO, expr->loc); break;
        case BinaryOp::BitwiseAnd:   emit_op(OpCode::OP_BITWISE_AND, expr->loc); break;
        case BinaryOp::BitwiseOr:    emit_op(OpCode::OP_BITWISE_OR, expr->loc); break;
        case BinaryOp::BitwiseXor:   emit_op(OpCode::OP_BITWISE_XOR, expr->loc); break;
        case BinaryOp::ShiftLeft:    emit_op(OpCode::OP_LEFT_SHIFT, expr->loc); break;
        case BinaryOp::ShiftRight:   emit_op(OpCode::OP_RIGHT_SHIFT, expr->loc); break;
        case BinaryOp::Equal:        emit_op(OpCode::OP_EQUAL, expr->loc); break;
        case BinaryOp::NotEqual:     emit_op(OpCode::OP_NOT_EQUAL, expr->loc); break;
        case BinaryOp::Less:         emit_op(OpCode::OP_LESS, expr->loc); break;
        case BinaryOp::LessEqual:    emit_op(OpCode::OP_LESS_EQUAL, expr->loc); break;
        case BinaryOp::Greater:      emit_op(OpCode::OP_GREATER, expr->loc); break;
        case BinaryOp::GreaterEqual: emit_op(OpCode::OP_GREATER_EQUAL, expr->loc); break;
        case BinaryOp::LogicAnd:
        case BinaryOp::LogicOr:
            break;
    }
}

void Compiler::visit(CallExpr* expr) {
    compile_expr(expr->callee.get());
    for (const auto& arg : expr->arguments) {
        compile_expr(arg.get());
    }
    emit_op_index(OpCode::OP_CALL, expr->arguments.size(), expr->loc, "call arguments");
}

void Compiler::visit(RecordExpr* expr) {
    std::vector<std::string> shape;
    shape.reserve(expr->fields.size());
    for (const auto& [name, value] : expr->fields) {
        compile_expr(value.get());
        shape.push_back(name);
    }
    size_t index = chunk_->add_record_shape(std::move(shape));
    emit_op_index(OpCode::OP_RECORD, index, expr->loc, "record shapes");
}

void Compiler::visit(ArrayExpr* expr) {
    for (const auto& element : expr->elements) {
        compile_expr(element.get());
    }
    emit_op_index(OpCode::OP_ARRAY, expr->elements.size(), expr->loc, "array elements");
}

// ---- Functions ----

std::shared_ptr<FunctionPrototype> Compiler::compile_function(const FunctionDecl& decl, SourceLocation loc) {
    Compiler function_compiler;
    function_compiler.chunk_ = std::make_shared<Chunk>();
    function_compiler.globals_ = globals_;
    function_compiler.enclosing_ = this;
    function_compiler.recursion_depth_ = recursion_depth_;

    for (const FunctionClause& clause : decl.clauses) {
        function_compiler.compile_clause(clause, clause.loc.known() ? clause.loc : loc);
    }
    function_compiler.emit_op(OpCode::OP_NO_MATCHING_OVERLOAD, loc);

    auto proto = std::make_shared<FunctionPrototype>();
    proto->name = decl.name.empty() ? "<lambda>" : decl.name;
    proto->is_proc = decl.is_proc;
    proto->chunk = function_compiler.chunk_;
    proto->max_slots = function_compiler.max_locals_;
    proto->upvalues.reserve(function_compiler.upvalues_.size());
    for (const auto& uv : function_compiler.upvalues_) {
        proto->upvalues.push_back({uv.index, uv.is_local});
    }
    return proto;
}

// Prologue: MATCH_ARGS tests arity and parameter patterns against the
// frame's arguments. A failed test falls through to the next clause.
void Compiler::compile_clause(const FunctionClause& clause, SourceLocation loc) {
    locals_.clear();
    loop_stack_.clear();
    scope_depth_ = 1;

    ClauseSignature signature;
    std::vector<const Pattern*> nested_bindings;
    for (const auto& param : clause.params) {
        if (param->kind == PatternKind::Binding) {
            // Named parameters are the argument slots themselves.
            signature.params.push_back(CompiledPattern{});
            declare_local(param->name, param->binding, param->loc);
        } else {
            signature.params.push_back(compile_pattern(*param));
            collect_bindings(*param, nested_bindings);
            declare_local("$arg", kUnresolved, param->loc);
        }
    }

    size_t clause_index = chunk_->add_clause(std::move(signature));
    emit_op_index(OpCode::OP_MATCH_ARGS, clause_index, loc, "function clauses");
    size_t next_clause = emit_jump(OpCode::OP_JUMP_IF_FALSE, loc);
    emit_op(OpCode::OP_POP, loc);

    for (const Pattern* binding : nested_bindings) {
        declare_local(binding->name, binding->binding, binding->loc);
    }
    for (const auto& stmt : clause.body) {
        compile_stmt(stmt.get());
    }
    emit_op(OpCode::OP_NIL, loc);
    emit_op(OpCode::OP_RETURN, loc);

    patch_jump(next_clause, loc);
    emit_op(OpCode::OP_POP, loc);
}

void Compiler::emit_closure(const FunctionDecl& decl, SourceLocation loc) {
    auto proto = compile_function(decl, loc);
    size_t index = chunk_->add_function(std::move(proto));
    emit_op_index(OpCode::OP_CLOSURE, index, loc, "functions");
}

// ---- Patterns ----

CompiledPattern Compiler::compile_pattern(const Pattern& pattern) {
    CompiledPattern compiled;
    switch (pattern.kind) {
        case PatternKind::Wildcard:
            compiled.kind = CompiledPattern::Kind::Wildcard;
            break;
        case PatternKind::Binding:
            compiled.kind = CompiledPattern::Kind::Binding;
            break;
        case PatternKind::Literal:
            if (pattern.string_literal) {
                compiled.kind = CompiledPattern::Kind::StringLiteral;
                compiled.text = *pattern.string_literal;
            } else {
                compiled.kind = CompiledPattern::Kind::Literal;
                compiled.literal = pattern.literal;
            }
            break;
        case PatternKind::Destructure:
            compiled.kind = CompiledPattern::Kind::Destructure;
            for (const auto& field : pattern.fields) {
                compiled.fields.emplace_back(field.field, compile_pattern(*field.pattern));
            }
            break;
    }
    return compiled;
}

// Traversal order matches the order MATCH pushes bound values.
void Compiler::collect_bindings(const Pattern& pattern, std::vector<const Pattern*>& out) {
    if (pattern.kind == PatternKind::Binding) {
        out.push_back(&pattern);
        return;
    }
    for (const auto& field : pattern.fields) {
        collect_bindings(*field.pattern, out);
    }
}

// ---- Scopes and variables ----

void Compiler::begin_scope() {
    scope_depth_++;
}

void Compiler::end_scope() {
    scope_depth_--;
    while (!locals_.empty() && locals_.back().depth > scope_depth_) {
        if (locals_.back().is_captured) {
            emit_op(OpCode::OP_CLOSE_UPVALUE, SourceLocation{});
        } else {
            emit_op(OpCode::OP_POP, SourceLocation{});
        }
        locals_.pop_back();
    }
}

// Pops locals deeper than target_depth without forgetting them; used by
// jumps that leave scopes early.
void Compiler::emit_scope_exit(int target_depth, SourceLocation loc) {
    for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
        if (it->depth <= target_depth) {
            break;
        }
        emit_op(it->is_captured ? OpCode::OP_CLOSE_UPVALUE : OpCode::OP_POP, loc);
    }
}

void Compiler::declare_local(const std::string& name, BindingId binding, SourceLocation loc) {
    if (locals_.size() >= MAX_LOCALS) {
        limit_error("too many local variables in function", loc);
    }
    locals_.push_back({name, binding, scope_depth_, false});
    max_locals_ = std::max(max_locals_, locals_.size());
}

int Compiler::resolve_local(BindingId binding) const {
    if (binding == kUnresolved) {
        return -1;
    }
    for (int i = static_cast<int>(locals_.size()) - 1; i >= 0; --i) {
        if (locals_[i].binding == binding) {
            return i;
        }
    }
    return -1;
}

int Compiler::resolve_upvalue(BindingId binding) {
    if (enclosing_ == nullptr) {
        return -1;
    }

    int local = enclosing_->resolve_local(binding);
    if (local != -1) {
        enclosing_->locals_[local].is_captured = true;
        return add_upvalue(static_cast<uint16_t>(local), true, SourceLocation{});
    }

    int upvalue = enclosing_->resolve_upvalue(binding);
    if (upvalue != -1) {
        return add_upvalue(static_cast<uint16_t>(upvalue), false, SourceLocation{});
    }
    return -1;
}

int Compiler::add_upvalue(uint16_t index, bool is_local, SourceLocation loc) {
    for (size_t i = 0; i < upvalues_.size(); ++i) {
        if (upvalues_[i].index == index && upvalues_[i].is_local == is_local) {
            return static_cast<int>(i);
        }
    }
    if (upvalues_.size() >= MAX_UPVALUES) {
        limit_error("too many captured variables in closure", loc);
    }
    upvalues_.push_back({index, is_local});
    return static_cast<int>(upvalues_.size() - 1);
}

void Compiler::emit_variable(const Resolution& resolution, Access access, SourceLocation loc) {
    if (!resolution.resolved()) {
        throw std::logic_error("unresolved name reached the compiler at line " + std::to_string(loc.line));
    }

    if (resolution.is_global) {
        OpCode op = access == Access::Get ? OpCode::OP_GET_GLOBAL
                  : access == Access::Set ? OpCode::OP_SET_GLOBAL
                  : OpCode::OP_MOVE_GLOBAL;
        emit_op(op, loc);
        emit_short(global_slot(resolution.binding, loc), loc);
        return;
    }

    int local = resolve_local(resolution.binding);
    if (local != -1) {
        OpCode op = access == Access::Get ? OpCode::OP_GET_LOCAL
                  : access == Access::Set ? OpCode::OP_SET_LOCAL
                  : OpCode::OP_MOVE_LOCAL;
        emit_op(op, loc);
        emit_short(static_cast<uint16_t>(local), loc);
        return;
    }

    int upvalue = resolve_upvalue(resolution.binding);
    if (upvalue != -1) {
        OpCode op = access == Access::Get ? OpCode::OP_GET_UPVALUE
                  : access == Access::Set ? OpCode::OP_SET_UPVALUE
                  : OpCode::OP_MOVE_UPVALUE;
        emit_op(op, loc);
        emit_short(static_cast<uint16_t>(upvalue), loc);
        return;
    }

    throw std::logic_error("binding is not visible from this function at line " + std::to_string(loc.line));
}

// ---- Emission ----

void Compiler::emit_op(OpCode op, SourceLocation loc) {
    chunk_->write_op(op, loc);
}

void Compiler::emit_short(uint16_t value, SourceLocation loc) {
    chunk_->write_short(value, loc);
}

void Compiler::emit_op_index(OpCode op, size_t index, SourceLocation loc, const char* what) {
    if (index > kMaxOperand) {
        limit_error(std::string("too many ") + what + " in one function", loc);
    }
    emit_op(op, loc);
    emit_short(static_cast<uint16_t>(index), loc);
}

void Compiler::emit_constant(Value value, SourceLocation loc) {
    size_t index = chunk_->add_constant(value);
    emit_op_index(OpCode::OP_CONSTANT, index, loc, "constants");
}

void Compiler::emit_string(const std::string& str, SourceLocation loc) {
    size_t index = chunk_->add_string(str);
    emit_op_index(OpCode::OP_STRING, index, loc, "string constants");
}

size_t Compiler::emit_jump(OpCode op, SourceLocation loc) {
    return chunk_->emit_jump(op, loc);
}

void Compiler::emit_loop(size_t loop_start, SourceLocation loc) {
    emit_op(OpCode::OP_LOOP, loc);
    size_t offset = chunk_->code.size() - loop_start + 2;
    if (offset > kMaxOperand) {
        limit_error("loop body too large", loc);
    }
    emit_short(static_cast<uint16_t>(offset), loc);
}

void Compiler::patch_jump(size_t offset, SourceLocation loc) {
    size_t jump = chunk_->code.size() - offset - 2;
    if (jump > kMaxOperand) {
        limit_error("too much code to jump over", loc);
    }
    chunk_->patch_jump(offset, static_cast<uint16_t>(jump));
}

void Compiler::limit_error(const std::string& message, SourceLocation loc) {
    throw CompileError(Diagnostic{ErrorKind::LimitExceeded, loc, message, {}, {}});
}

} // namespace kestrel
