#include "ks_vm.hpp"
#include "ks_verifier.hpp"
#include <algorithm>
#include <iomanip>

namespace kestrel {

    // Instantiate the OPCODE handler table from the constexpr factory in the
    // included `ks_vm_opcodes.inl`.
    const std::array<OpHandlerFunc, 256> g_opcode_handlers = make_handler_table();

    namespace {

        // Keeps host values reachable while the VM runs on their behalf.
        class PinGuard {
        public:
            PinGuard(std::vector<Value>& pinned, const std::vector<Value>& values)
                : pinned_(pinned), previous_size_(pinned.size()) {
                pinned_.insert(pinned_.end(), values.begin(), values.end());
            }
            ~PinGuard() {
                pinned_.resize(previous_size_);
            }
            PinGuard(const PinGuard&) = delete;
            PinGuard& operator=(const PinGuard&) = delete;
        private:
            std::vector<Value>& pinned_;
            size_t previous_size_;
        };

    } // namespace

    VM::VM(VMConfig config, GcConfig gc_config)
        : config_(config), gc_(gc_config) {
        stack_.reserve(config_.initial_stack_size);
    }

    VM::~VM() {
        if (config_.enable_debug) {
            print_stats();
        }
    }

    void VM::push(Value val) {
        if (stack_.size() >= config_.max_stack_size) {
            throw RuntimeError(ErrorKind::StackOverflow, "operand stack overflow");
        }
        stack_.push_back(val);
    }

    Value VM::pop() {
        if (stack_.empty()) {
            throw RuntimeError(ErrorKind::MalformedBytecode, "stack underflow");
        }
        Value val = stack_.back();
        stack_.pop_back();
        return val;
    }

    Value VM::peek(size_t offset) const {
        if (offset >= stack_.size()) {
            throw RuntimeError(ErrorKind::MalformedBytecode, "stack underflow");
        }
        return stack_[stack_.size() - 1 - offset];
    }

    uint8_t VM::read_byte() {
        return chunk_->code[ip_++];
    }

    uint16_t VM::read_short() {
        uint16_t value = chunk_->read_short(ip_);
        ip_ += 2;
        return value;
    }

    Value& VM::local(uint16_t slot) {
        size_t index = frame().stack_base + slot;
        if (index >= stack_.size()) {
            throw RuntimeError(ErrorKind::MalformedBytecode, "local slot beyond the operand stack");
        }
        return stack_[index];
    }

    // ---- Entry points ----

    Value VM::execute(const BytecodeUnit& unit) {
        verify_unit(unit);

        reset_execution_state();
        host_values_.clear();
        unit_ = unit;
        globals_.assign(unit_.global_names.size(), Value::nil());
        global_defined_.assign(unit_.global_names.size(), false);
        result_ = Value::nil();

        auto* script = allocate_with_retry<ClosureObject>(unit_.script);
        push(Value::from_object(script));
        call_frames_.emplace_back(1, 0, nullptr, script, 0);
        chunk_ = unit_.script->chunk.get();
        ip_ = 0;
        return run_loop();
    }

    Value VM::call(const std::string& function, const std::vector<Value>& args) {
        PinGuard pin(pinned_, args);

        auto entry = unit_.entry_points.find(function);
        if (entry == unit_.entry_points.end()) {
            throw RuntimeError(Diagnostic{ErrorKind::UndefinedGlobal, {},
                "no global function named '" + function + "'", function, {}});
        }
        if (!global_defined_[entry->second]) {
            throw RuntimeError(Diagnostic{ErrorKind::UndefinedGlobal, {},
                "global function '" + function + "' is not defined yet", function, {}});
        }
        if (args.size() > kMaxOperand) {
            throw RuntimeError(ErrorKind::StackOverflow, "too many arguments");
        }

        reset_execution_state();
        host_values_.clear();
        Value callee = globals_[entry->second];
        try {
            push(callee);
            for (const Value& arg : args) {
                push(arg);
            }
            call_value(callee, static_cast<uint16_t>(args.size()));
        } catch (const RuntimeError& error) {
            RuntimeError failed(error.diagnostic());
            failed.diagnostic().context = function;
            reset_execution_state();
            throw failed;
        }
        return run_loop();
    }

    ExecutionResult VM::run(const BytecodeUnit& unit, const std::string& entry, const std::vector<Value>& args) {
        PinGuard pin(pinned_, args);
        try {
            Value value = execute(unit);
            if (!entry.empty()) {
                value = call(entry, args);
            }
            return ExecutionResult{value, std::nullopt};
        } catch (const RuntimeError& error) {
            return ExecutionResult{std::nullopt, error.diagnostic()};
        }
    }

    Value VM::make_string(std::string text) {
        Value value = Value::from_object(allocate_with_retry<StringObject>(std::move(text)));
        host_values_.push_back(value);
        return value;
    }

    std::optional<Value> VM::get_global(const std::string& name) const {
        auto slot = unit_.find_global(name);
        if (!slot || *slot >= globals_.size() || !global_defined_[*slot]) {
            return std::nullopt;
        }
        return globals_[*slot];
    }

    // ---- Interpreter loop ----

    Value VM::run_loop() {
        halted_ = false;
        bool retried = false;
        while (!halted_) {
            try {
                if (gc_.should_collect()) {
                    collect_garbage();
                }
                instruction_start_ = ip_;
                if (config_.trace_execution) {
                    chunk_->disassemble_instruction(ip_, std::cerr);
                }
                dispatch();
                retried = false;
            } catch (const HeapExhausted& exhausted) {
                if (retried) {
                    raise(RuntimeError(ErrorKind::OutOfMemory,
                        "cannot allocate " + std::to_string(exhausted.requested()) +
                        " bytes after a full collection"));
                }
                // Handlers allocate before they touch the stack, so the
                // instruction can simply run again.
                KS_TRACE("heap exhausted at pc %zu, collecting", instruction_start_);
                ip_ = instruction_start_;
                collect_garbage();
                retried = true;
            } catch (const std::bad_alloc&) {
                raise(RuntimeError(ErrorKind::OutOfMemory, "host allocation failed"));
            } catch (const RuntimeError& error) {
                raise(error);
            }
        }

        Value result = result_;
        halted_ = false;
        return result;
    }

    void VM::dispatch() {
        OpCode op = static_cast<OpCode>(read_byte());
        auto handler = g_opcode_handlers[static_cast<uint8_t>(op)];
        if (!handler) {
            throw RuntimeError(ErrorKind::MalformedBytecode,
                "unknown opcode " + std::to_string(static_cast<int>(op)));
        }
        handler(*this);
    }

    void VM::raise(const RuntimeError& error) {
        Diagnostic diag = error.diagnostic();

        if (chunk_ && !diag.location.known()) {
            diag.location = chunk_->location_at(instruction_start_);
        }

        // Innermost first. Callers are suspended just after their CALL.
        size_t pc = instruction_start_;
        const Chunk* chunk = chunk_;
        for (auto it = call_frames_.rbegin(); it != call_frames_.rend(); ++it) {
            diag.frames.push_back(FrameInfo{
                it->closure ? it->closure->name() : std::string("<script>"),
                pc,
                chunk ? chunk->location_at(pc) : SourceLocation{}});
            chunk = it->chunk;
            pc = it->return_address >= instruction_length(OpCode::OP_CALL)
                ? it->return_address - instruction_length(OpCode::OP_CALL)
                : 0;
        }

        if (diag.context.empty() && !diag.frames.empty()) {
            diag.context = diag.frames.front().function;
        }

        reset_execution_state();
        throw RuntimeError(std::move(diag));
    }

    void VM::reset_execution_state() {
        // Closures that escaped keep their captured values.
        close_upvalues(0);
        stack_.clear();
        call_frames_.clear();
        chunk_ = nullptr;
        ip_ = 0;
        instruction_start_ = 0;
        halted_ = false;
    }

    // ---- Calls ----

    void VM::call_value(Value callee, uint16_t arg_count) {
        if (!callee.is_object_of(ObjectType::Closure)) {
            throw RuntimeError(Diagnostic{ErrorKind::NotCallable, {},
                "cannot call a value of type " + std::string(callee.type_name()),
                std::string(callee.type_name()), {}});
        }
        auto* closure = static_cast<ClosureObject*>(callee.as_object());

        if (call_frames_.size() >= config_.max_call_depth) {
            throw RuntimeError(Diagnostic{ErrorKind::StackOverflow, {},
                "call depth limit of " + std::to_string(config_.max_call_depth) + " exceeded",
                closure->name(), {}});
        }

        size_t base = stack_.size() - arg_count;
        size_t needed = base + std::max<size_t>(arg_count, closure->proto->max_slots);
        if (needed > config_.max_stack_size) {
            throw RuntimeError(Diagnostic{ErrorKind::StackOverflow, {},
                "operand stack limit exceeded calling '" + closure->name() + "'",
                closure->name(), {}});
        }

        call_frames_.emplace_back(base, ip_, chunk_, closure, arg_count);
        chunk_ = closure->proto->chunk.get();
        ip_ = 0;
    }

    void VM::return_from_frame(Value result) {
        CallFrame frame = call_frames_.back();
        call_frames_.pop_back();

        close_upvalues(frame.stack_base);
        stack_.resize(frame.stack_base - 1);

        if (!frame.chunk) {
            // Back at the host boundary.
            result_ = result;
            halted_ = true;
            chunk_ = nullptr;
            return;
        }

        chunk_ = frame.chunk;
        ip_ = frame.return_address;
        push(result);
    }

    // ---- Upvalues ----

    UpvalueObject* VM::capture_upvalue(size_t slot) {
        UpvalueObject* prev = nullptr;
        UpvalueObject* current = open_upvalues_;

        while (current && current->slot > slot) {
            prev = current;
            current = current->next_open;
        }

        if (current && current->slot == slot) {
            return current;
        }

        auto* created = gc_.allocate<UpvalueObject>(slot);
        created->next_open = current;
        if (!prev) {
            open_upvalues_ = created;
        } else {
            prev->next_open = created;
        }
        return created;
    }

    void VM::close_upvalues(size_t from_slot) {
        while (open_upvalues_ && open_upvalues_->slot >= from_slot) {
            UpvalueObject* upvalue = open_upvalues_;
            // A slot captured by CLOSURE may not have been pushed yet.
            upvalue->closed = upvalue->slot < stack_.size() ? stack_[upvalue->slot] : Value::nil();
            upvalue->is_open = false;
            open_upvalues_ = upvalue->next_open;
            upvalue->next_open = nullptr;
        }
    }

    // ---- Pattern matching ----

    bool VM::match_pattern(const CompiledPattern& pattern, const Value& value, std::vector<Value>& bindings) {
        switch (pattern.kind) {
            case CompiledPattern::Kind::Wildcard:
                return true;
            case CompiledPattern::Kind::Binding:
                bindings.push_back(value);
                return true;
            case CompiledPattern::Kind::Literal:
                return value.equals(pattern.literal);
            case CompiledPattern::Kind::StringLiteral:
                return value.is_object_of(ObjectType::String) &&
                    static_cast<StringObject*>(value.as_object())->data == pattern.text;
            case CompiledPattern::Kind::Destructure: {
                if (!value.is_object_of(ObjectType::Record)) {
                    return false;
                }
                const auto* record = static_cast<const RecordObject*>(value.as_object());
                for (const auto& [name, sub_pattern] : pattern.fields) {
                    const Value* field = record->find(name);
                    if (!field || !match_pattern(sub_pattern, *field, bindings)) {
                        return false;
                    }
                }
                return true;
            }
        }
        return false;
    }

    // ---- Memory ----

    void VM::collect_garbage() {
        gc_.collect(*this);
    }

    void VM::trace_roots(GarbageCollector& gc) {
        for (const Value& value : stack_) {
            gc.mark_value(value);
        }
        for (const Value& value : globals_) {
            gc.mark_value(value);
        }
        for (const CallFrame& frame : call_frames_) {
            gc.mark_object(frame.closure);
        }
        for (UpvalueObject* upvalue = open_upvalues_; upvalue != nullptr; upvalue = upvalue->next_open) {
            gc.mark_object(upvalue);
        }
        for (const Value& value : pinned_) {
            gc.mark_value(value);
        }
        for (const Value& value : host_values_) {
            gc.mark_value(value);
        }
        gc.mark_value(result_);
    }

    void VM::print_stats() const {
        const MemoryStats& stats = gc_.stats();
        std::cout << "\n=== Kestrel VM Statistics ===\n";
        std::cout << "Total Allocated:  " << std::setw(10) << stats.total_allocated << " bytes\n";
        std::cout << "Total Freed:      " << std::setw(10) << stats.total_freed << " bytes\n";
        std::cout << "Live Bytes:       " << std::setw(10) << stats.bytes_live << " bytes\n";
        std::cout << "Current Objects:  " << std::setw(10) << stats.current_objects << "\n";
        std::cout << "Peak Objects:     " << std::setw(10) << stats.peak_objects << "\n";
        std::cout << "Collections:      " << std::setw(10) << stats.collections << "\n";
        std::cout << "Reused Blocks:    " << std::setw(10) << stats.reused_blocks << "\n";
        std::cout << "=============================\n";
    }

} // namespace kestrel
