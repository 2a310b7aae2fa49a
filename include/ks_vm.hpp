#pragma once

#include "ks_core.hpp"
#include "ks_value.hpp"
#include "ks_chunk.hpp"
#include "ks_gc.hpp"
#include <array>
#include <stdexcept>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

    // Primary OpCodeHandler template. Specializations in
    // `ks_vm_opcodes.inl` provide `execute` for every opcode.
    template<OpCode op>
    struct OpCodeHandler {
        static void execute(VM& vm) {
            (void)vm;
            throw std::logic_error("Unhandled opcode (no handler specialization)");
        }
    };

    // VM Configuration
    struct VMConfig {
        size_t initial_stack_size = 256;
        size_t max_stack_size = 65536;
        size_t max_call_depth = 1024;
        bool enable_debug = false;     // print memory statistics on destruction
        bool trace_execution = false;  // disassemble each instruction to std::cerr
    };

    // Outcome of VM::run: the final value, or the diagnostic that ended the run.
    struct ExecutionResult {
        std::optional<Value> value;
        std::optional<Diagnostic> error;

        bool ok() const { return !error.has_value(); }
    };

    // Call Frame for function calls
    class CallFrame {
    public:
        size_t stack_base;       // slot 0 of this frame (first argument)
        size_t return_address;   // caller ip after the CALL
        const Chunk* chunk;      // caller chunk, nullptr when called from the host
        ClosureObject* closure;  // function being executed
        uint16_t arg_count;

        CallFrame(size_t base, size_t ret_addr, const Chunk* caller_chunk, ClosureObject* c, uint16_t args)
            : stack_base(base),
              return_address(ret_addr),
              chunk(caller_chunk),
              closure(c),
              arg_count(args) {
        }
    };

    // Virtual Machine
    class VM : public RootSource {
        // Friend declaration for OpCode handlers
        template<OpCode op>
        friend struct OpCodeHandler;

    private:
        VMConfig config_;
        GarbageCollector gc_;
        std::ostream* out_{ &std::cout };

        // Loaded unit and global table
        BytecodeUnit unit_;
        std::vector<Value> globals_;
        std::vector<bool> global_defined_;

        // Execution state
        std::vector<Value> stack_;
        std::vector<CallFrame> call_frames_;
        const Chunk* chunk_{ nullptr };
        size_t ip_{ 0 };
        size_t instruction_start_{ 0 };
        UpvalueObject* open_upvalues_{ nullptr };
        bool halted_{ false };
        Value result_;

        // Host values kept alive for the duration of a run
        std::vector<Value> pinned_;
        // make_string results not yet handed to execute or call
        std::vector<Value> host_values_;

    public:
        explicit VM(VMConfig config = VMConfig{}, GcConfig gc_config = GcConfig{});
        ~VM() override;

        // Prevent copying
        VM(const VM&) = delete;
        VM& operator=(const VM&) = delete;

        // Verifies and loads the unit, then runs the top-level script.
        // Throws RuntimeError.
        Value execute(const BytecodeUnit& unit);

        // Calls a global function of the loaded unit. Throws RuntimeError.
        Value call(const std::string& function, const std::vector<Value>& args);

        // execute + optional call; failures become the result's diagnostic.
        ExecutionResult run(const BytecodeUnit& unit,
                            const std::string& entry = {},
                            const std::vector<Value>& args = {});

        // Host-side allocation, e.g. string arguments for call(). The string
        // stays reachable until the next execute, call or run; pass it as an
        // argument to keep it alive past that point.
        Value make_string(std::string text);

        // Global variables
        std::optional<Value> get_global(const std::string& name) const;

        // Output of the print statement
        void set_output(std::ostream& out) { out_ = &out; }

        // Stack operations
        void push(Value val);
        Value pop();
        Value peek(size_t offset = 0) const;
        size_t stack_size() const { return stack_.size(); }

        // Memory
        GarbageCollector& heap() { return gc_; }
        const GarbageCollector& heap() const { return gc_; }
        void collect_garbage();
        void trace_roots(GarbageCollector& gc) override;

        // Statistics
        const MemoryStats& get_stats() const { return gc_.stats(); }
        void print_stats() const;

        // Configuration
        const VMConfig& config() const { return config_; }

    private:
        Value run_loop();
        void dispatch();
        void reset_execution_state();
        // Adds location and call trace, resets the VM and rethrows.
        [[noreturn]] void raise(const RuntimeError& error);

        uint8_t read_byte();
        uint16_t read_short();
        CallFrame& frame() { return call_frames_.back(); }
        Value& local(uint16_t slot);

        template<typename T, typename... Args>
        T* allocate_with_retry(Args&&... args);

        void call_value(Value callee, uint16_t arg_count);
        void return_from_frame(Value result);

        UpvalueObject* capture_upvalue(size_t slot);
        void close_upvalues(size_t from_slot);

        static bool match_pattern(const CompiledPattern& pattern, const Value& value, std::vector<Value>& bindings);
    };

    // Opcode dispatch table (function pointer type) instantiated at program start
    using OpHandlerFunc = void(*)(VM&);
    extern const std::array<OpHandlerFunc, 256> g_opcode_handlers;

    // Build the handler table at program startup
    constexpr std::array<OpHandlerFunc, 256> make_handler_table();

    // Template implementation
    template<typename T, typename... Args>
    T* VM::allocate_with_retry(Args&&... args) {
        try {
            return gc_.allocate<T>(args...);
        } catch (const std::bad_alloc&) {
            collect_garbage();
        }
        try {
            return gc_.allocate<T>(std::forward<Args>(args)...);
        } catch (const std::bad_alloc&) {
            throw RuntimeError(ErrorKind::OutOfMemory, "heap exhausted after a full collection");
        }
    }

} // namespace kestrel

#include "ks_vm_opcodes.inl"
