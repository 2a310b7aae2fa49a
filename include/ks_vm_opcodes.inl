#pragma once
#define OPCODE(T) template<> struct OpCodeHandler<T>
#define OP_BODY static void execute(VM& vm)

#include "ks_vm.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace kestrel {

    // Note: the primary template `OpCodeHandler` and `make_handler_table` are
    // declared in `ks_vm.hpp`. This file provides the specializations and
    // the table factory only.

    namespace detail {

        [[noreturn]] inline void type_error(const std::string& message) {
            throw RuntimeError(ErrorKind::TypeError, message);
        }

        inline std::string operand_types(const Value& a, const Value& b) {
            return std::string(a.type_name()) + " and " + std::string(b.type_name());
        }

        // Integer arithmetic wraps on overflow.
        inline Int wrap_add(Int a, Int b) {
            return static_cast<Int>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
        }
        inline Int wrap_sub(Int a, Int b) {
            return static_cast<Int>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
        }
        inline Int wrap_mul(Int a, Int b) {
            return static_cast<Int>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
        }

        // Int op Int stays Int; any Float operand promotes both.
        template<typename IntOp, typename FloatOp>
        inline void arithmetic(VM& vm, const char* symbol, IntOp int_op, FloatOp float_op) {
            Value b = vm.peek(0);
            Value a = vm.peek(1);
            if (!a.is_number() || !b.is_number()) {
                type_error(std::string("operator ") + symbol + " expects numbers, got " + operand_types(a, b));
            }
            Value result = (a.is_int() && b.is_int())
                ? Value::from_int(int_op(a.as_int(), b.as_int()))
                : Value::from_float(float_op(*a.try_as<Float>(), *b.try_as<Float>()));
            vm.pop();
            vm.pop();
            vm.push(result);
        }

        template<typename IntOp>
        inline void bitwise(VM& vm, const char* symbol, IntOp op) {
            Value b = vm.peek(0);
            Value a = vm.peek(1);
            if (!a.is_int() || !b.is_int()) {
                type_error(std::string("operator ") + symbol + " expects integers, got " + operand_types(a, b));
            }
            Value result = Value::from_int(op(a.as_int(), b.as_int()));
            vm.pop();
            vm.pop();
            vm.push(result);
        }

        inline Int checked_shift(Int count) {
            if (count < 0 || count > 63) {
                type_error("shift count " + std::to_string(count) + " out of range 0..63");
            }
            return count;
        }

        template<typename Compare>
        inline void comparison(VM& vm, const char* symbol, Compare cmp) {
            Value b = vm.peek(0);
            Value a = vm.peek(1);
            if (!a.is_number() || !b.is_number()) {
                type_error(std::string("operator ") + symbol + " expects numbers, got " + operand_types(a, b));
            }
            bool result = (a.is_int() && b.is_int())
                ? cmp(a.as_int(), b.as_int())
                : cmp(*a.try_as<Float>(), *b.try_as<Float>());
            vm.pop();
            vm.pop();
            vm.push(Value::from_bool(result));
        }

        inline RecordObject* expect_record(const Value& value, const char* what) {
            if (!value.is_object_of(ObjectType::Record)) {
                type_error(std::string(what) + " expects a Record, got " + std::string(value.type_name()));
            }
            return static_cast<RecordObject*>(value.as_object());
        }

        inline ArrayObject* expect_array(const Value& value, const char* what) {
            if (!value.is_object_of(ObjectType::Array)) {
                type_error(std::string(what) + " expects an Array, got " + std::string(value.type_name()));
            }
            return static_cast<ArrayObject*>(value.as_object());
        }

        inline size_t checked_index(const ArrayObject& array, const Value& index) {
            if (!index.is_int()) {
                type_error("array index must be Int, got " + std::string(index.type_name()));
            }
            Int i = index.as_int();
            if (i < 0 || static_cast<size_t>(i) >= array.elements.size()) {
                throw RuntimeError(ErrorKind::IndexOutOfRange,
                    "index " + std::to_string(i) + " out of range for array of length " +
                    std::to_string(array.elements.size()));
            }
            return static_cast<size_t>(i);
        }

        using RecordField = std::pair<std::string, Value>;

        // Tracked bytes of a field name once copied into a record.
        inline size_t key_bytes(const std::string& name) {
            return std::max(name.size(), std::string().capacity());
        }

    } // namespace detail

    // ---- Constants & stack ----

    template<>
    struct OpCodeHandler<OpCode::OP_CONSTANT> {
        static void execute(VM& vm) {
            uint16_t index = vm.read_short();
            vm.push(vm.chunk_->constants[index]);
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_STRING> {
        static void execute(VM& vm) {
            const std::string& str = vm.chunk_->strings[vm.read_short()];
            Object* str_obj = vm.gc_.allocate<StringObject>(str);
            vm.push(Value::from_object(str_obj));
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_NIL> {
        static void execute(VM& vm) {
            vm.push(Value::nil());
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_TRUE> {
        static void execute(VM& vm) {
            vm.push(Value::from_bool(true));
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_FALSE> {
        static void execute(VM& vm) {
            vm.push(Value::from_bool(false));
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_POP> {
        static void execute(VM& vm) {
            vm.pop();
        }
    };

    OPCODE(OpCode::OP_POPN)
    {
        OP_BODY
        {
            uint16_t count = vm.read_short();
            if (count > vm.stack_.size()) {
                throw RuntimeError(ErrorKind::MalformedBytecode, "stack underflow");
            }
            vm.stack_.resize(vm.stack_.size() - count);
        }
    };

    template<>
    struct OpCodeHandler<OpCode::OP_DUP> {
        static void execute(VM& vm) {
            vm.push(vm.peek(0));
        }
    };

    // ---- Arithmetic ----

    OPCODE(OpCode::OP_ADD)
    {
        OP_BODY
        {
            detail::arithmetic(vm, "+", detail::wrap_add, [](Float a, Float b) { return a + b; });
        }
    };

    OPCODE(OpCode::OP_SUBTRACT)
    {
        OP_BODY
        {
            detail::arithmetic(vm, "-", detail::wrap_sub, [](Float a, Float b) { return a - b; });
        }
    };

    OPCODE(OpCode::OP_MULTIPLY)
    {
        OP_BODY
        {
            detail::arithmetic(vm, "*", detail::wrap_mul, [](Float a, Float b) { return a * b; });
        }
    };

    OPCODE(OpCode::OP_DIVIDE)
    {
        OP_BODY
        {
            detail::arithmetic(vm, "/",
                [](Int a, Int b) {
                    if (b == 0) {
                        detail::type_error("integer division by zero");
                    }
                    if (a == std::numeric_limits<Int>::min() && b == -1) {
                        return a;
                    }
                    return a / b;
                },
                [](Float a, Float b) { return a / b; });
        }
    };

    OPCODE(OpCode::OP_MODULO)
    {
        OP_BODY
        {
            detail::arithmetic(vm, "%",
                [](Int a, Int b) -> Int {
                    if (b == 0) {
                        detail::type_error("integer modulo by zero");
                    }
                    if (b == -1) {
                        return 0;
                    }
                    return a % b;
                },
                [](Float a, Float b) { return std::fmod(a, b); });
        }
    };

    OPCODE(OpCode::OP_NEGATE)
    {
        OP_BODY
        {
            Value v = vm.peek(0);
            if (v.is_int()) {
                vm.pop();
                vm.push(Value::from_int(detail::wrap_sub(0, v.as_int())));
            } else if (v.is_float()) {
                vm.pop();
                vm.push(Value::from_float(-v.as_float()));
            } else {
                detail::type_error("unary - expects a number, got " + std::string(v.type_name()));
            }
        }
    };

    OPCODE(OpCode::OP_BITWISE_AND)
    {
        OP_BODY
        {
            detail::bitwise(vm, "&", [](Int a, Int b) { return a & b; });
        }
    };

    OPCODE(OpCode::OP_BITWISE_OR)
    {
        OP_BODY
        {
            detail::bitwise(vm, "|", [](Int a, Int b) { return a | b; });
        }
    };

    OPCODE(OpCode::OP_BITWISE_XOR)
    {
        OP_BODY
        {
            detail::bitwise(vm, "^", [](Int a, Int b) { return a ^ b; });
        }
    };

    OPCODE(OpCode::OP_BITWISE_NOT)
    {
        OP_BODY
        {
            Value v = vm.peek(0);
            if (!v.is_int()) {
                detail::type_error("operator ~ expects an integer, got " + std::string(v.type_name()));
            }
            vm.pop();
            vm.push(Value::from_int(~v.as_int()));
        }
    };

    OPCODE(OpCode::OP_LEFT_SHIFT)
    {
        OP_BODY
        {
            detail::bitwise(vm, "<<", [](Int a, Int b) {
                return static_cast<Int>(static_cast<uint64_t>(a) << detail::checked_shift(b));
            });
        }
    };

    OPCODE(OpCode::OP_RIGHT_SHIFT)
    {
        OP_BODY
        {
            detail::bitwise(vm, ">>", [](Int a, Int b) {
                return a >> detail::checked_shift(b);
            });
        }
    };

    // ---- Comparison ----

    OPCODE(OpCode::OP_EQUAL)
    {
        OP_BODY
        {
            Value b = vm.pop();
            Value a = vm.pop();
            vm.push(Value::from_bool(a.equals(b)));
        }
    };

    OPCODE(OpCode::OP_NOT_EQUAL)
    {
        OP_BODY
        {
            Value b = vm.pop();
            Value a = vm.pop();
            vm.push(Value::from_bool(!a.equals(b)));
        }
    };

    OPCODE(OpCode::OP_LESS)
    {
        OP_BODY
        {
            detail::comparison(vm, "<", [](auto a, auto b) { return a < b; });
        }
    };

    OPCODE(OpCode::OP_GREATER)
    {
        OP_BODY
        {
            detail::comparison(vm, ">", [](auto a, auto b) { return a > b; });
        }
    };

    OPCODE(OpCode::OP_LESS_EQUAL)
    {
        OP_BODY
        {
            detail::comparison(vm, "<=", [](auto a, auto b) { return a <= b; });
        }
    };

    OPCODE(OpCode::OP_GREATER_EQUAL)
    {
        OP_BODY
        {
            detail::comparison(vm, ">=", [](auto a, auto b) { return a >= b; });
        }
    };

    OPCODE(OpCode::OP_NOT)
    {
        OP_BODY
        {
            Value v = vm.pop();
            vm.push(Value::from_bool(!v.is_truthy()));
        }
    };

    // ---- Variables ----

    OPCODE(OpCode::OP_GET_GLOBAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            if (!vm.global_defined_[slot]) {
                throw RuntimeError(Diagnostic{ErrorKind::UndefinedGlobal, {},
                    "global '" + vm.unit_.global_names[slot] + "' read before it was defined",
                    vm.unit_.global_names[slot], {}});
            }
            vm.push(vm.globals_[slot]);
        }
    };

    OPCODE(OpCode::OP_SET_GLOBAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            vm.globals_[slot] = vm.peek(0);
            vm.global_defined_[slot] = true;
        }
    };

    OPCODE(OpCode::OP_MOVE_GLOBAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            if (!vm.global_defined_[slot]) {
                throw RuntimeError(Diagnostic{ErrorKind::UndefinedGlobal, {},
                    "global '" + vm.unit_.global_names[slot] + "' moved before it was defined",
                    vm.unit_.global_names[slot], {}});
            }
            vm.push(vm.globals_[slot]);
            vm.globals_[slot] = Value::nil();
        }
    };

    OPCODE(OpCode::OP_GET_LOCAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            vm.push(vm.local(slot));
        }
    };

    OPCODE(OpCode::OP_SET_LOCAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            vm.local(slot) = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_MOVE_LOCAL)
    {
        OP_BODY
        {
            uint16_t slot = vm.read_short();
            Value v = vm.local(slot);
            vm.push(v);
            vm.local(slot) = Value::nil();
        }
    };

    OPCODE(OpCode::OP_GET_UPVALUE)
    {
        OP_BODY
        {
            uint16_t index = vm.read_short();
            UpvalueObject* upvalue = vm.frame().closure->upvalues[index];
            vm.push(upvalue->location(vm.stack_));
        }
    };

    OPCODE(OpCode::OP_SET_UPVALUE)
    {
        OP_BODY
        {
            uint16_t index = vm.read_short();
            UpvalueObject* upvalue = vm.frame().closure->upvalues[index];
            upvalue->location(vm.stack_) = vm.peek(0);
        }
    };

    OPCODE(OpCode::OP_MOVE_UPVALUE)
    {
        OP_BODY
        {
            uint16_t index = vm.read_short();
            UpvalueObject* upvalue = vm.frame().closure->upvalues[index];
            Value v = upvalue->location(vm.stack_);
            vm.push(v);
            upvalue->location(vm.stack_) = Value::nil();
        }
    };

    OPCODE(OpCode::OP_CLOSE_UPVALUE)
    {
        OP_BODY
        {
            vm.close_upvalues(vm.stack_.size() - 1);
            vm.pop();
        }
    };

    // ---- Control flow ----

    OPCODE(OpCode::OP_JUMP)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            vm.ip_ += offset;
        }
    };

    OPCODE(OpCode::OP_JUMP_IF_FALSE)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            if (!vm.peek(0).is_truthy()) {
                vm.ip_ += offset;
            }
        }
    };

    OPCODE(OpCode::OP_JUMP_IF_TRUE)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            if (vm.peek(0).is_truthy()) {
                vm.ip_ += offset;
            }
        }
    };

    OPCODE(OpCode::OP_LOOP)
    {
        OP_BODY
        {
            uint16_t offset = vm.read_short();
            vm.ip_ -= offset;
        }
    };

    // ---- Functions ----

    OPCODE(OpCode::OP_CALL)
    {
        OP_BODY
        {
            uint16_t arg_count = vm.read_short();
            if (vm.stack_.size() < static_cast<size_t>(arg_count) + 1) {
                throw RuntimeError(ErrorKind::MalformedBytecode, "not enough values for function call");
            }
            Value callee = vm.stack_[vm.stack_.size() - arg_count - 1];
            vm.call_value(callee, arg_count);
        }
    };

    OPCODE(OpCode::OP_RETURN)
    {
        OP_BODY
        {
            Value result = vm.pop();
            vm.return_from_frame(result);
        }
    };

    OPCODE(OpCode::OP_CLOSURE)
    {
        OP_BODY
        {
            const auto& proto = vm.chunk_->functions[vm.read_short()];
            // Allocate everything before touching the stack.
            auto* closure = vm.gc_.allocate<ClosureObject>(proto);
            const size_t base = vm.frame().stack_base;
            for (size_t i = 0; i < proto->upvalues.size(); ++i) {
                const UpvalueDescriptor& uv = proto->upvalues[i];
                closure->upvalues[i] = uv.is_local
                    ? vm.capture_upvalue(base + uv.index)
                    : vm.frame().closure->upvalues[uv.index];
            }
            vm.push(Value::from_object(closure));
        }
    };

    // ---- Aggregates ----

    OPCODE(OpCode::OP_RECORD)
    {
        OP_BODY
        {
            const auto& shape = vm.chunk_->record_shapes[vm.read_short()];
            if (vm.stack_.size() < shape.size()) {
                throw RuntimeError(ErrorKind::MalformedBytecode, "stack underflow");
            }
            size_t bytes = sizeof(RecordObject) + shape.size() * sizeof(detail::RecordField);
            for (const std::string& name : shape) {
                bytes += detail::key_bytes(name);
            }
            vm.gc_.ensure_headroom(bytes);
            auto* record = vm.gc_.allocate<RecordObject>();
            record->fields.reserve(shape.size());
            const size_t first = vm.stack_.size() - shape.size();
            for (size_t i = 0; i < shape.size(); ++i) {
                if (Value* existing = record->find(shape[i])) {
                    *existing = vm.stack_[first + i];
                } else {
                    record->fields.emplace_back(shape[i], vm.stack_[first + i]);
                }
            }
            vm.gc_.record_allocation_delta(*record, record->memory_size());
            vm.stack_.resize(first);
            vm.push(Value::from_object(record));
        }
    };

    OPCODE(OpCode::OP_GET_FIELD)
    {
        OP_BODY
        {
            const std::string& name = vm.chunk_->strings[vm.read_short()];
            RecordObject* record = detail::expect_record(vm.peek(0), "field access");
            const Value* field = record->find(name);
            if (!field) {
                throw RuntimeError(Diagnostic{ErrorKind::UnknownField, {},
                    "record has no field '" + name + "'", name, {}});
            }
            Value v = *field;
            vm.pop();
            vm.push(v);
        }
    };

    OPCODE(OpCode::OP_SET_FIELD)
    {
        OP_BODY
        {
            const std::string& name = vm.chunk_->strings[vm.read_short()];
            Value value = vm.peek(0);
            RecordObject* record = detail::expect_record(vm.peek(1), "field assignment");
            if (Value* field = record->find(name)) {
                *field = value;
            } else {
                auto& fields = record->fields;
                const size_t capacity = fields.size() < fields.capacity()
                    ? fields.capacity()
                    : fields.capacity() + std::max<size_t>(fields.capacity(), 1);
                vm.gc_.ensure_headroom((capacity - fields.capacity()) * sizeof(detail::RecordField) +
                    detail::key_bytes(name));
                fields.reserve(capacity);
                fields.emplace_back(name, value);
                vm.gc_.record_allocation_delta(*record, record->memory_size());
            }
            vm.pop();
            vm.pop();
            vm.push(value);
        }
    };

    OPCODE(OpCode::OP_ARRAY)
    {
        OP_BODY
        {
            uint16_t count = vm.read_short();
            if (vm.stack_.size() < count) {
                throw RuntimeError(ErrorKind::MalformedBytecode, "stack underflow");
            }
            vm.gc_.ensure_headroom(sizeof(ArrayObject) + count * sizeof(Value));
            auto* array = vm.gc_.allocate<ArrayObject>();
            const size_t first = vm.stack_.size() - count;
            array->elements.assign(vm.stack_.begin() + static_cast<std::ptrdiff_t>(first), vm.stack_.end());
            vm.gc_.record_allocation_delta(*array, array->memory_size());
            vm.stack_.resize(first);
            vm.push(Value::from_object(array));
        }
    };

    OPCODE(OpCode::OP_GET_INDEX)
    {
        OP_BODY
        {
            Value index = vm.peek(0);
            ArrayObject* array = detail::expect_array(vm.peek(1), "indexing");
            Value v = array->elements[detail::checked_index(*array, index)];
            vm.pop();
            vm.pop();
            vm.push(v);
        }
    };

    OPCODE(OpCode::OP_SET_INDEX)
    {
        OP_BODY
        {
            Value value = vm.peek(0);
            Value index = vm.peek(1);
            ArrayObject* array = detail::expect_array(vm.peek(2), "index assignment");
            array->elements[detail::checked_index(*array, index)] = value;
            vm.pop();
            vm.pop();
            vm.pop();
            vm.push(value);
        }
    };

    // ---- Pattern matching ----

    OPCODE(OpCode::OP_MATCH)
    {
        OP_BODY
        {
            const CompiledPattern& pattern = vm.chunk_->patterns[vm.read_short()];
            uint16_t slot = vm.read_short();
            std::vector<Value> bindings;
            if (!VM::match_pattern(pattern, vm.local(slot), bindings)) {
                vm.push(Value::from_bool(false));
                return;
            }
            for (const Value& v : bindings) {
                vm.push(v);
            }
            vm.push(Value::from_bool(true));
        }
    };

    OPCODE(OpCode::OP_MATCH_ARGS)
    {
        OP_BODY
        {
            const ClauseSignature& clause = vm.chunk_->clauses[vm.read_short()];
            const CallFrame& frame = vm.frame();
            std::vector<Value> bindings;
            bool matched = frame.arg_count == clause.params.size();
            for (size_t i = 0; matched && i < clause.params.size(); ++i) {
                matched = VM::match_pattern(clause.params[i], vm.stack_[frame.stack_base + i], bindings);
            }
            if (!matched) {
                vm.push(Value::from_bool(false));
                return;
            }
            for (const Value& v : bindings) {
                vm.push(v);
            }
            vm.push(Value::from_bool(true));
        }
    };

    OPCODE(OpCode::OP_NO_MATCHING_ARM)
    {
        OP_BODY
        {
            (void)vm;
            throw RuntimeError(ErrorKind::NoMatchingArm, "no cond arm matched");
        }
    };

    OPCODE(OpCode::OP_NO_MATCHING_OVERLOAD)
    {
        OP_BODY
        {
            const CallFrame& frame = vm.frame();
            const std::string& name = frame.closure->name();
            throw RuntimeError(Diagnostic{ErrorKind::NoMatchingOverload, {},
                "no clause of '" + name + "' accepts " + std::to_string(frame.arg_count) + " argument(s)",
                name, {}});
        }
    };

    // ---- I/O ----

    OPCODE(OpCode::OP_PRINT)
    {
        OP_BODY
        {
            Value val = vm.pop();
            *vm.out_ << val.to_string() << '\n';
        }
    };

    // ---- End ----

    OPCODE(OpCode::OP_HALT)
    {
        OP_BODY
        {
            vm.return_from_frame(Value::nil());
        }
    };

    constexpr std::array<OpHandlerFunc, 256> make_handler_table()
    {
        std::array<OpHandlerFunc, 256> tbl{};
        tbl.fill(nullptr);

#define X(op, operands) tbl[static_cast<uint8_t>(OpCode::OP_##op)] = &OpCodeHandler<OpCode::OP_##op>::execute;
#include "ks_opcodes.def"
#undef X

        return tbl;
    }

} // namespace kestrel

#undef OPCODE
#undef OP_BODY
