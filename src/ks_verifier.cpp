// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "ks_verifier.hpp"
#include <vector>

namespace kestrel {

namespace {

constexpr size_t kMaxFunctionNesting = 256;

[[noreturn]] void fail(const FunctionPrototype& proto, size_t offset, const std::string& message) {
    Diagnostic diag;
    diag.kind = ErrorKind::MalformedBytecode;
    diag.message = message + " at offset " + std::to_string(offset);
    diag.context = proto.name;
    if (proto.chunk) {
        diag.location = proto.chunk->location_at(offset);
    }
    throw RuntimeError(std::move(diag));
}

bool ends_control_flow(OpCode op) {
    switch (op) {
        case OpCode::OP_RETURN:
        case OpCode::OP_HALT:
        case OpCode::OP_JUMP:
        case OpCode::OP_LOOP:
        case OpCode::OP_NO_MATCHING_ARM:
        case OpCode::OP_NO_MATCHING_OVERLOAD:
            return true;
        default:
            return false;
    }
}

bool valid_pattern(const CompiledPattern& pattern, size_t depth) {
    if (depth > kMaxFunctionNesting) {
        return false;
    }
    for (const auto& [field, sub] : pattern.fields) {
        if (pattern.kind != CompiledPattern::Kind::Destructure || !valid_pattern(sub, depth + 1)) {
            return false;
        }
    }
    return true;
}

class Verifier {
public:
    explicit Verifier(const BytecodeUnit& unit) : unit_(unit) {}

    void verify_function(const FunctionPrototype& proto, const FunctionPrototype* enclosing, size_t depth) {
        if (depth > kMaxFunctionNesting) {
            fail(proto, 0, "function nesting too deep");
        }
        if (!proto.chunk) {
            fail(proto, 0, "function has no chunk");
        }
        const Chunk& chunk = *proto.chunk;
        if (chunk.code.empty()) {
            fail(proto, 0, "empty chunk");
        }
        if (chunk.locations.size() != chunk.code.size()) {
            fail(proto, 0, "location table does not cover the code");
        }

        for (const auto& uv : proto.upvalues) {
            if (enclosing == nullptr) {
                fail(proto, 0, "script cannot capture upvalues");
            }
            size_t limit = uv.is_local ? enclosing->max_slots : enclosing->upvalues.size();
            if (uv.index >= limit) {
                fail(proto, 0, "upvalue descriptor out of range");
            }
        }
        for (const auto& pattern : chunk.patterns) {
            if (!valid_pattern(pattern, 0)) {
                fail(proto, 0, "malformed pattern");
            }
        }
        for (const auto& clause : chunk.clauses) {
            for (const auto& param : clause.params) {
                if (!valid_pattern(param, 0)) {
                    fail(proto, 0, "malformed parameter pattern");
                }
            }
        }

        // First pass: instruction boundaries.
        std::vector<bool> boundary(chunk.code.size() + 1, false);
        OpCode last = OpCode::OP_HALT;
        for (size_t offset = 0; offset < chunk.code.size();) {
            if (chunk.code[offset] >= kOpCodeCount) {
                fail(proto, offset, "unknown opcode " + std::to_string(chunk.code[offset]));
            }
            last = static_cast<OpCode>(chunk.code[offset]);
            size_t length = instruction_length(last);
            if (offset + length > chunk.code.size()) {
                fail(proto, offset, "truncated instruction");
            }
            boundary[offset] = true;
            offset += length;
        }
        if (!ends_control_flow(last)) {
            fail(proto, chunk.code.size(), "execution can run past the end of the chunk");
        }

        // Second pass: operands.
        for (size_t offset = 0; offset < chunk.code.size();) {
            auto op = static_cast<OpCode>(chunk.code[offset]);
            check_operands(proto, chunk, op, offset, boundary);
            offset += instruction_length(op);
        }

        for (const auto& fn : chunk.functions) {
            if (!fn) {
                fail(proto, 0, "null function prototype");
            }
            verify_function(*fn, &proto, depth + 1);
        }
    }

private:
    const BytecodeUnit& unit_;

    void check_operands(const FunctionPrototype& proto, const Chunk& chunk, OpCode op,
                        size_t offset, const std::vector<bool>& boundary) const {
        auto operand = [&](size_t i) { return static_cast<size_t>(chunk.read_short(offset + 1 + 2 * i)); };
        auto require = [&](bool ok, const char* what) {
            if (!ok) {
                fail(proto, offset, std::string(opcode_name(op)) + ": " + what);
            }
        };

        switch (op) {
            case OpCode::OP_CONSTANT:
                require(operand(0) < chunk.constants.size(), "constant index out of range");
                require(!chunk.constants[operand(0)].is_object(), "heap constant in constant pool");
                break;
            case OpCode::OP_STRING:
            case OpCode::OP_GET_FIELD:
            case OpCode::OP_SET_FIELD:
                require(operand(0) < chunk.strings.size(), "string index out of range");
                break;
            case OpCode::OP_GET_GLOBAL:
            case OpCode::OP_SET_GLOBAL:
            case OpCode::OP_MOVE_GLOBAL:
                require(operand(0) < unit_.global_names.size(), "global slot out of range");
                break;
            case OpCode::OP_GET_LOCAL:
            case OpCode::OP_SET_LOCAL:
            case OpCode::OP_MOVE_LOCAL:
                require(operand(0) < proto.max_slots, "local slot out of range");
                break;
            case OpCode::OP_GET_UPVALUE:
            case OpCode::OP_SET_UPVALUE:
            case OpCode::OP_MOVE_UPVALUE:
                require(operand(0) < proto.upvalues.size(), "upvalue index out of range");
                break;
            case OpCode::OP_JUMP:
            case OpCode::OP_JUMP_IF_FALSE:
            case OpCode::OP_JUMP_IF_TRUE: {
                size_t target = offset + 3 + operand(0);
                require(target < chunk.code.size() && boundary[target], "jump target is not an instruction");
                break;
            }
            case OpCode::OP_LOOP: {
                size_t back = operand(0);
                require(back <= offset + 3 && boundary[offset + 3 - back], "loop target is not an instruction");
                break;
            }
            case OpCode::OP_CLOSURE:
                require(operand(0) < chunk.functions.size(), "function index out of range");
                break;
            case OpCode::OP_RECORD:
                require(operand(0) < chunk.record_shapes.size(), "record shape out of range");
                break;
            case OpCode::OP_MATCH:
                require(operand(0) < chunk.patterns.size(), "pattern index out of range");
                require(operand(1) < proto.max_slots, "scrutinee slot out of range");
                break;
            case OpCode::OP_MATCH_ARGS:
                require(operand(0) < chunk.clauses.size(), "clause index out of range");
                break;
            default:
                break;
        }
    }
};

} // namespace

void verify_unit(const BytecodeUnit& unit) {
    if (unit.format_version != kBytecodeFormatVersion) {
        throw RuntimeError(ErrorKind::MalformedBytecode,
            "unsupported bytecode format version " + std::to_string(unit.format_version));
    }
    if (!unit.script) {
        throw RuntimeError(ErrorKind::MalformedBytecode, "unit has no script function");
    }
    if (unit.global_names.size() > kMaxOperand + 1) {
        throw RuntimeError(ErrorKind::MalformedBytecode, "too many globals");
    }
    for (const auto& [name, slot] : unit.entry_points) {
        if (slot >= unit.global_names.size()) {
            throw RuntimeError(ErrorKind::MalformedBytecode, "entry point '" + name + "' has no global slot");
        }
    }
    Verifier verifier(unit);
    verifier.verify_function(*unit.script, nullptr, 0);
}

} // namespace kestrel
