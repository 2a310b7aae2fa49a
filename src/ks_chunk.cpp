#include "ks_chunk.hpp"
#include <iomanip>

namespace kestrel {

namespace {

struct OpCodeInfo {
    const char* name;
    size_t operands;
};

constexpr OpCodeInfo kOpCodeInfo[] = {
#define X(name, operands) {"OP_" #name, operands},
#include "ks_opcodes.def"
#undef X
};

} // namespace

const char* opcode_name(OpCode op) {
    auto index = static_cast<size_t>(op);
    return index < kOpCodeCount ? kOpCodeInfo[index].name : "OP_UNKNOWN";
}

size_t opcode_operand_count(OpCode op) {
    auto index = static_cast<size_t>(op);
    return index < kOpCodeCount ? kOpCodeInfo[index].operands : 0;
}

size_t CompiledPattern::binding_count() const {
    switch (kind) {
        case Kind::Binding:
            return 1;
        case Kind::Destructure: {
            size_t count = 0;
            for (const auto& [field, sub] : fields) {
                count += sub.binding_count();
            }
            return count;
        }
        default:
            return 0;
    }
}

void Chunk::write(uint8_t byte, SourceLocation loc) {
    code.push_back(byte);
    locations.push_back(loc);
}

void Chunk::write_op(OpCode op, SourceLocation loc) {
    write(static_cast<uint8_t>(op), loc);
}

void Chunk::write_short(uint16_t value, SourceLocation loc) {
    write(static_cast<uint8_t>((value >> 8) & 0xFF), loc);
    write(static_cast<uint8_t>(value & 0xFF), loc);
}

size_t Chunk::add_constant(Value value) {
    constants.push_back(value);
    return constants.size() - 1;
}

size_t Chunk::add_string(const std::string& str) {
    for (size_t i = 0; i < strings.size(); ++i) {
        if (strings[i] == str) {
            return i;
        }
    }
    strings.push_back(str);
    return strings.size() - 1;
}

size_t Chunk::add_pattern(CompiledPattern pattern) {
    patterns.push_back(std::move(pattern));
    return patterns.size() - 1;
}

size_t Chunk::add_clause(ClauseSignature clause) {
    clauses.push_back(std::move(clause));
    return clauses.size() - 1;
}

size_t Chunk::add_record_shape(std::vector<std::string> shape) {
    for (size_t i = 0; i < record_shapes.size(); ++i) {
        if (record_shapes[i] == shape) {
            return i;
        }
    }
    record_shapes.push_back(std::move(shape));
    return record_shapes.size() - 1;
}

size_t Chunk::add_function(std::shared_ptr<FunctionPrototype> proto) {
    functions.push_back(std::move(proto));
    return functions.size() - 1;
}

size_t Chunk::emit_jump(OpCode op, SourceLocation loc) {
    write_op(op, loc);
    write(0xFF, loc);
    write(0xFF, loc);
    return code.size() - 2;
}

void Chunk::patch_jump(size_t operand_offset, uint16_t distance) {
    code[operand_offset] = static_cast<uint8_t>((distance >> 8) & 0xFF);
    code[operand_offset + 1] = static_cast<uint8_t>(distance & 0xFF);
}

void Chunk::disassemble(const std::string& name, std::ostream& out) const {
    out << "== " << name << " ==\n";
    for (size_t offset = 0; offset < code.size();) {
        offset = disassemble_instruction(offset, out);
    }
    for (const auto& fn : functions) {
        if (fn && fn->chunk) {
            fn->chunk->disassemble(fn->name, out);
        }
    }
}

size_t Chunk::disassemble_instruction(size_t offset, std::ostream& out) const {
    out << std::setw(4) << std::setfill('0') << offset << std::setfill(' ') << " ";

    if (offset > 0 && location_at(offset).line == location_at(offset - 1).line) {
        out << "   | ";
    } else {
        out << std::setw(4) << location_at(offset).line << " ";
    }

    auto op = static_cast<OpCode>(code[offset]);
    if (static_cast<size_t>(op) >= kOpCodeCount) {
        out << "Unknown opcode " << static_cast<int>(code[offset]) << "\n";
        return offset + 1;
    }

    const size_t length = instruction_length(op);
    if (offset + length > code.size()) {
        out << opcode_name(op) << " <truncated>\n";
        return code.size();
    }

    out << std::setw(16) << std::left << opcode_name(op) << std::right;
    switch (op) {
        case OpCode::OP_CONSTANT: {
            uint16_t index = read_short(offset + 1);
            out << " " << std::setw(4) << index << " '";
            if (index < constants.size()) {
                out << constants[index].to_string();
            }
            out << "'";
            break;
        }
        case OpCode::OP_STRING:
        case OpCode::OP_GET_FIELD:
        case OpCode::OP_SET_FIELD: {
            uint16_t index = read_short(offset + 1);
            out << " " << std::setw(4) << index << " '";
            if (index < strings.size()) {
                out << strings[index];
            }
            out << "'";
            break;
        }
        case OpCode::OP_JUMP:
        case OpCode::OP_JUMP_IF_FALSE:
        case OpCode::OP_JUMP_IF_TRUE:
            out << " " << std::setw(4) << offset << " -> " << (offset + 3 + read_short(offset + 1));
            break;
        case OpCode::OP_LOOP:
            out << " " << std::setw(4) << offset << " -> " << (offset + 3 - read_short(offset + 1));
            break;
        case OpCode::OP_CLOSURE: {
            uint16_t index = read_short(offset + 1);
            out << " " << std::setw(4) << index;
            if (index < functions.size() && functions[index]) {
                out << " <" << functions[index]->name << ">";
            }
            break;
        }
        default:
            for (size_t i = 0; i < opcode_operand_count(op); ++i) {
                out << " " << read_short(offset + 1 + 2 * i);
            }
            break;
    }
    out << "\n";
    return offset + length;
}

std::optional<uint16_t> BytecodeUnit::find_global(const std::string& name) const {
    for (size_t i = 0; i < global_names.size(); ++i) {
        if (global_names[i] == name) {
            return static_cast<uint16_t>(i);
        }
    }
    return std::nullopt;
}

} // namespace kestrel
