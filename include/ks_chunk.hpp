#pragma once

#include "ks_diagnostics.hpp"
#include "ks_value.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kestrel {

// Opcodes
enum class OpCode : uint8_t {
#define X(name, operands) OP_##name,
#include "ks_opcodes.def"
#undef X
};

inline constexpr size_t kOpCodeCount = 0
#define X(name, operands) + 1
#include "ks_opcodes.def"
#undef X
    ;

const char* opcode_name(OpCode op);
size_t opcode_operand_count(OpCode op);

// Encoded size of an instruction, opcode byte included.
inline size_t instruction_length(OpCode op) {
    return 1 + 2 * opcode_operand_count(op);
}

// Bumped whenever the encoding of a BytecodeUnit changes.
inline constexpr uint32_t kBytecodeFormatVersion = 1;

// Largest index an instruction operand can carry.
inline constexpr size_t kMaxOperand = UINT16_MAX;

struct Chunk;

// Pattern tree as stored in a chunk and interpreted by MATCH / MATCH_ARGS.
struct CompiledPattern {
    enum class Kind : uint8_t {
        Wildcard,
        Binding,        // pushes the matched value
        Literal,        // scalar compared with Value::equals
        StringLiteral,  // String compared by content
        Destructure,    // Record with every listed field matching
    };

    Kind kind{Kind::Wildcard};
    Value literal;
    std::string text;
    std::vector<std::pair<std::string, CompiledPattern>> fields;

    // Number of values a successful match pushes.
    size_t binding_count() const;
};

// Parameter patterns of one function clause.
struct ClauseSignature {
    std::vector<CompiledPattern> params;
};

struct UpvalueDescriptor {
    uint16_t index{0};
    bool is_local{false};  // enclosing frame slot, otherwise enclosing upvalue
};

struct FunctionPrototype {
    std::string name;
    bool is_proc{true};
    std::vector<UpvalueDescriptor> upvalues;
    std::shared_ptr<Chunk> chunk;
    size_t max_slots{0};  // operand stack slots the frame may use
};

// Chunk = compiled bytecode for one function/script
struct Chunk {
    std::vector<uint8_t> code;
    std::vector<SourceLocation> locations;  // one per code byte
    std::vector<Value> constants;
    std::vector<std::string> strings;
    std::vector<CompiledPattern> patterns;
    std::vector<ClauseSignature> clauses;
    std::vector<std::vector<std::string>> record_shapes;
    std::vector<std::shared_ptr<FunctionPrototype>> functions;

    void write(uint8_t byte, SourceLocation loc);
    void write_op(OpCode op, SourceLocation loc);
    void write_short(uint16_t value, SourceLocation loc);

    size_t add_constant(Value value);
    size_t add_string(const std::string& str);
    size_t add_pattern(CompiledPattern pattern);
    size_t add_clause(ClauseSignature clause);
    size_t add_record_shape(std::vector<std::string> shape);
    size_t add_function(std::shared_ptr<FunctionPrototype> proto);

    // Emits op with a placeholder offset and returns the operand position.
    size_t emit_jump(OpCode op, SourceLocation loc);
    void patch_jump(size_t operand_offset, uint16_t distance);

    uint16_t read_short(size_t offset) const {
        return static_cast<uint16_t>((code[offset] << 8) | code[offset + 1]);
    }

    SourceLocation location_at(size_t offset) const {
        return offset < locations.size() ? locations[offset] : SourceLocation{};
    }

    // Debug
    void disassemble(const std::string& name, std::ostream& out = std::cout) const;
    size_t disassemble_instruction(size_t offset, std::ostream& out = std::cout) const;
};

// Output of the compiler: the script prototype plus the global table layout.
struct BytecodeUnit {
    uint32_t format_version{kBytecodeFormatVersion};
    std::shared_ptr<FunctionPrototype> script;
    std::vector<std::string> global_names;
    std::unordered_map<std::string, uint16_t> entry_points;  // global functions

    std::optional<uint16_t> find_global(const std::string& name) const;
};

} // namespace kestrel
