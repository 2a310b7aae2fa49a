#pragma once

#include "ks_core.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <memory>

namespace kestrel {

// Value types (unboxed - stored directly in Value)
using Int = int64_t;
using Float = double;
using Bool = bool;

struct FunctionPrototype;

// Value class - 16 bytes on 64-bit systems
class Value {
public:
    enum class Type : uint8_t {
        Nil,
        Bool,
        Int,
        Float,
        Object  // Pointer to heap object
    };

private:
    Type type_{Type::Nil};
    uint8_t padding_[7]{};  // Alignment padding

    union {
        Bool bool_val;
        Int int_val;
        Float float_val;
        Object* object_val;
    } data_{.int_val = 0};

public:
    Value() : type_(Type::Nil) {}

    static Value nil() { return Value(); }

    static Value from_bool(Bool b) {
        Value v;
        v.type_ = Type::Bool;
        v.data_.int_val = 0;  // Zero union first
        v.data_.bool_val = b;
        return v;
    }

    static Value from_int(Int i) {
        Value v;
        v.type_ = Type::Int;
        v.data_.int_val = i;
        return v;
    }

    static Value from_float(Float f) {
        Value v;
        v.type_ = Type::Float;
        v.data_.int_val = 0;
        v.data_.float_val = f;
        return v;
    }

    static Value from_object(Object* obj) {
        Value v;
        v.type_ = Type::Object;
        v.data_.int_val = 0;
        v.data_.object_val = obj;
        return v;
    }

    bool is_nil() const { return type_ == Type::Nil; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_float() const { return type_ == Type::Float; }
    bool is_number() const { return is_int() || is_float(); }
    bool is_object() const { return type_ == Type::Object; }
    bool is_object_of(ObjectType t) const {
        return is_object() && data_.object_val && data_.object_val->type == t;
    }

    Type type() const { return type_; }

    Bool as_bool() const {
        KS_ASSERT(is_bool(), "Value is not a bool");
        return data_.bool_val;
    }

    Int as_int() const {
        KS_ASSERT(is_int(), "Value is not an int");
        return data_.int_val;
    }

    Float as_float() const {
        KS_ASSERT(is_float(), "Value is not a float");
        return data_.float_val;
    }

    Object* as_object() const {
        KS_ASSERT(is_object(), "Value is not an object");
        return data_.object_val;
    }

    template<typename T>
    std::optional<T> try_as() const;

    // nil and false are falsy, everything else is truthy.
    bool is_truthy() const {
        if (is_nil()) return false;
        if (is_bool()) return data_.bool_val;
        return true;
    }

    std::string to_string() const;
    std::string_view type_name() const;

    // Scalars and strings compare by value, other objects by identity.
    bool equals(const Value& other) const;

    static constexpr size_t size() { return sizeof(Value); }
};

template<>
inline std::optional<Bool> Value::try_as<Bool>() const {
    if (is_bool()) return data_.bool_val;
    return std::nullopt;
}

template<>
inline std::optional<Int> Value::try_as<Int>() const {
    if (is_int()) return data_.int_val;
    return std::nullopt;
}

template<>
inline std::optional<Float> Value::try_as<Float>() const {
    if (is_float()) return data_.float_val;
    if (is_int()) return static_cast<Float>(data_.int_val);
    return std::nullopt;
}

template<>
inline std::optional<Object*> Value::try_as<Object*>() const {
    if (is_object()) return data_.object_val;
    return std::nullopt;
}

// Specific object types
class StringObject : public Object {
public:
    std::string data;

    explicit StringObject(std::string s)
        : Object(ObjectType::String), data(std::move(s)) {}

    std::string to_string() const override { return data; }
    size_t memory_size() const override {
        return sizeof(StringObject) + data.capacity();
    }
};

// Ordered field-name -> value mapping. Field order is insertion order.
class RecordObject : public Object {
public:
    std::vector<std::pair<std::string, Value>> fields;

    RecordObject() : Object(ObjectType::Record) {}

    Value* find(std::string_view name);
    const Value* find(std::string_view name) const;

    std::string to_string() const override;
    size_t memory_size() const override;
    void trace(GarbageCollector& gc) const override;
};

class ArrayObject : public Object {
public:
    std::vector<Value> elements;

    ArrayObject() : Object(ObjectType::Array) {}

    std::string to_string() const override;
    size_t memory_size() const override {
        return sizeof(ArrayObject) + elements.capacity() * sizeof(Value);
    }
    void trace(GarbageCollector& gc) const override;
};

// Captured variable cell. While open it aliases an operand stack slot,
// once closed it owns the value.
class UpvalueObject : public Object {
public:
    size_t slot;
    bool is_open{true};
    Value closed;
    UpvalueObject* next_open{nullptr};

    explicit UpvalueObject(size_t stack_slot)
        : Object(ObjectType::Upvalue), slot(stack_slot) {}

    Value& location(std::vector<Value>& stack) {
        return is_open ? stack[slot] : closed;
    }

    std::string to_string() const override { return "<upvalue>"; }
    size_t memory_size() const override { return sizeof(UpvalueObject); }
    void trace(GarbageCollector& gc) const override;
};

class ClosureObject : public Object {
public:
    std::shared_ptr<const FunctionPrototype> proto;
    std::vector<UpvalueObject*> upvalues;

    explicit ClosureObject(std::shared_ptr<const FunctionPrototype> p);

    const std::string& name() const;

    std::string to_string() const override;
    size_t memory_size() const override {
        return sizeof(ClosureObject) + upvalues.capacity() * sizeof(UpvalueObject*);
    }
    void trace(GarbageCollector& gc) const override;
};

static_assert(sizeof(Value) == 16, "Value must be exactly 16 bytes");

} // namespace kestrel
