#include "ks_value.hpp"
#include "ks_chunk.hpp"
#include "ks_gc.hpp"
#include <cmath>
#include <sstream>

namespace kestrel {

std::string Value::to_string() const {
    switch (type_) {
        case Type::Nil:
            return "nil";
        case Type::Bool:
            return data_.bool_val ? "true" : "false";
        case Type::Int:
            return std::to_string(data_.int_val);
        case Type::Float: {
            std::ostringstream oss;
            oss << data_.float_val;
            return oss.str();
        }
        case Type::Object:
            return data_.object_val ? data_.object_val->to_string() : "nil";
    }
    return "unknown";
}

std::string_view Value::type_name() const {
    switch (type_) {
        case Type::Nil:   return "Nil";
        case Type::Bool:  return "Bool";
        case Type::Int:   return "Int";
        case Type::Float: return "Float";
        case Type::Object:
            return data_.object_val ? object_type_name(data_.object_val->type) : "Nil";
    }
    return "Unknown";
}

bool Value::equals(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (is_int() && other.is_int()) {
            return data_.int_val == other.data_.int_val;
        }
        return *try_as<Float>() == *other.try_as<Float>();
    }
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::Nil:
            return true;
        case Type::Bool:
            return data_.bool_val == other.data_.bool_val;
        case Type::Object: {
            Object* a = data_.object_val;
            Object* b = other.data_.object_val;
            if (a == b) return true;
            if (!a || !b) return false;
            if (a->type == ObjectType::String && b->type == ObjectType::String) {
                return static_cast<StringObject*>(a)->data == static_cast<StringObject*>(b)->data;
            }
            return false;
        }
        default:
            return false;
    }
}

Value* RecordObject::find(std::string_view name) {
    for (auto& [key, value] : fields) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const Value* RecordObject::find(std::string_view name) const {
    for (const auto& [key, value] : fields) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

std::string RecordObject::to_string() const {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << fields[i].first << ": ";
        // Avoid unbounded recursion through self-referencing records.
        if (fields[i].second.is_object_of(ObjectType::Record) ||
            fields[i].second.is_object_of(ObjectType::Array)) {
            oss << "<" << fields[i].second.type_name() << ">";
        } else {
            oss << fields[i].second.to_string();
        }
    }
    oss << "}";
    return oss.str();
}

size_t RecordObject::memory_size() const {
    size_t total = sizeof(RecordObject) + fields.capacity() * sizeof(std::pair<std::string, Value>);
    for (const auto& [key, value] : fields) {
        total += key.capacity();
    }
    return total;
}

void RecordObject::trace(GarbageCollector& gc) const {
    for (const auto& [key, value] : fields) {
        gc.mark_value(value);
    }
}

std::string ArrayObject::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) oss << ", ";
        if (elements[i].is_object_of(ObjectType::Record) ||
            elements[i].is_object_of(ObjectType::Array)) {
            oss << "<" << elements[i].type_name() << ">";
        } else {
            oss << elements[i].to_string();
        }
    }
    oss << "]";
    return oss.str();
}

void ArrayObject::trace(GarbageCollector& gc) const {
    for (const auto& element : elements) {
        gc.mark_value(element);
    }
}

void UpvalueObject::trace(GarbageCollector& gc) const {
    // An open upvalue's slot is reached through the operand stack.
    if (!is_open) {
        gc.mark_value(closed);
    }
}

ClosureObject::ClosureObject(std::shared_ptr<const FunctionPrototype> p)
    : Object(ObjectType::Closure), proto(std::move(p)) {
    upvalues.resize(proto ? proto->upvalues.size() : 0, nullptr);
}

const std::string& ClosureObject::name() const {
    static const std::string anonymous = "<closure>";
    return proto ? proto->name : anonymous;
}

std::string ClosureObject::to_string() const {
    return "<" + std::string(proto && proto->is_proc ? "proc " : "func ") + name() + ">";
}

void ClosureObject::trace(GarbageCollector& gc) const {
    for (UpvalueObject* upvalue : upvalues) {
        gc.mark_object(upvalue);
    }
}

} // namespace kestrel
