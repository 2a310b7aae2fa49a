#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cassert>
#include <string>

namespace kestrel {

// Forward declarations
class VM;
class Object;
class Value;
class GarbageCollector;

// Object type enumeration
enum class ObjectType : uint8_t {
    String,
    Record,
    Array,
    Closure,
    Upvalue
};

// Utility: ObjectType to string
inline const char* object_type_name(ObjectType t) {
    switch (t) {
        case ObjectType::String:  return "String";
        case ObjectType::Record:  return "Record";
        case ObjectType::Array:   return "Array";
        case ObjectType::Closure: return "Closure";
        case ObjectType::Upvalue: return "Upvalue";
    }
    return "Unknown";
}

// Base class for all heap-allocated objects.
// Storage is obtained from and returned to the GarbageCollector only.
class Object {
public:
    ObjectType type;
    bool marked{false};
    Object* next{nullptr};   // GarbageCollector's all-objects list
    size_t tracked_size{0};  // bytes accounted to the heap for this object
    size_t block_size{0};    // size of the raw storage block

    explicit Object(ObjectType t) : type(t) {}
    virtual ~Object() = default;

    virtual std::string to_string() const = 0;
    virtual size_t memory_size() const = 0;

    // Report every directly referenced heap object to the collector.
    virtual void trace(GarbageCollector& gc) const { (void)gc; }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
};

// Memory statistics
struct MemoryStats {
    size_t total_allocated{0};
    size_t total_freed{0};
    size_t bytes_live{0};
    size_t current_objects{0};
    size_t peak_objects{0};
    size_t collections{0};
    size_t reused_blocks{0};
};

// Debug utilities
#ifdef KS_DEBUG
    #define KS_DEBUG_GC(fmt, ...) \
        printf("[GC] " fmt "\n", ##__VA_ARGS__)
    #define KS_TRACE(fmt, ...) \
        printf("[VM] " fmt "\n", ##__VA_ARGS__)
#else
    #define KS_DEBUG_GC(fmt, ...)
    #define KS_TRACE(fmt, ...)
#endif

#define KS_ASSERT(cond, msg) assert((cond) && (msg))

} // namespace kestrel
