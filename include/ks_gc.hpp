// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_gc.hpp
 * @brief Non-moving mark-sweep garbage collector.
 *
 * The collector owns every heap object. Objects are linked into a single
 * all-objects list; a cycle marks from the roots supplied by a RootSource
 * using an explicit gray work-list, then sweeps the list, destroying
 * unmarked objects and parking their storage in size-bucketed free lists.
 *
 * Collection never starts on its own: the owner polls should_collect() at
 * its safepoints and calls collect() there.
 */

#pragma once

#include "ks_core.hpp"
#include "ks_value.hpp"
#include <new>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kestrel {

struct GcConfig {
    size_t initial_threshold = 1024 * 1024;        // bytes allocated before the first cycle
    double growth_factor = 2.0;                    // threshold multiplier per cycle
    size_t max_heap_bytes = 256 * 1024 * 1024;     // hard limit on live bytes
    size_t max_free_list_bytes = 4 * 1024 * 1024;  // storage retained for reuse
    bool stress = false;                           // collect at every safepoint
};

// Raised when an allocation cannot be satisfied. The VM treats it as a
// request to collect at the current instruction boundary and retry.
class HeapExhausted : public std::bad_alloc {
public:
    explicit HeapExhausted(size_t requested) : requested_(requested) {}
    const char* what() const noexcept override { return "heap exhausted"; }
    size_t requested() const { return requested_; }

private:
    size_t requested_;
};

class GarbageCollector;

// Supplies the root set of a collection cycle.
class RootSource {
public:
    virtual ~RootSource() = default;
    virtual void trace_roots(GarbageCollector& gc) = 0;
};

class GarbageCollector {
public:
    explicit GarbageCollector(GcConfig config = GcConfig{});
    ~GarbageCollector();

    GarbageCollector(const GarbageCollector&) = delete;
    GarbageCollector& operator=(const GarbageCollector&) = delete;

    template<typename T, typename... Args>
    T* allocate(Args&&... args);

    // Throws HeapExhausted when bytes more live bytes would pass
    // max_heap_bytes. Callers check before growing a container.
    void ensure_headroom(size_t bytes) const;

    // Container objects report growth so accounting stays exact.
    void record_allocation_delta(Object& obj, size_t new_size);

    bool should_collect() const;
    void request_collection() { collection_requested_ = true; }

    // Full stop-the-world cycle. Returns the number of bytes reclaimed.
    size_t collect(RootSource& roots);

    // Mark entry points used by RootSource and Object::trace.
    void mark_value(const Value& value);
    void mark_object(Object* obj);

    size_t bytes_live() const { return stats_.bytes_live; }
    size_t object_count() const { return stats_.current_objects; }
    size_t next_threshold() const { return threshold_; }
    size_t free_list_bytes() const { return free_list_bytes_; }
    const MemoryStats& stats() const { return stats_; }
    const GcConfig& config() const { return config_; }

    // Visit every object currently owned by the heap.
    template<typename Fn>
    void for_each_object(Fn&& fn) const {
        for (Object* obj = objects_head_; obj != nullptr; obj = obj->next) {
            fn(*obj);
        }
    }

private:
    GcConfig config_;
    Object* objects_head_{nullptr};
    std::vector<Object*> gray_stack_;
    std::unordered_map<size_t, std::vector<void*>> free_blocks_;
    size_t free_list_bytes_{0};
    size_t bytes_since_collection_{0};
    size_t threshold_;
    bool collection_requested_{false};
    bool collecting_{false};
    MemoryStats stats_;

    void* acquire_block(size_t size);
    void release_block(void* block, size_t size);
    void link(Object* obj, size_t block);
    void trace_references();
    size_t sweep();
    void destroy(Object* obj);
};

template<typename T, typename... Args>
T* GarbageCollector::allocate(Args&&... args) {
    constexpr size_t block = sizeof(T);
    if (stats_.bytes_live + block > config_.max_heap_bytes) {
        throw HeapExhausted(block);
    }

    void* storage = acquire_block(block);
    T* obj = nullptr;
    try {
        obj = new (storage) T(std::forward<Args>(args)...);
    } catch (const std::bad_alloc&) {
        release_block(storage, block);
        throw HeapExhausted(block);
    } catch (...) {
        release_block(storage, block);
        throw;
    }

    // Strings and closures own storage beyond the object itself.
    const size_t size = obj->memory_size();
    if (stats_.bytes_live + size > config_.max_heap_bytes) {
        obj->~T();
        release_block(storage, block);
        throw HeapExhausted(size);
    }

    link(obj, block);
    KS_DEBUG_GC("ALLOCATE %p [%s] size: %zu bytes",
        static_cast<void*>(obj), object_type_name(obj->type), obj->tracked_size);
    return obj;
}

} // namespace kestrel
