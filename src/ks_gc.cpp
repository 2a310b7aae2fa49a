// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "ks_gc.hpp"
#include <algorithm>

namespace kestrel {

GarbageCollector::GarbageCollector(GcConfig config)
    : config_(config),
      threshold_(std::max<size_t>(config.initial_threshold, 1)) {
    if (config_.growth_factor < 1.0) {
        config_.growth_factor = 1.0;
    }
}

GarbageCollector::~GarbageCollector() {
    Object* obj = objects_head_;
    while (obj) {
        Object* next = obj->next;
        size_t block = obj->block_size;
        obj->~Object();
        ::operator delete(static_cast<void*>(obj), block);
        obj = next;
    }
    objects_head_ = nullptr;

    for (auto& [size, blocks] : free_blocks_) {
        for (void* block : blocks) {
            ::operator delete(block, size);
        }
    }
    free_blocks_.clear();
    free_list_bytes_ = 0;
}

void* GarbageCollector::acquire_block(size_t size) {
    auto it = free_blocks_.find(size);
    if (it != free_blocks_.end() && !it->second.empty()) {
        void* block = it->second.back();
        it->second.pop_back();
        free_list_bytes_ -= size;
        stats_.reused_blocks++;
        return block;
    }
    try {
        return ::operator new(size);
    } catch (const std::bad_alloc&) {
        throw HeapExhausted(size);
    }
}

void GarbageCollector::release_block(void* block, size_t size) {
    if (free_list_bytes_ + size > config_.max_free_list_bytes) {
        ::operator delete(block, size);
        return;
    }
    free_blocks_[size].push_back(block);
    free_list_bytes_ += size;
}

void GarbageCollector::link(Object* obj, size_t block) {
    obj->block_size = block;
    obj->tracked_size = obj->memory_size();
    obj->next = objects_head_;
    objects_head_ = obj;

    stats_.total_allocated += obj->tracked_size;
    stats_.bytes_live += obj->tracked_size;
    stats_.current_objects++;
    if (stats_.current_objects > stats_.peak_objects) {
        stats_.peak_objects = stats_.current_objects;
    }
    bytes_since_collection_ += obj->tracked_size;
}

void GarbageCollector::ensure_headroom(size_t bytes) const {
    if (bytes > config_.max_heap_bytes || stats_.bytes_live > config_.max_heap_bytes - bytes) {
        throw HeapExhausted(bytes);
    }
}

void GarbageCollector::record_allocation_delta(Object& obj, size_t new_size) {
    if (new_size > obj.tracked_size) {
        size_t grown = new_size - obj.tracked_size;
        stats_.total_allocated += grown;
        stats_.bytes_live += grown;
        bytes_since_collection_ += grown;
    } else if (new_size < obj.tracked_size) {
        size_t shrunk = obj.tracked_size - new_size;
        stats_.total_freed += shrunk;
        stats_.bytes_live -= shrunk;
    }
    obj.tracked_size = new_size;
}

bool GarbageCollector::should_collect() const {
    if (collecting_) {
        return false;
    }
    return config_.stress || collection_requested_ || bytes_since_collection_ > threshold_;
}

size_t GarbageCollector::collect(RootSource& roots) {
    if (collecting_) {
        return 0;
    }
    collecting_ = true;
    KS_DEBUG_GC("-- collection %zu begin: %zu bytes live, %zu objects",
        stats_.collections + 1, stats_.bytes_live, stats_.current_objects);

    roots.trace_roots(*this);
    trace_references();
    size_t reclaimed = sweep();

    stats_.collections++;
    bytes_since_collection_ = 0;
    collection_requested_ = false;
    double next = static_cast<double>(threshold_) * config_.growth_factor;
    threshold_ = next >= static_cast<double>(SIZE_MAX) ? SIZE_MAX : static_cast<size_t>(next);

    KS_DEBUG_GC("-- collection end: reclaimed %zu bytes, %zu bytes live, next at %zu",
        reclaimed, stats_.bytes_live, threshold_);
    collecting_ = false;
    return reclaimed;
}

void GarbageCollector::mark_value(const Value& value) {
    if (value.is_object()) {
        mark_object(value.as_object());
    }
}

void GarbageCollector::mark_object(Object* obj) {
    if (obj == nullptr || obj->marked) {
        return;
    }
    obj->marked = true;
    gray_stack_.push_back(obj);
}

void GarbageCollector::trace_references() {
    while (!gray_stack_.empty()) {
        Object* obj = gray_stack_.back();
        gray_stack_.pop_back();
        obj->trace(*this);
    }
}

size_t GarbageCollector::sweep() {
    size_t reclaimed = 0;
    Object* previous = nullptr;
    Object* obj = objects_head_;
    while (obj) {
        if (obj->marked) {
            obj->marked = false;
            previous = obj;
            obj = obj->next;
            continue;
        }

        Object* unreached = obj;
        obj = obj->next;
        if (previous) {
            previous->next = obj;
        } else {
            objects_head_ = obj;
        }
        reclaimed += unreached->tracked_size;
        destroy(unreached);
    }
    return reclaimed;
}

void GarbageCollector::destroy(Object* obj) {
    KS_DEBUG_GC("FREE %p [%s] size: %zu bytes",
        static_cast<void*>(obj), object_type_name(obj->type), obj->tracked_size);

    stats_.total_freed += obj->tracked_size;
    stats_.bytes_live -= obj->tracked_size;
    stats_.current_objects--;

    size_t block = obj->block_size;
    obj->~Object();
    release_block(obj, block);
}

} // namespace kestrel
