// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_config.cpp
 * @brief Runtime configuration loader implementation.
 */

#include "ks_config.hpp"
#include <fstream>
#include <iterator>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace kestrel {

static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

// Reads section[key] into field when present. Wrong JSON types are errors.
template<typename T>
static bool ReadField(const nlohmann::json& section, const char* section_name, const char* key,
                      T& field, std::string& err) {
    auto it = section.find(key);
    if (it == section.end()) return true;

    bool type_ok;
    if constexpr (std::is_same_v<T, bool>) {
        type_ok = it->is_boolean();
    } else if constexpr (std::is_floating_point_v<T>) {
        type_ok = it->is_number();
    } else {
        type_ok = it->is_number_unsigned() || (it->is_number_integer() && it->template get<int64_t>() >= 0);
    }
    if (!type_ok) {
        err = std::string(section_name) + "." + key + ": unexpected " + it->type_name();
        return false;
    }
    field = it->template get<T>();
    return true;
}

static bool ReadSection(const nlohmann::json& root, const char* name, nlohmann::json& out, std::string& err) {
    auto it = root.find(name);
    if (it == root.end()) { out = nlohmann::json::object(); return true; }
    if (!it->is_object()) {
        err = std::string(name) + ": expected an object";
        return false;
    }
    out = *it;
    return true;
}

bool parse_runtime_config(const std::string& text, RuntimeConfig& out, std::string& err) {
    nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        err = "invalid JSON";
        return false;
    }
    if (!root.is_object()) {
        err = "configuration must be a JSON object";
        return false;
    }

    nlohmann::json vm, gc;
    if (!ReadSection(root, "vm", vm, err)) return false;
    if (!ReadSection(root, "gc", gc, err)) return false;

    RuntimeConfig config = out;
    bool ok = ReadField(vm, "vm", "initial_stack_size", config.vm.initial_stack_size, err)
        && ReadField(vm, "vm", "max_stack_size", config.vm.max_stack_size, err)
        && ReadField(vm, "vm", "max_call_depth", config.vm.max_call_depth, err)
        && ReadField(vm, "vm", "enable_debug", config.vm.enable_debug, err)
        && ReadField(vm, "vm", "trace_execution", config.vm.trace_execution, err)
        && ReadField(gc, "gc", "initial_threshold", config.gc.initial_threshold, err)
        && ReadField(gc, "gc", "growth_factor", config.gc.growth_factor, err)
        && ReadField(gc, "gc", "max_heap_bytes", config.gc.max_heap_bytes, err)
        && ReadField(gc, "gc", "max_free_list_bytes", config.gc.max_free_list_bytes, err)
        && ReadField(gc, "gc", "stress", config.gc.stress, err);
    if (!ok) return false;

    if (config.gc.growth_factor < 1.0) {
        err = "gc.growth_factor: must be at least 1.0";
        return false;
    }
    if (config.vm.max_stack_size == 0 || config.vm.max_call_depth == 0) {
        err = "vm: stack and call depth limits must be positive";
        return false;
    }

    out = config;
    return true;
}

bool load_runtime_config(const std::filesystem::path& path, RuntimeConfig& out, std::string& err) {
    std::string text;
    if (!ReadAllText(path, text, err)) return false;
    if (!parse_runtime_config(text, out, err)) {
        err = path.string() + ": " + err;
        return false;
    }
    return true;
}

} // namespace kestrel
