// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_config.hpp
 * @brief Runtime configuration file.
 *
 * A JSON document with optional "vm" and "gc" objects:
 *
 *   {
 *     "vm": { "max_stack_size": 65536, "max_call_depth": 1024 },
 *     "gc": { "initial_threshold": 1048576, "stress": false }
 *   }
 *
 * Missing keys keep their defaults, unknown keys are ignored.
 */

#pragma once

#include "ks_gc.hpp"
#include "ks_vm.hpp"
#include <filesystem>
#include <string>

namespace kestrel {

struct RuntimeConfig {
    VMConfig vm;
    GcConfig gc;
};

bool load_runtime_config(const std::filesystem::path& path, RuntimeConfig& out, std::string& err);
bool parse_runtime_config(const std::string& text, RuntimeConfig& out, std::string& err);

} // namespace kestrel
