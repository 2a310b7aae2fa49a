// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_runner.hpp
 * @brief High-level execution utilities.
 *
 * Runs a parsed Program through the whole pipeline in a single call:
 * StaticAnalyzer, Compiler, then the VM.
 */

#pragma once
#include <string>
#include <vector>
#include "ks_analyzer.hpp"
#include "ks_compiler.hpp"
#include "ks_vm.hpp"

namespace kestrel {

// Analyze and compile. Throws AnalysisError or CompileError.
inline BytecodeUnit Build(Program& program) {
    StaticAnalyzer analyzer;
    analyzer.analyze(program);
    Compiler compiler;
    return compiler.compile(program);
}

// Build and execute the top-level script. Throws on any failure.
inline Value Interpret(VM& vm, Program& program) {
    BytecodeUnit unit = Build(program);
    return vm.execute(unit);
}

// Build, execute and optionally call an entry function. Every failure ends
// up in the result; for analysis failures that is the first diagnostic.
inline ExecutionResult Run(VM& vm, Program& program,
                           const std::string& entry = {},
                           const std::vector<Value>& args = {}) {
    BytecodeUnit unit;
    try {
        unit = Build(program);
    } catch (const AnalysisError& e) {
        return ExecutionResult{std::nullopt, e.diagnostics().front()};
    } catch (const CompileError& e) {
        return ExecutionResult{std::nullopt, e.diagnostic()};
    }
    return vm.run(unit, entry, args);
}

} // namespace kestrel
