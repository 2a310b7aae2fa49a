// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_diagnostics.hpp
 * @brief Structured error records shared by the analyzer, compiler and VM.
 *
 * The core never formats diagnostics for humans. Every failure is a
 * Diagnostic record (kind + location + context) that an external renderer
 * consumes, either directly or through its JSON form.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kestrel {

enum class ErrorKind : uint8_t {
    // Analysis time
    DuplicateBinding,
    UseOfUninitialized,
    ConflictingBorrow,
    UseAfterMove,
    UndefinedName,
    // Compile time
    BreakOutsideLoop,
    LimitExceeded,
    // Load time
    MalformedBytecode,
    // Run time
    TypeError,
    NoMatchingArm,
    NoMatchingOverload,
    StackOverflow,
    OutOfMemory,
    UndefinedGlobal,
    NotCallable,
    IndexOutOfRange,
    UnknownField,
};

const char* error_kind_name(ErrorKind kind);

struct SourceLocation {
    uint32_t line{0};
    uint32_t column{0};

    bool known() const { return line != 0; }
    bool operator==(const SourceLocation&) const = default;
};

// One active invocation at the time of a runtime failure, innermost first.
struct FrameInfo {
    std::string function;
    size_t pc{0};
    SourceLocation location;
};

struct Diagnostic {
    ErrorKind kind{ErrorKind::TypeError};
    SourceLocation location;
    std::string message;
    std::string context;             // symbol name, function name, ...
    std::vector<FrameInfo> frames;   // runtime errors only

    // "<Kind> at line:col: message"; used as exception text only.
    std::string summary() const;
};

void to_json(nlohmann::json& j, const SourceLocation& loc);
void to_json(nlohmann::json& j, const FrameInfo& frame);
void to_json(nlohmann::json& j, const Diagnostic& diag);

// Thrown by the StaticAnalyzer with every diagnostic found in one pass.
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(std::vector<Diagnostic> diagnostics);

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    bool has(ErrorKind kind) const;
    size_t count(ErrorKind kind) const;

private:
    std::vector<Diagnostic> diagnostics_;
};

class CompileError : public std::runtime_error {
public:
    explicit CompileError(Diagnostic diagnostic)
        : std::runtime_error(diagnostic.summary()), diagnostic_(std::move(diagnostic)) {}

    const Diagnostic& diagnostic() const { return diagnostic_; }
    ErrorKind kind() const { return diagnostic_.kind; }

private:
    Diagnostic diagnostic_;
};

class RuntimeError : public std::runtime_error {
public:
    explicit RuntimeError(Diagnostic diagnostic)
        : std::runtime_error(diagnostic.summary()), diagnostic_(std::move(diagnostic)) {}

    RuntimeError(ErrorKind kind, const std::string& message)
        : RuntimeError(Diagnostic{kind, {}, message, {}, {}}) {}

    const Diagnostic& diagnostic() const { return diagnostic_; }
    Diagnostic& diagnostic() { return diagnostic_; }
    ErrorKind kind() const { return diagnostic_.kind; }

private:
    Diagnostic diagnostic_;
};

} // namespace kestrel
