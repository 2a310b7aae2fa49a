// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "ks_diagnostics.hpp"
#include <algorithm>
#include <sstream>

namespace kestrel {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateBinding:   return "DuplicateBinding";
        case ErrorKind::UseOfUninitialized: return "UseOfUninitialized";
        case ErrorKind::ConflictingBorrow:  return "ConflictingBorrow";
        case ErrorKind::UseAfterMove:       return "UseAfterMove";
        case ErrorKind::UndefinedName:      return "UndefinedName";
        case ErrorKind::BreakOutsideLoop:   return "BreakOutsideLoop";
        case ErrorKind::LimitExceeded:      return "LimitExceeded";
        case ErrorKind::MalformedBytecode:  return "MalformedBytecode";
        case ErrorKind::TypeError:          return "TypeError";
        case ErrorKind::NoMatchingArm:      return "NoMatchingArm";
        case ErrorKind::NoMatchingOverload: return "NoMatchingOverload";
        case ErrorKind::StackOverflow:      return "StackOverflow";
        case ErrorKind::OutOfMemory:        return "OutOfMemory";
        case ErrorKind::UndefinedGlobal:    return "UndefinedGlobal";
        case ErrorKind::NotCallable:        return "NotCallable";
        case ErrorKind::IndexOutOfRange:    return "IndexOutOfRange";
        case ErrorKind::UnknownField:       return "UnknownField";
    }
    return "Unknown";
}

std::string Diagnostic::summary() const {
    std::ostringstream oss;
    oss << error_kind_name(kind);
    if (location.known()) {
        oss << " at " << location.line << ":" << location.column;
    }
    oss << ": " << message;
    return oss.str();
}

void to_json(nlohmann::json& j, const SourceLocation& loc) {
    j = nlohmann::json{{"line", loc.line}, {"column", loc.column}};
}

void to_json(nlohmann::json& j, const FrameInfo& frame) {
    j = nlohmann::json{
        {"function", frame.function},
        {"pc", frame.pc},
        {"location", frame.location},
    };
}

void to_json(nlohmann::json& j, const Diagnostic& diag) {
    j = nlohmann::json{
        {"kind", error_kind_name(diag.kind)},
        {"message", diag.message},
    };
    if (diag.location.known()) {
        j["location"] = diag.location;
    }
    if (!diag.context.empty()) {
        j["context"] = diag.context;
    }
    if (!diag.frames.empty()) {
        j["frames"] = diag.frames;
    }
}

static std::string summarize(const std::vector<Diagnostic>& diagnostics) {
    if (diagnostics.empty()) {
        return "analysis failed";
    }
    std::string text = diagnostics.front().summary();
    if (diagnostics.size() > 1) {
        text += " (and " + std::to_string(diagnostics.size() - 1) + " more)";
    }
    return text;
}

AnalysisError::AnalysisError(std::vector<Diagnostic> diagnostics)
    : std::runtime_error(summarize(diagnostics)), diagnostics_(std::move(diagnostics)) {}

bool AnalysisError::has(ErrorKind kind) const {
    return count(kind) > 0;
}

size_t AnalysisError::count(ErrorKind kind) const {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

} // namespace kestrel
