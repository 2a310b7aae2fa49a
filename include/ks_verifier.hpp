// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file ks_verifier.hpp
 * @brief Load-time structural checks for a BytecodeUnit.
 *
 * The VM executes only units that pass verification, so the dispatch loop
 * can index constants, strings, patterns, locals and jump targets without
 * re-checking them on every instruction.
 */

#pragma once

#include "ks_chunk.hpp"

namespace kestrel {

// Throws RuntimeError with ErrorKind::MalformedBytecode on the first
// violation: unknown opcode, truncated instruction, out-of-range operand,
// jump into the middle of an instruction or a chunk that can run off its end.
void verify_unit(const BytecodeUnit& unit);

} // namespace kestrel
