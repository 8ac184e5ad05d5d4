//===-- TerminationTypes.h --------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TERMINATIONTYPES_H
#define TACSYM_TERMINATIONTYPES_H

#include <cstdint>

// TTYPE(name, id, file suffix)
// MARK(name, id) closes a range of related types.
#define TERMINATION_TYPES                                                      \
  TTYPE(Running, 0U, "")                                                       \
  TTYPE(Halted, 1U, "")                                                        \
  MARK(NORMAL, 1U)                                                             \
  TTYPE(Pruned, 2U, "pruned")                                                  \
  TTYPE(MaxDepth, 3U, "early")                                                 \
  MARK(EARLY, 3U)                                                              \
  TTYPE(UninitializedRegister, 4U, "uninit.err")                               \
  TTYPE(StackUnderflow, 5U, "stack.err")                                       \
  TTYPE(InvalidJump, 6U, "jump.err")                                           \
  TTYPE(Execution, 7U, "exec.err")                                             \
  TTYPE(Solver, 8U, "solver.err")                                              \
  MARK(EXECERR, 8U)

/// Reason an ExecutionState got terminated.
enum class StateTerminationType : std::uint8_t {
#define TTYPE(N,I,S) N = (I),
#define MARK(N,I) N = (I),
  TERMINATION_TYPES
#undef TTYPE
#undef MARK
};

namespace tacsym {
const char *getTerminationTypeName(StateTerminationType type);
const char *getTerminationTypeSuffix(StateTerminationType type);
}

#endif /* TACSYM_TERMINATIONTYPES_H */
