//===-- CoreStats.h ---------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_CORESTATS_H
#define TACSYM_CORESTATS_H

#include "llvm/Support/DataTypes.h"

namespace tacsym {
namespace stats {

  extern uint64_t instructions;
  extern uint64_t forks;
  extern uint64_t privateCalls;
  extern uint64_t privateReturns;
  extern uint64_t simProcedureCalls;
  /// Constraints added by checked arithmetic.
  extern uint64_t safetyConstraints;

  extern uint64_t completedPaths;
  extern uint64_t revertedPaths;
  extern uint64_t prunedPaths;
  extern uint64_t erroredPaths;

  /// Time spent in the TimingSolver, in microseconds.
  extern uint64_t solverTime;

  /// Reset all counters, core and solver, to zero.
  void reset();
}
}

#endif /* TACSYM_CORESTATS_H */
