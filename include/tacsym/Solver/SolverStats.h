//===-- SolverStats.h -------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_SOLVERSTATS_H
#define TACSYM_SOLVERSTATS_H

#include "llvm/Support/DataTypes.h"

namespace tacsym {
namespace stats {

  extern uint64_t queries;
  extern uint64_t queriesInvalid;
  extern uint64_t queriesValid;
  extern uint64_t queryConstructs;
  extern uint64_t queryCounterexamples;
  extern uint64_t queryTimeouts;
  /// Time spent inside Z3, in microseconds.
  extern uint64_t queryTime;

}
}

#endif /* TACSYM_SOLVERSTATS_H */
