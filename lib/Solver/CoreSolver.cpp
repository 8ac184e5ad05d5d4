//===-- CoreSolver.cpp ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Z3Solver.h"

#include "tacsym/Solver/Solver.h"

namespace tacsym {

Solver *createCoreSolver() {
  return new Z3Solver();
}

} // namespace tacsym
