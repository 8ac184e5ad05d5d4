//===-- Z3Solver.h ---------------------------------------------*- C++ -*-====//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_Z3SOLVER_H
#define TACSYM_Z3SOLVER_H

#include "tacsym/Solver/Solver.h"

namespace tacsym {
/// Z3Solver - A complete solver based on Z3
class Z3Solver : public Solver {
public:
  /// Z3Solver - Construct a new Z3Solver.
  Z3Solver();

  /// Get the query in SMT-LIBv2 format.
  /// \return A C-style string. The caller is responsible for freeing this.
  virtual char *getConstraintLog(const Query &);

  /// setCoreSolverTimeout - Set constraint solver timeout delay to the given
  /// value; 0 is off.
  virtual void setCoreSolverTimeout(unsigned timeoutMs);
};
}

#endif /* TACSYM_Z3SOLVER_H */
