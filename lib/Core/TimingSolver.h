//===-- TimingSolver.h ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TIMINGSOLVER_H
#define TACSYM_TIMINGSOLVER_H

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/Expr.h"
#include "tacsym/Solver/Solver.h"
#include "tacsym/Solver/SolverImpl.h"

#include "llvm/ADT/APInt.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace tacsym {

/// Per-state bookkeeping of solver usage.
struct SolverQueryMetaData {
  /// Accumulated time of the state's queries, in microseconds.
  uint64_t queryCost;

  SolverQueryMetaData() : queryCost(0) {}
};

/// TimingSolver - A simple class which wraps a solver and handles
/// tracking the statistics that we care about.
class TimingSolver {
public:
  std::unique_ptr<Solver> solver;
  bool simplifyExprs;

public:
  /// TimingSolver - Construct a new timing solver.
  ///
  /// \param _simplifyExprs - Whether expressions should be
  /// simplified (via the constraint manager interface) prior to
  /// querying.
  TimingSolver(Solver *_solver, bool _simplifyExprs = true)
      : solver(_solver), simplifyExprs(_simplifyExprs) {}

  void setTimeout(unsigned timeoutMs) {
    solver->setCoreSolverTimeout(timeoutMs);
  }

  char *getConstraintLog(const Query &query) {
    return solver->getConstraintLog(query);
  }

  /// Name of the outcome of the last query sent to the core solver.
  const char *getLastStatusString() const {
    return SolverImpl::getOperationStatusString(
        solver->impl->getOperationStatusCode());
  }

  bool evaluate(const ConstraintSet &, ref<Expr>, Solver::Validity &result,
                SolverQueryMetaData &metaData);

  bool mustBeTrue(const ConstraintSet &, ref<Expr>, bool &result,
                  SolverQueryMetaData &metaData);

  bool mustBeFalse(const ConstraintSet &, ref<Expr>, bool &result,
                   SolverQueryMetaData &metaData);

  bool mayBeTrue(const ConstraintSet &, ref<Expr>, bool &result,
                 SolverQueryMetaData &metaData);

  bool mayBeFalse(const ConstraintSet &, ref<Expr>, bool &result,
                  SolverQueryMetaData &metaData);

  bool getValue(const ConstraintSet &, ref<Expr> expr,
                ref<ConstantExpr> &result, SolverQueryMetaData &metaData);

  /// Compute a model of \p objects. \p hasSolution is false when the
  /// constraints are unsatisfiable.
  bool getInitialValues(const ConstraintSet &,
                        const std::vector<const SymbolExpr *> &objects,
                        std::vector<llvm::APInt> &result, bool &hasSolution,
                        SolverQueryMetaData &metaData);

  /// Decide whether the constraints are jointly satisfiable.
  bool isFeasible(const ConstraintSet &, bool &result,
                  SolverQueryMetaData &metaData);
};
}

#endif /* TACSYM_TIMINGSOLVER_H */
