//===-- SolverImpl.cpp ----------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Solver/SolverImpl.h"
#include "tacsym/Solver/Solver.h"

using namespace tacsym;

SolverImpl::~SolverImpl() {}

// Two truth queries: expr itself, then its negation if expr is not valid.
bool SolverImpl::computeValidity(const Query &query, Solver::Validity &result) {
  bool exprIsValid;
  if (!computeTruth(query, exprIsValid))
    return false;
  if (exprIsValid) {
    result = Solver::True;
    return true;
  }

  bool negationIsValid;
  if (!computeTruth(query.negateExpr(), negationIsValid))
    return false;
  result = negationIsValid ? Solver::False : Solver::Unknown;
  return true;
}

const char *SolverImpl::getOperationStatusString(SolverRunStatus statusCode) {
  switch (statusCode) {
  case SOLVER_RUN_STATUS_SUCCESS_SOLVABLE:
    return "sat";
  case SOLVER_RUN_STATUS_SUCCESS_UNSOLVABLE:
    return "unsat";
  case SOLVER_RUN_STATUS_TIMEOUT:
    return "timeout";
  case SOLVER_RUN_STATUS_INTERRUPTED:
    return "interrupted";
  case SOLVER_RUN_STATUS_FAILURE:
    break;
  }
  return "failure";
}
