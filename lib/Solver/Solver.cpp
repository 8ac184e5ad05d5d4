//===-- Solver.cpp --------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Solver/Solver.h"

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Solver/SolverImpl.h"

#include "llvm/Support/raw_ostream.h"

using namespace tacsym;

const char *Solver::validity_to_str(Validity v) {
  switch (v) {
  default:    return "n/a";
  case True:  return "true";
  case False: return "false";
  }
}

Solver::~Solver() {
  delete impl;
}

char *Solver::getConstraintLog(const Query& query) {
  return impl->getConstraintLog(query);
}

void Solver::setCoreSolverTimeout(unsigned timeoutMs) {
  impl->setCoreSolverTimeout(timeoutMs);
}

bool Solver::evaluate(const Query& query, Validity &result) {
  assert(query.expr->getWidth() == Expr::Bool && "Invalid expression type!");

  // Maintain invariants implementations expect.
  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(query.expr)) {
    result = CE->isTrue() ? True : False;
    return true;
  }

  return impl->computeValidity(query, result);
}

bool Solver::mustBeTrue(const Query& query, bool &result) {
  assert(query.expr->getWidth() == Expr::Bool && "Invalid expression type!");

  // Maintain invariants implementations expect.
  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(query.expr)) {
    result = CE->isTrue();
    return true;
  }

  return impl->computeTruth(query, result);
}

bool Solver::mustBeFalse(const Query& query, bool &result) {
  return mustBeTrue(query.negateExpr(), result);
}

bool Solver::mayBeTrue(const Query& query, bool &result) {
  bool res;
  if (!mustBeFalse(query, res))
    return false;
  result = !res;
  return true;
}

bool Solver::mayBeFalse(const Query& query, bool &result) {
  bool res;
  if (!mustBeTrue(query, res))
    return false;
  result = !res;
  return true;
}

bool Solver::getValue(const Query& query, ref<ConstantExpr> &result) {
  // Maintain invariants implementation expect.
  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(query.expr)) {
    result = CE;
    return true;
  }

  ref<Expr> tmp;
  if (!impl->computeValue(query, tmp))
    return false;

  result = cast<ConstantExpr>(tmp);
  return true;
}

bool Solver::getInitialValues(const Query &query,
                              const std::vector<const SymbolExpr *> &objects,
                              std::vector<llvm::APInt> &result,
                              bool &hasSolution) {
  hasSolution = false;
  return impl->computeInitialValues(query, objects, result, hasSolution);
}

void Query::dump() const {
  llvm::errs() << "Constraints [\n";
  for (const auto &constraint : constraints) {
    llvm::errs() << "  ";
    constraint.expr->print(llvm::errs());
    llvm::errs() << "  ; " << getProvenanceName(constraint.provenance) << "\n";
  }
  llvm::errs() << "]\n";
  llvm::errs() << "Query [\n  ";
  expr->print(llvm::errs());
  llvm::errs() << "\n]\n";
}
