//===-- Solver.h ------------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_SOLVER_H
#define TACSYM_SOLVER_H

#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/APInt.h"

#include <vector>

namespace tacsym {
class ConstraintSet;
class SolverImpl;

struct Query {
public:
  const ConstraintSet &constraints;
  ref<Expr> expr;

  Query(const ConstraintSet &_constraints, ref<Expr> _expr)
      : constraints(_constraints), expr(_expr) {}

  /// withExpr - Return a copy of the query with the given expression.
  Query withExpr(ref<Expr> _expr) const { return Query(constraints, _expr); }

  /// withFalse - Return a copy of the query with a false expression.
  Query withFalse() const { return Query(constraints, Expr::createFalse()); }

  /// negateExpr - Return a copy of the query with the expression negated.
  Query negateExpr() const { return withExpr(Expr::createIsZero(expr)); }

  /// Dump query
  void dump() const;
};

class Solver {
  // DO NOT IMPLEMENT.
  Solver(const Solver &);
  void operator=(const Solver &);

public:
  enum Validity { True = 1, False = -1, Unknown = 0 };

public:
  /// validity_to_str - Return the name of given Validity enum value.
  static const char *validity_to_str(Validity v);

public:
  SolverImpl *impl;

public:
  Solver(SolverImpl *_impl) : impl(_impl) {}
  virtual ~Solver();

  /// evaluate - Determine for a particular state if the query
  /// expression is provably true, provably false or neither.
  ///
  /// \param [out] result - if
  /// \f[ \forall X constraints(X) \to query(X) \f]
  /// then Solver::True,
  /// else if
  /// \f[ \forall X constraints(X) \to \lnot query(X) \f]
  /// then Solver::False,
  /// else
  /// Solver::Unknown
  ///
  /// \return True on success.
  bool evaluate(const Query &, Validity &result);

  /// mustBeTrue - Determine if the expression is provably true.
  ///
  /// \param [out] result - On success, true iff the logical formula is true.
  /// \return True on success.
  bool mustBeTrue(const Query &, bool &result);

  /// mustBeFalse - Determine if the expression is provably false.
  bool mustBeFalse(const Query &, bool &result);

  /// mayBeTrue - Determine if there is a valid assignment for the given
  /// state in which the expression evaluates to true.
  bool mayBeTrue(const Query &, bool &result);

  /// mayBeFalse - Determine if there is a valid assignment for the given
  /// state in which the expression evaluates to false.
  bool mayBeFalse(const Query &, bool &result);

  /// getValue - Compute one possible value for the given expression.
  ///
  /// \param [out] result - On success, a value for the expression in some
  /// satisfying assignment.
  ///
  /// \return True on success.
  bool getValue(const Query &, ref<ConstantExpr> &result);

  /// getInitialValues - Compute the initial values for a list of symbols.
  ///
  /// \param [out] result - On success, if \p hasSolution is set, this vector
  /// will be filled in with a value for each symbol in \p objects, in order.
  /// \param [out] hasSolution - On success, whether the constraints of the
  /// query are satisfiable.
  ///
  /// \return True on success.
  bool getInitialValues(const Query &,
                        const std::vector<const SymbolExpr *> &objects,
                        std::vector<llvm::APInt> &result,
                        bool &hasSolution);

  /// setCoreSolverTimeout - Set the timeout of each query, in
  /// milliseconds. Zero disables the timeout.
  virtual void setCoreSolverTimeout(unsigned timeoutMs);

  /// getConstraintLog - Return the query in SMT-LIBv2 form. The caller
  /// owns the returned string and must free() it.
  virtual char *getConstraintLog(const Query &query);
};

/* *** */

/// createCoreSolver - Create the Z3 backed solver.
Solver *createCoreSolver();

} // namespace tacsym

#endif /* TACSYM_SOLVER_H */
