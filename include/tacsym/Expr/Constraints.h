//===-- Constraints.h -------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_CONSTRAINTS_H
#define TACSYM_CONSTRAINTS_H

#include "tacsym/Expr/Expr.h"

#include <vector>

namespace tacsym {

/// Where a path constraint came from.
enum class ConstraintProvenance {
  /// Branch conditions and other program semantics.
  Program,
  /// Side conditions of checked arithmetic ("safemath").
  Safety
};

const char *getProvenanceName(ConstraintProvenance provenance);

/// A single conjunct of a path condition.
struct Constraint {
  ref<Expr> expr;
  ConstraintProvenance provenance;

  Constraint(const ref<Expr> &e, ConstraintProvenance p)
      : expr(e), provenance(p) {}
};

/// Resembles a set of constraints that can be passed around
///
class ConstraintSet {
  friend class ConstraintManager;

public:
  using constraints_ty = std::vector<Constraint>;
  using iterator = constraints_ty::iterator;
  using const_iterator = constraints_ty::const_iterator;

  using constraint_iterator = const_iterator;

  bool empty() const;
  constraint_iterator begin() const;
  constraint_iterator end() const;
  size_t size() const noexcept;

  /// Number of constraints with the given provenance.
  size_t count(ConstraintProvenance provenance) const;

  /// The formulas alone, in insertion order.
  std::vector<ref<Expr> > getExprs() const;

  ConstraintSet() = default;

  void push_back(const ref<Expr> &e,
                 ConstraintProvenance provenance =
                     ConstraintProvenance::Program);

  bool operator==(const ConstraintSet &b) const;

private:
  constraints_ty constraints;
};

/// Manages constraints, e.g. optimisation
class ConstraintManager {
public:
  /// Create constraint manager that modifies constraints
  /// \param constraints
  explicit ConstraintManager(ConstraintSet &constraints);

  /// Simplify expression expr based on constraints
  /// \param constraints set of constraints used for simplification
  /// \param expr to simplify
  /// \return simplified expression
  static ref<Expr> simplifyExpr(const ConstraintSet &constraints,
                                const ref<Expr> &expr);

  /// Add constraint to the referenced constraint set. Constant true is
  /// dropped. Conjunctions are split into separate records that share the
  /// provenance.
  void addConstraint(const ref<Expr> &constraint,
                     ConstraintProvenance provenance =
                         ConstraintProvenance::Program);

private:
  void addConstraintInternal(const ref<Expr> &constraint,
                             ConstraintProvenance provenance);

  ConstraintSet &constraints;
};

} // namespace tacsym

#endif /* TACSYM_CONSTRAINTS_H */
