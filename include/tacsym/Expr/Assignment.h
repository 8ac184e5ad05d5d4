//===-- Assignment.h --------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_ASSIGNMENT_H
#define TACSYM_ASSIGNMENT_H

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/APInt.h"

#include <map>
#include <string>
#include <vector>

namespace tacsym {

/// A (partial) model: concrete values for symbols, keyed by symbol name.
class Assignment {
public:
  typedef std::map<std::string, llvm::APInt> bindings_ty;

  bool allowFreeValues;
  bindings_ty bindings;

public:
  Assignment(bool _allowFreeValues = false)
      : allowFreeValues(_allowFreeValues) {}
  Assignment(const std::vector<const SymbolExpr *> &objects,
             const std::vector<llvm::APInt> &values,
             bool _allowFreeValues = false);

  /// Value of a symbol. Unbound symbols stay symbolic when free values are
  /// allowed and are zero otherwise.
  ref<Expr> evaluate(const SymbolExpr *se) const;

  /// Substitute the bindings into \p e and fold the result.
  ref<Expr> evaluate(ref<Expr> e) const;

  /// Check that every constraint evaluates to true under this assignment.
  bool satisfies(const ConstraintSet &constraints) const;

  void dump() const;
};

} // namespace tacsym

#endif /* TACSYM_ASSIGNMENT_H */
