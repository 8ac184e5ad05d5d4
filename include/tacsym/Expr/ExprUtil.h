//===-- ExprUtil.h ----------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_EXPRUTIL_H
#define TACSYM_EXPRUTIL_H

#include "tacsym/Expr/Expr.h"
#include "tacsym/Expr/ExprHashMap.h"

#include <vector>

namespace tacsym {

/// Find all symbols referenced by an expression, each name once, in the
/// order of first occurrence.
void findSymbols(ref<Expr> e, std::vector<const SymbolExpr *> &results);

/// Find all symbols referenced by any of the given expressions.
void findSymbols(const std::vector<ref<Expr> > &exprs,
                 std::vector<const SymbolExpr *> &results);

/// Rebuild \p e bottom-up, replacing every subexpression that is a key of
/// \p replacements by its value.
ref<Expr> replaceSubExprs(const ref<Expr> &e,
                          const ExprHashMap<ref<Expr> > &replacements);

} // namespace tacsym

#endif /* TACSYM_EXPRUTIL_H */
