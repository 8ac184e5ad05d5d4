//===-- ExprUtil.cpp ------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Expr/ExprUtil.h"
#include "tacsym/Expr/Expr.h"
#include "tacsym/Expr/ExprHashMap.h"

#include <set>
#include <string>

using namespace tacsym;

static void collectSymbols(ref<Expr> e, ExprHashSet &visited,
                           std::set<std::string> &names,
                           std::vector<const SymbolExpr *> &results) {
  // Invariant: \forall_{i \in stack} !i.isConstant() && i \in visited
  std::vector< ref<Expr> > stack;

  if (!isa<ConstantExpr>(e) && visited.insert(e).second)
    stack.push_back(e);

  while (!stack.empty()) {
    ref<Expr> top = stack.back();
    stack.pop_back();

    if (const SymbolExpr *se = dyn_cast<SymbolExpr>(top)) {
      if (names.insert(se->name).second)
        results.push_back(se);
      continue;
    }

    Expr *cur = top.get();
    // Push in reverse so kids are visited left to right.
    for (unsigned i = cur->getNumKids(); i != 0; --i) {
      ref<Expr> k = cur->getKid(i - 1);
      if (!isa<ConstantExpr>(k) && visited.insert(k).second)
        stack.push_back(k);
    }
  }
}

void tacsym::findSymbols(ref<Expr> e,
                         std::vector<const SymbolExpr *> &results) {
  ExprHashSet visited;
  std::set<std::string> names;
  collectSymbols(e, visited, names, results);
}

void tacsym::findSymbols(const std::vector<ref<Expr> > &exprs,
                         std::vector<const SymbolExpr *> &results) {
  ExprHashSet visited;
  std::set<std::string> names;
  for (const auto &e : exprs)
    collectSymbols(e, visited, names, results);
}

static ref<Expr> replaceSubExprs(const ref<Expr> &e,
                                 const ExprHashMap<ref<Expr> > &replacements,
                                 ExprHashMap<ref<Expr> > &cache) {
  if (isa<ConstantExpr>(e))
    return e;

  auto it = replacements.find(e);
  if (it != replacements.end())
    return it->second;

  auto cached = cache.find(e);
  if (cached != cache.end())
    return cached->second;

  unsigned numKids = e->getNumKids();
  ref<Expr> res = e;
  if (numKids) {
    ref<Expr> kids[3];
    bool changed = false;
    for (unsigned i = 0; i < numKids; ++i) {
      kids[i] = replaceSubExprs(e->getKid(i), replacements, cache);
      if (kids[i].get() != e->getKid(i).get())
        changed = true;
    }
    if (changed)
      res = e->rebuild(kids);
  }

  cache.insert(std::make_pair(e, res));
  return res;
}

ref<Expr> tacsym::replaceSubExprs(const ref<Expr> &e,
                                  const ExprHashMap<ref<Expr> > &replacements) {
  if (replacements.empty())
    return e;
  ExprHashMap<ref<Expr> > cache;
  return ::replaceSubExprs(e, replacements, cache);
}
