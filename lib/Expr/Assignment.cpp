//===-- Assignment.cpp ----------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Expr/Assignment.h"

#include "tacsym/Expr/ExprHashMap.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/raw_ostream.h"

namespace tacsym {

Assignment::Assignment(const std::vector<const SymbolExpr *> &objects,
                       const std::vector<llvm::APInt> &values,
                       bool _allowFreeValues)
    : allowFreeValues(_allowFreeValues) {
  assert(objects.size() == values.size() && "Size mismatch in Assignment");
  for (unsigned i = 0, e = objects.size(); i != e; ++i)
    bindings.insert(std::make_pair(objects[i]->name, values[i]));
}

ref<Expr> Assignment::evaluate(const SymbolExpr *se) const {
  assert(se);
  bindings_ty::const_iterator it = bindings.find(se->name);
  if (it != bindings.end())
    return ConstantExpr::alloc(it->second.zextOrTrunc(se->getWidth()));
  if (allowFreeValues)
    return const_cast<SymbolExpr *>(se);
  return ConstantExpr::alloc(0, se->getWidth());
}

static ref<Expr> evaluateCached(const Assignment &a, const ref<Expr> &e,
                                ExprHashMap<ref<Expr> > &cache) {
  if (isa<ConstantExpr>(e))
    return e;
  if (const SymbolExpr *se = dyn_cast<SymbolExpr>(e))
    return a.evaluate(se);

  auto it = cache.find(e);
  if (it != cache.end())
    return it->second;

  ref<Expr> kids[3];
  for (unsigned i = 0, n = e->getNumKids(); i != n; ++i)
    kids[i] = evaluateCached(a, e->getKid(i), cache);
  // create() folds once all kids are constant.
  ref<Expr> res = e->rebuild(kids);
  cache.insert(std::make_pair(e, res));
  return res;
}

ref<Expr> Assignment::evaluate(ref<Expr> e) const {
  ExprHashMap<ref<Expr> > cache;
  return evaluateCached(*this, e, cache);
}

bool Assignment::satisfies(const ConstraintSet &constraints) const {
  for (const auto &c : constraints) {
    ref<Expr> res = evaluate(c.expr);
    ConstantExpr *CE = dyn_cast<ConstantExpr>(res);
    if (!CE || !CE->isTrue())
      return false;
  }
  return true;
}

void Assignment::dump() const {
  if (bindings.empty()) {
    llvm::errs() << "No bindings\n";
    return;
  }
  for (const auto &b : bindings) {
    llvm::SmallString<80> S;
    b.second.toString(S, 16, false);
    llvm::errs() << b.first << " = 0x" << S.str().lower() << "\n";
  }
}

} // namespace tacsym
