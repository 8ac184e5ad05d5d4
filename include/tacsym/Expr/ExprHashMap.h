//===-- ExprHashMap.h -------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_EXPRHASHMAP_H
#define TACSYM_EXPRHASHMAP_H

#include "tacsym/Expr/Expr.h"

#include <unordered_map>
#include <unordered_set>

namespace tacsym {

namespace util {
struct ExprHash {
  unsigned operator()(const ref<Expr> &e) const { return e->hash(); }
};

struct ExprCmp {
  bool operator()(const ref<Expr> &a, const ref<Expr> &b) const {
    return a == b;
  }
};
} // namespace util

template <class T>
class ExprHashMap
    : public std::unordered_map<ref<Expr>, T, util::ExprHash, util::ExprCmp> {
};

typedef std::unordered_set<ref<Expr>, util::ExprHash, util::ExprCmp>
    ExprHashSet;

} // namespace tacsym

#endif /* TACSYM_EXPRHASHMAP_H */
