//===-- Z3Builder.h --------------------------------------------*- C++ -*-====//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_Z3BUILDER_H
#define TACSYM_Z3BUILDER_H

#include "tacsym/Expr/Expr.h"
#include "tacsym/Expr/ExprHashMap.h"

#include <map>
#include <string>
#include <z3.h>

namespace tacsym {

/// Owning handle for a node of a reference-counted Z3 context.
template <typename T> class Z3NodeHandle {
protected:
  T node;
  ::Z3_context context;

private:
  inline ::Z3_ast as_ast() const;

  void retain() {
    if (node && context)
      ::Z3_inc_ref(context, as_ast());
  }
  void release() {
    if (node && context)
      ::Z3_dec_ref(context, as_ast());
  }

public:
  Z3NodeHandle() : node(nullptr), context(nullptr) {}
  Z3NodeHandle(const T _node, const ::Z3_context _context)
      : node(_node), context(_context) {
    retain();
  }
  Z3NodeHandle(const Z3NodeHandle &b) : node(b.node), context(b.context) {
    retain();
  }
  ~Z3NodeHandle() { release(); }

  Z3NodeHandle &operator=(const Z3NodeHandle &b) {
    if (this == &b)
      return *this;
    release();
    node = b.node;
    context = b.context;
    retain();
    return *this;
  }

  void dump() const;

  operator T() const { return node; }
};

template <> inline ::Z3_ast Z3NodeHandle<Z3_sort>::as_ast() const {
  return ::Z3_sort_to_ast(context, node);
}
typedef Z3NodeHandle<Z3_sort> Z3SortHandle;
template <> void Z3NodeHandle<Z3_sort>::dump() const;

template <> inline ::Z3_ast Z3NodeHandle<Z3_ast>::as_ast() const {
  return node;
}
typedef Z3NodeHandle<Z3_ast> Z3ASTHandle;
template <> void Z3NodeHandle<Z3_ast>::dump() const;

/// Translates tacsym expressions into Z3 terms. An expression of width 1
/// becomes a Z3 boolean; every other width becomes a bitvector.
class Z3Builder {
  ExprHashMap<Z3ASTHandle> constructed;
  std::map<std::string, Z3ASTHandle> symbols;
  bool autoClearConstructCache;

  Z3ASTHandle wrap(::Z3_ast node) { return Z3ASTHandle(node, ctx); }
  Z3SortHandle sortFor(Expr::Width width);
  Z3ASTHandle bvConstant(const llvm::APInt &value);

  Z3ASTHandle constructCached(const ref<Expr> &e);
  Z3ASTHandle constructActual(const ref<Expr> &e);
  Z3ASTHandle constructBinary(Expr::Kind kind, Expr::Width operandWidth,
                              const Z3ASTHandle &left,
                              const Z3ASTHandle &right);

public:
  ::Z3_context ctx;

  explicit Z3Builder(bool autoClearConstructCache);
  ~Z3Builder();

  /// The Z3 constant standing for a symbol. Symbols are identified by name,
  /// so every call with the same name returns the same term.
  Z3ASTHandle getSymbolHandle(const SymbolExpr *se);

  Z3ASTHandle construct(const ref<Expr> &e) {
    Z3ASTHandle res = constructCached(e);
    if (autoClearConstructCache)
      clearConstructCache();
    return res;
  }

  void clearConstructCache() { constructed.clear(); }
};

} // namespace tacsym

#endif /* TACSYM_Z3BUILDER_H */
