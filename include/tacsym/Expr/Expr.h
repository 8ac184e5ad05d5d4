//===-- Expr.h --------------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_EXPR_H
#define TACSYM_EXPR_H

#include "tacsym/ADT/Ref.h"
#include "tacsym/Support/Casting.h"

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/DenseSet.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

namespace tacsym {

class ConstantExpr;

/// Symbolic expressions over machine words.
///
/// Expressions are immutable and shared through ref<>. They are built with
/// the static create() methods, which fold constant operands and a few
/// algebraic identities. Widths of binary operands always agree. Booleans
/// have width 1: comparisons produce them, Not/And/Or/Xor/Eq/Ne/Select
/// accept them, and ZExt turns one into a word.
///
/// Folded division follows SMT-LIB, so x/0 is all ones and x%0 is x. The
/// executor builds the TAC rule (x/0 == 0) on top with a Select.
///
/// A new kind needs a case in printKind, in Z3Builder and, if it can be
/// folded, in its create().
class Expr {
public:
  static const unsigned MAGIC_HASH_CONSTANT = 39;

  /// The type of an expression is its width in bits.
  typedef unsigned Width;

  static const Width Bool = 1;
  /// The machine word of the analysed programs.
  static const Width Int256 = 256;

  enum Kind {
    // Leaves
    Constant = 0,
    Symbol,

    Select,
    ZExt,
    Not,

    // Binary, with operands of equal width
    Add,
    Sub,
    Mul,
    UDiv,
    URem,
    And,
    Or,
    Xor,
    Shl,
    LShr,

    // Binary, producing a boolean
    Eq,
    Ne,
    Ult,
    Ule,
    Ugt,
    Uge,

    BinaryKindFirst = Add,
    BinaryKindLast = Uge
  };

  /// @brief Required by tacsym::ref-managed objects
  class ReferenceCounter _refCount;

protected:
  unsigned hashValue;

  /// Order `this` against `b`, which has the same kind, looking only at
  /// the attributes that are not kids.
  virtual int compareContents(const Expr &b) const = 0;

public:
  Expr() : hashValue(0) {}
  virtual ~Expr() {}

  virtual Kind getKind() const = 0;
  virtual Width getWidth() const = 0;

  virtual unsigned getNumKids() const = 0;
  virtual ref<Expr> getKid(unsigned i) const = 0;

  /// Rebuild this expression over new kids, folding where possible.
  virtual ref<Expr> rebuild(ref<Expr> kids[]) const = 0;

  virtual void print(llvm::raw_ostream &os) const;
  void dump() const;

  virtual unsigned hash() const { return hashValue; }
  virtual unsigned computeHash();

  /// Structural total order. Returns 0 iff both sides denote the same tree.
  int compare(const Expr &b) const;

  bool isZero() const;
  bool isTrue() const;
  bool isFalse() const;

  static void printKind(llvm::raw_ostream &os, Kind k);
  static void printWidth(llvm::raw_ostream &os, Width w);

  static ref<Expr> createIsZero(ref<Expr> e);
  static ref<Expr> createTrue();
  static ref<Expr> createFalse();

  static bool classof(const Expr *) { return true; }

private:
  typedef llvm::DenseSet<std::pair<const Expr *, const Expr *> > ExprEquivSet;
  int compare(const Expr &b, ExprEquivSet &equivs) const;
};

inline bool operator==(const Expr &lhs, const Expr &rhs) {
  return lhs.compare(rhs) == 0;
}

inline bool operator!=(const Expr &lhs, const Expr &rhs) {
  return lhs.compare(rhs) != 0;
}

inline bool operator<(const Expr &lhs, const Expr &rhs) {
  return lhs.compare(rhs) < 0;
}

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Expr &e) {
  e.print(os);
  return os;
}

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const Expr::Kind kind) {
  Expr::printKind(os, kind);
  return os;
}

class ConstantExpr : public Expr {
  llvm::APInt value;

  explicit ConstantExpr(const llvm::APInt &v) : value(v) {}

protected:
  int compareContents(const Expr &b) const {
    const llvm::APInt &other = static_cast<const ConstantExpr &>(b).value;
    if (value.getBitWidth() != other.getBitWidth())
      return value.getBitWidth() < other.getBitWidth() ? -1 : 1;
    if (value == other)
      return 0;
    return value.ult(other) ? -1 : 1;
  }

public:
  static ref<ConstantExpr> alloc(const llvm::APInt &v) {
    ref<ConstantExpr> c(new ConstantExpr(v));
    c->computeHash();
    return c;
  }

  static ref<ConstantExpr> alloc(uint64_t v, Width w) {
    return alloc(llvm::APInt(w, v));
  }

  static ref<ConstantExpr> create(uint64_t v, Width w) {
    assert((w >= 64 || v < (UINT64_C(1) << w)) && "invalid constant");
    return alloc(v, w);
  }

  Kind getKind() const { return Constant; }
  Width getWidth() const { return value.getBitWidth(); }

  unsigned getNumKids() const { return 0; }
  ref<Expr> getKid(unsigned) const { return 0; }
  ref<Expr> rebuild(ref<Expr>[]) const {
    return const_cast<ConstantExpr *>(this);
  }

  unsigned computeHash();

  const llvm::APInt &getAPValue() const { return value; }

  /// The value as a uint64_t. Only valid when it has at most 64 active bits.
  uint64_t getZExtValue() const {
    assert(value.getActiveBits() <= 64 && "Value may be out of range!");
    return value.getZExtValue();
  }

  /// Print the value in the given radix.
  void toString(std::string &Res, unsigned radix = 10) const;

  bool isZero() const { return value.isMinValue(); }
  bool isOne() const { return value == 1; }
  bool isAllOnes() const { return value.isMaxValue(); }
  bool isTrue() const { return getWidth() == Bool && value.getBoolValue(); }
  bool isFalse() const { return getWidth() == Bool && !value.getBoolValue(); }

  // Folding helpers. Operands have equal widths; comparisons return a
  // boolean constant.
  ref<ConstantExpr> ZExt(Width W);
  ref<ConstantExpr> Add(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Sub(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Mul(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> UDiv(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> URem(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> And(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Or(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Xor(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Shl(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> LShr(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Eq(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Ne(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Ult(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Ule(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Ugt(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Uge(const ref<ConstantExpr> &RHS);
  ref<ConstantExpr> Not();

  static bool classof(const Expr *E) { return E->getKind() == Constant; }
};

/// A named bitvector of fixed width. Two symbols with the same name denote
/// the same unknown.
class SymbolExpr : public Expr {
  SymbolExpr(const std::string &_name, Width _width)
      : name(_name), width(_width) {}

protected:
  int compareContents(const Expr &b) const {
    const SymbolExpr &other = static_cast<const SymbolExpr &>(b);
    if (width != other.width)
      return width < other.width ? -1 : 1;
    int cmp = name.compare(other.name);
    return cmp == 0 ? 0 : (cmp < 0 ? -1 : 1);
  }

public:
  const std::string name;
  const Width width;

  static ref<Expr> alloc(const std::string &name, Width width) {
    ref<Expr> s(new SymbolExpr(name, width));
    s->computeHash();
    return s;
  }

  static ref<Expr> create(const std::string &name, Width width) {
    return alloc(name, width);
  }

  Kind getKind() const { return Symbol; }
  Width getWidth() const { return width; }

  unsigned getNumKids() const { return 0; }
  ref<Expr> getKid(unsigned) const { return 0; }
  ref<Expr> rebuild(ref<Expr>[]) const {
    return const_cast<SymbolExpr *>(this);
  }

  unsigned computeHash();

  static bool classof(const Expr *E) { return E->getKind() == Symbol; }
};

/// If-then-else over a boolean condition.
class SelectExpr : public Expr {
  SelectExpr(const ref<Expr> &c, const ref<Expr> &t, const ref<Expr> &f)
      : cond(c), trueExpr(t), falseExpr(f) {}

protected:
  int compareContents(const Expr &) const { return 0; }

public:
  ref<Expr> cond, trueExpr, falseExpr;

  static ref<Expr> alloc(const ref<Expr> &c, const ref<Expr> &t,
                         const ref<Expr> &f) {
    ref<Expr> s(new SelectExpr(c, t, f));
    s->computeHash();
    return s;
  }

  static ref<Expr> create(ref<Expr> c, ref<Expr> t, ref<Expr> f);

  Kind getKind() const { return Select; }
  Width getWidth() const { return trueExpr->getWidth(); }

  unsigned getNumKids() const { return 3; }
  ref<Expr> getKid(unsigned i) const {
    switch (i) {
    case 0: return cond;
    case 1: return trueExpr;
    case 2: return falseExpr;
    default: return ref<Expr>();
    }
  }
  ref<Expr> rebuild(ref<Expr> kids[]) const {
    return create(kids[0], kids[1], kids[2]);
  }

  static bool classof(const Expr *E) { return E->getKind() == Select; }
};

/// Zero extension to a strictly wider width. Extending a boolean yields
/// 0 or 1.
class ZExtExpr : public Expr {
  ZExtExpr(const ref<Expr> &e, Width w) : src(e), width(w) {}

protected:
  int compareContents(const Expr &b) const {
    Width other = static_cast<const ZExtExpr &>(b).width;
    return width == other ? 0 : (width < other ? -1 : 1);
  }

public:
  ref<Expr> src;
  Width width;

  static ref<Expr> alloc(const ref<Expr> &e, Width w) {
    ref<Expr> z(new ZExtExpr(e, w));
    z->computeHash();
    return z;
  }

  static ref<Expr> create(const ref<Expr> &e, Width w);

  Kind getKind() const { return ZExt; }
  Width getWidth() const { return width; }

  unsigned getNumKids() const { return 1; }
  ref<Expr> getKid(unsigned i) const { return i == 0 ? src : ref<Expr>(); }
  ref<Expr> rebuild(ref<Expr> kids[]) const { return create(kids[0], width); }

  unsigned computeHash();

  static bool classof(const Expr *E) { return E->getKind() == ZExt; }
};

/// Bitwise complement; logical negation on booleans.
class NotExpr : public Expr {
  explicit NotExpr(const ref<Expr> &e) : expr(e) {}

protected:
  int compareContents(const Expr &) const { return 0; }

public:
  ref<Expr> expr;

  static ref<Expr> alloc(const ref<Expr> &e) {
    ref<Expr> n(new NotExpr(e));
    n->computeHash();
    return n;
  }

  static ref<Expr> create(const ref<Expr> &e);

  Kind getKind() const { return Not; }
  Width getWidth() const { return expr->getWidth(); }

  unsigned getNumKids() const { return 1; }
  ref<Expr> getKid(unsigned i) const { return i == 0 ? expr : ref<Expr>(); }
  ref<Expr> rebuild(ref<Expr> kids[]) const { return create(kids[0]); }

  static bool classof(const Expr *E) { return E->getKind() == Not; }
};

class BinaryExpr : public Expr {
protected:
  BinaryExpr(const ref<Expr> &l, const ref<Expr> &r) : left(l), right(r) {}

  int compareContents(const Expr &) const { return 0; }

public:
  ref<Expr> left, right;

  unsigned getNumKids() const { return 2; }
  ref<Expr> getKid(unsigned i) const {
    return i == 0 ? left : (i == 1 ? right : ref<Expr>());
  }

  static bool classof(const Expr *E) {
    Kind k = E->getKind();
    return BinaryKindFirst <= k && k <= BinaryKindLast;
  }
};

// One class per binary kind. create() folds and is defined in Expr.cpp.
#define BINARY_EXPR_CLASS(_class_kind, _result_width)                          \
  class _class_kind##Expr : public BinaryExpr {                                \
    _class_kind##Expr(const ref<Expr> &l, const ref<Expr> &r)                  \
        : BinaryExpr(l, r) {}                                                  \
                                                                               \
  public:                                                                      \
    static ref<Expr> alloc(const ref<Expr> &l, const ref<Expr> &r) {           \
      ref<Expr> b(new _class_kind##Expr(l, r));                                \
      b->computeHash();                                                        \
      return b;                                                                \
    }                                                                          \
    static ref<Expr> create(const ref<Expr> &l, const ref<Expr> &r);           \
                                                                               \
    Kind getKind() const { return _class_kind; }                               \
    Width getWidth() const { return _result_width; }                           \
    ref<Expr> rebuild(ref<Expr> kids[]) const {                                \
      return create(kids[0], kids[1]);                                         \
    }                                                                          \
                                                                               \
    static bool classof(const Expr *E) { return E->getKind() == _class_kind; } \
  };

#define ARITHMETIC_EXPR_CLASS(_class_kind)                                     \
  BINARY_EXPR_CLASS(_class_kind, left->getWidth())
#define COMPARISON_EXPR_CLASS(_class_kind) BINARY_EXPR_CLASS(_class_kind, Bool)

ARITHMETIC_EXPR_CLASS(Add)
ARITHMETIC_EXPR_CLASS(Sub)
ARITHMETIC_EXPR_CLASS(Mul)
ARITHMETIC_EXPR_CLASS(UDiv)
ARITHMETIC_EXPR_CLASS(URem)
ARITHMETIC_EXPR_CLASS(And)
ARITHMETIC_EXPR_CLASS(Or)
ARITHMETIC_EXPR_CLASS(Xor)
ARITHMETIC_EXPR_CLASS(Shl)
ARITHMETIC_EXPR_CLASS(LShr)

COMPARISON_EXPR_CLASS(Eq)
COMPARISON_EXPR_CLASS(Ne)
COMPARISON_EXPR_CLASS(Ult)
COMPARISON_EXPR_CLASS(Ule)
COMPARISON_EXPR_CLASS(Ugt)
COMPARISON_EXPR_CLASS(Uge)

#undef ARITHMETIC_EXPR_CLASS
#undef COMPARISON_EXPR_CLASS
#undef BINARY_EXPR_CLASS

// Implementations

inline bool Expr::isZero() const {
  if (const ConstantExpr *CE = dyn_cast<ConstantExpr>(this))
    return CE->isZero();
  return false;
}

inline bool Expr::isTrue() const {
  assert(getWidth() == Expr::Bool && "isTrue() on a non-boolean");
  if (const ConstantExpr *CE = dyn_cast<ConstantExpr>(this))
    return CE->isTrue();
  return false;
}

inline bool Expr::isFalse() const {
  assert(getWidth() == Expr::Bool && "isFalse() on a non-boolean");
  if (const ConstantExpr *CE = dyn_cast<ConstantExpr>(this))
    return CE->isFalse();
  return false;
}

} // End tacsym namespace

#endif /* TACSYM_EXPR_H */
