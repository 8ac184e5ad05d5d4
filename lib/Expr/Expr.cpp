//===-- Expr.cpp ----------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/Hashing.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace tacsym;
using namespace llvm;

/***/

ref<Expr> Expr::createTrue() { return ConstantExpr::alloc(1, Expr::Bool); }

ref<Expr> Expr::createFalse() { return ConstantExpr::alloc(0, Expr::Bool); }

ref<Expr> Expr::createIsZero(ref<Expr> e) {
  return EqExpr::create(e, ConstantExpr::alloc(0, e->getWidth()));
}

void Expr::printKind(llvm::raw_ostream &os, Kind k) {
  switch(k) {
#define X(C) case C: os << #C; break
    X(Constant);
    X(Symbol);
    X(Select);
    X(ZExt);
    X(Not);
    X(Add);
    X(Sub);
    X(Mul);
    X(UDiv);
    X(URem);
    X(And);
    X(Or);
    X(Xor);
    X(Shl);
    X(LShr);
    X(Eq);
    X(Ne);
    X(Ult);
    X(Ule);
    X(Ugt);
    X(Uge);
#undef X
  default:
    assert(0 && "invalid kind");
  }
}

void Expr::printWidth(llvm::raw_ostream &os, Width width) {
  switch(width) {
  case Expr::Bool: os << "Bool"; break;
  default: os << "w" << width; break;
  }
}

////////
//
// Simple hash functions for various kinds of Exprs
//
///////

unsigned Expr::computeHash() {
  unsigned res = getKind() * Expr::MAGIC_HASH_CONSTANT;

  int n = getNumKids();
  for (int i = 0; i < n; i++) {
    res <<= 1;
    res ^= getKid(i)->hash() * Expr::MAGIC_HASH_CONSTANT;
  }

  hashValue = res;
  return hashValue;
}

unsigned ConstantExpr::computeHash() {
  hashValue = static_cast<unsigned>(hash_value(value)) ^
              (getWidth() * MAGIC_HASH_CONSTANT);
  return hashValue;
}

unsigned SymbolExpr::computeHash() {
  hashValue = static_cast<unsigned>(hash_value(name)) ^
              (width * MAGIC_HASH_CONSTANT);
  return hashValue;
}

unsigned ZExtExpr::computeHash() {
  unsigned res = getWidth() * Expr::MAGIC_HASH_CONSTANT;
  hashValue = res ^ src->hash() * Expr::MAGIC_HASH_CONSTANT;
  return hashValue;
}

int Expr::compare(const Expr &b) const {
  static ExprEquivSet equivs;
  int r = compare(b, equivs);
  equivs.clear();
  return r;
}

// returns 0 if b is structurally equal to *this
int Expr::compare(const Expr &b, ExprEquivSet &equivs) const {
  if (this == &b) return 0;

  const Expr *ap, *bp;
  if (this < &b) {
    ap = this; bp = &b;
  } else {
    ap = &b; bp = this;
  }

  if (equivs.count(std::make_pair(ap, bp)))
    return 0;

  Kind ak = getKind(), bk = b.getKind();
  if (ak!=bk)
    return (ak < bk) ? -1 : 1;

  if (hashValue != b.hashValue)
    return (hashValue < b.hashValue) ? -1 : 1;

  if (int res = compareContents(b))
    return res;

  unsigned aN = getNumKids();
  for (unsigned i=0; i<aN; i++)
    if (int res = getKid(i)->compare(*b.getKid(i), equivs))
      return res;

  equivs.insert(std::make_pair(ap, bp));
  return 0;
}

void Expr::print(llvm::raw_ostream &os) const {
  switch (getKind()) {
  case Constant: {
    const ConstantExpr *CE = cast<ConstantExpr>(this);
    if (CE->getWidth() == Expr::Bool) {
      os << (CE->isTrue() ? "true" : "false");
    } else {
      std::string S;
      CE->toString(S, CE->getAPValue().getActiveBits() > 64 ? 16 : 10);
      if (CE->getAPValue().getActiveBits() > 64)
        os << "0x";
      os << S;
    }
    return;
  }
  case Symbol:
    os << cast<SymbolExpr>(this)->name;
    return;
  default:
    break;
  }

  os << "(";
  printKind(os, getKind());
  if (isa<ZExtExpr>(this)) {
    os << " ";
    printWidth(os, getWidth());
  }
  for (unsigned i = 0, e = getNumKids(); i != e; ++i)
    os << " " << getKid(i);
  os << ")";
}

void Expr::dump() const {
  this->print(errs());
  errs() << "\n";
}

/***/

void ConstantExpr::toString(std::string &Res, unsigned radix) const {
  SmallString<80> S;
  value.toString(S, radix, false);
  Res = S.str().lower();
}

ref<ConstantExpr> ConstantExpr::ZExt(Width W) {
  return ConstantExpr::alloc(value.zext(W));
}

ref<ConstantExpr> ConstantExpr::Add(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value + RHS->value);
}

ref<ConstantExpr> ConstantExpr::Sub(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value - RHS->value);
}

ref<ConstantExpr> ConstantExpr::Mul(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value * RHS->value);
}

ref<ConstantExpr> ConstantExpr::UDiv(const ref<ConstantExpr> &RHS) {
  // SMT-LIB: division by zero yields all ones.
  if (RHS->isZero())
    return ConstantExpr::alloc(APInt::getMaxValue(getWidth()));
  return ConstantExpr::alloc(value.udiv(RHS->value));
}

ref<ConstantExpr> ConstantExpr::URem(const ref<ConstantExpr> &RHS) {
  // SMT-LIB: remainder by zero yields the dividend.
  if (RHS->isZero())
    return ConstantExpr::alloc(value);
  return ConstantExpr::alloc(value.urem(RHS->value));
}

ref<ConstantExpr> ConstantExpr::And(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value & RHS->value);
}

ref<ConstantExpr> ConstantExpr::Or(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value | RHS->value);
}

ref<ConstantExpr> ConstantExpr::Xor(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value ^ RHS->value);
}

ref<ConstantExpr> ConstantExpr::Shl(const ref<ConstantExpr> &RHS) {
  // Shift amounts at or above the width produce zero.
  return ConstantExpr::alloc(value.shl(RHS->value));
}

ref<ConstantExpr> ConstantExpr::LShr(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value.lshr(RHS->value));
}

ref<ConstantExpr> ConstantExpr::Not() {
  return ConstantExpr::alloc(~value);
}

ref<ConstantExpr> ConstantExpr::Eq(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value == RHS->value, Expr::Bool);
}

ref<ConstantExpr> ConstantExpr::Ne(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value != RHS->value, Expr::Bool);
}

ref<ConstantExpr> ConstantExpr::Ult(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value.ult(RHS->value), Expr::Bool);
}

ref<ConstantExpr> ConstantExpr::Ule(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value.ule(RHS->value), Expr::Bool);
}

ref<ConstantExpr> ConstantExpr::Ugt(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value.ugt(RHS->value), Expr::Bool);
}

ref<ConstantExpr> ConstantExpr::Uge(const ref<ConstantExpr> &RHS) {
  return ConstantExpr::alloc(value.uge(RHS->value), Expr::Bool);
}

/***/

ref<Expr> SelectExpr::create(ref<Expr> c, ref<Expr> t, ref<Expr> f) {
  Expr::Width kt = t->getWidth();

  assert(c->getWidth()==Bool && "type mismatch");
  assert(kt==f->getWidth() && "type mismatch");

  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(c)) {
    return CE->isTrue() ? t : f;
  } else if (t==f) {
    return t;
  } else if (kt==Expr::Bool) { // c ? t : f  <=> (c and t) or (not c and f)
    if (ConstantExpr *CE = dyn_cast<ConstantExpr>(t)) {
      if (CE->isTrue()) {
        return OrExpr::create(c, f);
      } else {
        return AndExpr::create(NotExpr::create(c), f);
      }
    } else if (ConstantExpr *CE = dyn_cast<ConstantExpr>(f)) {
      if (CE->isTrue()) {
        return OrExpr::create(NotExpr::create(c), t);
      } else {
        return AndExpr::create(c, t);
      }
    }
  }

  return SelectExpr::alloc(c, t, f);
}

/***/

ref<Expr> ZExtExpr::create(const ref<Expr> &e, Width w) {
  Width kBits = e->getWidth();
  assert(w >= kBits && "zero extension to a narrower width");
  if (w == kBits)
    return e;
  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(e))
    return CE->ZExt(w);
  return ZExtExpr::alloc(e, w);
}

ref<Expr> NotExpr::create(const ref<Expr> &e) {
  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(e))
    return CE->Not();
  if (NotExpr *NE = dyn_cast<NotExpr>(e))
    return NE->expr;

  return NotExpr::alloc(e);
}

/***/

static bool isAllOnesConstant(const ref<Expr> &e) {
  if (const ConstantExpr *CE = dyn_cast<ConstantExpr>(e))
    return CE->isAllOnes();
  return false;
}

static bool isOneConstant(const ref<Expr> &e) {
  if (const ConstantExpr *CE = dyn_cast<ConstantExpr>(e))
    return CE->isOne();
  return false;
}

ref<Expr> AddExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Add(cr);

  if (l->getWidth() == Expr::Bool) // a + b ==> a ^ b
    return XorExpr::create(l, r);
  if (l->isZero())
    return r;
  if (r->isZero())
    return l;
  return AddExpr::alloc(l, r);
}

ref<Expr> SubExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Sub(cr);

  if (l->getWidth() == Expr::Bool) // a - b ==> a ^ b
    return XorExpr::create(l, r);
  if (r->isZero())
    return l;
  if (l == r)
    return ConstantExpr::alloc(0, l->getWidth());
  return SubExpr::alloc(l, r);
}

ref<Expr> MulExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Mul(cr);

  if (l->getWidth() == Expr::Bool) // a * b ==> a & b
    return AndExpr::create(l, r);
  if (l->isZero())
    return l;
  if (r->isZero())
    return r;
  if (isOneConstant(l))
    return r;
  if (isOneConstant(r))
    return l;
  return MulExpr::alloc(l, r);
}

ref<Expr> UDivExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->UDiv(cr);

  if (isOneConstant(r))
    return l;
  return UDivExpr::alloc(l, r);
}

ref<Expr> URemExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->URem(cr);

  if (isOneConstant(r))
    return ConstantExpr::alloc(0, l->getWidth());
  return URemExpr::alloc(l, r);
}

ref<Expr> AndExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->And(cr);

  if (l->isZero() || isAllOnesConstant(r))
    return l;
  if (r->isZero() || isAllOnesConstant(l))
    return r;
  if (l == r)
    return l;
  return AndExpr::alloc(l, r);
}

ref<Expr> OrExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Or(cr);

  if (l->isZero() || isAllOnesConstant(r))
    return r;
  if (r->isZero() || isAllOnesConstant(l))
    return l;
  if (l == r)
    return l;
  return OrExpr::alloc(l, r);
}

ref<Expr> XorExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Xor(cr);

  if (l->isZero())
    return r;
  if (r->isZero())
    return l;
  if (l == r)
    return ConstantExpr::alloc(0, l->getWidth());
  return XorExpr::alloc(l, r);
}

ref<Expr> ShlExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Shl(cr);

  if (r->isZero() || l->isZero())
    return l;
  return ShlExpr::alloc(l, r);
}

ref<Expr> LShrExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->LShr(cr);

  if (r->isZero() || l->isZero())
    return l;
  return LShrExpr::alloc(l, r);
}

/***/

ref<Expr> EqExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Eq(cr);

  if (l == r)
    return Expr::createTrue();

  if (l->getWidth() == Expr::Bool) {
    // (true == x) ==> x, (false == x) ==> !x
    if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
      return cl->isTrue() ? r : NotExpr::create(r);
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cr->isTrue() ? l : NotExpr::create(l);
  }

  return EqExpr::alloc(l, r);
}

ref<Expr> NeExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Ne(cr);

  if (l == r)
    return Expr::createFalse();

  if (l->getWidth() == Expr::Bool)
    return NotExpr::create(EqExpr::create(l, r));

  return NeExpr::alloc(l, r);
}

ref<Expr> UltExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Ult(cr);

  // nothing is below zero
  if (r->isZero() || l == r)
    return Expr::createFalse();
  return UltExpr::alloc(l, r);
}

ref<Expr> UleExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Ule(cr);

  if (l->isZero() || l == r)
    return Expr::createTrue();
  return UleExpr::alloc(l, r);
}

ref<Expr> UgtExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Ugt(cr);

  if (l->isZero() || l == r)
    return Expr::createFalse();
  return UgtExpr::alloc(l, r);
}

ref<Expr> UgeExpr::create(const ref<Expr> &l, const ref<Expr> &r) {
  assert(l->getWidth() == r->getWidth() && "type mismatch");
  if (ConstantExpr *cl = dyn_cast<ConstantExpr>(l))
    if (ConstantExpr *cr = dyn_cast<ConstantExpr>(r))
      return cl->Uge(cr);

  if (r->isZero() || l == r)
    return Expr::createTrue();
  return UgeExpr::alloc(l, r);
}
