//===-- ExprTest.cpp ------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "gtest/gtest.h"

#include "tacsym/Expr/Assignment.h"
#include "tacsym/Expr/Expr.h"
#include "tacsym/Expr/ExprHashMap.h"
#include "tacsym/Expr/ExprUtil.h"
#include "tacsym/Support/Casting.h"

#include "llvm/ADT/APInt.h"

#include <vector>

using namespace tacsym;

namespace {

ref<Expr> word(uint64_t v) { return ConstantExpr::alloc(v, Expr::Int256); }

ref<Expr> symbol(const char *name) {
  return SymbolExpr::create(name, Expr::Int256);
}

uint64_t constantValue(const ref<Expr> &e) {
  const ConstantExpr *CE = dyn_cast<ConstantExpr>(e);
  EXPECT_TRUE(CE != nullptr);
  return CE ? CE->getZExtValue() : 0;
}

TEST(ExprTest, BasicConstruction) {
  ref<Expr> x = symbol("x");
  EXPECT_EQ(Expr::Symbol, x->getKind());
  EXPECT_EQ(256u, x->getWidth());

  ref<Expr> sum = AddExpr::create(x, word(3));
  EXPECT_EQ(Expr::Add, sum->getKind());
  EXPECT_EQ(2u, sum->getNumKids());

  ref<Expr> cmp = UltExpr::create(x, word(3));
  EXPECT_EQ(1u, cmp->getWidth());
}

TEST(ExprTest, StructuralEquality) {
  ref<Expr> a = AddExpr::create(symbol("x"), symbol("y"));
  ref<Expr> b = AddExpr::create(symbol("x"), symbol("y"));
  ref<Expr> c = AddExpr::create(symbol("x"), symbol("z"));

  EXPECT_TRUE(a == b);
  EXPECT_FALSE(a == c);
  EXPECT_EQ(a->hash(), b->hash());
}

TEST(ExprTest, ConstantFolding) {
  EXPECT_EQ(12u, constantValue(AddExpr::create(word(5), word(7))));
  EXPECT_EQ(2u, constantValue(SubExpr::create(word(7), word(5))));
  EXPECT_EQ(35u, constantValue(MulExpr::create(word(5), word(7))));
  EXPECT_EQ(3u, constantValue(UDivExpr::create(word(7), word(2))));
  EXPECT_EQ(1u, constantValue(URemExpr::create(word(7), word(2))));
  EXPECT_EQ(8u, constantValue(ShlExpr::create(word(1), word(3))));
  EXPECT_EQ(1u, constantValue(LShrExpr::create(word(8), word(3))));

  // Words wrap around.
  ref<Expr> max = ConstantExpr::alloc(llvm::APInt::getMaxValue(Expr::Int256));
  EXPECT_TRUE(AddExpr::create(max, word(1))->isZero());
  EXPECT_TRUE(SubExpr::create(word(0), word(1)) == max);

  // Shifting out every bit gives zero.
  EXPECT_TRUE(ShlExpr::create(word(1), word(300))->isZero());
  EXPECT_TRUE(LShrExpr::create(max, word(256))->isZero());
}

TEST(ExprTest, IdentityFolding) {
  ref<Expr> x = symbol("x");

  EXPECT_TRUE(AddExpr::create(x, word(0)) == x);
  EXPECT_TRUE(AddExpr::create(word(0), x) == x);
  EXPECT_TRUE(SubExpr::create(x, word(0)) == x);
  EXPECT_TRUE(SubExpr::create(x, x)->isZero());
  EXPECT_TRUE(MulExpr::create(x, word(0))->isZero());
  EXPECT_TRUE(MulExpr::create(word(1), x) == x);
  EXPECT_TRUE(MulExpr::create(x, word(1)) == x);
  EXPECT_TRUE(XorExpr::create(x, x)->isZero());
}

TEST(ExprTest, ComparisonFolding) {
  ref<Expr> x = symbol("x");

  EXPECT_TRUE(EqExpr::create(x, x)->isTrue());
  EXPECT_TRUE(NeExpr::create(x, x)->isFalse());
  EXPECT_TRUE(UgeExpr::create(x, x)->isTrue());
  EXPECT_TRUE(UgeExpr::create(x, word(0))->isTrue());
  EXPECT_TRUE(UltExpr::create(x, word(0))->isFalse());
  EXPECT_TRUE(UltExpr::create(word(3), word(4))->isTrue());
  EXPECT_TRUE(UgtExpr::create(word(3), word(4))->isFalse());

  ref<Expr> ne = NeExpr::create(x, word(0));
  EXPECT_EQ(Expr::Ne, ne->getKind());
}

TEST(ExprTest, BooleanNormalization) {
  ref<Expr> b = UltExpr::create(symbol("x"), symbol("y"));

  // x == false  ==>  !x
  ref<Expr> isZero = Expr::createIsZero(b);
  EXPECT_EQ(Expr::Not, isZero->getKind());
  EXPECT_TRUE(NotExpr::create(isZero) == b);

  ref<Expr> c = UltExpr::create(symbol("y"), symbol("z"));
  ref<Expr> ne = NeExpr::create(b, c);
  ASSERT_EQ(Expr::Not, ne->getKind());
  EXPECT_EQ(Expr::Eq, ne->getKid(0)->getKind());
}

TEST(ExprTest, ZExtAndSelect) {
  EXPECT_EQ(1u, constantValue(
                    ZExtExpr::create(Expr::createTrue(), Expr::Int256)));

  ref<Expr> x = symbol("x");
  ref<Expr> cond = UltExpr::create(x, word(10));
  ref<Expr> wide = ZExtExpr::create(cond, Expr::Int256);
  EXPECT_EQ(Expr::ZExt, wide->getKind());
  EXPECT_EQ(256u, wide->getWidth());
  EXPECT_TRUE(ZExtExpr::create(x, Expr::Int256) == x);

  EXPECT_EQ(4u, constantValue(
                    SelectExpr::create(Expr::createTrue(), word(4), word(5))));
  EXPECT_EQ(5u, constantValue(SelectExpr::create(Expr::createFalse(),
                                                 word(4), word(5))));
  ref<Expr> sel = SelectExpr::create(cond, word(4), word(5));
  EXPECT_EQ(Expr::Select, sel->getKind());
  EXPECT_TRUE(SelectExpr::create(cond, x, x) == x);
}

TEST(ExprTest, DivisionByZeroConstants) {
  ref<ConstantExpr> seven = ConstantExpr::alloc(7, Expr::Int256);
  ref<ConstantExpr> zero = ConstantExpr::alloc(0, Expr::Int256);

  EXPECT_TRUE(seven->UDiv(zero)->isAllOnes());
  EXPECT_EQ(7u, seven->URem(zero)->getZExtValue());
}

TEST(ExprTest, FindSymbols) {
  ref<Expr> x = symbol("x");
  ref<Expr> y = symbol("y");
  ref<Expr> e = AddExpr::create(MulExpr::create(x, y), x);

  std::vector<const SymbolExpr *> symbols;
  findSymbols(e, symbols);
  ASSERT_EQ(2u, symbols.size());
  EXPECT_EQ("x", symbols[0]->name);
  EXPECT_EQ("y", symbols[1]->name);

  symbols.clear();
  findSymbols(word(3), symbols);
  EXPECT_TRUE(symbols.empty());
}

TEST(ExprTest, ReplaceSubExprs) {
  ref<Expr> x = symbol("x");
  ref<Expr> y = symbol("y");
  ref<Expr> e = AddExpr::create(x, y);

  ExprHashMap<ref<Expr> > replacements;
  replacements[x] = word(2);
  ref<Expr> partial = replaceSubExprs(e, replacements);
  EXPECT_TRUE(partial == AddExpr::create(word(2), y));

  replacements[y] = word(3);
  EXPECT_EQ(5u, constantValue(replaceSubExprs(e, replacements)));
}

TEST(ExprTest, AssignmentEvaluation) {
  ref<Expr> x = symbol("x");
  ref<Expr> y = symbol("y");
  ref<Expr> e = SubExpr::create(x, y);

  Assignment a;
  a.bindings["x"] = llvm::APInt(Expr::Int256, 10);
  a.bindings["y"] = llvm::APInt(Expr::Int256, 4);
  EXPECT_EQ(6u, constantValue(a.evaluate(e)));

  // Unbound symbols are zero unless free values are allowed.
  Assignment strict;
  strict.bindings["x"] = llvm::APInt(Expr::Int256, 10);
  EXPECT_EQ(10u, constantValue(strict.evaluate(e)));

  Assignment lenient(true);
  lenient.bindings["x"] = llvm::APInt(Expr::Int256, 10);
  EXPECT_FALSE(isa<ConstantExpr>(lenient.evaluate(e)));
}

} // namespace
