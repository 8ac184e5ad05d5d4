//===-- Z3SolverTest.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "gtest/gtest.h"

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/Expr.h"
#include "tacsym/Solver/Solver.h"
#include "tacsym/Solver/SolverImpl.h"

#include "llvm/ADT/APInt.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace tacsym;

namespace {

class Z3SolverTest : public ::testing::Test {
protected:
  std::unique_ptr<Solver> solver;
  ref<Expr> x, y;

  Z3SolverTest()
      : solver(createCoreSolver()),
        x(SymbolExpr::create("x", Expr::Int256)),
        y(SymbolExpr::create("y", Expr::Int256)) {}

  static ref<Expr> word(uint64_t v) {
    return ConstantExpr::alloc(v, Expr::Int256);
  }
};

TEST_F(Z3SolverTest, Validity) {
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(UltExpr::create(x, word(10)));

  Solver::Validity v;
  ASSERT_TRUE(solver->evaluate(Query(cs, UltExpr::create(x, word(11))), v));
  EXPECT_EQ(Solver::True, v);
  ASSERT_TRUE(solver->evaluate(Query(cs, UgtExpr::create(x, word(20))), v));
  EXPECT_EQ(Solver::False, v);
  ASSERT_TRUE(solver->evaluate(Query(cs, EqExpr::create(x, word(5))), v));
  EXPECT_EQ(Solver::Unknown, v);
}

TEST(SolverImplTest, StatusNames) {
  EXPECT_STREQ("sat", SolverImpl::getOperationStatusString(
                          SolverImpl::SOLVER_RUN_STATUS_SUCCESS_SOLVABLE));
  EXPECT_STREQ("unsat", SolverImpl::getOperationStatusString(
                            SolverImpl::SOLVER_RUN_STATUS_SUCCESS_UNSOLVABLE));
  EXPECT_STREQ("timeout", SolverImpl::getOperationStatusString(
                              SolverImpl::SOLVER_RUN_STATUS_TIMEOUT));
  EXPECT_STREQ("interrupted", SolverImpl::getOperationStatusString(
                                  SolverImpl::SOLVER_RUN_STATUS_INTERRUPTED));
  EXPECT_STREQ("failure", SolverImpl::getOperationStatusString(
                              SolverImpl::SOLVER_RUN_STATUS_FAILURE));
}

TEST_F(Z3SolverTest, LastStatusFollowsQuery) {
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(UltExpr::create(x, word(10)));

  bool result;
  ASSERT_TRUE(solver->mayBeTrue(Query(cs, EqExpr::create(x, word(3))), result));
  EXPECT_TRUE(result);
  EXPECT_STREQ("sat", SolverImpl::getOperationStatusString(
                          solver->impl->getOperationStatusCode()));

  ASSERT_TRUE(
      solver->mustBeTrue(Query(cs, UltExpr::create(x, word(11))), result));
  EXPECT_TRUE(result);
  EXPECT_STREQ("unsat", SolverImpl::getOperationStatusString(
                            solver->impl->getOperationStatusCode()));
}

TEST_F(Z3SolverTest, MayAndMust) {
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(NeExpr::create(x, word(0)));

  bool result;
  ASSERT_TRUE(solver->mustBeFalse(Query(cs, Expr::createIsZero(x)), result));
  EXPECT_TRUE(result);
  ASSERT_TRUE(solver->mayBeTrue(Query(cs, EqExpr::create(x, word(1))),
                                result));
  EXPECT_TRUE(result);
  ASSERT_TRUE(solver->mayBeFalse(Query(cs, EqExpr::create(x, word(1))),
                                 result));
  EXPECT_TRUE(result);
}

TEST_F(Z3SolverTest, WrappingArithmetic) {
  // x + 1 == 0 has exactly one solution in 256 bits.
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(
      EqExpr::create(AddExpr::create(x, word(1)), word(0)));

  ref<ConstantExpr> value;
  ASSERT_TRUE(solver->getValue(Query(cs, x), value));
  EXPECT_TRUE(value->isAllOnes());
}

TEST_F(Z3SolverTest, DivisionSemantics) {
  // SMT-LIB bvudiv by zero yields all ones.
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(EqExpr::create(y, word(0)));

  bool result;
  ASSERT_TRUE(solver->mustBeTrue(
      Query(cs, EqExpr::create(
                    UDivExpr::create(x, y),
                    ConstantExpr::alloc(
                        llvm::APInt::getMaxValue(Expr::Int256)))),
      result));
  EXPECT_TRUE(result);
}

TEST_F(Z3SolverTest, InitialValues) {
  ConstraintSet cs;
  ConstraintManager cm(cs);
  cm.addConstraint(UgeExpr::create(x, y));
  cm.addConstraint(EqExpr::create(y, word(7)));
  cm.addConstraint(UltExpr::create(x, word(8)));

  std::vector<const SymbolExpr *> objects;
  objects.push_back(cast<SymbolExpr>(x));
  objects.push_back(cast<SymbolExpr>(y));

  std::vector<llvm::APInt> values;
  bool hasSolution;
  ASSERT_TRUE(solver->getInitialValues(Query(cs, Expr::createFalse()),
                                       objects, values, hasSolution));
  ASSERT_TRUE(hasSolution);
  ASSERT_EQ(2u, values.size());
  EXPECT_EQ(7u, values[0].getZExtValue());
  EXPECT_EQ(7u, values[1].getZExtValue());
}

TEST_F(Z3SolverTest, UnsatisfiableConstraints) {
  ConstraintSet cs;
  ConstraintManager cm(cs);
  cm.addConstraint(UltExpr::create(x, word(3)));
  cm.addConstraint(UgtExpr::create(x, word(5)));

  std::vector<const SymbolExpr *> objects;
  std::vector<llvm::APInt> values;
  bool hasSolution = true;
  ASSERT_TRUE(solver->getInitialValues(Query(cs, Expr::createFalse()),
                                       objects, values, hasSolution));
  EXPECT_FALSE(hasSolution);
}

TEST_F(Z3SolverTest, ConstraintLog) {
  ConstraintSet cs;
  ConstraintManager(cs).addConstraint(UltExpr::create(x, word(10)));

  char *log = solver->getConstraintLog(Query(cs, Expr::createFalse()));
  ASSERT_TRUE(log != nullptr);
  std::string text(log);
  free(log);

  EXPECT_NE(std::string::npos, text.find("declare-fun"));
  EXPECT_NE(std::string::npos, text.find("bvult"));
}

} // namespace
