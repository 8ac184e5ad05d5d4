//===-- SafeMathTest.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "TACTestHelpers.h"

#include "Core/SimProcedureHandler.h"
#include "Core/TimingSolver.h"

#include "tacsym/Core/TerminationTypes.h"
#include "tacsym/Expr/Constraints.h"
#include "tacsym/Module/TACStatement.h"

#include "llvm/ADT/APInt.h"

#include <memory>
#include <string>

using namespace tacsym;

namespace {

const char *const SafeMathProgram = R"(
function 0x0 main public
function 0x40 safeAdd args a b
function 0x80 safeSub args a b
function 0xc0 safeMul args a b
function 0x100 safeDiv args a b
function 0x140 addThree args a b c

block 0x0 0x0 fallthrough 0x10
s1: r = CALLPRIVATE f, x, y
block 0x10 0x0
s2: STOP

block 0x40 0x40
t1: INVALID
block 0x80 0x80
t2: INVALID
block 0xc0 0xc0
t3: INVALID
block 0x100 0x100
t4: INVALID
block 0x140 0x140
t5: INVALID
)";

class SafeMathTest : public TACExecutionTest {
protected:
  std::unique_ptr<ExecutionState> state;
  ref<Expr> x, y;

  void SetUp() override {
    TACExecutionTest::SetUp();
    ASSERT_NO_FATAL_FAILURE(load(SafeMathProgram));
    ASSERT_NO_FATAL_FAILURE(bind("0x40", "SAFEADD"));
    ASSERT_NO_FATAL_FAILURE(bind("safeSub", "SIMPROCEDURE_SAFESUB"));
    ASSERT_NO_FATAL_FAILURE(bind("0xc0", "safe_mul"));
    ASSERT_NO_FATAL_FAILURE(bind("0x100", "SafeMath.div"));
    ASSERT_NO_FATAL_FAILURE(bind("addThree", "safeadd"));
    state = initialState();
    x = SymbolExpr::create("x", Expr::Int256);
    y = SymbolExpr::create("y", Expr::Int256);
  }

  /// Call the function at \p target with (a, b) and run until control is
  /// back in main or the path ends.
  Executor::StateList call(uint64_t target, const ref<Expr> &a,
                           const ref<Expr> &b) {
    state->pc = program->getStatement("s1");
    state->writeRegister("f", word(target));
    state->writeRegister("x", a);
    state->writeRegister("y", b);
    Executor::StateList results;
    for (unsigned i = 0; i != 10 && state->pc->id != "s2"; ++i) {
      results = executor->executeStatement(*state);
      if (results.size() != 1)
        break;
    }
    return results;
  }

  ref<Expr> result() const { return state->readRegister("r"); }

  size_t safetyConstraints() const {
    return state->constraints.count(ConstraintProvenance::Safety);
  }

  static ref<Expr> maxWord() {
    return ConstantExpr::alloc(llvm::APInt::getMaxValue(Expr::Int256));
  }
};

TEST_F(SafeMathTest, EntryIsReplaced) {
  const TACStatement *entry = program->getBlock("0x40")->getFirstStatement();
  EXPECT_EQ(TACStatement::SIMPROCEDURE, entry->opcode);
  EXPECT_EQ("0x40_SIMPROCEDURE_SAFEADD", entry->id);

  const SimProcedureHandler::HandlerInfo *hi =
      executor->getSimProcedureHandler().getBinding(
          program->getFunction("0xc0"));
  ASSERT_TRUE(hi != nullptr);
  EXPECT_STREQ("SIMPROCEDURE_SAFEMUL", hi->name);
  EXPECT_TRUE(executor->getSimProcedureHandler().getBinding(
                  program->getFunction("0x0")) == nullptr);
}

TEST_F(SafeMathTest, AddConcrete) {
  Executor::StateList results = call(0x40, word(5), word(7));
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ("s2", state->pc->id);
  EXPECT_EQ(12u, valueOf(result()));
  EXPECT_TRUE(state->constraints.empty());
  EXPECT_TRUE(state->stack.empty());
  EXPECT_EQ(1u, stats::simProcedureCalls);
  EXPECT_EQ(1u, stats::privateReturns);
}

TEST_F(SafeMathTest, AddOverflowPrunes) {
  Executor::StateList results = call(0x40, maxWord(), word(1));
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::Pruned, state->terminationType);
  EXPECT_EQ(1u, stats::prunedPaths);
  EXPECT_EQ(0u, stats::erroredPaths);
}

TEST_F(SafeMathTest, AddOneSymbolic) {
  ASSERT_EQ(1u, call(0x40, x, word(3)).size());
  ASSERT_EQ(1u, safetyConstraints());
  EXPECT_TRUE(state->constraints.begin()->expr ==
              UltExpr::create(x, SubExpr::create(word(0), word(3))));
  EXPECT_TRUE(result() == AddExpr::create(x, word(3)));
  EXPECT_EQ(1u, stats::safetyConstraints);
}

TEST_F(SafeMathTest, AddZeroIsIdentity) {
  ASSERT_EQ(1u, call(0x40, word(0), x).size());
  EXPECT_TRUE(state->constraints.empty());
  EXPECT_TRUE(result() == x);
}

TEST_F(SafeMathTest, AddBothSymbolic) {
  ASSERT_EQ(1u, call(0x40, x, y).size());
  ASSERT_EQ(1u, safetyConstraints());
  EXPECT_TRUE(result() == AddExpr::create(x, y));

  // With x at its maximum, y can only be zero.
  ConstraintSet cs = state->constraints;
  ConstraintManager(cs).addConstraint(EqExpr::create(x, maxWord()));
  bool mayBeOne;
  ASSERT_TRUE(executor->getSolver()->mayBeTrue(
      cs, EqExpr::create(y, word(1)), mayBeOne, state->queryMetaData));
  EXPECT_FALSE(mayBeOne);
  bool mayBeZero;
  ASSERT_TRUE(executor->getSolver()->mayBeTrue(
      cs, EqExpr::create(y, word(0)), mayBeZero, state->queryMetaData));
  EXPECT_TRUE(mayBeZero);
}

TEST_F(SafeMathTest, SubConcrete) {
  ASSERT_EQ(1u, call(0x80, word(7), word(5)).size());
  EXPECT_EQ(2u, valueOf(result()));
  EXPECT_TRUE(state->constraints.empty());
}

TEST_F(SafeMathTest, SubUnderflowPrunes) {
  EXPECT_TRUE(call(0x80, word(5), word(7)).empty());
  EXPECT_EQ(StateTerminationType::Pruned, state->terminationType);
}

TEST_F(SafeMathTest, SubSymbolic) {
  ASSERT_EQ(1u, call(0x80, x, y).size());
  ASSERT_EQ(1u, state->constraints.size());
  EXPECT_EQ(ConstraintProvenance::Safety,
            state->constraints.begin()->provenance);
  EXPECT_TRUE(state->constraints.begin()->expr == UgeExpr::create(x, y));
  EXPECT_TRUE(result() == SubExpr::create(x, y));
}

TEST_F(SafeMathTest, MulByZero) {
  ASSERT_EQ(1u, call(0xc0, word(0), y).size());
  EXPECT_TRUE(state->constraints.empty());
  EXPECT_EQ(0u, valueOf(result()));
}

TEST_F(SafeMathTest, MulByOne) {
  ASSERT_EQ(1u, call(0xc0, x, word(1)).size());
  EXPECT_TRUE(state->constraints.empty());
  EXPECT_TRUE(result() == x);
}

TEST_F(SafeMathTest, MulConcrete) {
  ASSERT_EQ(1u, call(0xc0, word(6), word(7)).size());
  EXPECT_EQ(42u, valueOf(result()));

  llvm::APInt half = llvm::APInt::getOneBitSet(Expr::Int256, 255);
  EXPECT_TRUE(call(0xc0, ConstantExpr::alloc(half), word(2)).empty());
  EXPECT_EQ(StateTerminationType::Pruned, state->terminationType);
}

TEST_F(SafeMathTest, MulOneSymbolic) {
  ASSERT_EQ(1u, call(0xc0, word(3), x).size());
  ASSERT_EQ(1u, safetyConstraints());
  EXPECT_TRUE(result() == MulExpr::create(word(3), x));

  // The largest admissible x is floor((2^256 - 1) / 3).
  llvm::APInt limit =
      llvm::APInt::getMaxValue(Expr::Int256).udiv(llvm::APInt(256, 3));
  ConstraintSet cs = state->constraints;
  bool ok;
  ASSERT_TRUE(executor->getSolver()->mayBeTrue(
      cs, EqExpr::create(x, ConstantExpr::alloc(limit)), ok,
      state->queryMetaData));
  EXPECT_TRUE(ok);
  ASSERT_TRUE(executor->getSolver()->mayBeTrue(
      cs, EqExpr::create(x, ConstantExpr::alloc(limit + 1)), ok,
      state->queryMetaData));
  EXPECT_FALSE(ok);
}

TEST_F(SafeMathTest, MulBothSymbolic) {
  ASSERT_EQ(1u, call(0xc0, x, y).size());
  ASSERT_EQ(1u, safetyConstraints());
  EXPECT_TRUE(result() == MulExpr::create(x, y));

  ConstraintSet cs = state->constraints;
  ConstraintManager(cs).addConstraint(
      EqExpr::create(x, ConstantExpr::alloc(
                            llvm::APInt::getOneBitSet(Expr::Int256, 128))));
  bool ok;
  ASSERT_TRUE(executor->getSolver()->mayBeTrue(
      cs, UgeExpr::create(y, ConstantExpr::alloc(llvm::APInt::getOneBitSet(
                                 Expr::Int256, 128))),
      ok, state->queryMetaData));
  EXPECT_FALSE(ok);
}

TEST_F(SafeMathTest, DivSymbolicDivisor) {
  ASSERT_EQ(1u, call(0x100, x, y).size());
  ASSERT_EQ(1u, state->constraints.size());
  EXPECT_EQ(1u, safetyConstraints());
  EXPECT_TRUE(state->constraints.begin()->expr ==
              NeExpr::create(y, word(0)));
  EXPECT_TRUE(result() == UDivExpr::create(x, y));
}

TEST_F(SafeMathTest, DivConcreteDivisor) {
  ASSERT_EQ(1u, call(0x100, x, word(2)).size());
  EXPECT_TRUE(state->constraints.empty());
  EXPECT_TRUE(result() == UDivExpr::create(x, word(2)));

  ASSERT_EQ(1u, call(0x100, word(7), word(2)).size());
  EXPECT_EQ(3u, valueOf(result()));
}

TEST_F(SafeMathTest, DivByZeroPrunes) {
  EXPECT_TRUE(call(0x100, x, word(0)).empty());
  EXPECT_EQ(StateTerminationType::Pruned, state->terminationType);
  EXPECT_TRUE(state->constraints.empty());
}

TEST_F(SafeMathTest, WrongArity) {
  EXPECT_TRUE(call(0x140, word(1), word(2)).empty());
  EXPECT_EQ(StateTerminationType::UninitializedRegister,
            state->terminationType);
  EXPECT_EQ("uninitialized variable c", state->terminationMessage);

  state = initialState();
  state->writeRegister("c", word(3));
  EXPECT_TRUE(call(0x140, word(1), word(2)).empty());
  EXPECT_EQ(StateTerminationType::Execution, state->terminationType);
  EXPECT_EQ("invalid number of arguments to SIMPROCEDURE_SAFEADD",
            state->terminationMessage);
}

TEST_F(SafeMathTest, BindingErrors) {
  std::string error;
  EXPECT_FALSE(executor->bindSimProcedure("0x999", "SAFEADD", error));
  EXPECT_EQ("unknown function '0x999'", error);
  EXPECT_FALSE(executor->bindSimProcedure("0x0", "SAFEPOW", error));
  EXPECT_EQ("unknown SimProcedure 'SAFEPOW'", error);
  EXPECT_FALSE(executor->bindSimProcedure("0x40", "SAFESUB", error));
  EXPECT_EQ("function '0x40' is already bound to SIMPROCEDURE_SAFEADD",
            error);
}

class SafeMathIdCollisionTest : public TACExecutionTest {};

TEST_F(SafeMathIdCollisionTest, BindingFailsAndLeavesFunctionUnbound) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 safeAdd(uint256,uint256) args a b
block 0x0 0x0
0x40_SIMPROCEDURE_SAFEADD: STOP
block 0x40 0x40
s1: RETURNPRIVATE ra, a
)"));

  std::string error;
  EXPECT_FALSE(executor->bindSimProcedure("0x40", "SAFEADD", error));
  EXPECT_EQ("duplicate statement id '0x40_SIMPROCEDURE_SAFEADD'", error);
  EXPECT_EQ(0u, executor->bindSimProceduresByName());

  const TACStatement *user =
      program->getStatement("0x40_SIMPROCEDURE_SAFEADD");
  ASSERT_TRUE(user != nullptr);
  EXPECT_EQ(TACStatement::STOP, user->opcode);
  EXPECT_EQ(program->getStatement("s1"),
            program->getBlock("0x40")->getFirstStatement());
}

class SafeMathByNameTest : public TACExecutionTest {};

TEST_F(SafeMathByNameTest, BindsAliases) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 safeAdd(uint256,uint256) args a b
function 0x80 SafeMath.sub args a b
function 0xc0 transfer(address,uint256) args a b
block 0x0 0x0
s1: STOP
block 0x40 0x40
t1: INVALID
block 0x80 0x80
t2: INVALID
block 0xc0 0xc0
t3: INVALID
)"));

  EXPECT_EQ(2u, executor->bindSimProceduresByName());
  SimProcedureHandler &handler = executor->getSimProcedureHandler();
  ASSERT_TRUE(handler.getBinding(program->getFunction("0x40")) != nullptr);
  EXPECT_STREQ("SIMPROCEDURE_SAFEADD",
               handler.getBinding(program->getFunction("0x40"))->name);
  ASSERT_TRUE(handler.getBinding(program->getFunction("0x80")) != nullptr);
  EXPECT_STREQ("SIMPROCEDURE_SAFESUB",
               handler.getBinding(program->getFunction("0x80"))->name);
  EXPECT_TRUE(handler.getBinding(program->getFunction("0xc0")) == nullptr);

  // Already bound functions are skipped.
  EXPECT_EQ(0u, executor->bindSimProceduresByName());
}

} // namespace
