//===-- CallReturnTest.cpp ------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "TACTestHelpers.h"

#include "tacsym/Core/TerminationTypes.h"

#include <memory>

using namespace tacsym;

namespace {

class CallReturnTest : public TACExecutionTest {};

const char *const SimpleCall = R"(
function 0x0 main public
function 0x40 helper args p q

block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: a = CONST 3
s3: b = CONST 4
s4: r1, r2 = CALLPRIVATE f, a, b
block 0x10 0x0
s5: STOP

block 0x40 0x40
s6: s = ADD p, q
s7: m = MUL p, q
s8: RETURNPRIVATE ra, s, m
)";

TEST_F(CallReturnTest, BindsFormalsAndResults) {
  ASSERT_NO_FATAL_FAILURE(load(SimpleCall));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s6"));

  ASSERT_EQ(1u, state->stack.size());
  const CallFrame &frame = state->stack.back();
  EXPECT_EQ("s4", frame.callSite->id);
  EXPECT_EQ("s5", frame.returnTo->id);
  ASSERT_EQ(2u, frame.results.size());
  EXPECT_EQ("r1", frame.results[0]);
  EXPECT_EQ("r2", frame.results[1]);
  EXPECT_EQ(3u, valueOf(state->readRegister("p")));
  EXPECT_EQ(4u, valueOf(state->readRegister("q")));

  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s5"));
  EXPECT_TRUE(state->stack.empty());
  EXPECT_EQ(7u, valueOf(state->readRegister("r1")));
  EXPECT_EQ(12u, valueOf(state->readRegister("r2")));

  stepToEnd(*state);
  EXPECT_TRUE(state->halt);
  EXPECT_EQ(1u, stats::privateCalls);
  EXPECT_EQ(1u, stats::privateReturns);
}

TEST_F(CallReturnTest, NestedCallsStayBalanced) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 twice args x
function 0x80 inc args y

block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: a = CONST 1
s3: r = CALLPRIVATE f, a
block 0x10 0x0 fallthrough 0x20
s4: r2 = CALLPRIVATE f, r
block 0x20 0x0
s5: STOP

block 0x40 0x40 fallthrough 0x50
t1: g = CONST 0x80
t2: x1 = CALLPRIVATE g, x
block 0x50 0x40 fallthrough 0x60
t3: x2 = CALLPRIVATE g, x1
block 0x60 0x40
t4: RETURNPRIVATE ra, x2

block 0x80 0x80
u1: one = CONST 1
u2: y1 = ADD y, one
u3: RETURNPRIVATE ra, y1
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "u1"));
  EXPECT_EQ(2u, state->stack.size());
  EXPECT_EQ("t2", state->stack.back().callSite->id);

  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s5"));
  EXPECT_TRUE(state->stack.empty());
  EXPECT_EQ(3u, valueOf(state->readRegister("r")));
  EXPECT_EQ(5u, valueOf(state->readRegister("r2")));
  EXPECT_EQ(6u, stats::privateCalls);
  EXPECT_EQ(6u, stats::privateReturns);
}

TEST_F(CallReturnTest, ReturnWithoutFallthroughGoesToFakeExit) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 helper

block 0x0 0x0
s1: f = CONST 0x40
s2: CALLPRIVATE f

block 0x40 0x40
s3: RETURNPRIVATE ra
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s3"));
  EXPECT_EQ(program->getFakeExit()->getFirstStatement(),
            state->stack.back().returnTo);

  Executor::StateList results = stepToEnd(*state);
  ASSERT_EQ(1u, results.size());
  EXPECT_TRUE(state->halt);
  EXPECT_FALSE(state->reverted);
  EXPECT_EQ(program->getFakeExit(), state->pc->block);
  EXPECT_TRUE(state->stack.empty());
}

TEST_F(CallReturnTest, ReturnWithEmptyStack) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: v = CONST 1
s2: RETURNPRIVATE ra, v
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  Executor::StateList results = stepToEnd(*state);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::StackUnderflow, state->terminationType);
  EXPECT_EQ("return with an empty call stack", state->terminationMessage);
  EXPECT_EQ(0u, stats::privateReturns);
}

TEST_F(CallReturnTest, MissingActualsStayUnbound) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 ignoresThird args a b c
function 0x80 readsThird args d e f

block 0x0 0x0 fallthrough 0x10
s1: g = CONST 0x40
s2: x = CONST 2
s3: y = CONST 3
s4: r = CALLPRIVATE g, x, y
block 0x10 0x0 fallthrough 0x20
s5: h = CONST 0x80
s6: r2 = CALLPRIVATE h, x, y
block 0x20 0x0
s7: STOP

block 0x40 0x40
t1: sum = ADD a, b
t2: RETURNPRIVATE ra, sum

block 0x80 0x80
u1: sum2 = ADD d, f
u2: RETURNPRIVATE ra, sum2
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s5"));
  EXPECT_EQ(5u, valueOf(state->readRegister("r")));
  EXPECT_TRUE(state->readRegister("c").isNull());

  Executor::StateList results = stepToEnd(*state);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::UninitializedRegister,
            state->terminationType);
  EXPECT_EQ("uninitialized variable f", state->terminationMessage);
  EXPECT_EQ("u1", state->prevPC->id);
}

TEST_F(CallReturnTest, UnmatchedActualsAreNotRead) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 helper args p

block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: a = CONST 9
s3: r1 = CALLPRIVATE f, a, neverbound
block 0x10 0x0
s4: STOP

block 0x40 0x40
s5: RETURNPRIVATE ra, p
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s5"));
  EXPECT_EQ(9u, valueOf(state->readRegister("p")));
  EXPECT_TRUE(state->readRegister("neverbound").isNull());

  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s4"));
  EXPECT_EQ(9u, valueOf(state->readRegister("r1")));

  Executor::StateList results = stepToEnd(*state);
  ASSERT_EQ(1u, results.size());
  EXPECT_TRUE(state->halt);
  EXPECT_EQ(StateTerminationType::Running, state->terminationType);
}

TEST_F(CallReturnTest, UnboundCallTarget) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public

block 0x0 0x0
s1: a = CONST 1
s2: CALLPRIVATE nowhere, a
s3: STOP
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  Executor::StateList results = stepToEnd(*state);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::UninitializedRegister,
            state->terminationType);
  EXPECT_EQ("uninitialized variable nowhere", state->terminationMessage);
}

TEST_F(CallReturnTest, ExtraValuesAreDropped) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 helper args p

block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: a = CONST 3
s3: b = CONST 4
s4: r1, r2 = CALLPRIVATE f, a, b
block 0x10 0x0
s5: STOP

block 0x40 0x40
s6: RETURNPRIVATE ra, p
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s6"));
  EXPECT_EQ(3u, valueOf(state->readRegister("p")));

  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s5"));
  EXPECT_EQ(3u, valueOf(state->readRegister("r1")));
  EXPECT_TRUE(state->readRegister("r2").isNull());
}

TEST_F(CallReturnTest, ForkedStatesKeepTheirStacks) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 pick args p

block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: v = CALLVALUE
s3: r = CALLPRIVATE f, v
block 0x10 0x0
s4: STOP

block 0x40 0x40 fallthrough 0x50
t1: t = CONST 0x60
t2: JUMPI t, p
block 0x50 0x40
t3: zero = CONST 0
t4: RETURNPRIVATE ra, zero
block 0x60 0x40
t5: one = CONST 1
t6: RETURNPRIVATE ra, one
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "t2"));
  Executor::StateList results = executor->executeStatement(*state);
  ASSERT_EQ(2u, results.size());
  std::unique_ptr<ExecutionState> fork(results[1]);
  EXPECT_EQ(1u, fork->stack.size());

  ASSERT_NO_FATAL_FAILURE(stepTo(*state, "s4"));
  ASSERT_NO_FATAL_FAILURE(stepTo(*fork, "s4"));
  EXPECT_TRUE(state->stack.empty());
  EXPECT_TRUE(fork->stack.empty());
  EXPECT_EQ(1u, valueOf(state->readRegister("r")));
  EXPECT_EQ(0u, valueOf(fork->readRegister("r")));
}

TEST_F(CallReturnTest, SymbolicCallTarget) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: f = CALLER
s2: CALLPRIVATE f
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  Executor::StateList results = stepToEnd(*state);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::InvalidJump, state->terminationType);
  EXPECT_EQ("symbolic call target", state->terminationMessage);
  EXPECT_TRUE(state->stack.empty());
}

TEST_F(CallReturnTest, UnboundedRecursionStopsAtMaxDepth) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 loop

block 0x0 0x0
s1: f = CONST 0x40
s2: CALLPRIVATE f

block 0x40 0x40
t1: g = CONST 0x40
t2: CALLPRIVATE g
)"));

  std::unique_ptr<ExecutionState> state = initialState();
  Executor::StateList results = stepToEnd(*state);
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(StateTerminationType::MaxDepth, state->terminationType);
  EXPECT_EQ(8192u, state->stack.size());
  EXPECT_EQ(8192u, stats::privateCalls);
  EXPECT_EQ(1u, stats::prunedPaths);
}

} // namespace
