//===-- StateManagerTest.cpp ----------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "TACTestHelpers.h"

#include "Core/Searcher.h"
#include "Core/StateManager.h"

#include "tacsym/Core/Interpreter.h"
#include "tacsym/Core/TerminationTypes.h"

#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>
#include <vector>

using namespace tacsym;

namespace {

const char *const TwoPaths = R"(
function 0x0 main public
block 0x0 0x0 fallthrough 0x10
s1: t = CONST 0x20
s2: x = CALLVALUE
s3: JUMPI t, x
block 0x10 0x0
s4: STOP
block 0x20 0x0
s5: REVERT x, x
)";

class StateManagerTest : public TACExecutionTest {
protected:
  std::unique_ptr<StateManager> manager;

  void createManager(Searcher *searcher = nullptr) {
    manager.reset(new StateManager(*executor, executor->createInitialState(),
                                   searcher ? searcher : new DFSSearcher()));
  }

  size_t stashSize(StateManager::Stash stash) const {
    return manager->getStash(stash).size();
  }
};

TEST_F(StateManagerTest, SinglePath) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: a = CONST 1
s2: STOP
)"));
  createManager();
  manager->run();

  EXPECT_EQ(2u, manager->getSteps());
  EXPECT_EQ(0u, stashSize(StateManager::Active));
  ASSERT_EQ(1u, stashSize(StateManager::Deadended));
  const ExecutionState *es = manager->getStash(StateManager::Deadended)[0];
  EXPECT_EQ(StateTerminationType::Halted, es->terminationType);
  EXPECT_EQ(1u, stats::completedPaths);
  EXPECT_EQ(0u, stats::revertedPaths);
}

TEST_F(StateManagerTest, BranchesEndInDeadended) {
  ASSERT_NO_FATAL_FAILURE(load(TwoPaths));
  createManager();
  manager->run();

  EXPECT_EQ(0u, stashSize(StateManager::Active));
  EXPECT_EQ(2u, stashSize(StateManager::Deadended));
  EXPECT_EQ(0u, stashSize(StateManager::Pruned));
  EXPECT_EQ(0u, stashSize(StateManager::Errored));
  EXPECT_EQ(1u, stats::completedPaths);
  EXPECT_EQ(1u, stats::revertedPaths);
  EXPECT_EQ(1u, stats::forks);

  unsigned reverted = 0;
  for (const ExecutionState *es : manager->getStash(StateManager::Deadended)) {
    EXPECT_TRUE(es->halt);
    EXPECT_EQ(1u, es->constraints.size());
    reverted += es->reverted;
  }
  EXPECT_EQ(1u, reverted);
}

TEST_F(StateManagerTest, InfeasibleBranchIsPruned) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0 fallthrough 0x10
s1: t = CONST 0x20
s2: x = CALLVALUE
s3: JUMPI t, x
block 0x10 0x0
s4: STOP
block 0x20 0x0 fallthrough 0x28
s5: t2 = CONST 0x30
s6: z = ISZERO x
s7: JUMPI t2, z
block 0x28 0x0
s8: STOP
block 0x30 0x0
s9: INVALID
)"));
  createManager();
  manager->run();

  EXPECT_EQ(2u, stashSize(StateManager::Deadended));
  ASSERT_EQ(1u, stashSize(StateManager::Pruned));
  const ExecutionState *es = manager->getStash(StateManager::Pruned)[0];
  EXPECT_EQ(StateTerminationType::Pruned, es->terminationType);
  EXPECT_EQ("infeasible path", es->terminationMessage);
  EXPECT_EQ("s9", es->pc->id);
  EXPECT_EQ(0u, stats::revertedPaths);
  EXPECT_EQ(1u, stats::prunedPaths);
}

TEST_F(StateManagerTest, ErrorsGoToErrored) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: a = ADD b, c
s2: STOP
)"));
  createManager();
  manager->run();

  EXPECT_EQ(0u, stashSize(StateManager::Deadended));
  ASSERT_EQ(1u, stashSize(StateManager::Errored));
  EXPECT_EQ(StateTerminationType::UninitializedRegister,
            manager->getStash(StateManager::Errored)[0]->terminationType);
  EXPECT_EQ(1u, stats::erroredPaths);
}

TEST_F(StateManagerTest, SafeMathViolationIsPruned) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 safeSub args a b
block 0x0 0x0 fallthrough 0x10
s1: f = CONST 0x40
s2: x = CONST 1
s3: y = CONST 2
s4: r = CALLPRIVATE f, x, y
block 0x10 0x0
s5: STOP
block 0x40 0x40
t1: INVALID
)"));
  ASSERT_NO_FATAL_FAILURE(bind("safeSub", "SAFESUB"));
  createManager();
  manager->run();

  EXPECT_EQ(0u, stashSize(StateManager::Deadended));
  ASSERT_EQ(1u, stashSize(StateManager::Pruned));
  EXPECT_EQ(StateTerminationType::Pruned,
            manager->getStash(StateManager::Pruned)[0]->terminationType);
  EXPECT_EQ(0u, stats::revertedPaths);
}

TEST_F(StateManagerTest, SafeMathConstraintCanMakePathInfeasible) {
  // safeSub(x, y) under x < y leaves no feasible continuation.
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
function 0x40 safeSub args a b
block 0x0 0x0 fallthrough 0x10
s1: t = CONST 0x20
s2: x = CALLDATALOAD t
s3: y = CALLVALUE
s4: c = LT x, y
s5: JUMPI t, c
block 0x10 0x0
s6: STOP
block 0x20 0x0 fallthrough 0x30
s7: f = CONST 0x40
s8: r = CALLPRIVATE f, x, y
block 0x30 0x0
s9: STOP
block 0x40 0x40
t1: INVALID
)"));
  ASSERT_NO_FATAL_FAILURE(bind("0x40", "SAFESUB"));
  createManager();
  manager->run();

  EXPECT_EQ(1u, stashSize(StateManager::Deadended));
  ASSERT_EQ(1u, stashSize(StateManager::Pruned));
  const ExecutionState *es = manager->getStash(StateManager::Pruned)[0];
  EXPECT_EQ("infeasible path", es->terminationMessage);
  EXPECT_EQ(1u, es->constraints.count(ConstraintProvenance::Safety));
}

TEST_F(StateManagerTest, FindPredicateStops) {
  ASSERT_NO_FATAL_FAILURE(load(TwoPaths));
  createManager();
  manager->run([](const ExecutionState &es) {
    return es.pc && es.pc->id == "s4";
  });

  ASSERT_EQ(1u, stashSize(StateManager::Found));
  EXPECT_EQ("s4", manager->getStash(StateManager::Found)[0]->pc->id);
  EXPECT_FALSE(manager->getStash(StateManager::Found)[0]->halt);
}

TEST_F(StateManagerTest, MaxSteps) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: t = CONST 0x0
s2: JUMP t
)"));
  createManager();
  manager->setMaxSteps(5);
  manager->run();

  EXPECT_EQ(5u, manager->getSteps());
  EXPECT_EQ(1u, stashSize(StateManager::Active));
}

TEST_F(StateManagerTest, StepWithoutActiveStates) {
  ASSERT_NO_FATAL_FAILURE(load(R"(
function 0x0 main public
block 0x0 0x0
s1: STOP
)"));
  createManager();
  EXPECT_TRUE(manager->step());
  EXPECT_FALSE(manager->step());
  EXPECT_EQ(1u, manager->getSteps());
}

TEST_F(StateManagerTest, StashNames) {
  EXPECT_STREQ("active", StateManager::getStashName(StateManager::Active));
  EXPECT_STREQ("pruned", StateManager::getStashName(StateManager::Pruned));
  EXPECT_STREQ("errored", StateManager::getStashName(StateManager::Errored));
}

TEST(SearcherTest, DFSAndBFSOrder) {
  ExecutionState a(nullptr, nullptr), b(nullptr, nullptr),
      c(nullptr, nullptr);

  DFSSearcher dfs;
  dfs.update(nullptr, {&a}, {});
  dfs.update(&a, {&b, &c}, {});
  EXPECT_EQ(&c, &dfs.selectState());
  dfs.update(&c, {}, {&c});
  EXPECT_EQ(&b, &dfs.selectState());
  dfs.update(&b, {}, {&b, &a});
  EXPECT_TRUE(dfs.empty());

  BFSSearcher bfs;
  bfs.update(nullptr, {&a}, {});
  bfs.update(&a, {&b}, {});
  EXPECT_EQ(&a, &bfs.selectState());
  // A state that forks again goes behind the other states of its depth.
  bfs.update(&a, {&c}, {});
  EXPECT_EQ(&b, &bfs.selectState());
  bfs.update(&b, {}, {&b});
  EXPECT_EQ(&a, &bfs.selectState());
  bfs.update(&a, {}, {&a});
  EXPECT_EQ(&c, &bfs.selectState());
}

/***/

class CountingHandler : public InterpreterHandler {
public:
  unsigned paths = 0;
  unsigned testCases = 0;
  unsigned errors = 0;
  std::vector<std::string> suffixes;

  llvm::raw_ostream &getInfoStream() const override { return llvm::nulls(); }
  void incPathsExplored() override { ++paths; }
  void processTestCase(const ExecutionState &state, const char *err,
                       const char *suffix) override {
    ++testCases;
    if (state.terminationType > StateTerminationType::EARLY)
      ++errors;
    suffixes.push_back(suffix ? suffix : "");
  }
};

TEST(InterpreterTest, RunReportsEveryPath) {
  std::string error;
  std::unique_ptr<TACProgram> program =
      parseTAC(llvm::StringRef(TwoPaths), error);
  ASSERT_TRUE(program) << error;

  CountingHandler handler;
  std::unique_ptr<Interpreter> interpreter(
      Interpreter::create(Interpreter::InterpreterOptions(), &handler));
  interpreter->setProgram(program.get());
  interpreter->run();

  EXPECT_EQ(2u, handler.paths);
  EXPECT_EQ(2u, handler.testCases);
  EXPECT_EQ(0u, handler.errors);
}

TEST(InterpreterTest, ErrorsAreReportedOnce) {
  std::string error;
  std::unique_ptr<TACProgram> program = parseTAC(llvm::StringRef(R"(
function 0x0 main public
block 0x0 0x0
s1: JUMP nowhere
)"),
                                                 error);
  ASSERT_TRUE(program) << error;

  CountingHandler handler;
  std::unique_ptr<Interpreter> interpreter(
      Interpreter::create(Interpreter::InterpreterOptions(), &handler));
  interpreter->setProgram(program.get());
  interpreter->run();

  EXPECT_EQ(1u, handler.paths);
  EXPECT_EQ(1u, handler.testCases);
  EXPECT_EQ(1u, handler.errors);
  ASSERT_EQ(1u, handler.suffixes.size());
  EXPECT_EQ("uninit.err", handler.suffixes[0]);
}

} // namespace
