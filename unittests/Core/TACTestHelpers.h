//===-- TACTestHelpers.h ----------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_UNITTESTS_TACTESTHELPERS_H
#define TACSYM_UNITTESTS_TACTESTHELPERS_H

#include "gtest/gtest.h"

#include "Core/CoreStats.h"
#include "Core/ExecutionState.h"
#include "Core/Executor.h"

#include "tacsym/Expr/Expr.h"
#include "tacsym/Module/TACParser.h"
#include "tacsym/Module/TACProgram.h"
#include "tacsym/Support/Casting.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>

namespace tacsym {

/// Fixture owning a parsed program and an executor with the Z3 solver.
class TACExecutionTest : public ::testing::Test {
protected:
  Interpreter::InterpreterOptions opts;
  std::unique_ptr<TACProgram> program;
  std::unique_ptr<Executor> executor;

  void SetUp() override { stats::reset(); }

  /// Use with ASSERT_NO_FATAL_FAILURE.
  void load(const char *text) {
    std::string error;
    program = parseTAC(llvm::StringRef(text), error);
    ASSERT_TRUE(program) << error;
    executor.reset(new Executor(opts, nullptr));
    executor->setProgram(program.get());
  }

  void bind(const char *function, const char *procedure) {
    std::string error;
    ASSERT_TRUE(executor->bindSimProcedure(function, procedure, error))
        << error;
  }

  std::unique_ptr<ExecutionState> initialState() {
    return std::unique_ptr<ExecutionState>(executor->createInitialState());
  }

  /// Step a state that does not fork until it halts or terminates. Returns
  /// the successors of the last step.
  Executor::StateList stepToEnd(ExecutionState &state) {
    Executor::StateList results;
    for (unsigned i = 0; i != 100000 && !state.halt; ++i) {
      results = executor->executeStatement(state);
      if (results.size() != 1)
        break;
    }
    return results;
  }

  /// Step until the next statement to execute is \p id.
  void stepTo(ExecutionState &state, const char *id) {
    for (unsigned i = 0; i != 1000 && state.pc && state.pc->id != id; ++i) {
      Executor::StateList results = executor->executeStatement(state);
      ASSERT_EQ(1u, results.size()) << "at " << state.prevPC->id;
      ASSERT_FALSE(state.halt);
    }
    ASSERT_TRUE(state.pc != nullptr);
    ASSERT_EQ(id, state.pc->id);
  }

  static ref<Expr> word(uint64_t v) {
    return ConstantExpr::alloc(v, Expr::Int256);
  }

  static uint64_t valueOf(const ref<Expr> &e) {
    const ConstantExpr *CE = dyn_cast_or_null<ConstantExpr>(e.get());
    EXPECT_TRUE(CE != nullptr);
    return CE ? CE->getZExtValue() : ~0ULL;
  }
};

} // namespace tacsym

#endif /* TACSYM_UNITTESTS_TACTESTHELPERS_H */
