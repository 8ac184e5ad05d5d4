//===-- StateManager.h ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_STATEMANAGER_H
#define TACSYM_STATEMANAGER_H

#include "tacsym/Core/Interpreter.h"

#include <memory>
#include <vector>

namespace tacsym {
class ExecutionState;
class Executor;
class Searcher;

/// StateManager - Owns the states of one exploration and sorts them into
/// stashes. States leave the active stash when they halt, get pruned, hit
/// an error or satisfy the find predicate.
class StateManager {
public:
  enum Stash { Active = 0, Found, Deadended, Pruned, Errored, NumStashes };

  typedef std::vector<ExecutionState *> stash_ty;

private:
  Executor &executor;
  std::unique_ptr<Searcher> searcher;
  stash_ty stashes[NumStashes];

  Interpreter::FindPredicate find;
  unsigned long long steps;
  unsigned long long maxSteps;

  /// Decide where a successor of the last step goes. \p baseConstraints
  /// is the constraint count of the stepped state before the step.
  Stash classify(ExecutionState &state, size_t baseConstraints);

public:
  /// Takes ownership of \p initialState and of \p _searcher. A null
  /// searcher selects the one named by -search.
  StateManager(Executor &_executor, ExecutionState *initialState,
               Searcher *_searcher = nullptr);
  ~StateManager();

  StateManager(const StateManager &) = delete;
  StateManager &operator=(const StateManager &) = delete;

  const stash_ty &getStash(Stash stash) const { return stashes[stash]; }
  unsigned long long getSteps() const { return steps; }

  void setMaxSteps(unsigned long long n) { maxSteps = n; }
  void setFindPredicate(const Interpreter::FindPredicate &pred) {
    find = pred;
  }

  /// Execute one statement of the state selected by the searcher and
  /// sort its successors. Returns false if there was no active state.
  bool step();

  /// Step until no state is active, the step limit is reached, execution
  /// is halted, or (with a predicate) a state is found.
  void run(const Interpreter::FindPredicate &pred =
               Interpreter::FindPredicate());

  static const char *getStashName(Stash stash);
};

} // namespace tacsym

#endif /* TACSYM_STATEMANAGER_H */
