//===-- Searcher.h ----------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_SEARCHER_H
#define TACSYM_SEARCHER_H

#include "llvm/Support/raw_ostream.h"

#include <deque>
#include <vector>

namespace tacsym {
class ExecutionState;

/// A Searcher implements an exploration strategy for the StateManager by
/// selecting which active state to step next.
class Searcher {
public:
  virtual ~Searcher() = default;

  /// Selects a state for further exploration.
  /// \return The selected state.
  virtual ExecutionState &selectState() = 0;

  /// Notifies searcher about new or deleted states.
  /// \param current The currently selected state for exploration.
  /// \param addedStates The newly branched states with `current` as common
  /// ancestor.
  /// \param removedStates The states that stopped being active.
  virtual void update(ExecutionState *current,
                      const std::vector<ExecutionState *> &addedStates,
                      const std::vector<ExecutionState *> &removedStates) = 0;

  /// \return True if no state left for exploration, False otherwise
  virtual bool empty() = 0;

  /// Prints name of searcher to \p os.
  virtual void printName(llvm::raw_ostream &os) = 0;

  enum CoreSearchType { DFS, BFS };
};

/// DFSSearcher implements depth-first exploration. All states are kept
/// in insertion order. The last state is selected for further
/// exploration.
class DFSSearcher final : public Searcher {
  std::vector<ExecutionState *> states;

public:
  ExecutionState &selectState() override;
  void update(ExecutionState *current,
              const std::vector<ExecutionState *> &addedStates,
              const std::vector<ExecutionState *> &removedStates) override;
  bool empty() override;
  void printName(llvm::raw_ostream &os) override;
};

/// BFSSearcher implements breadth-first exploration. When a state forks,
/// the forking state and its successors are moved to the back of the
/// queue, so that all states of one depth are explored before any state
/// of the next.
class BFSSearcher final : public Searcher {
  std::deque<ExecutionState *> states;

public:
  ExecutionState &selectState() override;
  void update(ExecutionState *current,
              const std::vector<ExecutionState *> &addedStates,
              const std::vector<ExecutionState *> &removedStates) override;
  bool empty() override;
  void printName(llvm::raw_ostream &os) override;
};

/// Create the searcher named by -search.
Searcher *constructUserSearcher();

} // namespace tacsym

#endif /* TACSYM_SEARCHER_H */
