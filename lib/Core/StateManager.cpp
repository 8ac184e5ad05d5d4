//===-- StateManager.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "StateManager.h"

#include "CoreStats.h"
#include "ExecutionState.h"
#include "Executor.h"
#include "Searcher.h"
#include "TimingSolver.h"

#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/OptionCategories.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/CommandLine.h"

#include <algorithm>

using namespace llvm;
using namespace tacsym;

namespace {
cl::opt<bool> LazySolves(
    "lazy-solves", cl::init(false),
    cl::desc("Do not check the feasibility of states that gained "
             "constraints (default=false)"),
    cl::cat(SearchCat));
}

StateManager::StateManager(Executor &_executor, ExecutionState *initialState,
                           Searcher *_searcher)
    : executor(_executor),
      searcher(_searcher ? _searcher : constructUserSearcher()), steps(0),
      maxSteps(0) {
  stashes[Active].push_back(initialState);
  searcher->update(nullptr, stashes[Active], stash_ty());
}

StateManager::~StateManager() {
  for (auto &stash : stashes)
    for (ExecutionState *es : stash)
      delete es;
}

const char *StateManager::getStashName(Stash stash) {
  switch (stash) {
  case Active:
    return "active";
  case Found:
    return "found";
  case Deadended:
    return "deadended";
  case Pruned:
    return "pruned";
  case Errored:
    return "errored";
  case NumStashes:
    break;
  }
  return "unknown";
}

StateManager::Stash StateManager::classify(ExecutionState &state,
                                           size_t baseConstraints) {
  if (!LazySolves && state.constraints.size() != baseConstraints) {
    bool feasible;
    if (!state.isFeasible(*executor.getSolver(), feasible)) {
      executor.terminateStateOnSolverError(
          state, llvm::Twine("feasibility query failed: ") +
                     executor.getSolver()->getLastStatusString());
      return Errored;
    }
    if (!feasible) {
      state.terminationType = StateTerminationType::Pruned;
      state.terminationMessage = "infeasible path";
      ++stats::prunedPaths;
      return Pruned;
    }
  }

  if (state.halt) {
    state.terminationType = StateTerminationType::Halted;
    if (state.reverted)
      ++stats::revertedPaths;
    else
      ++stats::completedPaths;
    return Deadended;
  }

  if (find && find(state))
    return Found;
  return Active;
}

bool StateManager::step() {
  if (searcher->empty())
    return false;

  ExecutionState &state = searcher->selectState();
  size_t baseConstraints = state.constraints.size();
  Executor::StateList results = executor.executeStatement(state);
  ++steps;

  stash_ty addedStates, removedStates;
  if (results.empty()) {
    // A handler that returned nothing without saying why pruned the path.
    if (state.terminationType == StateTerminationType::Running) {
      state.terminationType = StateTerminationType::Pruned;
      ++stats::prunedPaths;
    }
    Stash target = state.terminationType <= StateTerminationType::EARLY
                       ? Pruned
                       : Errored;
    removedStates.push_back(&state);
    stashes[target].push_back(&state);
  } else {
    if (std::find(results.begin(), results.end(), &state) == results.end())
      tacsym_error("state %u is missing from its own successors",
                   state.getID());

    for (ExecutionState *es : results) {
      Stash target = classify(*es, baseConstraints);
      if (es == &state) {
        if (target != Active)
          removedStates.push_back(es);
      } else if (target == Active) {
        addedStates.push_back(es);
      }
      if (target != Active || es != &state)
        stashes[target].push_back(es);
    }
  }

  if (!removedStates.empty()) {
    stash_ty &active = stashes[Active];
    active.erase(std::remove(active.begin(), active.end(), &state),
                 active.end());
  }
  searcher->update(&state, addedStates, removedStates);
  return true;
}

void StateManager::run(const Interpreter::FindPredicate &pred) {
  if (pred)
    find = pred;

  while (!searcher->empty() && !executor.haltExecution) {
    if (maxSteps && steps >= maxSteps) {
      tacsym_warning("max-steps reached, %zu states remain active",
                     stashes[Active].size());
      break;
    }
    step();
    if (find && !stashes[Found].empty())
      break;
  }
}
