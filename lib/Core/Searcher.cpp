//===-- Searcher.cpp ------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Searcher.h"

#include "ExecutionState.h"

#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/OptionCategories.h"

#include "llvm/Support/CommandLine.h"

#include <algorithm>

using namespace tacsym;
using namespace llvm;

namespace {
cl::opt<Searcher::CoreSearchType> CoreSearch(
    "search",
    cl::desc("Specify the search heuristic (default=dfs)"),
    cl::values(
        clEnumValN(Searcher::DFS, "dfs", "use Depth First Search (DFS)"),
        clEnumValN(Searcher::BFS, "bfs", "use Breadth First Search (BFS)")),
    cl::init(Searcher::DFS), cl::cat(SearchCat));
}

///

ExecutionState &DFSSearcher::selectState() {
  return *states.back();
}

void DFSSearcher::update(ExecutionState *current,
                         const std::vector<ExecutionState *> &addedStates,
                         const std::vector<ExecutionState *> &removedStates) {
  // insert states
  states.insert(states.end(), addedStates.begin(), addedStates.end());

  // remove states
  for (const auto state : removedStates) {
    if (state == states.back()) {
      states.pop_back();
    } else {
      auto it = std::find(states.begin(), states.end(), state);
      if (it == states.end())
        tacsym_error("DFSSearcher: state %u not found", state->getID());
      states.erase(it);
    }
  }
}

bool DFSSearcher::empty() {
  return states.empty();
}

void DFSSearcher::printName(llvm::raw_ostream &os) {
  os << "DFSSearcher\n";
}

///

ExecutionState &BFSSearcher::selectState() {
  return *states.front();
}

void BFSSearcher::update(ExecutionState *current,
                         const std::vector<ExecutionState *> &addedStates,
                         const std::vector<ExecutionState *> &removedStates) {
  // update current state
  // Assumption: If new states were added, the current state has forked
  // and should go to the back of the queue.
  if (!addedStates.empty() && current &&
      std::find(removedStates.begin(), removedStates.end(), current) ==
          removedStates.end()) {
    if (states.front() == current) {
      states.pop_front();
      states.push_back(current);
    }
  }

  // insert states
  states.insert(states.end(), addedStates.begin(), addedStates.end());

  // remove states
  for (const auto state : removedStates) {
    if (state == states.front()) {
      states.pop_front();
    } else {
      auto it = std::find(states.begin(), states.end(), state);
      if (it == states.end())
        tacsym_error("BFSSearcher: state %u not found", state->getID());
      states.erase(it);
    }
  }
}

bool BFSSearcher::empty() {
  return states.empty();
}

void BFSSearcher::printName(llvm::raw_ostream &os) {
  os << "BFSSearcher\n";
}

///

Searcher *tacsym::constructUserSearcher() {
  switch (CoreSearch) {
  case Searcher::BFS:
    return new BFSSearcher();
  case Searcher::DFS:
    break;
  }
  return new DFSSearcher();
}
