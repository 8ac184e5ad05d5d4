//===-- CoreStats.cpp -----------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "CoreStats.h"

#include "tacsym/Solver/SolverStats.h"

using namespace tacsym;

uint64_t stats::instructions = 0;
uint64_t stats::forks = 0;
uint64_t stats::privateCalls = 0;
uint64_t stats::privateReturns = 0;
uint64_t stats::simProcedureCalls = 0;
uint64_t stats::safetyConstraints = 0;

uint64_t stats::completedPaths = 0;
uint64_t stats::revertedPaths = 0;
uint64_t stats::prunedPaths = 0;
uint64_t stats::erroredPaths = 0;

uint64_t stats::solverTime = 0;

void stats::reset() {
  instructions = forks = privateCalls = privateReturns = 0;
  simProcedureCalls = safetyConstraints = 0;
  completedPaths = revertedPaths = prunedPaths = erroredPaths = 0;
  solverTime = 0;

  queries = queriesInvalid = queriesValid = 0;
  queryConstructs = queryCounterexamples = queryTimeouts = 0;
  queryTime = 0;
}
