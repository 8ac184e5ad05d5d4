//===-- SolverStats.cpp ---------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Solver/SolverStats.h"

using namespace tacsym;

uint64_t stats::queries = 0;
uint64_t stats::queriesInvalid = 0;
uint64_t stats::queriesValid = 0;
uint64_t stats::queryConstructs = 0;
uint64_t stats::queryCounterexamples = 0;
uint64_t stats::queryTimeouts = 0;
uint64_t stats::queryTime = 0;
