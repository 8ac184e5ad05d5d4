//===-- TerminationTypes.cpp ----------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Core/TerminationTypes.h"

using namespace tacsym;

const char *tacsym::getTerminationTypeName(StateTerminationType type) {
#define TTYPE(N,I,S) case StateTerminationType::N: return #N;
#define MARK(N,I)
  switch (type) {
  TERMINATION_TYPES
  }
#undef TTYPE
#undef MARK
  return "Unknown";
}

const char *tacsym::getTerminationTypeSuffix(StateTerminationType type) {
#define TTYPE(N,I,S) case StateTerminationType::N: return (S);
#define MARK(N,I)
  switch (type) {
  TERMINATION_TYPES
  }
#undef TTYPE
#undef MARK
  return "";
}
