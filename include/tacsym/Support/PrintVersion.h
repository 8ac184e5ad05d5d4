//===-- PrintVersion.h ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_PRINTVERSION_H
#define TACSYM_PRINTVERSION_H

#include "llvm/Support/raw_ostream.h"

namespace tacsym {
  void printVersion(llvm::raw_ostream &OS);
}

#endif /* TACSYM_PRINTVERSION_H */
