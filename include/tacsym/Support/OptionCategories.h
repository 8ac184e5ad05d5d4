//===-- OptionCategories.h --------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

/*
 * This header defines the option categories used in TACSym.
 */

#ifndef TACSYM_OPTIONCATEGORIES_H
#define TACSYM_OPTIONCATEGORIES_H

#include "llvm/Support/CommandLine.h"

namespace tacsym {
  extern llvm::cl::OptionCategory ExecCat;
  extern llvm::cl::OptionCategory ModuleCat;
  extern llvm::cl::OptionCategory SearchCat;
  extern llvm::cl::OptionCategory SolvingCat;
}

#endif /* TACSYM_OPTIONCATEGORIES_H */
