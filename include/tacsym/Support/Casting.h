//===-- Casting.h -----------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_CASTING_H
#define TACSYM_CASTING_H

#include "llvm/Support/Casting.h"

namespace tacsym {
using llvm::cast;
using llvm::cast_or_null;
using llvm::dyn_cast;
using llvm::dyn_cast_or_null;
using llvm::isa;
using llvm::isa_and_nonnull;
} // namespace tacsym

#endif /* TACSYM_CASTING_H */
