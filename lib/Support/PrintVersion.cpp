//===-- PrintVersion.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Support/PrintVersion.h"
#include "tacsym/Config/Version.h"

#include "llvm/Support/CommandLine.h"

void tacsym::printVersion(llvm::raw_ostream &OS) {
  OS << PACKAGE_STRING "\n";

  // Show LLVM version information
  OS << "\n";
  llvm::cl::PrintVersionMessage();
}
