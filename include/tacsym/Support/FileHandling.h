//===-- FileHandling.h ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_FILEHANDLING_H
#define TACSYM_FILEHANDLING_H

#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>

namespace tacsym {
std::unique_ptr<llvm::raw_fd_ostream>
tacsym_open_output_file(const std::string &path, std::string &error);
}

#endif /* TACSYM_FILEHANDLING_H */
