//===-- FileHandling.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Support/FileHandling.h"

#include "llvm/Support/FileSystem.h"

#include <system_error>

namespace tacsym {

std::unique_ptr<llvm::raw_fd_ostream>
tacsym_open_output_file(const std::string &path, std::string &error) {
  error.clear();
  std::error_code ec;
  auto f = std::make_unique<llvm::raw_fd_ostream>(path.c_str(), ec,
                                                  llvm::sys::fs::OF_None);
  if (ec)
    error = ec.message();
  if (!error.empty()) {
    f.reset(nullptr);
  }
  return f;
}

} // namespace tacsym
