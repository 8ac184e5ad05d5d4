//===-- TACParser.h ---------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TACPARSER_H
#define TACSYM_TACPARSER_H

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>

namespace llvm {
class MemoryBuffer;
}

namespace tacsym {
class TACProgram;

/// Parse a program in the textual TAC format:
///
///   function <id> <name> [args <v> ...] [public]
///   block <id> <function-id> [fallthrough <block-id>] [succ <block-id> ...]
///     <stmt-id>: [<r>, ... =] <OPCODE> [<operand>, ...]
///   entry <block-id>
///
/// Everything after a '#' is a comment. On failure returns null and sets
/// \p errorMsg to a message that starts with the offending line number.
std::unique_ptr<TACProgram> parseTAC(const llvm::MemoryBuffer &buffer,
                                     std::string &errorMsg);

std::unique_ptr<TACProgram> parseTAC(llvm::StringRef text,
                                     std::string &errorMsg);

/// Read and parse the file at \p path.
std::unique_ptr<TACProgram> loadTACFile(const std::string &path,
                                        std::string &errorMsg);

} // namespace tacsym

#endif /* TACSYM_TACPARSER_H */
