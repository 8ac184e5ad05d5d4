//===-- TACStatement.h ------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TACSTATEMENT_H
#define TACSYM_TACSTATEMENT_H

#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

namespace tacsym {
struct TACBlock;

// X(name, numArgs, numResults, hasSideEffects)
//
// A negative arity accepts any number of operands.
#define TACSYM_TAC_OPCODES(X)                                                  \
  /* Gigahorse reserved */                                                     \
  X(THROW, -1, 0, true)                                                        \
  X(CALLPRIVATE, -1, -1, true)                                                 \
  X(RETURNPRIVATE, -1, 0, true)                                                \
  X(PHI, -1, 1, false)                                                         \
  X(CONST, 0, 1, false)                                                        \
  X(NOP, 0, 0, false)                                                          \
  X(CALLPRIVATEARG, -1, -1, false)                                             \
  /* Installed in front of a function bound to a SimProcedure */              \
  X(SIMPROCEDURE, 0, 0, true)                                                  \
  /* Control flow */                                                           \
  X(JUMP, 1, 0, true)                                                          \
  X(JUMPI, 2, 0, true)                                                         \
  X(STOP, 0, 0, true)                                                          \
  X(RETURN, 2, 0, true)                                                        \
  X(REVERT, 2, 0, true)                                                        \
  X(INVALID, 0, 0, true)                                                       \
  /* Arithmetic */                                                             \
  X(ADD, 2, 1, false)                                                          \
  X(SUB, 2, 1, false)                                                          \
  X(MUL, 2, 1, false)                                                          \
  X(DIV, 2, 1, false)                                                          \
  X(MOD, 2, 1, false)                                                          \
  X(LT, 2, 1, false)                                                           \
  X(GT, 2, 1, false)                                                           \
  X(EQ, 2, 1, false)                                                           \
  X(ISZERO, 1, 1, false)                                                       \
  X(AND, 2, 1, false)                                                          \
  X(OR, 2, 1, false)                                                           \
  X(XOR, 2, 1, false)                                                          \
  X(NOT, 1, 1, false)                                                          \
  X(SHL, 2, 1, false)                                                          \
  X(SHR, 2, 1, false)                                                          \
  /* Environment */                                                            \
  X(CALLER, 0, 1, false)                                                       \
  X(CALLVALUE, 0, 1, false)                                                    \
  X(ORIGIN, 0, 1, false)                                                       \
  X(ADDRESS, 0, 1, false)                                                      \
  X(TIMESTAMP, 0, 1, false)                                                    \
  X(NUMBER, 0, 1, false)                                                       \
  X(CALLDATASIZE, 0, 1, false)                                                 \
  X(CALLDATALOAD, 1, 1, false)

/// TACStatement - One three-address instruction of a decompiled program.
struct TACStatement {
  enum Opcode {
#define TACSYM_OPCODE_ENUM(name, args, results, effects) name,
    TACSYM_TAC_OPCODES(TACSYM_OPCODE_ENUM)
#undef TACSYM_OPCODE_ENUM
    InvalidOpcode
  };

  Opcode opcode;
  /// Program-wide unique identifier.
  std::string id;
  std::vector<std::string> argVars;
  std::vector<std::string> resVars;
  /// The immediate of a CONST.
  ref<ConstantExpr> value;
  /// Name of the bound procedure, for SIMPROCEDURE statements.
  std::string procedureName;

  TACBlock *block;
  /// Position inside the owning block.
  unsigned index;
  /// Line in the source file, 0 for synthetic statements.
  unsigned line;

  TACStatement(Opcode _opcode, const std::string &_id)
      : opcode(_opcode), id(_id), block(nullptr), index(0), line(0) {}

  const char *getOpcodeName() const { return getOpcodeName(opcode); }
  bool hasSideEffects() const { return hasSideEffects(opcode); }

  void print(llvm::raw_ostream &os) const;
  void dump() const;

  static const char *getOpcodeName(Opcode opcode);
  /// Returns InvalidOpcode for an unknown name.
  static Opcode getOpcodeByName(llvm::StringRef name);
  static int getNumArgs(Opcode opcode);
  static int getNumResults(Opcode opcode);
  static bool hasSideEffects(Opcode opcode);
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const TACStatement &stmt) {
  stmt.print(os);
  return os;
}

} // namespace tacsym

#endif /* TACSYM_TACSTATEMENT_H */
