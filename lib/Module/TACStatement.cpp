//===-- TACStatement.cpp --------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Module/TACStatement.h"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace tacsym;

namespace {
struct OpcodeInfo {
  const char *name;
  int numArgs;
  int numResults;
  bool hasSideEffects;
};

const OpcodeInfo opcodeTable[] = {
#define TACSYM_OPCODE_INFO(name, args, results, effects)                       \
  {#name, args, results, effects},
    TACSYM_TAC_OPCODES(TACSYM_OPCODE_INFO)
#undef TACSYM_OPCODE_INFO
};

const OpcodeInfo &getInfo(TACStatement::Opcode opcode) {
  if (opcode < 0 || opcode >= TACStatement::InvalidOpcode)
    llvm_unreachable("invalid TAC opcode");
  return opcodeTable[opcode];
}
} // namespace

const char *TACStatement::getOpcodeName(Opcode opcode) {
  if (opcode == InvalidOpcode)
    return "<invalid>";
  return getInfo(opcode).name;
}

TACStatement::Opcode TACStatement::getOpcodeByName(llvm::StringRef name) {
  return llvm::StringSwitch<Opcode>(name)
#define TACSYM_OPCODE_CASE(opname, args, results, effects)                     \
  .Case(#opname, opname)
      TACSYM_TAC_OPCODES(TACSYM_OPCODE_CASE)
#undef TACSYM_OPCODE_CASE
      .Default(InvalidOpcode);
}

int TACStatement::getNumArgs(Opcode opcode) { return getInfo(opcode).numArgs; }

int TACStatement::getNumResults(Opcode opcode) {
  return getInfo(opcode).numResults;
}

bool TACStatement::hasSideEffects(Opcode opcode) {
  return getInfo(opcode).hasSideEffects;
}

void TACStatement::print(llvm::raw_ostream &os) const {
  os << id << ": ";
  for (unsigned i = 0; i < resVars.size(); ++i)
    os << (i ? ", " : "") << resVars[i];
  if (!resVars.empty())
    os << " = ";
  os << getOpcodeName();

  if (opcode == CONST && !value.isNull()) {
    std::string digits;
    value->toString(digits, 16);
    os << " 0x" << digits;
  } else if (opcode == SIMPROCEDURE) {
    os << " " << procedureName;
  }

  for (unsigned i = 0; i < argVars.size(); ++i)
    os << (i ? ", " : " ") << argVars[i];
}

void TACStatement::dump() const {
  print(llvm::errs());
  llvm::errs() << "\n";
}
