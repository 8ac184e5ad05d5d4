//===-- TACProgram.cpp ----------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Module/TACProgram.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"

using namespace tacsym;

const char *const TACProgram::FakeExitId = "fake_exit";

TACProgram::TACProgram() : entryBlock(nullptr), fakeExit(nullptr) {
  std::string error;
  fakeExit = addBlock(FakeExitId, nullptr, error);
  std::unique_ptr<TACStatement> stop(
      new TACStatement(TACStatement::STOP, std::string(FakeExitId) + "_stop"));
  addStatement(fakeExit, std::move(stop), error);
}

TACProgram::~TACProgram() {}

TACFunction *TACProgram::addFunction(const std::string &id,
                                     const std::string &name,
                                     std::string &error) {
  if (functionMap.count(id)) {
    error = "duplicate function id '" + id + "'";
    return nullptr;
  }
  if (functionNameMap.count(name)) {
    error = "duplicate function name '" + name + "'";
    return nullptr;
  }
  functions.emplace_back(new TACFunction(id, name));
  TACFunction *f = functions.back().get();
  functionMap[id] = f;
  functionNameMap[name] = f;
  return f;
}

TACBlock *TACProgram::addBlock(const std::string &id, TACFunction *function,
                               std::string &error) {
  if (blockMap.count(id)) {
    error = "duplicate block id '" + id + "'";
    return nullptr;
  }
  blocks.emplace_back(new TACBlock(id, function));
  TACBlock *bb = blocks.back().get();
  blockMap[id] = bb;
  if (function)
    function->blocks.push_back(bb);
  return bb;
}

TACStatement *TACProgram::addStatement(TACBlock *block,
                                       std::unique_ptr<TACStatement> stmt,
                                       std::string &error) {
  if (statementMap.count(stmt->id)) {
    error = "duplicate statement id '" + stmt->id + "'";
    return nullptr;
  }
  TACStatement *s = stmt.get();
  s->block = block;
  s->index = block->statements.size();
  block->statements.push_back(std::move(stmt));
  statementMap[s->id] = s;
  return s;
}

void TACProgram::renumber(TACBlock *block) {
  for (unsigned i = 0; i < block->statements.size(); ++i)
    block->statements[i]->index = i;
}

TACBlock *TACProgram::getBlock(const std::string &id) const {
  auto it = blockMap.find(id);
  return it == blockMap.end() ? nullptr : it->second;
}

TACStatement *TACProgram::getStatement(const std::string &id) const {
  auto it = statementMap.find(id);
  return it == statementMap.end() ? nullptr : it->second;
}

TACFunction *TACProgram::getFunction(const std::string &id) const {
  auto it = functionMap.find(id);
  return it == functionMap.end() ? nullptr : it->second;
}

TACFunction *TACProgram::getFunctionByName(const std::string &name) const {
  auto it = functionNameMap.find(name);
  return it == functionNameMap.end() ? nullptr : it->second;
}

const TACStatement *
TACProgram::getFallthrough(const TACStatement *stmt) const {
  const TACBlock *bb = stmt->block;
  if (stmt->index + 1 < bb->statements.size())
    return bb->statements[stmt->index + 1].get();
  if (bb->fallthrough)
    return bb->fallthrough->getFirstStatement();
  return nullptr;
}

TACBlock *TACProgram::resolveJumpTarget(const llvm::APInt &target) const {
  llvm::SmallString<70> digits;
  target.toString(digits, 16, /*Signed=*/false);
  return getBlock("0x" + llvm::StringRef(digits).lower());
}

TACStatement *TACProgram::insertSimProcedure(TACFunction *function,
                                             const std::string &procedureName,
                                             std::string &error) {
  std::string id = function->id + "_" + procedureName;
  if (statementMap.count(id)) {
    error = "duplicate statement id '" + id + "'";
    return nullptr;
  }

  TACBlock *entry = function->entry;
  std::unique_ptr<TACStatement> stmt(
      new TACStatement(TACStatement::SIMPROCEDURE, id));
  stmt->procedureName = procedureName;
  stmt->block = entry;

  TACStatement *s = stmt.get();
  entry->statements.insert(entry->statements.begin(), std::move(stmt));
  statementMap[s->id] = s;
  renumber(entry);
  return s;
}

void TACProgram::print(llvm::raw_ostream &os) const {
  for (const auto &f : functions) {
    os << "function " << f->id << " " << f->name;
    if (!f->arguments.empty()) {
      os << " args";
      for (const auto &arg : f->arguments)
        os << " " << arg;
    }
    if (f->isPublic)
      os << " public";
    os << "\n";
  }
  for (const auto &bb : blocks) {
    if (bb.get() == fakeExit)
      continue;
    os << "block " << bb->id << " " << bb->function->id;
    if (bb->fallthrough)
      os << " fallthrough " << bb->fallthrough->id;
    if (!bb->successors.empty()) {
      os << " succ";
      for (const TACBlock *succ : bb->successors)
        os << " " << succ->id;
    }
    os << "\n";
    for (const auto &stmt : bb->statements)
      os << "  " << *stmt << "\n";
  }
  if (entryBlock)
    os << "entry " << entryBlock->id << "\n";
}
