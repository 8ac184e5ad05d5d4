//===-- TACProgram.h --------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_TACPROGRAM_H
#define TACSYM_TACPROGRAM_H

#include "tacsym/Module/TACStatement.h"

#include "llvm/ADT/APInt.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tacsym {
struct TACFunction;

struct TACBlock {
  std::string id;
  TACFunction *function;
  std::vector<std::unique_ptr<TACStatement> > statements;
  /// Block reached when control runs off the end, or null.
  TACBlock *fallthrough;
  std::vector<TACBlock *> successors;

  TACBlock(const std::string &_id, TACFunction *_function)
      : id(_id), function(_function), fallthrough(nullptr) {}

  const TACStatement *getFirstStatement() const {
    return statements.empty() ? nullptr : statements.front().get();
  }
};

struct TACFunction {
  std::string id;
  std::string name;
  /// Ordered formal arguments.
  std::vector<std::string> arguments;
  /// The block a CALLPRIVATE to this function jumps to.
  TACBlock *entry;
  std::vector<TACBlock *> blocks;
  bool isPublic;

  TACFunction(const std::string &_id, const std::string &_name)
      : id(_id), name(_name), entry(nullptr), isPublic(false) {}
};

/// TACProgram - Owns and indexes the blocks, functions and statements of a
/// decompiled program. Apart from SimProcedure installation it is read-only
/// once loaded.
class TACProgram {
public:
  static const char *const FakeExitId;

private:
  std::vector<std::unique_ptr<TACFunction> > functions;
  std::vector<std::unique_ptr<TACBlock> > blocks;

  std::map<std::string, TACFunction *> functionMap;
  std::map<std::string, TACFunction *> functionNameMap;
  std::map<std::string, TACBlock *> blockMap;
  std::map<std::string, TACStatement *> statementMap;

  TACBlock *entryBlock;
  TACBlock *fakeExit;

  void renumber(TACBlock *block);

public:
  TACProgram();
  ~TACProgram();

  TACProgram(const TACProgram &) = delete;
  TACProgram &operator=(const TACProgram &) = delete;

  /// Each add* method returns null and sets \p error when the identifier
  /// is already taken.
  TACFunction *addFunction(const std::string &id, const std::string &name,
                           std::string &error);
  TACBlock *addBlock(const std::string &id, TACFunction *function,
                     std::string &error);
  TACStatement *addStatement(TACBlock *block,
                             std::unique_ptr<TACStatement> stmt,
                             std::string &error);
  void setEntryBlock(TACBlock *block) { entryBlock = block; }

  TACBlock *getBlock(const std::string &id) const;
  TACStatement *getStatement(const std::string &id) const;
  TACFunction *getFunction(const std::string &id) const;
  TACFunction *getFunctionByName(const std::string &name) const;

  const std::vector<std::unique_ptr<TACFunction> > &getFunctions() const {
    return functions;
  }
  const std::vector<std::unique_ptr<TACBlock> > &getBlocks() const {
    return blocks;
  }

  /// The block execution starts from.
  TACBlock *getEntryBlock() const { return entryBlock; }

  /// The synthetic block holding a single STOP, used as the return
  /// location of calls that have no successor.
  TACBlock *getFakeExit() const { return fakeExit; }

  /// The statement executed after \p stmt when control is not
  /// transferred: the next one in its block, or the first statement of the
  /// block's fallthrough. Null if there is none.
  const TACStatement *getFallthrough(const TACStatement *stmt) const;

  /// Map a jump destination to its block. Block identifiers of decompiled
  /// code are the lowercase hex form of their address.
  TACBlock *resolveJumpTarget(const llvm::APInt &target) const;

  /// Insert a SIMPROCEDURE statement at the front of the entry block of
  /// \p function. Returns the new statement, or null with \p error set
  /// when its id is already taken.
  TACStatement *insertSimProcedure(TACFunction *function,
                                   const std::string &procedureName,
                                   std::string &error);

  void print(llvm::raw_ostream &os) const;
};

} // namespace tacsym

#endif /* TACSYM_TACPROGRAM_H */
