//===-- SimProcedureHandler.h -----------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_SIMPROCEDUREHANDLER_H
#define TACSYM_SIMPROCEDUREHANDLER_H

#include "Executor.h"

#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/StringRef.h"

#include <map>
#include <string>
#include <vector>

namespace tacsym {
class ExecutionState;
struct TACFunction;
struct TACStatement;

/// Replaces the body of bound functions with hand-written symbolic
/// semantics. A bound function starts with a SIMPROCEDURE statement; when
/// it runs, the handler receives the function's formals and leaves the
/// function through Executor::returnPrivate, or prunes the path.
class SimProcedureHandler {
public:
  typedef Executor::StateList (SimProcedureHandler::*Handler)(
      ExecutionState &state, const std::vector<std::string> &argNames,
      std::vector<ref<Expr> > &arguments);

  struct HandlerInfo {
    const char *name;
    SimProcedureHandler::Handler handler;
    /// Function names bound by bindByName(), null terminated.
    const char *aliases[5];
  };

  typedef std::map<const TACFunction *, const HandlerInfo *> handlers_ty;

  handlers_ty handlers;
  class Executor &executor;

  static int size();

  /// Find a procedure by its name (with or without the SIMPROCEDURE_
  /// prefix, in any case) or by one of its aliases.
  static const HandlerInfo *lookup(llvm::StringRef procedure);

public:
  explicit SimProcedureHandler(Executor &_executor);

  /// Bind \p function, an id or a name, to \p procedure and install the
  /// SIMPROCEDURE statement at its entry. Returns false and sets \p error
  /// if either is unknown or the function is already bound.
  bool bind(const std::string &function, const std::string &procedure,
            std::string &error);

  /// Bind every function whose name (ignoring a parameter list) is an
  /// alias of a procedure. Returns the number of bound functions.
  unsigned bindByName();

  const HandlerInfo *getBinding(const TACFunction *f) const;

  /// Run the procedure bound to the function owning \p stmt.
  Executor::StateList handle(ExecutionState &state, const TACStatement *stmt);

  /* Convenience routines */

  Executor::StateList returnValue(ExecutionState &state,
                                  const ref<Expr> &value);

  void addSafetyConstraint(ExecutionState &state, const ref<Expr> &condition);

  /* Handlers */

#define HANDLER(name)                                                          \
  Executor::StateList name(ExecutionState &state,                              \
                           const std::vector<std::string> &argNames,           \
                           std::vector<ref<Expr> > &arguments)
  HANDLER(handleSafeAdd);
  HANDLER(handleSafeDiv);
  HANDLER(handleSafeMul);
  HANDLER(handleSafeSub);
#undef HANDLER
};
} // End tacsym namespace

#endif /* TACSYM_SIMPROCEDUREHANDLER_H */
