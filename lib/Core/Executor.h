//===-- Executor.h ----------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//
//
// Class to perform actual execution, hides implementation details from
// external interpreter.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_EXECUTOR_H
#define TACSYM_EXECUTOR_H

#include "ExecutionState.h"

#include "tacsym/Core/Interpreter.h"
#include "tacsym/Core/TerminationTypes.h"
#include "tacsym/Expr/Expr.h"

#include "llvm/ADT/Twine.h"

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tacsym {
class Solver;
class SimProcedureHandler;
class StateManager;
struct TACBlock;
class TACProgram;
struct TACStatement;
class TimingSolver;

class Executor : public Interpreter {
  friend class SimProcedureHandler;
  friend class StateManager;

public:
  /// The successors of one executed statement. Empty if the state was
  /// pruned or terminated; otherwise the state itself comes first,
  /// followed by the states it forked.
  typedef std::vector<ExecutionState *> StateList;

private:
  InterpreterHandler *interpreterHandler;
  TACProgram *program;

  std::unique_ptr<TimingSolver> solver;
  std::unique_ptr<SimProcedureHandler> simProcedureHandler;

  /// (statement, message) pairs already reported.
  std::set<std::pair<const TACStatement *, std::string> > emittedErrors;

  /// Signals the StateManager to stop at the next step boundary.
  bool haltExecution;

  void printDebugStatement(const ExecutionState &state,
                           const TACStatement *stmt);

  /// Read every register in \p names. On an unbound register, returns
  /// false and stores its name in \p unbound.
  bool readRegisters(const ExecutionState &state,
                     std::vector<std::string>::const_iterator begin,
                     std::vector<std::string>::const_iterator end,
                     std::vector<ref<Expr> > &values, std::string &unbound);

  /// Continue with the statement after \p stmt.
  void transferToNext(ExecutionState &state, const TACStatement *stmt);

  /// Resolve a concrete jump destination. Returns null and terminates the
  /// state if the destination is symbolic or names no block.
  const TACStatement *resolveTarget(ExecutionState &state,
                                    const ref<Expr> &target,
                                    const char *what);

  StateList executeCallPrivate(ExecutionState &state,
                               const TACStatement *stmt);
  StateList executeReturnPrivate(ExecutionState &state,
                                 const TACStatement *stmt);
  StateList executeJumpi(ExecutionState &state, const TACStatement *stmt);
  StateList executeArithmetic(ExecutionState &state,
                              const TACStatement *stmt);
  StateList executeEnvironment(ExecutionState &state,
                               const TACStatement *stmt);

  void processFinishedState(const ExecutionState &state);

public:
  /// \p coreSolver is owned by the executor. A null solver makes the
  /// executor create the Z3 backed one.
  Executor(const InterpreterOptions &opts, InterpreterHandler *ie,
           Solver *coreSolver = nullptr);
  virtual ~Executor();

  const InterpreterHandler &getHandler() { return *interpreterHandler; }

  TimingSolver *getSolver() { return solver.get(); }
  SimProcedureHandler &getSimProcedureHandler() {
    return *simProcedureHandler;
  }
  TACProgram *getProgram() const { return program; }

  /// A new state positioned at the first statement of the program entry.
  /// The caller owns it.
  ExecutionState *createInitialState() const;

  /// Execute the statement at the state's pc.
  StateList executeStatement(ExecutionState &state);
  /// Execute \p stmt on \p state.
  StateList executeStatement(ExecutionState &state, const TACStatement *stmt);

  /// Pop the top call frame, bind its result variables to \p values and
  /// resume at its return location.
  StateList returnPrivate(ExecutionState &state,
                          const std::vector<ref<Expr> > &values);

  /// Record an error termination. Each (statement, message) pair is
  /// reported once unless -emit-all-errors is given.
  StateList terminateStateOnError(ExecutionState &state,
                                  const llvm::Twine &message,
                                  StateTerminationType terminationType);

  StateList terminateStateOnExecError(ExecutionState &state,
                                      const llvm::Twine &message) {
    return terminateStateOnError(state, message,
                                 StateTerminationType::Execution);
  }

  StateList terminateStateOnSolverError(ExecutionState &state,
                                        const llvm::Twine &message) {
    return terminateStateOnError(state, message,
                                 StateTerminationType::Solver);
  }

  /// Stop a state that is not erroneous: a pruned path or a resource
  /// limit.
  StateList terminateStateEarly(ExecutionState &state,
                                const llvm::Twine &message,
                                StateTerminationType terminationType);

  // Fired by the StateManager once a state stops being active.
  void terminateState(ExecutionState &state);

  /*** Interpreter interface ***/

  void setProgram(TACProgram *_program) override;

  bool bindSimProcedure(const std::string &function,
                        const std::string &procedure,
                        std::string &error) override;

  unsigned bindSimProceduresByName() override;

  void run(const FindPredicate &find = FindPredicate()) override;

  void setHaltExecution(bool value) { haltExecution = value; }

  /*** State accessor methods ***/

  void getConstraintLog(const ExecutionState &state,
                        std::string &res) override;

  bool getSymbolicSolution(
      const ExecutionState &state,
      std::vector<std::pair<std::string, std::string> > &res) override;
};

} // End tacsym namespace

#endif /* TACSYM_EXECUTOR_H */
