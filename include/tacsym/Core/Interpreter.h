//===-- Interpreter.h - Abstract Execution Engine Interface -----*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_INTERPRETER_H
#define TACSYM_INTERPRETER_H

#include <functional>
#include <string>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace tacsym {
class ExecutionState;
class TACProgram;

class InterpreterHandler {
public:
  InterpreterHandler() {}
  virtual ~InterpreterHandler() {}

  virtual llvm::raw_ostream &getInfoStream() const = 0;

  virtual void incPathsExplored() = 0;

  /// Called once for every state that finished, with the error message of
  /// the termination (or null) and the file suffix of its termination type.
  virtual void processTestCase(const ExecutionState &state,
                               const char *err,
                               const char *suffix) = 0;
};

class Interpreter {
public:
  /// Predicate marking a state as found.
  typedef std::function<bool(const ExecutionState &)> FindPredicate;

  struct InterpreterOptions {
    /// Stop exploring once this many statements have been executed;
    /// zero means no limit.
    unsigned long long MaxSteps;

    InterpreterOptions() : MaxSteps(0) {}
  };

protected:
  const InterpreterOptions interpreterOpts;

  Interpreter(const InterpreterOptions &_interpreterOpts)
      : interpreterOpts(_interpreterOpts) {}

public:
  virtual ~Interpreter() {}

  static Interpreter *create(const InterpreterOptions &_interpreterOpts,
                             InterpreterHandler *ih);

  /// Register the program to execute. The interpreter does not take
  /// ownership; the program must outlive it.
  virtual void setProgram(TACProgram *program) = 0;

  /// Bind \p function (an id or a name) to the SimProcedure \p procedure
  /// (a procedure name or an alias). Returns false and sets \p error on
  /// failure.
  virtual bool bindSimProcedure(const std::string &function,
                                const std::string &procedure,
                                std::string &error) = 0;

  /// Bind every function whose name is an alias of a known SimProcedure.
  /// Returns the number of bound functions.
  virtual unsigned bindSimProceduresByName() = 0;

  /// Explore the program from its entry block until no state is left, the
  /// step limit is reached, or a state satisfying \p find is found.
  virtual void run(const FindPredicate &find = FindPredicate()) = 0;

  /*** State accessor methods ***/

  virtual void getConstraintLog(const ExecutionState &state,
                                std::string &res) = 0;

  /// Compute a model of the state's symbolic inputs. Returns false if the
  /// state is infeasible or the solver failed.
  virtual bool getSymbolicSolution(
      const ExecutionState &state,
      std::vector<std::pair<std::string, std::string> > &res) = 0;
};

} // End tacsym namespace

#endif /* TACSYM_INTERPRETER_H */
