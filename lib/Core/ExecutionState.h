//===-- ExecutionState.h ----------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_EXECUTIONSTATE_H
#define TACSYM_EXECUTIONSTATE_H

#include "TimingSolver.h"

#include "tacsym/Core/TerminationTypes.h"
#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/Expr.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tacsym {
class TACProgram;
struct TACStatement;

/// One unreturned private call.
struct CallFrame {
  /// The CALLPRIVATE statement.
  const TACStatement *callSite;
  /// Where execution resumes after the matching return.
  const TACStatement *returnTo;
  /// The caller's result variables, in order.
  std::vector<std::string> results;

  CallFrame(const TACStatement *_callSite, const TACStatement *_returnTo,
            const std::vector<std::string> &_results)
      : callSite(_callSite), returnTo(_returnTo), results(_results) {}
};

/// @brief ExecutionState representing a path under exploration
class ExecutionState {
public:
  typedef std::vector<CallFrame> stack_ty;
  typedef std::map<std::string, ref<Expr> > registers_ty;

private:
  static std::uint32_t nextID;

public:
  // Execution - Control Flow specific

  /// @brief Program this state runs; never modified through the state
  const TACProgram *program;

  /// @brief Pointer to statement to be executed next
  const TACStatement *pc;

  /// @brief Pointer to statement which was last executed
  const TACStatement *prevPC;

  /// @brief Variable bindings. Writes overwrite, nothing is ever unbound.
  registers_ty registers;

  /// @brief Stack of unreturned private calls
  stack_ty stack;

  /// @brief Set by terminal statements; a halted state is not advanced
  bool halt;

  /// @brief The halt came from REVERT or INVALID
  bool reverted;

  /// @brief Exploration depth, i.e., number of times this state forked
  std::uint32_t depth;

  // Overall state of the state - Data specific

  /// @brief Constraints collected so far
  ConstraintSet constraints;

  /// @brief Symbolic program inputs, created on first use
  registers_ty environment;

  /// @brief Number of unnamed symbolic inputs created so far
  unsigned freshSymbols;

  /// Statistics and information

  /// @brief Costs for all queries issued for this state, in microseconds
  mutable SolverQueryMetaData queryMetaData;

  /// @brief The number of statements executed by this state
  std::uint64_t steppedInstructions;

  /// @brief Running until the executor terminates the state
  StateTerminationType terminationType;
  std::string terminationMessage;

  /// @brief the global state counter
  std::uint32_t id;

public:
  ExecutionState(const TACProgram *_program, const TACStatement *entry);

  // copy ctor
  ExecutionState(const ExecutionState &state);
  // no copy assignment, use copy constructor
  ExecutionState &operator=(const ExecutionState &) = delete;
  // no move ctor
  ExecutionState(ExecutionState &&) noexcept = delete;
  // no move assignment
  ExecutionState &operator=(ExecutionState &&) noexcept = delete;

  ~ExecutionState();

  ExecutionState *branch();

  /// Returns null if \p name is unbound.
  ref<Expr> readRegister(const std::string &name) const;
  void writeRegister(const std::string &name, const ref<Expr> &value);

  void pushFrame(const TACStatement *callSite, const TACStatement *returnTo,
                 const std::vector<std::string> &results);
  /// Pops the top frame into \p frame. Returns false on an empty stack.
  bool popFrame(CallFrame &frame);

  /// Continue with \p next, or halt if it is null.
  void setNextPC(const TACStatement *next);

  void addConstraint(ref<Expr> e,
                     ConstraintProvenance provenance =
                         ConstraintProvenance::Program);

  /// The symbolic input called \p name, created on first use.
  ref<Expr> getEnvironmentSymbol(const std::string &name);
  /// A new unconstrained input whose name starts with \p prefix.
  ref<Expr> createFreshSymbol(const std::string &prefix);

  /// Decide whether the path constraints are satisfiable. Returns false if
  /// the solver failed.
  bool isFeasible(TimingSolver &solver, bool &result) const;

  bool isTerminated() const {
    return terminationType != StateTerminationType::Running &&
           terminationType != StateTerminationType::Halted;
  }

  void dumpStack(llvm::raw_ostream &out) const;

  void setID() { id = nextID++; };
  std::uint32_t getID() const { return id; };
};

struct ExecutionStateIDCompare {
  bool operator()(const ExecutionState *a, const ExecutionState *b) const {
    return a->getID() < b->getID();
  }
};

} // namespace tacsym

#endif /* TACSYM_EXECUTIONSTATE_H */
