//===-- Executor.cpp ------------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Executor.h"

#include "CoreStats.h"
#include "ExecutionState.h"
#include "SimProcedureHandler.h"
#include "StateManager.h"
#include "TimingSolver.h"

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/Expr.h"
#include "tacsym/Expr/ExprUtil.h"
#include "tacsym/Module/TACProgram.h"
#include "tacsym/Module/TACStatement.h"
#include "tacsym/Solver/Solver.h"
#include "tacsym/Support/Casting.h"
#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/OptionCategories.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

using namespace llvm;
using namespace tacsym;

namespace {

cl::opt<bool> EmitAllErrors(
    "emit-all-errors", cl::init(false),
    cl::desc("Report every error "
             "(default=false, i.e. one per (error,statement) pair)"),
    cl::cat(ExecCat));

cl::opt<bool> DebugPrintStatements(
    "debug-print-statements", cl::init(false),
    cl::desc("Print every executed statement to stderr (default=false)"),
    cl::cat(ExecCat));

cl::opt<unsigned> MaxStackFrames(
    "max-stack-frames",
    cl::desc("Terminate a state after this many nested private calls.  "
             "Set to 0 to disable (default=8192)"),
    cl::init(8192), cl::cat(ExecCat));

cl::opt<unsigned> MaxSolverTime(
    "max-solver-time",
    cl::desc("Maximum amount of time for a single Z3 query, in milliseconds. "
             "Set to 0 to disable (default=0)"),
    cl::init(0), cl::cat(SolvingCat));

} // namespace

/***/

static std::string formatHex(const APInt &value) {
  SmallString<70> digits;
  value.toString(digits, 16, /*Signed=*/false);
  return "0x" + StringRef(digits).lower();
}

/***/

Executor::Executor(const InterpreterOptions &opts, InterpreterHandler *ih,
                   Solver *coreSolver)
    : Interpreter(opts), interpreterHandler(ih), program(nullptr),
      haltExecution(false) {
  if (!coreSolver)
    coreSolver = createCoreSolver();
  solver.reset(new TimingSolver(coreSolver));
  if (MaxSolverTime)
    solver->setTimeout(MaxSolverTime);

  simProcedureHandler.reset(new SimProcedureHandler(*this));
}

Executor::~Executor() {}

void Executor::setProgram(TACProgram *_program) { program = _program; }

ExecutionState *Executor::createInitialState() const {
  const TACBlock *entry = program ? program->getEntryBlock() : nullptr;
  return new ExecutionState(program,
                            entry ? entry->getFirstStatement() : nullptr);
}

bool Executor::bindSimProcedure(const std::string &function,
                                const std::string &procedure,
                                std::string &error) {
  return simProcedureHandler->bind(function, procedure, error);
}

unsigned Executor::bindSimProceduresByName() {
  return simProcedureHandler->bindByName();
}

/***/

void Executor::printDebugStatement(const ExecutionState &state,
                                   const TACStatement *stmt) {
  if (!DebugPrintStatements)
    return;
  llvm::errs() << "     " << state.getID() << ':' << *stmt << '\n';
}

bool Executor::readRegisters(const ExecutionState &state,
                             std::vector<std::string>::const_iterator begin,
                             std::vector<std::string>::const_iterator end,
                             std::vector<ref<Expr> > &values,
                             std::string &unbound) {
  for (auto it = begin; it != end; ++it) {
    ref<Expr> value = state.readRegister(*it);
    if (value.isNull()) {
      unbound = *it;
      return false;
    }
    values.push_back(value);
  }
  return true;
}

void Executor::transferToNext(ExecutionState &state,
                              const TACStatement *stmt) {
  state.setNextPC(program->getFallthrough(stmt));
}

const TACStatement *Executor::resolveTarget(ExecutionState &state,
                                            const ref<Expr> &target,
                                            const char *what) {
  const ConstantExpr *CE = dyn_cast<ConstantExpr>(target);
  if (!CE) {
    terminateStateOnError(state, Twine("symbolic ") + what + " target",
                          StateTerminationType::InvalidJump);
    return nullptr;
  }

  TACBlock *bb = program->resolveJumpTarget(CE->getAPValue());
  if (!bb || !bb->getFirstStatement()) {
    terminateStateOnError(state,
                          Twine("invalid ") + what + " target " +
                              formatHex(CE->getAPValue()),
                          StateTerminationType::InvalidJump);
    return nullptr;
  }
  return bb->getFirstStatement();
}

/***/

Executor::StateList Executor::executeStatement(ExecutionState &state) {
  return executeStatement(state, state.pc);
}

Executor::StateList Executor::executeStatement(ExecutionState &state,
                                               const TACStatement *stmt) {
  // A halted state stays where it is.
  if (state.halt)
    return {&state};

  if (!stmt)
    return terminateStateOnExecError(state, "no statement to execute");

  printDebugStatement(state, stmt);

  ++stats::instructions;
  ++state.steppedInstructions;
  state.prevPC = stmt;
  state.pc = stmt;

  switch (stmt->opcode) {
    // Gigahorse reserved
  case TACStatement::THROW:
    state.halt = true;
    return {&state};

  case TACStatement::PHI:
  case TACStatement::NOP:
  case TACStatement::CALLPRIVATEARG:
    transferToNext(state, stmt);
    return {&state};

  case TACStatement::CONST:
    if (stmt->resVars.size() != 1 || stmt->value.isNull())
      return terminateStateOnExecError(state, "malformed CONST statement");
    state.writeRegister(stmt->resVars[0], stmt->value);
    transferToNext(state, stmt);
    return {&state};

  case TACStatement::CALLPRIVATE:
    return executeCallPrivate(state, stmt);

  case TACStatement::RETURNPRIVATE:
    return executeReturnPrivate(state, stmt);

  case TACStatement::SIMPROCEDURE:
    return simProcedureHandler->handle(state, stmt);

    // Control flow
  case TACStatement::JUMP: {
    std::vector<ref<Expr> > args;
    std::string unbound;
    if (!readRegisters(state, stmt->argVars.begin(), stmt->argVars.end(),
                       args, unbound))
      return terminateStateOnError(state, "uninitialized variable " + unbound,
                                   StateTerminationType::UninitializedRegister);
    const TACStatement *dest = resolveTarget(state, args[0], "jump");
    if (!dest)
      return {};
    state.pc = dest;
    return {&state};
  }

  case TACStatement::JUMPI:
    return executeJumpi(state, stmt);

  case TACStatement::STOP:
  case TACStatement::RETURN:
    state.halt = true;
    return {&state};

  case TACStatement::REVERT:
  case TACStatement::INVALID:
    state.halt = true;
    state.reverted = true;
    return {&state};

    // Arithmetic
  case TACStatement::ADD:
  case TACStatement::SUB:
  case TACStatement::MUL:
  case TACStatement::DIV:
  case TACStatement::MOD:
  case TACStatement::LT:
  case TACStatement::GT:
  case TACStatement::EQ:
  case TACStatement::ISZERO:
  case TACStatement::AND:
  case TACStatement::OR:
  case TACStatement::XOR:
  case TACStatement::NOT:
  case TACStatement::SHL:
  case TACStatement::SHR:
    return executeArithmetic(state, stmt);

    // Environment
  case TACStatement::CALLER:
  case TACStatement::CALLVALUE:
  case TACStatement::ORIGIN:
  case TACStatement::ADDRESS:
  case TACStatement::TIMESTAMP:
  case TACStatement::NUMBER:
  case TACStatement::CALLDATASIZE:
  case TACStatement::CALLDATALOAD:
    return executeEnvironment(state, stmt);

  case TACStatement::InvalidOpcode:
    break;
  }

  return terminateStateOnExecError(state, Twine("illegal statement ") +
                                              stmt->id);
}

Executor::StateList Executor::executeCallPrivate(ExecutionState &state,
                                                 const TACStatement *stmt) {
  if (stmt->argVars.empty())
    return terminateStateOnExecError(state, "CALLPRIVATE without a target");

  ref<Expr> target = state.readRegister(stmt->argVars[0]);
  if (target.isNull())
    return terminateStateOnError(state,
                                 "uninitialized variable " + stmt->argVars[0],
                                 StateTerminationType::UninitializedRegister);

  const TACStatement *dest = resolveTarget(state, target, "call");
  if (!dest)
    return {};

  const TACStatement *returnTo = program->getFallthrough(stmt);
  if (!returnTo)
    returnTo = program->getFakeExit()->getFirstStatement();

  static const std::vector<std::string> noFormals;
  const TACFunction *callee = dest->block->function;
  const std::vector<std::string> &formals =
      callee ? callee->arguments : noFormals;

  size_t numActuals = stmt->argVars.size() - 1;
  if (formals.size() != numActuals)
    tacsym_warning_once(stmt,
                        "%s: calling %s with %zu arguments, expected %zu",
                        stmt->id.c_str(),
                        callee ? callee->name.c_str() : dest->block->id.c_str(),
                        numActuals, formals.size());

  if (MaxStackFrames && state.stack.size() >= MaxStackFrames)
    return terminateStateEarly(state, "max-stack-frames exceeded",
                               StateTerminationType::MaxDepth);

  // Only actuals matched by a formal are read. All of them are read
  // before any formal is written, so a formal that shadows an actual
  // still sees the caller's binding.
  size_t numBound = std::min(formals.size(), numActuals);
  std::vector<ref<Expr> > actuals;
  std::string unbound;
  if (!readRegisters(state, stmt->argVars.begin() + 1,
                     stmt->argVars.begin() + 1 + numBound, actuals, unbound))
    return terminateStateOnError(state, "uninitialized variable " + unbound,
                                 StateTerminationType::UninitializedRegister);
  for (size_t i = 0; i != numBound; ++i)
    state.writeRegister(formals[i], actuals[i]);

  LOG_STEPS("%s: call %s (depth %zu)", stmt->id.c_str(),
            callee ? callee->name.c_str() : "<unknown>",
            state.stack.size() + 1);

  state.pushFrame(stmt, returnTo, stmt->resVars);
  ++stats::privateCalls;
  state.pc = dest;
  return {&state};
}

Executor::StateList Executor::executeReturnPrivate(ExecutionState &state,
                                                   const TACStatement *stmt) {
  // The first operand is the return address slot. It was consumed by
  // the matching CALLPRIVATE.
  std::vector<ref<Expr> > values;
  std::string unbound;
  if (!stmt->argVars.empty() &&
      !readRegisters(state, stmt->argVars.begin() + 1, stmt->argVars.end(),
                     values, unbound))
    return terminateStateOnError(state, "uninitialized variable " + unbound,
                                 StateTerminationType::UninitializedRegister);

  return returnPrivate(state, values);
}

Executor::StateList
Executor::returnPrivate(ExecutionState &state,
                        const std::vector<ref<Expr> > &values) {
  CallFrame frame(nullptr, nullptr, std::vector<std::string>());
  if (!state.popFrame(frame))
    return terminateStateOnError(state, "return with an empty call stack",
                                 StateTerminationType::StackUnderflow);

  if (frame.results.size() != values.size())
    tacsym_warning_once(frame.callSite,
                        "%s: returning %zu values to %zu result variables",
                        frame.callSite->id.c_str(), values.size(),
                        frame.results.size());

  for (size_t i = 0, e = std::min(frame.results.size(), values.size()); i != e;
       ++i)
    state.writeRegister(frame.results[i], values[i]);

  LOG_STEPS("return to %s (depth %zu)", frame.returnTo->id.c_str(),
            state.stack.size());

  ++stats::privateReturns;
  state.pc = frame.returnTo;
  return {&state};
}

Executor::StateList Executor::executeJumpi(ExecutionState &state,
                                           const TACStatement *stmt) {
  std::vector<ref<Expr> > args;
  std::string unbound;
  if (!readRegisters(state, stmt->argVars.begin(), stmt->argVars.end(), args,
                     unbound))
    return terminateStateOnError(state, "uninitialized variable " + unbound,
                                 StateTerminationType::UninitializedRegister);

  ref<Expr> target = args[0];
  ref<Expr> cond = args[1];

  if (ConstantExpr *CE = dyn_cast<ConstantExpr>(cond)) {
    if (CE->isZero()) {
      transferToNext(state, stmt);
      return {&state};
    }
    const TACStatement *dest = resolveTarget(state, target, "jump");
    if (!dest)
      return {};
    state.pc = dest;
    return {&state};
  }

  const TACStatement *dest = resolveTarget(state, target, "jump");
  if (!dest)
    return {};

  ref<Expr> zero = ConstantExpr::alloc(0, cond->getWidth());
  ExecutionState *falseState = state.branch();
  ++stats::forks;

  state.addConstraint(NeExpr::create(cond, zero));
  state.pc = dest;

  falseState->addConstraint(EqExpr::create(cond, zero));
  transferToNext(*falseState, stmt);

  return {&state, falseState};
}

Executor::StateList Executor::executeArithmetic(ExecutionState &state,
                                                const TACStatement *stmt) {
  std::vector<ref<Expr> > args;
  std::string unbound;
  if (!readRegisters(state, stmt->argVars.begin(), stmt->argVars.end(), args,
                     unbound))
    return terminateStateOnError(state, "uninitialized variable " + unbound,
                                 StateTerminationType::UninitializedRegister);
  if (stmt->resVars.size() != 1 ||
      (int)args.size() != TACStatement::getNumArgs(stmt->opcode))
    return terminateStateOnExecError(state, Twine("malformed statement ") +
                                                stmt->id);

  ref<Expr> left = args[0];
  ref<Expr> right = args.size() > 1 ? args[1] : ref<Expr>();
  ref<Expr> result;

  switch (stmt->opcode) {
  case TACStatement::ADD:
    result = AddExpr::create(left, right);
    break;
  case TACStatement::SUB:
    result = SubExpr::create(left, right);
    break;
  case TACStatement::MUL:
    result = MulExpr::create(left, right);
    break;
  case TACStatement::DIV:
  case TACStatement::MOD: {
    // x / 0 == x % 0 == 0
    ref<Expr> zero = ConstantExpr::alloc(0, left->getWidth());
    ref<Expr> op = stmt->opcode == TACStatement::DIV
                       ? UDivExpr::create(left, right)
                       : URemExpr::create(left, right);
    result = SelectExpr::create(Expr::createIsZero(right), zero, op);
    break;
  }
  case TACStatement::LT:
    result = ZExtExpr::create(UltExpr::create(left, right), Expr::Int256);
    break;
  case TACStatement::GT:
    result = ZExtExpr::create(UgtExpr::create(left, right), Expr::Int256);
    break;
  case TACStatement::EQ:
    result = ZExtExpr::create(EqExpr::create(left, right), Expr::Int256);
    break;
  case TACStatement::ISZERO:
    result = ZExtExpr::create(Expr::createIsZero(left), Expr::Int256);
    break;
  case TACStatement::AND:
    result = AndExpr::create(left, right);
    break;
  case TACStatement::OR:
    result = OrExpr::create(left, right);
    break;
  case TACStatement::XOR:
    result = XorExpr::create(left, right);
    break;
  case TACStatement::NOT:
    result = NotExpr::create(left);
    break;
  // Shifts take the shift amount first.
  case TACStatement::SHL:
    result = ShlExpr::create(right, left);
    break;
  case TACStatement::SHR:
    result = LShrExpr::create(right, left);
    break;
  default:
    return terminateStateOnExecError(state, Twine("illegal statement ") +
                                                stmt->id);
  }

  state.writeRegister(stmt->resVars[0], result);
  transferToNext(state, stmt);
  return {&state};
}

Executor::StateList Executor::executeEnvironment(ExecutionState &state,
                                                 const TACStatement *stmt) {
  if (stmt->resVars.size() != 1)
    return terminateStateOnExecError(state, Twine("malformed statement ") +
                                                stmt->id);

  ref<Expr> result;
  if (stmt->opcode == TACStatement::CALLDATALOAD) {
    std::vector<ref<Expr> > args;
    std::string unbound;
    if (!readRegisters(state, stmt->argVars.begin(), stmt->argVars.end(),
                       args, unbound))
      return terminateStateOnError(
          state, "uninitialized variable " + unbound,
          StateTerminationType::UninitializedRegister);

    if (ConstantExpr *CE = dyn_cast<ConstantExpr>(args[0])) {
      result = state.getEnvironmentSymbol(
          "CALLDATA_" + toString(CE->getAPValue(), 10, /*Signed=*/false));
    } else {
      tacsym_warning_once(stmt, "%s: symbolic calldata offset, using an "
                                "unconstrained value",
                          stmt->id.c_str());
      result = state.createFreshSymbol("CALLDATA");
    }
  } else {
    result = state.getEnvironmentSymbol(stmt->getOpcodeName());
  }

  state.writeRegister(stmt->resVars[0], result);
  transferToNext(state, stmt);
  return {&state};
}

/***/

Executor::StateList
Executor::terminateStateOnError(ExecutionState &state,
                                const llvm::Twine &messaget,
                                StateTerminationType terminationType) {
  std::string message = messaget.str();
  const TACStatement *lastStmt = state.prevPC;

  state.terminationType = terminationType;
  state.terminationMessage = message;
  ++stats::erroredPaths;

  if (EmitAllErrors ||
      emittedErrors.insert(std::make_pair(lastStmt, message)).second) {
    if (lastStmt) {
      tacsym_message("ERROR: %s: %s", lastStmt->id.c_str(), message.c_str());
    } else {
      tacsym_message("ERROR: (location information missing) %s",
                     message.c_str());
    }
    if (!EmitAllErrors)
      tacsym_message("NOTE: now ignoring this error at this location");

    if (interpreterHandler) {
      std::string MsgString;
      llvm::raw_string_ostream msg(MsgString);
      msg << "Error: " << message << '\n';
      if (lastStmt) {
        msg << "Statement: " << *lastStmt << '\n';
        if (lastStmt->line)
          msg << "Line: " << lastStmt->line << '\n';
      }
      msg << "State: " << state.getID() << '\n';
      msg << "Stack: \n";
      state.dumpStack(msg);

      interpreterHandler->processTestCase(
          state, msg.str().c_str(), getTerminationTypeSuffix(terminationType));
    }
  }

  return {};
}

Executor::StateList
Executor::terminateStateEarly(ExecutionState &state,
                              const llvm::Twine &message,
                              StateTerminationType terminationType) {
  state.terminationType = terminationType;
  state.terminationMessage = message.str();
  ++stats::prunedPaths;

  if (terminationType == StateTerminationType::MaxDepth)
    tacsym_warning_once(state.prevPC, "%s", state.terminationMessage.c_str());

  return {};
}

void Executor::terminateState(ExecutionState &state) {
  if (!interpreterHandler)
    return;

  interpreterHandler->incPathsExplored();

  // Errors were reported when they happened.
  if (state.terminationType > StateTerminationType::EARLY)
    return;

  if (state.terminationType == StateTerminationType::Running ||
      state.terminationType == StateTerminationType::Halted) {
    interpreterHandler->processTestCase(
        state, nullptr,
        getTerminationTypeSuffix(StateTerminationType::Halted));
  } else {
    interpreterHandler->processTestCase(
        state, (state.terminationMessage + "\n").c_str(),
        getTerminationTypeSuffix(state.terminationType));
  }
}

/***/

void Executor::run(const FindPredicate &find) {
  if (!program)
    tacsym_error("no program to execute");

  haltExecution = false;

  StateManager manager(*this, createInitialState());
  if (interpreterOpts.MaxSteps)
    manager.setMaxSteps(interpreterOpts.MaxSteps);
  manager.run(find);

  if (haltExecution)
    tacsym_message("halting execution, dumping remaining states");

  for (ExecutionState *es : manager.getStash(StateManager::Found))
    terminateState(*es);
  for (ExecutionState *es : manager.getStash(StateManager::Deadended))
    terminateState(*es);
  for (ExecutionState *es : manager.getStash(StateManager::Pruned))
    terminateState(*es);
  for (ExecutionState *es : manager.getStash(StateManager::Errored))
    terminateState(*es);
  for (ExecutionState *es : manager.getStash(StateManager::Active))
    terminateState(*es);
}

/***/

void Executor::getConstraintLog(const ExecutionState &state,
                                std::string &res) {
  Query query(state.constraints, ConstantExpr::alloc(0, Expr::Bool));
  char *log = solver->getConstraintLog(query);
  res = std::string(log);
  free(log);
}

bool Executor::getSymbolicSolution(
    const ExecutionState &state,
    std::vector<std::pair<std::string, std::string> > &res) {
  std::vector<const SymbolExpr *> objects;
  std::vector<ref<Expr> > inputs;
  for (const auto &it : state.environment)
    inputs.push_back(it.second);
  std::vector<ref<Expr> > exprs = state.constraints.getExprs();
  inputs.insert(inputs.end(), exprs.begin(), exprs.end());
  findSymbols(inputs, objects);

  std::vector<APInt> values;
  bool hasSolution = false;
  bool success = solver->getInitialValues(state.constraints, objects, values,
                                          hasSolution, state.queryMetaData);
  if (!success) {
    tacsym_warning("unable to compute initial values (invalid constraints?)!");
    return false;
  }
  if (!hasSolution)
    return false;

  for (unsigned i = 0; i != objects.size(); ++i)
    res.push_back(std::make_pair(objects[i]->name, formatHex(values[i])));
  return true;
}

/***/

Interpreter *Interpreter::create(const InterpreterOptions &opts,
                                 InterpreterHandler *ih) {
  return new Executor(opts, ih);
}
