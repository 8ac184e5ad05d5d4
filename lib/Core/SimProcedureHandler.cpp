//===-- SimProcedureHandler.cpp -------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "SimProcedureHandler.h"

#include "CoreStats.h"
#include "ExecutionState.h"
#include "Executor.h"

#include "tacsym/Expr/Constraints.h"
#include "tacsym/Module/TACProgram.h"
#include "tacsym/Module/TACStatement.h"
#include "tacsym/Support/Casting.h"
#include "tacsym/Support/ErrorHandling.h"

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/Twine.h"

using namespace llvm;
using namespace tacsym;

static const char ProcedurePrefix[] = "SIMPROCEDURE_";

// Checked arithmetic ("safemath"). Every procedure takes two words and
// returns one; overflow, underflow and division by zero revert.
static SimProcedureHandler::HandlerInfo handlerInfo[] = {
#define add(name, handler, ...) { name, \
                                  &SimProcedureHandler::handler, \
                                  { __VA_ARGS__, nullptr } }
  add("SIMPROCEDURE_SAFEADD", handleSafeAdd,
      "safeAdd", "safe_add", "add", "SafeMath.add"),
  add("SIMPROCEDURE_SAFESUB", handleSafeSub,
      "safeSub", "safe_sub", "sub", "SafeMath.sub"),
  add("SIMPROCEDURE_SAFEMUL", handleSafeMul,
      "safeMul", "safe_mul", "mul", "SafeMath.mul"),
  add("SIMPROCEDURE_SAFEDIV", handleSafeDiv,
      "safeDiv", "safe_div", "div", "SafeMath.div"),
#undef add
};

int SimProcedureHandler::size() {
  return sizeof(handlerInfo)/sizeof(handlerInfo[0]);
}

const SimProcedureHandler::HandlerInfo *
SimProcedureHandler::lookup(StringRef procedure) {
  StringRef shortName = procedure;
  if (shortName.startswith_insensitive(ProcedurePrefix))
    shortName = shortName.drop_front(sizeof(ProcedurePrefix) - 1);

  for (int i = 0, N = size(); i != N; ++i) {
    const HandlerInfo &hi = handlerInfo[i];
    StringRef name(hi.name);
    if (name.drop_front(sizeof(ProcedurePrefix) - 1)
            .equals_insensitive(shortName))
      return &hi;
    for (const char *const *alias = hi.aliases; *alias; ++alias)
      if (procedure == *alias)
        return &hi;
  }
  return nullptr;
}

SimProcedureHandler::SimProcedureHandler(Executor &_executor)
    : executor(_executor) {}

bool SimProcedureHandler::bind(const std::string &function,
                               const std::string &procedure,
                               std::string &error) {
  TACProgram *program = executor.getProgram();
  if (!program) {
    error = "no program loaded";
    return false;
  }

  TACFunction *f = program->getFunction(function);
  if (!f)
    f = program->getFunctionByName(function);
  if (!f) {
    error = "unknown function '" + function + "'";
    return false;
  }

  const HandlerInfo *hi = lookup(procedure);
  if (!hi) {
    error = "unknown SimProcedure '" + procedure + "'";
    return false;
  }

  if (handlers.count(f)) {
    error = "function '" + function + "' is already bound to " +
            handlers[f]->name;
    return false;
  }

  if (!f->entry) {
    error = "function '" + function + "' has no entry block";
    return false;
  }

  if (!program->insertSimProcedure(f, hi->name, error))
    return false;
  handlers[f] = hi;
  return true;
}

unsigned SimProcedureHandler::bindByName() {
  TACProgram *program = executor.getProgram();
  if (!program)
    return 0;

  unsigned bound = 0;
  for (const auto &f : program->getFunctions()) {
    if (handlers.count(f.get()) || !f->entry)
      continue;

    StringRef name = StringRef(f->name).take_until([](char c) {
      return c == '(';
    });
    for (int i = 0, N = size(); i != N; ++i) {
      const HandlerInfo &hi = handlerInfo[i];
      bool matches = false;
      for (const char *const *alias = hi.aliases; *alias && !matches; ++alias)
        matches = name == *alias;
      if (!matches)
        continue;

      std::string error;
      if (!program->insertSimProcedure(f.get(), hi.name, error)) {
        tacsym_warning("cannot bind %s to %s: %s", f->name.c_str(), hi.name,
                       error.c_str());
        break;
      }
      handlers[f.get()] = &hi;
      tacsym_message("binding %s to %s", f->name.c_str(), hi.name);
      ++bound;
      break;
    }
  }
  return bound;
}

const SimProcedureHandler::HandlerInfo *
SimProcedureHandler::getBinding(const TACFunction *f) const {
  handlers_ty::const_iterator it = handlers.find(f);
  return it == handlers.end() ? nullptr : it->second;
}

Executor::StateList SimProcedureHandler::handle(ExecutionState &state,
                                                const TACStatement *stmt) {
  const TACFunction *f = stmt->block ? stmt->block->function : nullptr;
  const HandlerInfo *hi = getBinding(f);
  if (!hi)
    return executor.terminateStateOnExecError(
        state, Twine("SimProcedure ") + stmt->procedureName +
                   " reached in an unbound function");

  std::vector<ref<Expr> > arguments;
  for (const std::string &name : f->arguments) {
    ref<Expr> value = state.readRegister(name);
    if (value.isNull())
      return executor.terminateStateOnError(
          state, "uninitialized variable " + name,
          StateTerminationType::UninitializedRegister);
    arguments.push_back(value);
  }

  ++stats::simProcedureCalls;
  Handler h = hi->handler;
  return (this->*h)(state, f->arguments, arguments);
}

/****/

Executor::StateList SimProcedureHandler::returnValue(ExecutionState &state,
                                                     const ref<Expr> &value) {
  return executor.returnPrivate(state, std::vector<ref<Expr> >(1, value));
}

void SimProcedureHandler::addSafetyConstraint(ExecutionState &state,
                                              const ref<Expr> &condition) {
  size_t before = state.constraints.size();
  state.addConstraint(condition, ConstraintProvenance::Safety);
  stats::safetyConstraints += state.constraints.size() - before;
}

/****/

Executor::StateList
SimProcedureHandler::handleSafeAdd(ExecutionState &state,
                                   const std::vector<std::string> &argNames,
                                   std::vector<ref<Expr> > &arguments) {
  if (arguments.size() != 2)
    return executor.terminateStateOnExecError(
        state, "invalid number of arguments to SIMPROCEDURE_SAFEADD");

  ref<Expr> a = arguments[0], b = arguments[1];
  ConstantExpr *ca = dyn_cast<ConstantExpr>(a);
  ConstantExpr *cb = dyn_cast<ConstantExpr>(b);

  if (ca && cb) {
    bool overflow = false;
    APInt result = ca->getAPValue().uadd_ov(cb->getAPValue(), overflow);
    if (overflow)
      return executor.terminateStateEarly(state, "checked addition overflows",
                                          StateTerminationType::Pruned);
    return returnValue(state, ConstantExpr::alloc(result));
  }

  if (ca || cb) {
    ConstantExpr *conc = ca ? ca : cb;
    ref<Expr> sym = ca ? b : a;
    if (conc->isZero())
      return returnValue(state, sym);

    // sym + c < 2^N  <=>  sym < 2^N - c
    addSafetyConstraint(
        state, UltExpr::create(sym, ConstantExpr::alloc(-conc->getAPValue())));
    return returnValue(state, AddExpr::create(a, b));
  }

  Expr::Width w = a->getWidth();
  ref<Expr> wideSum = AddExpr::create(ZExtExpr::create(a, w + 1),
                                      ZExtExpr::create(b, w + 1));
  addSafetyConstraint(
      state, UltExpr::create(wideSum, ConstantExpr::alloc(
                                          APInt::getOneBitSet(w + 1, w))));
  return returnValue(state, AddExpr::create(a, b));
}

Executor::StateList
SimProcedureHandler::handleSafeSub(ExecutionState &state,
                                   const std::vector<std::string> &argNames,
                                   std::vector<ref<Expr> > &arguments) {
  if (arguments.size() != 2)
    return executor.terminateStateOnExecError(
        state, "invalid number of arguments to SIMPROCEDURE_SAFESUB");

  ref<Expr> a = arguments[0], b = arguments[1];
  ConstantExpr *ca = dyn_cast<ConstantExpr>(a);
  ConstantExpr *cb = dyn_cast<ConstantExpr>(b);

  if (ca && cb) {
    if (ca->getAPValue().ult(cb->getAPValue()))
      return executor.terminateStateEarly(state, "checked subtraction "
                                                 "underflows",
                                          StateTerminationType::Pruned);
    return returnValue(state, ca->Sub(cb));
  }

  addSafetyConstraint(state, UgeExpr::create(a, b));
  return returnValue(state, SubExpr::create(a, b));
}

Executor::StateList
SimProcedureHandler::handleSafeMul(ExecutionState &state,
                                   const std::vector<std::string> &argNames,
                                   std::vector<ref<Expr> > &arguments) {
  if (arguments.size() != 2)
    return executor.terminateStateOnExecError(
        state, "invalid number of arguments to SIMPROCEDURE_SAFEMUL");

  ref<Expr> a = arguments[0], b = arguments[1];
  ConstantExpr *ca = dyn_cast<ConstantExpr>(a);
  ConstantExpr *cb = dyn_cast<ConstantExpr>(b);
  Expr::Width w = a->getWidth();

  if (ca && cb) {
    bool overflow = false;
    APInt result = ca->getAPValue().umul_ov(cb->getAPValue(), overflow);
    if (overflow)
      return executor.terminateStateEarly(state, "checked multiplication "
                                                 "overflows",
                                          StateTerminationType::Pruned);
    return returnValue(state, ConstantExpr::alloc(result));
  }

  if (ca || cb) {
    ConstantExpr *conc = ca ? ca : cb;
    ref<Expr> sym = ca ? b : a;
    if (conc->isZero())
      return returnValue(state, ConstantExpr::alloc(0, w));
    if (conc->isOne())
      return returnValue(state, sym);

    // sym * c <= 2^N - 1  <=>  sym < floor((2^N - 1) / c) + 1
    APInt limit = APInt::getMaxValue(w).udiv(conc->getAPValue()) + 1;
    addSafetyConstraint(state,
                        UltExpr::create(sym, ConstantExpr::alloc(limit)));
    return returnValue(state, MulExpr::create(a, b));
  }

  ref<Expr> wideProduct = MulExpr::create(ZExtExpr::create(a, 2 * w),
                                          ZExtExpr::create(b, 2 * w));
  addSafetyConstraint(
      state, UltExpr::create(wideProduct, ConstantExpr::alloc(
                                              APInt::getOneBitSet(2 * w, w))));
  return returnValue(state, MulExpr::create(a, b));
}

Executor::StateList
SimProcedureHandler::handleSafeDiv(ExecutionState &state,
                                   const std::vector<std::string> &argNames,
                                   std::vector<ref<Expr> > &arguments) {
  if (arguments.size() != 2)
    return executor.terminateStateOnExecError(
        state, "invalid number of arguments to SIMPROCEDURE_SAFEDIV");

  ref<Expr> a = arguments[0], b = arguments[1];

  if (ConstantExpr *cb = dyn_cast<ConstantExpr>(b)) {
    if (cb->isZero())
      return executor.terminateStateEarly(state, "checked division by zero",
                                          StateTerminationType::Pruned);
  } else {
    addSafetyConstraint(
        state, NeExpr::create(b, ConstantExpr::alloc(0, b->getWidth())));
  }

  return returnValue(state, UDivExpr::create(a, b));
}
