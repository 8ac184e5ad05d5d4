//===-- ExecutionState.cpp ------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "ExecutionState.h"

#include "tacsym/Module/TACProgram.h"
#include "tacsym/Module/TACStatement.h"

#include "llvm/Support/raw_ostream.h"

using namespace llvm;
using namespace tacsym;

/***/

std::uint32_t ExecutionState::nextID = 1;

/***/

ExecutionState::ExecutionState(const TACProgram *_program,
                               const TACStatement *entry)
    : program(_program), pc(entry), prevPC(nullptr), halt(entry == nullptr),
      reverted(false), depth(0), freshSymbols(0), steppedInstructions(0),
      terminationType(StateTerminationType::Running) {
  setID();
}

ExecutionState::~ExecutionState() {}

ExecutionState::ExecutionState(const ExecutionState &state)
    : program(state.program),
      pc(state.pc),
      prevPC(state.prevPC),
      registers(state.registers),
      stack(state.stack),
      halt(state.halt),
      reverted(state.reverted),
      depth(state.depth),
      constraints(state.constraints),
      environment(state.environment),
      freshSymbols(state.freshSymbols),
      queryMetaData(state.queryMetaData),
      steppedInstructions(state.steppedInstructions),
      terminationType(state.terminationType),
      terminationMessage(state.terminationMessage),
      id(state.id) {}

ExecutionState *ExecutionState::branch() {
  depth++;

  auto *falseState = new ExecutionState(*this);
  falseState->setID();

  return falseState;
}

ref<Expr> ExecutionState::readRegister(const std::string &name) const {
  auto it = registers.find(name);
  if (it == registers.end())
    return ref<Expr>();
  return it->second;
}

void ExecutionState::writeRegister(const std::string &name,
                                   const ref<Expr> &value) {
  registers[name] = value;
}

void ExecutionState::pushFrame(const TACStatement *callSite,
                               const TACStatement *returnTo,
                               const std::vector<std::string> &results) {
  stack.emplace_back(callSite, returnTo, results);
}

bool ExecutionState::popFrame(CallFrame &frame) {
  if (stack.empty())
    return false;
  frame = stack.back();
  stack.pop_back();
  return true;
}

void ExecutionState::setNextPC(const TACStatement *next) {
  if (next)
    pc = next;
  else
    halt = true;
}

void ExecutionState::addConstraint(ref<Expr> e,
                                   ConstraintProvenance provenance) {
  ConstraintManager c(constraints);
  c.addConstraint(e, provenance);
}

ref<Expr> ExecutionState::getEnvironmentSymbol(const std::string &name) {
  auto it = environment.find(name);
  if (it != environment.end())
    return it->second;
  ref<Expr> sym = SymbolExpr::create(name, Expr::Int256);
  environment.insert(std::make_pair(name, sym));
  return sym;
}

ref<Expr> ExecutionState::createFreshSymbol(const std::string &prefix) {
  std::string name;
  do {
    name = prefix + "_" + std::to_string(freshSymbols++);
  } while (environment.count(name));
  return getEnvironmentSymbol(name);
}

bool ExecutionState::isFeasible(TimingSolver &solver, bool &result) const {
  return solver.isFeasible(constraints, result, queryMetaData);
}

void ExecutionState::dumpStack(llvm::raw_ostream &out) const {
  if (pc)
    out << "\t#0 " << pc->id << "\n";
  unsigned idx = 1;
  for (auto it = stack.rbegin(), ie = stack.rend(); it != ie; ++it, ++idx) {
    const CallFrame &sf = *it;
    out << "\t#" << idx << " " << sf.callSite->id;
    if (sf.callSite->block && sf.callSite->block->function)
      out << " in " << sf.callSite->block->function->name;
    out << " (returns to "
        << (sf.returnTo ? sf.returnTo->id : std::string("<none>")) << ")\n";
  }
}
