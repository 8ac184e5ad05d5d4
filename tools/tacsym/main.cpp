/* -*- mode: c++; c-basic-offset: 2; -*- */

//===-- main.cpp ------------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "../../lib/Core/CoreStats.h"
#include "../../lib/Core/ExecutionState.h"

#include "tacsym/Core/Interpreter.h"
#include "tacsym/Core/TerminationTypes.h"
#include "tacsym/Module/TACParser.h"
#include "tacsym/Module/TACProgram.h"
#include "tacsym/Module/TACStatement.h"
#include "tacsym/Solver/SolverStats.h"
#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/OptionCategories.h"
#include "tacsym/Support/PrintVersion.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace llvm;
using namespace tacsym;

namespace {
  cl::opt<std::string>
  InputFile(cl::desc("<input.tac>"), cl::Positional, cl::Required);

  cl::list<std::string>
  SimProcedures("sim-procedure",
                cl::desc("Replace a function by a SimProcedure "
                         "(e.g. -sim-procedure=0x1a2=SAFEADD). "
                         "The function is given by id or name"),
                cl::value_desc("function=procedure"),
                cl::cat(ModuleCat));

  cl::opt<bool>
  AutoSimProcedures("auto-sim-procedures",
                    cl::desc("Bind every function whose name is a known "
                             "SimProcedure alias, e.g. safeAdd "
                             "(default=false)"),
                    cl::init(false), cl::cat(ModuleCat));

  cl::opt<bool>
  PrintProgram("print-program",
               cl::desc("Print the program after loading and SimProcedure "
                        "installation (default=false)"),
               cl::init(false), cl::cat(ModuleCat));

  cl::opt<bool>
  PrintModels("print-models",
              cl::desc("Print a model of the symbolic inputs of every "
                       "finished path (default=false)"),
              cl::init(false), cl::cat(ExecCat));

  cl::opt<bool>
  PrintConstraints("print-constraints",
                   cl::desc("Print the path condition of every finished "
                            "path in SMT-LIBv2 form (default=false)"),
                   cl::init(false), cl::cat(ExecCat));

  cl::opt<unsigned long long>
  MaxSteps("max-steps",
           cl::desc("Stop after executing this many statements.  "
                    "Set to 0 to disable (default=0)"),
           cl::init(0), cl::cat(SearchCat));
}

/***/

class TACSymHandler : public InterpreterHandler {
private:
  Interpreter *m_interpreter;
  unsigned m_pathsExplored; // number of paths explored so far
  unsigned m_numTestCases;
  unsigned m_numErrors;

public:
  TACSymHandler()
      : m_interpreter(nullptr), m_pathsExplored(0), m_numTestCases(0),
        m_numErrors(0) {
    tacsym_warning_file = nullptr;
    tacsym_message_file = nullptr;
  }

  void setInterpreter(Interpreter *i) { m_interpreter = i; }

  llvm::raw_ostream &getInfoStream() const override { return llvm::outs(); }
  unsigned getNumTestCases() const { return m_numTestCases; }
  unsigned getNumPathsExplored() const { return m_pathsExplored; }
  unsigned getNumErrors() const { return m_numErrors; }

  void incPathsExplored() override { m_pathsExplored++; }

  void processTestCase(const ExecutionState &state, const char *errorMessage,
                       const char *errorSuffix) override;
};

/* Prints the outcome of one path, with its model and constraints on
   request */
void TACSymHandler::processTestCase(const ExecutionState &state,
                                    const char *errorMessage,
                                    const char *errorSuffix) {
  unsigned id = ++m_numTestCases;
  llvm::raw_ostream &os = getInfoStream();

  os << "path " << id << " (state " << state.getID() << "): ";
  if (state.terminationType > StateTerminationType::EARLY) {
    ++m_numErrors;
    os << getTerminationTypeName(state.terminationType);
  } else if (state.terminationType == StateTerminationType::Pruned ||
             state.terminationType == StateTerminationType::MaxDepth) {
    os << getTerminationTypeName(state.terminationType);
  } else if (state.halt) {
    os << (state.reverted ? "reverted" : "halted");
  } else {
    os << "active";
  }
  if (state.prevPC)
    os << " at " << state.prevPC->id;
  if (errorSuffix && *errorSuffix)
    os << " [" << errorSuffix << "]";
  os << ", " << state.steppedInstructions << " statements, "
     << state.constraints.size() << " constraints ("
     << state.constraints.count(ConstraintProvenance::Safety)
     << " safemath)\n";

  if (errorMessage)
    os << errorMessage;

  if (PrintModels) {
    std::vector<std::pair<std::string, std::string> > out;
    if (!m_interpreter->getSymbolicSolution(state, out)) {
      tacsym_warning("unable to get symbolic solution for path %u", id);
    } else {
      for (const auto &binding : out)
        os << "  " << binding.first << " = " << binding.second << "\n";
    }
  }

  if (PrintConstraints) {
    std::string constraints;
    m_interpreter->getConstraintLog(state, constraints);
    os << constraints << "\n";
  }
}

/***/

static void bindSimProcedures(Interpreter *interpreter) {
  for (const std::string &binding : SimProcedures) {
    std::pair<StringRef, StringRef> split = StringRef(binding).rsplit('=');
    if (split.first.empty() || split.second.empty())
      tacsym_error("invalid -sim-procedure '%s', expected function=procedure",
                   binding.c_str());

    std::string error;
    if (!interpreter->bindSimProcedure(split.first.str(), split.second.str(),
                                       error))
      tacsym_error("-sim-procedure '%s': %s", binding.c_str(), error.c_str());
    tacsym_message("binding %s to %s", split.first.str().c_str(),
                   split.second.str().c_str());
  }

  if (AutoSimProcedures) {
    unsigned bound = interpreter->bindSimProceduresByName();
    tacsym_message("bound %u function(s) to SimProcedures by name", bound);
  }
}

int main(int argc, char **argv) {
  InitLLVM X(argc, argv);

  cl::SetVersionPrinter(tacsym::printVersion);
  cl::ParseCommandLineOptions(argc, argv, " tacsym\n");

  std::string errorMsg;
  std::unique_ptr<TACProgram> program = loadTACFile(InputFile, errorMsg);
  if (!program)
    tacsym_error("error loading program: %s", errorMsg.c_str());

  tacsym_message("loaded %zu functions, %zu blocks",
                 program->getFunctions().size(), program->getBlocks().size());

  Interpreter::InterpreterOptions IOpts;
  IOpts.MaxSteps = MaxSteps;

  std::unique_ptr<TACSymHandler> handler(new TACSymHandler());
  std::unique_ptr<Interpreter> interpreter(
      Interpreter::create(IOpts, handler.get()));
  handler->setInterpreter(interpreter.get());
  interpreter->setProgram(program.get());

  bindSimProcedures(interpreter.get());

  if (PrintProgram)
    program->print(llvm::outs());

  interpreter->run();

  uint64_t queries = stats::queries;
  llvm::raw_ostream &os = handler->getInfoStream();
  os << "TACSym: done: explored paths = " << handler->getNumPathsExplored()
     << "\n"
     << "TACSym: done: completed paths = " << stats::completedPaths << "\n"
     << "TACSym: done: reverted paths = " << stats::revertedPaths << "\n"
     << "TACSym: done: pruned paths = " << stats::prunedPaths << "\n"
     << "TACSym: done: errored paths = " << stats::erroredPaths << "\n";

  // Write some extra information which users won't necessarily care
  // about or understand.
  if (queries)
    os << "TACSym: done: avg. constructs per query = "
       << stats::queryConstructs / queries << "\n";
  os << "TACSym: done: total queries = " << queries << "\n"
     << "TACSym: done: valid queries = " << stats::queriesValid << "\n"
     << "TACSym: done: invalid queries = " << stats::queriesInvalid << "\n"
     << "TACSym: done: query cex = " << stats::queryCounterexamples << "\n"
     << "TACSym: done: query timeouts = " << stats::queryTimeouts << "\n"
     << "TACSym: done: solver time (us) = " << stats::solverTime << "\n"
     << "TACSym: done: total instructions = " << stats::instructions << "\n"
     << "TACSym: done: forks = " << stats::forks << "\n"
     << "TACSym: done: private calls = " << stats::privateCalls << "\n"
     << "TACSym: done: SimProcedure calls = " << stats::simProcedureCalls
     << "\n"
     << "TACSym: done: safemath constraints = " << stats::safetyConstraints
     << "\n";

  return 0;
}
