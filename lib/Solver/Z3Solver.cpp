//===-- Z3Solver.cpp -------------------------------------------*- C++ -*-====//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Z3Solver.h"
#include "Z3Builder.h"

#include "tacsym/Expr/Assignment.h"
#include "tacsym/Expr/Constraints.h"
#include "tacsym/Expr/ExprUtil.h"
#include "tacsym/Solver/Solver.h"
#include "tacsym/Solver/SolverImpl.h"
#include "tacsym/Solver/SolverStats.h"
#include "tacsym/Statistics/TimerStatIncrementer.h"
#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/FileHandling.h"
#include "tacsym/Support/OptionCategories.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

#include <climits>
#include <cstring>
#include <memory>

namespace {
llvm::cl::opt<std::string> Z3QueryDumpFile(
    "debug-z3-dump-queries", llvm::cl::init(""),
    llvm::cl::desc("Append every query sent to Z3 to this file, in SMT-LIBv2"),
    llvm::cl::cat(tacsym::SolvingCat));

llvm::cl::opt<bool> Z3ValidateModels(
    "debug-z3-validate-models", llvm::cl::init(false),
    llvm::cl::desc("Evaluate the path constraints under every model Z3 "
                   "returns and abort if one is violated (default=false)"),
    llvm::cl::cat(tacsym::SolvingCat));
} // namespace

namespace tacsym {

namespace {
/// A single satisfiability check against a fresh Z3 solver. Incremental
/// solving is not used: push/pop makes Z3 fall back to a slower engine.
class Z3Check {
  Z3Builder &builder;
  ::Z3_solver solver;
  ::Z3_model model;

public:
  Z3Check(Z3Builder &_builder, ::Z3_params params)
      : builder(_builder), model(nullptr) {
    solver = Z3_mk_solver(builder.ctx);
    Z3_solver_inc_ref(builder.ctx, solver);
    Z3_solver_set_params(builder.ctx, solver, params);
  }

  ~Z3Check() {
    if (model)
      Z3_model_dec_ref(builder.ctx, model);
    Z3_solver_dec_ref(builder.ctx, solver);
  }

  void assertTrue(const ref<Expr> &e) {
    Z3_solver_assert(builder.ctx, solver, builder.construct(e));
  }

  void assertFalse(const ref<Expr> &e) {
    Z3ASTHandle negated(Z3_mk_not(builder.ctx, builder.construct(e)),
                        builder.ctx);
    Z3_solver_assert(builder.ctx, solver, negated);
  }

  ::Z3_lbool check() { return Z3_solver_check(builder.ctx, solver); }

  const char *reasonUnknown() {
    return Z3_solver_get_reason_unknown(builder.ctx, solver);
  }

  void print(llvm::raw_ostream &os, bool wantModel) {
    os << "; start Z3 query\n"
       << Z3_solver_to_string(builder.ctx, solver) << "(check-sat)\n";
    if (wantModel)
      os << "(get-model)\n";
    os << "; end Z3 query\n\n";
  }

  /// Read the value of each symbol from the model of a satisfiable check.
  bool readModel(const std::vector<const SymbolExpr *> &objects,
                 std::vector<llvm::APInt> &values);
};

bool Z3Check::readModel(const std::vector<const SymbolExpr *> &objects,
                        std::vector<llvm::APInt> &values) {
  if (!model) {
    model = Z3_solver_get_model(builder.ctx, solver);
    if (!model) {
      tacsym_warning("Z3 reported sat but returned no model");
      return false;
    }
    Z3_model_inc_ref(builder.ctx, model);
  }

  values.clear();
  values.reserve(objects.size());
  for (const SymbolExpr *se : objects) {
    ::Z3_ast raw;
    if (!Z3_model_eval(builder.ctx, model, builder.getSymbolHandle(se),
                       /*model_completion=*/true, &raw)) {
      tacsym_warning("Z3 could not evaluate symbol %s in its model",
                     se->name.c_str());
      return false;
    }
    Z3ASTHandle value(raw, builder.ctx);

    if (se->getWidth() == Expr::Bool) {
      bool isTrue = Z3_get_bool_value(builder.ctx, value) == Z3_L_TRUE;
      values.push_back(llvm::APInt(1, isTrue ? 1 : 0));
      continue;
    }

    llvm::StringRef digits(Z3_get_numeral_string(builder.ctx, value));
    llvm::APInt result;
    if (digits.getAsInteger(10, result)) {
      tacsym_warning("Z3 returned a malformed numeral \"%s\" for %s",
                     digits.str().c_str(), se->name.c_str());
      return false;
    }
    values.push_back(result.zextOrTrunc(se->getWidth()));
  }
  return true;
}
} // namespace

class Z3SolverImpl : public SolverImpl {
private:
  Z3Builder builder;
  ::Z3_params solverParameters;
  SolverRunStatus runStatusCode;
  std::unique_ptr<llvm::raw_fd_ostream> dumpedQueriesFile;

  bool internalRunSolver(const Query &,
                         const std::vector<const SymbolExpr *> *objects,
                         std::vector<llvm::APInt> *values,
                         bool &hasSolution);
  SolverRunStatus classifyUnknown(const char *reason);
  void validateModel(const Query &query, Z3Check &check);

public:
  Z3SolverImpl();
  ~Z3SolverImpl();

  char *getConstraintLog(const Query &);
  void setCoreSolverTimeout(unsigned timeoutMs);

  bool computeTruth(const Query &, bool &isValid);
  bool computeValue(const Query &, ref<Expr> &result);
  bool computeInitialValues(const Query &,
                            const std::vector<const SymbolExpr *> &objects,
                            std::vector<llvm::APInt> &values,
                            bool &hasSolution);
  SolverRunStatus getOperationStatusCode() { return runStatusCode; }
};

Z3SolverImpl::Z3SolverImpl()
    : builder(/*autoClearConstructCache=*/false),
      runStatusCode(SOLVER_RUN_STATUS_FAILURE) {
  solverParameters = Z3_mk_params(builder.ctx);
  Z3_params_inc_ref(builder.ctx, solverParameters);
  setCoreSolverTimeout(0);

  if (!Z3QueryDumpFile.empty()) {
    std::string error;
    dumpedQueriesFile = tacsym_open_output_file(Z3QueryDumpFile, error);
    if (!dumpedQueriesFile)
      tacsym_error("Error creating file for dumping Z3 queries: %s",
                   error.c_str());
    tacsym_message("Dumping Z3 queries to \"%s\"", Z3QueryDumpFile.c_str());
  }
}

Z3SolverImpl::~Z3SolverImpl() {
  Z3_params_dec_ref(builder.ctx, solverParameters);
}

void Z3SolverImpl::setCoreSolverTimeout(unsigned timeoutMs) {
  ::Z3_symbol timeout = Z3_mk_string_symbol(builder.ctx, "timeout");
  Z3_params_set_uint(builder.ctx, solverParameters, timeout,
                     timeoutMs ? timeoutMs : UINT_MAX);
}

Z3Solver::Z3Solver() : Solver(new Z3SolverImpl()) {}

char *Z3Solver::getConstraintLog(const Query &query) {
  return impl->getConstraintLog(query);
}

void Z3Solver::setCoreSolverTimeout(unsigned timeoutMs) {
  impl->setCoreSolverTimeout(timeoutMs);
}

char *Z3SolverImpl::getConstraintLog(const Query &query) {
  // A private builder keeps the solver's term cache untouched.
  Z3Builder logBuilder(/*autoClearConstructCache=*/false);
  std::vector<Z3ASTHandle> assumptions;
  for (const Constraint &constraint : query.constraints)
    assumptions.push_back(logBuilder.construct(constraint.expr));
  std::vector<::Z3_ast> rawAssumptions(assumptions.begin(), assumptions.end());

  // The log states the satisfiability form of the validity query:
  // constraints /\ !expr.
  Z3ASTHandle formula(Z3_mk_not(logBuilder.ctx, logBuilder.construct(query.expr)),
                      logBuilder.ctx);

  ::Z3_string log = Z3_benchmark_to_smtlib_string(
      logBuilder.ctx, /*name=*/"tacsym path condition", /*logic=*/"",
      /*status=*/"unknown", /*attributes=*/"",
      static_cast<unsigned>(rawAssumptions.size()), rawAssumptions.data(),
      formula);

  // The string belongs to logBuilder's context.
  return strdup(log);
}

bool Z3SolverImpl::computeTruth(const Query &query, bool &isValid) {
  bool hasSolution = false;
  if (!internalRunSolver(query, nullptr, nullptr, hasSolution))
    return false;
  isValid = !hasSolution;
  return true;
}

bool Z3SolverImpl::computeValue(const Query &query, ref<Expr> &result) {
  std::vector<const SymbolExpr *> objects;
  std::vector<llvm::APInt> values;
  bool hasSolution = false;

  findSymbols(query.expr, objects);
  if (!computeInitialValues(query.withFalse(), objects, values, hasSolution))
    return false;
  if (!hasSolution) {
    tacsym_warning("computeValue: the constraint set is unsatisfiable");
    return false;
  }

  result = Assignment(objects, values).evaluate(query.expr);
  return true;
}

bool Z3SolverImpl::computeInitialValues(
    const Query &query, const std::vector<const SymbolExpr *> &objects,
    std::vector<llvm::APInt> &values, bool &hasSolution) {
  return internalRunSolver(query, &objects, &values, hasSolution);
}

bool Z3SolverImpl::internalRunSolver(
    const Query &query, const std::vector<const SymbolExpr *> *objects,
    std::vector<llvm::APInt> *values, bool &hasSolution) {
  TimerStatIncrementer t(stats::queryTime);
  ++stats::queries;
  if (objects)
    ++stats::queryCounterexamples;

  runStatusCode = SOLVER_RUN_STATUS_FAILURE;
  {
    Z3Check check(builder, solverParameters);
    for (const Constraint &constraint : query.constraints)
      check.assertTrue(constraint.expr);
    // Validity of expr is unsatisfiability of its negation.
    check.assertFalse(query.expr);

    if (dumpedQueriesFile) {
      check.print(*dumpedQueriesFile, objects != nullptr);
      dumpedQueriesFile->flush();
    }

    switch (check.check()) {
    case Z3_L_TRUE:
      hasSolution = true;
      runStatusCode = SOLVER_RUN_STATUS_SUCCESS_SOLVABLE;
      if (objects && !check.readModel(*objects, *values))
        runStatusCode = SOLVER_RUN_STATUS_FAILURE;
      else if (Z3ValidateModels)
        validateModel(query, check);
      break;
    case Z3_L_FALSE:
      hasSolution = false;
      runStatusCode = SOLVER_RUN_STATUS_SUCCESS_UNSOLVABLE;
      break;
    case Z3_L_UNDEF:
      runStatusCode = classifyUnknown(check.reasonUnknown());
      break;
    }
  }
  LOG_SOLVER_TIME("Z3 query took %llu us", (unsigned long long)t.delta());

  // Terms are shared within one query only.
  builder.clearConstructCache();

  if (runStatusCode == SOLVER_RUN_STATUS_SUCCESS_SOLVABLE)
    ++stats::queriesInvalid;
  else if (runStatusCode == SOLVER_RUN_STATUS_SUCCESS_UNSOLVABLE)
    ++stats::queriesValid;
  else
    return false;
  return true;
}

SolverImpl::SolverRunStatus Z3SolverImpl::classifyUnknown(const char *reason) {
  if (strcmp(reason, "timeout") == 0 || strcmp(reason, "canceled") == 0 ||
      strcmp(reason, "(resource limits reached)") == 0) {
    ++stats::queryTimeouts;
    return SOLVER_RUN_STATUS_TIMEOUT;
  }
  if (strcmp(reason, "interrupted from keyboard") == 0)
    return SOLVER_RUN_STATUS_INTERRUPTED;
  if (strcmp(reason, "unknown") != 0)
    tacsym_warning("Unexpected solver failure. Reason is \"%s\"", reason);
  return SOLVER_RUN_STATUS_FAILURE;
}

void Z3SolverImpl::validateModel(const Query &query, Z3Check &check) {
  std::vector<ref<Expr> > exprs = query.constraints.getExprs();
  exprs.push_back(query.expr);
  std::vector<const SymbolExpr *> symbols;
  findSymbols(exprs, symbols);

  std::vector<llvm::APInt> values;
  if (!check.readModel(symbols, values))
    tacsym_error("Z3 model could not be read back for validation");

  Assignment model(symbols, values);
  if (!model.satisfies(query.constraints)) {
    model.dump();
    tacsym_error("Z3 produced a model that violates the path constraints");
  }
  if (model.evaluate(query.expr)->isTrue()) {
    model.dump();
    tacsym_error("Z3 produced a model in which the query holds");
  }
}

} // namespace tacsym
