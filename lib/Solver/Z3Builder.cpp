//===-- Z3Builder.cpp ------------------------------------------*- C++ -*-====//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "Z3Builder.h"

#include "tacsym/Expr/Expr.h"
#include "tacsym/Solver/SolverStats.h"
#include "tacsym/Support/ErrorHandling.h"
#include "tacsym/Support/OptionCategories.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

#include <cstring>

using namespace tacsym;

namespace {
llvm::cl::opt<bool> UseConstructHashZ3(
    "use-construct-hash-z3",
    llvm::cl::desc("Reuse the Z3 term of a subexpression already translated "
                   "for the current query (default=true)"),
    llvm::cl::init(true),
    llvm::cl::cat(tacsym::SolvingCat));

typedef ::Z3_ast (*Z3BinaryBuilder)(::Z3_context, ::Z3_ast, ::Z3_ast);

void handleZ3Error(Z3_context ctx, Z3_error_code ec) {
  ::Z3_string errorMsg = Z3_get_error_msg(ctx, ec);
  // Raised when a query hits its timeout; the check reports it as unknown.
  if (strcmp(errorMsg, "canceled") == 0)
    return;
  tacsym_error("Incorrect use of Z3. [%d] %s", static_cast<int>(ec), errorMsg);
}
} // namespace

namespace tacsym {

template <> void Z3NodeHandle<Z3_sort>::dump() const {
  llvm::errs() << "Z3SortHandle:\n" << ::Z3_sort_to_string(context, node)
               << "\n";
}

template <> void Z3NodeHandle<Z3_ast>::dump() const {
  llvm::errs() << "Z3ASTHandle:\n" << ::Z3_ast_to_string(context, node)
               << "\n";
}

Z3Builder::Z3Builder(bool autoClearConstructCache)
    : autoClearConstructCache(autoClearConstructCache) {
  Z3_config cfg = Z3_mk_config();
  // Terms are cached across calls, so Z3 must not collect them behind our
  // back.
  ctx = Z3_mk_context_rc(cfg);
  Z3_del_config(cfg);
  Z3_set_error_handler(ctx, handleZ3Error);
  Z3_set_ast_print_mode(ctx, Z3_PRINT_SMTLIB2_COMPLIANT);
}

Z3Builder::~Z3Builder() {
  // Every handle has to be released before its context goes away.
  clearConstructCache();
  symbols.clear();
  Z3_del_context(ctx);
}

Z3SortHandle Z3Builder::sortFor(Expr::Width width) {
  if (width == Expr::Bool)
    return Z3SortHandle(Z3_mk_bool_sort(ctx), ctx);
  return Z3SortHandle(Z3_mk_bv_sort(ctx, width), ctx);
}

Z3ASTHandle Z3Builder::bvConstant(const llvm::APInt &value) {
  Z3SortHandle sort = sortFor(value.getBitWidth());
  if (value.getActiveBits() <= 64)
    return wrap(Z3_mk_unsigned_int64(ctx, value.getZExtValue(), sort));

  llvm::SmallString<80> digits;
  value.toString(digits, 10, /*Signed=*/false);
  return wrap(Z3_mk_numeral(ctx, digits.c_str(), sort));
}

Z3ASTHandle Z3Builder::getSymbolHandle(const SymbolExpr *se) {
  std::map<std::string, Z3ASTHandle>::iterator it = symbols.find(se->name);
  if (it != symbols.end())
    return it->second;

  Z3_symbol name = Z3_mk_string_symbol(ctx, se->name.c_str());
  Z3ASTHandle res = wrap(Z3_mk_const(ctx, name, sortFor(se->getWidth())));
  symbols.insert(std::make_pair(se->name, res));
  return res;
}

Z3ASTHandle Z3Builder::constructCached(const ref<Expr> &e) {
  if (!UseConstructHashZ3 || isa<ConstantExpr>(e))
    return constructActual(e);

  ExprHashMap<Z3ASTHandle>::iterator it = constructed.find(e);
  if (it != constructed.end())
    return it->second;

  Z3ASTHandle res = constructActual(e);
  constructed.insert(std::make_pair(e, res));
  return res;
}

Z3ASTHandle Z3Builder::constructActual(const ref<Expr> &e) {
  ++stats::queryConstructs;

  switch (e->getKind()) {
  case Expr::Constant: {
    ConstantExpr *CE = cast<ConstantExpr>(e);
    if (CE->getWidth() == Expr::Bool)
      return wrap(CE->isTrue() ? Z3_mk_true(ctx) : Z3_mk_false(ctx));
    return bvConstant(CE->getAPValue());
  }

  case Expr::Symbol:
    return getSymbolHandle(cast<SymbolExpr>(e));

  case Expr::Select: {
    SelectExpr *se = cast<SelectExpr>(e);
    Z3ASTHandle cond = constructCached(se->cond);
    Z3ASTHandle whenTrue = constructCached(se->trueExpr);
    Z3ASTHandle whenFalse = constructCached(se->falseExpr);
    return wrap(Z3_mk_ite(ctx, cond, whenTrue, whenFalse));
  }

  case Expr::ZExt: {
    ZExtExpr *ze = cast<ZExtExpr>(e);
    Z3ASTHandle src = constructCached(ze->src);
    Expr::Width srcWidth = ze->src->getWidth();
    Expr::Width width = ze->getWidth();
    if (srcWidth == Expr::Bool) {
      Z3ASTHandle one = bvConstant(llvm::APInt(width, 1));
      Z3ASTHandle zero = bvConstant(llvm::APInt(width, 0));
      return wrap(Z3_mk_ite(ctx, src, one, zero));
    }
    return wrap(Z3_mk_zero_ext(ctx, width - srcWidth, src));
  }

  case Expr::Not: {
    NotExpr *ne = cast<NotExpr>(e);
    Z3ASTHandle src = constructCached(ne->expr);
    if (ne->getWidth() == Expr::Bool)
      return wrap(Z3_mk_not(ctx, src));
    return wrap(Z3_mk_bvnot(ctx, src));
  }

  default:
    break;
  }

  BinaryExpr *be = dyn_cast<BinaryExpr>(e);
  if (!be)
    tacsym_error("Z3Builder: unhandled expression kind %d",
                 static_cast<int>(e->getKind()));
  Z3ASTHandle left = constructCached(be->left);
  Z3ASTHandle right = constructCached(be->right);
  return constructBinary(e->getKind(), be->left->getWidth(), left, right);
}

Z3ASTHandle Z3Builder::constructBinary(Expr::Kind kind,
                                       Expr::Width operandWidth,
                                       const Z3ASTHandle &left,
                                       const Z3ASTHandle &right) {
  if (kind == Expr::Eq)
    return wrap(Z3_mk_eq(ctx, left, right));
  if (kind == Expr::Ne)
    return wrap(Z3_mk_not(ctx, wrap(Z3_mk_eq(ctx, left, right))));

  if (operandWidth == Expr::Bool) {
    ::Z3_ast args[2] = {left, right};
    switch (kind) {
    case Expr::And:
      return wrap(Z3_mk_and(ctx, 2, args));
    case Expr::Or:
      return wrap(Z3_mk_or(ctx, 2, args));
    case Expr::Xor:
      return wrap(Z3_mk_xor(ctx, left, right));
    default:
      tacsym_error("Z3Builder: expression kind %d is not defined on booleans",
                   static_cast<int>(kind));
    }
  }

  Z3BinaryBuilder build = nullptr;
  switch (kind) {
  case Expr::Add:  build = Z3_mk_bvadd; break;
  case Expr::Sub:  build = Z3_mk_bvsub; break;
  case Expr::Mul:  build = Z3_mk_bvmul; break;
  case Expr::UDiv: build = Z3_mk_bvudiv; break;
  case Expr::URem: build = Z3_mk_bvurem; break;
  case Expr::And:  build = Z3_mk_bvand; break;
  case Expr::Or:   build = Z3_mk_bvor; break;
  case Expr::Xor:  build = Z3_mk_bvxor; break;
  // Both shifts yield zero once the amount reaches the width.
  case Expr::Shl:  build = Z3_mk_bvshl; break;
  case Expr::LShr: build = Z3_mk_bvlshr; break;
  case Expr::Ult:  build = Z3_mk_bvult; break;
  case Expr::Ule:  build = Z3_mk_bvule; break;
  case Expr::Ugt:  build = Z3_mk_bvugt; break;
  case Expr::Uge:  build = Z3_mk_bvuge; break;
  default:
    tacsym_error("Z3Builder: unhandled binary expression kind %d",
                 static_cast<int>(kind));
  }
  return wrap(build(ctx, left, right));
}

} // namespace tacsym
