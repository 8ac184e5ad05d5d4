//===-- Constraints.cpp ---------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Expr/Constraints.h"

#include "tacsym/Expr/ExprHashMap.h"
#include "tacsym/Expr/ExprUtil.h"

using namespace tacsym;

const char *tacsym::getProvenanceName(ConstraintProvenance provenance) {
  switch (provenance) {
  case ConstraintProvenance::Program:
    return "program";
  case ConstraintProvenance::Safety:
    return "safemath";
  }
  return "unknown";
}

ref<Expr> ConstraintManager::simplifyExpr(const ConstraintSet &constraints,
                                          const ref<Expr> &e) {

  if (isa<ConstantExpr>(e))
    return e;

  ExprHashMap<ref<Expr> > equalities;

  for (auto &constraint : constraints) {
    const ref<Expr> &c = constraint.expr;
    if (const EqExpr *ee = dyn_cast<EqExpr>(c)) {
      if (isa<ConstantExpr>(ee->left)) {
        equalities.insert(std::make_pair(ee->right, ee->left));
        continue;
      }
      if (isa<ConstantExpr>(ee->right)) {
        equalities.insert(std::make_pair(ee->left, ee->right));
        continue;
      }
    }
    equalities.insert(std::make_pair(c, Expr::createTrue()));
  }

  return replaceSubExprs(e, equalities);
}

void ConstraintManager::addConstraintInternal(const ref<Expr> &e,
                                              ConstraintProvenance provenance) {
  switch (e->getKind()) {
  case Expr::Constant:
    // A false constraint is kept: it makes the set unsatisfiable.
    if (!cast<ConstantExpr>(e)->isTrue())
      constraints.push_back(e, provenance);
    break;

    // split to enable finer grained independence and other optimizations
  case Expr::And: {
    if (e->getWidth() == Expr::Bool) {
      BinaryExpr *be = cast<BinaryExpr>(e);
      addConstraintInternal(be->left, provenance);
      addConstraintInternal(be->right, provenance);
      break;
    }
    constraints.push_back(e, provenance);
    break;
  }

  default:
    constraints.push_back(e, provenance);
    break;
  }
}

void ConstraintManager::addConstraint(const ref<Expr> &e,
                                      ConstraintProvenance provenance) {
  assert(e->getWidth() == Expr::Bool && "constraint must be a boolean");
  addConstraintInternal(e, provenance);
}

ConstraintManager::ConstraintManager(ConstraintSet &_constraints)
    : constraints(_constraints) {}

bool ConstraintSet::empty() const { return constraints.empty(); }

tacsym::ConstraintSet::constraint_iterator ConstraintSet::begin() const {
  return constraints.begin();
}

tacsym::ConstraintSet::constraint_iterator ConstraintSet::end() const {
  return constraints.end();
}

size_t ConstraintSet::size() const noexcept { return constraints.size(); }

size_t ConstraintSet::count(ConstraintProvenance provenance) const {
  size_t n = 0;
  for (const auto &c : constraints)
    if (c.provenance == provenance)
      ++n;
  return n;
}

std::vector<ref<Expr> > ConstraintSet::getExprs() const {
  std::vector<ref<Expr> > res;
  res.reserve(constraints.size());
  for (const auto &c : constraints)
    res.push_back(c.expr);
  return res;
}

void ConstraintSet::push_back(const ref<Expr> &e,
                              ConstraintProvenance provenance) {
  constraints.emplace_back(e, provenance);
}

bool ConstraintSet::operator==(const ConstraintSet &b) const {
  if (constraints.size() != b.constraints.size())
    return false;
  for (size_t i = 0, e = constraints.size(); i != e; ++i)
    if (constraints[i].provenance != b.constraints[i].provenance ||
        constraints[i].expr != b.constraints[i].expr)
      return false;
  return true;
}
