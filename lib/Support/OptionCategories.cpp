//===-- OptionCategories.cpp ------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Support/OptionCategories.h"

namespace tacsym {
llvm::cl::OptionCategory
    ExecCat("Execution options",
            "These options control how TAC statements are executed.");

llvm::cl::OptionCategory
    ModuleCat("Program loading options",
              "These options control how the TAC program is loaded and "
              "which functions are replaced by SimProcedures.");

llvm::cl::OptionCategory
    SearchCat("Search options",
              "These options control the path scheduler.");

llvm::cl::OptionCategory
    SolvingCat("Constraint solving options",
               "These options impact constraint solving.");
} // namespace tacsym
