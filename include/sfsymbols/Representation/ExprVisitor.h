//===--- ExprVisitor.h - Expr Visitor ---------------------------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//
//
// This file defines the ExprVisitor class.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_EXPRVISITOR_H
#define SFSYMBOLS_REPRESENTATION_EXPRVISITOR_H

#include "sfsymbols/Representation/Expr.h"
#include "llvm/Support/ErrorHandling.h"
#include <utility>

namespace sfsymbols {

/// ExprVisitor - This is a simple visitor class for generated expressions.
///
/// Subclasses implement visitXXXExpr for every concrete expression kind;
/// the dispatch is resolved statically.
template <typename ImplClass, typename RetTy = void, typename... Args>
class ExprVisitor {
public:
  using ExprVisitorTy = ExprVisitor;

  RetTy visit(const Expr *E, Args... AA) {
    switch (E->getKind()) {
#define EXPR(CLASS, PARENT)                                                    \
    case ExprKind::CLASS:                                                      \
      return static_cast<ImplClass *>(this)->visit##CLASS##Expr(               \
          static_cast<const CLASS##Expr *>(E), std::forward<Args>(AA)...);
#include "sfsymbols/Representation/ExprNodes.def"
    }
    llvm_unreachable("Not reachable, all cases handled");
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_EXPRVISITOR_H
