//===--- DeclVisitor.h - Decl Visitor ---------------------------*- C++ -*-===//
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
// This file defines the DeclVisitor class.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_DECLVISITOR_H
#define SFSYMBOLS_REPRESENTATION_DECLVISITOR_H

#include "sfsymbols/Representation/Decl.h"
#include "llvm/Support/ErrorHandling.h"
#include <utility>

namespace sfsymbols {

/// DeclVisitor - This is a simple visitor class for generated declarations.
///
/// Subclasses implement visitXXXDecl for every concrete declaration kind;
/// the dispatch is resolved statically.
template <typename ImplClass, typename RetTy = void, typename... Args>
class DeclVisitor {
public:
  using DeclVisitorTy = DeclVisitor;

  RetTy visit(const Decl *D, Args... AA) {
    switch (D->getKind()) {
#define DECL(CLASS, PARENT)                                                    \
    case DeclKind::CLASS:                                                      \
      return static_cast<ImplClass *>(this)->visit##CLASS##Decl(               \
          static_cast<const CLASS##Decl *>(D), std::forward<Args>(AA)...);
#include "sfsymbols/Representation/DeclNodes.def"
    }
    llvm_unreachable("Not reachable, all cases handled");
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_DECLVISITOR_H
