//===--- Decl.cpp - Declarations of generated code ------------------------===//
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
//  This file implements the Decl class and subclasses.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/Decl.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/ErrorHandling.h"

using namespace sfsymbols;

Decl::~Decl() = default;

StringRef Decl::getKindName(DeclKind K) {
  switch (K) {
#define DECL(Id, Parent) case DeclKind::Id: return #Id;
#include "sfsymbols/Representation/DeclNodes.def"
  }
  llvm_unreachable("bad DeclKind");
}

const Decl *Decl::getUnwrapped() const {
  const Decl *D = this;
  while (auto *wrapper = dyn_cast<WrapperDecl>(D))
    D = wrapper->getInner();
  return D;
}

StringRef sfsymbols::getAccessModifierSpelling(AccessModifier access) {
  switch (access) {
  case AccessModifier::Public: return "public";
  case AccessModifier::Package: return "package";
  case AccessModifier::Internal: return "internal";
  case AccessModifier::FilePrivate: return "fileprivate";
  case AccessModifier::Private: return "private";
  }
  llvm_unreachable("bad AccessModifier");
}

std::unique_ptr<VarDecl> VarDecl::create(std::optional<AccessModifier> access,
                                         bool isStatic, BindingKind binding,
                                         StringRef name,
                                         std::optional<ExistingType> type) {
  return std::make_unique<VarDecl>(access, isStatic, binding,
                                   IdentifierExpr::create(name),
                                   std::move(type));
}

bool EnumDecl::requiresFrozenAttr() const {
  if (!IsFrozen)
    return false;
  auto access = getAccess();
  return access && (*access == AccessModifier::Public ||
                    *access == AccessModifier::Package);
}

std::unique_ptr<FuncDecl>
FuncDecl::createInit(std::optional<AccessModifier> access, bool isFailable,
                     std::vector<FunctionParameter> params) {
  auto FD = std::make_unique<FuncDecl>(access, Kind::Initializer, "init",
                                       std::move(params));
  FD->IsFailable = isFailable;
  return FD;
}

std::unique_ptr<FuncDecl>
FuncDecl::createFunc(std::optional<AccessModifier> access, StringRef name,
                     bool isStatic, std::vector<FunctionParameter> params) {
  auto FD = std::make_unique<FuncDecl>(access, Kind::Function, name,
                                       std::move(params));
  FD->IsStatic = isStatic;
  return FD;
}

std::unique_ptr<IfConfigDecl>
IfConfigDecl::create(std::vector<IfConfigClause> clauses) {
  assert(!clauses.empty() && clauses.front().Condition &&
         "#if block must start with a condition");
  assert(llvm::all_of(llvm::makeArrayRef(clauses).drop_front(),
                      [&](const IfConfigClause &clause) {
                        return !clause.isElse() ||
                               &clause == &clauses.back();
                      }) &&
         "#else must be the last clause");
  return std::make_unique<IfConfigDecl>(std::move(clauses));
}

std::unique_ptr<IfConfigDecl> IfConfigDecl::create(StringRef condition,
                                                   CodeBlocks elements) {
  std::vector<IfConfigClause> clauses;
  clauses.emplace_back(condition.str(), std::move(elements));
  return create(std::move(clauses));
}
