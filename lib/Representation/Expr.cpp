//===--- Expr.cpp - Expressions of generated code -------------------------===//
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
//  This file implements the Expr class and subclasses.
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/Expr.h"
#include "llvm/Support/ErrorHandling.h"
#include <cassert>

using namespace sfsymbols;

Expr::~Expr() = default;

StringRef Expr::getKindName(ExprKind K) {
  switch (K) {
#define EXPR(Id, Parent) case ExprKind::Id: return #Id;
#include "sfsymbols/Representation/ExprNodes.def"
  }
  llvm_unreachable("bad ExprKind");
}

StringRef sfsymbols::getBindingKindSpelling(BindingKind kind) {
  switch (kind) {
  case BindingKind::Var: return "var";
  case BindingKind::Let: return "let";
  }
  llvm_unreachable("bad BindingKind");
}

StringRef sfsymbols::getFunctionKeywordSpelling(FunctionKeyword keyword) {
  switch (keyword) {
  case FunctionKeyword::Throws: return "throws";
  case FunctionKeyword::Async: return "async";
  }
  llvm_unreachable("bad FunctionKeyword");
}

StringRef sfsymbols::getKeywordKindSpelling(KeywordKind kind) {
  switch (kind) {
  case KeywordKind::Return: return "return";
  case KeywordKind::Try: return "try";
  case KeywordKind::TryOptional: return "try?";
  case KeywordKind::Await: return "await";
  case KeywordKind::Throw: return "throw";
  case KeywordKind::Yield: return "yield";
  }
  llvm_unreachable("bad KeywordKind");
}

StringRef sfsymbols::getBinaryOperatorSpelling(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::Plus: return "+";
  case BinaryOperator::Minus: return "-";
  case BinaryOperator::Equals: return "==";
  case BinaryOperator::NotEquals: return "!=";
  case BinaryOperator::LessThan: return "<";
  case BinaryOperator::GreaterThan: return ">";
  case BinaryOperator::ClosedRange: return "...";
  case BinaryOperator::HalfOpenRange: return "..<";
  case BinaryOperator::NilCoalescing: return "??";
  case BinaryOperator::BooleanAnd: return "&&";
  case BinaryOperator::BooleanOr: return "||";
  case BinaryOperator::PlusEquals: return "+=";
  }
  llvm_unreachable("bad BinaryOperator");
}

SwitchCase SwitchCase::getCase(ExprPtr pattern,
                               ArrayRef<std::string> associatedValueNames,
                               CodeBlocks body) {
  SwitchCase result{Kind::Case, {}, {}, std::move(body)};
  result.Patterns.push_back(std::move(pattern));
  result.AssociatedValueNames.assign(associatedValueNames.begin(),
                                     associatedValueNames.end());
  return result;
}

SwitchCase SwitchCase::getMultiCase(std::vector<ExprPtr> patterns,
                                    CodeBlocks body) {
  assert(!patterns.empty() && "case needs at least one pattern");
  return SwitchCase{Kind::MultiCase, std::move(patterns), {}, std::move(body)};
}

SwitchCase SwitchCase::getDefault(CodeBlocks body) {
  return SwitchCase{Kind::Default, {}, {}, std::move(body)};
}

std::unique_ptr<IfExpr> IfExpr::create(std::vector<IfBranch> branches,
                                       std::optional<CodeBlocks> elseBody) {
  assert(!branches.empty() && "if expression needs an if branch");
  return std::make_unique<IfExpr>(std::move(branches), std::move(elseBody));
}
