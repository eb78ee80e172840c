//===--- CodeBlock.cpp - A commented declaration or expression ------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Representation/CodeBlock.h"
#include "sfsymbols/Representation/Decl.h"
#include "sfsymbols/Representation/Expr.h"
#include <cassert>

using namespace sfsymbols;

CodeBlock::CodeBlock(std::optional<Comment> comment, DeclPtr decl,
                     ExprPtr expr)
    : TheComment(std::move(comment)), TheDecl(std::move(decl)),
      TheExpr(std::move(expr)) {
  assert((TheDecl != nullptr) != (TheExpr != nullptr) &&
         "code block holds exactly one item");
}

CodeBlock CodeBlock::get(DeclPtr decl, std::optional<Comment> comment) {
  return CodeBlock(std::move(comment), std::move(decl), nullptr);
}

CodeBlock CodeBlock::get(ExprPtr expr, std::optional<Comment> comment) {
  return CodeBlock(std::move(comment), nullptr, std::move(expr));
}

CodeBlock::CodeBlock(CodeBlock &&) = default;
CodeBlock &CodeBlock::operator=(CodeBlock &&) = default;
CodeBlock::~CodeBlock() = default;
