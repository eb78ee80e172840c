//===--- CodeBlock.h - A commented declaration or expression ----*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_CODEBLOCK_H
#define SFSYMBOLS_REPRESENTATION_CODEBLOCK_H

#include "sfsymbols/Representation/Comment.h"
#include <memory>
#include <optional>
#include <vector>

namespace sfsymbols {

class Decl;
class Expr;

using DeclPtr = std::unique_ptr<Decl>;
using ExprPtr = std::unique_ptr<Expr>;

/// One item of a body or a file: exactly one declaration or expression,
/// optionally preceded by a comment.
class CodeBlock {
  std::optional<Comment> TheComment;
  DeclPtr TheDecl;
  ExprPtr TheExpr;

  CodeBlock(std::optional<Comment> comment, DeclPtr decl, ExprPtr expr);

public:
  static CodeBlock get(DeclPtr decl,
                       std::optional<Comment> comment = std::nullopt);
  static CodeBlock get(ExprPtr expr,
                       std::optional<Comment> comment = std::nullopt);

  CodeBlock(CodeBlock &&);
  CodeBlock &operator=(CodeBlock &&);
  ~CodeBlock();

  const std::optional<Comment> &getComment() const { return TheComment; }

  /// The declaration, or null if this block holds an expression.
  const Decl *getDecl() const { return TheDecl.get(); }

  /// The expression, or null if this block holds a declaration.
  const Expr *getExpr() const { return TheExpr.get(); }
};

using CodeBlocks = std::vector<CodeBlock>;

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_CODEBLOCK_H
