//===--- TextRenderer.h - Render generated code as Swift text ---*- C++ -*-===//
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
// This file declares the TextRenderer, which serializes declarations and
// expressions into consistently indented Swift source.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_RENDER_TEXTRENDERER_H
#define SFSYMBOLS_RENDER_TEXTRENDERER_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Render/CodeWriter.h"
#include "sfsymbols/Representation/DeclVisitor.h"
#include "sfsymbols/Representation/ExprVisitor.h"
#include "sfsymbols/Representation/File.h"
#include <optional>
#include <string>

namespace sfsymbols {

/// Writes declarations and expressions to a CodeWriter.
///
/// Every render function leaves the writer at the nesting level it started
/// at. Rendering is total over well-formed trees.
class TextRenderer : public DeclVisitor<TextRenderer>,
                     public ExprVisitor<TextRenderer> {
  CodeWriter &Writer;

  friend DeclVisitor<TextRenderer>;
  friend ExprVisitor<TextRenderer>;

public:
  explicit TextRenderer(CodeWriter &writer) : Writer(writer) {}

  /// Render a whole file: the top comment, the imports followed by a blank
  /// line, and every code block followed by a blank line.
  void renderFile(const FileDescription &file);

  void renderComment(const Comment &comment);
  void renderImports(ArrayRef<ImportDescription> imports);
  void renderImport(const ImportDescription &import);
  void renderCodeBlock(const CodeBlock &block);
  void renderCodeBlocks(ArrayRef<CodeBlock> blocks);
  void renderDecl(const Decl *D) { DeclVisitor::visit(D); }
  void renderExpr(const Expr *E) { ExprVisitor::visit(E); }
  void renderAttr(const AvailableAttr &attr);

private:
  void renderAccessPrefix(std::optional<AccessModifier> access);
  void renderNominalTypeDecl(const NominalTypeDecl *D, StringRef keyword);
  /// Renders the indented members of a braced declaration, optionally with
  /// an empty line between consecutive members.
  void renderMembers(ArrayRef<DeclPtr> members, bool separateWithEmptyLine);
  void renderCallArgument(const CallArgument &arg);
  void renderCall(const CallExpr *E);
  void renderParameter(const FunctionParameter &param);
  void renderSwitchCase(const SwitchCase &switchCase);
  void renderBracedBody(ArrayRef<CodeBlock> body);

  void visitCommentableDecl(const CommentableDecl *D);
  void visitAttributedDecl(const AttributedDecl *D);
  void visitVarDecl(const VarDecl *D);
  void visitExtensionDecl(const ExtensionDecl *D);
  void visitStructDecl(const StructDecl *D);
  void visitProtocolDecl(const ProtocolDecl *D);
  void visitEnumDecl(const EnumDecl *D);
  void visitTypeAliasDecl(const TypeAliasDecl *D);
  void visitFuncDecl(const FuncDecl *D);
  void visitEnumCaseDecl(const EnumCaseDecl *D);
  void visitIfConfigDecl(const IfConfigDecl *D);

  void visitStringLiteralExpr(const StringLiteralExpr *E);
  void visitIntegerLiteralExpr(const IntegerLiteralExpr *E);
  void visitFloatLiteralExpr(const FloatLiteralExpr *E);
  void visitBooleanLiteralExpr(const BooleanLiteralExpr *E);
  void visitNilLiteralExpr(const NilLiteralExpr *E);
  void visitArrayLiteralExpr(const ArrayLiteralExpr *E);
  void visitIdentifierExpr(const IdentifierExpr *E);
  void visitTypeExpr(const TypeExpr *E);
  void visitMemberAccessExpr(const MemberAccessExpr *E);
  void visitCallExpr(const CallExpr *E);
  void visitAssignExpr(const AssignExpr *E);
  void visitSwitchExpr(const SwitchExpr *E);
  void visitIfExpr(const IfExpr *E);
  void visitDoExpr(const DoExpr *E);
  void visitValueBindingExpr(const ValueBindingExpr *E);
  void visitUnaryKeywordExpr(const UnaryKeywordExpr *E);
  void visitClosureExpr(const ClosureExpr *E);
  void visitBinaryExpr(const BinaryExpr *E);
  void visitInOutExpr(const InOutExpr *E);
  void visitOptionalChainExpr(const OptionalChainExpr *E);
  void visitForceValueExpr(const ForceValueExpr *E);
  void visitTupleExpr(const TupleExpr *E);
};

/// Render \p file to a string.
std::string renderFile(const FileDescription &file);

/// Render the file made of \p blocks, preceded by \p imports and
/// \p topComment.
std::string render(CodeBlocks blocks, ArrayRef<ImportDescription> imports,
                   std::optional<Comment> topComment = std::nullopt);

/// Render a single declaration to a string.
std::string renderDeclAsString(const Decl *D);

/// Render a single expression to a string.
std::string renderExprAsString(const Expr *E);

} // end namespace sfsymbols

#endif // SFSYMBOLS_RENDER_TEXTRENDERER_H
