//===--- TextRenderer.cpp - Render generated code as Swift text -----------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Render/TextRenderer.h"
#include "sfsymbols/Basic/QuotedString.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"
#include <cassert>

using namespace sfsymbols;

//===----------------------------------------------------------------------===//
// Files and comments
//===----------------------------------------------------------------------===//

void TextRenderer::renderFile(const FileDescription &file) {
  if (file.TopComment)
    renderComment(*file.TopComment);
  if (!file.Imports.empty()) {
    renderImports(file.Imports);
    Writer.writeEmptyLine();
  }
  for (const auto &block : file.Blocks) {
    renderCodeBlock(block);
    Writer.writeEmptyLine();
  }
}

void TextRenderer::renderComment(const Comment &comment) {
  StringRef prefix = comment.getPrefix();
  SmallVector<StringRef, 4> lines;
  comment.getText().split(lines, '\n', /*MaxSplit=*/-1, /*KeepEmpty=*/true);
  for (StringRef line : lines) {
    if (line.empty())
      Writer.writeLine(prefix);
    else
      Writer.writeLine(prefix + " " + line);
  }
}

void TextRenderer::renderImports(ArrayRef<ImportDescription> imports) {
  for (const auto &import : imports)
    renderImport(import);
}

void TextRenderer::renderImport(const ImportDescription &import) {
  auto render = [&](bool preconcurrency) {
    if (!import.CanImportModules.empty()) {
      SmallVector<std::string, 2> conditions;
      for (const auto &module : import.CanImportModules)
        conditions.push_back("canImport(" + module + ")");
      Writer.writeLine("#if " + llvm::join(conditions, " || "));
    }

    std::string prefix;
    if (preconcurrency)
      prefix += "@preconcurrency ";
    if (import.SPI)
      prefix += "@_spi(" + *import.SPI + ") ";

    if (!import.ModuleTypes.empty()) {
      for (const auto &type : import.ModuleTypes)
        Writer.writeLine(prefix + "import " + type);
    } else {
      Writer.writeLine(prefix + "import " + import.ModuleName);
    }

    if (!import.CanImportModules.empty())
      Writer.writeLine("#endif");
  };

  switch (import.Preconcurrency) {
  case ImportDescription::PreconcurrencyKind::Always:
    render(true);
    return;
  case ImportDescription::PreconcurrencyKind::Never:
    render(false);
    return;
  case ImportDescription::PreconcurrencyKind::OnOS: {
    SmallVector<std::string, 2> conditions;
    for (const auto &os : import.PreconcurrencyOSes)
      conditions.push_back("os(" + os + ")");
    Writer.writeLine("#if " + llvm::join(conditions, " || "));
    render(true);
    Writer.writeLine("#else");
    render(false);
    Writer.writeLine("#endif");
    return;
  }
  }
  llvm_unreachable("bad preconcurrency kind");
}

void TextRenderer::renderCodeBlock(const CodeBlock &block) {
  if (const auto &comment = block.getComment())
    renderComment(*comment);
  if (auto *D = block.getDecl())
    renderDecl(D);
  else
    renderExpr(block.getExpr());
}

void TextRenderer::renderCodeBlocks(ArrayRef<CodeBlock> blocks) {
  for (const auto &block : blocks)
    renderCodeBlock(block);
}

void TextRenderer::renderAttr(const AvailableAttr &attr) {
  std::string line;
  llvm::raw_string_ostream OS(line);
  attr.print(OS);
  Writer.writeLine(OS.str());
}

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

void TextRenderer::renderAccessPrefix(std::optional<AccessModifier> access) {
  if (!access)
    return;
  Writer.writeLine(getAccessModifierSpelling(*access) + " ");
  Writer.nextLineAppendsToLastLine();
}

void TextRenderer::renderMembers(ArrayRef<DeclPtr> members,
                                 bool separateWithEmptyLine) {
  if (members.empty()) {
    Writer.nextLineAppendsToLastLine();
    return;
  }
  CodeWriter::IndentRAII indentMore(Writer);
  for (const auto &member : members) {
    if (separateWithEmptyLine && &member != &members.front())
      Writer.writeEmptyLine();
    renderDecl(member.get());
  }
}

void TextRenderer::renderBracedBody(ArrayRef<CodeBlock> body) {
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" {");
  if (!body.empty())
    Writer.withNestedLevel([&] { renderCodeBlocks(body); });
  else
    Writer.nextLineAppendsToLastLine();
  Writer.writeLine("}");
}

void TextRenderer::visitCommentableDecl(const CommentableDecl *D) {
  if (const auto &comment = D->getComment())
    renderComment(*comment);
  renderDecl(D->getInner());
}

void TextRenderer::visitAttributedDecl(const AttributedDecl *D) {
  renderAttr(D->getAttr());
  renderDecl(D->getInner());
}

void TextRenderer::visitVarDecl(const VarDecl *D) {
  renderAccessPrefix(D->getAccess());
  if (D->isStatic()) {
    Writer.writeLine("static ");
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(getBindingKindSpelling(D->getBindingKind()) + " ");
  Writer.nextLineAppendsToLastLine();
  renderExpr(D->getPattern());
  if (const auto &type = D->getType()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(": " + type->getString());
  }

  if (auto *init = D->getInit()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" = ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(init);
  }

  const auto &getter = D->getGetter();
  if (!getter)
    return;

  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" {");
  {
    CodeWriter::IndentRAII indentMore(Writer);
    if (D->hasExplicitGetter()) {
      std::string line = "get";
      for (auto effect : D->getGetterEffects())
        line += (" " + getFunctionKeywordSpelling(effect)).str();
      Writer.writeLine(line + " {");
      Writer.withNestedLevel([&] { renderCodeBlocks(*getter); });
      Writer.writeLine("}");
    } else {
      renderCodeBlocks(*getter);
    }
    if (const auto &setter = D->getSetter()) {
      Writer.writeLine("set {");
      Writer.withNestedLevel([&] { renderCodeBlocks(*setter); });
      Writer.writeLine("}");
    }
  }
  Writer.writeLine("}");
}

void TextRenderer::visitExtensionDecl(const ExtensionDecl *D) {
  renderAccessPrefix(D->getAccess());
  Writer.writeLine("extension " + D->getExtendedType());
  Writer.nextLineAppendsToLastLine();
  if (!D->getConformances().empty()) {
    Writer.writeLine(": " + llvm::join(D->getConformances(), ", "));
    Writer.nextLineAppendsToLastLine();
  }
  if (!D->getRequirements().empty()) {
    SmallVector<std::string, 2> requirements;
    for (const auto &requirement : D->getRequirements())
      requirements.push_back(requirement.Left + ": " + requirement.Right);
    Writer.writeLine(" where " + llvm::join(requirements, ", "));
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(" {");
  renderMembers(D->getMembers(), /*separateWithEmptyLine=*/true);
  Writer.writeLine("}");
}

void TextRenderer::renderNominalTypeDecl(const NominalTypeDecl *D,
                                         StringRef keyword) {
  Writer.writeLine(keyword + " " + D->getName());
  Writer.nextLineAppendsToLastLine();
  if (!D->getConformances().empty()) {
    Writer.writeLine(": " + llvm::join(D->getConformances(), ", "));
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(" {");
  renderMembers(D->getMembers(), !isa<EnumDecl>(D));
  Writer.writeLine("}");
}

void TextRenderer::visitStructDecl(const StructDecl *D) {
  renderAccessPrefix(D->getAccess());
  renderNominalTypeDecl(D, "struct");
}

void TextRenderer::visitProtocolDecl(const ProtocolDecl *D) {
  renderAccessPrefix(D->getAccess());
  renderNominalTypeDecl(D, "protocol");
}

void TextRenderer::visitEnumDecl(const EnumDecl *D) {
  if (D->requiresFrozenAttr()) {
    Writer.writeLine("@frozen ");
    Writer.nextLineAppendsToLastLine();
  }
  renderAccessPrefix(D->getAccess());
  if (D->isIndirect()) {
    Writer.writeLine("indirect ");
    Writer.nextLineAppendsToLastLine();
  }
  renderNominalTypeDecl(D, "enum");
}

void TextRenderer::visitTypeAliasDecl(const TypeAliasDecl *D) {
  SmallVector<std::string, 5> words;
  if (auto access = D->getAccess())
    words.push_back(getAccessModifierSpelling(*access).str());
  words.push_back("typealias");
  words.push_back(D->getName().str());
  words.push_back("=");
  words.push_back(D->getUnderlyingType().getString());
  Writer.writeLine(llvm::join(words, " "));
}

void TextRenderer::renderParameter(const FunctionParameter &param) {
  Writer.writeLine(param.Label ? *param.Label : "_");
  Writer.nextLineAppendsToLastLine();
  // If the label and name are the same value, don't repeat it.
  if (param.Name && param.Name != param.Label) {
    Writer.writeLine(" " + *param.Name);
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(": " + param.Type.getString());
  if (param.DefaultValue) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" = ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(param.DefaultValue.get());
  }
}

void TextRenderer::visitFuncDecl(const FuncDecl *D) {
  renderAccessPrefix(D->getAccess());

  std::string kind;
  if (D->isInitializer()) {
    if (D->isConvenience())
      kind += "convenience ";
    kind += "init";
    if (D->isFailable())
      kind += '?';
  } else {
    if (D->isStatic())
      kind += "static ";
    kind += "func ";
    kind += D->getName().str();
  }
  Writer.writeLine(kind + "(");

  auto params = D->getParams();
  if (params.size() > 1) {
    CodeWriter::IndentRAII indentMore(Writer);
    for (const auto &param : params) {
      renderParameter(param);
      if (&param != &params.back()) {
        Writer.nextLineAppendsToLastLine();
        Writer.writeLine(",");
      }
    }
  } else {
    Writer.nextLineAppendsToLastLine();
    if (!params.empty())
      renderParameter(params.front());
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(")");

  for (auto keyword : D->getKeywords()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" " + getFunctionKeywordSpelling(keyword));
  }

  if (auto *returnType = D->getReturnType()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" -> ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(returnType);
  }

  if (const auto &body = D->getBody())
    renderBracedBody(*body);
}

void TextRenderer::visitEnumCaseDecl(const EnumCaseDecl *D) {
  Writer.writeLine("case " + D->getName());
  if (auto *rawValue = D->getRawValue()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" = ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(rawValue);
    return;
  }

  auto values = D->getAssociatedValues();
  if (values.empty())
    return;
  SmallVector<std::string, 4> rendered;
  for (const auto &value : values) {
    std::string text;
    if (value.Label)
      text += *value.Label + ": ";
    text += value.Type.getString();
    rendered.push_back(std::move(text));
  }
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine("(" + llvm::join(rendered, ", ") + ")");
}

void TextRenderer::visitIfConfigDecl(const IfConfigDecl *D) {
  bool first = true;
  for (const auto &clause : D->getClauses()) {
    if (first)
      Writer.writeLine("#if " + *clause.Condition);
    else if (clause.isElse())
      Writer.writeLine("#else");
    else
      Writer.writeLine("#elseif " + *clause.Condition);
    first = false;

    bool firstElement = true;
    for (const auto &element : clause.Elements) {
      if (!firstElement)
        Writer.writeEmptyLine();
      firstElement = false;
      renderCodeBlock(element);
    }
  }
  Writer.writeLine("#endif");
}

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

void TextRenderer::visitStringLiteralExpr(const StringLiteralExpr *E) {
  std::string literal;
  llvm::raw_string_ostream OS(literal);
  printAsStringLiteral(OS, E->getValue());
  Writer.writeLine(OS.str());
}

void TextRenderer::visitIntegerLiteralExpr(const IntegerLiteralExpr *E) {
  Writer.writeLine(Twine(E->getValue()));
}

void TextRenderer::visitFloatLiteralExpr(const FloatLiteralExpr *E) {
  std::string literal;
  llvm::raw_string_ostream OS(literal);
  OS << llvm::format("%.*f", static_cast<int>(E->getPrecision()),
                     E->getValue());
  Writer.writeLine(OS.str());
}

void TextRenderer::visitBooleanLiteralExpr(const BooleanLiteralExpr *E) {
  Writer.writeLine(E->getValue() ? "true" : "false");
}

void TextRenderer::visitNilLiteralExpr(const NilLiteralExpr *E) {
  Writer.writeLine("nil");
}

void TextRenderer::visitArrayLiteralExpr(const ArrayLiteralExpr *E) {
  Writer.writeLine("[");
  auto elements = E->getElements();
  if (elements.empty()) {
    Writer.nextLineAppendsToLastLine();
  } else {
    CodeWriter::IndentRAII indentMore(Writer);
    for (const auto &element : elements) {
      renderExpr(element.get());
      if (&element != &elements.back()) {
        Writer.nextLineAppendsToLastLine();
        Writer.writeLine(",");
      }
    }
  }
  Writer.writeLine("]");
}

void TextRenderer::visitIdentifierExpr(const IdentifierExpr *E) {
  Writer.writeLine(E->getName());
}

void TextRenderer::visitTypeExpr(const TypeExpr *E) {
  Writer.writeLine(E->getType().getString());
}

void TextRenderer::visitMemberAccessExpr(const MemberAccessExpr *E) {
  if (auto *base = E->getBase()) {
    renderExpr(base);
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine("." + E->getMember());
}

void TextRenderer::renderCallArgument(const CallArgument &arg) {
  if (arg.Label) {
    Writer.writeLine(*arg.Label + ": ");
    Writer.nextLineAppendsToLastLine();
  }
  renderExpr(arg.Value.get());
}

void TextRenderer::renderCall(const CallExpr *E) {
  renderExpr(E->getCallee());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine("(");

  auto args = E->getArgs();
  if (args.size() > 1) {
    CodeWriter::IndentRAII indentMore(Writer);
    for (const auto &arg : args) {
      renderCallArgument(arg);
      if (&arg != &args.back()) {
        Writer.nextLineAppendsToLastLine();
        Writer.writeLine(",");
      }
    }
  } else {
    Writer.nextLineAppendsToLastLine();
    if (!args.empty())
      renderCallArgument(args.front());
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(")");

  if (auto *closure = E->getTrailingClosure()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(closure);
  }
}

void TextRenderer::visitCallExpr(const CallExpr *E) { renderCall(E); }

void TextRenderer::visitAssignExpr(const AssignExpr *E) {
  renderExpr(E->getDest());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" = ");
  Writer.nextLineAppendsToLastLine();
  renderExpr(E->getSrc());
}

void TextRenderer::renderSwitchCase(const SwitchCase &switchCase) {
  switch (switchCase.TheKind) {
  case SwitchCase::Kind::Case: {
    bool binds = !switchCase.AssociatedValueNames.empty();
    Writer.writeLine(binds ? "case let " : "case ");
    Writer.nextLineAppendsToLastLine();
    renderExpr(switchCase.Patterns.front().get());
    Writer.nextLineAppendsToLastLine();
    if (binds) {
      Writer.writeLine("(" + llvm::join(switchCase.AssociatedValueNames, ", ") +
                       ")");
    }
    break;
  }
  case SwitchCase::Kind::MultiCase:
    Writer.writeLine("case ");
    Writer.nextLineAppendsToLastLine();
    for (const auto &pattern : switchCase.Patterns) {
      renderExpr(pattern.get());
      Writer.nextLineAppendsToLastLine();
      if (&pattern != &switchCase.Patterns.back())
        Writer.writeLine(", ");
      Writer.nextLineAppendsToLastLine();
    }
    break;
  case SwitchCase::Kind::Default:
    Writer.writeLine("default");
    break;
  }
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(":");
  Writer.withNestedLevel([&] { renderCodeBlocks(switchCase.Body); });
}

void TextRenderer::visitSwitchExpr(const SwitchExpr *E) {
  Writer.writeLine("switch ");
  Writer.nextLineAppendsToLastLine();
  renderExpr(E->getSubject());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" {");
  for (const auto &switchCase : E->getCases())
    renderSwitchCase(switchCase);
  Writer.writeLine("}");
}

void TextRenderer::visitIfExpr(const IfExpr *E) {
  bool first = true;
  for (const auto &branch : E->getBranches()) {
    if (first) {
      Writer.writeLine("if ");
    } else {
      Writer.nextLineAppendsToLastLine();
      Writer.writeLine(" else if ");
    }
    first = false;
    Writer.nextLineAppendsToLastLine();
    renderExpr(branch.Condition.get());
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" {");
    Writer.withNestedLevel([&] { renderCodeBlocks(branch.Body); });
    Writer.writeLine("}");
  }
  if (const auto &elseBody = E->getElseBody()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" else {");
    Writer.withNestedLevel([&] { renderCodeBlocks(*elseBody); });
    Writer.writeLine("}");
  }
}

void TextRenderer::visitDoExpr(const DoExpr *E) {
  Writer.writeLine("do {");
  Writer.withNestedLevel([&] { renderCodeBlocks(E->getBody()); });
  if (const auto &catchBody = E->getCatchBody()) {
    Writer.writeLine("} catch {");
    if (!catchBody->empty())
      Writer.withNestedLevel([&] { renderCodeBlocks(*catchBody); });
    else
      Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine("}");
}

void TextRenderer::visitValueBindingExpr(const ValueBindingExpr *E) {
  Writer.writeLine(getBindingKindSpelling(E->getBindingKind()) + " ");
  Writer.nextLineAppendsToLastLine();
  renderCall(E->getValue());
}

void TextRenderer::visitUnaryKeywordExpr(const UnaryKeywordExpr *E) {
  Writer.writeLine(getKeywordKindSpelling(E->getKeyword()));
  auto *operand = E->getOperand();
  if (!operand)
    return;
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" ");
  Writer.nextLineAppendsToLastLine();
  renderExpr(operand);
}

void TextRenderer::visitClosureExpr(const ClosureExpr *E) {
  Writer.writeLine("{");
  if (!E->getArgumentNames().empty()) {
    Writer.nextLineAppendsToLastLine();
    Writer.writeLine(" " + llvm::join(E->getArgumentNames(), ", ") + " in");
  }
  if (const auto &body = E->getBody())
    Writer.withNestedLevel([&] { renderCodeBlocks(*body); });
  Writer.writeLine("}");
}

void TextRenderer::visitBinaryExpr(const BinaryExpr *E) {
  renderExpr(E->getLHS());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine(" " + getBinaryOperatorSpelling(E->getOperator()) + " ");
  Writer.nextLineAppendsToLastLine();
  renderExpr(E->getRHS());
}

void TextRenderer::visitInOutExpr(const InOutExpr *E) {
  Writer.writeLine("&");
  Writer.nextLineAppendsToLastLine();
  renderExpr(E->getSubExpr());
}

void TextRenderer::visitOptionalChainExpr(const OptionalChainExpr *E) {
  renderExpr(E->getSubExpr());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine("?");
}

void TextRenderer::visitForceValueExpr(const ForceValueExpr *E) {
  renderExpr(E->getSubExpr());
  Writer.nextLineAppendsToLastLine();
  Writer.writeLine("!");
}

void TextRenderer::visitTupleExpr(const TupleExpr *E) {
  Writer.writeLine("(");
  Writer.nextLineAppendsToLastLine();
  auto elements = E->getElements();
  for (const auto &element : elements) {
    renderExpr(element.get());
    if (&element != &elements.back()) {
      Writer.nextLineAppendsToLastLine();
      Writer.writeLine(", ");
    }
    Writer.nextLineAppendsToLastLine();
  }
  Writer.writeLine(")");
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

std::string sfsymbols::renderFile(const FileDescription &file) {
  CodeWriter writer;
  TextRenderer(writer).renderFile(file);
  assert(writer.getLevel() == 0 && "unbalanced indentation");
  return writer.rendered();
}

std::string sfsymbols::render(CodeBlocks blocks,
                              ArrayRef<ImportDescription> imports,
                              std::optional<Comment> topComment) {
  FileDescription file;
  file.TopComment = std::move(topComment);
  file.Imports.assign(imports.begin(), imports.end());
  file.Blocks = std::move(blocks);
  return renderFile(file);
}

std::string sfsymbols::renderDeclAsString(const Decl *D) {
  CodeWriter writer;
  TextRenderer(writer).renderDecl(D);
  return writer.rendered();
}

std::string sfsymbols::renderExprAsString(const Expr *E) {
  CodeWriter writer;
  TextRenderer(writer).renderExpr(E);
  return writer.rendered();
}
