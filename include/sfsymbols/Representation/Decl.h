//===--- Decl.h - Declarations of generated code ----------------*- C++ -*-===//
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
// This file defines the Decl class and subclasses.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_DECL_H
#define SFSYMBOLS_REPRESENTATION_DECL_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Representation/Attr.h"
#include "sfsymbols/Representation/CodeBlock.h"
#include "sfsymbols/Representation/Comment.h"
#include "sfsymbols/Representation/ExistingType.h"
#include "sfsymbols/Representation/Expr.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sfsymbols {

enum class DeclKind : uint8_t {
#define DECL(Id, Parent) Id,
#define LAST_DECL(Id) Last_Decl = Id,
#define DECL_RANGE(Id, FirstId, LastId) \
  First_##Id##Decl = FirstId, Last_##Id##Decl = LastId,
#include "sfsymbols/Representation/DeclNodes.def"
};

/// The access level written in front of a declaration.
enum class AccessModifier : uint8_t {
  Public,
  Package,
  Internal,
  FilePrivate,
  Private,
};

/// Returns the keyword spelling of \p access ("fileprivate").
StringRef getAccessModifierSpelling(AccessModifier access);

/// Decl - Base class for all declarations in generated code.
class Decl {
  Decl(const Decl &) = delete;
  void operator=(const Decl &) = delete;

  const DeclKind Kind;

protected:
  explicit Decl(DeclKind kind) : Kind(kind) {}

public:
  virtual ~Decl();

  DeclKind getKind() const { return Kind; }

  /// Retrieve the name of the given declaration kind.
  ///
  /// This name should only be used for debugging dumps and other
  /// developer aids, and should never be part of a diagnostic or exposed
  /// to the user in any way.
  static StringRef getKindName(DeclKind K);

  /// Retrieve the name of this declaration's kind.
  StringRef getDescriptiveKindName() const { return getKindName(Kind); }

  /// Strip every wrapping comment and attribute layer and return the
  /// declaration underneath.
  const Decl *getUnwrapped() const;
};

/// WrapperDecl - A declaration that prints something in front of the
/// declaration it owns.
class WrapperDecl : public Decl {
  DeclPtr Inner;

protected:
  WrapperDecl(DeclKind kind, DeclPtr inner)
      : Decl(kind), Inner(std::move(inner)) {
    assert(Inner && "wrapping a null declaration");
  }

public:
  const Decl *getInner() const { return Inner.get(); }

  /// Transfer the wrapped declaration out of this node.
  DeclPtr takeInner() { return std::move(Inner); }

  void setInner(DeclPtr inner) {
    assert(inner && "wrapping a null declaration");
    Inner = std::move(inner);
  }

  static bool classof(const Decl *D) {
    return D->getKind() >= DeclKind::First_WrapperDecl &&
           D->getKind() <= DeclKind::Last_WrapperDecl;
  }
};

/// CommentableDecl - A declaration preceded by a comment.
class CommentableDecl : public WrapperDecl {
  std::optional<Comment> TheComment;

public:
  CommentableDecl(std::optional<Comment> comment, DeclPtr inner)
      : WrapperDecl(DeclKind::Commentable, std::move(inner)),
        TheComment(std::move(comment)) {}

  static std::unique_ptr<CommentableDecl>
  create(std::optional<Comment> comment, DeclPtr inner) {
    return std::make_unique<CommentableDecl>(std::move(comment),
                                             std::move(inner));
  }

  const std::optional<Comment> &getComment() const { return TheComment; }
  void setComment(std::optional<Comment> comment) {
    TheComment = std::move(comment);
  }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::Commentable;
  }
};

/// AttributedDecl - A declaration preceded by an @available attribute.
class AttributedDecl : public WrapperDecl {
  AvailableAttr Attr;

public:
  AttributedDecl(AvailableAttr attr, DeclPtr inner)
      : WrapperDecl(DeclKind::Attributed, std::move(inner)),
        Attr(std::move(attr)) {}

  static std::unique_ptr<AttributedDecl> create(AvailableAttr attr,
                                                DeclPtr inner) {
    return std::make_unique<AttributedDecl>(std::move(attr), std::move(inner));
  }

  const AvailableAttr &getAttr() const { return Attr; }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::Attributed;
  }
};

/// VarDecl - A stored or computed property.
///
/// \code
///   static var messageCircle: SFSymbolResource {
///       SFSymbolResource(systemName: "message.circle")
///   }
/// \endcode
class VarDecl : public Decl {
  std::optional<AccessModifier> Access;
  bool IsStatic;
  BindingKind Binding;
  ExprPtr Pattern;
  std::optional<ExistingType> Type;
  ExprPtr Init;
  std::optional<CodeBlocks> Getter;
  std::vector<FunctionKeyword> GetterEffects;
  std::optional<CodeBlocks> Setter;

public:
  VarDecl(std::optional<AccessModifier> access, bool isStatic,
          BindingKind binding, ExprPtr pattern,
          std::optional<ExistingType> type)
      : Decl(DeclKind::Var), Access(access), IsStatic(isStatic),
        Binding(binding), Pattern(std::move(pattern)), Type(std::move(type)) {}

  static std::unique_ptr<VarDecl>
  create(std::optional<AccessModifier> access, bool isStatic,
         BindingKind binding, StringRef name,
         std::optional<ExistingType> type = std::nullopt);

  std::optional<AccessModifier> getAccess() const { return Access; }
  bool isStatic() const { return IsStatic; }
  BindingKind getBindingKind() const { return Binding; }
  const Expr *getPattern() const { return Pattern.get(); }
  const std::optional<ExistingType> &getType() const { return Type; }

  /// The initial value ("= value"), or null.
  const Expr *getInit() const { return Init.get(); }
  void setInit(ExprPtr init) { Init = std::move(init); }

  const std::optional<CodeBlocks> &getGetter() const { return Getter; }
  void setGetter(CodeBlocks body) { Getter = std::move(body); }

  ArrayRef<FunctionKeyword> getGetterEffects() const { return GetterEffects; }
  void addGetterEffect(FunctionKeyword effect) {
    GetterEffects.push_back(effect);
  }

  const std::optional<CodeBlocks> &getSetter() const { return Setter; }
  void setSetter(CodeBlocks body) { Setter = std::move(body); }

  /// Whether the getter has to be spelled out with "get { }" because the
  /// property has effects or other accessors.
  bool hasExplicitGetter() const {
    return !GetterEffects.empty() || Setter.has_value();
  }

  static bool classof(const Decl *D) { return D->getKind() == DeclKind::Var; }
};

/// A "Left: Right" conformance requirement of a where clause.
struct WhereRequirement {
  std::string Left;
  std::string Right;
};

/// ExtensionDecl - "extension OnType: Conformances where ... { members }".
class ExtensionDecl : public Decl {
  std::optional<AccessModifier> Access;
  std::string OnType;
  std::vector<std::string> Conformances;
  std::vector<WhereRequirement> Requirements;
  std::vector<DeclPtr> Members;

public:
  ExtensionDecl(std::optional<AccessModifier> access, StringRef onType,
                ArrayRef<std::string> conformances)
      : Decl(DeclKind::Extension), Access(access), OnType(onType.str()),
        Conformances(conformances.begin(), conformances.end()) {}

  static std::unique_ptr<ExtensionDecl>
  create(std::optional<AccessModifier> access, StringRef onType,
         ArrayRef<std::string> conformances = {}) {
    return std::make_unique<ExtensionDecl>(access, onType, conformances);
  }

  std::optional<AccessModifier> getAccess() const { return Access; }
  StringRef getExtendedType() const { return OnType; }
  ArrayRef<std::string> getConformances() const { return Conformances; }

  ArrayRef<WhereRequirement> getRequirements() const { return Requirements; }
  void addRequirement(StringRef left, StringRef right) {
    Requirements.push_back({left.str(), right.str()});
  }

  ArrayRef<DeclPtr> getMembers() const { return Members; }
  void addMember(DeclPtr member) { Members.push_back(std::move(member)); }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::Extension;
  }
};

/// NominalTypeDecl - Common base of struct, protocol and enum declarations.
class NominalTypeDecl : public Decl {
  std::optional<AccessModifier> Access;
  std::string Name;
  std::vector<std::string> Conformances;
  std::vector<DeclPtr> Members;

protected:
  NominalTypeDecl(DeclKind kind, std::optional<AccessModifier> access,
                  StringRef name, ArrayRef<std::string> conformances)
      : Decl(kind), Access(access), Name(name.str()),
        Conformances(conformances.begin(), conformances.end()) {}

public:
  std::optional<AccessModifier> getAccess() const { return Access; }
  StringRef getName() const { return Name; }
  ArrayRef<std::string> getConformances() const { return Conformances; }

  ArrayRef<DeclPtr> getMembers() const { return Members; }
  void addMember(DeclPtr member) { Members.push_back(std::move(member)); }

  static bool classof(const Decl *D) {
    return D->getKind() >= DeclKind::First_NominalTypeDecl &&
           D->getKind() <= DeclKind::Last_NominalTypeDecl;
  }
};

/// StructDecl - "struct Name: Conformances { members }".
class StructDecl : public NominalTypeDecl {
public:
  StructDecl(std::optional<AccessModifier> access, StringRef name,
             ArrayRef<std::string> conformances)
      : NominalTypeDecl(DeclKind::Struct, access, name, conformances) {}

  static std::unique_ptr<StructDecl>
  create(std::optional<AccessModifier> access, StringRef name,
         ArrayRef<std::string> conformances = {}) {
    return std::make_unique<StructDecl>(access, name, conformances);
  }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::Struct;
  }
};

/// ProtocolDecl - "protocol Name: Conformances { members }".
class ProtocolDecl : public NominalTypeDecl {
public:
  ProtocolDecl(std::optional<AccessModifier> access, StringRef name,
               ArrayRef<std::string> conformances)
      : NominalTypeDecl(DeclKind::Protocol, access, name, conformances) {}

  static std::unique_ptr<ProtocolDecl>
  create(std::optional<AccessModifier> access, StringRef name,
         ArrayRef<std::string> conformances = {}) {
    return std::make_unique<ProtocolDecl>(access, name, conformances);
  }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::Protocol;
  }
};

/// EnumDecl - "enum Name: Conformances { members }".
class EnumDecl : public NominalTypeDecl {
  bool IsFrozen = false;
  bool IsIndirect = false;

public:
  EnumDecl(std::optional<AccessModifier> access, StringRef name,
           ArrayRef<std::string> conformances)
      : NominalTypeDecl(DeclKind::Enum, access, name, conformances) {}

  static std::unique_ptr<EnumDecl>
  create(std::optional<AccessModifier> access, StringRef name,
         ArrayRef<std::string> conformances = {}) {
    return std::make_unique<EnumDecl>(access, name, conformances);
  }

  bool isFrozen() const { return IsFrozen; }
  void setFrozen(bool frozen = true) { IsFrozen = frozen; }

  bool isIndirect() const { return IsIndirect; }
  void setIndirect(bool indirect = true) { IsIndirect = indirect; }

  /// Whether the enum has to be printed with @frozen: only frozen enums
  /// visible outside of their module need the attribute.
  bool requiresFrozenAttr() const;

  static bool classof(const Decl *D) { return D->getKind() == DeclKind::Enum; }
};

/// TypeAliasDecl - "typealias Name = Type".
class TypeAliasDecl : public Decl {
  std::optional<AccessModifier> Access;
  std::string Name;
  ExistingType Underlying;

public:
  TypeAliasDecl(std::optional<AccessModifier> access, StringRef name,
                ExistingType underlying)
      : Decl(DeclKind::TypeAlias), Access(access), Name(name.str()),
        Underlying(std::move(underlying)) {}

  static std::unique_ptr<TypeAliasDecl>
  create(std::optional<AccessModifier> access, StringRef name,
         ExistingType underlying) {
    return std::make_unique<TypeAliasDecl>(access, name,
                                           std::move(underlying));
  }

  std::optional<AccessModifier> getAccess() const { return Access; }
  StringRef getName() const { return Name; }
  const ExistingType &getUnderlyingType() const { return Underlying; }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::TypeAlias;
  }
};

/// One parameter of a function signature: "label name: Type = default".
struct FunctionParameter {
  /// The argument label; "_" is printed when there is none.
  std::optional<std::string> Label;
  /// The parameter name, printed only when it differs from the label.
  std::optional<std::string> Name;
  ExistingType Type;
  ExprPtr DefaultValue;

  FunctionParameter(std::optional<std::string> label,
                    std::optional<std::string> name, ExistingType type,
                    ExprPtr defaultValue = nullptr)
      : Label(std::move(label)), Name(std::move(name)), Type(std::move(type)),
        DefaultValue(std::move(defaultValue)) {}
};

/// FuncDecl - A function or an initializer.
class FuncDecl : public Decl {
public:
  enum class Kind : uint8_t { Initializer, Function };

private:
  std::optional<AccessModifier> Access;
  Kind TheKind;
  bool IsFailable = false;
  bool IsStatic = false;
  bool IsConvenience = false;
  std::string Name;
  std::vector<FunctionParameter> Params;
  std::vector<FunctionKeyword> Keywords;
  ExprPtr ReturnType;
  std::optional<CodeBlocks> Body;

public:
  FuncDecl(std::optional<AccessModifier> access, Kind kind, StringRef name,
           std::vector<FunctionParameter> params)
      : Decl(DeclKind::Func), Access(access), TheKind(kind),
        Name(name.str()), Params(std::move(params)) {}

  /// Create "init(params)" or, if \p isFailable, "init?(params)".
  static std::unique_ptr<FuncDecl>
  createInit(std::optional<AccessModifier> access, bool isFailable,
             std::vector<FunctionParameter> params);

  /// Create "func name(params)" or "static func name(params)".
  static std::unique_ptr<FuncDecl>
  createFunc(std::optional<AccessModifier> access, StringRef name,
             bool isStatic, std::vector<FunctionParameter> params);

  std::optional<AccessModifier> getAccess() const { return Access; }
  Kind getFuncKind() const { return TheKind; }
  bool isInitializer() const { return TheKind == Kind::Initializer; }
  bool isFailable() const { return IsFailable; }
  bool isStatic() const { return IsStatic; }

  /// Whether this is a "convenience init" of a class.
  bool isConvenience() const { return IsConvenience; }
  void setConvenience(bool convenience = true) {
    assert(isInitializer() && "only initializers can be convenience");
    IsConvenience = convenience;
  }

  StringRef getName() const { return Name; }
  ArrayRef<FunctionParameter> getParams() const { return Params; }

  ArrayRef<FunctionKeyword> getKeywords() const { return Keywords; }
  void addKeyword(FunctionKeyword keyword) { Keywords.push_back(keyword); }

  /// The return type, or null for functions returning Void.
  const Expr *getReturnType() const { return ReturnType.get(); }
  void setReturnType(ExprPtr type) { ReturnType = std::move(type); }

  /// The body; a declaration without one is a requirement.
  const std::optional<CodeBlocks> &getBody() const { return Body; }
  void setBody(CodeBlocks body) { Body = std::move(body); }

  static bool classof(const Decl *D) { return D->getKind() == DeclKind::Func; }
};

/// An associated value of an enum case: "label: Type".
struct EnumCaseAssociatedValue {
  std::optional<std::string> Label;
  ExistingType Type;
};

/// EnumCaseDecl - "case name", "case name = rawValue" or
/// "case name(label: Type, ...)".
class EnumCaseDecl : public Decl {
  std::string Name;
  std::unique_ptr<LiteralExpr> RawValue;
  std::vector<EnumCaseAssociatedValue> AssociatedValues;

public:
  EnumCaseDecl(StringRef name, std::unique_ptr<LiteralExpr> rawValue,
               std::vector<EnumCaseAssociatedValue> associatedValues)
      : Decl(DeclKind::EnumCase), Name(name.str()),
        RawValue(std::move(rawValue)),
        AssociatedValues(std::move(associatedValues)) {}

  static std::unique_ptr<EnumCaseDecl> create(StringRef name) {
    return std::make_unique<EnumCaseDecl>(
        name, nullptr, std::vector<EnumCaseAssociatedValue>());
  }

  static std::unique_ptr<EnumCaseDecl>
  createWithRawValue(StringRef name, std::unique_ptr<LiteralExpr> rawValue) {
    return std::make_unique<EnumCaseDecl>(
        name, std::move(rawValue), std::vector<EnumCaseAssociatedValue>());
  }

  static std::unique_ptr<EnumCaseDecl>
  createWithAssociatedValues(StringRef name,
                             std::vector<EnumCaseAssociatedValue> values) {
    return std::make_unique<EnumCaseDecl>(name, nullptr, std::move(values));
  }

  StringRef getName() const { return Name; }
  const LiteralExpr *getRawValue() const { return RawValue.get(); }
  ArrayRef<EnumCaseAssociatedValue> getAssociatedValues() const {
    return AssociatedValues;
  }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::EnumCase;
  }
};

/// One clause of an #if block. The first clause is the "#if", later ones
/// are "#elseif" clauses and a clause without a condition is the "#else".
struct IfConfigClause {
  std::optional<std::string> Condition;
  CodeBlocks Elements;

  IfConfigClause(std::optional<std::string> condition, CodeBlocks elements)
      : Condition(std::move(condition)), Elements(std::move(elements)) {}

  bool isElse() const { return !Condition; }
};

/// IfConfigDecl - A conditional compilation block.
///
/// \code
///   #if canImport(UIKit) && !os(watchOS)
///   ...
///   #endif
/// \endcode
class IfConfigDecl : public Decl {
  std::vector<IfConfigClause> Clauses;

public:
  explicit IfConfigDecl(std::vector<IfConfigClause> clauses)
      : Decl(DeclKind::IfConfig), Clauses(std::move(clauses)) {}

  static std::unique_ptr<IfConfigDecl>
  create(std::vector<IfConfigClause> clauses);

  /// Create a single "#if condition" clause around \p elements.
  static std::unique_ptr<IfConfigDecl> create(StringRef condition,
                                              CodeBlocks elements);

  ArrayRef<IfConfigClause> getClauses() const { return Clauses; }

  static bool classof(const Decl *D) {
    return D->getKind() == DeclKind::IfConfig;
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_DECL_H
