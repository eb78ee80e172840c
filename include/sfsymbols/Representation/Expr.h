//===--- Expr.h - Expressions of generated code -----------------*- C++ -*-===//
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
// This file defines the Expr class and subclasses.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_EXPR_H
#define SFSYMBOLS_REPRESENTATION_EXPR_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Representation/CodeBlock.h"
#include "sfsymbols/Representation/ExistingType.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sfsymbols {

enum class ExprKind : uint8_t {
#define EXPR(Id, Parent) Id,
#define LAST_EXPR(Id) Last_Expr = Id,
#define EXPR_RANGE(Id, FirstId, LastId) \
  First_##Id##Expr = FirstId, Last_##Id##Expr = LastId,
#include "sfsymbols/Representation/ExprNodes.def"
};

/// The introducer of a stored value.
enum class BindingKind : uint8_t { Var, Let };

/// Returns "var" or "let".
StringRef getBindingKindSpelling(BindingKind kind);

/// Effects written after a function signature or a getter.
enum class FunctionKeyword : uint8_t { Throws, Async };

/// Returns "throws" or "async".
StringRef getFunctionKeywordSpelling(FunctionKeyword keyword);

/// Expr - Base class for all expressions in generated code.
class Expr {
  Expr(const Expr &) = delete;
  void operator=(const Expr &) = delete;

  const ExprKind Kind;

protected:
  explicit Expr(ExprKind kind) : Kind(kind) {}

public:
  virtual ~Expr();

  /// Return the kind of this expression.
  ExprKind getKind() const { return Kind; }

  /// Retrieve the name of the given expression kind.
  ///
  /// This name should only be used for debugging dumps and other
  /// developer aids, and should never be part of a diagnostic or exposed
  /// to the user of the compiler in any way.
  static StringRef getKindName(ExprKind K);
};

/// LiteralExpr - Common base class between the literals.
class LiteralExpr : public Expr {
protected:
  explicit LiteralExpr(ExprKind kind) : Expr(kind) {}

public:
  static bool classof(const Expr *E) {
    return E->getKind() >= ExprKind::First_LiteralExpr &&
           E->getKind() <= ExprKind::Last_LiteralExpr;
  }
};

/// StringLiteralExpr - A string literal, e.g. "message.circle".
class StringLiteralExpr : public LiteralExpr {
  std::string Value;

public:
  explicit StringLiteralExpr(StringRef value)
      : LiteralExpr(ExprKind::StringLiteral), Value(value.str()) {}

  static std::unique_ptr<StringLiteralExpr> create(StringRef value) {
    return std::make_unique<StringLiteralExpr>(value);
  }

  StringRef getValue() const { return Value; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::StringLiteral;
  }
};

/// IntegerLiteralExpr - An integer literal.
class IntegerLiteralExpr : public LiteralExpr {
  int64_t Value;

public:
  explicit IntegerLiteralExpr(int64_t value)
      : LiteralExpr(ExprKind::IntegerLiteral), Value(value) {}

  static std::unique_ptr<IntegerLiteralExpr> create(int64_t value) {
    return std::make_unique<IntegerLiteralExpr>(value);
  }

  int64_t getValue() const { return Value; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::IntegerLiteral;
  }
};

/// FloatLiteralExpr - A floating point literal printed with a fixed number
/// of fractional digits.
class FloatLiteralExpr : public LiteralExpr {
  double Value;
  unsigned Precision;

public:
  FloatLiteralExpr(double value, unsigned precision)
      : LiteralExpr(ExprKind::FloatLiteral), Value(value),
        Precision(precision) {}

  static std::unique_ptr<FloatLiteralExpr> create(double value,
                                                  unsigned precision) {
    return std::make_unique<FloatLiteralExpr>(value, precision);
  }

  double getValue() const { return Value; }
  unsigned getPrecision() const { return Precision; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::FloatLiteral;
  }
};

/// BooleanLiteralExpr - "true" or "false".
class BooleanLiteralExpr : public LiteralExpr {
  bool Value;

public:
  explicit BooleanLiteralExpr(bool value)
      : LiteralExpr(ExprKind::BooleanLiteral), Value(value) {}

  static std::unique_ptr<BooleanLiteralExpr> create(bool value) {
    return std::make_unique<BooleanLiteralExpr>(value);
  }

  bool getValue() const { return Value; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::BooleanLiteral;
  }
};

/// NilLiteralExpr - "nil".
class NilLiteralExpr : public LiteralExpr {
public:
  NilLiteralExpr() : LiteralExpr(ExprKind::NilLiteral) {}

  static std::unique_ptr<NilLiteralExpr> create() {
    return std::make_unique<NilLiteralExpr>();
  }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::NilLiteral;
  }
};

/// ArrayLiteralExpr - An array literal, e.g. [1, 2].
class ArrayLiteralExpr : public LiteralExpr {
  std::vector<ExprPtr> Elements;

public:
  explicit ArrayLiteralExpr(std::vector<ExprPtr> elements)
      : LiteralExpr(ExprKind::ArrayLiteral), Elements(std::move(elements)) {}

  static std::unique_ptr<ArrayLiteralExpr>
  create(std::vector<ExprPtr> elements = {}) {
    return std::make_unique<ArrayLiteralExpr>(std::move(elements));
  }

  ArrayRef<ExprPtr> getElements() const { return Elements; }
  void addElement(ExprPtr element) { Elements.push_back(std::move(element)); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::ArrayLiteral;
  }
};

/// IdentifierExpr - A name written as is, such as a variable reference or
/// a pattern in a binding.
class IdentifierExpr : public Expr {
  std::string Name;

public:
  explicit IdentifierExpr(StringRef name)
      : Expr(ExprKind::Identifier), Name(name.str()) {}

  static std::unique_ptr<IdentifierExpr> create(StringRef name) {
    return std::make_unique<IdentifierExpr>(name);
  }

  StringRef getName() const { return Name; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Identifier;
  }
};

/// TypeExpr - A reference to a type used as an expression, e.g. the callee
/// of an initializer call.
class TypeExpr : public Expr {
  ExistingType Type;

public:
  explicit TypeExpr(ExistingType type)
      : Expr(ExprKind::Type), Type(std::move(type)) {}

  static std::unique_ptr<TypeExpr> create(ExistingType type) {
    return std::make_unique<TypeExpr>(std::move(type));
  }

  const ExistingType &getType() const { return Type; }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::Type; }
};

/// MemberAccessExpr - "base.member", or ".member" when the base is
/// implicit.
class MemberAccessExpr : public Expr {
  ExprPtr Base;
  std::string Member;

public:
  MemberAccessExpr(ExprPtr base, StringRef member)
      : Expr(ExprKind::MemberAccess), Base(std::move(base)),
        Member(member.str()) {}

  static std::unique_ptr<MemberAccessExpr> create(ExprPtr base,
                                                  StringRef member) {
    return std::make_unique<MemberAccessExpr>(std::move(base), member);
  }

  /// Create an implicit member expression (".member").
  static std::unique_ptr<MemberAccessExpr> createImplicit(StringRef member) {
    return create(nullptr, member);
  }

  /// The base, or null for an implicit member expression.
  const Expr *getBase() const { return Base.get(); }
  StringRef getMember() const { return Member; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::MemberAccess;
  }
};

/// ClosureExpr - "{ a, b in ... }".
class ClosureExpr : public Expr {
  std::vector<std::string> ArgumentNames;
  std::optional<CodeBlocks> Body;

public:
  ClosureExpr(ArrayRef<std::string> argumentNames,
              std::optional<CodeBlocks> body)
      : Expr(ExprKind::Closure),
        ArgumentNames(argumentNames.begin(), argumentNames.end()),
        Body(std::move(body)) {}

  static std::unique_ptr<ClosureExpr>
  create(ArrayRef<std::string> argumentNames,
         std::optional<CodeBlocks> body = std::nullopt) {
    return std::make_unique<ClosureExpr>(argumentNames, std::move(body));
  }

  ArrayRef<std::string> getArgumentNames() const { return ArgumentNames; }
  const std::optional<CodeBlocks> &getBody() const { return Body; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Closure;
  }
};

/// One argument of a call.
struct CallArgument {
  std::optional<std::string> Label;
  ExprPtr Value;

  CallArgument(std::optional<std::string> label, ExprPtr value)
      : Label(std::move(label)), Value(std::move(value)) {}
};

/// CallExpr - "callee(label: value, ...)" with an optional trailing
/// closure.
class CallExpr : public Expr {
  ExprPtr Callee;
  std::vector<CallArgument> Args;
  std::unique_ptr<ClosureExpr> TrailingClosure;

public:
  CallExpr(ExprPtr callee, std::vector<CallArgument> args,
           std::unique_ptr<ClosureExpr> trailingClosure)
      : Expr(ExprKind::Call), Callee(std::move(callee)), Args(std::move(args)),
        TrailingClosure(std::move(trailingClosure)) {}

  static std::unique_ptr<CallExpr>
  create(ExprPtr callee, std::vector<CallArgument> args = {},
         std::unique_ptr<ClosureExpr> trailingClosure = nullptr) {
    return std::make_unique<CallExpr>(std::move(callee), std::move(args),
                                      std::move(trailingClosure));
  }

  const Expr *getCallee() const { return Callee.get(); }
  ArrayRef<CallArgument> getArgs() const { return Args; }
  const ClosureExpr *getTrailingClosure() const {
    return TrailingClosure.get();
  }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::Call; }
};

/// AssignExpr - "dest = source".
class AssignExpr : public Expr {
  ExprPtr Dest;
  ExprPtr Src;

public:
  AssignExpr(ExprPtr dest, ExprPtr src)
      : Expr(ExprKind::Assign), Dest(std::move(dest)), Src(std::move(src)) {}

  static std::unique_ptr<AssignExpr> create(ExprPtr dest, ExprPtr src) {
    return std::make_unique<AssignExpr>(std::move(dest), std::move(src));
  }

  const Expr *getDest() const { return Dest.get(); }
  const Expr *getSrc() const { return Src.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Assign;
  }
};

/// One case of a switch.
struct SwitchCase {
  enum class Kind : uint8_t {
    /// "case .pattern(let a, let b):" with optional associated value names.
    Case,
    /// "case .a, .b:"
    MultiCase,
    /// "default:"
    Default,
  };

  Kind TheKind;
  std::vector<ExprPtr> Patterns;
  std::vector<std::string> AssociatedValueNames;
  CodeBlocks Body;

  static SwitchCase getCase(ExprPtr pattern,
                            ArrayRef<std::string> associatedValueNames,
                            CodeBlocks body);
  static SwitchCase getMultiCase(std::vector<ExprPtr> patterns,
                                 CodeBlocks body);
  static SwitchCase getDefault(CodeBlocks body);
};

/// SwitchExpr - "switch subject { ... }".
class SwitchExpr : public Expr {
  ExprPtr Subject;
  std::vector<SwitchCase> Cases;

public:
  SwitchExpr(ExprPtr subject, std::vector<SwitchCase> cases)
      : Expr(ExprKind::Switch), Subject(std::move(subject)),
        Cases(std::move(cases)) {}

  static std::unique_ptr<SwitchExpr> create(ExprPtr subject,
                                            std::vector<SwitchCase> cases) {
    return std::make_unique<SwitchExpr>(std::move(subject), std::move(cases));
  }

  const Expr *getSubject() const { return Subject.get(); }
  ArrayRef<SwitchCase> getCases() const { return Cases; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Switch;
  }
};

/// A condition and the body executed when it holds.
struct IfBranch {
  ExprPtr Condition;
  CodeBlocks Body;

  IfBranch(ExprPtr condition, CodeBlocks body)
      : Condition(std::move(condition)), Body(std::move(body)) {}
};

/// IfExpr - "if a { } else if b { } else { }".
class IfExpr : public Expr {
  std::vector<IfBranch> Branches;
  std::optional<CodeBlocks> ElseBody;

public:
  IfExpr(std::vector<IfBranch> branches, std::optional<CodeBlocks> elseBody)
      : Expr(ExprKind::If), Branches(std::move(branches)),
        ElseBody(std::move(elseBody)) {}

  /// \p branches must not be empty: the first one is the "if" branch and
  /// the rest are "else if" branches.
  static std::unique_ptr<IfExpr>
  create(std::vector<IfBranch> branches,
         std::optional<CodeBlocks> elseBody = std::nullopt);

  ArrayRef<IfBranch> getBranches() const { return Branches; }
  const std::optional<CodeBlocks> &getElseBody() const { return ElseBody; }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::If; }
};

/// DoExpr - "do { } catch { }".
class DoExpr : public Expr {
  CodeBlocks Body;
  std::optional<CodeBlocks> CatchBody;

public:
  DoExpr(CodeBlocks body, std::optional<CodeBlocks> catchBody)
      : Expr(ExprKind::Do), Body(std::move(body)),
        CatchBody(std::move(catchBody)) {}

  static std::unique_ptr<DoExpr>
  create(CodeBlocks body, std::optional<CodeBlocks> catchBody = std::nullopt) {
    return std::make_unique<DoExpr>(std::move(body), std::move(catchBody));
  }

  const CodeBlocks &getBody() const { return Body; }
  const std::optional<CodeBlocks> &getCatchBody() const { return CatchBody; }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::Do; }
};

/// ValueBindingExpr - "let pattern(a, b)", a binding whose value is a call,
/// as used in enum case patterns.
class ValueBindingExpr : public Expr {
  BindingKind Binding;
  std::unique_ptr<CallExpr> Value;

public:
  ValueBindingExpr(BindingKind binding, std::unique_ptr<CallExpr> value)
      : Expr(ExprKind::ValueBinding), Binding(binding),
        Value(std::move(value)) {}

  static std::unique_ptr<ValueBindingExpr>
  create(BindingKind binding, std::unique_ptr<CallExpr> value) {
    return std::make_unique<ValueBindingExpr>(binding, std::move(value));
  }

  BindingKind getBindingKind() const { return Binding; }
  const CallExpr *getValue() const { return Value.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::ValueBinding;
  }
};

/// The keyword of a UnaryKeywordExpr.
enum class KeywordKind : uint8_t {
  Return,
  Try,
  /// "try?"
  TryOptional,
  Await,
  Throw,
  Yield,
};

/// Returns the keyword as written in source.
StringRef getKeywordKindSpelling(KeywordKind kind);

/// UnaryKeywordExpr - "return x", "try x", "await x" and friends. The
/// operand is optional ("return").
class UnaryKeywordExpr : public Expr {
  KeywordKind Keyword;
  ExprPtr Operand;

public:
  UnaryKeywordExpr(KeywordKind keyword, ExprPtr operand)
      : Expr(ExprKind::UnaryKeyword), Keyword(keyword),
        Operand(std::move(operand)) {}

  static std::unique_ptr<UnaryKeywordExpr> create(KeywordKind keyword,
                                                  ExprPtr operand = nullptr) {
    return std::make_unique<UnaryKeywordExpr>(keyword, std::move(operand));
  }

  KeywordKind getKeyword() const { return Keyword; }
  const Expr *getOperand() const { return Operand.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::UnaryKeyword;
  }
};

/// The operator of a BinaryExpr.
enum class BinaryOperator : uint8_t {
  Plus,
  Minus,
  Equals,
  NotEquals,
  LessThan,
  GreaterThan,
  ClosedRange,
  HalfOpenRange,
  NilCoalescing,
  BooleanAnd,
  BooleanOr,
  PlusEquals,
};

/// Returns the operator as written in source ("+", "==", "...").
StringRef getBinaryOperatorSpelling(BinaryOperator op);

/// BinaryExpr - "lhs op rhs".
class BinaryExpr : public Expr {
  BinaryOperator Op;
  ExprPtr LHS;
  ExprPtr RHS;

public:
  BinaryExpr(BinaryOperator op, ExprPtr lhs, ExprPtr rhs)
      : Expr(ExprKind::Binary), Op(op), LHS(std::move(lhs)),
        RHS(std::move(rhs)) {}

  static std::unique_ptr<BinaryExpr> create(BinaryOperator op, ExprPtr lhs,
                                            ExprPtr rhs) {
    return std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs));
  }

  BinaryOperator getOperator() const { return Op; }
  const Expr *getLHS() const { return LHS.get(); }
  const Expr *getRHS() const { return RHS.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Binary;
  }
};

/// InOutExpr - "&x".
class InOutExpr : public Expr {
  ExprPtr SubExpr;

public:
  explicit InOutExpr(ExprPtr subExpr)
      : Expr(ExprKind::InOut), SubExpr(std::move(subExpr)) {}

  static std::unique_ptr<InOutExpr> create(ExprPtr subExpr) {
    return std::make_unique<InOutExpr>(std::move(subExpr));
  }

  const Expr *getSubExpr() const { return SubExpr.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::InOut;
  }
};

/// OptionalChainExpr - "x?".
class OptionalChainExpr : public Expr {
  ExprPtr SubExpr;

public:
  explicit OptionalChainExpr(ExprPtr subExpr)
      : Expr(ExprKind::OptionalChain), SubExpr(std::move(subExpr)) {}

  static std::unique_ptr<OptionalChainExpr> create(ExprPtr subExpr) {
    return std::make_unique<OptionalChainExpr>(std::move(subExpr));
  }

  const Expr *getSubExpr() const { return SubExpr.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::OptionalChain;
  }
};

/// ForceValueExpr - "x!".
class ForceValueExpr : public Expr {
  ExprPtr SubExpr;

public:
  explicit ForceValueExpr(ExprPtr subExpr)
      : Expr(ExprKind::ForceValue), SubExpr(std::move(subExpr)) {}

  static std::unique_ptr<ForceValueExpr> create(ExprPtr subExpr) {
    return std::make_unique<ForceValueExpr>(std::move(subExpr));
  }

  const Expr *getSubExpr() const { return SubExpr.get(); }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::ForceValue;
  }
};

/// TupleExpr - "(a, b)".
class TupleExpr : public Expr {
  std::vector<ExprPtr> Elements;

public:
  explicit TupleExpr(std::vector<ExprPtr> elements)
      : Expr(ExprKind::Tuple), Elements(std::move(elements)) {}

  static std::unique_ptr<TupleExpr> create(std::vector<ExprPtr> elements) {
    return std::make_unique<TupleExpr>(std::move(elements));
  }

  ArrayRef<ExprPtr> getElements() const { return Elements; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Tuple;
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_EXPR_H
