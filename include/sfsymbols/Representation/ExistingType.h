//===--- ExistingType.h - References to existing types ----------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_REPRESENTATION_EXISTINGTYPE_H
#define SFSYMBOLS_REPRESENTATION_EXISTINGTYPE_H

#include "sfsymbols/Basic/LLVM.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <utility>
#include <vector>

namespace sfsymbols {

/// A reference to a type that already exists, either in the generated file
/// or in an imported module.
class ExistingType {
public:
  enum class Kind : uint8_t {
    /// A possibly qualified type name: "UIKit.UIImage".
    Member,
    /// An existential: "any T".
    Any,
    /// "T?"
    Optional,
    /// "[T]"
    Array,
    /// "[String: T]"
    DictionaryValue,
    /// "Wrapper<T>"
    Generic,
  };

private:
  Kind TheKind;
  std::vector<std::string> Components;
  std::vector<ExistingType> Children;

  explicit ExistingType(Kind kind) : TheKind(kind) {}

  static ExistingType wrapping(Kind kind, ExistingType wrapped);

public:
  /// A type named by its dotted components.
  static ExistingType getMember(ArrayRef<StringRef> components);

  /// A type named by a single, possibly dotted, name.
  static ExistingType getNamed(StringRef name);

  static ExistingType getAny(ExistingType protocol) {
    return wrapping(Kind::Any, std::move(protocol));
  }
  static ExistingType getOptional(ExistingType wrapped) {
    return wrapping(Kind::Optional, std::move(wrapped));
  }
  static ExistingType getArray(ExistingType element) {
    return wrapping(Kind::Array, std::move(element));
  }
  static ExistingType getDictionaryValue(ExistingType value) {
    return wrapping(Kind::DictionaryValue, std::move(value));
  }
  static ExistingType getGeneric(ExistingType wrapper, ExistingType wrapped);

  Kind getKind() const { return TheKind; }

  /// The name components of a \c Kind::Member type.
  ArrayRef<std::string> getComponents() const { return Components; }

  /// The wrapped type of every kind but \c Kind::Member; a generic type has
  /// the wrapper first and the argument second.
  ArrayRef<ExistingType> getChildren() const { return Children; }

  void print(raw_ostream &OS) const;

  /// The type as it is spelled in source.
  std::string getString() const;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_REPRESENTATION_EXISTINGTYPE_H
