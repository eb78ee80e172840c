//===--- DeclarationMutator.h - Per-symbol transforms -----------*- C++ -*-===//
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
// Mutators decorate the declaration generated for a symbol with metadata
// looked up by the symbol's name. A name without an entry leaves the
// declaration unchanged.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_FRONTEND_DECLARATIONMUTATOR_H
#define SFSYMBOLS_FRONTEND_DECLARATIONMUTATOR_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Representation/Attr.h"
#include "sfsymbols/Representation/Decl.h"

namespace sfsymbols {

class NameAvailability;
class StringsTable;

/// Transforms the declaration of a symbol.
class DeclarationMutator {
public:
  virtual ~DeclarationMutator();

  /// Returns \p D decorated with the metadata of \p symbolName.
  virtual DeclPtr mutate(DeclPtr D, StringRef symbolName) const = 0;
};

/// Wraps \p D in an attribute, below every comment layer that starts it, so
/// the comments stay the first lines of the rendered declaration.
DeclPtr addAttributeBelowComments(DeclPtr D, AvailableAttr attr);

/// Adds "@available(iOS a, macOS b, macCatalyst a, tvOS c, visionOS d,
/// watchOS e, *)" for symbols whose availability key is known.
class AvailabilityMutator : public DeclarationMutator {
  const NameAvailability &Availability;

public:
  explicit AvailabilityMutator(const NameAvailability &availability)
      : Availability(availability) {}

  DeclPtr mutate(DeclPtr D, StringRef symbolName) const override;
};

/// Deprecates symbols that were renamed, pointing at the new name.
class DeprecationMutator : public DeclarationMutator {
  const StringsTable &NameAliases;

public:
  /// The message of every deprecation.
  static constexpr const char *Message =
      "This name has been deprecated. You should use a more modern name if "
      "your app does not need to support older platforms.";

  explicit DeprecationMutator(const StringsTable &nameAliases)
      : NameAliases(nameAliases) {}

  DeclPtr mutate(DeclPtr D, StringRef symbolName) const override;
};

/// Appends the usage restriction of a symbol to its documentation as an
/// "- Important:" callout.
class RestrictionMutator : public DeclarationMutator {
  const StringsTable &Restrictions;

public:
  explicit RestrictionMutator(const StringsTable &restrictions)
      : Restrictions(restrictions) {}

  DeclPtr mutate(DeclPtr D, StringRef symbolName) const override;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_FRONTEND_DECLARATIONMUTATOR_H
