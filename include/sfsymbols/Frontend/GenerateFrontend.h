//===--- GenerateFrontend.h - Generate the symbol accessors -----*- C++ -*-===//
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
// GenerateFrontend turns a SymbolCatalog into the Swift source file that
// declares SFSymbolResource and one accessor per exported symbol.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_FRONTEND_GENERATEFRONTEND_H
#define SFSYMBOLS_FRONTEND_GENERATEFRONTEND_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Catalog/SymbolCatalog.h"
#include "sfsymbols/Frontend/DeclarationMutator.h"
#include "sfsymbols/Frontend/GenerateOptions.h"
#include "sfsymbols/Representation/File.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sfsymbols {

/// An accessor to generate.
struct SymbolAccessor {
  /// The Swift identifier of the accessor.
  std::string Identifier;

  /// The name written in the documentation and, for a symbol, passed to
  /// SFSymbolResource.
  std::string Name;

  /// For a semantic alias, the catalog symbol it draws. The mutators are
  /// keyed by this name.
  std::optional<std::string> AliasOf;

  /// For a semantic alias, the identifier of the accessor it forwards to.
  std::optional<std::string> AliasOfIdentifier;

  bool isAlias() const { return AliasOf.has_value(); }

  /// The name the declaration mutators look up.
  StringRef getMutationKey() const { return AliasOf ? *AliasOf : Name; }
};

class GenerateFrontend {
  const SymbolCatalog &Catalog;
  GenerateOptions Options;

  /// Applied in order to every accessor.
  std::vector<std::unique_ptr<DeclarationMutator>> Mutators;

public:
  GenerateFrontend(const SymbolCatalog &catalog, GenerateOptions options);

  const GenerateOptions &getOptions() const { return Options; }

  /// Whether the localization options export \p symbolName.
  bool isExported(StringRef symbolName) const;

  /// The exported symbol names in byte order.
  std::vector<StringRef> collectSymbolNames() const;

  /// The accessors to generate: every exported symbol followed by the
  /// semantic aliases. Fails if a symbol has no release versions or two
  /// accessors derive the same identifier.
  llvm::Expected<std::vector<SymbolAccessor>> collectAccessors() const;

  /// Run \p D through the mutators for \p symbolName.
  DeclPtr applyMutators(DeclPtr D, StringRef symbolName) const;

  /// The documented and mutated "static var" of \p accessor on
  /// SFSymbolResource.
  DeclPtr makeResourceAccessor(const SymbolAccessor &accessor) const;

  /// The documented and mutated "static var" of \p accessor on the image
  /// type of \p extension.
  DeclPtr makeImageAccessor(const SymbolAccessor &accessor,
                            CompanionExtension extension) const;

  /// Builds the whole file.
  llvm::Expected<FileDescription> buildFile() const;

  /// Builds and renders the whole file.
  llvm::Expected<std::string> generate() const;

private:
  std::optional<AccessModifier> getAccess() const {
    return Options.getWrittenAccess();
  }

  std::string getDocumentation(const SymbolAccessor &accessor) const;

  CodeBlock makeSupportType() const;
  CodeBlock makeResourceExtension(ArrayRef<SymbolAccessor> accessors) const;
  CodeBlock makeCompanionBlock(ArrayRef<SymbolAccessor> accessors,
                               CompanionExtension extension) const;
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_FRONTEND_GENERATEFRONTEND_H
