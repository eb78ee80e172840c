//===--- SymbolCatalog.h - The SF Symbols resource catalog ------*- C++ -*-===//
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
// This file declares the in-memory form of the SF Symbols resource bundle:
// the symbol to availability key table, the key to release versions table
// and the auxiliary string tables.
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_CATALOG_SYMBOLCATALOG_H
#define SFSYMBOLS_CATALOG_SYMBOLCATALOG_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Basic/PlatformKind.h"
#include "sfsymbols/Catalog/StringsFile.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <vector>

namespace sfsymbols {

/// The first OS release of every platform for one availability key.
struct ReleaseVersions {
  std::string iOS;
  std::string macOS;
  std::string tvOS;
  std::string watchOS;
  std::string visionOS;

  /// The version for \p platform. Mac Catalyst follows iOS.
  StringRef getVersion(PlatformKind platform) const;
};

/// The contents of "name_availability.json".
class NameAvailability {
  /// Symbol name to availability key.
  llvm::StringMap<std::string> Symbols;

  /// Availability key to release versions.
  llvm::StringMap<ReleaseVersions> YearToRelease;

public:
  static llvm::Expected<NameAvailability> loadFromPath(StringRef path);

  /// Decodes the JSON text in \p data; \p bufferName is used in error
  /// messages.
  static llvm::Expected<NameAvailability>
  loadFromBuffer(StringRef data, StringRef bufferName = "<buffer>");

  void addSymbol(StringRef name, StringRef key) { Symbols[name] = key.str(); }
  void addRelease(StringRef key, ReleaseVersions versions) {
    YearToRelease[key] = std::move(versions);
  }

  size_t getNumSymbols() const { return Symbols.size(); }
  bool hasSymbol(StringRef name) const { return Symbols.count(name) != 0; }

  /// The symbol names in byte order.
  std::vector<StringRef> getSortedSymbolNames() const;

  /// The availability key of \p symbol, if it is in the catalog.
  std::optional<StringRef> getAvailabilityKey(StringRef symbol) const;

  /// The release versions of \p key, if the key is known.
  const ReleaseVersions *lookupRelease(StringRef key) const;

  /// The release versions of \p symbol. Fails if the symbol is unknown or
  /// refers to an availability key missing from the release table.
  llvm::Expected<const ReleaseVersions &>
  getReleaseVersions(StringRef symbol) const;
};

/// All the tables of a resource directory.
class SymbolCatalog {
  NameAvailability Availability;
  StringsTable NameAliases;
  StringsTable NoFillToFill;
  StringsTable SemanticToDescriptive;
  StringsTable SymbolRestrictions;

public:
  SymbolCatalog(NameAvailability availability, StringsTable nameAliases,
                StringsTable noFillToFill, StringsTable semanticToDescriptive,
                StringsTable symbolRestrictions)
      : Availability(std::move(availability)),
        NameAliases(std::move(nameAliases)),
        NoFillToFill(std::move(noFillToFill)),
        SemanticToDescriptive(std::move(semanticToDescriptive)),
        SymbolRestrictions(std::move(symbolRestrictions)) {}

  /// Loads "name_availability.json" and the four string tables from
  /// \p resourceDirectory. Every file is required.
  static llvm::Expected<SymbolCatalog>
  loadFromDirectory(StringRef resourceDirectory);

  const NameAvailability &getAvailability() const { return Availability; }

  /// Deprecated symbol name to its replacement.
  const StringsTable &getNameAliases() const { return NameAliases; }

  /// Outlined symbol name to its filled variant.
  const StringsTable &getNoFillToFill() const { return NoFillToFill; }

  /// Semantic symbol name to the descriptive symbol it draws.
  const StringsTable &getSemanticToDescriptive() const {
    return SemanticToDescriptive;
  }

  /// Symbol name to the restriction on its use.
  const StringsTable &getSymbolRestrictions() const {
    return SymbolRestrictions;
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_CATALOG_SYMBOLCATALOG_H
