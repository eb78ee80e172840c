//===--- GenerateOptions.h - Options for source generation ------*- C++ -*-===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#ifndef SFSYMBOLS_FRONTEND_GENERATEOPTIONS_H
#define SFSYMBOLS_FRONTEND_GENERATEOPTIONS_H

#include "sfsymbols/Basic/LLVM.h"
#include "sfsymbols/Basic/OptionSet.h"
#include "sfsymbols/Representation/Decl.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <optional>

namespace sfsymbols {

/// Which localized variants of a symbol are exported.
enum class LocalizationOption : uint8_t {
  /// Symbols whose last name component is a language code
  /// ("character.book.closed.ja").
  LanguageCode = 1 << 0,
  /// Symbols ending in ".rtl".
  RightToLeft = 1 << 1,
};
using LocalizationOptions = OptionSet<LocalizationOption>;

/// The localization flag passed on the command line.
enum class LocalizationFlag : uint8_t {
  Both,
  LanguageCode,
  RightToLeft,
};

/// Translate the command line flag into the set of exported variants. No
/// flag exports neither.
LocalizationOptions
getLocalizationOptions(std::optional<LocalizationFlag> flag);

/// The frameworks that receive an image extension mirroring the accessors.
enum class CompanionExtension : uint8_t {
  AppKit = 1 << 0,
  SwiftUI = 1 << 1,
  UIKit = 1 << 2,
};
using CompanionExtensions = OptionSet<CompanionExtension>;

/// The module name of \p extension ("SwiftUI").
StringRef getCompanionExtensionName(CompanionExtension extension);

/// Parse a module name, case-insensitively.
std::optional<CompanionExtension> companionExtensionFromString(StringRef name);

/// Parse an access modifier spelling ("public").
std::optional<AccessModifier> accessModifierFromString(StringRef spelling);

struct GenerateOptions {
  /// The access level of the generated declarations. Internal access is
  /// the default in Swift and is left implicit.
  AccessModifier Access = AccessModifier::Internal;

  CompanionExtensions Extensions = {CompanionExtension::AppKit,
                                    CompanionExtension::SwiftUI,
                                    CompanionExtension::UIKit};

  LocalizationOptions Localizations;

  /// Whether semantic names ("heart.text.square" style aliases) get an
  /// accessor referring to the symbol they draw.
  bool ExportSemanticSymbols = true;

  /// The access modifier written in source, or None for internal access.
  std::optional<AccessModifier> getWrittenAccess() const {
    if (Access == AccessModifier::Internal)
      return std::nullopt;
    return Access;
  }
};

} // end namespace sfsymbols

#endif // SFSYMBOLS_FRONTEND_GENERATEOPTIONS_H
