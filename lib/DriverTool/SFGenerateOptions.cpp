//===--- SFGenerateOptions.cpp - sfgenerate command line ------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/DriverTool/SFGenerateOptions.h"
#include "llvm/ADT/Twine.h"

using namespace sfsymbols;

llvm::Expected<GenerateOptions> SFGenerateOptions::translate() const {
  GenerateOptions options;

  auto access = accessModifierFromString(Access);
  if (!access) {
    return llvm::make_error<llvm::StringError>(
        "unknown access modifier '" + Access + "'",
        llvm::inconvertibleErrorCode());
  }
  options.Access = *access;

  if (EnabledExtensions.getNumOccurrences() != 0) {
    options.Extensions = CompanionExtensions();
    for (const std::string &name : EnabledExtensions) {
      if (StringRef(name).equals_insensitive("none"))
        continue;
      auto extension = companionExtensionFromString(name);
      if (!extension) {
        return llvm::make_error<llvm::StringError>(
            "unknown extension '" + name + "'",
            llvm::inconvertibleErrorCode());
      }
      options.Extensions |= *extension;
    }
  }

  options.ExportSemanticSymbols =
      ExportSemanticSymbols && !NoExportSemanticSymbols;

  std::optional<LocalizationFlag> flag;
  if (Localization.getNumOccurrences() != 0)
    flag = Localization.getValue();
  options.Localizations = getLocalizationOptions(flag);
  return options;
}
