//===--- GenerateOptions.cpp - Options for source generation --------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Frontend/GenerateOptions.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace sfsymbols;

LocalizationOptions
sfsymbols::getLocalizationOptions(std::optional<LocalizationFlag> flag) {
  if (!flag)
    return LocalizationOptions();

  switch (*flag) {
  case LocalizationFlag::Both:
    return {LocalizationOption::LanguageCode, LocalizationOption::RightToLeft};
  case LocalizationFlag::LanguageCode:
    return LocalizationOption::LanguageCode;
  case LocalizationFlag::RightToLeft:
    return LocalizationOption::RightToLeft;
  }
  llvm_unreachable("bad LocalizationFlag");
}

StringRef sfsymbols::getCompanionExtensionName(CompanionExtension extension) {
  switch (extension) {
  case CompanionExtension::AppKit:
    return "AppKit";
  case CompanionExtension::SwiftUI:
    return "SwiftUI";
  case CompanionExtension::UIKit:
    return "UIKit";
  }
  llvm_unreachable("bad CompanionExtension");
}

std::optional<CompanionExtension>
sfsymbols::companionExtensionFromString(StringRef name) {
  return llvm::StringSwitch<std::optional<CompanionExtension>>(name.lower())
      .Case("appkit", CompanionExtension::AppKit)
      .Case("swiftui", CompanionExtension::SwiftUI)
      .Case("uikit", CompanionExtension::UIKit)
      .Default(std::nullopt);
}

std::optional<AccessModifier>
sfsymbols::accessModifierFromString(StringRef spelling) {
  return llvm::StringSwitch<std::optional<AccessModifier>>(spelling)
      .Case("public", AccessModifier::Public)
      .Case("package", AccessModifier::Package)
      .Case("internal", AccessModifier::Internal)
      .Case("fileprivate", AccessModifier::FilePrivate)
      .Case("private", AccessModifier::Private)
      .Default(std::nullopt);
}
