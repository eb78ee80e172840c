//===--- GenerateOptionsTest.cpp ------------------------------------------===//
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
#include "gtest/gtest.h"

using namespace sfsymbols;

TEST(GenerateOptions, LocalizationFlags) {
  auto none = getLocalizationOptions(std::nullopt);
  EXPECT_FALSE(none.contains(LocalizationOption::LanguageCode));
  EXPECT_FALSE(none.contains(LocalizationOption::RightToLeft));

  auto both = getLocalizationOptions(LocalizationFlag::Both);
  EXPECT_TRUE(both.contains(LocalizationOption::LanguageCode));
  EXPECT_TRUE(both.contains(LocalizationOption::RightToLeft));

  auto lang = getLocalizationOptions(LocalizationFlag::LanguageCode);
  EXPECT_TRUE(lang.contains(LocalizationOption::LanguageCode));
  EXPECT_FALSE(lang.contains(LocalizationOption::RightToLeft));

  auto rtl = getLocalizationOptions(LocalizationFlag::RightToLeft);
  EXPECT_FALSE(rtl.contains(LocalizationOption::LanguageCode));
  EXPECT_TRUE(rtl.contains(LocalizationOption::RightToLeft));
}

TEST(GenerateOptions, CompanionExtensions) {
  EXPECT_EQ(CompanionExtension::SwiftUI,
            companionExtensionFromString("SwiftUI").value());
  EXPECT_EQ(CompanionExtension::UIKit,
            companionExtensionFromString("uikit").value());
  EXPECT_EQ(CompanionExtension::AppKit,
            companionExtensionFromString("APPKIT").value());
  EXPECT_FALSE(companionExtensionFromString("WatchKit").has_value());
  EXPECT_EQ("SwiftUI", getCompanionExtensionName(CompanionExtension::SwiftUI));
}

TEST(GenerateOptions, AccessModifiers) {
  EXPECT_EQ(AccessModifier::Public, accessModifierFromString("public").value());
  EXPECT_EQ(AccessModifier::FilePrivate,
            accessModifierFromString("fileprivate").value());
  EXPECT_FALSE(accessModifierFromString("Public").has_value());
  EXPECT_FALSE(accessModifierFromString("open").has_value());
}

TEST(GenerateOptions, Defaults) {
  GenerateOptions options;
  EXPECT_EQ(AccessModifier::Internal, options.Access);
  EXPECT_FALSE(options.getWrittenAccess().has_value());
  EXPECT_TRUE(options.Extensions.contains(CompanionExtension::AppKit));
  EXPECT_TRUE(options.Extensions.contains(CompanionExtension::SwiftUI));
  EXPECT_TRUE(options.Extensions.contains(CompanionExtension::UIKit));
  EXPECT_FALSE(options.Localizations.contains(LocalizationOption::RightToLeft));
  EXPECT_TRUE(options.ExportSemanticSymbols);

  options.Access = AccessModifier::Package;
  EXPECT_EQ(AccessModifier::Package, options.getWrittenAccess().value());
}
