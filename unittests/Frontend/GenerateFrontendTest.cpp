//===--- GenerateFrontendTest.cpp -----------------------------------------===//
//
// This source file is part of the SFSymbolsGenerator open source project
//
// Copyright (c) 2024 - 2025 the SFSymbolsGenerator project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See LICENSE.txt for license information
//
//===----------------------------------------------------------------------===//

#include "sfsymbols/Frontend/GenerateFrontend.h"
#include "sfsymbols/Basic/Version.h"
#include "sfsymbols/Render/TextRenderer.h"
#include "gtest/gtest.h"
#include <algorithm>
#include <optional>

using namespace sfsymbols;

static const char AvailabilityJSON[] = R"({
  "symbols": {
    "arrow.left.rtl": "2020",
    "c.square": "2020",
    "character.book.closed.ja": "2020",
    "message.circle": "2019",
    "person.circle": "2019",
    "person.circle.old": "2019"
  },
  "year_to_release": {
    "2019": {"iOS": "13.0", "macOS": "11.0", "tvOS": "13.0",
             "watchOS": "6.0", "visionOS": "1.0"},
    "2020": {"iOS": "14.0", "macOS": "11.0", "tvOS": "14.0",
             "watchOS": "7.0", "visionOS": "1.0"}
  }
})";

static const char NameAliases[] =
    "\"person.circle.old\" = \"person.circle\";\n";

static const char SemanticNames[] =
    "\"chat\" = \"message.circle\";\n"
    "\"bubble\" = \"missing.target\";\n"
    "\"c.square\" = \"message.circle\";\n"
    "\"dictionary\" = \"character.book.closed.ja\";\n";

static const char Restrictions[] =
    "\"c.square\" = \"This symbol may not be modified.\";\n";

static SymbolCatalog makeCatalog(StringRef json = AvailabilityJSON) {
  return SymbolCatalog(
      llvm::cantFail(NameAvailability::loadFromBuffer(json)),
      llvm::cantFail(StringsTable::loadFromBuffer(NameAliases)),
      llvm::cantFail(StringsTable::loadFromBuffer("")),
      llvm::cantFail(StringsTable::loadFromBuffer(SemanticNames)),
      llvm::cantFail(StringsTable::loadFromBuffer(Restrictions)));
}

static std::string generate(const SymbolCatalog &catalog,
                            const GenerateOptions &options) {
  auto source = GenerateFrontend(catalog, options).generate();
  if (!source) {
    ADD_FAILURE() << llvm::toString(source.takeError());
    return std::string();
  }
  return std::move(*source);
}

static std::string generateError(const SymbolCatalog &catalog,
                                 const GenerateOptions &options) {
  auto source = GenerateFrontend(catalog, options).generate();
  if (source) {
    ADD_FAILURE() << "expected generation to fail";
    return std::string();
  }
  return llvm::toString(source.takeError());
}

static bool contains(StringRef haystack, StringRef needle) {
  return haystack.contains(needle);
}

TEST(GenerateFrontend, SymbolNamesAreFilteredAndSorted) {
  auto catalog = makeCatalog();

  GenerateOptions options;
  auto names = GenerateFrontend(catalog, options).collectSymbolNames();
  ASSERT_EQ(4u, names.size());
  EXPECT_EQ("c.square", names[0]);
  EXPECT_EQ("message.circle", names[1]);
  EXPECT_EQ("person.circle", names[2]);
  EXPECT_EQ("person.circle.old", names[3]);

  options.Localizations =
      getLocalizationOptions(LocalizationFlag::LanguageCode);
  names = GenerateFrontend(catalog, options).collectSymbolNames();
  ASSERT_EQ(5u, names.size());
  EXPECT_EQ("character.book.closed.ja", names[1]);

  options.Localizations = getLocalizationOptions(LocalizationFlag::RightToLeft);
  names = GenerateFrontend(catalog, options).collectSymbolNames();
  ASSERT_EQ(5u, names.size());
  EXPECT_EQ("arrow.left.rtl", names[0]);

  options.Localizations = getLocalizationOptions(LocalizationFlag::Both);
  EXPECT_EQ(6u, GenerateFrontend(catalog, options).collectSymbolNames().size());
}

TEST(GenerateFrontend, SymbolNamesFollowExportFilter) {
  auto catalog = makeCatalog();
  std::optional<LocalizationFlag> flags[] = {
      std::nullopt, LocalizationFlag::LanguageCode,
      LocalizationFlag::RightToLeft, LocalizationFlag::Both};
  for (auto flag : flags) {
    GenerateOptions options;
    options.Localizations = getLocalizationOptions(flag);
    GenerateFrontend frontend(catalog, options);
    std::vector<StringRef> names = frontend.collectSymbolNames();
    for (StringRef name :
         catalog.getAvailability().getSortedSymbolNames()) {
      bool collected =
          std::find(names.begin(), names.end(), name) != names.end();
      EXPECT_EQ(frontend.isExported(name), collected) << name.str();
    }
  }
}

TEST(GenerateFrontend, SemanticAliases) {
  auto catalog = makeCatalog();
  GenerateOptions options;

  auto accessors = GenerateFrontend(catalog, options).collectAccessors();
  ASSERT_TRUE(static_cast<bool>(accessors))
      << llvm::toString(accessors.takeError());
  ASSERT_EQ(5u, accessors->size());
  const SymbolAccessor &chat = accessors->back();
  EXPECT_EQ("chat", chat.Identifier);
  EXPECT_TRUE(chat.isAlias());
  EXPECT_EQ("messageCircle", chat.AliasOfIdentifier.value());
  EXPECT_EQ("message.circle", chat.getMutationKey());

  // The target of "dictionary" is exported with language codes.
  options.Localizations =
      getLocalizationOptions(LocalizationFlag::LanguageCode);
  accessors = GenerateFrontend(catalog, options).collectAccessors();
  ASSERT_TRUE(static_cast<bool>(accessors));
  ASSERT_EQ(7u, accessors->size());
  EXPECT_EQ("dictionary", accessors->back().Identifier);

  options.ExportSemanticSymbols = false;
  accessors = GenerateFrontend(catalog, options).collectAccessors();
  ASSERT_TRUE(static_cast<bool>(accessors));
  EXPECT_EQ(5u, accessors->size());
  for (const auto &accessor : *accessors)
    EXPECT_FALSE(accessor.isAlias());
}

TEST(GenerateFrontend, ResourceAccessor) {
  auto catalog = makeCatalog();
  GenerateFrontend frontend(catalog, GenerateOptions());

  SymbolAccessor accessor;
  accessor.Identifier = "messageCircle";
  accessor.Name = "message.circle";
  auto D = frontend.makeResourceAccessor(accessor);
  EXPECT_EQ("/// The \"message.circle\" SF Symbol.\n"
            "///\n"
            "@available(iOS 13.0, macOS 11.0, macCatalyst 13.0, tvOS 13.0, "
            "visionOS 1.0, watchOS 6.0, *)\n"
            "static var messageCircle: SFSymbolResource {\n"
            "    SFSymbolResource(systemName: \"message.circle\")\n"
            "}",
            renderDeclAsString(D.get()));

  accessor.Identifier = "cSquare";
  accessor.Name = "c.square";
  D = frontend.makeResourceAccessor(accessor);
  EXPECT_EQ("/// The \"c.square\" SF Symbol.\n"
            "///\n"
            "/// - Important: This symbol may not be modified.\n"
            "@available(iOS 14.0, macOS 11.0, macCatalyst 14.0, tvOS 14.0, "
            "visionOS 1.0, watchOS 7.0, *)\n"
            "static var cSquare: SFSymbolResource {\n"
            "    SFSymbolResource(systemName: \"c.square\")\n"
            "}",
            renderDeclAsString(D.get()));
}

TEST(GenerateFrontend, AliasAccessorForwardsToTarget) {
  auto catalog = makeCatalog();
  GenerateFrontend frontend(catalog, GenerateOptions());

  SymbolAccessor accessor;
  accessor.Identifier = "chat";
  accessor.Name = "chat";
  accessor.AliasOf = "message.circle";
  accessor.AliasOfIdentifier = "messageCircle";
  auto D = frontend.makeResourceAccessor(accessor);
  EXPECT_EQ("/// The \"chat\" SF Symbol.\n"
            "///\n"
            "/// An alias of the \"message.circle\" SF Symbol.\n"
            "///\n"
            "@available(iOS 13.0, macOS 11.0, macCatalyst 13.0, tvOS 13.0, "
            "visionOS 1.0, watchOS 6.0, *)\n"
            "static var chat: SFSymbolResource {\n"
            "    .messageCircle\n"
            "}",
            renderDeclAsString(D.get()));

  D = frontend.makeImageAccessor(accessor, CompanionExtension::SwiftUI);
  EXPECT_TRUE(contains(renderDeclAsString(D.get()),
                       "static var chat: SwiftUI.Image {\n"
                       "    SwiftUI.Image(systemSymbolResource: .chat)\n"
                       "}"));
}

TEST(GenerateFrontend, GeneratedFile) {
  auto catalog = makeCatalog();
  std::string source = generate(catalog, GenerateOptions());

  EXPECT_EQ(0u, source.find(("// This file was generated by sfgenerate " +
                             version::getVersionString() + ".\n" +
                             "// Do not edit it by hand.\n")
                                .str()));
  EXPECT_TRUE(contains(source, "import Foundation\n"));
  EXPECT_TRUE(contains(source, "import AppKit\n"));
  EXPECT_TRUE(contains(source, "import SwiftUI\n"));
  EXPECT_TRUE(contains(source, "import UIKit\n"));

  EXPECT_TRUE(contains(source,
                       "// MARK: - SFSymbolResource\n"
                       "/// A SFSymbol resource.\n"
                       "struct SFSymbolResource: Hashable {\n"
                       "    /// A SFSymbol system name.\n"
                       "    fileprivate let systemName: String\n"));
  EXPECT_TRUE(contains(source, "// MARK: - Symbols\n"
                               "extension SFSymbolResource {\n"));

  EXPECT_TRUE(contains(source,
                       "    @available(*, deprecated, message: \"This name "
                       "has been deprecated."));
  EXPECT_TRUE(contains(source, "renamed: \"person.circle\")\n"
                               "    static var personCircleOld: "
                               "SFSymbolResource {\n"));
  EXPECT_FALSE(contains(source, "characterBookClosedJa"));
  EXPECT_FALSE(contains(source, "arrowLeftRtl"));
  EXPECT_FALSE(contains(source, "static var bubble"));
  EXPECT_FALSE(contains(source, "static var dictionary"));

  EXPECT_TRUE(contains(source, "// MARK: - UIKit\n"
                               "#if canImport(UIKit) && !os(watchOS)\n"
                               "@available(iOS 13.0, tvOS 13.0, *)\n"
                               "@available(watchOS, unavailable)\n"
                               "extension UIKit.UIImage {\n"));
  EXPECT_TRUE(contains(source, "self.init(systemName: "
                               "resource.systemName)!\n"));
  EXPECT_TRUE(contains(source, "    static var cSquare: UIKit.UIImage {\n"
                               "        UIKit.UIImage(systemSymbolResource: "
                               ".cSquare)\n"));

  // Companion blocks follow the resource extension in module order.
  size_t appKit = source.find("// MARK: - AppKit");
  size_t swiftUI = source.find("// MARK: - SwiftUI");
  size_t uiKit = source.find("// MARK: - UIKit");
  ASSERT_NE(std::string::npos, appKit);
  EXPECT_LT(source.find("// MARK: - Symbols"), appKit);
  EXPECT_LT(appKit, swiftUI);
  EXPECT_LT(swiftUI, uiKit);
}

TEST(GenerateFrontend, OutputIsDeterministic) {
  auto catalog = makeCatalog();
  GenerateOptions options;
  options.Localizations = getLocalizationOptions(LocalizationFlag::Both);
  std::string first = generate(catalog, options);
  EXPECT_FALSE(first.empty());
  EXPECT_EQ(first, generate(catalog, options));
  EXPECT_EQ(first, generate(makeCatalog(), options));
}

TEST(GenerateFrontend, PublicAccess) {
  auto catalog = makeCatalog();
  GenerateOptions options;
  options.Access = AccessModifier::Public;
  std::string source = generate(catalog, options);

  EXPECT_TRUE(contains(source, "public struct SFSymbolResource: Hashable {\n"));
  EXPECT_TRUE(contains(source, "    public init(systemName name: String) {\n"));
  EXPECT_TRUE(contains(source, "    public static var messageCircle: "
                               "SFSymbolResource {\n"));
  EXPECT_TRUE(contains(source, "    public convenience init("
                               "systemSymbolResource resource: "
                               "SFSymbolResource) {\n"));
  EXPECT_FALSE(contains(source, "public extension"));
}

TEST(GenerateFrontend, NoCompanionExtensions) {
  auto catalog = makeCatalog();
  GenerateOptions options;
  options.Extensions = CompanionExtensions();
  std::string source = generate(catalog, options);

  EXPECT_TRUE(contains(source, "import Foundation\n"));
  EXPECT_FALSE(contains(source, "import SwiftUI"));
  EXPECT_FALSE(contains(source, "#if"));
  EXPECT_FALSE(contains(source, "UIImage"));
  EXPECT_TRUE(contains(source, "static var messageCircle"));
}

TEST(GenerateFrontend, UnknownAvailabilityKey) {
  auto catalog = makeCatalog(R"({
    "symbols": {"message.circle": "2019", "sparkles": "2099"},
    "year_to_release": {
      "2019": {"iOS": "13.0", "macOS": "11.0", "tvOS": "13.0",
               "watchOS": "6.0", "visionOS": "1.0"}
    }
  })");
  EXPECT_EQ("symbol 'sparkles' refers to unknown availability key '2099'",
            generateError(catalog, GenerateOptions()));
}

TEST(GenerateFrontend, SymbolWithoutIdentifier) {
  auto catalog = makeCatalog(R"({
    "symbols": {"...": "2019", "message.circle": "2019"},
    "year_to_release": {
      "2019": {"iOS": "13.0", "macOS": "11.0", "tvOS": "13.0",
               "watchOS": "6.0", "visionOS": "1.0"}
    }
  })");
  EXPECT_EQ("symbol '...' does not derive a Swift identifier",
            generateError(catalog, GenerateOptions()));
}

TEST(GenerateFrontend, AccessorsSeparatedByEmptyLine) {
  auto catalog = makeCatalog();
  GenerateOptions options;
  options.Extensions = CompanionExtension::UIKit;
  std::string source = generate(catalog, options);

  EXPECT_TRUE(contains(source, "extension SFSymbolResource {\n"
                               "    /// The \"c.square\" SF Symbol.\n"));
  EXPECT_TRUE(contains(source, "        SFSymbolResource(systemName: "
                               "\"c.square\")\n"
                               "    }\n"
                               "\n"
                               "    /// The \"message.circle\" SF Symbol.\n"));
  EXPECT_TRUE(contains(source, "        UIKit.UIImage(systemSymbolResource: "
                               ".cSquare)\n"
                               "    }\n"
                               "\n"
                               "    /// The \"message.circle\" SF Symbol.\n"));
  // The last accessor closes its extension directly.
  EXPECT_FALSE(contains(source, "    }\n\n}"));
  // Separator lines carry no indentation.
  EXPECT_FALSE(contains(source, "\n    \n"));
}

TEST(GenerateFrontend, IdentifierCollision) {
  auto catalog = makeCatalog(R"({
    "symbols": {"a.b": "2019", "a-b": "2019"},
    "year_to_release": {
      "2019": {"iOS": "13.0", "macOS": "11.0", "tvOS": "13.0",
               "watchOS": "6.0", "visionOS": "1.0"}
    }
  })");
  EXPECT_EQ("symbols 'a-b' and 'a.b' both derive the identifier 'aB'",
            generateError(catalog, GenerateOptions()));
}
